#ifndef MIGRATION_CONFIG_H
#define MIGRATION_CONFIG_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace MigrationDefaults {
constexpr int DEFAULT_MYSQL_PORT = 3306;
constexpr int DEFAULT_CLICKHOUSE_PORT = 8123;
constexpr int MYSQL_SESSION_TIMEOUT_SECONDS = 600;

constexpr size_t DEFAULT_BATCH_SIZE = 10000;
constexpr size_t MIN_BATCH_SIZE = 1;
constexpr size_t MAX_BATCH_SIZE = 1000000;

constexpr size_t DEFAULT_FETCH_SIZE = 5000;
constexpr size_t MAX_FETCH_SIZE = 1000000;
constexpr size_t DEFAULT_QUEUE_CAPACITY = 4;
constexpr size_t MAX_QUEUE_CAPACITY = 64;
constexpr size_t DEFAULT_MAX_PARALLEL_TABLES = 1;
constexpr size_t MAX_PARALLEL_TABLES = 16;

constexpr int DEFAULT_RETRIES = 3;
constexpr int MAX_RETRIES = 20;
constexpr int DEFAULT_RETRY_BACKOFF_MS = 500;
constexpr int MAX_RETRY_BACKOFF_MS = 30000;

constexpr int DEFAULT_CONNECTION_TIMEOUT = 30;
constexpr int DEFAULT_READ_TIMEOUT = 60;
constexpr int DEFAULT_WRITE_TIMEOUT = 600;
constexpr int DEFAULT_LOG_INTERVAL = 3;
constexpr int DEFAULT_PROGRESS_BAR_WIDTH = 40;
} // namespace MigrationDefaults

// One migrated table. Immutable once a task starts.
struct TableSpec {
  std::string source_table;
  std::string destination_table;
  size_t batch_size = MigrationDefaults::DEFAULT_BATCH_SIZE;
  bool verify = true;
  bool continue_on_error = false;
};

struct SourceConfig {
  std::string host = "localhost";
  int port = MigrationDefaults::DEFAULT_MYSQL_PORT;
  std::string user;
  std::string password;
  std::string database;
  std::string charset = "utf8mb4";
};

struct DestinationConfig {
  std::string host = "localhost";
  int port = MigrationDefaults::DEFAULT_CLICKHOUSE_PORT;
  std::string user = "default";
  std::string password;
  std::string database;
  bool secure = false;
};

struct PerformanceConfig {
  size_t fetch_size = MigrationDefaults::DEFAULT_FETCH_SIZE;
  size_t queue_capacity = MigrationDefaults::DEFAULT_QUEUE_CAPACITY;
  size_t max_parallel_tables = MigrationDefaults::DEFAULT_MAX_PARALLEL_TABLES;
  int flush_interval_ms = 0;
  int write_retries = MigrationDefaults::DEFAULT_RETRIES;
  int read_retries = MigrationDefaults::DEFAULT_RETRIES;
  int retry_backoff_ms = MigrationDefaults::DEFAULT_RETRY_BACKOFF_MS;
  int connection_timeout = MigrationDefaults::DEFAULT_CONNECTION_TIMEOUT;
  int read_timeout = MigrationDefaults::DEFAULT_READ_TIMEOUT;
  int write_timeout = MigrationDefaults::DEFAULT_WRITE_TIMEOUT;
};

struct TaskOptions {
  std::string task_name = "migration";
  size_t default_batch_size = MigrationDefaults::DEFAULT_BATCH_SIZE;
  bool default_verify = true;
  bool continue_on_error = false;
  bool skip_empty_tables = true;
  bool drop_table_before_create = false;
  int log_interval = MigrationDefaults::DEFAULT_LOG_INTERVAL;
  int progress_bar_width = MigrationDefaults::DEFAULT_PROGRESS_BAR_WIDTH;
};

struct LoggingConfig {
  std::string level = "INFO";
  std::string file_prefix = "migration";
  bool console_output = true;
  bool file_output = true;
  size_t max_file_size = 10 * 1024 * 1024;
  int max_backup_files = 5;
};

struct NotificationConfig {
  bool enabled = false;
  std::string webhook_url;
  std::string webhook_type = "FEISHU";
  bool notify_on_start = true;
  bool notify_on_success = true;
  bool notify_on_failure = true;
  std::string env_name = "Production";
  std::string project_name = "Data Migration";
  std::vector<std::string> mention_users;
  bool mention_all = false;
  int timeout_seconds = 10;
};

struct HistoryConfig {
  bool enabled = false;
  std::string connection_string;
};

// Fully resolved configuration of one migration task. Built once and passed by
// const reference to every component; nothing reads it from global state.
struct MigrationConfig {
  SourceConfig source;
  DestinationConfig destination;
  PerformanceConfig performance;
  TaskOptions task;
  LoggingConfig logging;
  NotificationConfig notification;
  HistoryConfig history;
  std::vector<TableSpec> tables;

  static MigrationConfig loadFromFile(const std::string &configPath);
  static MigrationConfig fromJsonString(const std::string &content);

  void applyEnvOverrides();
  void validate() const;

  // Config as JSON text with every password masked.
  std::string toSnapshotJson() const;
};

#endif
