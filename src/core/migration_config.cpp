#include "core/migration_config.h"
#include "core/logger.h"
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {
constexpr const char *MASKED_PASSWORD = "******";

// Reads a port that may be written either as a number or as a string, the
// way hand-edited config files tend to mix them.
int readPort(const json &section, const char *key, int fallback) {
  if (!section.contains(key) || section[key].is_null())
    return fallback;

  const json &value = section[key];
  int port = fallback;
  if (value.is_number_integer()) {
    port = value.get<int>();
  } else if (value.is_string()) {
    const std::string text = value.get<std::string>();
    try {
      size_t consumed = 0;
      port = std::stoi(text, &consumed);
      if (consumed != text.size())
        throw std::invalid_argument(text);
    } catch (const std::exception &) {
      throw std::invalid_argument(std::string("Invalid port for '") + key +
                                  "': " + text);
    }
  } else {
    throw std::invalid_argument(std::string("Invalid port type for '") + key +
                                "'");
  }
  return port;
}

template <typename T>
void readValue(const json &section, const char *key, T &target) {
  if (section.contains(key) && !section[key].is_null()) {
    target = section[key].get<T>();
  }
}

void requireRange(const std::string &key, long long value, long long min,
                  long long max) {
  if (value < min || value > max) {
    throw std::invalid_argument(key + " must be between " +
                                std::to_string(min) + " and " +
                                std::to_string(max) + " (got " +
                                std::to_string(value) + ")");
  }
}

void requireNonEmpty(const std::string &key, const std::string &value) {
  if (value.empty()) {
    throw std::invalid_argument(key + " must not be empty");
  }
}
} // namespace

// Loads a task configuration from a JSON file, applies environment overrides
// for secrets and validates the result. Unlike the logging defaults, a missing
// or malformed task file is fatal: there is nothing sensible to migrate
// without one, so the error is thrown to the caller.
MigrationConfig MigrationConfig::loadFromFile(const std::string &configPath) {
  std::ifstream configFile(configPath);
  if (!configFile.is_open()) {
    throw std::runtime_error("Configuration file not found: " + configPath);
  }

  std::stringstream buffer;
  buffer << configFile.rdbuf();
  MigrationConfig config = fromJsonString(buffer.str());
  config.applyEnvOverrides();
  config.validate();
  return config;
}

// Builds a configuration from JSON text. Sections that are absent keep their
// defaults; per-table batch_size, verify and continue_on_error inherit the
// task-level values when omitted. Type errors surface as nlohmann exceptions
// rewrapped into std::invalid_argument.
MigrationConfig MigrationConfig::fromJsonString(const std::string &content) {
  MigrationConfig config;
  json root;
  try {
    root = json::parse(content);
  } catch (const json::parse_error &e) {
    throw std::invalid_argument("Malformed configuration JSON: " +
                                std::string(e.what()));
  }

  try {
    if (root.contains("mysql")) {
      const json &mysql = root["mysql"];
      readValue(mysql, "host", config.source.host);
      config.source.port = readPort(mysql, "port", config.source.port);
      readValue(mysql, "user", config.source.user);
      readValue(mysql, "password", config.source.password);
      readValue(mysql, "database", config.source.database);
      readValue(mysql, "charset", config.source.charset);
    }

    if (root.contains("clickhouse")) {
      const json &ch = root["clickhouse"];
      readValue(ch, "host", config.destination.host);
      config.destination.port = readPort(ch, "port", config.destination.port);
      readValue(ch, "user", config.destination.user);
      readValue(ch, "password", config.destination.password);
      readValue(ch, "database", config.destination.database);
      readValue(ch, "secure", config.destination.secure);
    }

    if (root.contains("performance")) {
      const json &perf = root["performance"];
      readValue(perf, "fetch_size", config.performance.fetch_size);
      readValue(perf, "queue_capacity", config.performance.queue_capacity);
      readValue(perf, "max_parallel_tables",
                config.performance.max_parallel_tables);
      readValue(perf, "flush_interval_ms",
                config.performance.flush_interval_ms);
      readValue(perf, "write_retries", config.performance.write_retries);
      readValue(perf, "read_retries", config.performance.read_retries);
      readValue(perf, "retry_backoff_ms", config.performance.retry_backoff_ms);
      readValue(perf, "connection_timeout",
                config.performance.connection_timeout);
      readValue(perf, "read_timeout", config.performance.read_timeout);
      readValue(perf, "write_timeout", config.performance.write_timeout);
    }

    if (root.contains("migration")) {
      const json &migration = root["migration"];
      readValue(migration, "task_name", config.task.task_name);
      readValue(migration, "default_batch_size",
                config.task.default_batch_size);
      readValue(migration, "default_verify", config.task.default_verify);
      readValue(migration, "continue_on_error", config.task.continue_on_error);
      readValue(migration, "skip_empty_tables", config.task.skip_empty_tables);
      readValue(migration, "drop_table_before_create",
                config.task.drop_table_before_create);
      readValue(migration, "log_interval", config.task.log_interval);
      readValue(migration, "progress_bar_width",
                config.task.progress_bar_width);

      if (migration.contains("tables")) {
        for (const auto &entry : migration["tables"]) {
          TableSpec spec;
          spec.source_table = entry.value("mysql_table", "");
          spec.destination_table = entry.value("ch_table", "");
          if (spec.source_table.empty() || spec.destination_table.empty()) {
            throw std::invalid_argument(
                "Table entry needs both mysql_table and ch_table: " +
                entry.dump());
          }
          spec.batch_size =
              entry.value("batch_size", config.task.default_batch_size);
          spec.verify = entry.value("verify", config.task.default_verify);
          spec.continue_on_error = entry.value("continue_on_error",
                                               config.task.continue_on_error);
          config.tables.push_back(spec);
        }
      }
    }

    if (root.contains("logging")) {
      const json &logging = root["logging"];
      readValue(logging, "level", config.logging.level);
      readValue(logging, "file_prefix", config.logging.file_prefix);
      readValue(logging, "console_output", config.logging.console_output);
      readValue(logging, "file_output", config.logging.file_output);
      readValue(logging, "max_file_size", config.logging.max_file_size);
      readValue(logging, "max_backup_files", config.logging.max_backup_files);
    }

    if (root.contains("feishu")) {
      const json &feishu = root["feishu"];
      readValue(feishu, "enabled", config.notification.enabled);
      readValue(feishu, "webhook_url", config.notification.webhook_url);
      readValue(feishu, "webhook_type", config.notification.webhook_type);
      readValue(feishu, "notify_on_start", config.notification.notify_on_start);
      readValue(feishu, "notify_on_success",
                config.notification.notify_on_success);
      readValue(feishu, "notify_on_failure",
                config.notification.notify_on_failure);
      readValue(feishu, "env_name", config.notification.env_name);
      readValue(feishu, "project_name", config.notification.project_name);
      readValue(feishu, "mention_users", config.notification.mention_users);
      readValue(feishu, "mention_all", config.notification.mention_all);
      readValue(feishu, "timeout_seconds", config.notification.timeout_seconds);
    }

    if (root.contains("history")) {
      const json &history = root["history"];
      readValue(history, "enabled", config.history.enabled);
      readValue(history, "connection_string",
                config.history.connection_string);
    }
  } catch (const json::exception &e) {
    throw std::invalid_argument("Invalid configuration value: " +
                                std::string(e.what()));
  }

  return config;
}

// Secrets may be kept out of the file: MYSQL_PASSWORD, CLICKHOUSE_PASSWORD and
// HISTORY_DB_URL take precedence over the values read from JSON.
void MigrationConfig::applyEnvOverrides() {
  const char *mysqlPassword = std::getenv("MYSQL_PASSWORD");
  const char *chPassword = std::getenv("CLICKHOUSE_PASSWORD");
  const char *historyUrl = std::getenv("HISTORY_DB_URL");

  if (mysqlPassword)
    source.password = mysqlPassword;
  if (chPassword)
    destination.password = chPassword;
  if (historyUrl && strlen(historyUrl) > 0)
    history.connection_string = historyUrl;

  if (source.password.empty()) {
    Logger::warning(LogCategory::CONFIG, "MigrationConfig",
                    "MySQL password is empty; set mysql.password or "
                    "MYSQL_PASSWORD if the server requires one");
  }
}

void MigrationConfig::validate() const {
  requireNonEmpty("mysql.host", source.host);
  requireNonEmpty("mysql.user", source.user);
  requireNonEmpty("mysql.database", source.database);
  requireRange("mysql.port", source.port, 1, 65535);

  requireNonEmpty("clickhouse.host", destination.host);
  requireNonEmpty("clickhouse.database", destination.database);
  requireRange("clickhouse.port", destination.port, 1, 65535);

  requireRange("migration.default_batch_size",
               static_cast<long long>(task.default_batch_size),
               MigrationDefaults::MIN_BATCH_SIZE,
               MigrationDefaults::MAX_BATCH_SIZE);
  requireRange("migration.log_interval", task.log_interval, 1, 3600);
  requireRange("migration.progress_bar_width", task.progress_bar_width, 10,
               200);

  for (const auto &table : tables) {
    requireRange("batch_size of " + table.source_table,
                 static_cast<long long>(table.batch_size),
                 MigrationDefaults::MIN_BATCH_SIZE,
                 MigrationDefaults::MAX_BATCH_SIZE);
  }

  requireRange("performance.fetch_size",
               static_cast<long long>(performance.fetch_size), 1,
               MigrationDefaults::MAX_FETCH_SIZE);
  requireRange("performance.queue_capacity",
               static_cast<long long>(performance.queue_capacity), 1,
               MigrationDefaults::MAX_QUEUE_CAPACITY);
  requireRange("performance.max_parallel_tables",
               static_cast<long long>(performance.max_parallel_tables), 1,
               MigrationDefaults::MAX_PARALLEL_TABLES);
  requireRange("performance.flush_interval_ms", performance.flush_interval_ms,
               0, 3600 * 1000);
  requireRange("performance.write_retries", performance.write_retries, 1,
               MigrationDefaults::MAX_RETRIES);
  requireRange("performance.read_retries", performance.read_retries, 1,
               MigrationDefaults::MAX_RETRIES);
  requireRange("performance.retry_backoff_ms", performance.retry_backoff_ms, 0,
               MigrationDefaults::MAX_RETRY_BACKOFF_MS);
  requireRange("performance.connection_timeout",
               performance.connection_timeout, 1, 3600);
  requireRange("performance.read_timeout", performance.read_timeout, 1, 86400);
  requireRange("performance.write_timeout", performance.write_timeout, 1,
               86400);

  if (history.enabled) {
    requireNonEmpty("history.connection_string", history.connection_string);
  }
}

std::string MigrationConfig::toSnapshotJson() const {
  json snapshot;
  snapshot["mysql"] = {{"host", source.host},
                       {"port", source.port},
                       {"user", source.user},
                       {"password", MASKED_PASSWORD},
                       {"database", source.database},
                       {"charset", source.charset}};
  snapshot["clickhouse"] = {{"host", destination.host},
                            {"port", destination.port},
                            {"user", destination.user},
                            {"password", MASKED_PASSWORD},
                            {"database", destination.database},
                            {"secure", destination.secure}};
  snapshot["performance"] = {
      {"fetch_size", performance.fetch_size},
      {"queue_capacity", performance.queue_capacity},
      {"max_parallel_tables", performance.max_parallel_tables},
      {"flush_interval_ms", performance.flush_interval_ms},
      {"write_retries", performance.write_retries},
      {"read_retries", performance.read_retries},
      {"retry_backoff_ms", performance.retry_backoff_ms}};

  json tableList = json::array();
  for (const auto &table : tables) {
    tableList.push_back({{"mysql_table", table.source_table},
                         {"ch_table", table.destination_table},
                         {"batch_size", table.batch_size},
                         {"verify", table.verify},
                         {"continue_on_error", table.continue_on_error}});
  }
  snapshot["migration"] = {
      {"task_name", task.task_name},
      {"default_batch_size", task.default_batch_size},
      {"default_verify", task.default_verify},
      {"continue_on_error", task.continue_on_error},
      {"skip_empty_tables", task.skip_empty_tables},
      {"drop_table_before_create", task.drop_table_before_create},
      {"tables", tableList}};
  return snapshot.dump();
}
