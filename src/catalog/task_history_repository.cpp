#include "catalog/task_history_repository.h"
#include "core/logger.h"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace {
std::string toTimestampText(std::chrono::system_clock::time_point point) {
  auto time_t = std::chrono::system_clock::to_time_t(point);
  struct tm tm_buf;
  gmtime_r(&time_t, &tm_buf);
  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << "+00";
  return oss.str();
}
} // namespace

TaskHistoryRepository::TaskHistoryRepository(std::string connectionString)
    : connectionString_(std::move(connectionString)) {}

pqxx::connection TaskHistoryRepository::getConnection() {
  return pqxx::connection(connectionString_);
}

// Creates the migration schema and its four tables if they do not exist.
// tasks holds one row per run, table_migrations one row per finished table,
// table_events one row per state transition and task_logs the log lines
// mirrored by DatabaseLogWriter.
bool TaskHistoryRepository::ensureSchema() {
  try {
    auto conn = getConnection();
    pqxx::work txn(conn);
    txn.exec("CREATE SCHEMA IF NOT EXISTS migration");
    txn.exec("CREATE TABLE IF NOT EXISTS migration.tasks ("
             "id BIGSERIAL PRIMARY KEY, "
             "task_name VARCHAR(255) NOT NULL, "
             "config_snapshot JSONB, "
             "status VARCHAR(32) NOT NULL, "
             "start_time TIMESTAMPTZ NOT NULL DEFAULT NOW(), "
             "end_time TIMESTAMPTZ, "
             "total_tables INTEGER DEFAULT 0, "
             "success_tables INTEGER DEFAULT 0, "
             "failed_tables INTEGER DEFAULT 0, "
             "skipped_tables INTEGER DEFAULT 0, "
             "total_rows BIGINT DEFAULT 0, "
             "total_time DOUBLE PRECISION DEFAULT 0, "
             "error_message TEXT)");
    txn.exec("CREATE TABLE IF NOT EXISTS migration.table_migrations ("
             "id BIGSERIAL PRIMARY KEY, "
             "task_id BIGINT NOT NULL REFERENCES migration.tasks(id), "
             "mysql_table VARCHAR(255) NOT NULL, "
             "ch_table VARCHAR(255) NOT NULL, "
             "status VARCHAR(32) NOT NULL, "
             "rows_read BIGINT DEFAULT 0, "
             "rows BIGINT DEFAULT 0, "
             "source_count BIGINT DEFAULT 0, "
             "destination_count BIGINT DEFAULT 0, "
             "time_used DOUBLE PRECISION DEFAULT 0, "
             "speed DOUBLE PRECISION DEFAULT 0, "
             "verified BOOLEAN DEFAULT FALSE, "
             "error_message TEXT)");
    txn.exec("CREATE TABLE IF NOT EXISTS migration.table_events ("
             "id BIGSERIAL PRIMARY KEY, "
             "task_id BIGINT NOT NULL REFERENCES migration.tasks(id), "
             "mysql_table VARCHAR(255) NOT NULL, "
             "ch_table VARCHAR(255) NOT NULL, "
             "state VARCHAR(32) NOT NULL, "
             "rows_read BIGINT DEFAULT 0, "
             "rows_written BIGINT DEFAULT 0, "
             "error_name VARCHAR(64), "
             "error_message TEXT, "
             "event_time TIMESTAMPTZ NOT NULL)");
    txn.exec("CREATE TABLE IF NOT EXISTS migration.task_logs ("
             "id BIGSERIAL PRIMARY KEY, "
             "task_id BIGINT NOT NULL, "
             "log_level VARCHAR(50), "
             "log_message TEXT, "
             "log_time TIMESTAMPTZ NOT NULL DEFAULT NOW())");
    txn.exec("CREATE INDEX IF NOT EXISTS idx_table_events_task "
             "ON migration.table_events (task_id)");
    txn.exec("CREATE INDEX IF NOT EXISTS idx_task_logs_task "
             "ON migration.task_logs (task_id)");
    txn.commit();
    return true;
  } catch (const std::exception &e) {
    Logger::error(LogCategory::HISTORY, "TaskHistoryRepository",
                  "Error creating history schema: " + std::string(e.what()));
    return false;
  }
}

std::optional<int64_t>
TaskHistoryRepository::createTask(const std::string &taskName,
                                  const std::string &configSnapshotJson) {
  try {
    auto conn = getConnection();
    pqxx::work txn(conn);
    auto result = txn.exec_params(
        "INSERT INTO migration.tasks (task_name, config_snapshot, status, "
        "start_time) VALUES ($1, $2::jsonb, 'running', NOW()) RETURNING id",
        taskName, configSnapshotJson);
    txn.commit();

    if (result.empty() || result[0][0].is_null()) {
      Logger::error(LogCategory::HISTORY, "TaskHistoryRepository",
                    "createTask returned no id");
      return std::nullopt;
    }
    return result[0][0].as<int64_t>();
  } catch (const std::exception &e) {
    Logger::error(LogCategory::HISTORY, "TaskHistoryRepository",
                  "Error creating task: " + std::string(e.what()));
    return std::nullopt;
  }
}

bool TaskHistoryRepository::updateTaskStatus(int64_t taskId,
                                             const TaskResult &result) {
  std::string errorMessage;
  if (result.task_error) {
    errorMessage = *result.task_error;
  } else if (const TableResult *failed = result.firstFailure()) {
    errorMessage = failed->spec.source_table + ": " + failed->error->name +
                   ": " + failed->error->message;
  }

  try {
    auto conn = getConnection();
    pqxx::work txn(conn);
    txn.exec_params(
        "UPDATE migration.tasks SET status = $1, end_time = NOW(), "
        "total_tables = $2, success_tables = $3, failed_tables = $4, "
        "skipped_tables = $5, total_rows = $6, total_time = $7, "
        "error_message = NULLIF($8, '') WHERE id = $9",
        overallStatusToString(result.overall_status),
        static_cast<int>(result.table_results.size()),
        static_cast<int>(result.countWithStatus(TableStatus::SUCCESS)),
        static_cast<int>(result.countWithStatus(TableStatus::FAILED)),
        static_cast<int>(result.countWithStatus(TableStatus::SKIPPED)),
        static_cast<int64_t>(result.totalRowsWritten()),
        result.duration.count() / 1000.0, errorMessage, taskId);
    txn.commit();
    return true;
  } catch (const std::exception &e) {
    Logger::error(LogCategory::HISTORY, "TaskHistoryRepository",
                  "Error updating task " + std::to_string(taskId) + ": " +
                      std::string(e.what()));
    return false;
  }
}

bool TaskHistoryRepository::addTableMigration(int64_t taskId,
                                              const TableResult &result) {
  double seconds = result.durationSeconds();
  double speed = seconds > 0 ? result.rows_written / seconds : 0.0;
  std::string errorMessage =
      result.error ? result.error->name + ": " + result.error->message : "";

  try {
    auto conn = getConnection();
    pqxx::work txn(conn);
    txn.exec_params(
        "INSERT INTO migration.table_migrations (task_id, mysql_table, "
        "ch_table, status, rows_read, rows, source_count, destination_count, "
        "time_used, speed, verified, error_message) VALUES ($1, $2, $3, $4, "
        "$5, $6, $7, $8, $9, $10, $11, NULLIF($12, ''))",
        taskId, result.spec.source_table, result.spec.destination_table,
        tableStatusToString(result.status),
        static_cast<int64_t>(result.rows_read),
        static_cast<int64_t>(result.rows_written),
        static_cast<int64_t>(result.source_count),
        static_cast<int64_t>(result.destination_count), seconds, speed,
        result.verified, errorMessage);
    txn.commit();
    return true;
  } catch (const std::exception &e) {
    Logger::error(LogCategory::HISTORY, "TaskHistoryRepository",
                  "Error recording table " + result.spec.source_table + ": " +
                      std::string(e.what()));
    return false;
  }
}

bool TaskHistoryRepository::addTableEvent(int64_t taskId,
                                          const TableStateRecord &record) {
  std::string errorName = record.error ? record.error->name : "";
  std::string errorMessage = record.error ? record.error->message : "";

  try {
    auto conn = getConnection();
    pqxx::work txn(conn);
    txn.exec_params(
        "INSERT INTO migration.table_events (task_id, mysql_table, ch_table, "
        "state, rows_read, rows_written, error_name, error_message, "
        "event_time) VALUES ($1, $2, $3, $4, $5, $6, NULLIF($7, ''), "
        "NULLIF($8, ''), $9::timestamptz)",
        taskId, record.source_table, record.destination_table,
        tableStateToString(record.state),
        static_cast<int64_t>(record.rows_read),
        static_cast<int64_t>(record.rows_written), errorName, errorMessage,
        toTimestampText(record.timestamp));
    txn.commit();
    return true;
  } catch (const std::exception &e) {
    Logger::error(LogCategory::HISTORY, "TaskHistoryRepository",
                  "Error recording event for " + record.source_table + ": " +
                      std::string(e.what()));
    return false;
  }
}

std::vector<TaskSummary> TaskHistoryRepository::getRecentTasks(int limit) {
  std::vector<TaskSummary> tasks;
  try {
    auto conn = getConnection();
    pqxx::work txn(conn);
    auto results = txn.exec_params(
        "SELECT id, task_name, status, "
        "to_char(start_time, 'YYYY-MM-DD HH24:MI:SS'), "
        "to_char(end_time, 'YYYY-MM-DD HH24:MI:SS'), total_tables, "
        "success_tables, failed_tables, total_rows, total_time, error_message "
        "FROM migration.tasks ORDER BY id DESC LIMIT $1",
        limit);
    txn.commit();

    for (const auto &row : results) {
      TaskSummary task;
      task.id = row[0].as<int64_t>();
      task.task_name = row[1].as<std::string>();
      task.status = row[2].as<std::string>();
      task.start_time = row[3].is_null() ? "" : row[3].as<std::string>();
      task.end_time = row[4].is_null() ? "" : row[4].as<std::string>();
      task.total_tables = row[5].is_null() ? 0 : row[5].as<int>();
      task.success_tables = row[6].is_null() ? 0 : row[6].as<int>();
      task.failed_tables = row[7].is_null() ? 0 : row[7].as<int>();
      task.total_rows = row[8].is_null() ? 0 : row[8].as<int64_t>();
      task.total_time = row[9].is_null() ? 0.0 : row[9].as<double>();
      task.error_message = row[10].is_null() ? "" : row[10].as<std::string>();
      tasks.push_back(task);
    }
  } catch (const std::exception &e) {
    Logger::error(LogCategory::HISTORY, "TaskHistoryRepository",
                  "Error reading recent tasks: " + std::string(e.what()));
  }
  return tasks;
}
