#ifndef TASK_HISTORY_REPOSITORY_H
#define TASK_HISTORY_REPOSITORY_H

#include "sync/MigrationListener.h"
#include "sync/MigrationTypes.h"
#include <cstdint>
#include <optional>
#include <pqxx/pqxx>
#include <string>
#include <vector>

struct TaskSummary {
  int64_t id = 0;
  std::string task_name;
  std::string status;
  std::string start_time;
  std::string end_time;
  int total_tables = 0;
  int success_tables = 0;
  int failed_tables = 0;
  int64_t total_rows = 0;
  double total_time = 0.0;
  std::string error_message;
};

// Append-only store of task runs in the PostgreSQL schema "migration". Every
// method logs and swallows database errors, returning false or an empty
// value, because history must never decide the outcome of a migration.
class TaskHistoryRepository {
  std::string connectionString_;

public:
  explicit TaskHistoryRepository(std::string connectionString);

  bool ensureSchema();

  // Returns the new task id.
  std::optional<int64_t> createTask(const std::string &taskName,
                                    const std::string &configSnapshotJson);
  bool updateTaskStatus(int64_t taskId, const TaskResult &result);
  bool addTableMigration(int64_t taskId, const TableResult &result);
  bool addTableEvent(int64_t taskId, const TableStateRecord &record);

  std::vector<TaskSummary> getRecentTasks(int limit);

  const std::string &connectionString() const { return connectionString_; }

private:
  pqxx::connection getConnection();
};

#endif
