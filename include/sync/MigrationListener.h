#ifndef MIGRATIONLISTENER_H
#define MIGRATIONLISTENER_H

#include "sync/MigrationTypes.h"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

struct TaskStartedEvent {
  std::string task_name;
  std::vector<TableSpec> tables;
  std::string source_database;
  std::string destination_database;
  std::chrono::system_clock::time_point started_at;
};

// One state transition of one table, suitable for an append-only log.
struct TableStateRecord {
  std::chrono::system_clock::time_point timestamp;
  std::string source_table;
  std::string destination_table;
  TableState state = TableState::PENDING;
  uint64_t rows_read = 0;
  uint64_t rows_written = 0;
  std::optional<TableError> error;
};

// Observer of a running task. Calls are serialized by the task runner but may
// come from worker threads. An exception thrown from a callback is logged and
// otherwise ignored by the runner.
class IMigrationListener {
public:
  virtual ~IMigrationListener() = default;

  virtual void onTaskStarted(const TaskStartedEvent &) {}
  virtual void onTableStateChanged(const TableStateRecord &) {}
  virtual void onTableCompleted(const TableResult &) {}
  virtual void onTaskCompleted(const TaskResult &) {}
};

#endif
