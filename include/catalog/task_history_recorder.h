#ifndef TASK_HISTORY_RECORDER_H
#define TASK_HISTORY_RECORDER_H

#include "catalog/task_history_repository.h"
#include "sync/MigrationListener.h"
#include <memory>

// Writes task lifecycle events into TaskHistoryRepository. The task row is
// created when the task starts; while it is open, log lines are mirrored into
// task_logs as well.
class TaskHistoryRecorder : public IMigrationListener {
  std::shared_ptr<TaskHistoryRepository> repository_;
  std::string configSnapshot_;
  bool mirrorLogs_;
  std::optional<int64_t> taskId_;

public:
  TaskHistoryRecorder(std::shared_ptr<TaskHistoryRepository> repository,
                      std::string configSnapshot, bool mirrorLogs = true);

  void onTaskStarted(const TaskStartedEvent &event) override;
  void onTableStateChanged(const TableStateRecord &record) override;
  void onTableCompleted(const TableResult &result) override;
  void onTaskCompleted(const TaskResult &result) override;

  std::optional<int64_t> taskId() const { return taskId_; }
};

#endif
