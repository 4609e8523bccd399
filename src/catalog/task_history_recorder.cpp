#include "catalog/task_history_recorder.h"
#include "core/logger.h"

TaskHistoryRecorder::TaskHistoryRecorder(
    std::shared_ptr<TaskHistoryRepository> repository,
    std::string configSnapshot, bool mirrorLogs)
    : repository_(std::move(repository)),
      configSnapshot_(std::move(configSnapshot)), mirrorLogs_(mirrorLogs) {}

void TaskHistoryRecorder::onTaskStarted(const TaskStartedEvent &event) {
  if (!repository_->ensureSchema())
    return;

  taskId_ = repository_->createTask(event.task_name, configSnapshot_);
  if (!taskId_) {
    Logger::warning(LogCategory::HISTORY, "TaskHistoryRecorder",
                    "Task history unavailable, continuing without it");
    return;
  }

  Logger::info(LogCategory::HISTORY, "TaskHistoryRecorder",
               "Recording task '" + event.task_name + "' as id " +
                   std::to_string(*taskId_));
  if (mirrorLogs_) {
    Logger::attachTaskLog(repository_->connectionString(), *taskId_);
  }
}

void TaskHistoryRecorder::onTableStateChanged(const TableStateRecord &record) {
  if (taskId_)
    repository_->addTableEvent(*taskId_, record);
}

void TaskHistoryRecorder::onTableCompleted(const TableResult &result) {
  if (taskId_)
    repository_->addTableMigration(*taskId_, result);
}

void TaskHistoryRecorder::onTaskCompleted(const TaskResult &result) {
  if (!taskId_)
    return;
  repository_->updateTaskStatus(*taskId_, result);
  if (mirrorLogs_) {
    Logger::detachTaskLog();
  }
}
