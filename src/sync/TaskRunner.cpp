#include "sync/TaskRunner.h"
#include "core/logger.h"
#include "sync/TableProcessorThreadPool.h"
#include "utils/string_utils.h"
#include "utils/time_utils.h"
#include <algorithm>
#include <atomic>

TaskRunner::TaskRunner(const MigrationConfig &config, ISourceEngine &source,
                       IWarehouseEngine &destination)
    : config_(config), source_(source), destination_(destination),
      mapper_(config.source.charset) {}

void TaskRunner::addListener(std::shared_ptr<IMigrationListener> listener) {
  if (listener) {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    listeners_.push_back(std::move(listener));
  }
}

// Listener calls are serialized under one mutex, so listeners never see two
// events at once even when tables run in parallel. A throwing listener is
// logged and skipped; it cannot affect the migration.
template <typename Callback>
void TaskRunner::notifyListeners(const char *event, Callback &&callback) {
  std::lock_guard<std::mutex> lock(listenerMutex_);
  for (auto &listener : listeners_) {
    try {
      callback(*listener);
    } catch (const std::exception &e) {
      Logger::error(LogCategory::NOTIFY, "TaskRunner",
                    std::string("Listener failed on ") + event + ": " +
                        e.what());
    }
  }
}

void TaskRunner::emitStateChange(const TableStateRecord &record) {
  notifyListeners("table state change", [&](IMigrationListener &listener) {
    listener.onTableStateChanged(record);
  });
}

void TaskRunner::emitTableCompleted(const TableResult &result) {
  notifyListeners("table completed", [&](IMigrationListener &listener) {
    listener.onTableCompleted(result);
  });
}

TableResult TaskRunner::skippedResult(const TableSpec &spec,
                                      const std::string &reason,
                                      const std::string &message) {
  TableResult result;
  result.spec = spec;
  result.status = TableStatus::SKIPPED;
  result.error = TableError{reason, TableState::PENDING, message};

  TableStateRecord record;
  record.timestamp = std::chrono::system_clock::now();
  record.source_table = spec.source_table;
  record.destination_table = spec.destination_table;
  record.state = TableState::SKIPPED;
  record.error = result.error;
  emitStateChange(record);
  return result;
}

TaskResult TaskRunner::run(const StopPredicate &stopRequested) {
  return run(config_.tables, stopRequested);
}

// Runs a whole task. Connectivity to both sides is checked first; if either
// is unreachable the task fails before any table is touched and every table
// is reported as skipped. Tables then run one after another, or on a bounded
// pool when max_parallel_tables > 1. Results always come back in task order.
TaskResult TaskRunner::run(const std::vector<TableSpec> &tables,
                           const StopPredicate &stopRequested) {
  TaskResult result;
  result.task_name = config_.task.task_name;
  auto start = std::chrono::steady_clock::now();

  TaskStartedEvent started;
  started.task_name = config_.task.task_name;
  started.tables = tables;
  started.source_database = source_.databaseName();
  started.destination_database = destination_.databaseName();
  started.started_at = std::chrono::system_clock::now();

  Logger::info(LogCategory::SYSTEM, "TaskRunner",
               "Starting task '" + result.task_name + "' with " +
                   std::to_string(tables.size()) + " table(s): " +
                   started.source_database + " -> " +
                   started.destination_database);
  notifyListeners("task started", [&](IMigrationListener &listener) {
    listener.onTaskStarted(started);
  });

  std::string connectionProblem;
  if (!source_.testConnection()) {
    connectionProblem = "Cannot connect to source database " +
                        source_.databaseName();
  } else if (!destination_.testConnection()) {
    connectionProblem = "Cannot connect to destination database " +
                        destination_.databaseName();
  }

  if (!connectionProblem.empty()) {
    Logger::critical(LogCategory::DATABASE, "TaskRunner", connectionProblem);
    result.task_error = "ConnectionError: " + connectionProblem;
    for (const auto &spec : tables) {
      result.table_results.push_back(
          skippedResult(spec, "ConnectionError", connectionProblem));
      emitTableCompleted(result.table_results.back());
    }
  } else if (config_.performance.max_parallel_tables > 1 &&
             tables.size() > 1) {
    runParallel(tables, stopRequested, result);
  } else {
    runSequential(tables, stopRequested, result);
  }

  result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  result.overall_status = computeOverallStatus(result);

  Logger::info(LogCategory::SYSTEM, "TaskRunner",
               "Task '" + result.task_name + "' " +
                   overallStatusToString(result.overall_status) +
                   " | succeeded " +
                   std::to_string(result.countWithStatus(TableStatus::SUCCESS)) +
                   ", failed " +
                   std::to_string(result.countWithStatus(TableStatus::FAILED)) +
                   ", skipped " +
                   std::to_string(result.countWithStatus(TableStatus::SKIPPED)) +
                   " | rows " +
                   StringUtils::formatNumber(result.totalRowsWritten()) +
                   " | " +
                   TimeUtils::formatDuration(result.duration.count() / 1000.0));

  notifyListeners("task completed", [&](IMigrationListener &listener) {
    listener.onTaskCompleted(result);
  });
  return result;
}

void TaskRunner::runSequential(const std::vector<TableSpec> &tables,
                               const StopPredicate &stopRequested,
                               TaskResult &result) {
  MigrationOrchestrator orchestrator(config_, source_, destination_, mapper_);
  auto onStateChange = [this](const TableStateRecord &record) {
    emitStateChange(record);
  };

  std::string haltedBy;
  for (size_t i = 0; i < tables.size(); ++i) {
    const TableSpec &spec = tables[i];
    TableResult tableResult;

    if (!haltedBy.empty()) {
      tableResult = skippedResult(spec, "Halted",
                                  "Not started: " + haltedBy +
                                      " failed and continue_on_error is off");
    } else if (result.cancelled || (stopRequested && stopRequested())) {
      result.cancelled = true;
      tableResult = skippedResult(spec, "Cancelled",
                                  "Not started: task was cancelled");
    } else {
      Logger::info(LogCategory::SYSTEM, "TaskRunner",
                   "Table " + std::to_string(i + 1) + "/" +
                       std::to_string(tables.size()) + ": " +
                       spec.source_table);
      tableResult =
          orchestrator.migrateTable(spec, stopRequested, onStateChange);
      if (tableResult.status == TableStatus::FAILED &&
          !spec.continue_on_error) {
        haltedBy = spec.source_table;
      }
      if (tableResult.error && tableResult.error->name == "Cancelled") {
        result.cancelled = true;
      }
    }

    result.table_results.push_back(tableResult);
    emitTableCompleted(result.table_results.back());
  }
}

// Each worker checks the halt flag and the stop predicate before starting a
// table, so a failure or a cancellation stops new tables from starting while
// the ones already running finish on their own.
void TaskRunner::runParallel(const std::vector<TableSpec> &tables,
                             const StopPredicate &stopRequested,
                             TaskResult &result) {
  MigrationOrchestrator orchestrator(config_, source_, destination_, mapper_);
  auto onStateChange = [this](const TableStateRecord &record) {
    emitStateChange(record);
  };

  std::vector<TableResult> results(tables.size());
  std::atomic<bool> halted{false};
  std::atomic<bool> cancelled{false};
  std::mutex haltMutex;
  std::string haltedBy;

  size_t workers =
      std::min(config_.performance.max_parallel_tables, tables.size());
  {
    TableProcessorThreadPool pool(workers);
    pool.run(tables, [&](size_t index) {
      const TableSpec &spec = tables[index];
      TableResult tableResult;

      if (halted.load()) {
        std::string culprit;
        {
          std::lock_guard<std::mutex> lock(haltMutex);
          culprit = haltedBy;
        }
        tableResult = skippedResult(
            spec, "Halted",
            "Not started: " + culprit +
                " failed and continue_on_error is off");
      } else if (cancelled.load() || (stopRequested && stopRequested())) {
        cancelled = true;
        tableResult = skippedResult(spec, "Cancelled",
                                    "Not started: task was cancelled");
      } else {
        tableResult =
            orchestrator.migrateTable(spec, stopRequested, onStateChange);
        if (tableResult.status == TableStatus::FAILED &&
            !spec.continue_on_error) {
          std::lock_guard<std::mutex> lock(haltMutex);
          if (!halted.exchange(true)) {
            haltedBy = spec.source_table;
          }
        }
        if (tableResult.error && tableResult.error->name == "Cancelled") {
          cancelled = true;
        }
      }

      results[index] = tableResult;
      emitTableCompleted(results[index]);
    });
  }

  result.cancelled = cancelled.load();
  result.table_results = std::move(results);
}

// A failure without continue_on_error makes the task failed; a cancellation
// comes next; failures that were allowed to continue only downgrade a
// success to a success with warnings.
OverallStatus TaskRunner::computeOverallStatus(const TaskResult &result) {
  if (result.task_error) {
    return OverallStatus::FAILED;
  }

  bool anyFailed = false;
  for (const auto &table : result.table_results) {
    if (table.status == TableStatus::FAILED) {
      if (!table.spec.continue_on_error) {
        return OverallStatus::FAILED;
      }
      anyFailed = true;
    }
  }

  if (result.cancelled) {
    return OverallStatus::CANCELLED;
  }
  return anyFailed ? OverallStatus::SUCCESS_WITH_WARNINGS
                   : OverallStatus::SUCCESS;
}
