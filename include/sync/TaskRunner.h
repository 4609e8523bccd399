#ifndef TASKRUNNER_H
#define TASKRUNNER_H

#include "core/migration_config.h"
#include "engines/source_engine.h"
#include "engines/warehouse_engine.h"
#include "sync/MigrationListener.h"
#include "sync/MigrationOrchestrator.h"
#include "sync/TypeMapper.h"
#include <memory>
#include <mutex>
#include <vector>

class TaskRunner {
  const MigrationConfig &config_;
  ISourceEngine &source_;
  IWarehouseEngine &destination_;
  TypeMapper mapper_;

  std::vector<std::shared_ptr<IMigrationListener>> listeners_;
  std::mutex listenerMutex_;

public:
  TaskRunner(const MigrationConfig &config, ISourceEngine &source,
             IWarehouseEngine &destination);

  void addListener(std::shared_ptr<IMigrationListener> listener);

  // Migrates config.tables in order.
  TaskResult run(const StopPredicate &stopRequested = nullptr);
  TaskResult run(const std::vector<TableSpec> &tables,
                 const StopPredicate &stopRequested = nullptr);

  static OverallStatus computeOverallStatus(const TaskResult &result);

private:
  void runSequential(const std::vector<TableSpec> &tables,
                     const StopPredicate &stopRequested, TaskResult &result);
  void runParallel(const std::vector<TableSpec> &tables,
                   const StopPredicate &stopRequested, TaskResult &result);

  TableResult skippedResult(const TableSpec &spec, const std::string &reason,
                            const std::string &message);
  void emitStateChange(const TableStateRecord &record);
  void emitTableCompleted(const TableResult &result);

  template <typename Callback>
  void notifyListeners(const char *event, Callback &&callback);
};

#endif
