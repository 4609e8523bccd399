#ifndef MIGRATIONORCHESTRATOR_H
#define MIGRATIONORCHESTRATOR_H

#include "core/migration_config.h"
#include "engines/source_engine.h"
#include "engines/warehouse_engine.h"
#include "sync/MigrationListener.h"
#include "sync/MigrationTypes.h"
#include "sync/TypeMapper.h"
#include <functional>

using StopPredicate = std::function<bool()>;
using StateCallback = std::function<void(const TableStateRecord &)>;

// Runs one table through PENDING -> SYNCING -> STREAMING -> VERIFYING and
// into exactly one of SUCCEEDED, FAILED or SKIPPED. Never throws: every
// failure ends up in the returned TableResult.
class MigrationOrchestrator {
  const MigrationConfig &config_;
  ISourceEngine &source_;
  IWarehouseEngine &destination_;
  const TypeMapper &mapper_;

public:
  MigrationOrchestrator(const MigrationConfig &config, ISourceEngine &source,
                        IWarehouseEngine &destination,
                        const TypeMapper &mapper);

  TableResult migrateTable(const TableSpec &spec,
                           const StopPredicate &stopRequested = nullptr,
                           const StateCallback &onStateChange = nullptr);

private:
  // Returns false if a stop request interrupted the stream.
  bool streamTable(const TableSpec &spec, const std::vector<ColumnDef> &columns,
                   uint64_t expectedRows, const StopPredicate &stopRequested,
                   TableResult &result);
};

#endif
