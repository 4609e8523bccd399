#ifndef SCHEMASYNCHRONIZER_H
#define SCHEMASYNCHRONIZER_H

#include "engines/warehouse_engine.h"
#include "sync/MigrationErrors.h"
#include "sync/MigrationTypes.h"
#include "sync/RetryPolicy.h"
#include <string>
#include <vector>

// Destination calls are retried on transient errors. A createTable retry
// after a lost response is safe because the DDL is IF NOT EXISTS.
class SchemaSynchronizer {
  IWarehouseEngine &destination_;
  RetryPolicy retry_;

public:
  explicit SchemaSynchronizer(IWarehouseEngine &destination,
                              RetryPolicy retry = RetryPolicy());

  // Creates the destination table when it is missing, or checks that an
  // existing one can take the mapped columns. Returns true if it created
  // the table. Throws SchemaMismatchError.
  bool ensureTable(const std::string &table,
                   const std::vector<ColumnDef> &columns,
                   const std::vector<std::string> &orderBy,
                   bool dropExisting = false);

  static void checkCompatibility(const std::string &table,
                                 const std::vector<ColumnDef> &columns,
                                 const std::vector<WarehouseColumnInfo> &live);
};

#endif
