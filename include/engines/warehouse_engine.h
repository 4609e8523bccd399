#ifndef WAREHOUSE_ENGINE_H
#define WAREHOUSE_ENGINE_H

#include "sync/MigrationTypes.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct WarehouseColumnInfo {
  std::string name;
  std::string data_type;
};

// Write handle for one destination table. Each insert() is exactly one bulk
// insert call; a failure throws WriteError, marked transient when a retry
// may succeed.
class IBulkInserter {
public:
  virtual ~IBulkInserter() = default;
  virtual void insert(const Batch &batch) = 0;
};

class IWarehouseEngine {
public:
  virtual ~IWarehouseEngine() = default;

  virtual bool testConnection() = 0;
  virtual std::string databaseName() const = 0;

  virtual bool tableExists(const std::string &table) = 0;
  virtual std::vector<WarehouseColumnInfo>
  describeColumns(const std::string &table) = 0;
  virtual void createTable(const std::string &table,
                           const std::vector<ColumnDef> &columns,
                           const std::vector<std::string> &orderBy) = 0;
  virtual void dropTable(const std::string &table) = 0;
  virtual uint64_t countRows(const std::string &table) = 0;

  virtual std::unique_ptr<IBulkInserter>
  openInserter(const std::string &table,
               const std::vector<ColumnDef> &columns) = 0;
};

#endif
