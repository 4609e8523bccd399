#ifndef CLICKHOUSE_ENGINE_H
#define CLICKHOUSE_ENGINE_H

#include "core/logger.h"
#include "core/migration_config.h"
#include "engines/warehouse_engine.h"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;

class ClickHouseEngine;

// Holds one curl handle for the lifetime of a table migration so consecutive
// batches reuse the HTTP keep-alive connection.
class ClickHouseInserter : public IBulkInserter {
  ClickHouseEngine &engine_;
  std::string insertQuery_;
  CURL *curl_{nullptr};

public:
  ClickHouseInserter(ClickHouseEngine &engine, std::string insertQuery);
  ~ClickHouseInserter() override;

  ClickHouseInserter(const ClickHouseInserter &) = delete;
  ClickHouseInserter &operator=(const ClickHouseInserter &) = delete;

  void insert(const Batch &batch) override;
};

class ClickHouseEngine : public IWarehouseEngine {
  const DestinationConfig &config_;
  const PerformanceConfig &performance_;

public:
  ClickHouseEngine(const DestinationConfig &config,
                   const PerformanceConfig &performance);

  bool testConnection() override;
  std::string databaseName() const override { return config_.database; }
  const PerformanceConfig &performance() const { return performance_; }

  bool tableExists(const std::string &table) override;
  std::vector<WarehouseColumnInfo>
  describeColumns(const std::string &table) override;
  void createTable(const std::string &table,
                   const std::vector<ColumnDef> &columns,
                   const std::vector<std::string> &orderBy) override;
  void dropTable(const std::string &table) override;
  uint64_t countRows(const std::string &table) override;

  std::unique_ptr<IBulkInserter>
  openInserter(const std::string &table,
               const std::vector<ColumnDef> &columns) override;

  // Runs a statement; SELECTs get FORMAT JSON appended and their "data"
  // array returned.
  std::vector<json> executeQuery(const std::string &query);
  void executeStatement(const std::string &statement);

  // Sends body to the HTTP interface with query as the URL parameter.
  // Throws WriteError, transient for network errors and 502/503/504.
  std::string post(CURL *curl, const std::string &query,
                   const std::string &body, long timeoutSeconds);

  static std::string escapeTSV(const std::string &value);
  static std::string formatValue(const Value &value);
  static std::string encodeTSV(const Batch &batch);
  static std::string buildCreateTableSQL(const std::string &database,
                                         const std::string &table,
                                         const std::vector<ColumnDef> &columns,
                                         const std::vector<std::string> &orderBy);
  static std::string buildInsertQuery(const std::string &database,
                                      const std::string &table,
                                      const std::vector<ColumnDef> &columns);
  static bool isTransientHttpStatus(long status);

private:
  std::string baseUrl() const;
  std::string qualifiedName(const std::string &table) const;
};

#endif
