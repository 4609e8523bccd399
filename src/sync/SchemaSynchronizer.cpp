#include "sync/SchemaSynchronizer.h"
#include "core/logger.h"
#include "utils/string_utils.h"
#include <unordered_map>

SchemaSynchronizer::SchemaSynchronizer(IWarehouseEngine &destination,
                                       RetryPolicy retry)
    : destination_(destination), retry_(retry) {}

bool SchemaSynchronizer::ensureTable(const std::string &table,
                                     const std::vector<ColumnDef> &columns,
                                     const std::vector<std::string> &orderBy,
                                     bool dropExisting) {
  if (columns.empty()) {
    throw SchemaMismatchError("No columns to create for " + table);
  }

  bool exists = retryTransient(retry_, "Looking up " + table,
                               [&]() { return destination_.tableExists(table); });
  if (exists && dropExisting) {
    retryTransient(retry_, "Dropping " + table,
                   [&]() { destination_.dropTable(table); });
    exists = false;
  }

  if (!exists) {
    retryTransient(retry_, "Creating " + table, [&]() {
      destination_.createTable(table, columns, orderBy);
    });
    Logger::info(LogCategory::SCHEMA, "SchemaSynchronizer",
                 "Created destination table " + table + " with " +
                     std::to_string(columns.size()) + " columns");
    return true;
  }

  auto live = retryTransient(retry_, "Describing " + table, [&]() {
    return destination_.describeColumns(table);
  });
  checkCompatibility(table, columns, live);
  Logger::info(LogCategory::SCHEMA, "SchemaSynchronizer",
               "Destination table " + table +
                   " already exists and is compatible");
  return false;
}

// Every mapped column must exist in the live table with the same type. Types
// are compared with whitespace removed because ClickHouse normalizes
// "Decimal(10,2)" to "Decimal(10, 2)". Extra live columns are fine; they are
// left to their defaults by the column-listed INSERT.
void SchemaSynchronizer::checkCompatibility(
    const std::string &table, const std::vector<ColumnDef> &columns,
    const std::vector<WarehouseColumnInfo> &live) {
  std::unordered_map<std::string, std::string> liveTypes;
  for (const auto &column : live) {
    liveTypes[column.name] = StringUtils::removeWhitespace(column.data_type);
  }

  std::vector<std::string> problems;
  for (const auto &column : columns) {
    auto it = liveTypes.find(column.name);
    if (it == liveTypes.end()) {
      problems.push_back("missing column " + column.name);
    } else if (it->second !=
               StringUtils::removeWhitespace(column.destination_type)) {
      problems.push_back("column " + column.name + " is " + it->second +
                         ", expected " + column.destination_type);
    }
  }

  if (!problems.empty()) {
    throw SchemaMismatchError("Existing table " + table +
                              " is not compatible: " +
                              StringUtils::join(problems, "; "));
  }
}
