#ifndef SOURCE_ENGINE_H
#define SOURCE_ENGINE_H

#include "sync/MigrationTypes.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Forward-only row stream over one source table. Owns its connection; rows
// are pulled one at a time so nothing beyond the current row is buffered
// client side.
class ISourceCursor {
public:
  virtual ~ISourceCursor() = default;

  // Column names in the order the rows carry them.
  virtual const std::vector<std::string> &columnNames() const = 0;

  // Fills row and returns true, or returns false at end of stream. Throws
  // ReadError on connection failure.
  virtual bool fetchRow(SourceRow &row) = 0;

  virtual void close() = 0;
};

class ISourceEngine {
public:
  virtual ~ISourceEngine() = default;

  virtual bool testConnection() = 0;
  virtual std::string databaseName() const = 0;

  virtual std::vector<SourceColumn> describeColumns(const std::string &table) = 0;
  virtual std::vector<std::string> detectPrimaryKey(const std::string &table) = 0;
  virtual uint64_t countRows(const std::string &table) = 0;

  // Opens a new, independent cursor selecting the given columns in order.
  virtual std::unique_ptr<ISourceCursor>
  openCursor(const std::string &table, const std::vector<std::string> &columns,
             size_t fetchSize) = 0;
};

#endif
