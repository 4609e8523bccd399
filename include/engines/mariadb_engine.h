#ifndef MARIADB_ENGINE_H
#define MARIADB_ENGINE_H

#include "core/logger.h"
#include "core/migration_config.h"
#include "engines/source_engine.h"
#include <functional>
#include <memory>
#include <mysql/mysql.h>

class MySQLConnection {
  MYSQL *conn_{nullptr};
  std::string lastError_;

public:
  MySQLConnection(const SourceConfig &source,
                  const PerformanceConfig &performance);
  ~MySQLConnection();

  MySQLConnection(const MySQLConnection &) = delete;
  MySQLConnection &operator=(const MySQLConnection &) = delete;

  MySQLConnection(MySQLConnection &&other) noexcept;
  MySQLConnection &operator=(MySQLConnection &&other) noexcept;

  MYSQL *get() const { return conn_; }
  bool isValid() const { return conn_ != nullptr; }
  const std::string &lastError() const { return lastError_; }
};

// Unbuffered (mysql_use_result) cursor on a connection of its own. The server
// streams rows as they are fetched, so client memory stays at one row.
// Closing it before the last row runs cancelQuery with the connection's
// thread id, so that freeing the result does not pull the rest of the table.
class MariaDBCursor : public ISourceCursor {
public:
  using QueryCanceller = std::function<void(unsigned long threadId)>;

private:
  std::unique_ptr<MySQLConnection> conn_;
  MYSQL_RES *result_{nullptr};
  std::vector<std::string> columnNames_;
  bool exhausted_{false};
  QueryCanceller cancelQuery_;

public:
  MariaDBCursor(std::unique_ptr<MySQLConnection> conn, MYSQL_RES *result,
                QueryCanceller cancelQuery);
  ~MariaDBCursor() override;

  MariaDBCursor(const MariaDBCursor &) = delete;
  MariaDBCursor &operator=(const MariaDBCursor &) = delete;

  const std::vector<std::string> &columnNames() const override {
    return columnNames_;
  }
  bool fetchRow(SourceRow &row) override;
  void close() override;
};

class MariaDBEngine : public ISourceEngine {
  const SourceConfig &source_;
  const PerformanceConfig &performance_;

public:
  MariaDBEngine(const SourceConfig &source,
                const PerformanceConfig &performance);

  bool testConnection() override;
  std::string databaseName() const override { return source_.database; }

  std::vector<SourceColumn> describeColumns(const std::string &table) override;
  std::vector<std::string> detectPrimaryKey(const std::string &table) override;
  uint64_t countRows(const std::string &table) override;

  std::unique_ptr<ISourceCursor>
  openCursor(const std::string &table, const std::vector<std::string> &columns,
             size_t fetchSize) override;

  // Lost or refused connections, lock wait timeouts and deadlocks.
  static bool isTransientError(unsigned int code);
  // Unknown column or missing table: the source changed under the task.
  static bool isSchemaChangeError(unsigned int code);

private:
  void killQuery(unsigned long threadId);
  std::unique_ptr<MySQLConnection> connectOnce();
  std::unique_ptr<MySQLConnection> createConnection();
  void setSessionOptions(MYSQL *conn);
  std::string escapeString(MYSQL *conn, const std::string &value);
  std::vector<SourceRow> executeQuery(MYSQL *conn, const std::string &query);
};

#endif
