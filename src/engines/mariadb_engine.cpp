#include "engines/mariadb_engine.h"
#include "sync/MigrationErrors.h"
#include "sync/RetryPolicy.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <chrono>
#include <mysql/errmsg.h>
#include <mysql/mysqld_error.h>
#include <thread>

MySQLConnection::MySQLConnection(const SourceConfig &source,
                                 const PerformanceConfig &performance) {
  conn_ = mysql_init(nullptr);
  if (!conn_) {
    lastError_ = "mysql_init() failed";
    Logger::error(LogCategory::DATABASE, "MySQLConnection", lastError_);
    return;
  }

  unsigned int connectTimeout =
      static_cast<unsigned int>(performance.connection_timeout);
  unsigned int readTimeout = static_cast<unsigned int>(performance.read_timeout);
  unsigned int writeTimeout =
      static_cast<unsigned int>(performance.write_timeout);
  mysql_options(conn_, MYSQL_OPT_CONNECT_TIMEOUT, &connectTimeout);
  mysql_options(conn_, MYSQL_OPT_READ_TIMEOUT, &readTimeout);
  mysql_options(conn_, MYSQL_OPT_WRITE_TIMEOUT, &writeTimeout);
  mysql_options(conn_, MYSQL_SET_CHARSET_NAME, source.charset.c_str());

  if (mysql_real_connect(conn_, source.host.c_str(), source.user.c_str(),
                         source.password.c_str(), source.database.c_str(),
                         static_cast<unsigned int>(source.port), nullptr,
                         0) == nullptr) {
    lastError_ = mysql_error(conn_);
    Logger::error(LogCategory::DATABASE, "MySQLConnection",
                  "Connection failed: " + lastError_);
    mysql_close(conn_);
    conn_ = nullptr;
  }
}

MySQLConnection::~MySQLConnection() {
  if (conn_)
    mysql_close(conn_);
}

MySQLConnection::MySQLConnection(MySQLConnection &&other) noexcept
    : conn_(other.conn_), lastError_(std::move(other.lastError_)) {
  other.conn_ = nullptr;
}

MySQLConnection &MySQLConnection::operator=(MySQLConnection &&other) noexcept {
  if (this != &other) {
    if (conn_)
      mysql_close(conn_);
    conn_ = other.conn_;
    lastError_ = std::move(other.lastError_);
    other.conn_ = nullptr;
  }
  return *this;
}

MariaDBCursor::MariaDBCursor(std::unique_ptr<MySQLConnection> conn,
                             MYSQL_RES *result, QueryCanceller cancelQuery)
    : conn_(std::move(conn)), result_(result),
      cancelQuery_(std::move(cancelQuery)) {
  unsigned int numFields = mysql_num_fields(result_);
  MYSQL_FIELD *fields = mysql_fetch_fields(result_);
  columnNames_.reserve(numFields);
  for (unsigned int i = 0; i < numFields; ++i) {
    columnNames_.emplace_back(fields[i].name, fields[i].name_length);
  }
}

MariaDBCursor::~MariaDBCursor() { close(); }

// mysql_fetch_lengths gives the byte length of every field, so binary values
// with embedded zero bytes come through intact. A NULL row pointer means
// either end of stream or a failure; mysql_errno tells them apart.
bool MariaDBCursor::fetchRow(SourceRow &row) {
  if (!result_ || exhausted_)
    return false;

  MYSQL_ROW mysqlRow = mysql_fetch_row(result_);
  if (!mysqlRow) {
    if (mysql_errno(conn_->get()) != 0) {
      throw ReadError("Cursor fetch failed: " +
                      std::string(mysql_error(conn_->get())));
    }
    exhausted_ = true;
    return false;
  }

  unsigned long *lengths = mysql_fetch_lengths(result_);
  size_t numFields = columnNames_.size();
  row.clear();
  row.reserve(numFields);
  for (size_t i = 0; i < numFields; ++i) {
    if (mysqlRow[i]) {
      row.emplace_back(std::string(mysqlRow[i], lengths[i]));
    } else {
      row.emplace_back(std::nullopt);
    }
  }
  return true;
}

// Freeing an unbuffered result that was not read to the end makes the client
// drain the remaining rows first. The query is killed beforehand so the
// server ends the stream; if the kill fails the drain still happens, only
// slower.
void MariaDBCursor::close() {
  if (result_) {
    if (!exhausted_ && cancelQuery_ && conn_ && conn_->isValid()) {
      unsigned long threadId = mysql_thread_id(conn_->get());
      Logger::debug(LogCategory::DATABASE, "MariaDBCursor",
                    "Closing cursor before end of stream, killing query on "
                    "connection " +
                        std::to_string(threadId));
      try {
        cancelQuery_(threadId);
      } catch (const std::exception &e) {
        Logger::warning(LogCategory::DATABASE, "MariaDBCursor",
                        "Could not cancel streaming query on connection " +
                            std::to_string(threadId) + ": " + e.what());
      }
    }
    mysql_free_result(result_);
    result_ = nullptr;
  }
  conn_.reset();
}

MariaDBEngine::MariaDBEngine(const SourceConfig &source,
                             const PerformanceConfig &performance)
    : source_(source), performance_(performance) {}

std::unique_ptr<MySQLConnection> MariaDBEngine::connectOnce() {
  auto conn = std::make_unique<MySQLConnection>(source_, performance_);
  if (!conn->isValid()) {
    throw ReadError("Cannot connect to MySQL " + source_.host + ":" +
                    std::to_string(source_.port) + ": " + conn->lastError());
  }
  setSessionOptions(conn->get());
  return conn;
}

std::unique_ptr<MySQLConnection> MariaDBEngine::createConnection() {
  const RetryPolicy retry = RetryPolicy::forReads(performance_);
  const int maxRetries = std::max(1, retry.max_attempts);

  for (int attempt = 1;; ++attempt) {
    try {
      auto conn = connectOnce();
      if (attempt > 1) {
        Logger::info(LogCategory::DATABASE, "MariaDBEngine",
                     "Connection successful on attempt " +
                         std::to_string(attempt));
      }
      return conn;
    } catch (const ReadError &e) {
      if (attempt >= maxRetries) {
        throw ReadError("Failed to connect after " + std::to_string(attempt) +
                            " attempts: " + e.what(),
                        ErrorSeverity::TABLE_FATAL);
      }
      int backoffMs = retry.backoffFor(attempt);
      Logger::warning(LogCategory::DATABASE, "MariaDBEngine",
                      "Connection attempt " + std::to_string(attempt) +
                          " failed, retrying in " + std::to_string(backoffMs) +
                          "ms...");
      std::this_thread::sleep_for(std::chrono::milliseconds(backoffMs));
    }
  }
}

// Long session timeouts keep the server from dropping a streaming cursor
// while the destination is slow; time_zone is pinned so TIMESTAMP text is UTC.
void MariaDBEngine::setSessionOptions(MYSQL *conn) {
  const int timeout = MigrationDefaults::MYSQL_SESSION_TIMEOUT_SECONDS;
  std::string query = "SET SESSION wait_timeout = " + std::to_string(timeout) +
                      ", net_read_timeout = " + std::to_string(timeout) +
                      ", net_write_timeout = " + std::to_string(timeout) +
                      ", time_zone = '+00:00'";

  if (mysql_query(conn, query.c_str())) {
    Logger::warning(LogCategory::DATABASE, "MariaDBEngine",
                    "Failed to set session options: " +
                        std::string(mysql_error(conn)));
  }
}

std::string MariaDBEngine::escapeString(MYSQL *conn, const std::string &value) {
  std::vector<char> buffer(value.length() * 2 + 1);
  unsigned long len = mysql_real_escape_string(conn, buffer.data(),
                                               value.c_str(), value.length());
  if (len == static_cast<unsigned long>(-1)) {
    throw ReadError("mysql_real_escape_string failed for '" + value + "'",
                    ErrorSeverity::TABLE_FATAL);
  }
  return std::string(buffer.data(), len);
}

bool MariaDBEngine::isTransientError(unsigned int code) {
  switch (code) {
  case CR_CONNECTION_ERROR:
  case CR_CONN_HOST_ERROR:
  case CR_SERVER_GONE_ERROR:
  case CR_SERVER_LOST:
  case ER_LOCK_WAIT_TIMEOUT:
  case ER_LOCK_DEADLOCK:
    return true;
  default:
    return false;
  }
}

bool MariaDBEngine::isSchemaChangeError(unsigned int code) {
  return code == ER_BAD_FIELD_ERROR || code == ER_NO_SUCH_TABLE;
}

std::vector<SourceRow> MariaDBEngine::executeQuery(MYSQL *conn,
                                                   const std::string &query) {
  std::vector<SourceRow> results;

  if (mysql_query(conn, query.c_str())) {
    unsigned int code = mysql_errno(conn);
    throw ReadError("Query failed: " + std::string(mysql_error(conn)) +
                        " (error code: " + std::to_string(code) + ")",
                    isTransientError(code) ? ErrorSeverity::TRANSIENT
                                           : ErrorSeverity::TABLE_FATAL);
  }

  MYSQL_RES *res = mysql_store_result(conn);
  if (!res) {
    if (mysql_field_count(conn) > 0) {
      unsigned int code = mysql_errno(conn);
      throw ReadError("Result fetch failed: " + std::string(mysql_error(conn)) +
                          " (error code: " + std::to_string(code) + ")",
                      isTransientError(code) ? ErrorSeverity::TRANSIENT
                                             : ErrorSeverity::TABLE_FATAL);
    }
    return results;
  }

  unsigned int numFields = mysql_num_fields(res);
  MYSQL_ROW row;
  while ((row = mysql_fetch_row(res))) {
    unsigned long *lengths = mysql_fetch_lengths(res);
    SourceRow rowData;
    rowData.reserve(numFields);
    for (unsigned int i = 0; i < numFields; ++i) {
      if (row[i])
        rowData.emplace_back(std::string(row[i], lengths[i]));
      else
        rowData.emplace_back(std::nullopt);
    }
    results.push_back(std::move(rowData));
  }
  mysql_free_result(res);
  return results;
}

bool MariaDBEngine::testConnection() {
  try {
    auto conn = connectOnce();
    auto rows = executeQuery(conn->get(), "SELECT 1");
    return !rows.empty();
  } catch (const ReadError &e) {
    Logger::error(LogCategory::DATABASE, "MariaDBEngine",
                  "Connection test failed: " + std::string(e.what()));
    return false;
  }
}

std::vector<SourceColumn>
MariaDBEngine::describeColumns(const std::string &table) {
  auto conn = createConnection();
  std::string query =
      "SELECT COLUMN_NAME, COLUMN_TYPE, IS_NULLABLE, COLUMN_KEY "
      "FROM information_schema.COLUMNS "
      "WHERE TABLE_SCHEMA = '" +
      escapeString(conn->get(), source_.database) + "' AND TABLE_NAME = '" +
      escapeString(conn->get(), table) + "' ORDER BY ORDINAL_POSITION";

  std::vector<SourceColumn> columns;
  for (const auto &row : executeQuery(conn->get(), query)) {
    if (row.size() < 4 || !row[0] || !row[1])
      continue;
    SourceColumn column;
    column.name = *row[0];
    column.column_type = *row[1];
    column.nullable = row[2] && StringUtils::toUpper(*row[2]) == "YES";
    column.primary_key = row[3] && *row[3] == "PRI";
    columns.push_back(column);
  }

  if (columns.empty()) {
    throw ReadError("Table " + source_.database + "." + table +
                        " not found or has no columns",
                    ErrorSeverity::TABLE_FATAL);
  }
  return columns;
}

std::vector<std::string>
MariaDBEngine::detectPrimaryKey(const std::string &table) {
  auto conn = createConnection();
  std::string query = "SELECT COLUMN_NAME "
                      "FROM information_schema.KEY_COLUMN_USAGE "
                      "WHERE TABLE_SCHEMA = '" +
                      escapeString(conn->get(), source_.database) +
                      "' AND TABLE_NAME = '" +
                      escapeString(conn->get(), table) +
                      "' AND CONSTRAINT_NAME = 'PRIMARY' "
                      "ORDER BY ORDINAL_POSITION";

  std::vector<std::string> pkColumns;
  for (const auto &row : executeQuery(conn->get(), query)) {
    if (!row.empty() && row[0] && !row[0]->empty())
      pkColumns.push_back(*row[0]);
  }
  return pkColumns;
}

uint64_t MariaDBEngine::countRows(const std::string &table) {
  auto conn = createConnection();
  std::string query = "SELECT COUNT(*) FROM " +
                      StringUtils::quoteMySQLIdentifier(source_.database) +
                      "." + StringUtils::quoteMySQLIdentifier(table);
  auto rows = executeQuery(conn->get(), query);
  if (rows.empty() || rows[0].empty() || !rows[0][0]) {
    throw ReadError("COUNT(*) returned no value for " + table,
                    ErrorSeverity::TABLE_FATAL);
  }
  try {
    return std::stoull(*rows[0][0]);
  } catch (const std::exception &e) {
    throw ReadError("Unparseable COUNT(*) result for " + table + ": " +
                        *rows[0][0] + " (" + e.what() + ")",
                    ErrorSeverity::TABLE_FATAL);
  }
}

// fetchSize does not change what the server sends with mysql_use_result; the
// streaming reader uses it to size the chunks it hands to the writer.
std::unique_ptr<ISourceCursor>
MariaDBEngine::openCursor(const std::string &table,
                          const std::vector<std::string> &columns,
                          size_t fetchSize) {
  auto conn = connectOnce();

  std::vector<std::string> quoted;
  quoted.reserve(columns.size());
  for (const auto &column : columns) {
    quoted.push_back(StringUtils::quoteMySQLIdentifier(column));
  }
  std::string query = "SELECT " + StringUtils::join(quoted, ", ") + " FROM " +
                      StringUtils::quoteMySQLIdentifier(source_.database) +
                      "." + StringUtils::quoteMySQLIdentifier(table);

  if (mysql_query(conn->get(), query.c_str())) {
    unsigned int code = mysql_errno(conn->get());
    std::string message = "Cursor query failed on " + table + ": " +
                          std::string(mysql_error(conn->get()));
    if (isSchemaChangeError(code)) {
      throw SchemaDriftError(message + " (table changed since schema sync)");
    }
    throw ReadError(message, isTransientError(code)
                                 ? ErrorSeverity::TRANSIENT
                                 : ErrorSeverity::TABLE_FATAL);
  }

  MYSQL_RES *result = mysql_use_result(conn->get());
  if (!result) {
    unsigned int code = mysql_errno(conn->get());
    throw ReadError("mysql_use_result failed on " + table + ": " +
                        std::string(mysql_error(conn->get())),
                    isTransientError(code) ? ErrorSeverity::TRANSIENT
                                           : ErrorSeverity::TABLE_FATAL);
  }

  Logger::debug(LogCategory::DATABASE, "MariaDBEngine",
                "Opened streaming cursor on " + table + " (fetch size " +
                    std::to_string(fetchSize) + ")");
  return std::make_unique<MariaDBCursor>(
      std::move(conn), result,
      [this](unsigned long threadId) { killQuery(threadId); });
}

// Runs on a short-lived side connection; the streaming connection itself is
// busy until its result is freed.
void MariaDBEngine::killQuery(unsigned long threadId) {
  auto side = connectOnce();
  executeQuery(side->get(), "KILL QUERY " + std::to_string(threadId));
}
