#include "engines/clickhouse_engine.h"
#include "sync/MigrationErrors.h"
#include "utils/string_utils.h"
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace {
constexpr size_t MAX_ERROR_BODY = 500;

size_t WriteCallback(void *contents, size_t size, size_t nmemb, void *userp) {
  ((std::string *)userp)->append((char *)contents, size * nmemb);
  return size * nmemb;
}

uint64_t jsonToUInt64(const json &value) {
  if (value.is_number_unsigned())
    return value.get<uint64_t>();
  if (value.is_number_integer())
    return static_cast<uint64_t>(value.get<int64_t>());
  if (value.is_string())
    return std::stoull(value.get<std::string>());
  throw std::invalid_argument("not a count: " + value.dump());
}

struct ValueFormatter {
  std::string operator()(const NullValue &) const { return "\\N"; }
  std::string operator()(int64_t v) const { return std::to_string(v); }
  std::string operator()(uint64_t v) const { return std::to_string(v); }
  std::string operator()(double v) const {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.17g", v);
    return buffer;
  }
  std::string operator()(const DecimalValue &v) const { return v.text; }
  std::string operator()(const std::string &v) const {
    return ClickHouseEngine::escapeTSV(v);
  }
  std::string operator()(const BytesValue &v) const {
    return ClickHouseEngine::escapeTSV(v.data);
  }
  std::string operator()(const DateTimeValue &v) const {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << v.year << '-' << std::setw(2)
        << v.month << '-' << std::setw(2) << v.day;
    if (v.date_only)
      return oss.str();
    oss << ' ' << std::setw(2) << v.hour << ':' << std::setw(2) << v.minute
        << ':' << std::setw(2) << v.second;
    if (v.fsp > 0) {
      std::ostringstream micros;
      micros << std::setfill('0') << std::setw(6) << v.micros;
      oss << '.' << micros.str().substr(0, static_cast<size_t>(v.fsp));
    }
    return oss.str();
  }
};
} // namespace

ClickHouseInserter::ClickHouseInserter(ClickHouseEngine &engine,
                                       std::string insertQuery)
    : engine_(engine), insertQuery_(std::move(insertQuery)) {
  curl_ = curl_easy_init();
  if (!curl_) {
    throw WriteError("Failed to initialize CURL");
  }
}

ClickHouseInserter::~ClickHouseInserter() {
  if (curl_)
    curl_easy_cleanup(curl_);
}

void ClickHouseInserter::insert(const Batch &batch) {
  if (batch.empty())
    return;
  std::string body = ClickHouseEngine::encodeTSV(batch);
  engine_.post(curl_, insertQuery_, body,
               engine_.performance().write_timeout);
}

ClickHouseEngine::ClickHouseEngine(const DestinationConfig &config,
                                   const PerformanceConfig &performance)
    : config_(config), performance_(performance) {}

std::string ClickHouseEngine::baseUrl() const {
  return std::string(config_.secure ? "https://" : "http://") + config_.host +
         ":" + std::to_string(config_.port) + "/";
}

std::string ClickHouseEngine::qualifiedName(const std::string &table) const {
  return StringUtils::quoteClickHouseIdentifier(config_.database) + "." +
         StringUtils::quoteClickHouseIdentifier(table);
}

// One HTTP POST against the ClickHouse HTTP interface. The statement travels
// in the query URL parameter so the body can carry raw insert data; for plain
// statements the body is the statement itself and query is empty. Network
// level failures and gateway errors are reported as transient so the batch
// writer may retry them. Any other non-200 answer carries a ClickHouse
// exception text (syntax, type, missing table) that a retry cannot fix.
std::string ClickHouseEngine::post(CURL *curl, const std::string &query,
                                   const std::string &body,
                                   long timeoutSeconds) {
  std::string url = baseUrl() + "?database=";
  char *escapedDb =
      curl_easy_escape(curl, config_.database.c_str(),
                       static_cast<int>(config_.database.size()));
  url += escapedDb ? escapedDb : "";
  curl_free(escapedDb);

  if (!query.empty()) {
    char *escapedQuery =
        curl_easy_escape(curl, query.c_str(), static_cast<int>(query.size()));
    url += "&query=";
    url += escapedQuery ? escapedQuery : "";
    curl_free(escapedQuery);
  }

  std::string response;
  struct curl_slist *headers = nullptr;
  std::string userHeader = "X-ClickHouse-User: " + config_.user;
  std::string keyHeader = "X-ClickHouse-Key: " + config_.password;
  headers = curl_slist_append(headers, userHeader.c_str());
  headers = curl_slist_append(headers, keyHeader.c_str());
  headers = curl_slist_append(headers, "Content-Type: text/plain");

  curl_easy_reset(curl);
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.data());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                   static_cast<curl_off_t>(body.size()));
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT,
                   static_cast<long>(performance_.connection_timeout));
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeoutSeconds);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

  CURLcode res = curl_easy_perform(curl);
  long httpCode = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
  curl_slist_free_all(headers);

  if (res != CURLE_OK) {
    throw WriteError("ClickHouse request failed: " +
                     std::string(curl_easy_strerror(res)));
  }

  if (httpCode != 200) {
    std::string detail = StringUtils::trim(response.substr(0, MAX_ERROR_BODY));
    ErrorSeverity severity = isTransientHttpStatus(httpCode)
                                 ? ErrorSeverity::TRANSIENT
                                 : ErrorSeverity::TABLE_FATAL;
    throw WriteError("ClickHouse returned HTTP " + std::to_string(httpCode) +
                         ": " + detail,
                     severity);
  }

  return response;
}

bool ClickHouseEngine::isTransientHttpStatus(long status) {
  return status == 429 || status == 502 || status == 503 || status == 504;
}

std::vector<json> ClickHouseEngine::executeQuery(const std::string &query) {
  CURL *curl = curl_easy_init();
  if (!curl) {
    throw WriteError("Failed to initialize CURL");
  }

  std::string response;
  try {
    response = post(curl, "", query + " FORMAT JSON",
                    performance_.read_timeout);
  } catch (const WriteError &) {
    curl_easy_cleanup(curl);
    throw;
  }
  curl_easy_cleanup(curl);

  std::vector<json> rows;
  try {
    json parsed = json::parse(response);
    if (parsed.contains("data") && parsed["data"].is_array()) {
      for (const auto &row : parsed["data"]) {
        rows.push_back(row);
      }
    }
  } catch (const json::exception &e) {
    throw WriteError("Unparseable ClickHouse response: " +
                         std::string(e.what()),
                     ErrorSeverity::TABLE_FATAL);
  }
  return rows;
}

void ClickHouseEngine::executeStatement(const std::string &statement) {
  CURL *curl = curl_easy_init();
  if (!curl) {
    throw WriteError("Failed to initialize CURL");
  }
  try {
    post(curl, "", statement, performance_.write_timeout);
  } catch (const WriteError &) {
    curl_easy_cleanup(curl);
    throw;
  }
  curl_easy_cleanup(curl);
}

bool ClickHouseEngine::testConnection() {
  try {
    auto rows = executeQuery("SELECT 1 AS ok");
    return !rows.empty();
  } catch (const std::exception &e) {
    Logger::error(LogCategory::DATABASE, "ClickHouseEngine::testConnection",
                  "Connection test failed: " + std::string(e.what()));
    return false;
  }
}

bool ClickHouseEngine::tableExists(const std::string &table) {
  auto rows = executeQuery(
      "SELECT count() AS n FROM system.tables WHERE database = " +
      StringUtils::quoteLiteral(config_.database) +
      " AND name = " + StringUtils::quoteLiteral(table));
  return !rows.empty() && jsonToUInt64(rows[0]["n"]) > 0;
}

std::vector<WarehouseColumnInfo>
ClickHouseEngine::describeColumns(const std::string &table) {
  auto rows = executeQuery(
      "SELECT name, type FROM system.columns WHERE database = " +
      StringUtils::quoteLiteral(config_.database) +
      " AND table = " + StringUtils::quoteLiteral(table) +
      " ORDER BY position");

  std::vector<WarehouseColumnInfo> columns;
  columns.reserve(rows.size());
  for (const auto &row : rows) {
    columns.push_back({row.value("name", ""), row.value("type", "")});
  }
  return columns;
}

void ClickHouseEngine::createTable(const std::string &table,
                                   const std::vector<ColumnDef> &columns,
                                   const std::vector<std::string> &orderBy) {
  std::string ddl =
      buildCreateTableSQL(config_.database, table, columns, orderBy);
  Logger::info(LogCategory::SCHEMA, "ClickHouseEngine::createTable",
               "Creating " + config_.database + "." + table);
  Logger::debug(LogCategory::SCHEMA, "ClickHouseEngine::createTable", ddl);
  executeStatement(ddl);
}

void ClickHouseEngine::dropTable(const std::string &table) {
  Logger::warning(LogCategory::SCHEMA, "ClickHouseEngine::dropTable",
                  "Dropping " + config_.database + "." + table);
  executeStatement("DROP TABLE IF EXISTS " + qualifiedName(table));
}

uint64_t ClickHouseEngine::countRows(const std::string &table) {
  auto rows = executeQuery("SELECT count() AS n FROM " + qualifiedName(table));
  if (rows.empty()) {
    throw WriteError("count() returned no rows for " + table,
                     ErrorSeverity::TABLE_FATAL);
  }
  return jsonToUInt64(rows[0]["n"]);
}

std::unique_ptr<IBulkInserter>
ClickHouseEngine::openInserter(const std::string &table,
                               const std::vector<ColumnDef> &columns) {
  return std::make_unique<ClickHouseInserter>(
      *this, buildInsertQuery(config_.database, table, columns));
}

// TabSeparated escaping: backslash, tab, newline, carriage return, NUL,
// backspace and form feed. Everything else, including non-UTF-8 bytes, is
// passed through, so binary columns survive unchanged.
std::string ClickHouseEngine::escapeTSV(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + value.size() / 8);
  for (char c : value) {
    switch (c) {
    case '\\':
      escaped += "\\\\";
      break;
    case '\t':
      escaped += "\\t";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\0':
      escaped += "\\0";
      break;
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
      break;
    default:
      escaped += c;
    }
  }
  return escaped;
}

std::string ClickHouseEngine::formatValue(const Value &value) {
  return std::visit(ValueFormatter{}, value);
}

std::string ClickHouseEngine::encodeTSV(const Batch &batch) {
  std::string body;
  for (const auto &row : batch.rows) {
    for (size_t i = 0; i < row.size(); ++i) {
      if (i > 0)
        body += '\t';
      body += formatValue(row[i]);
    }
    body += '\n';
  }
  return body;
}

std::string ClickHouseEngine::buildCreateTableSQL(
    const std::string &database, const std::string &table,
    const std::vector<ColumnDef> &columns,
    const std::vector<std::string> &orderBy) {
  std::ostringstream ddl;
  ddl << "CREATE TABLE IF NOT EXISTS "
      << StringUtils::quoteClickHouseIdentifier(database) << "."
      << StringUtils::quoteClickHouseIdentifier(table) << " (\n";
  for (size_t i = 0; i < columns.size(); ++i) {
    ddl << "  " << StringUtils::quoteClickHouseIdentifier(columns[i].name)
        << " " << columns[i].destination_type;
    if (i + 1 < columns.size())
      ddl << ",";
    ddl << "\n";
  }
  ddl << ") ENGINE = MergeTree() ORDER BY ";
  if (orderBy.empty()) {
    ddl << "tuple()";
  } else {
    std::vector<std::string> quoted;
    for (const auto &column : orderBy) {
      quoted.push_back(StringUtils::quoteClickHouseIdentifier(column));
    }
    ddl << "(" << StringUtils::join(quoted, ", ") << ")";
  }
  ddl << " SETTINGS index_granularity = 8192";
  return ddl.str();
}

std::string
ClickHouseEngine::buildInsertQuery(const std::string &database,
                                   const std::string &table,
                                   const std::vector<ColumnDef> &columns) {
  std::vector<std::string> quoted;
  quoted.reserve(columns.size());
  for (const auto &column : columns) {
    quoted.push_back(StringUtils::quoteClickHouseIdentifier(column.name));
  }
  return "INSERT INTO " + StringUtils::quoteClickHouseIdentifier(database) +
         "." + StringUtils::quoteClickHouseIdentifier(table) + " (" +
         StringUtils::join(quoted, ", ") + ") FORMAT TabSeparated";
}
