#ifndef MIGRATIONTYPES_H
#define MIGRATIONTYPES_H

#include "core/migration_config.h"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// A source field exactly as the MySQL client returns it: text (or raw bytes
// for binary columns) or SQL NULL.
using SourceValue = std::optional<std::string>;
using SourceRow = std::vector<SourceValue>;

// Column metadata read from the source catalog.
struct SourceColumn {
  std::string name;
  std::string column_type; // e.g. "int(10) unsigned", "decimal(12,2)"
  bool nullable = true;
  bool primary_key = false;
};

enum class CoercionRule {
  SIGNED_INT,
  UNSIGNED_INT,
  BIT_FIELD,
  FLOAT,
  DECIMAL,
  TEXT,
  BINARY,
  DATE,
  DATETIME,
  TIMESTAMP
};

struct ColumnDef {
  std::string name;
  std::string source_type;
  std::string destination_type; // full type, Nullable(...) included
  bool nullable = true;

  CoercionRule rule = CoercionRule::TEXT;
  int bits = 0;      // integer width for SIGNED_INT/UNSIGNED_INT/BIT_FIELD
  int precision = 0; // DECIMAL
  int scale = 0;     // DECIMAL, and fractional digits for DATETIME/TIMESTAMP
  bool validate_utf8 = false;
};

struct NullValue {
  bool operator==(const NullValue &) const { return true; }
};

struct DecimalValue {
  std::string text; // canonical "[-]digits[.digits]"
  bool operator==(const DecimalValue &other) const {
    return text == other.text;
  }
};

struct BytesValue {
  std::string data;
  bool operator==(const BytesValue &other) const { return data == other.data; }
};

struct DateTimeValue {
  int year = 1970;
  int month = 1;
  int day = 1;
  int hour = 0;
  int minute = 0;
  int second = 0;
  int micros = 0;
  int fsp = 0;
  bool date_only = false;

  bool operator==(const DateTimeValue &other) const {
    return year == other.year && month == other.month && day == other.day &&
           hour == other.hour && minute == other.minute &&
           second == other.second && micros == other.micros &&
           fsp == other.fsp && date_only == other.date_only;
  }
};

// Destination-typed value produced by TypeMapper::coerce.
using Value = std::variant<NullValue, int64_t, uint64_t, double, DecimalValue,
                           std::string, BytesValue, DateTimeValue>;

using DestinationRow = std::vector<Value>;

struct Batch {
  std::vector<DestinationRow> rows;
  size_t sequence = 0; // 1-based position of this batch within its table

  size_t size() const { return rows.size(); }
  bool empty() const { return rows.empty(); }
};

enum class TableState {
  PENDING,
  SYNCING,
  STREAMING,
  VERIFYING,
  SUCCEEDED,
  FAILED,
  SKIPPED
};

enum class TableStatus { SUCCESS, FAILED, SKIPPED };

enum class OverallStatus { SUCCESS, SUCCESS_WITH_WARNINGS, FAILED, CANCELLED };

inline bool isTerminal(TableState state) {
  return state == TableState::SUCCEEDED || state == TableState::FAILED ||
         state == TableState::SKIPPED;
}

inline std::string tableStateToString(TableState state) {
  switch (state) {
  case TableState::PENDING:
    return "PENDING";
  case TableState::SYNCING:
    return "SYNCING";
  case TableState::STREAMING:
    return "STREAMING";
  case TableState::VERIFYING:
    return "VERIFYING";
  case TableState::SUCCEEDED:
    return "SUCCEEDED";
  case TableState::FAILED:
    return "FAILED";
  case TableState::SKIPPED:
    return "SKIPPED";
  }
  return "UNKNOWN";
}

inline std::string tableStatusToString(TableStatus status) {
  switch (status) {
  case TableStatus::SUCCESS:
    return "success";
  case TableStatus::FAILED:
    return "failed";
  case TableStatus::SKIPPED:
    return "skipped";
  }
  return "unknown";
}

inline std::string overallStatusToString(OverallStatus status) {
  switch (status) {
  case OverallStatus::SUCCESS:
    return "completed";
  case OverallStatus::SUCCESS_WITH_WARNINGS:
    return "completed_with_warnings";
  case OverallStatus::FAILED:
    return "failed";
  case OverallStatus::CANCELLED:
    return "cancelled";
  }
  return "unknown";
}

struct TableError {
  std::string name;   // error class, e.g. "WriteError"
  TableState state = TableState::PENDING; // state when it happened
  std::string message;
};

struct TableResult {
  TableSpec spec;
  uint64_t rows_read = 0;
  uint64_t rows_written = 0;
  uint64_t source_count = 0;
  uint64_t destination_count = 0;
  bool verified = false;
  TableStatus status = TableStatus::SKIPPED;
  std::optional<TableError> error;
  std::chrono::milliseconds duration{0};
  size_t batches_written = 0;

  double durationSeconds() const { return duration.count() / 1000.0; }
};

struct TaskResult {
  std::string task_name;
  std::vector<TableResult> table_results;
  OverallStatus overall_status = OverallStatus::SUCCESS;
  std::chrono::milliseconds duration{0};
  bool cancelled = false;
  std::optional<std::string> task_error;

  size_t countWithStatus(TableStatus status) const {
    size_t count = 0;
    for (const auto &result : table_results) {
      if (result.status == status)
        count++;
    }
    return count;
  }

  uint64_t totalRowsWritten() const {
    uint64_t total = 0;
    for (const auto &result : table_results)
      total += result.rows_written;
    return total;
  }

  const TableResult *firstFailure() const {
    for (const auto &result : table_results) {
      if (result.status == TableStatus::FAILED)
        return &result;
    }
    return nullptr;
  }
};

#endif
