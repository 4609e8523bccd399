#include "sync/StreamingReader.h"
#include "core/logger.h"
#include "sync/RetryPolicy.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <chrono>
#include <thread>

StreamingReader::StreamingReader(ISourceEngine &source,
                                 const PerformanceConfig &performance)
    : source_(source), performance_(performance) {}

StreamingReader::~StreamingReader() {
  try {
    close();
  } catch (const std::exception &e) {
    Logger::error(LogCategory::TRANSFER, "StreamingReader",
                  "Error closing cursor on " + table_ + ": " + e.what());
  }
}

// Opens the cursor, retrying transient ReadErrors with exponential backoff.
// The cursor's column list is compared with the columns the destination was
// built from; a difference means the table changed between describe and open
// and is reported as schema drift.
void StreamingReader::open(const std::string &table,
                           const std::vector<std::string> &expectedColumns,
                           size_t fetchSize) {
  close();
  table_ = table;
  expectedColumns_ = expectedColumns;
  fetchSize_ = std::max<size_t>(1, fetchSize);
  rowsRead_ = 0;
  finished_ = false;

  const RetryPolicy retry = RetryPolicy::forReads(performance_);
  const int maxAttempts = std::max(1, retry.max_attempts);
  for (int attempt = 1;; ++attempt) {
    try {
      cursor_ = source_.openCursor(table, expectedColumns, fetchSize_);
      break;
    } catch (const ReadError &e) {
      if (!e.isTransient() || attempt >= maxAttempts) {
        throw ReadError("Opening cursor on " + table + " failed after " +
                            std::to_string(attempt) +
                            " attempt(s): " + e.what(),
                        ErrorSeverity::TABLE_FATAL);
      }
      int backoffMs = retry.backoffFor(attempt);
      Logger::warning(LogCategory::TRANSFER, "StreamingReader",
                      "Opening cursor on " + table + " failed (attempt " +
                          std::to_string(attempt) + "), retrying in " +
                          std::to_string(backoffMs) + "ms: " + e.what());
      std::this_thread::sleep_for(std::chrono::milliseconds(backoffMs));
    }
  }

  if (cursor_->columnNames() != expectedColumns_) {
    std::string actual = StringUtils::join(cursor_->columnNames(), ", ");
    close();
    throw SchemaDriftError("Source columns of " + table +
                           " changed since schema sync: expected [" +
                           StringUtils::join(expectedColumns_, ", ") +
                           "], cursor returned [" + actual + "]");
  }
}

// A ReadError here cannot be retried: the cursor is forward-only and the rows
// already handed out cannot be fetched again, so the table fails as a whole.
std::optional<std::vector<SourceRow>> StreamingReader::nextBatch() {
  if (!cursor_) {
    if (finished_)
      return std::nullopt;
    throw ReadError("Reader is not open", ErrorSeverity::TABLE_FATAL);
  }
  if (finished_) {
    close();
    return std::nullopt;
  }

  std::vector<SourceRow> rows;
  rows.reserve(fetchSize_);

  try {
    SourceRow row;
    while (rows.size() < fetchSize_) {
      if (!cursor_->fetchRow(row)) {
        finished_ = true;
        break;
      }
      if (row.size() != expectedColumns_.size()) {
        throw SchemaDriftError("Row " + std::to_string(rowsRead_ + 1) + " of " +
                               table_ + " has " + std::to_string(row.size()) +
                               " fields, expected " +
                               std::to_string(expectedColumns_.size()));
      }
      rows.push_back(std::move(row));
      rowsRead_++;
    }
  } catch (const ReadError &e) {
    throw ReadError("Read failed on " + table_ + " after " +
                        std::to_string(rowsRead_) + " rows: " + e.what(),
                    ErrorSeverity::TABLE_FATAL);
  }

  if (rows.empty()) {
    close();
    finished_ = true;
    return std::nullopt;
  }
  return rows;
}

void StreamingReader::close() {
  if (cursor_) {
    cursor_->close();
    cursor_.reset();
  }
}
