#include "sync/BatchWriter.h"
#include "core/logger.h"
#include <algorithm>
#include <thread>

BatchWriter::BatchWriter(IWarehouseEngine &destination, std::string table,
                         const std::vector<ColumnDef> &columns,
                         const TypeMapper &mapper, size_t batchSize,
                         const PerformanceConfig &performance)
    : destination_(destination), table_(std::move(table)), columns_(columns),
      mapper_(mapper), batchSize_(std::max<size_t>(1, batchSize)),
      flushInterval_(performance.flush_interval_ms),
      retry_(RetryPolicy::forWrites(performance)) {
  buffer_.rows.reserve(batchSize_);
}

void BatchWriter::append(const SourceRow &row) {
  if (buffer_.empty()) {
    bufferStarted_ = std::chrono::steady_clock::now();
  }
  buffer_.rows.push_back(mapper_.coerceRow(row, columns_));
}

bool BatchWriter::shouldFlush() const {
  if (buffer_.size() >= batchSize_)
    return true;
  if (flushInterval_.count() > 0 && !buffer_.empty()) {
    return std::chrono::steady_clock::now() - bufferStarted_ >= flushInterval_;
  }
  return false;
}

std::chrono::milliseconds BatchWriter::timeUntilFlush() const {
  if (buffer_.empty())
    return flushInterval_;
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - bufferStarted_);
  if (elapsed >= flushInterval_)
    return std::chrono::milliseconds(0);
  return flushInterval_ - elapsed;
}

// The buffer is moved out before writing, so a batch is released as soon as
// its write returns or throws and is never sent a second time by a later
// flush.
size_t BatchWriter::flush() {
  if (buffer_.empty())
    return 0;

  Batch batch;
  batch.rows.swap(buffer_.rows);
  batch.sequence = nextSequence_++;
  buffer_.rows.reserve(batchSize_);
  return write(batch);
}

// Transient failures are retried with exponential backoff. Each retry runs
// through a freshly opened inserter, so a connection left in an unknown state
// by the failed attempt is never reused. If a failed attempt had in fact been
// applied, the retry appends the rows again; the destination is append-only
// and the count check afterwards reports the difference.
size_t BatchWriter::write(const Batch &batch) {
  if (batch.empty())
    return 0;

  const int maxAttempts = std::max(1, retry_.max_attempts);
  for (int attempt = 1;; ++attempt) {
    try {
      if (!inserter_) {
        inserter_ = destination_.openInserter(table_, columns_);
      }
      insertAttempts_++;
      inserter_->insert(batch);
      break;
    } catch (const WriteError &e) {
      inserter_.reset();
      if (!e.isTransient()) {
        throw;
      }
      if (attempt >= maxAttempts) {
        throw WriteError("Batch " + std::to_string(batch.sequence) + " of " +
                             table_ + " failed after " +
                             std::to_string(attempt) +
                             " attempts: " + e.what(),
                         ErrorSeverity::TABLE_FATAL);
      }
      int backoffMs = retry_.backoffFor(attempt);
      Logger::warning(LogCategory::TRANSFER, "BatchWriter",
                      "Batch " + std::to_string(batch.sequence) + " of " +
                          table_ + " failed (attempt " +
                          std::to_string(attempt) + "/" +
                          std::to_string(maxAttempts) + "), retrying in " +
                          std::to_string(backoffMs) + "ms: " + e.what());
      std::this_thread::sleep_for(std::chrono::milliseconds(backoffMs));
    }
  }

  writeCalls_++;
  rowsWritten_ += batch.size();
  return batch.size();
}
