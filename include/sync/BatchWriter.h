#ifndef BATCHWRITER_H
#define BATCHWRITER_H

#include "core/migration_config.h"
#include "engines/warehouse_engine.h"
#include "sync/MigrationErrors.h"
#include "sync/RetryPolicy.h"
#include "sync/TypeMapper.h"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

// Buffers coerced rows for one destination table and writes them in bulk.
// A batch goes out when it reaches batchSize, when the flush interval has
// passed since its first row, or when the caller flushes at end of stream.
class BatchWriter {
  IWarehouseEngine &destination_;
  std::string table_;
  const std::vector<ColumnDef> &columns_;
  const TypeMapper &mapper_;
  size_t batchSize_;
  std::chrono::milliseconds flushInterval_;
  RetryPolicy retry_;

  std::unique_ptr<IBulkInserter> inserter_;
  Batch buffer_;
  std::chrono::steady_clock::time_point bufferStarted_;
  size_t nextSequence_ = 1;
  uint64_t rowsWritten_ = 0;
  size_t writeCalls_ = 0;
  size_t insertAttempts_ = 0;

public:
  BatchWriter(IWarehouseEngine &destination, std::string table,
              const std::vector<ColumnDef> &columns, const TypeMapper &mapper,
              size_t batchSize, const PerformanceConfig &performance);

  // Coerces and buffers one row. Throws CoercionError.
  void append(const SourceRow &row);

  bool shouldFlush() const;

  bool hasFlushInterval() const { return flushInterval_.count() > 0; }

  // Time until the buffered rows fall due under the flush interval. Zero
  // once they are due; the whole interval while the buffer is empty.
  std::chrono::milliseconds timeUntilFlush() const;

  // Writes the buffered rows, if any, as one batch. Returns rows written.
  size_t flush();

  // One bulk insert of batch, retried on transient failures.
  size_t write(const Batch &batch);

  uint64_t rowsWritten() const { return rowsWritten_; }
  size_t writeCalls() const { return writeCalls_; }
  size_t insertAttempts() const { return insertAttempts_; }
  size_t bufferedRows() const { return buffer_.size(); }
  size_t batchSize() const { return batchSize_; }
};

#endif
