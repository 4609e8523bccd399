#include "sync/MigrationOrchestrator.h"
#include "core/logger.h"
#include "sync/BatchWriter.h"
#include "sync/MigrationErrors.h"
#include "sync/ParallelProcessing.h"
#include "sync/ProgressTracker.h"
#include "sync/RetryPolicy.h"
#include "sync/SchemaSynchronizer.h"
#include "sync/StreamingReader.h"
#include "sync/Verifier.h"
#include "utils/string_utils.h"
#include <thread>

namespace {
// Tracks the current state of one table and makes sure the terminal state is
// entered once.
class TableRun {
  const TableSpec &spec_;
  TableResult &result_;
  const StateCallback &onStateChange_;
  TableState state_ = TableState::PENDING;

public:
  TableRun(const TableSpec &spec, TableResult &result,
           const StateCallback &onStateChange)
      : spec_(spec), result_(result), onStateChange_(onStateChange) {}

  TableState state() const { return state_; }

  void enter(TableState next) {
    if (isTerminal(state_)) {
      Logger::error(LogCategory::TRANSFER, "MigrationOrchestrator",
                    spec_.source_table + ": ignoring transition to " +
                        tableStateToString(next) + " after " +
                        tableStateToString(state_));
      return;
    }
    state_ = next;
    Logger::debug(LogCategory::TRANSFER, "MigrationOrchestrator",
                  spec_.source_table + " -> " + tableStateToString(next));
    emit();
  }

  void finish(TableState terminal, std::optional<TableError> error) {
    if (isTerminal(state_))
      return;
    result_.error = std::move(error);
    switch (terminal) {
    case TableState::SUCCEEDED:
      result_.status = TableStatus::SUCCESS;
      break;
    case TableState::FAILED:
      result_.status = TableStatus::FAILED;
      break;
    default:
      result_.status = TableStatus::SKIPPED;
      break;
    }
    enter(terminal);
  }

  void fail(const std::string &name, const std::string &message) {
    TableState at = state_;
    finish(TableState::FAILED, TableError{name, at, message});
  }

private:
  void emit() {
    if (!onStateChange_)
      return;
    TableStateRecord record;
    record.timestamp = std::chrono::system_clock::now();
    record.source_table = spec_.source_table;
    record.destination_table = spec_.destination_table;
    record.state = state_;
    record.rows_read = result_.rows_read;
    record.rows_written = result_.rows_written;
    record.error = result_.error;
    onStateChange_(record);
  }
};
} // namespace

MigrationOrchestrator::MigrationOrchestrator(const MigrationConfig &config,
                                             ISourceEngine &source,
                                             IWarehouseEngine &destination,
                                             const TypeMapper &mapper)
    : config_(config), source_(source), destination_(destination),
      mapper_(mapper) {}

// Drives one table end to end. The pre-count doubles as the empty-table check
// and as the total for progress lines. Any exception is converted into the
// table's error record with the state it happened in; the destination is
// never rolled back, rows already written stay in place.
TableResult MigrationOrchestrator::migrateTable(
    const TableSpec &spec, const StopPredicate &stopRequested,
    const StateCallback &onStateChange) {
  TableResult result;
  result.spec = spec;
  TableRun run(spec, result, onStateChange);
  auto start = std::chrono::steady_clock::now();

  Logger::info(LogCategory::TRANSFER, "MigrationOrchestrator",
               "Migrating " + source_.databaseName() + "." + spec.source_table +
                   " -> " + destination_.databaseName() + "." +
                   spec.destination_table + " (batch size " +
                   std::to_string(spec.batch_size) + ")");

  const RetryPolicy readRetry = RetryPolicy::forReads(config_.performance);
  const RetryPolicy writeRetry = RetryPolicy::forWrites(config_.performance);

  try {
    uint64_t sourceRows =
        retryTransient(readRetry, "Counting rows of " + spec.source_table,
                       [&]() { return source_.countRows(spec.source_table); });
    result.source_count = sourceRows;

    if (sourceRows == 0 && config_.task.skip_empty_tables) {
      Logger::info(LogCategory::TRANSFER, "MigrationOrchestrator",
                   spec.source_table + " is empty, skipping");
      run.finish(TableState::SKIPPED, std::nullopt);
    } else {
      run.enter(TableState::SYNCING);
      auto sourceColumns =
          retryTransient(readRetry, "Describing " + spec.source_table, [&]() {
            return source_.describeColumns(spec.source_table);
          });
      auto primaryKey = retryTransient(
          readRetry, "Reading primary key of " + spec.source_table,
          [&]() { return source_.detectPrimaryKey(spec.source_table); });
      auto columns = mapper_.mapColumns(sourceColumns);

      SchemaSynchronizer synchronizer(destination_, writeRetry);
      synchronizer.ensureTable(spec.destination_table, columns, primaryKey,
                               config_.task.drop_table_before_create);

      run.enter(TableState::STREAMING);
      bool completed =
          streamTable(spec, columns, sourceRows, stopRequested, result);

      if (!completed) {
        run.finish(TableState::SKIPPED,
                   TableError{"Cancelled", TableState::STREAMING,
                              "Cancelled after " +
                                  StringUtils::formatNumber(
                                      result.rows_written) +
                                  " rows written"});
      } else if (spec.verify) {
        run.enter(TableState::VERIFYING);
        Verifier verifier(source_, destination_, readRetry, writeRetry);
        auto verification =
            verifier.verify(spec.source_table, spec.destination_table);
        result.source_count = verification.source_count;
        result.destination_count = verification.destination_count;
        result.verified = verification.match;

        if (verification.match) {
          run.finish(TableState::SUCCEEDED, std::nullopt);
        } else {
          run.fail("VerificationMismatch",
                   "Row count mismatch: source " +
                       std::to_string(verification.source_count) +
                       ", destination " +
                       std::to_string(verification.destination_count));
        }
      } else {
        run.finish(TableState::SUCCEEDED, std::nullopt);
      }
    }
  } catch (const MigrationError &e) {
    run.fail(e.name(), e.what());
  } catch (const std::exception &e) {
    run.fail("UnexpectedError", e.what());
  }

  result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);

  std::string summary = spec.source_table + ": " +
                        tableStatusToString(result.status) + " | rows " +
                        StringUtils::formatNumber(result.rows_written) + "/" +
                        StringUtils::formatNumber(result.rows_read) + " | " +
                        std::to_string(result.durationSeconds()) + "s";
  if (result.status == TableStatus::FAILED) {
    Logger::error(LogCategory::TRANSFER, "MigrationOrchestrator",
                  summary + " | " + result.error->name + " in " +
                      tableStateToString(result.error->state) + ": " +
                      result.error->message);
  } else {
    Logger::info(LogCategory::TRANSFER, "MigrationOrchestrator", summary);
  }
  return result;
}

// Reader and writer run on two threads joined by a bounded queue of row
// chunks. When the writer falls behind the queue fills up and push() blocks
// the reader, so at most queue_capacity chunks plus one batch are in memory.
// The writer checks for a stop request after every batch; the batch in
// flight always completes. Whatever stops the writer, the queue is closed
// and the reader joined before this returns or rethrows.
bool MigrationOrchestrator::streamTable(const TableSpec &spec,
                                        const std::vector<ColumnDef> &columns,
                                        uint64_t expectedRows,
                                        const StopPredicate &stopRequested,
                                        TableResult &result) {
  const PerformanceConfig &performance = config_.performance;
  ThreadSafeQueue<ParallelProcessing::RowChunk> queue(
      performance.queue_capacity);

  std::vector<std::string> columnNames;
  columnNames.reserve(columns.size());
  for (const auto &column : columns) {
    columnNames.push_back(column.name);
  }

  StreamingReader reader(source_, performance);
  std::thread producer([&]() {
    ParallelProcessing::RowChunk failure;
    try {
      reader.open(spec.source_table, columnNames, performance.fetch_size);
      size_t chunkNumber = 0;
      while (true) {
        auto rows = reader.nextBatch();
        ParallelProcessing::RowChunk chunk;
        chunk.chunkNumber = ++chunkNumber;
        if (!rows) {
          chunk.isLastChunk = true;
          queue.push(std::move(chunk));
          break;
        }
        chunk.rows = std::move(*rows);
        if (!queue.push(std::move(chunk))) {
          break;
        }
      }
      reader.close();
      return;
    } catch (...) {
      failure.error = std::current_exception();
    }
    // The error travels to the writer thread, which rethrows it. The cursor
    // is closed when the reader goes out of scope after the join.
    queue.push(std::move(failure));
  });

  BatchWriter writer(destination_, spec.destination_table, columns, mapper_,
                     spec.batch_size, performance);
  ProgressTracker progress(spec.source_table, expectedRows, spec.batch_size,
                           config_.task.progress_bar_width,
                           config_.task.log_interval);

  auto stopped = [&]() { return stopRequested && stopRequested(); };
  auto flushBatch = [&]() {
    if (writer.flush() > 0) {
      result.rows_written = writer.rowsWritten();
      result.batches_written = writer.writeCalls();
      progress.onBatchWritten(writer.rowsWritten(), writer.writeCalls());
    }
  };

  bool cancelled = false;
  std::exception_ptr failure;
  try {
    ParallelProcessing::RowChunk chunk;
    while (!cancelled) {
      PopStatus popped = PopStatus::CLOSED;
      if (writer.hasFlushInterval()) {
        popped = queue.popFor(chunk, writer.timeUntilFlush());
      } else if (queue.popBlocking(chunk)) {
        popped = PopStatus::ITEM;
      }
      if (popped == PopStatus::CLOSED) {
        break;
      }
      if (popped == PopStatus::TIMEOUT) {
        // The source is stalled; rows past the flush interval go out now.
        if (writer.shouldFlush()) {
          flushBatch();
          cancelled = stopped();
        }
        continue;
      }

      if (chunk.error) {
        std::rethrow_exception(chunk.error);
      }
      if (chunk.isLastChunk) {
        flushBatch();
        progress.finish(writer.rowsWritten(), writer.writeCalls());
        break;
      }

      for (const auto &row : chunk.rows) {
        writer.append(row);
        result.rows_read++;
        if (writer.shouldFlush()) {
          flushBatch();
          if (stopped()) {
            cancelled = true;
            break;
          }
        }
      }

      if (!cancelled && writer.shouldFlush()) {
        flushBatch();
      }
      if (!cancelled && writer.bufferedRows() == 0 && stopped()) {
        cancelled = true;
      }
    }
  } catch (...) {
    failure = std::current_exception();
  }

  queue.close();
  producer.join();

  result.rows_written = writer.rowsWritten();
  result.batches_written = writer.writeCalls();

  if (failure) {
    std::rethrow_exception(failure);
  }
  if (cancelled) {
    Logger::warning(LogCategory::TRANSFER, "MigrationOrchestrator",
                    spec.source_table + ": stop requested, " +
                        StringUtils::formatNumber(writer.bufferedRows()) +
                        " buffered rows not written");
  }
  return !cancelled;
}
