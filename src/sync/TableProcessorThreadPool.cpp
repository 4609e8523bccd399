#include "sync/TableProcessorThreadPool.h"
#include "core/logger.h"
#include <algorithm>

TableProcessorThreadPool::TableProcessorThreadPool(size_t numWorkers)
    : numWorkers_(numWorkers) {
  if (numWorkers_ == 0) {
    numWorkers_ = std::max<size_t>(1, std::thread::hardware_concurrency());
    Logger::warning(LogCategory::TRANSFER, "TableProcessorThreadPool",
                    "numWorkers was 0, using hardware_concurrency: " +
                        std::to_string(numWorkers_));
  }
}

void TableProcessorThreadPool::run(
    const std::vector<TableSpec> &tables,
    const std::function<void(size_t)> &processor) {
  nextIndex_ = 0;
  size_t threads = std::min(numWorkers_, tables.size());
  Logger::info(LogCategory::TRANSFER, "TableProcessorThreadPool",
               "Processing " + std::to_string(tables.size()) +
                   " tables with " + std::to_string(threads) + " workers");

  std::vector<std::thread> workers;
  workers.reserve(threads);
  for (size_t i = 0; i < threads; ++i) {
    workers.emplace_back(&TableProcessorThreadPool::workerThread, this, i,
                         std::cref(tables), std::cref(processor));
  }
  for (auto &worker : workers) {
    worker.join();
  }

  Logger::info(LogCategory::TRANSFER, "TableProcessorThreadPool",
               "All tables processed - Completed: " +
                   std::to_string(completedTasks_.load()) +
                   " | Failed: " + std::to_string(failedTasks_.load()));
}

// A processor records its own table failures in the task result. An exception
// that still escapes is counted and logged here so one table cannot take the
// worker, and with it the tables queued behind it, down.
void TableProcessorThreadPool::workerThread(
    size_t workerId, const std::vector<TableSpec> &tables,
    const std::function<void(size_t)> &processor) {
  for (size_t index = nextIndex_++; index < tables.size();
       index = nextIndex_++) {
    activeWorkers_++;
    Logger::debug(LogCategory::TRANSFER, "TableProcessorThreadPool",
                  "Worker #" + std::to_string(workerId) +
                      " processing table: " + tables[index].source_table);
    try {
      processor(index);
      completedTasks_++;
    } catch (const std::exception &e) {
      failedTasks_++;
      Logger::error(LogCategory::TRANSFER, "TableProcessorThreadPool",
                    "Worker #" + std::to_string(workerId) +
                        " failed processing table: " +
                        tables[index].source_table + " - Error: " + e.what());
    }
    activeWorkers_--;
  }
}
