#ifndef TABLEPROCESSORTHREADPOOL_H
#define TABLEPROCESSORTHREADPOOL_H

#include "sync/MigrationTypes.h"
#include <atomic>
#include <functional>
#include <thread>
#include <vector>

// Runs the tables of one task on a fixed number of worker threads. Workers
// claim table indices from a shared counter, so tables start in task order
// even though they finish in any order.
class TableProcessorThreadPool {
private:
  size_t numWorkers_;
  std::atomic<size_t> nextIndex_{0};
  std::atomic<size_t> activeWorkers_{0};
  std::atomic<size_t> completedTasks_{0};
  std::atomic<size_t> failedTasks_{0};

  void workerThread(size_t workerId, const std::vector<TableSpec> &tables,
                    const std::function<void(size_t)> &processor);

public:
  explicit TableProcessorThreadPool(size_t numWorkers);

  TableProcessorThreadPool(const TableProcessorThreadPool &) = delete;
  TableProcessorThreadPool &
  operator=(const TableProcessorThreadPool &) = delete;

  // Calls processor(i) once for every index of tables and returns when all
  // of them are done. Never starts more threads than there are tables.
  void run(const std::vector<TableSpec> &tables,
           const std::function<void(size_t)> &processor);

  size_t activeWorkers() const { return activeWorkers_.load(); }
  size_t completedTasks() const { return completedTasks_.load(); }
  size_t failedTasks() const { return failedTasks_.load(); }
  size_t totalWorkers() const { return numWorkers_; }
};

#endif
