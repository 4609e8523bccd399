#ifndef PROGRESSTRACKER_H
#define PROGRESSTRACKER_H

#include <chrono>
#include <cstdint>
#include <string>

// Logs [PROGRESS] lines for one table while batches are written.
class ProgressTracker {
  std::string table_;
  uint64_t totalRows_;
  size_t totalBatches_;
  int barWidth_;
  std::chrono::seconds logInterval_;

  std::chrono::steady_clock::time_point start_;
  std::chrono::steady_clock::time_point lastLog_;
  uint64_t lastLoggedRows_ = 0;

public:
  ProgressTracker(std::string table, uint64_t totalRows, size_t batchSize,
                  int barWidth, int logIntervalSeconds);

  // Called after every written batch.
  void onBatchWritten(uint64_t rowsWritten, size_t batchNumber);

  // Final 100% line with the average speed and the elapsed time.
  void finish(uint64_t rowsWritten, size_t batchesWritten);

  // "[=====>....]" for a progress between 0 and 100.
  static std::string renderBar(double percent, int width);
  static std::string formatLine(double percent, int width, uint64_t rows,
                                uint64_t totalRows, size_t batch,
                                size_t totalBatches, uint64_t speed,
                                const std::string &tailLabel,
                                const std::string &tailValue);
};

#endif
