#include "sync/ProgressTracker.h"
#include "core/logger.h"
#include "utils/string_utils.h"
#include "utils/time_utils.h"
#include <algorithm>
#include <cstdio>

ProgressTracker::ProgressTracker(std::string table, uint64_t totalRows,
                                 size_t batchSize, int barWidth,
                                 int logIntervalSeconds)
    : table_(std::move(table)), totalRows_(totalRows),
      totalBatches_(batchSize == 0
                        ? 0
                        : static_cast<size_t>((totalRows + batchSize - 1) /
                                              batchSize)),
      barWidth_(barWidth), logInterval_(logIntervalSeconds),
      start_(std::chrono::steady_clock::now()), lastLog_(start_) {}

std::string ProgressTracker::renderBar(double percent, int width) {
  if (width <= 0)
    return "";
  percent = std::max(0.0, std::min(100.0, percent));
  int filled = static_cast<int>(width * percent / 100.0);
  if (filled >= width)
    return std::string(static_cast<size_t>(width), '=');
  return std::string(static_cast<size_t>(filled), '=') + ">" +
         std::string(static_cast<size_t>(width - filled - 1), '.');
}

std::string ProgressTracker::formatLine(double percent, int width,
                                        uint64_t rows, uint64_t totalRows,
                                        size_t batch, size_t totalBatches,
                                        uint64_t speed,
                                        const std::string &tailLabel,
                                        const std::string &tailValue) {
  char percentText[16];
  std::snprintf(percentText, sizeof(percentText), "%.2f%%", percent);
  return "[PROGRESS] [" + renderBar(percent, width) + "] " + percentText +
         " | " + StringUtils::formatNumber(rows) + "/" +
         StringUtils::formatNumber(totalRows) + " rows | Batch " +
         StringUtils::formatNumber(batch) + "/" +
         StringUtils::formatNumber(totalBatches) +
         " | Speed: " + StringUtils::formatNumber(speed) + " rows/s | " +
         tailLabel + ": " + tailValue;
}

// Logs on the first batch, on every tenth batch and whenever logInterval has
// passed since the previous line. Speed is measured over the rows written
// since that previous line; ETA uses the average speed so far.
void ProgressTracker::onBatchWritten(uint64_t rowsWritten, size_t batchNumber) {
  auto now = std::chrono::steady_clock::now();
  bool shouldLog = batchNumber == 1 || batchNumber % 10 == 0 ||
                   now - lastLog_ >= logInterval_;
  if (!shouldLog)
    return;

  double elapsed = std::chrono::duration<double>(now - start_).count();
  double sinceLast = std::chrono::duration<double>(now - lastLog_).count();
  double avgSpeed = elapsed > 0 ? rowsWritten / elapsed : 0.0;
  double recentSpeed = sinceLast > 0
                           ? (rowsWritten - lastLoggedRows_) / sinceLast
                           : avgSpeed;

  uint64_t total = std::max(totalRows_, rowsWritten);
  double percent = total > 0 ? 100.0 * rowsWritten / total : 100.0;
  double eta = avgSpeed > 0 ? (total - rowsWritten) / avgSpeed : 0.0;
  size_t totalBatches = std::max(totalBatches_, batchNumber);

  Logger::info(LogCategory::TRANSFER, table_,
               formatLine(percent, barWidth_, rowsWritten, total, batchNumber,
                          totalBatches, static_cast<uint64_t>(recentSpeed),
                          "ETA", TimeUtils::formatDuration(eta)));

  lastLog_ = now;
  lastLoggedRows_ = rowsWritten;
}

void ProgressTracker::finish(uint64_t rowsWritten, size_t batchesWritten) {
  double elapsed = TimeUtils::secondsSince(start_);
  double avgSpeed = elapsed > 0 ? rowsWritten / elapsed : 0.0;
  Logger::info(LogCategory::TRANSFER, table_,
               formatLine(100.0, barWidth_, rowsWritten,
                          std::max(totalRows_, rowsWritten), batchesWritten,
                          std::max(totalBatches_, batchesWritten),
                          static_cast<uint64_t>(avgSpeed), "Time",
                          TimeUtils::formatDuration(elapsed)));
}
