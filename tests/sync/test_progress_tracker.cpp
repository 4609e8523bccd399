#include "../support/TestRunner.h"
#include "sync/ProgressTracker.h"
#include "utils/string_utils.h"
#include "utils/time_utils.h"

int main() {
  TestRunner runner;

  runner.runTest("progress bar rendering", [&]() {
    runner.assertEquals(std::string(">........."),
                        ProgressTracker::renderBar(0.0, 10), "empty");
    runner.assertEquals(std::string("====>....."),
                        ProgressTracker::renderBar(40.0, 10), "40%");
    runner.assertEquals(std::string("=========="),
                        ProgressTracker::renderBar(100.0, 10), "full");
    runner.assertEquals(std::string("=========="),
                        ProgressTracker::renderBar(250.0, 10), "clamped");
  });

  runner.runTest("progress line format", [&]() {
    std::string line = ProgressTracker::formatLine(40.0, 10, 10000, 25000, 1,
                                                   3, 5000, "ETA", "3s");
    runner.assertEquals(
        std::string("[PROGRESS] [====>.....] 40.00% | 10,000/25,000 rows | "
                    "Batch 1/3 | Speed: 5,000 rows/s | ETA: 3s"),
        line, "line");
  });

  runner.runTest("number and duration formatting", [&]() {
    runner.assertEquals(std::string("0"), StringUtils::formatNumber(0), "0");
    runner.assertEquals(std::string("999"), StringUtils::formatNumber(999),
                        "999");
    runner.assertEquals(std::string("1,234,567"),
                        StringUtils::formatNumber(1234567), "millions");
    runner.assertEquals(std::string("1,000"), StringUtils::formatNumber(1000),
                        "four digits");
    runner.assertEquals(std::string("10,000"),
                        StringUtils::formatNumber(10000), "five digits");
    runner.assertEquals(std::string("250,000"),
                        StringUtils::formatNumber(250000), "six digits");
    runner.assertEquals(std::string("12,345,678"),
                        StringUtils::formatNumber(12345678), "eight digits");
    runner.assertEquals(std::string("18,446,744,073,709,551,615"),
                        StringUtils::formatNumber(UINT64_MAX), "uint64 max");
    runner.assertEquals(std::string("42s"), TimeUtils::formatDuration(42.7),
                        "seconds");
    runner.assertEquals(std::string("3m 5s"), TimeUtils::formatDuration(185),
                        "minutes");
    runner.assertEquals(std::string("2h 0m 7s"),
                        TimeUtils::formatDuration(7207), "hours");
  });

  runner.runTest("tracker accepts a table larger than its pre-count", [&]() {
    ProgressTracker tracker("users", 10, 5, 20, 60);
    tracker.onBatchWritten(5, 1);
    tracker.onBatchWritten(10, 2);
    tracker.onBatchWritten(15, 3);
    tracker.finish(15, 3);
    runner.assertTrue(true, "no division or underflow trouble");
  });

  runner.printSummary();
  return 0;
}
