#ifndef RETRYPOLICY_H
#define RETRYPOLICY_H

#include "core/logger.h"
#include "core/migration_config.h"
#include "sync/MigrationErrors.h"
#include <algorithm>
#include <chrono>
#include <string>
#include <thread>

struct RetryPolicy {
  int max_attempts = MigrationDefaults::DEFAULT_RETRIES;
  int initial_backoff_ms = MigrationDefaults::DEFAULT_RETRY_BACKOFF_MS;
  int max_backoff_ms = MigrationDefaults::MAX_RETRY_BACKOFF_MS;

  static RetryPolicy forWrites(const PerformanceConfig &performance) {
    return RetryPolicy{performance.write_retries, performance.retry_backoff_ms,
                       MigrationDefaults::MAX_RETRY_BACKOFF_MS};
  }

  static RetryPolicy forReads(const PerformanceConfig &performance) {
    return RetryPolicy{performance.read_retries, performance.retry_backoff_ms,
                       MigrationDefaults::MAX_RETRY_BACKOFF_MS};
  }

  // Delay before retry number attempt (1-based), doubled per attempt and
  // capped at max_backoff_ms.
  int backoffFor(int attempt) const;
};

// Runs operation, retrying it while it throws a transient MigrationError.
// The last transient error is rethrown once max_attempts calls have failed;
// any other error is rethrown at once.
template <typename Operation>
auto retryTransient(const RetryPolicy &policy, const std::string &description,
                    Operation &&operation) -> decltype(operation()) {
  const int maxAttempts = std::max(1, policy.max_attempts);
  for (int attempt = 1;; ++attempt) {
    try {
      return operation();
    } catch (const MigrationError &e) {
      if (!e.isTransient() || attempt >= maxAttempts) {
        throw;
      }
      int backoffMs = policy.backoffFor(attempt);
      Logger::warning(LogCategory::DATABASE, "retryTransient",
                      description + " failed (attempt " +
                          std::to_string(attempt) + "/" +
                          std::to_string(maxAttempts) + "), retrying in " +
                          std::to_string(backoffMs) + "ms: " + e.what());
      std::this_thread::sleep_for(std::chrono::milliseconds(backoffMs));
    }
  }
}

#endif
