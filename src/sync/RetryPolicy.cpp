#include "sync/RetryPolicy.h"

int RetryPolicy::backoffFor(int attempt) const {
  int shift = std::min(std::max(attempt - 1, 0), 16);
  long long backoff = static_cast<long long>(initial_backoff_ms) << shift;
  return static_cast<int>(std::min<long long>(backoff, max_backoff_ms));
}
