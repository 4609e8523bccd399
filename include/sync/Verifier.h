#ifndef VERIFIER_H
#define VERIFIER_H

#include "engines/source_engine.h"
#include "engines/warehouse_engine.h"
#include "sync/RetryPolicy.h"
#include <cstdint>
#include <string>

struct VerificationResult {
  uint64_t source_count = 0;
  uint64_t destination_count = 0;
  bool match = false;
};

// Row-count comparison between a source and a destination table. A mismatch
// is reported to the caller, never corrected. Each count is retried on
// transient errors under its own side's policy.
class Verifier {
  ISourceEngine &source_;
  IWarehouseEngine &destination_;
  RetryPolicy readRetry_;
  RetryPolicy writeRetry_;

public:
  Verifier(ISourceEngine &source, IWarehouseEngine &destination,
           RetryPolicy readRetry = RetryPolicy(),
           RetryPolicy writeRetry = RetryPolicy());

  VerificationResult verify(const std::string &sourceTable,
                            const std::string &destinationTable);
};

#endif
