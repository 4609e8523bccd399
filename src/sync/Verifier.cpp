#include "sync/Verifier.h"
#include "core/logger.h"
#include "utils/string_utils.h"

Verifier::Verifier(ISourceEngine &source, IWarehouseEngine &destination,
                   RetryPolicy readRetry, RetryPolicy writeRetry)
    : source_(source), destination_(destination), readRetry_(readRetry),
      writeRetry_(writeRetry) {}

VerificationResult Verifier::verify(const std::string &sourceTable,
                                    const std::string &destinationTable) {
  VerificationResult result;
  result.source_count =
      retryTransient(readRetry_, "Counting source rows of " + sourceTable,
                     [&]() { return source_.countRows(sourceTable); });
  result.destination_count = retryTransient(
      writeRetry_, "Counting destination rows of " + destinationTable,
      [&]() { return destination_.countRows(destinationTable); });
  result.match = result.source_count == result.destination_count;

  if (result.match) {
    Logger::info(LogCategory::VALIDATION, "Verifier",
                 "Row count verified for " + sourceTable + " -> " +
                     destinationTable + ": " +
                     StringUtils::formatNumber(result.source_count));
  } else {
    Logger::warning(LogCategory::VALIDATION, "Verifier",
                    "Row count mismatch for " + sourceTable + " -> " +
                        destinationTable + ": source " +
                        StringUtils::formatNumber(result.source_count) +
                        ", destination " +
                        StringUtils::formatNumber(result.destination_count));
  }
  return result;
}
