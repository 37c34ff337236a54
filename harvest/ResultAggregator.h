#ifndef GEOHARVEST_RESULT_AGGREGATOR_H
#define GEOHARVEST_RESULT_AGGREGATOR_H

#include "HarvestTypes.h"

#include <folly/Optional.h>

#include <cstddef>
#include <string>
#include <vector>

struct OutcomeSummary {
  size_t keys = 0;
  size_t complete = 0;
  size_t empty = 0;
  size_t partial = 0;
  size_t records = 0;
  size_t requests = 0;
  /** Keys that ended early, in completion order. */
  std::vector<std::string> degraded_keys;
};

OutcomeSummary summarizeOutcomes(const std::vector<KeyOutcome>& outcomes);

/** Concatenate the records of every outcome, keeping the order inside each
  * key. Returns none when no key produced a record. */
folly::Optional<RecordSet> aggregateRecords(std::vector<KeyOutcome> outcomes);

#endif // GEOHARVEST_RESULT_AGGREGATOR_H
