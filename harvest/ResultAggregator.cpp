#include "ResultAggregator.h"

#include <algorithm>
#include <iterator>

OutcomeSummary summarizeOutcomes(const std::vector<KeyOutcome>& outcomes) {
  OutcomeSummary summary;
  summary.keys = outcomes.size();

  for (const KeyOutcome& o : outcomes) {
    summary.records += o.records.size();
    summary.requests += o.requests;
    switch (o.status) {
      case FetchStatus::COMPLETE:
        summary.complete += 1;
        break;
      case FetchStatus::EMPTY:
        summary.empty += 1;
        break;
      case FetchStatus::PARTIAL:
        summary.partial += 1;
        summary.degraded_keys.push_back(o.key);
        break;
    }
  }
  return summary;
}

folly::Optional<RecordSet> aggregateRecords(std::vector<KeyOutcome> outcomes) {
  size_t total = 0;
  for (const KeyOutcome& o : outcomes)
    total += o.records.size();
  if (total == 0)
    return folly::none;

  RecordSet all;
  all.reserve(total);
  for (KeyOutcome& o : outcomes) {
    std::move(o.records.begin(), o.records.end(), std::back_inserter(all));
  }
  return all;
}
