#ifndef GEOHARVEST_RANGE_DRIVER_H
#define GEOHARVEST_RANGE_DRIVER_H

#include "FetchController.h"
#include "RecordSink.h"
#include "ResultAggregator.h"

#include <cstdint>
#include <string>
#include <vector>

struct RangeOptions {
  size_t progress_every = 50;
  /** Extra runs over keys that ended with a partial result. */
  uint32_t degraded_retry_passes = 0;
};

struct RunReport {
  uint32_t start = 0;
  uint32_t end = 0;
  std::string chunk_name;
  OutcomeSummary summary;
  bool exported = false;
};

/**
 * Owns one range run: key generation, fetching, aggregation and the single
 * hand-off to the record sink. Must be called on the thread that drives the
 * event base of the fetch context.
 */
class RangeDriver {
 public:
  static constexpr uint32_t kMaxKey = 999999;
  static constexpr int kKeyWidth = 6;

  RangeDriver(FetchContext ctx, RecordSink* sink, RangeOptions options);

  /** Zero padded keys of [start, end].
    * Throws `invalid_argument` for an empty or out of range interval. */
  static std::vector<std::string> makeKeys(uint32_t start, uint32_t end);
  static std::string chunkName(uint32_t start, uint32_t end);

  /** Fetch the range and export it when it produced any record.
    * Sink failures propagate to the caller. */
  RunReport run(uint32_t start, uint32_t end);

 private:
  std::vector<KeyOutcome> fetch(const std::string& label,
                                std::vector<std::string> keys);
  void retryDegraded(const std::string& label,
                     std::vector<KeyOutcome>& outcomes);

  FetchContext ctx_;
  RecordSink* sink_;
  RangeOptions options_;
};

#endif // GEOHARVEST_RANGE_DRIVER_H
