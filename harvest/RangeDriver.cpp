#include "RangeDriver.h"

#include <folly/String.h>
#include <folly/io/async/EventBase.h>
#include <fmt/format.h>
#include <glog/logging.h>

#include <stdexcept>
#include <unordered_map>

RangeDriver::RangeDriver(FetchContext ctx, RecordSink* sink,
                         RangeOptions options)
  : ctx_(std::move(ctx))
  , sink_(sink)
  , options_(options)
{
  CHECK(sink_);
}

std::vector<std::string> RangeDriver::makeKeys(uint32_t start, uint32_t end) {
  if (start > end)
    throw std::invalid_argument(fmt::format(
        "range start {} is greater than end {}", start, end));
  if (end > kMaxKey)
    throw std::invalid_argument(fmt::format(
        "range end {} does not fit into {} digits", end, kKeyWidth));

  std::vector<std::string> keys;
  keys.reserve(end - start + 1);
  for (uint64_t key = start; key <= end; ++key)
    keys.push_back(fmt::format("{:0{}d}", key, kKeyWidth));
  return keys;
}

std::string RangeDriver::chunkName(uint32_t start, uint32_t end) {
  return fmt::format("addresses_{:06d}_{:06d}", start, end);
}

RunReport RangeDriver::run(uint32_t start, uint32_t end) {
  std::vector<std::string> keys = makeKeys(start, end);
  const std::string label = fmt::format("[{:06d}-{:06d}]", start, end);

  RunReport report;
  report.start = start;
  report.end = end;
  report.chunk_name = chunkName(start, end);

  LOG(INFO) << "Starting scrape: " << keys.front() << " to " << keys.back()
            << " (" << keys.size() << " keys)";

  std::vector<KeyOutcome> outcomes = fetch(label, std::move(keys));
  retryDegraded(label, outcomes);

  report.summary = summarizeOutcomes(outcomes);
  const OutcomeSummary& s = report.summary;
  LOG(INFO) << label << " done: " << s.records << " records from " << s.keys
            << " keys (" << s.complete << " complete, " << s.empty
            << " empty, " << s.partial << " partial, " << s.requests
            << " requests)";
  LOG_IF(WARNING, s.partial > 0)
    << label << " degraded keys: " << folly::join(", ", s.degraded_keys);

  folly::Optional<RecordSet> records = aggregateRecords(std::move(outcomes));
  if (!records) {
    LOG(WARNING) << label << " no data, nothing exported";
    return report;
  }

  sink_->publish(*records, report.chunk_name);
  report.exported = true;
  LOG(INFO) << label << " exported " << records->size() << " records as "
            << report.chunk_name;
  return report;
}

std::vector<KeyOutcome> RangeDriver::fetch(const std::string& label,
                                           std::vector<std::string> keys)
{
  ControllerOptions copts;
  copts.progress_every = options_.progress_every;
  copts.label = label;

  FetchController controller(ctx_, std::move(copts));
  return controller.run(std::move(keys)).getVia(ctx_.evb);
}

void RangeDriver::retryDegraded(const std::string& label,
                                std::vector<KeyOutcome>& outcomes)
{
  for (uint32_t pass = 1; pass <= options_.degraded_retry_passes; ++pass) {
    std::unordered_map<std::string, size_t> index;
    std::vector<std::string> degraded;
    for (size_t i = 0; i < outcomes.size(); ++i) {
      if (outcomes[i].status == FetchStatus::PARTIAL) {
        index.emplace(outcomes[i].key, i);
        degraded.push_back(outcomes[i].key);
      }
    }
    if (degraded.empty())
      return;

    LOG(INFO) << label << " retry pass " << pass << ": "
              << degraded.size() << " degraded keys";
    auto retried = fetch(fmt::format("{} retry {}", label, pass),
                         std::move(degraded));

    for (KeyOutcome& fresh : retried) {
      KeyOutcome& prev = outcomes[index.at(fresh.key)];
      /* Never trade records for another partial answer */
      if (fresh.status == FetchStatus::PARTIAL &&
          fresh.records.size() < prev.records.size())
        continue;
      fresh.requests += prev.requests;
      prev = std::move(fresh);
    }
  }
}
