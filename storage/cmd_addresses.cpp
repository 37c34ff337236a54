#include "cmd_addresses_internal.hpp"
#include "cmd_addresses.hpp"

#include <arrow/api.h>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>
#include <folly/Conv.h>
#include <folly/portability/GFlags.h>
#include <glog/logging.h>

#include <cstdlib>
#include <exception>

DEFINE_double(requests_per_second, 6.67,
              "Request rate shared by all fetchers, <= 0 disables throttling");
DEFINE_double(request_burst, 1, "Requests allowed back to back");
DEFINE_uint32(retry_attempts, 4, "Attempts per result page");
DEFINE_uint32(backoff_unit_ms, 1000, "Exponential backoff unit");
DEFINE_uint32(backoff_floor_ms, 2000, "Constant added to every backoff");
DEFINE_uint32(progress_every, 50, "Log progress every N completed keys");
DEFINE_string(onemap_url, "https://www.onemap.gov.sg/api/common/elastic/search",
              "Postal code search endpoint");
DEFINE_bool(onemap_auth, false, "Send ONEMAP_TOKEN as Authorization header");

DECLARE_uint32(concurrency);
DECLARE_uint32(request_timeout_ms);

namespace po = boost::program_options;
using Status = arrow::Status;

CmdPtr<CmdAddresses> CmdAddresses::Make() {
  return CmdPtr<CmdAddresses>(new CmdAddresses());
}

template <>
void CmdDeleter<CmdAddresses>::operator()(CmdAddresses* cmd) const {
  delete cmd;
}

Status CmdAddresses::Init(const Options& options_) {
  options = &options_;
  ARROW_RETURN_NOT_OK(net.Init(options->upload));

  PostalApiOptions api_options;
  api_options.base_url = FLAGS_onemap_url;
  api_options.token = options->api_token;
  api = std::make_unique<PostalApi>(std::move(api_options));

  permits = std::make_unique<PermitPool>(FLAGS_concurrency);
  throttle = std::make_unique<RequestThrottle>(FLAGS_requests_per_second,
                                               FLAGS_request_burst);

  retry.max_attempts = FLAGS_retry_attempts;
  retry.backoff_unit = std::chrono::milliseconds(FLAGS_backoff_unit_ms);
  retry.backoff_floor = std::chrono::milliseconds(FLAGS_backoff_floor_ms);
  retry.attempt_timeout = std::chrono::milliseconds(FLAGS_request_timeout_ms);

  PublishOptions publish;
  publish.output_dir = options->output_dir;
  ARROW_ASSIGN_OR_RAISE(publish.parquet, ParquetOptionsFromFlags());
  publisher = std::make_unique<DatasetPublisher>(std::move(publish),
                                                 net.uploader.get());

  LOG(INFO) << "concurrency " << FLAGS_concurrency << ", "
            << (throttle->enabled()
                ? folly::to<std::string>(throttle->rate(), " req/s")
                : std::string("no rate limit"))
            << ", run id " << HarvestRunId();
  return Status::OK();
}

Status CmdAddresses::Run() {
  FetchContext ctx;
  ctx.evb = &net.evb;
  ctx.transport = net.transport.get();
  ctx.permits = permits.get();
  ctx.throttle = throttle->enabled() ? throttle.get() : nullptr;
  ctx.api = api.get();
  ctx.retry = retry;

  RangeOptions range;
  range.progress_every = FLAGS_progress_every;
  range.degraded_retry_passes = options->degraded_retry_passes;

  RangeDriver driver(ctx, publisher.get(), range);
  try {
    report = driver.run(options->start, options->end);
  } catch (const std::exception& e) {
    return Status::IOError("export of ",
                           RangeDriver::chunkName(options->start, options->end),
                           " failed: ", e.what());
  }

  if (!report.exported)
    return Status::Cancelled("range produced no data");
  return Status::OK();
}

Status CmdAddresses::Finish(bool incomplete) {
  const OutcomeSummary& s = report.summary;
  LOG(INFO) << "Finished " << report.chunk_name << ": " << s.keys << " keys, "
            << s.records << " records, " << s.partial << " degraded"
            << (incomplete ? " (not exported)" : "");
  if (report.exported)
    LOG(INFO) << "wrote " << publisher->lastPath();
  return Status::OK();
}

////////////////////////////////////////////////////////////////////////////////

const CmdDescription CmdAddresses::description = {
  .name = "addresses",
  .args = "START END",
  .abstract = "Fetch every address of the postal code range [START, END]",
  .help = "Keys are zero padded to six digits. The records are written as "
          "one GeoParquet chunk and uploaded to the dataset hub.",
};

template <>
void CmdOps<CmdAddresses>::BindOptions(po::options_description& description,
                                       CmdAddressesOptions& options)
{
  description.add_options()
      ("output-dir,o",
       po::value(&options.output_dir)->default_value("."),
       "Directory receiving the parquet chunk")
      ("no-upload",
       po::bool_switch()->default_value(false),
       "Keep the chunk locally")
      ("retry-partial",
       po::value(&options.degraded_retry_passes)->default_value(0),
       "Extra passes over keys that ended with a partial result");
}

template <>
Status CmdOps<CmdAddresses>::StoreArgs(const po::variables_map& vm,
                                       const std::vector<std::string>& args,
                                       CmdAddressesOptions& options)
{
  if (args.size() != 2u)
    return Status::Invalid("START and END expected");

  auto start = folly::tryTo<uint32_t>(args[0]);
  auto end = folly::tryTo<uint32_t>(args[1]);
  if (!start || !end)
    return Status::Invalid("START and END must be non-negative integers");
  if (*start > *end)
    return Status::Invalid("START ", *start, " is greater than END ", *end);
  if (*end > RangeDriver::kMaxKey)
    return Status::Invalid("END ", *end, " is above ", RangeDriver::kMaxKey);

  options.start = *start;
  options.end = *end;
  options.upload = !vm["no-upload"].as<bool>();

  options.api_token.clear();
  if (FLAGS_onemap_auth) {
    const char* token = std::getenv("ONEMAP_TOKEN");
    if (!token || !*token)
      return Status::Invalid("--onemap_auth requires ONEMAP_TOKEN");
    options.api_token = token;
  }
  return Status::OK();
}
