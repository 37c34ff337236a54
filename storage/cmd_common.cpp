#include "cmd_common.hpp"

#include <arrow/status.h>
#include <arrow/result.h>
#include <folly/portability/GFlags.h>
#include <glog/logging.h>
#include <uuid.h>

#include <cstdlib>

DEFINE_uint32(concurrency, 10,
              "Maximum number of keys fetched at once, also caps connections");
DEFINE_uint32(connect_timeout_ms, 5000, "TCP and TLS connect timeout");
DEFINE_uint32(request_timeout_ms, 20000, "Total deadline of one HTTP attempt");
DEFINE_string(ca_bundle, "", "Trusted CA file, system defaults when empty");
DEFINE_string(user_agent, "geoharvest/1.0", "User-Agent of outbound requests");
DEFINE_string(hub_endpoint, "https://huggingface.co", "Dataset hub endpoint");
DEFINE_string(hub_repo, "gisfun/spatial-datasets", "Hub repository id");
DEFINE_string(hub_repo_type, "dataset", "Hub repository type");
DEFINE_string(hub_revision, "main", "Branch receiving the commits");
DEFINE_string(parquet_compression, "snappy", "Parquet compression codec");

using Status = arrow::Status;
template <class T> using Result = arrow::Result<T>;

TransportOptions TransportOptionsFromFlags() {
  TransportOptions options;
  options.max_connections = FLAGS_concurrency;
  options.connect_timeout = std::chrono::milliseconds(FLAGS_connect_timeout_ms);
  options.request_timeout = std::chrono::milliseconds(FLAGS_request_timeout_ms);
  options.ca_bundle = FLAGS_ca_bundle;
  options.user_agent = FLAGS_user_agent;
  return options;
}

HubTarget HubTargetFromFlags() {
  HubTarget target;
  target.endpoint = FLAGS_hub_endpoint;
  target.repo_id = FLAGS_hub_repo;
  target.repo_type = FLAGS_hub_repo_type;
  target.revision = FLAGS_hub_revision;
  if (const char* token = std::getenv("HF_TOKEN"))
    target.token = token;
  return target;
}

Result<GeoParquetOptions> ParquetOptionsFromFlags() {
  GeoParquetOptions options;
  ARROW_ASSIGN_OR_RAISE(options.compression,
                        ParseCompression(FLAGS_parquet_compression));
  options.extra_metadata.emplace_back("harvest_run_id", HarvestRunId());
  return options;
}

const std::string& HarvestRunId() {
  static const std::string run_id = [] {
    uuid_t id;
    uuid_generate_random(id);
    std::string text(37, '\0');
    uuid_unparse(id, text.data());
    text.resize(36);
    return text;
  }();
  return run_id;
}

Status CmdNetwork::Init(bool upload) {
  if (FLAGS_concurrency == 0)
    return Status::Invalid("--concurrency must be positive");

  transport = makeProxygenTransport(&evb, TransportOptionsFromFlags());
  if (!upload)
    return Status::OK();

  HubTarget target = HubTargetFromFlags();
  if (target.token.empty())
    return Status::Invalid("HF_TOKEN is not set, use --no-upload to skip "
                           "the upload");
  LOG(INFO) << "uploading to " << target.repo_type << ' ' << target.repo_id
            << '@' << target.revision;
  uploader = std::make_unique<HubUploader>(transport.get(), &evb,
                                           std::move(target));
  return Status::OK();
}
