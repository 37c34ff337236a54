#include "cmd_stops_internal.hpp"
#include "cmd_stops.hpp"
#include "dataset_publisher.hpp"

#include <arrow/api.h>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>
#include <folly/io/async/EventBase.h>
#include <glog/logging.h>

namespace po = boost::program_options;
using Status = arrow::Status;
template <class T> using Result = arrow::Result<T>;

static constexpr const char* kStopsFileName = "bus_stops.parquet";

CmdPtr<CmdStops> CmdStops::Make(arrow::MemoryPool* memory_pool) {
  CmdPtr<CmdStops> cmd(new CmdStops());
  cmd->memory_pool = memory_pool ?: arrow::default_memory_pool();
  return cmd;
}

template <>
void CmdDeleter<CmdStops>::operator()(CmdStops* cmd) const {
  delete cmd;
}

Status CmdStops::Init(const Options& options_) {
  options = &options_;
  ARROW_RETURN_NOT_OK(net.Init(options->upload));
  ARROW_ASSIGN_OR_RAISE(parquet, ParquetOptionsFromFlags());
  output_path = JoinPath(options->output_dir, kStopsFileName);
  return Status::OK();
}

Result<std::string> CmdStopsPriv::Download() {
  HttpRequest req;
  req.url = options->feed_url;
  req.headers.emplace_back("Accept", "application/xml");

  LOG(INFO) << "fetching " << req.url;
  folly::Try<HttpResponse> result =
    net.transport->send(std::move(req)).via(&net.evb).getTryVia(&net.evb);
  if (result.hasException())
    return Status::IOError(options->feed_url, ": ",
                           result.exception().what().toStdString());
  if (result->status != 200)
    return Status::IOError(options->feed_url, ": HTTP ", result->status);

  LOG(INFO) << "stop feed: " << result->body.size() << " bytes";
  return std::move(result->body);
}

Status CmdStops::Run() {
  ARROW_ASSIGN_OR_RAISE(std::string xml, Download());
  ARROW_ASSIGN_OR_RAISE(auto stops, ParseStopFeed(xml));
  ARROW_ASSIGN_OR_RAISE(auto table, MakeStopTable(stops, memory_pool));
  num_stops = table->num_rows();

  ARROW_RETURN_NOT_OK(WriteGeoParquet(*table, output_path, parquet,
                                      memory_pool));
  if (!net.uploader)
    return Status::OK();
  return net.uploader->Upload(output_path, kStopsFileName,
                              "Upload bus stop registry");
}

Status CmdStops::Finish(bool incomplete) {
  if (incomplete) {
    LOG(WARNING) << "stop registry not published";
    return Status::OK();
  }
  LOG(INFO) << num_stops << " stops written to " << output_path;
  return Status::OK();
}

////////////////////////////////////////////////////////////////////////////////

const CmdDescription CmdStops::description = {
  .name = "stops",
  .args = "",
  .abstract = "Export the bus stop registry as GeoParquet",
  .help = "",
};

template <>
void CmdOps<CmdStops>::BindOptions(po::options_description& description,
                                   CmdStopsOptions& options)
{
  description.add_options()
      ("url",
       po::value(&options.feed_url)->default_value(
           "https://www.lta.gov.sg/map/busService/bus_stops.xml"),
       "Stop registry feed")
      ("output-dir,o",
       po::value(&options.output_dir)->default_value("."),
       "Directory receiving bus_stops.parquet")
      ("no-upload",
       po::bool_switch()->default_value(false),
       "Keep the file locally");
}

template <>
Status CmdOps<CmdStops>::StoreArgs(const po::variables_map& vm,
                                   const std::vector<std::string>& args,
                                   CmdStopsOptions& options)
{
  if (!args.empty())
    return Status::Invalid("no positional arguments expected");
  options.upload = !vm["no-upload"].as<bool>();
  return Status::OK();
}
