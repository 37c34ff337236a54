#ifndef GEOHARVEST_CMD_COMMON_H_
#define GEOHARVEST_CMD_COMMON_H_

#include "harvest/HttpTransport.h"
#include "hub_uploader.hpp"
#include "geoparquet_writer.hpp"

#include <arrow/type_fwd.h>
#include <folly/io/async/EventBase.h>

#include <memory>
#include <string>

/** Network plumbing shared by the commands: one event base, the HTTP
  * transport running on it and, when uploads are enabled, the hub client. */
struct CmdNetwork {
  arrow::Status Init(bool upload);

  folly::EventBase evb;
  std::unique_ptr<HttpTransport> transport;
  std::unique_ptr<HubUploader> uploader;
};

TransportOptions TransportOptionsFromFlags();
HubTarget HubTargetFromFlags();
arrow::Result<GeoParquetOptions> ParquetOptionsFromFlags();

/** Random identifier attached to every file written by this process. */
const std::string& HarvestRunId();

#endif // GEOHARVEST_CMD_COMMON_H_
