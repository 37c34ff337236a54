#ifndef GEOHARVEST_CMD_STOPS_INTERNAL_H_
#define GEOHARVEST_CMD_STOPS_INTERNAL_H_

#include "cmd_common.hpp"
#include "stop_feed.hpp"

#include <arrow/api.h>

#include <string>

struct CmdStopsPriv {
  arrow::Result<std::string> Download();

  const struct CmdStopsOptions* options;
  arrow::MemoryPool* memory_pool;

  CmdNetwork net;
  GeoParquetOptions parquet;
  std::string output_path;
  int64_t num_stops = 0;
};

#endif // GEOHARVEST_CMD_STOPS_INTERNAL_H_
