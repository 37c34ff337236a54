#ifndef GEOHARVEST_CMD_STOPS_H_
#define GEOHARVEST_CMD_STOPS_H_

#include "cmd.hpp"

#include <arrow/type_fwd.h>

#include <memory>
#include <string>

struct CmdStopsOptions {
  std::string feed_url;
  std::string output_dir;
  bool upload;
};

struct CmdStops
#ifdef GEOHARVEST_CMD_STOPS_INTERNAL_H_
    : private CmdStopsPriv
#endif
{
  using Options = CmdStopsOptions;
  static const CmdDescription description;

  static CmdPtr<CmdStops> Make(arrow::MemoryPool* memory_pool = nullptr);

  arrow::Status Init(const Options& options);
  arrow::Status Run();
  arrow::Status Finish(bool incomplete = false);
};

#endif // GEOHARVEST_CMD_STOPS_H_
