#ifndef GEOHARVEST_CMD_ADDRESSES_H_
#define GEOHARVEST_CMD_ADDRESSES_H_

#include "cmd.hpp"

#include <arrow/type_fwd.h>

#include <cstdint>
#include <memory>
#include <string>

struct CmdAddressesOptions {
  uint32_t start;
  uint32_t end;
  std::string output_dir;
  bool upload;
  uint32_t degraded_retry_passes;
  /* ONEMAP_TOKEN, sent only with --onemap_auth */
  std::string api_token;
};

struct CmdAddresses
#ifdef GEOHARVEST_CMD_ADDRESSES_INTERNAL_H_
    : private CmdAddressesPriv
#endif
{
  using Options = CmdAddressesOptions;
  static const CmdDescription description;

  static CmdPtr<CmdAddresses> Make();

  arrow::Status Init(const Options& options);
  /* Cancelled when the range produced no data */
  arrow::Status Run();
  arrow::Status Finish(bool incomplete = false);
};

#endif // GEOHARVEST_CMD_ADDRESSES_H_
