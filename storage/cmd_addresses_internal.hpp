#ifndef GEOHARVEST_CMD_ADDRESSES_INTERNAL_H_
#define GEOHARVEST_CMD_ADDRESSES_INTERNAL_H_

#include "cmd_common.hpp"
#include "dataset_publisher.hpp"
#include "harvest/PermitPool.h"
#include "harvest/PostalApi.h"
#include "harvest/RangeDriver.h"
#include "harvest/RequestThrottle.h"

#include <memory>

struct CmdAddressesPriv {
  const struct CmdAddressesOptions* options;

  CmdNetwork net;
  std::unique_ptr<PostalApi> api;
  std::unique_ptr<PermitPool> permits;
  std::unique_ptr<RequestThrottle> throttle;
  std::unique_ptr<DatasetPublisher> publisher;
  RetryPolicy retry;
  RunReport report;
};

#endif // GEOHARVEST_CMD_ADDRESSES_INTERNAL_H_
