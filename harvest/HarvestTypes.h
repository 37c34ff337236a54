#ifndef GEOHARVEST_HARVEST_TYPES_H
#define GEOHARVEST_HARVEST_TYPES_H

#include <folly/dynamic.h>

#include <cstdint>
#include <string>
#include <vector>

/** Raw address hit as returned by the postal API. Opaque to the fetch layer. */
using RawRecord = folly::dynamic;
using RecordSet = std::vector<RawRecord>;

enum class FetchStatus {
  COMPLETE,  // all pages retrieved, at least one record
  EMPTY,     // all pages retrieved, nothing found
  PARTIAL,   // stopped early, see KeyOutcome::reason
};

const char* fetchStatusName(FetchStatus status) noexcept;

/** Terminal result of fetching one key. */
struct KeyOutcome {
  std::string key;
  FetchStatus status = FetchStatus::EMPTY;
  std::string reason;
  RecordSet records;
  uint32_t pages = 0;
  uint32_t requests = 0;
};

#endif // GEOHARVEST_HARVEST_TYPES_H
