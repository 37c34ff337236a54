#ifndef GEOHARVEST_STOP_FEED_H_
#define GEOHARVEST_STOP_FEED_H_

#include <arrow/type_fwd.h>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

struct StopRow {
  std::string name;
  bool wab = false;  // wheelchair accessible
  std::string details;
  double lat = 0;
  double lon = 0;
};

/** Parse the bus stop registry. Every `busstop` child of the document root
  * becomes a row; an unreadable coordinate fails the whole feed. */
arrow::Result<std::vector<StopRow>> ParseStopFeed(std::string_view xml);

/** name, wab, details and a WKB point geometry per stop. */
arrow::Result<std::shared_ptr<arrow::Table>> MakeStopTable(
    const std::vector<StopRow>& stops,
    arrow::MemoryPool* memory_pool = nullptr);

#endif // GEOHARVEST_STOP_FEED_H_
