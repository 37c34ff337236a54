#ifndef GEOHARVEST_GEOPARQUET_WRITER_H_
#define GEOHARVEST_GEOPARQUET_WRITER_H_

#include <arrow/type_fwd.h>
#include <arrow/util/type_fwd.h>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace folly {
  struct dynamic;
}

struct GeoParquetOptions {
  std::string geometry_column = "geometry";
  arrow::Compression::type compression = arrow::Compression::SNAPPY;
  int64_t row_group_size = 64 * 1024;
  /* Appended to the file key-value metadata after "geo" */
  std::vector<std::pair<std::string, std::string>> extra_metadata;
};

/** PROJJSON description of WGS 84 (EPSG:4326). */
const folly::dynamic& Epsg4326ProjJson();

/** GeoParquet "geo" metadata document for a table whose geometry column
  * holds WKB points. */
arrow::Result<folly::dynamic> MakeGeoMetadata(const arrow::Table& table,
                                              const std::string& column);

/** Write `table` as a GeoParquet file. */
arrow::Status WriteGeoParquet(const arrow::Table& table,
                              const std::string& file_path,
                              const GeoParquetOptions& options,
                              arrow::MemoryPool* memory_pool = nullptr);

/** Parse a codec name ("snappy", "zstd", "uncompressed", ...). */
arrow::Result<arrow::Compression::type> ParseCompression(
    const std::string& name);

#endif // GEOHARVEST_GEOPARQUET_WRITER_H_
