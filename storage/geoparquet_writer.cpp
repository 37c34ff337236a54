#include "geoparquet_writer.hpp"
#include "geo_schema.hpp"
#include "geo_table.hpp"

#include <arrow/api.h>
#include <arrow/io/api.h>
#include <arrow/util/compression.h>
#include <folly/dynamic.h>
#include <folly/json.h>
#include <glog/logging.h>
#include <parquet/arrow/writer.h>
#include <parquet/properties.h>

#include <algorithm>
#include <limits>

using folly::dynamic;
using Status = arrow::Status;
template <class T> using Result = arrow::Result<T>;

const dynamic& Epsg4326ProjJson() {
  static const dynamic crs = dynamic::object
    ("$schema", "https://proj.org/schemas/v0.7/projjson.schema.json")
    ("type", "GeographicCRS")
    ("name", "WGS 84")
    ("datum_ensemble", dynamic::object
      ("name", "World Geodetic System 1984 ensemble")
      ("members", dynamic::array(
        dynamic::object("name", "World Geodetic System 1984 (Transit)"),
        dynamic::object("name", "World Geodetic System 1984 (G730)"),
        dynamic::object("name", "World Geodetic System 1984 (G873)"),
        dynamic::object("name", "World Geodetic System 1984 (G1150)"),
        dynamic::object("name", "World Geodetic System 1984 (G1674)"),
        dynamic::object("name", "World Geodetic System 1984 (G1762)"),
        dynamic::object("name", "World Geodetic System 1984 (G2139)")))
      ("ellipsoid", dynamic::object
        ("name", "WGS 84")
        ("semi_major_axis", 6378137)
        ("inverse_flattening", 298.257223563))
      ("accuracy", "2.0")
      ("id", dynamic::object("authority", "EPSG")("code", 6326)))
    ("coordinate_system", dynamic::object
      ("subtype", "ellipsoidal")
      ("axis", dynamic::array(
        dynamic::object
          ("name", "Geodetic latitude")
          ("abbreviation", "Lat")
          ("direction", "north")
          ("unit", "degree"),
        dynamic::object
          ("name", "Geodetic longitude")
          ("abbreviation", "Lon")
          ("direction", "east")
          ("unit", "degree"))))
    ("scope", "Horizontal component of 3D system.")
    ("area", "World.")
    ("bbox", dynamic::object
      ("south_latitude", -90)
      ("west_longitude", -180)
      ("north_latitude", 90)
      ("east_longitude", 180))
    ("id", dynamic::object("authority", "EPSG")("code", kCrsEpsgCode));
  return crs;
}

Result<dynamic> MakeGeoMetadata(const arrow::Table& table,
                                const std::string& column)
{
  auto geometry = table.GetColumnByName(column);
  if (!geometry)
    return Status::Invalid("no geometry column '", column, "'");
  if (geometry->type()->id() != arrow::Type::BINARY)
    return Status::TypeError("geometry column '", column, "' is ",
                             geometry->type()->ToString(), ", not binary");

  double min_x = std::numeric_limits<double>::infinity();
  double min_y = min_x;
  double max_x = -min_x;
  double max_y = -min_x;
  int64_t points = 0;

  for (const auto& chunk : geometry->chunks()) {
    const auto& wkb = static_cast<const arrow::BinaryArray&>(*chunk);
    for (int64_t i = 0; i < wkb.length(); ++i) {
      double x, y;
      if (wkb.IsNull(i))
        continue;
      if (!DecodeWkbPoint(wkb.GetView(i), &x, &y))
        return Status::Invalid("row ", i, " of '", column,
                               "' is not a WKB point");
      min_x = std::min(min_x, x);
      min_y = std::min(min_y, y);
      max_x = std::max(max_x, x);
      max_y = std::max(max_y, y);
      points += 1;
    }
  }

  dynamic meta = dynamic::object
    ("encoding", "WKB")
    ("geometry_types", dynamic::array("Point"))
    ("crs", Epsg4326ProjJson());
  if (points > 0)
    meta["bbox"] = dynamic::array(min_x, min_y, max_x, max_y);

  dynamic geo = dynamic::object
    ("version", kGeoParquetVersion)
    ("primary_column", column)
    ("columns", dynamic::object(column, std::move(meta)));
  return geo;
}

Status WriteGeoParquet(const arrow::Table& table,
                       const std::string& file_path,
                       const GeoParquetOptions& options,
                       arrow::MemoryPool* memory_pool)
{
  memory_pool = memory_pool ?: arrow::default_memory_pool();
  ARROW_ASSIGN_OR_RAISE(dynamic geo,
                        MakeGeoMetadata(table, options.geometry_column));

  auto metadata = table.schema()->metadata()
    ? table.schema()->metadata()->Copy()
    : std::make_shared<arrow::KeyValueMetadata>();
  metadata->Append("geo", folly::toJson(geo));
  metadata->Append("num_rows", std::to_string(table.num_rows()));
  for (const auto& kv : options.extra_metadata)
    metadata->Append(kv.first, kv.second);
  auto tagged = table.ReplaceSchemaMetadata(metadata);

  auto properties = parquet::WriterProperties::Builder()
    .compression(options.compression)
    ->build();
  auto arrow_properties = parquet::ArrowWriterProperties::Builder()
    .store_schema()
    ->build();

  ARROW_ASSIGN_OR_RAISE(auto ostream, arrow::io::FileOutputStream::Open(
      file_path));
  ARROW_RETURN_NOT_OK(parquet::arrow::WriteTable(
      *tagged, memory_pool, ostream, options.row_group_size,
      properties, arrow_properties));

  ARROW_ASSIGN_OR_RAISE(int64_t bytes, ostream->Tell());
  ARROW_RETURN_NOT_OK(ostream->Close());
  LOG(INFO) << file_path << ": " << table.num_rows() << " rows, "
            << bytes << " bytes";
  return Status::OK();
}

Result<arrow::Compression::type> ParseCompression(const std::string& name) {
  return arrow::util::Codec::GetCompressionType(name);
}
