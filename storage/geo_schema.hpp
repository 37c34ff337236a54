#ifndef GEOHARVEST_GEO_SCHEMA_H_
#define GEOHARVEST_GEO_SCHEMA_H_

#include <cstddef>

/* Column layout of the exported tables.
 *
 *  addresses_NNNNNN_NNNNNN.parquet
 *  ┌───────────┬────────┬───────────┬──────────┬─────────┬────────┬───┬───┬──────────┬───────────┬─────────┬──────────┐
 *  │ SEARCHVAL │ BLK_NO │ ROAD_NAME │ BUILDING │ ADDRESS │ POSTAL │ X │ Y │ LATITUDE │ LONGITUDE │ (extra) │ geometry │
 *  ├───────────┴────────┴───────────┴──────────┴─────────┴────────┴───┴───┼──────────┴───────────┼─────────┼──────────┤
 *  │                              utf8                                    │       float64        │  utf8   │   WKB    │
 *  └──────────────────────────────────────────────────────────────────────┴──────────────────────┴─────────┴──────────┘
 *  Fields not listed above follow the known ones in name order.
 *
 *  bus_stops.parquet
 *  ┌──────┬──────┬─────────┬──────────┐
 *  │ name │ wab  │ details │ geometry │
 *  ├──────┼──────┼─────────┼──────────┤
 *  │ utf8 │ bool │  utf8   │   WKB    │
 *  └──────┴──────┴─────────┴──────────┘
 */

static constexpr const char* kAddressKnownFields[] = {
  "SEARCHVAL", "BLK_NO", "ROAD_NAME", "BUILDING", "ADDRESS",
  "POSTAL", "X", "Y", "LATITUDE", "LONGITUDE",
};

static constexpr const char* kLatitudeField = "LATITUDE";
static constexpr const char* kLongitudeField = "LONGITUDE";
static constexpr const char* kGeometryColumn = "geometry";

/* Points are stored as ISO WKB in little endian order */
enum {
  WKB_BYTE_ORDER_NDR = 1,
  WKB_TYPE_POINT = 1,
  WKB_POINT_SIZE = 1 + 4 + 8 + 8,
};

static constexpr int kCrsEpsgCode = 4326;
static constexpr const char* kGeoParquetVersion = "1.0.0";

#endif // GEOHARVEST_GEO_SCHEMA_H_
