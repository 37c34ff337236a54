#ifndef GEOHARVEST_GEO_TABLE_H_
#define GEOHARVEST_GEO_TABLE_H_

#include "harvest/HarvestTypes.h"

#include <arrow/type_fwd.h>

#include <memory>
#include <string>
#include <string_view>

/** ISO WKB encoding of POINT(x y). */
std::string EncodeWkbPoint(double x, double y);

/** Decode a WKB point written by EncodeWkbPoint (either byte order).
  * Returns false for anything that is not a 2D point. */
bool DecodeWkbPoint(std::string_view wkb, double* x, double* y);

/** Text value of a record field as it is stored in a utf8 column. */
std::string FieldToText(const folly::dynamic& value);

/** Numeric coordinate of a record field. Returns false when the value is
  * missing, not numeric or not finite. */
bool FieldToCoordinate(const folly::dynamic& value, double* out);

/**
 * Convert raw address records into a table. Every field becomes a utf8
 * column except latitude and longitude, which are coerced to float64
 * (unparsable values become null). A WKB `geometry` column is appended,
 * null where either coordinate is missing.
 */
arrow::Result<std::shared_ptr<arrow::Table>> MakeAddressTable(
    const RecordSet& records, arrow::MemoryPool* memory_pool = nullptr);

#endif // GEOHARVEST_GEO_TABLE_H_
