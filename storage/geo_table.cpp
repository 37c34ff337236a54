#include "geo_table.hpp"
#include "geo_schema.hpp"

#include <arrow/api.h>
#include <folly/Conv.h>
#include <folly/String.h>
#include <folly/json.h>
#include <folly/lang/Bits.h>
#include <glog/logging.h>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <set>

using Status = arrow::Status;
template <class T> using Result = arrow::Result<T>;

static void PutDouble(char* out, double value) {
  uint64_t bits;
  std::memcpy(&bits, &value, sizeof(bits));
  bits = folly::Endian::little(bits);
  std::memcpy(out, &bits, sizeof(bits));
}

static double GetDouble(const char* in, bool little) {
  uint64_t bits;
  std::memcpy(&bits, in, sizeof(bits));
  bits = little ? folly::Endian::little(bits) : folly::Endian::big(bits);
  double value;
  std::memcpy(&value, &bits, sizeof(value));
  return value;
}

std::string EncodeWkbPoint(double x, double y) {
  std::string wkb(WKB_POINT_SIZE, '\0');
  uint32_t type = folly::Endian::little(uint32_t(WKB_TYPE_POINT));
  wkb[0] = WKB_BYTE_ORDER_NDR;
  std::memcpy(&wkb[1], &type, sizeof(type));
  PutDouble(&wkb[5], x);
  PutDouble(&wkb[13], y);
  return wkb;
}

bool DecodeWkbPoint(std::string_view wkb, double* x, double* y) {
  if (wkb.size() != WKB_POINT_SIZE)
    return false;

  bool little = wkb[0] == WKB_BYTE_ORDER_NDR;
  if (!little && wkb[0] != 0)
    return false;

  uint32_t type;
  std::memcpy(&type, &wkb[1], sizeof(type));
  type = little ? folly::Endian::little(type) : folly::Endian::big(type);
  if (type != WKB_TYPE_POINT)
    return false;

  *x = GetDouble(&wkb[5], little);
  *y = GetDouble(&wkb[13], little);
  return true;
}

std::string FieldToText(const folly::dynamic& value) {
  if (value.isString())
    return value.getString();
  if (value.isArray() || value.isObject() || value.isBool())
    return folly::toJson(value);
  return value.asString();
}

bool FieldToCoordinate(const folly::dynamic& value, double* out) {
  double v;
  if (value.isInt() || value.isDouble()) {
    v = value.asDouble();
  } else if (value.isString()) {
    auto parsed = folly::tryTo<double>(
        folly::trimWhitespace(value.stringPiece()));
    if (!parsed.hasValue())
      return false;
    v = parsed.value();
  } else {
    return false;
  }

  if (!std::isfinite(v))
    return false;
  *out = v;
  return true;
}

static std::vector<std::string> ColumnOrder(const RecordSet& records) {
  std::set<std::string> seen;
  for (const RawRecord& rec : records) {
    if (!rec.isObject())
      continue;
    for (const auto& item : rec.items())
      seen.insert(item.first.asString());
  }

  std::vector<std::string> order;
  for (const char* known : kAddressKnownFields) {
    auto it = seen.find(known);
    if (it != seen.end()) {
      order.push_back(*it);
      seen.erase(it);
    }
  }
  /* std::set keeps the rest in name order */
  order.insert(order.end(), seen.begin(), seen.end());
  return order;
}

static bool IsCoordinateField(const std::string& name) {
  return name == kLatitudeField || name == kLongitudeField;
}

Result<std::shared_ptr<arrow::Table>> MakeAddressTable(
    const RecordSet& records, arrow::MemoryPool* memory_pool)
{
  memory_pool = memory_pool ?: arrow::default_memory_pool();
  const std::vector<std::string> columns = ColumnOrder(records);

  arrow::FieldVector fields;
  for (const std::string& name : columns) {
    fields.push_back(arrow::field(
        name, IsCoordinateField(name) ? arrow::float64() : arrow::utf8()));
  }
  fields.push_back(arrow::field(kGeometryColumn, arrow::binary()));
  auto schema = arrow::schema(std::move(fields));

  ARROW_ASSIGN_OR_RAISE(auto builder, arrow::RecordBatchBuilder::Make(
      schema, memory_pool, static_cast<int64_t>(records.size())));
  auto& geometry = *builder->GetFieldAs<arrow::BinaryBuilder>(
      static_cast<int>(columns.size()));

  size_t skipped = 0;
  for (const RawRecord& rec : records) {
    if (!rec.isObject()) {
      skipped += 1;
      continue;
    }

    double lat = 0, lon = 0;
    bool has_lat = false, has_lon = false;

    for (size_t i = 0; i < columns.size(); ++i) {
      const std::string& name = columns[i];
      const folly::dynamic* value = rec.get_ptr(name);
      const bool missing = !value || value->isNull();

      if (IsCoordinateField(name)) {
        auto& column =
            *builder->GetFieldAs<arrow::DoubleBuilder>(static_cast<int>(i));
        double v;
        if (!missing && FieldToCoordinate(*value, &v)) {
          ARROW_RETURN_NOT_OK(column.Append(v));
          if (name == kLatitudeField) {
            lat = v;
            has_lat = true;
          } else {
            lon = v;
            has_lon = true;
          }
        } else {
          ARROW_RETURN_NOT_OK(column.AppendNull());
        }
      } else {
        auto& column =
            *builder->GetFieldAs<arrow::StringBuilder>(static_cast<int>(i));
        if (missing) {
          ARROW_RETURN_NOT_OK(column.AppendNull());
        } else {
          ARROW_RETURN_NOT_OK(column.Append(FieldToText(*value)));
        }
      }
    }

    if (has_lat && has_lon) {
      ARROW_RETURN_NOT_OK(geometry.Append(EncodeWkbPoint(lon, lat)));
    } else {
      ARROW_RETURN_NOT_OK(geometry.AppendNull());
    }
  }

  LOG_IF(WARNING, skipped) << "skipped " << skipped << " non-object records";

  ARROW_ASSIGN_OR_RAISE(auto batch, builder->Flush());
  return arrow::Table::FromRecordBatches(schema, {batch});
}
