#include "stop_feed.hpp"
#include "geo_schema.hpp"
#include "geo_table.hpp"

#include <arrow/api.h>
#include <folly/Conv.h>
#include <folly/String.h>
#include <glog/logging.h>
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>

#include <memory>

using Status = arrow::Status;
template <class T> using Result = arrow::Result<T>;

using XmlDocument = std::unique_ptr<xmlDoc, void (*)(xmlDocPtr)>;

static bool NameIs(const xmlNode* node, const char* name) {
  return node->type == XML_ELEMENT_NODE &&
    xmlStrEqual(node->name, reinterpret_cast<const xmlChar*>(name));
}

static const xmlNode* FindChild(const xmlNode* parent, const char* name) {
  for (const xmlNode* c = parent ? parent->children : nullptr; c; c = c->next) {
    if (NameIs(c, name))
      return c;
  }
  return nullptr;
}

/* Owns the xmlChar* returned by libxml2 just long enough to copy it */
static std::string TakeXmlString(xmlChar* text) {
  if (!text)
    return std::string();
  std::string out(reinterpret_cast<const char*>(text));
  xmlFree(text);
  return out;
}

static std::string Attribute(const xmlNode* node, const char* name) {
  return TakeXmlString(xmlGetProp(node, reinterpret_cast<const xmlChar*>(name)));
}

static std::string Text(const xmlNode* node) {
  return node ? TakeXmlString(xmlNodeGetContent(node)) : std::string();
}

static Status ParseCoordinate(const xmlNode* coordinates, const char* axis,
                              const std::string& stop, double* out)
{
  const xmlNode* node = FindChild(coordinates, axis);
  if (!node)
    return Status::Invalid("stop '", stop, "' has no coordinates/", axis);

  std::string text = Text(node);
  auto value = folly::tryTo<double>(folly::trimWhitespace(text));
  if (!value.hasValue())
    return Status::Invalid("stop '", stop, "': bad ", axis, " '", text, "'");
  *out = value.value();
  return Status::OK();
}

Result<std::vector<StopRow>> ParseStopFeed(std::string_view xml) {
  XmlDocument doc(xmlReadMemory(xml.data(), static_cast<int>(xml.size()),
                                "bus_stops.xml", nullptr, XML_PARSE_NONET),
                  xmlFreeDoc);
  if (!doc) {
    const xmlError* err = xmlGetLastError();
    return Status::IOError("stop feed is not valid XML: ",
                           err && err->message ? err->message : "unknown error");
  }

  const xmlNode* root = xmlDocGetRootElement(doc.get());
  if (!root)
    return Status::Invalid("stop feed has no root element");

  std::vector<StopRow> stops;
  for (const xmlNode* node = root->children; node; node = node->next) {
    if (!NameIs(node, "busstop"))
      continue;

    StopRow& row = stops.emplace_back();
    row.name = Attribute(node, "name");
    row.wab = Attribute(node, "wab") == "true";
    row.details = Text(FindChild(node, "details"));

    const xmlNode* coordinates = FindChild(node, "coordinates");
    ARROW_RETURN_NOT_OK(ParseCoordinate(coordinates, "lat", row.name, &row.lat));
    ARROW_RETURN_NOT_OK(ParseCoordinate(coordinates, "long", row.name, &row.lon));
  }

  LOG(INFO) << "stop feed: " << stops.size() << " stops";
  return stops;
}

Result<std::shared_ptr<arrow::Table>> MakeStopTable(
    const std::vector<StopRow>& stops, arrow::MemoryPool* memory_pool)
{
  memory_pool = memory_pool ?: arrow::default_memory_pool();
  auto schema = arrow::schema({
      arrow::field("name", arrow::utf8()),
      arrow::field("wab", arrow::boolean()),
      arrow::field("details", arrow::utf8()),
      arrow::field(kGeometryColumn, arrow::binary()),
    });

  ARROW_ASSIGN_OR_RAISE(auto builder, arrow::RecordBatchBuilder::Make(
      schema, memory_pool, static_cast<int64_t>(stops.size())));
  auto& name = *builder->GetFieldAs<arrow::StringBuilder>(0);
  auto& wab = *builder->GetFieldAs<arrow::BooleanBuilder>(1);
  auto& details = *builder->GetFieldAs<arrow::StringBuilder>(2);
  auto& geometry = *builder->GetFieldAs<arrow::BinaryBuilder>(3);

  for (const StopRow& stop : stops) {
    ARROW_RETURN_NOT_OK(name.Append(stop.name));
    ARROW_RETURN_NOT_OK(wab.Append(stop.wab));
    ARROW_RETURN_NOT_OK(details.Append(stop.details));
    ARROW_RETURN_NOT_OK(geometry.Append(EncodeWkbPoint(stop.lon, stop.lat)));
  }

  ARROW_ASSIGN_OR_RAISE(auto batch, builder->Flush());
  return arrow::Table::FromRecordBatches(schema, {batch});
}
