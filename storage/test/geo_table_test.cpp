#include <storage/geo_table.hpp>
#include <storage/geo_schema.hpp>

#include <arrow/api.h>
#include <folly/json.h>
#include <folly/portability/GMock.h>
#include <folly/portability/GTest.h>

#include <cmath>

using namespace testing;
using folly::dynamic;

TEST(GeoTableTest, WkbPointLayout) {
  std::string wkb = EncodeWkbPoint(103.85, 1.29);
  ASSERT_EQ(wkb.size(), 21u);
  EXPECT_EQ(wkb[0], 1);
  EXPECT_EQ(wkb.substr(1, 4), std::string("\x01\x00\x00\x00", 4));

  double x = 0, y = 0;
  ASSERT_TRUE(DecodeWkbPoint(wkb, &x, &y));
  EXPECT_DOUBLE_EQ(x, 103.85);
  EXPECT_DOUBLE_EQ(y, 1.29);
}

TEST(GeoTableTest, BigEndianWkb) {
  /* POINT(1 2) in XDR */
  const std::string wkb(
      "\x00\x00\x00\x00\x01"
      "\x3f\xf0\x00\x00\x00\x00\x00\x00"
      "\x40\x00\x00\x00\x00\x00\x00\x00", 21);
  double x = 0, y = 0;
  ASSERT_TRUE(DecodeWkbPoint(wkb, &x, &y));
  EXPECT_EQ(x, 1.0);
  EXPECT_EQ(y, 2.0);
}

TEST(GeoTableTest, RejectsOtherGeometries) {
  double x, y;
  EXPECT_FALSE(DecodeWkbPoint("", &x, &y));
  std::string line = EncodeWkbPoint(1, 2);
  line[1] = 2;
  EXPECT_FALSE(DecodeWkbPoint(line, &x, &y));
  std::string bad_order = EncodeWkbPoint(1, 2);
  bad_order[0] = 7;
  EXPECT_FALSE(DecodeWkbPoint(bad_order, &x, &y));
}

TEST(GeoTableTest, FieldConversions) {
  EXPECT_EQ(FieldToText("abc"), "abc");
  EXPECT_EQ(FieldToText(12), "12");
  EXPECT_EQ(FieldToText(true), "true");
  EXPECT_EQ(FieldToText(dynamic::array(1, 2)), "[1,2]");

  double v = 0;
  EXPECT_TRUE(FieldToCoordinate(" 1.2941 ", &v));
  EXPECT_DOUBLE_EQ(v, 1.2941);
  EXPECT_TRUE(FieldToCoordinate(103, &v));
  EXPECT_EQ(v, 103.0);
  EXPECT_FALSE(FieldToCoordinate("NIL", &v));
  EXPECT_FALSE(FieldToCoordinate("", &v));
  EXPECT_FALSE(FieldToCoordinate(nullptr, &v));
  EXPECT_FALSE(FieldToCoordinate("nan", &v));
}

static RecordSet Records(const char* json) {
  RecordSet out;
  for (const dynamic& rec : folly::parseJson(json))
    out.push_back(rec);
  return out;
}

TEST(GeoTableTest, AddressTableSchema) {
  auto records = Records(R"([
    {"SEARCHVAL": "A", "POSTAL": "018956", "LATITUDE": "1.29",
     "LONGITUDE": "103.85", "ZZZ": "z", "AAA": 5},
    {"POSTAL": "018957", "LATITUDE": "NIL", "LONGITUDE": "103.9"},
    {"BLK_NO": "10", "POSTAL": "018958", "LATITUDE": 1.3, "LONGITUDE": 103.7}
  ])");

  auto result = MakeAddressTable(records);
  ASSERT_TRUE(result.ok()) << result.status().ToString();
  auto table = *result;

  std::vector<std::string> names;
  for (const auto& f : table->schema()->fields())
    names.push_back(f->name());
  EXPECT_THAT(names, ElementsAre("SEARCHVAL", "BLK_NO", "POSTAL", "LATITUDE",
                                 "LONGITUDE", "AAA", "ZZZ", "geometry"));

  EXPECT_EQ(table->num_rows(), 3);
  EXPECT_TRUE(table->GetColumnByName("LATITUDE")->type()->Equals(
      arrow::float64()));
  EXPECT_TRUE(table->GetColumnByName("POSTAL")->type()->Equals(arrow::utf8()));
  EXPECT_TRUE(table->GetColumnByName("geometry")->type()->Equals(
      arrow::binary()));

  auto lat = std::static_pointer_cast<arrow::DoubleArray>(
      table->GetColumnByName("LATITUDE")->chunk(0));
  EXPECT_DOUBLE_EQ(lat->Value(0), 1.29);
  EXPECT_TRUE(lat->IsNull(1));
  EXPECT_DOUBLE_EQ(lat->Value(2), 1.3);

  auto aaa = std::static_pointer_cast<arrow::StringArray>(
      table->GetColumnByName("AAA")->chunk(0));
  EXPECT_EQ(aaa->GetString(0), "5");
  EXPECT_TRUE(aaa->IsNull(1));

  auto geometry = std::static_pointer_cast<arrow::BinaryArray>(
      table->GetColumnByName("geometry")->chunk(0));
  double x, y;
  ASSERT_TRUE(DecodeWkbPoint(geometry->GetView(0), &x, &y));
  EXPECT_DOUBLE_EQ(x, 103.85);
  EXPECT_DOUBLE_EQ(y, 1.29);
  EXPECT_TRUE(geometry->IsNull(1));
  EXPECT_FALSE(geometry->IsNull(2));
}

TEST(GeoTableTest, NonObjectRecordsAreSkipped) {
  auto records = Records(R"([{"POSTAL": "1"}, "junk", 3])");
  auto result = MakeAddressTable(records);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ((*result)->num_rows(), 1);
}
