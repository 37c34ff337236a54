#include <harvest/ResultAggregator.h>

#include <folly/portability/GMock.h>
#include <folly/portability/GTest.h>

using namespace testing;
using folly::dynamic;

static KeyOutcome Outcome(const std::string& key, FetchStatus status,
                          std::vector<std::string> names)
{
  KeyOutcome o;
  o.key = key;
  o.status = status;
  o.requests = 1;
  for (const std::string& n : names)
    o.records.push_back(dynamic::object("ADDRESS", n));
  return o;
}

TEST(ResultAggregatorTest, FlattensInOrder) {
  std::vector<KeyOutcome> outcomes;
  outcomes.push_back(Outcome("1", FetchStatus::COMPLETE, {"a", "b"}));
  outcomes.push_back(Outcome("2", FetchStatus::EMPTY, {}));
  outcomes.push_back(Outcome("3", FetchStatus::COMPLETE, {"c"}));

  auto records = aggregateRecords(std::move(outcomes));
  ASSERT_TRUE(records.has_value());
  ASSERT_EQ(records->size(), 3);
  EXPECT_EQ((*records)[0]["ADDRESS"], "a");
  EXPECT_EQ((*records)[1]["ADDRESS"], "b");
  EXPECT_EQ((*records)[2]["ADDRESS"], "c");
}

TEST(ResultAggregatorTest, PartialRecordsAreKept) {
  std::vector<KeyOutcome> outcomes;
  outcomes.push_back(Outcome("1", FetchStatus::PARTIAL, {"x"}));
  auto records = aggregateRecords(std::move(outcomes));
  ASSERT_TRUE(records.has_value());
  EXPECT_EQ(records->size(), 1);
}

TEST(ResultAggregatorTest, NoData) {
  std::vector<KeyOutcome> outcomes;
  outcomes.push_back(Outcome("1", FetchStatus::EMPTY, {}));
  outcomes.push_back(Outcome("2", FetchStatus::PARTIAL, {}));
  EXPECT_FALSE(aggregateRecords(std::move(outcomes)).has_value());
  EXPECT_FALSE(aggregateRecords({}).has_value());
}

TEST(ResultAggregatorTest, Summary) {
  std::vector<KeyOutcome> outcomes;
  outcomes.push_back(Outcome("1", FetchStatus::COMPLETE, {"a", "b"}));
  outcomes.push_back(Outcome("2", FetchStatus::EMPTY, {}));
  outcomes.push_back(Outcome("3", FetchStatus::PARTIAL, {"c"}));
  outcomes.push_back(Outcome("4", FetchStatus::PARTIAL, {}));

  OutcomeSummary s = summarizeOutcomes(outcomes);
  EXPECT_EQ(s.keys, 4);
  EXPECT_EQ(s.complete, 1);
  EXPECT_EQ(s.empty, 1);
  EXPECT_EQ(s.partial, 2);
  EXPECT_EQ(s.records, 3);
  EXPECT_EQ(s.requests, 4);
  EXPECT_THAT(s.degraded_keys, ElementsAre("3", "4"));
}

TEST(ResultAggregatorTest, StatusNames) {
  EXPECT_STREQ(fetchStatusName(FetchStatus::COMPLETE), "COMPLETE");
  EXPECT_STREQ(fetchStatusName(FetchStatus::EMPTY), "EMPTY");
  EXPECT_STREQ(fetchStatusName(FetchStatus::PARTIAL), "PARTIAL");
}
