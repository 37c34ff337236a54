#include <harvest/FetchController.h>
#include <harvest/PostalApi.h>
#include <lib/test/ScriptedTransport.h>

#include <folly/portability/GMock.h>
#include <folly/portability/GTest.h>
#include <folly/Conv.h>

#include <set>

using namespace testing;
using folly::dynamic;

class FetchControllerTest : public Test {
 protected:
  FetchContext Context(ScriptedTransport& transport, PermitPool& permits) {
    FetchContext ctx;
    ctx.evb = &evb;
    ctx.transport = &transport;
    ctx.permits = &permits;
    ctx.api = &api;
    ctx.retry = RetryPolicy{2, std::chrono::milliseconds(0),
                            std::chrono::milliseconds(0)};
    return ctx;
  }

  folly::EventBase evb;
  PostalApi api{PostalApiOptions{}};
};

static std::vector<std::string> Keys(int n) {
  std::vector<std::string> keys;
  for (int i = 0; i < n; ++i)
    keys.push_back(folly::to<std::string>(100000 + i));
  return keys;
}

TEST_F(FetchControllerTest, EveryKeyCompletesOnce) {
  ScriptedTransport transport(&evb, [](const HttpRequest& req) {
    std::string key = queryParam(req.url, "searchVal");
    return searchPage(dynamic::array(dynamic::object("POSTAL", key)), 1);
  }, std::chrono::milliseconds(2));
  PermitPool permits(4);

  FetchController controller(Context(transport, permits),
                             ControllerOptions{5, "[test]"});
  auto outcomes = controller.run(Keys(25)).getVia(&evb);

  ASSERT_EQ(outcomes.size(), 25);
  std::set<std::string> seen;
  for (const KeyOutcome& o : outcomes) {
    EXPECT_TRUE(seen.insert(o.key).second) << o.key;
    EXPECT_EQ(o.status, FetchStatus::COMPLETE);
    ASSERT_EQ(o.records.size(), 1);
    EXPECT_EQ(o.records[0]["POSTAL"], o.key);
  }
  EXPECT_EQ(controller.progress().completed, 25);
  EXPECT_EQ(controller.progress().records, 25);
  EXPECT_EQ(controller.progress().partial, 0);
}

TEST_F(FetchControllerTest, ConcurrencyIsBounded) {
  ScriptedTransport transport(&evb, [](const HttpRequest&) {
    return searchPage(dynamic::array(), 0);
  }, std::chrono::milliseconds(3));
  PermitPool permits(3);

  FetchController controller(Context(transport, permits), ControllerOptions{});
  auto outcomes = controller.run(Keys(20)).getVia(&evb);

  EXPECT_EQ(outcomes.size(), 20);
  EXPECT_EQ(transport.requests().size(), 20);
  EXPECT_LE(transport.peakInFlight(), 3);
  EXPECT_LE(permits.peakActive(), 3);
  EXPECT_EQ(permits.active(), 0);
}

TEST_F(FetchControllerTest, FailuresDoNotStopTheRun) {
  ScriptedTransport transport(&evb, [](const HttpRequest& req) {
    std::string key = queryParam(req.url, "searchVal");
    if (key == "100001")
      return reply(400);
    if (key == "100002")
      return transportFailure("reset");
    return searchPage(dynamic::array(dynamic::object("POSTAL", key)), 1);
  });
  PermitPool permits(2);

  FetchController controller(Context(transport, permits), ControllerOptions{});
  auto outcomes = controller.run(Keys(4)).getVia(&evb);

  ASSERT_EQ(outcomes.size(), 4);
  EXPECT_EQ(controller.progress().partial, 2);
  EXPECT_EQ(controller.progress().records, 2);
}

TEST_F(FetchControllerTest, NoKeys) {
  ScriptedTransport transport(&evb, [](const HttpRequest&) {
    return reply(500);
  });
  PermitPool permits(1);

  FetchController controller(Context(transport, permits), ControllerOptions{});
  auto outcomes = controller.run({}).getVia(&evb);
  EXPECT_TRUE(outcomes.empty());
  EXPECT_TRUE(transport.requests().empty());
}

TEST_F(FetchControllerTest, RunsBackToBack) {
  ScriptedTransport transport(&evb, [](const HttpRequest&) {
    return searchPage(dynamic::array(), 0);
  });
  PermitPool permits(2);

  FetchController controller(Context(transport, permits), ControllerOptions{});
  EXPECT_EQ(controller.run(Keys(3)).getVia(&evb).size(), 3);
  EXPECT_EQ(controller.run(Keys(5)).getVia(&evb).size(), 5);
  EXPECT_EQ(controller.progress().total, 5);
}
