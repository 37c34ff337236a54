#include <harvest/PostalApi.h>
#include <lib/test/ScriptedTransport.h>

#include <folly/portability/GMock.h>
#include <folly/portability/GTest.h>

using namespace testing;
using folly::dynamic;

TEST(PostalApiTest, PageRequest) {
  PostalApi api(PostalApiOptions{});
  HttpRequest req = api.pageRequest("018956", 2);
  EXPECT_EQ(req.method, "GET");
  EXPECT_THAT(req.url, StartsWith(
      "https://www.onemap.gov.sg/api/common/elastic/search?"));
  EXPECT_EQ(queryParam(req.url, "searchVal"), "018956");
  EXPECT_EQ(queryParam(req.url, "returnGeom"), "Y");
  EXPECT_EQ(queryParam(req.url, "getAddrDetails"), "Y");
  EXPECT_EQ(queryParam(req.url, "pageNum"), "2");
  EXPECT_EQ(headerValue(req, "Authorization"), "");
}

TEST(PostalApiTest, TokenIsSentWhenConfigured) {
  PostalApiOptions options;
  options.base_url = "http://localhost:8080/search";
  options.token = "secret";
  PostalApi api(options);
  HttpRequest req = api.pageRequest("000001", 1);
  EXPECT_THAT(req.url, StartsWith("http://localhost:8080/search?searchVal=000001&"));
  EXPECT_EQ(headerValue(req, "Authorization"), "secret");
}

TEST(PostalApiTest, ParsePage) {
  auto page = PostalApi::parsePage(R"({
    "found": 2, "totalNumPages": 3, "pageNum": 1,
    "results": [{"POSTAL": "018956", "BLK_NO": "10"}, {"POSTAL": "018956"}]
  })");
  ASSERT_TRUE(page.hasValue()) << page.error();
  EXPECT_EQ(page->total_pages, 3);
  ASSERT_EQ(page->results.size(), 2);
  EXPECT_EQ(page->results[0]["BLK_NO"], "10");
}

TEST(PostalApiTest, MissingFieldsMeanNothingFound) {
  auto page = PostalApi::parsePage(R"({"found": 0})");
  ASSERT_TRUE(page.hasValue());
  EXPECT_EQ(page->total_pages, 0);
  EXPECT_TRUE(page->results.empty());

  page = PostalApi::parsePage(R"({"results": null, "totalNumPages": null})");
  ASSERT_TRUE(page.hasValue());
  EXPECT_TRUE(page->results.empty());
}

TEST(PostalApiTest, NumericStringPageCount) {
  auto page = PostalApi::parsePage(R"({"results": [], "totalNumPages": "4"})");
  ASSERT_TRUE(page.hasValue());
  EXPECT_EQ(page->total_pages, 4);
}

TEST(PostalApiTest, MalformedBodies) {
  EXPECT_EQ(PostalApi::parsePage("<html>").error(), "invalid JSON body");
  EXPECT_EQ(PostalApi::parsePage("[]").error(), "body is not a JSON object");
  EXPECT_EQ(PostalApi::parsePage(R"({"results": {}})").error(),
            "'results' is not an array");
  EXPECT_THAT(PostalApi::parsePage(R"({"totalNumPages": "many"})").error(),
              StartsWith("bad 'totalNumPages'"));
  EXPECT_THAT(PostalApi::parsePage(R"({"totalNumPages": [1]})").error(),
              StartsWith("bad 'totalNumPages'"));
}
