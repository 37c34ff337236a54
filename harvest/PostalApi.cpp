#include "PostalApi.h"

#include <folly/Conv.h>
#include <folly/String.h>
#include <folly/dynamic.h>
#include <folly/json.h>
#include <fmt/format.h>

using folly::dynamic;
using folly::StringPiece;

PostalApi::PostalApi(PostalApiOptions options)
  : options_(std::move(options))
{
}

HttpRequest PostalApi::pageRequest(StringPiece key, uint32_t page) const {
  HttpRequest req;
  req.method = "GET";
  req.url = fmt::format(
      "{}?searchVal={}&returnGeom=Y&getAddrDetails=Y&pageNum={}",
      options_.base_url, folly::uriEscape<std::string>(key), page);
  req.headers.emplace_back("Accept", "application/json");
  if (!options_.token.empty())
    req.headers.emplace_back("Authorization", options_.token);
  return req;
}

folly::Expected<PostalPage, std::string>
PostalApi::parsePage(StringPiece body) {
  const char* param = "body";

  try {
    dynamic json = folly::parseJson(body);
    if (!json.isObject())
      return folly::makeUnexpected(std::string("body is not a JSON object"));

    PostalPage page;
    param = "results";
    if (const dynamic* results = json.get_ptr("results")) {
      if (!results->isNull()) {
        if (!results->isArray())
          return folly::makeUnexpected(std::string("'results' is not an array"));
        page.results.reserve(results->size());
        for (const dynamic& row : *results)
          page.results.push_back(row);
      }
    }

    param = "totalNumPages";
    if (const dynamic* total = json.get_ptr("totalNumPages")) {
      if (!total->isNull())
        page.total_pages = total->asInt();
    }
    return page;
  } catch (const folly::json::parse_error& e) {
    return folly::makeUnexpected(std::string("invalid JSON body"));
  } catch (const folly::TypeError& e) {
    return folly::makeUnexpected(fmt::format("bad '{}': {}", param, e.what()));
  } catch (const folly::ConversionError& e) {
    return folly::makeUnexpected(fmt::format("bad '{}': {}", param, e.what()));
  }
}
