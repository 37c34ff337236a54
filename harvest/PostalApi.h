#ifndef GEOHARVEST_POSTAL_API_H
#define GEOHARVEST_POSTAL_API_H

#include "HarvestTypes.h"
#include "HttpTransport.h"

#include <folly/Expected.h>
#include <folly/Range.h>

#include <cstdint>
#include <string>

struct PostalApiOptions {
  std::string base_url = "https://www.onemap.gov.sg/api/common/elastic/search";
  /** Sent as the Authorization header when not empty. */
  std::string token;
};

/** One decoded result page. */
struct PostalPage {
  RecordSet results;
  int64_t total_pages = 0;
};

/** Request builder and body decoder for the address search endpoint. */
class PostalApi {
 public:
  explicit PostalApi(PostalApiOptions options);

  HttpRequest pageRequest(folly::StringPiece key, uint32_t page) const;

  /** Decode a 200 body. Errors describe what was wrong with the body. */
  static folly::Expected<PostalPage, std::string> parsePage(
      folly::StringPiece body);

 private:
  PostalApiOptions options_;
};

#endif // GEOHARVEST_POSTAL_API_H
