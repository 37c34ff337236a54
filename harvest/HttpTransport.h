#ifndef GEOHARVEST_HTTP_TRANSPORT_H
#define GEOHARVEST_HTTP_TRANSPORT_H

#include <folly/futures/Future.h>
#include <openssl/ossl_typ.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace folly {
  class EventBase;
}

struct HttpRequest {
  std::string method = "GET";
  std::string url;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;
};

struct HttpResponse {
  int status = 0;
  std::string body;
  std::vector<std::pair<std::string, std::string>> headers;

  bool ok() const noexcept { return status >= 200 && status < 300; }
};

/** Thrown into the response future when no HTTP status was received. */
class TransportError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class HttpTransport {
 public:
  virtual ~HttpTransport() = default;

  /** Issue a single request. The future fails with TransportError
    * on connect errors, timeouts and protocol errors. */
  virtual folly::SemiFuture<HttpResponse> send(HttpRequest request) = 0;
};

/** True when `cert` names `host` (DNS name, wildcard or IP literal). The
  * transport drops a TLS connection whose peer fails this check. */
bool certificateMatchesHost(X509* cert, const std::string& host);

struct TransportOptions {
  size_t max_connections = 10;
  std::chrono::milliseconds connect_timeout{5000};
  /* Total deadline of one request, connect included */
  std::chrono::milliseconds request_timeout{20000};
  std::string ca_bundle;
  std::string user_agent = "geoharvest/1.0";
};

/** HTTP/1.1 client running on the given event base. Every request opens its
  * own connection; at most `max_connections` are open at once. */
std::unique_ptr<HttpTransport> makeProxygenTransport(
    folly::EventBase* evb, const TransportOptions& options);

#endif // GEOHARVEST_HTTP_TRANSPORT_H
