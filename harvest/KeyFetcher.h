#ifndef GEOHARVEST_KEY_FETCHER_H
#define GEOHARVEST_KEY_FETCHER_H

#include "HarvestTypes.h"
#include "HttpTransport.h"
#include "PermitPool.h"

#include <folly/futures/Future.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace folly {
  class EventBase;
}

class PostalApi;
class RequestThrottle;

struct RetryPolicy {
  uint32_t max_attempts = 4;
  std::chrono::milliseconds backoff_unit{1000};
  std::chrono::milliseconds backoff_floor{2000};
  /* Total deadline of one request, zero for none */
  std::chrono::milliseconds attempt_timeout{20000};

  /** Wait after the failed attempt number `attempt` (zero based). */
  std::chrono::milliseconds backoff(uint32_t attempt) const {
    return backoff_unit * (int64_t{1} << std::min<uint32_t>(attempt, 30))
      + backoff_floor;
  }
};

/** Everything a fetcher shares with the rest of the run. Not owned. */
struct FetchContext {
  folly::EventBase* evb = nullptr;
  HttpTransport* transport = nullptr;
  PermitPool* permits = nullptr;
  RequestThrottle* throttle = nullptr;  // optional
  const PostalApi* api = nullptr;
  RetryPolicy retry;
};

/**
 * Retrieves every result page of one key. The returned future always
 * holds an outcome: transient failures are retried with backoff, and a
 * permanent failure or an exhausted retry budget ends the key with the
 * records collected so far.
 */
class KeyFetcher : public std::enable_shared_from_this<KeyFetcher> {
 public:
  static std::shared_ptr<KeyFetcher> make(std::string key,
                                          const FetchContext& ctx);

  /** Wait for a permit, fetch all pages, release the permit. */
  folly::Future<KeyOutcome> run();

  /** Fetch without taking a permit. */
  folly::Future<KeyOutcome> runUnlimited();

 private:
  KeyFetcher(std::string key, const FetchContext& ctx);

  folly::Future<folly::Unit> attempt();
  folly::Future<folly::Unit> onResponse(folly::Try<HttpResponse>&& response);
  folly::Future<folly::Unit> onTransient(std::string reason);
  void finish(FetchStatus status, std::string reason = {});

  const FetchContext ctx_;
  KeyOutcome outcome_;
  /* Page cursor */
  uint32_t page_ = 1;
  uint32_t attempt_ = 0;
};

#endif // GEOHARVEST_KEY_FETCHER_H
