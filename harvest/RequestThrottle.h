#ifndef GEOHARVEST_REQUEST_THROTTLE_H
#define GEOHARVEST_REQUEST_THROTTLE_H

#include <folly/TokenBucket.h>
#include <folly/futures/Future.h>

#include <chrono>

namespace folly {
  class EventBase;
}

/** Resolves on `evb` after `delay` has elapsed. Must be called from the
  * event base thread or before its loop is started. */
folly::Future<folly::Unit> delayOn(folly::EventBase* evb,
                                   std::chrono::milliseconds delay);

/**
 * Request rate limiter shared by every fetcher of a run. Each request
 * reserves one token ahead of time and sleeps for as long as the bucket
 * needs to pay it back, so callers are spaced out evenly without holding
 * any lock while they wait.
 */
class RequestThrottle {
 public:
  /** A non-positive rate disables throttling. */
  RequestThrottle(double requestsPerSecond, double burst);

  /** Claim one token, return how long the caller must wait before using it. */
  std::chrono::milliseconds reserve();
  std::chrono::milliseconds reserveAt(double nowInSeconds);

  /** Claim one token and resolve on `evb` when it may be used. */
  folly::Future<folly::Unit> acquire(folly::EventBase* evb);

  bool enabled() const noexcept { return rate_ > 0; }
  double rate() const noexcept { return rate_; }

 private:
  const double rate_;
  folly::TokenBucket bucket_;
};

#endif // GEOHARVEST_REQUEST_THROTTLE_H
