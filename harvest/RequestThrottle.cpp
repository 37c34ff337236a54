#include "RequestThrottle.h"

#include <folly/io/async/EventBase.h>
#include <glog/logging.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

folly::Future<folly::Unit> delayOn(folly::EventBase* evb,
                                   std::chrono::milliseconds delay)
{
  if (delay.count() <= 0)
    return folly::makeFuture().via(evb);

  /* The timer takes 32-bit milliseconds */
  const auto ms = std::min<int64_t>(delay.count(),
                                    std::numeric_limits<uint32_t>::max());
  folly::Promise<folly::Unit> promise;
  auto future = promise.getSemiFuture().via(evb);
  evb->runAfterDelay([promise = std::move(promise)]() mutable {
    promise.setValue();
  }, static_cast<uint32_t>(ms));
  return future;
}

RequestThrottle::RequestThrottle(double requestsPerSecond, double burst)
  : rate_(requestsPerSecond > 0 ? requestsPerSecond : 0)
  , bucket_(rate_ > 0 ? rate_ : 1e10, std::max(burst, 1.0))
{
}

std::chrono::milliseconds RequestThrottle::reserve() {
  return reserveAt(folly::TokenBucket::defaultClockNow());
}

std::chrono::milliseconds RequestThrottle::reserveAt(double nowInSeconds) {
  if (!enabled())
    return std::chrono::milliseconds(0);

  auto wait = bucket_.consumeWithBorrowNonBlocking(1, nowInSeconds);
  /* Only happens when a single token exceeds the burst size */
  CHECK(wait.has_value()) << "throttle burst below one request";
  return std::chrono::milliseconds(
      static_cast<int64_t>(std::ceil(*wait * 1000.0)));
}

folly::Future<folly::Unit> RequestThrottle::acquire(folly::EventBase* evb) {
  return delayOn(evb, reserve());
}
