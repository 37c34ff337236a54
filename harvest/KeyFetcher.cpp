#include "KeyFetcher.h"
#include "PostalApi.h"
#include "RequestThrottle.h"

#include <folly/io/async/EventBase.h>
#include <fmt/format.h>
#include <glog/logging.h>

const char* fetchStatusName(FetchStatus status) noexcept {
  switch (status) {
    case FetchStatus::COMPLETE: return "COMPLETE";
    case FetchStatus::EMPTY: return "EMPTY";
    case FetchStatus::PARTIAL: return "PARTIAL";
  }
  return "UNKNOWN";
}

std::shared_ptr<KeyFetcher> KeyFetcher::make(std::string key,
                                             const FetchContext& ctx)
{
  return std::shared_ptr<KeyFetcher>(new KeyFetcher(std::move(key), ctx));
}

KeyFetcher::KeyFetcher(std::string key, const FetchContext& ctx)
  : ctx_(ctx)
{
  CHECK(ctx_.evb && ctx_.transport && ctx_.api);
  outcome_.key = std::move(key);
}

folly::Future<KeyOutcome> KeyFetcher::run() {
  CHECK(ctx_.permits);
  auto self = shared_from_this();
  return ctx_.permits->acquire().via(ctx_.evb)
    .thenValue([self](PermitPool::Permit permit) {
      return self->runUnlimited()
        .ensure([permit = std::move(permit)]() {});
    });
}

folly::Future<KeyOutcome> KeyFetcher::runUnlimited() {
  auto self = shared_from_this();
  return attempt().thenValue([self](folly::Unit) {
    return std::move(self->outcome_);
  });
}

folly::Future<folly::Unit> KeyFetcher::attempt() {
  auto self = shared_from_this();
  folly::Future<folly::Unit> ready = ctx_.throttle
    ? ctx_.throttle->acquire(ctx_.evb)
    : folly::makeFuture().via(ctx_.evb);

  return std::move(ready)
    .thenValue([self](folly::Unit) {
      self->outcome_.requests += 1;
      HttpRequest req = self->ctx_.api->pageRequest(self->outcome_.key,
                                                    self->page_);
      auto response = self->ctx_.transport->send(std::move(req))
        .via(self->ctx_.evb);
      const auto deadline = self->ctx_.retry.attempt_timeout;
      if (deadline.count() <= 0)
        return response;
      return std::move(response).within(deadline).via(self->ctx_.evb);
    })
    .thenTry([self](folly::Try<HttpResponse>&& response) {
      return self->onResponse(std::move(response));
    });
}

folly::Future<folly::Unit>
KeyFetcher::onResponse(folly::Try<HttpResponse>&& response) {
  if (response.hasException()) {
    if (response.exception().is_compatible_with<folly::FutureTimeout>()) {
      return onTransient(fmt::format("no response within {}ms",
                                     ctx_.retry.attempt_timeout.count()));
    }
    return onTransient(response.exception().what().toStdString());
  }

  const HttpResponse& resp = response.value();
  if (resp.status == 200) {
    auto page = PostalApi::parsePage(resp.body);
    if (!page)
      return onTransient("malformed body: " + page.error());

    outcome_.pages += 1;
    for (RawRecord& row : page->results)
      outcome_.records.push_back(std::move(row));

    if (static_cast<int64_t>(page_) < page->total_pages) {
      page_ += 1;
      attempt_ = 0;
      return attempt();
    }

    finish(outcome_.records.empty() ? FetchStatus::EMPTY
                                    : FetchStatus::COMPLETE);
    return folly::makeFuture();
  }

  if (resp.status == 429 || resp.status >= 500)
    return onTransient(fmt::format("HTTP {}", resp.status));

  finish(FetchStatus::PARTIAL,
         fmt::format("page {}: HTTP {}", page_, resp.status));
  return folly::makeFuture();
}

folly::Future<folly::Unit> KeyFetcher::onTransient(std::string reason) {
  const uint32_t budget = std::max<uint32_t>(ctx_.retry.max_attempts, 1);
  attempt_ += 1;

  if (attempt_ >= budget) {
    finish(FetchStatus::PARTIAL,
           fmt::format("page {}: gave up after {} attempts, last error: {}",
                       page_, attempt_, reason));
    return folly::makeFuture();
  }

  auto wait = ctx_.retry.backoff(attempt_ - 1);
  LOG(WARNING) << outcome_.key << " page " << page_ << ": " << reason
               << ", retry " << attempt_ << '/' << (budget - 1)
               << " in " << wait.count() << "ms";

  auto self = shared_from_this();
  return delayOn(ctx_.evb, wait).thenValue([self](folly::Unit) {
    return self->attempt();
  });
}

void KeyFetcher::finish(FetchStatus status, std::string reason) {
  outcome_.status = status;
  outcome_.reason = std::move(reason);
  LOG_IF(WARNING, status == FetchStatus::PARTIAL)
    << outcome_.key << ": partial result (" << outcome_.records.size()
    << " records): " << outcome_.reason;
  VLOG(1) << outcome_.key << ": " << fetchStatusName(status) << ", "
          << outcome_.pages << " pages, " << outcome_.requests << " requests";
}
