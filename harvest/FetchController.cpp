#include "FetchController.h"

#include <folly/io/async/EventBase.h>
#include <fmt/format.h>
#include <glog/logging.h>

FetchController::FetchController(FetchContext ctx, ControllerOptions options)
  : ctx_(std::move(ctx))
  , options_(std::move(options))
{
  CHECK(ctx_.evb && ctx_.permits);
  if (options_.progress_every == 0)
    options_.progress_every = 1;
}

folly::Future<std::vector<KeyOutcome>>
FetchController::run(std::vector<std::string> keys) {
  CHECK_EQ(progress_.completed, progress_.total) << "run already in progress";

  progress_ = Progress{};
  progress_.total = keys.size();
  outcomes_.clear();
  outcomes_.reserve(keys.size());

  if (keys.empty())
    return folly::makeFuture(std::vector<KeyOutcome>{});

  done_ = folly::Promise<std::vector<KeyOutcome>>();
  auto result = done_.getSemiFuture().via(ctx_.evb);

  for (const std::string& key : keys) {
    KeyFetcher::make(key, ctx_)->run()
      .thenTry([this, key](folly::Try<KeyOutcome>&& outcome) {
        if (outcome.hasValue()) {
          onComplete(std::move(outcome.value()));
          return;
        }
        /* A fetcher never fails on its own; keep the key accounted for */
        LOG(ERROR) << key << ": fetcher failed: " << outcome.exception().what();
        KeyOutcome failed;
        failed.key = key;
        failed.status = FetchStatus::PARTIAL;
        failed.reason = "internal error: " +
          outcome.exception().what().toStdString();
        onComplete(std::move(failed));
      });
  }

  return result;
}

void FetchController::onComplete(KeyOutcome outcome) {
  DCHECK(ctx_.evb->isInEventBaseThread());

  progress_.completed += 1;
  progress_.records += outcome.records.size();
  if (outcome.status == FetchStatus::PARTIAL)
    progress_.partial += 1;
  outcomes_.push_back(std::move(outcome));

  const bool last = progress_.completed == progress_.total;
  if (last || progress_.completed % options_.progress_every == 0)
    reportProgress();

  if (last)
    done_.setValue(std::move(outcomes_));
}

void FetchController::reportProgress() const {
  double pct = 100.0 * progress_.completed / progress_.total;
  LOG(INFO) << fmt::format("{}{}Progress: {}/{} ({:.1f}%)",
                           options_.label, options_.label.empty() ? "" : " ",
                           progress_.completed, progress_.total, pct);
}
