#ifndef GEOHARVEST_FETCH_CONTROLLER_H
#define GEOHARVEST_FETCH_CONTROLLER_H

#include "HarvestTypes.h"
#include "KeyFetcher.h"

#include <folly/futures/Future.h>

#include <cstddef>
#include <string>
#include <vector>

struct ControllerOptions {
  /** Log progress every N completions and always on the last one. */
  size_t progress_every = 50;
  /** Prefix of progress lines, e.g. "[000001-000100]". */
  std::string label;
};

struct Progress {
  size_t completed = 0;
  size_t total = 0;
  size_t records = 0;
  size_t partial = 0;
};

/**
 * Fans out one fetcher per key and collects their outcomes in completion
 * order. Admission is bounded by the permit pool of the fetch context.
 * Completions are consumed on the event base thread only.
 */
class FetchController {
 public:
  FetchController(FetchContext ctx, ControllerOptions options);

  /** Resolves once every key has produced exactly one outcome.
    * Only one run may be active at a time. */
  folly::Future<std::vector<KeyOutcome>> run(std::vector<std::string> keys);

  const Progress& progress() const noexcept { return progress_; }

 private:
  void onComplete(KeyOutcome outcome);
  void reportProgress() const;

  FetchContext ctx_;
  ControllerOptions options_;
  Progress progress_;
  std::vector<KeyOutcome> outcomes_;
  folly::Promise<std::vector<KeyOutcome>> done_;
};

#endif // GEOHARVEST_FETCH_CONTROLLER_H
