#ifndef GEOHARVEST_PERMIT_POOL_H
#define GEOHARVEST_PERMIT_POOL_H

#include <folly/futures/Future.h>

#include <cstddef>
#include <deque>
#include <mutex>

/**
 * Asynchronous counting semaphore. Waiters are served in FIFO order and a
 * released permit is handed directly to the oldest waiter, so the number of
 * outstanding permits never exceeds the capacity.
 *
 * The pool must outlive every permit it hands out.
 */
class PermitPool {
 public:
  class Permit {
   public:
    Permit() noexcept = default;
    Permit(Permit&& rhs) noexcept : pool_(rhs.pool_) { rhs.pool_ = nullptr; }
    Permit& operator=(Permit&& rhs) noexcept;
    Permit(const Permit&) = delete;
    Permit& operator=(const Permit&) = delete;
    ~Permit() { reset(); }

    /** Give the permit back early. */
    void reset() noexcept;
    explicit operator bool() const noexcept { return pool_ != nullptr; }

   private:
    friend class PermitPool;
    explicit Permit(PermitPool* pool) noexcept : pool_(pool) {}
    PermitPool* pool_ = nullptr;
  };

  explicit PermitPool(size_t capacity);
  ~PermitPool() noexcept;

  /** Resolves once a permit is available. */
  folly::SemiFuture<Permit> acquire();

  /** Take a permit only if one is free right now. */
  Permit tryAcquire();

  size_t capacity() const noexcept { return capacity_; }
  size_t active() const;
  size_t waiting() const;
  /** Highest number of permits ever outstanding at once. */
  size_t peakActive() const;

 private:
  void release() noexcept;

  const size_t capacity_;
  mutable std::mutex mutex_;
  size_t active_ = 0;
  size_t peak_ = 0;
  std::deque<folly::Promise<Permit>> waiters_;
};

#endif // GEOHARVEST_PERMIT_POOL_H
