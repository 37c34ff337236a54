#include "PermitPool.h"

#include <glog/logging.h>

#include <algorithm>

PermitPool::Permit& PermitPool::Permit::operator=(Permit&& rhs) noexcept {
  if (this != &rhs) {
    reset();
    pool_ = rhs.pool_;
    rhs.pool_ = nullptr;
  }
  return *this;
}

void PermitPool::Permit::reset() noexcept {
  if (pool_) {
    PermitPool* pool = pool_;
    pool_ = nullptr;
    pool->release();
  }
}

PermitPool::PermitPool(size_t capacity)
  : capacity_(capacity)
{
  CHECK_GT(capacity_, 0u) << "permit pool needs at least one permit";
}

PermitPool::~PermitPool() noexcept {
  LOG_IF(WARNING, active_ != 0)
    << "permit pool destroyed with " << active_ << " permits outstanding";
}

folly::SemiFuture<PermitPool::Permit> PermitPool::acquire() {
  std::unique_lock<std::mutex> lk(mutex_);
  if (active_ < capacity_) {
    active_ += 1;
    peak_ = std::max(peak_, active_);
    lk.unlock();
    return folly::makeSemiFuture(Permit(this));
  }

  waiters_.emplace_back();
  return waiters_.back().getSemiFuture();
}

PermitPool::Permit PermitPool::tryAcquire() {
  std::unique_lock<std::mutex> lk(mutex_);
  if (active_ >= capacity_)
    return Permit();
  active_ += 1;
  peak_ = std::max(peak_, active_);
  return Permit(this);
}

void PermitPool::release() noexcept {
  std::unique_lock<std::mutex> lk(mutex_);
  if (waiters_.empty()) {
    DCHECK_GT(active_, 0u);
    active_ -= 1;
    return;
  }

  /* Hand the permit over without ever dropping the counter */
  folly::Promise<Permit> next = std::move(waiters_.front());
  waiters_.pop_front();
  lk.unlock();
  next.setValue(Permit(this));
}

size_t PermitPool::active() const {
  std::unique_lock<std::mutex> lk(mutex_);
  return active_;
}

size_t PermitPool::waiting() const {
  std::unique_lock<std::mutex> lk(mutex_);
  return waiters_.size();
}

size_t PermitPool::peakActive() const {
  std::unique_lock<std::mutex> lk(mutex_);
  return peak_;
}
