// Copyright (c) 2025 The SNTP Server Authors
#include "internal/rate_limiter.hpp"

#include <algorithm>
#include <chrono>

namespace sntpserver {
namespace internal {

void RateLimiter::Reset(const Config& config) {
  std::lock_guard<std::mutex> lock(mtx_);
  config_ = config;
  lru_.clear();
  index_.clear();
}

bool RateLimiter::Admit(const std::string& address, Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mtx_);
  PruneStaleLocked(now);

  auto it = index_.find(address);
  if (it == index_.end()) {
    if (config_.max_entries == 0) return true;
    while (index_.size() >= config_.max_entries) {
      index_.erase(lru_.back().address);
      lru_.pop_back();
    }
    Bucket bucket;
    bucket.address = address;
    bucket.tokens = std::max(config_.burst, 1.0);
    bucket.last_refill = now;
    lru_.push_front(bucket);
    it = index_.emplace(address, lru_.begin()).first;
  } else {
    lru_.splice(lru_.begin(), lru_, it->second);
  }

  Bucket& bucket = *it->second;
  Refill(&bucket, now);
  bucket.last_seen = now;
  if (bucket.tokens < 1.0) return false;
  bucket.tokens -= 1.0;
  return true;
}

void RateLimiter::PruneStale(Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mtx_);
  PruneStaleLocked(now);
}

size_t RateLimiter::Size() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return index_.size();
}

bool RateLimiter::Contains(const std::string& address) const {
  std::lock_guard<std::mutex> lock(mtx_);
  return index_.count(address) != 0;
}

void RateLimiter::PruneStaleLocked(Clock::time_point now) {
  if (config_.idle_timeout <= Clock::duration::zero()) return;
  // The list is ordered by last_seen, so stale entries sit at the back.
  while (!lru_.empty() &&
         (now - lru_.back().last_seen) > config_.idle_timeout) {
    index_.erase(lru_.back().address);
    lru_.pop_back();
  }
}

void RateLimiter::Refill(Bucket* bucket, Clock::time_point now) const {
  const double capacity = std::max(config_.burst, 1.0);
  if (now <= bucket->last_refill) return;
  if (config_.min_interval <= Clock::duration::zero()) {
    bucket->tokens = capacity;
  } else {
    const double elapsed =
        std::chrono::duration<double>(now - bucket->last_refill).count();
    const double interval =
        std::chrono::duration<double>(config_.min_interval).count();
    bucket->tokens = std::min(capacity, bucket->tokens + elapsed / interval);
  }
  bucket->last_refill = now;
}

}  // namespace internal
}  // namespace sntpserver
