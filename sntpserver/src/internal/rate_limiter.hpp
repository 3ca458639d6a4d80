// Copyright (c) 2025 The SNTP Server Authors
/**
 * @file rate_limiter.hpp
 * @brief Per-client token-bucket admission control.
 *
 * Keeps one token bucket per client IP address in a bounded LRU table.
 * Entries leave the table when the table is full (least recently seen
 * first) or when they have been idle longer than the retention window.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>

namespace sntpserver {
namespace internal {

/**
 * @brief Bounded per-address rate limiter.
 *
 * Thread-safe: All public methods are protected by an internal mutex.
 */
class RateLimiter {
 public:
  using Clock = std::chrono::steady_clock;

  struct Config {
    size_t max_entries = 10000;  ///< Hard cap on tracked addresses
    Clock::duration idle_timeout = std::chrono::hours(24);
    Clock::duration min_interval = std::chrono::seconds(10);
    double burst = 1.0;  ///< Bucket capacity (tokens)
  };

  RateLimiter() = default;
  explicit RateLimiter(const Config& config) : config_(config) {}

  RateLimiter(const RateLimiter&) = delete;
  RateLimiter& operator=(const RateLimiter&) = delete;

  /**
   * @brief Replaces the configuration and forgets all tracked addresses.
   */
  void Reset(const Config& config);

  /**
   * @brief Consumes one token for address if available.
   *
   * The first request from an address always starts with a full bucket.
   * Idle entries are swept before the lookup.
   *
   * @param address Client IP address (port excluded).
   * @param now Monotonic time of the request.
   * @return true when the request is admitted.
   */
  bool Admit(const std::string& address, Clock::time_point now);
  bool Admit(const std::string& address) { return Admit(address, Clock::now()); }

  /** Removes entries idle for longer than the idle timeout. */
  void PruneStale(Clock::time_point now);

  /** Number of tracked addresses. */
  size_t Size() const;

  /** True if address currently has an entry. */
  bool Contains(const std::string& address) const;

 private:
  struct Bucket {
    std::string address;
    double tokens = 0.0;
    Clock::time_point last_refill{};
    Clock::time_point last_seen{};
  };
  using BucketList = std::list<Bucket>;

  void PruneStaleLocked(Clock::time_point now);
  void Refill(Bucket* bucket, Clock::time_point now) const;

  mutable std::mutex mtx_;
  Config config_;
  BucketList lru_;  // front = most recently seen
  std::unordered_map<std::string, BucketList::iterator> index_;
};

}  // namespace internal
}  // namespace sntpserver
