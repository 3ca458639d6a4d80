// Copyright (c) 2025
/**
 * @file system_clock.hpp
 * @brief TimeSource backed by the operating system real-time clock.
 */
#pragma once

#include "sntpserver/export.hpp"
#include "sntpserver/time_source.hpp"

namespace sntpserver {

/**
 * @brief TimeSource reading CLOCK_REALTIME via clock_gettime().
 *
 * Stateless and therefore thread-safe. The reference time is the current
 * time (the server acts as a stratum 1 "LOCL" source).
 */
class SNTP_SERVER_API SystemClock : public TimeSource {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = delete;
  SystemClock& operator=(const SystemClock&) = delete;

  TimeSpec NowUnix() override;
};

}  // namespace sntpserver
