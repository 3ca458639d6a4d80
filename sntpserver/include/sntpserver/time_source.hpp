// Copyright (c) 2025 The SNTP Server Authors
/**
 * @file time_source.hpp
 * @brief Minimal time source interface (UNIX time provider).
 */
#pragma once

#include "sntpserver/time_spec.hpp"

namespace sntpserver {

/**
 * Interface for time sources.
 * Provides current time as UNIX epoch time with nanosecond precision.
 *
 * Implementations must be safe to call from several threads at once; the
 * server reads the time from its receive loop and from request handlers.
 */
class TimeSource {
 public:
  virtual ~TimeSource() = default;

  /** Returns the current time since the UNIX epoch. */
  virtual TimeSpec NowUnix() = 0;

  /**
   * @brief Returns the time the local clock was last set or corrected.
   *
   * Used for the reference timestamp of responses. Sources without a
   * disciplining reference report the current time.
   */
  virtual TimeSpec ReferenceTime() { return NowUnix(); }
};

}  // namespace sntpserver
