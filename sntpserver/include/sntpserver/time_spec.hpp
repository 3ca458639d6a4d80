// Copyright (c) 2025 The SNTP Server Authors
/**
 * @file time_spec.hpp
 * @brief Wall-clock instant with nanosecond precision.
 *
 * Provides a TimeSpec structure (seconds + nanoseconds) and its
 * conversion to/from 64-bit NTP timestamps.
 */
#pragma once

#include <cstdint>

namespace sntpserver {

/**
 * @brief Time specification with nanosecond precision.
 *
 * Represents absolute time as UNIX epoch seconds plus nanosecond fraction.
 */
struct TimeSpec {
  int64_t sec;    ///< Seconds since UNIX epoch (1970-01-01 00:00:00 UTC)
  uint32_t nsec;  ///< Nanoseconds (0-999999999)

  /** Default constructor: zero time */
  TimeSpec() : sec(0), nsec(0) {}

  /** Constructor from seconds and nanoseconds */
  TimeSpec(int64_t s, uint32_t ns) : sec(s), nsec(ns) {}

  /**
   * @brief Convert to NTP timestamp (64-bit, seconds.fraction).
   *
   * NTP epoch is 1900-01-01, fraction is nsec * 2^32 / 10^9. Seconds wrap
   * modulo 2^32 (NTP era).
   * @return 64-bit NTP timestamp in host byte order.
   */
  uint64_t ToNtpTimestamp() const;

  /**
   * @brief Create TimeSpec from NTP timestamp (era 0).
   *
   * @param ntp_ts 64-bit NTP timestamp in host byte order.
   * @return TimeSpec representing the same instant.
   */
  static TimeSpec FromNtpTimestamp(uint64_t ntp_ts);
};

}  // namespace sntpserver
