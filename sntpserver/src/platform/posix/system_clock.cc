// Copyright (c) 2025
/**
 * @file system_clock.cc
 * @brief POSIX implementation using clock_gettime(CLOCK_REALTIME).
 */
#include "sntpserver/system_clock.hpp"

#include <time.h>

#include <chrono>
#include <cstdint>

namespace sntpserver {

TimeSpec SystemClock::NowUnix() {
  timespec ts{};
  if (clock_gettime(CLOCK_REALTIME, &ts) != 0) {
    // Fall back to the C++ clock, which is CLOCK_REALTIME on glibc anyway.
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    auto sec = std::chrono::duration_cast<std::chrono::seconds>(duration);
    auto nsec =
        std::chrono::duration_cast<std::chrono::nanoseconds>(duration - sec);
    return TimeSpec(sec.count(), static_cast<uint32_t>(nsec.count()));
  }
  return TimeSpec(static_cast<int64_t>(ts.tv_sec),
                  static_cast<uint32_t>(ts.tv_nsec));
}

}  // namespace sntpserver
