// Copyright (c) 2025 The SNTP Server Authors
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace sntpserver_example {

/** Largest accepted --min-interval / --client-ttl value, in seconds. */
constexpr double kMaxDurationSeconds = 1e9;

struct CliOptions {
  std::string host;
  uint16_t port = 123;
  std::chrono::steady_clock::duration min_interval = std::chrono::seconds(10);
  size_t max_clients = 10000;
  std::chrono::steady_clock::duration client_ttl = std::chrono::hours(24);
  bool debug = false;
  bool show_help = false;
};

/**
 * @brief Parses argv into opts.
 *
 * Numbers must be complete decimal literals within range: port 0-65535,
 * max clients >= 0, durations 0 to kMaxDurationSeconds.
 *
 * @return false with a message in error on an unknown option, a missing
 *         value or a malformed / out-of-range number.
 */
bool ParseCommandLine(int argc, const char* const* argv, CliOptions* opts,
                      std::string* error);

}  // namespace sntpserver_example
