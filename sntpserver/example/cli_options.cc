// Copyright (c) 2025 The SNTP Server Authors
#include "cli_options.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace sntpserver_example {

namespace {

bool ParseInteger(const std::string& text, long long min, long long max,
                  long long* out) {
  if (text.empty()) return false;
  char* end = nullptr;
  errno = 0;
  const long long v = std::strtoll(text.c_str(), &end, 10);
  if (errno == ERANGE || end == nullptr || *end != '\0') return false;
  if (v < min || v > max) return false;
  *out = v;
  return true;
}

bool ParseSeconds(const std::string& text,
                  std::chrono::steady_clock::duration* out) {
  if (text.empty()) return false;
  char* end = nullptr;
  errno = 0;
  const double v = std::strtod(text.c_str(), &end);
  if (errno == ERANGE || end == nullptr || *end != '\0') return false;
  if (!std::isfinite(v) || v < 0.0 || v > kMaxDurationSeconds) return false;
  *out = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
      std::chrono::duration<double>(v));
  return true;
}

}  // namespace

bool ParseCommandLine(int argc, const char* const* argv, CliOptions* opts,
                      std::string* error) {
  for (int i = 1; i < argc; ++i) {
    const std::string a(argv[i]);
    if (a == "-h" || a == "--help") {
      opts->show_help = true;
      continue;
    }
    if (a == "--debug") {
      opts->debug = true;
      continue;
    }
    if (a != "--host" && a != "--port" && a != "--min-interval" &&
        a != "--max-clients" && a != "--client-ttl") {
      *error = "unknown option: " + a;
      return false;
    }
    if (i + 1 >= argc) {
      *error = "missing value for " + a;
      return false;
    }
    const std::string v(argv[++i]);

    bool ok = true;
    if (a == "--host") {
      opts->host = v;
    } else if (a == "--port") {
      long long port = 0;
      ok = ParseInteger(v, 0, 65535, &port);
      if (ok) opts->port = static_cast<uint16_t>(port);
    } else if (a == "--max-clients") {
      long long n = 0;
      ok = ParseInteger(v, 0, std::numeric_limits<long long>::max(), &n);
      if (ok) opts->max_clients = static_cast<size_t>(n);
    } else if (a == "--min-interval") {
      ok = ParseSeconds(v, &opts->min_interval);
    } else {
      ok = ParseSeconds(v, &opts->client_ttl);
    }
    if (!ok) {
      *error = "invalid value for " + a + ": " + v;
      return false;
    }
  }
  return true;
}

}  // namespace sntpserver_example
