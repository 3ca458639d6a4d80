// Copyright (c) 2025 The SNTP Server Authors
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <ostream>
#include <string>

#include "sntpserver/export.hpp"
#include "sntpserver/ntp_types.hpp"
#include "sntpserver/random_source.hpp"
#include "sntpserver/time_source.hpp"

namespace sntpserver {

/** Severity passed to the log sink. */
enum class LogLevel { kDebug, kInfo, kWarning, kError };

/** Returns "DEBUG", "INFO", "WARN" or "ERROR". */
SNTP_SERVER_API const char* ToString(LogLevel level);

/**
 * Immutable configuration options for NtpServer.
 */
class SNTP_SERVER_API Options {
 public:
  using LogCallback = std::function<void(LogLevel, const std::string&)>;

  class SNTP_SERVER_API Builder {
   public:
    Builder();
    /** Reference clock code placed in the reference ID (max 4 chars). */
    Builder& ReferenceSource(const std::string& code);
    Builder& Precision(int8_t v);
    /** Maximum number of client addresses tracked; 0 disables limiting. */
    Builder& MaxTrackedClients(size_t v);
    /** Idle time after which a client address is forgotten. */
    Builder& ClientRetention(std::chrono::steady_clock::duration v);
    /** Minimum interval between admitted requests from one address. */
    Builder& MinRequestInterval(std::chrono::steady_clock::duration v);
    /** Requests an address may send back to back before being limited. */
    Builder& RequestBurst(uint32_t v);
    /** Nonce generator; nullptr selects OpenSslRandomSource. */
    Builder& Randomness(std::shared_ptr<RandomSource> v);
    /**
     * Log sink, called from the receive loop and from handler threads. A
     * handler still running when Stop() gives up waiting may call it after
     * Stop() returns, so the callback should own whatever it captures.
     */
    Builder& LogSink(LogCallback cb);
    Options Build() const;

   private:
    std::string reference_source_;
    int8_t precision_;
    size_t max_tracked_clients_;
    std::chrono::steady_clock::duration client_retention_;
    std::chrono::steady_clock::duration min_request_interval_;
    uint32_t request_burst_;
    std::shared_ptr<RandomSource> random_;
    LogCallback log_sink_cb_;
  };

  Options();

  const std::string& ReferenceSource() const;
  int8_t Precision() const;
  size_t MaxTrackedClients() const;
  std::chrono::steady_clock::duration ClientRetention() const;
  std::chrono::steady_clock::duration MinRequestInterval() const;
  uint32_t RequestBurst() const;
  const std::shared_ptr<RandomSource>& Randomness() const;
  const LogCallback& LogSink() const;

  static constexpr const char* kDefaultReferenceSource = refsource::kLocal;
  static constexpr int8_t kDefaultPrecision =
      sntpserver::Precision::kOneMicrosecond;
  static constexpr size_t kDefaultMaxTrackedClients = 10000;
  static constexpr std::chrono::steady_clock::duration kDefaultClientRetention =
      std::chrono::hours(24);
  static constexpr std::chrono::steady_clock::duration
      kDefaultMinRequestInterval = std::chrono::seconds(10);
  static constexpr uint32_t kDefaultRequestBurst = 1;

 private:
  std::string reference_source_;
  int8_t precision_;
  size_t max_tracked_clients_;
  std::chrono::steady_clock::duration client_retention_;
  std::chrono::steady_clock::duration min_request_interval_;
  uint32_t request_burst_;
  std::shared_ptr<RandomSource> random_;
  LogCallback log_callback_;
};

/** Writes a one-line summary such as "ref=LOCL precision=-20 ...". */
SNTP_SERVER_API std::ostream& operator<<(std::ostream& os, const Options& o);

struct ServerStats {
  uint64_t packets_received = 0;      ///< Datagrams dispatched to a handler
  uint64_t packets_sent = 0;          ///< Responses sent successfully
  uint64_t recv_errors = 0;           ///< poll()/recvfrom() failures
  uint64_t drop_short_packets = 0;    ///< Datagrams shorter than NTP header
  uint64_t drop_rate_limited = 0;     ///< Datagrams denied by the limiter
  uint64_t drop_invalid_requests = 0; ///< Malformed or non client/v4 requests
  uint64_t send_errors = 0;           ///< sendto() failures or partial sends
  uint64_t handler_errors = 0;        ///< Timestamp encode or dispatch errors
  uint64_t active_clients = 0;        ///< Currently tracked client addresses
  std::string last_error;             ///< Latest error message
};

/**
 * Minimal SNTP server (NTPv4 unicast over UDP, IPv4 and IPv6).
 *
 * Answers mode 3 (client) version 4 requests with mode 4 (server) stratum 1
 * responses. Each admitted request is handled on its own detached thread;
 * requests from one address beyond the configured rate are dropped
 * silently.
 *
 * @note Kiss-of-death (RATE/DENY) responses are not sent. Over-rate and
 *       invalid requests simply receive no answer.
 */
class SNTP_SERVER_API NtpServer {
 public:
  NtpServer();
  ~NtpServer();

  NtpServer(const NtpServer&) = delete;
  NtpServer& operator=(const NtpServer&) = delete;

  /** Upper bound on how long Stop() waits for in-flight handlers. */
  static constexpr std::chrono::milliseconds kHandlerDrainTimeout{500};

  /**
   * @brief Binds host:port and starts the receive loop.
   * @param host IPv4/IPv6 address or host name; empty for any address on
   *        both families, "0.0.0.0" for any IPv4 address.
   * @param port UDP port to bind (0: ephemeral, see LocalPort()).
   * @param time_source Time source for timestamps (default: SystemClock).
   *        Shared with in-flight handlers, which may hold it past Stop().
   * @param options Immutable configuration snapshot (defaults applied).
   * @return true on success (or if already running), false on failure.
   */
  bool Start(const std::string& host = "", uint16_t port = 123,
             std::shared_ptr<TimeSource> time_source = nullptr,
             const Options& options = Options());

  /**
   * Stops the receive loop, waits up to kHandlerDrainTimeout for handlers
   * already dispatched, then closes the socket. Handlers still running after
   * that keep their own references and fail their send. Safe to call
   * multiple times.
   */
  void Stop();

  /** True while the receive loop is running. */
  bool IsRunning() const;

  /** Bound UDP port, or 0 when stopped. */
  uint16_t LocalPort() const;

  /** Returns latest statistics snapshot (thread-safe). */
  ServerStats GetStats() const;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace sntpserver
