// Copyright (c) 2025 The SNTP Server Authors
/**
 * @file ntp_server.cc
 * @brief SNTP server receive loop, admission control and dispatch.
 */
#include "sntpserver/ntp_server.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include "internal/rate_limiter.hpp"
#include "internal/request_handler.hpp"
#include "sntpserver/ntp_types.hpp"
#include "sntpserver/platform/socket_interface.hpp"
#include "sntpserver/system_clock.hpp"
#include "sntpserver/timestamp_encoder.hpp"

namespace sntpserver {

namespace {

/** Poll timeout; bounds how long Stop() waits for the loop to notice. */
constexpr int64_t kWaitTimeoutUs = 200000;

class StatsTracker {
 public:
  void IncPacketsReceived() {
    packets_received_.fetch_add(1, std::memory_order_relaxed);
  }
  void IncPacketsSent() {
    packets_sent_.fetch_add(1, std::memory_order_relaxed);
  }
  void IncRecvErrors() { recv_errors_.fetch_add(1, std::memory_order_relaxed); }
  void IncShortPackets() {
    short_packets_.fetch_add(1, std::memory_order_relaxed);
  }
  void IncRateLimited() {
    rate_limited_.fetch_add(1, std::memory_order_relaxed);
  }
  void IncInvalidRequests() {
    invalid_requests_.fetch_add(1, std::memory_order_relaxed);
  }
  void IncSendErrors() { send_errors_.fetch_add(1, std::memory_order_relaxed); }
  void IncHandlerErrors() {
    handler_errors_.fetch_add(1, std::memory_order_relaxed);
  }
  void SetLastError(const std::string& text) {
    std::lock_guard<std::mutex> lk(last_error_mtx_);
    last_error_ = text;
  }

  ServerStats Snapshot(uint64_t active_clients) const {
    ServerStats stats;
    stats.packets_received = packets_received_.load(std::memory_order_relaxed);
    stats.packets_sent = packets_sent_.load(std::memory_order_relaxed);
    stats.recv_errors = recv_errors_.load(std::memory_order_relaxed);
    stats.drop_short_packets = short_packets_.load(std::memory_order_relaxed);
    stats.drop_rate_limited = rate_limited_.load(std::memory_order_relaxed);
    stats.drop_invalid_requests =
        invalid_requests_.load(std::memory_order_relaxed);
    stats.send_errors = send_errors_.load(std::memory_order_relaxed);
    stats.handler_errors = handler_errors_.load(std::memory_order_relaxed);
    stats.active_clients = active_clients;
    std::lock_guard<std::mutex> lk(last_error_mtx_);
    stats.last_error = last_error_;
    return stats;
  }

 private:
  std::atomic<uint64_t> packets_received_{0};
  std::atomic<uint64_t> packets_sent_{0};
  std::atomic<uint64_t> recv_errors_{0};
  std::atomic<uint64_t> short_packets_{0};
  std::atomic<uint64_t> rate_limited_{0};
  std::atomic<uint64_t> invalid_requests_{0};
  std::atomic<uint64_t> send_errors_{0};
  std::atomic<uint64_t> handler_errors_{0};
  mutable std::mutex last_error_mtx_;
  std::string last_error_;
};

/**
 * State of one Start()..Stop() cycle.
 *
 * Handler threads keep a shared_ptr to it, so the socket, the handler (and
 * through it the time and random sources) and the statistics stay alive
 * until the last in-flight request finishes even if the server has been
 * stopped or destroyed meanwhile.
 */
struct Session {
  std::unique_ptr<platform::ISocket> socket;
  std::mutex send_mtx;  // serializes Send() and Close()
  std::shared_ptr<TimeSource> time_source;
  std::unique_ptr<internal::RequestHandler> handler;
  Options::LogCallback log;
  std::shared_ptr<StatsTracker> stats;

  std::mutex inflight_mtx;
  std::condition_variable inflight_cv;
  size_t inflight = 0;

  void BeginRequest() {
    std::lock_guard<std::mutex> lock(inflight_mtx);
    ++inflight;
  }

  void EndRequest() {
    {
      std::lock_guard<std::mutex> lock(inflight_mtx);
      --inflight;
    }
    inflight_cv.notify_all();
  }

  /** Waits until no handler is running; returns the number still running. */
  size_t WaitForHandlers(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(inflight_mtx);
    inflight_cv.wait_for(lock, timeout, [this]() { return inflight == 0; });
    return inflight;
  }

  void Log(LogLevel level, const std::string& msg) const {
    if (log) log(level, msg);
  }

  void RecordError(LogLevel level, const std::string& msg) {
    Log(level, msg);
    stats->SetLastError(msg);
  }

  void CloseSocket() {
    std::lock_guard<std::mutex> lock(send_mtx);
    if (socket) socket->Close();
  }

  /** Runs on a detached handler thread. */
  void Serve(const std::vector<uint8_t>& request, const TimeSpec& t_recv,
             const platform::Endpoint& from) {
    using Status = internal::RequestHandler::Status;
    std::string error;
    const Status st = handler->Handle(request, t_recv, from, socket.get(),
                                      &send_mtx, &error);
    if (st == Status::kSent) {
      stats->IncPacketsSent();
      return;
    }
    std::ostringstream oss;
    oss << error << " from=" << from.address << ":" << from.port;
    switch (st) {
      case Status::kMalformed:
      case Status::kInvalidRequest:
        stats->IncInvalidRequests();
        Log(LogLevel::kWarning, oss.str());
        break;
      case Status::kEncodeFailed:
        stats->IncHandlerErrors();
        RecordError(LogLevel::kError, oss.str());
        break;
      case Status::kSendFailed:
        stats->IncSendErrors();
        RecordError(LogLevel::kError, oss.str());
        break;
      case Status::kSent:
        break;
    }
  }
};

}  // namespace

class NtpServer::Impl {
 public:
  Impl() : stats_(std::make_shared<StatsTracker>()) {}
  ~Impl() { Stop(); }

  bool Start(const std::string& host, uint16_t port,
             std::shared_ptr<TimeSource> time_source, const Options& options) {
    std::lock_guard<std::mutex> lock(start_stop_mtx_);
    if (running_.load()) return true;
    // The loop may have ended on its own after a transport error.
    JoinAndClose();

    auto session = std::make_shared<Session>();
    session->time_source =
        time_source ? std::move(time_source) : std::make_shared<SystemClock>();
    session->log = options.LogSink();
    session->stats = stats_;
    internal::RequestHandler::Config hcfg;
    hcfg.reference_source = options.ReferenceSource();
    hcfg.precision = options.Precision();
    session->handler.reset(new internal::RequestHandler(
        session->time_source, TimestampEncoder(options.Randomness()), hcfg));

    internal::RateLimiter::Config rcfg;
    rcfg.max_entries = options.MaxTrackedClients();
    rcfg.idle_timeout = options.ClientRetention();
    rcfg.min_interval = options.MinRequestInterval();
    rcfg.burst = static_cast<double>(options.RequestBurst());
    rate_limiter_.Reset(rcfg);

    // Don't reset stats_ to persist statistics across Start/Stop
    if (!CreateAndBindSocket(session.get(), host, port)) {
      return false;
    }

    {
      std::ostringstream oss;
      oss << "listening on " << (host.empty() ? "0.0.0.0" : host) << ":"
          << session->socket->LocalPort() << " " << options;
      session->Log(LogLevel::kInfo, oss.str());
    }

    session_ = session;
    running_.store(true);
    thread_ = std::thread([this, session]() { Loop(session); });
    return true;
  }

  void Stop() {
    std::lock_guard<std::mutex> lock(start_stop_mtx_);
    running_.store(false);
    JoinAndClose();
  }

  bool IsRunning() const { return running_.load(); }

  uint16_t LocalPort() const {
    std::lock_guard<std::mutex> lock(start_stop_mtx_);
    if (!session_ || !session_->socket) return 0;
    return session_->socket->LocalPort();
  }

  ServerStats GetStats() const {
    return stats_->Snapshot(rate_limiter_.Size());
  }

 private:
  /** Creates UDP socket and binds to given address. */
  bool CreateAndBindSocket(Session* session, const std::string& host,
                           uint16_t port) {
    session->socket = platform::CreatePlatformSocket();
    if (!session->socket->Bind(host, port)) {
      session->RecordError(
          LogLevel::kError,
          "Socket bind failed: " + session->socket->GetLastError());
      session->socket->Close();
      session->socket.reset();
      return false;
    }
    return true;
  }

  /** Joins a finished or stopping loop and releases its socket. */
  void JoinAndClose() {
    if (thread_.joinable()) thread_.join();
    if (session_) {
      const size_t running = session_->WaitForHandlers(kHandlerDrainTimeout);
      if (running != 0) {
        std::ostringstream oss;
        oss << "closing socket with " << running << " handler(s) still running";
        session_->Log(LogLevel::kWarning, oss.str());
      }
      session_->CloseSocket();
      session_->Log(LogLevel::kInfo, "server stopped");
      session_.reset();
      // Tracking state belongs to the serving session.
      rate_limiter_.Reset(internal::RateLimiter::Config());
    }
  }

  /** Main loop: wait for datagrams and dispatch them. */
  void Loop(const std::shared_ptr<Session>& session) {
    while (running_.load()) {
      const platform::WaitResult r =
          session->socket->WaitReadable(kWaitTimeoutUs);
      if (r == platform::WaitResult::kTimeout) continue;
      if (r == platform::WaitResult::kError) {
        session->stats->IncRecvErrors();
        session->RecordError(
            LogLevel::kError,
            "Wait failed: " + session->socket->GetLastError());
        break;
      }
      if (!HandleSingleDatagram(session)) break;
    }
    running_.store(false);
  }

  /**
   * @brief Receives one datagram, applies size and rate checks and hands it
   *        to a handler thread.
   * @return false on a transport error that ends the loop.
   */
  bool HandleSingleDatagram(const std::shared_ptr<Session>& session) {
    platform::Endpoint from;
    std::vector<uint8_t> data;
    if (!session->socket->Receive(&from, &data, kNtpPacketSize)) {
      session->stats->IncRecvErrors();
      session->RecordError(
          LogLevel::kError,
          "Receive failed: " + session->socket->GetLastError());
      return false;
    }
    const TimeSpec t_recv = session->time_source->NowUnix();

    if (data.size() < kNtpPacketSize) {
      session->stats->IncShortPackets();
      std::ostringstream oss;
      oss << "undersized packet size=" << data.size()
          << " from=" << from.address << ":" << from.port;
      session->Log(LogLevel::kWarning, oss.str());
      return true;
    }

    if (!rate_limiter_.Admit(from.address)) {
      session->stats->IncRateLimited();
      // No kiss-of-death (RATE) is sent; the request is dropped.
      session->Log(LogLevel::kDebug,
                   "rate limited client addr=" + from.address);
      return true;
    }

    session->stats->IncPacketsReceived();
    session->BeginRequest();
    try {
      std::thread([session, data = std::move(data), from, t_recv]() {
        session->Serve(data, t_recv, from);
        session->EndRequest();
      }).detach();
    } catch (const std::system_error& e) {
      session->EndRequest();
      session->stats->IncHandlerErrors();
      session->RecordError(LogLevel::kError,
                           std::string("handler dispatch failed: ") + e.what());
    }
    return true;
  }

  std::thread thread_;
  std::atomic<bool> running_{false};
  mutable std::mutex start_stop_mtx_;
  std::shared_ptr<Session> session_;
  internal::RateLimiter rate_limiter_;
  std::shared_ptr<StatsTracker> stats_;
};

NtpServer::NtpServer() : impl_(new Impl) {}
NtpServer::~NtpServer() = default;

bool NtpServer::Start(const std::string& host, uint16_t port,
                      std::shared_ptr<TimeSource> time_source,
                      const Options& options) {
  return impl_->Start(host, port, std::move(time_source), options);
}
void NtpServer::Stop() { impl_->Stop(); }
bool NtpServer::IsRunning() const { return impl_->IsRunning(); }
uint16_t NtpServer::LocalPort() const { return impl_->LocalPort(); }
ServerStats NtpServer::GetStats() const { return impl_->GetStats(); }

}  // namespace sntpserver
