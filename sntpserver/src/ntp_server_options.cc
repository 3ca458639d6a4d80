// Copyright (c) 2025 The SNTP Server Authors
#include <chrono>
#include <memory>
#include <ostream>
#include <string>
#include <utility>

#include "sntpserver/ntp_server.hpp"

namespace sntpserver {

const char* ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarning:
      return "WARN";
    case LogLevel::kError:
      return "ERROR";
  }
  return "UNKNOWN";
}

Options::Builder::Builder() {
  reference_source_ = Options::kDefaultReferenceSource;
  precision_ = Options::kDefaultPrecision;
  max_tracked_clients_ = Options::kDefaultMaxTrackedClients;
  client_retention_ = Options::kDefaultClientRetention;
  min_request_interval_ = Options::kDefaultMinRequestInterval;
  request_burst_ = Options::kDefaultRequestBurst;
}

Options::Builder& Options::Builder::ReferenceSource(const std::string& code) {
  reference_source_ = code.substr(0, 4);
  return *this;
}

Options::Builder& Options::Builder::Precision(int8_t v) {
  precision_ = v;
  return *this;
}

Options::Builder& Options::Builder::MaxTrackedClients(size_t v) {
  max_tracked_clients_ = v;
  return *this;
}

Options::Builder& Options::Builder::ClientRetention(
    std::chrono::steady_clock::duration v) {
  client_retention_ = v;
  return *this;
}

Options::Builder& Options::Builder::MinRequestInterval(
    std::chrono::steady_clock::duration v) {
  min_request_interval_ = v;
  return *this;
}

Options::Builder& Options::Builder::RequestBurst(uint32_t v) {
  request_burst_ = v == 0 ? 1 : v;
  return *this;
}

Options::Builder& Options::Builder::Randomness(
    std::shared_ptr<RandomSource> v) {
  random_ = std::move(v);
  return *this;
}

Options::Builder& Options::Builder::LogSink(LogCallback cb) {
  log_sink_cb_ = std::move(cb);
  return *this;
}

Options Options::Builder::Build() const {
  Options o;
  o.reference_source_ = reference_source_;
  o.precision_ = precision_;
  o.max_tracked_clients_ = max_tracked_clients_;
  o.client_retention_ = client_retention_;
  o.min_request_interval_ = min_request_interval_;
  o.request_burst_ = request_burst_;
  o.random_ = random_;
  o.log_callback_ = log_sink_cb_;
  return o;
}

Options::Options() {
  reference_source_ = kDefaultReferenceSource;
  precision_ = kDefaultPrecision;
  max_tracked_clients_ = kDefaultMaxTrackedClients;
  client_retention_ = kDefaultClientRetention;
  min_request_interval_ = kDefaultMinRequestInterval;
  request_burst_ = kDefaultRequestBurst;
}

const std::string& Options::ReferenceSource() const {
  return reference_source_;
}

int8_t Options::Precision() const { return precision_; }

size_t Options::MaxTrackedClients() const { return max_tracked_clients_; }

std::chrono::steady_clock::duration Options::ClientRetention() const {
  return client_retention_;
}

std::chrono::steady_clock::duration Options::MinRequestInterval() const {
  return min_request_interval_;
}

uint32_t Options::RequestBurst() const { return request_burst_; }

const std::shared_ptr<RandomSource>& Options::Randomness() const {
  return random_;
}

const Options::LogCallback& Options::LogSink() const { return log_callback_; }

std::ostream& operator<<(std::ostream& os, const Options& o) {
  using std::chrono::duration_cast;
  using std::chrono::milliseconds;
  using std::chrono::seconds;
  os << "ref=" << o.ReferenceSource()
     << " precision=" << static_cast<int>(o.Precision())
     << " max_clients=" << o.MaxTrackedClients() << " retention_s="
     << duration_cast<seconds>(o.ClientRetention()).count()
     << " min_interval_ms="
     << duration_cast<milliseconds>(o.MinRequestInterval()).count()
     << " burst=" << o.RequestBurst();
  return os;
}

}  // namespace sntpserver
