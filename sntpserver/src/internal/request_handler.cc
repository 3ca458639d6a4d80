// Copyright (c) 2025 The SNTP Server Authors
/**
 * @file request_handler.cc
 * @brief Request validation, response assembly and transmit re-stamp.
 */
#include "internal/request_handler.hpp"

#include <sstream>

#include "sntpserver/ntp_types.hpp"

namespace sntpserver {
namespace internal {

namespace {

void SetError(std::string* error, const std::string& text) {
  if (error) *error = text;
}

}  // namespace

RequestHandler::Status RequestHandler::BuildResponse(
    const std::vector<uint8_t>& request, const TimeSpec& t_recv,
    std::vector<uint8_t>* out, std::string* error) const {
  NtpPacket req;
  if (!NtpPacket::Decode(request, &req)) {
    std::ostringstream oss;
    oss << "malformed request size=" << request.size();
    SetError(error, oss.str());
    return Status::kMalformed;
  }

  if (req.GetMode() != Mode::kClient ||
      req.GetVersion() != static_cast<uint8_t>(Version::kVersion4)) {
    std::ostringstream oss;
    oss << "invalid request mode=" << static_cast<int>(req.GetMode())
        << " version=" << static_cast<int>(req.GetVersion());
    SetError(error, oss.str());
    return Status::kInvalidRequest;
  }

  NtpPacket resp;
  resp.SetLeapIndicator(LeapIndicator::kNoAdjustment);
  resp.SetVersion(Version::kVersion4);
  resp.SetMode(Mode::kServer);
  resp.stratum = Stratum::kPrimary;
  resp.poll = req.poll;
  resp.precision = config_.precision;
  resp.SetExternalReferenceSource(config_.reference_source);
  // Echo the client's transmit timestamp untouched for its delay calculation.
  resp.orig_timestamp = req.tx_timestamp;

  if (!encoder_.Encode(time_source_->ReferenceTime(), &resp.ref_timestamp) ||
      !encoder_.Encode(t_recv, &resp.recv_timestamp)) {
    SetError(error, "timestamp encode failed: " +
                        encoder_.random()->GetLastError());
    return Status::kEncodeFailed;
  }

  *out = resp.Encode();
  return Status::kSent;
}

bool RequestHandler::StampTransmitTime(std::vector<uint8_t>* response,
                                       std::string* error) const {
  if (response == nullptr || response->size() < kNtpPacketSize) {
    SetError(error, "response buffer too short");
    return false;
  }
  uint64_t t_tx = 0;
  if (!encoder_.Encode(time_source_->NowUnix(), &t_tx)) {
    SetError(error, "timestamp encode failed: " +
                        encoder_.random()->GetLastError());
    return false;
  }
  StoreBe64(t_tx, response->data() + kTxTimestampOffset);
  return true;
}

RequestHandler::Status RequestHandler::Handle(
    const std::vector<uint8_t>& request, const TimeSpec& t_recv,
    const platform::Endpoint& to, platform::ISocket* socket,
    std::mutex* send_mtx, std::string* error) const {
  std::vector<uint8_t> resp;
  const Status st = BuildResponse(request, t_recv, &resp, error);
  if (st != Status::kSent) return st;

  if (!StampTransmitTime(&resp, error)) return Status::kEncodeFailed;
  std::lock_guard<std::mutex> lock(*send_mtx);
  if (!socket->Send(to, resp)) {
    SetError(error, "Send failed: " + socket->GetLastError());
    return Status::kSendFailed;
  }
  return Status::kSent;
}

}  // namespace internal
}  // namespace sntpserver
