// Copyright (c) 2025 The SNTP Server Authors
/**
 * @file request_handler.hpp
 * @brief Turns one SNTP client request into a server response.
 */
#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "sntpserver/platform/socket_interface.hpp"
#include "sntpserver/time_source.hpp"
#include "sntpserver/time_spec.hpp"
#include "sntpserver/timestamp_encoder.hpp"

namespace sntpserver {
namespace internal {

/**
 * @brief Stateless request -> response transformation.
 *
 * A single instance is shared by all in-flight handler threads; it holds
 * only immutable configuration and shared ownership of thread-safe
 * collaborators.
 */
class RequestHandler {
 public:
  enum class Status {
    kSent,            ///< Response transmitted
    kMalformed,       ///< Request could not be decoded
    kInvalidRequest,  ///< Not a mode 3 / version 4 request
    kEncodeFailed,    ///< Timestamp nonce could not be generated
    kSendFailed,      ///< Socket rejected the response
  };

  struct Config {
    std::string reference_source;
    int8_t precision = 0;
  };

  RequestHandler(std::shared_ptr<TimeSource> time_source,
                 const TimestampEncoder& encoder, const Config& config)
      : time_source_(std::move(time_source)),
        encoder_(encoder),
        config_(config) {}

  /**
   * @brief Builds the encoded response, transmit timestamp left zero.
   * @param request Raw request bytes (one packet).
   * @param t_recv Arrival time of the request.
   * @param out Encoded response (kNtpPacketSize bytes) on success.
   * @param error Reason on failure.
   */
  Status BuildResponse(const std::vector<uint8_t>& request,
                       const TimeSpec& t_recv, std::vector<uint8_t>* out,
                       std::string* error) const;

  /**
   * @brief Overwrites the transmit timestamp of an encoded response with
   *        the current time.
   */
  bool StampTransmitTime(std::vector<uint8_t>* response,
                         std::string* error) const;

  /**
   * @brief Builds the response and sends it to the requester.
   *
   * The transmit timestamp is written immediately before send_mtx is
   * taken; only the socket write is serialized.
   */
  Status Handle(const std::vector<uint8_t>& request, const TimeSpec& t_recv,
                const platform::Endpoint& to, platform::ISocket* socket,
                std::mutex* send_mtx, std::string* error) const;

 private:
  std::shared_ptr<TimeSource> time_source_;
  TimestampEncoder encoder_;
  Config config_;
};

}  // namespace internal
}  // namespace sntpserver
