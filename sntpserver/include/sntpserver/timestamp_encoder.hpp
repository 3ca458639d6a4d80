// Copyright (c) 2025 The SNTP Server Authors
/**
 * @file timestamp_encoder.hpp
 * @brief Converts wall-clock instants into nonce-carrying NTP timestamps.
 */
#pragma once

#include <cstdint>
#include <memory>

#include "sntpserver/export.hpp"
#include "sntpserver/random_source.hpp"
#include "sntpserver/time_spec.hpp"

namespace sntpserver {

/**
 * @brief Builds 64-bit NTP timestamps for outgoing packets.
 *
 * The low 12 bits of the fraction (about 244 ns of a ~1 us clock) carry no
 * useful precision and are replaced with fresh random bits on every call.
 * An off-path attacker can then no longer predict the server timestamps
 * echoed back by clients.
 */
class SNTP_SERVER_API TimestampEncoder {
 public:
  static constexpr uint64_t kNonceBits = 12;
  static constexpr uint64_t kNonceMask = (1ULL << kNonceBits) - 1;

  /** Creates an OpenSslRandomSource when random is nullptr. */
  explicit TimestampEncoder(std::shared_ptr<RandomSource> random = nullptr);

  /**
   * @brief Encodes t as an NTP timestamp with a random low-order nonce.
   * @param t Instant to encode (UNIX epoch).
   * @param out Encoded timestamp (host order); untouched on failure.
   * @return false if the random source failed.
   */
  bool Encode(const TimeSpec& t, uint64_t* out) const;

  const std::shared_ptr<RandomSource>& random() const { return random_; }

 private:
  std::shared_ptr<RandomSource> random_;
};

}  // namespace sntpserver
