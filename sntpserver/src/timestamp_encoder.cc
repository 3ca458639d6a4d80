// Copyright (c) 2025 The SNTP Server Authors
#include "sntpserver/timestamp_encoder.hpp"

#include <memory>
#include <utility>

namespace sntpserver {

TimestampEncoder::TimestampEncoder(std::shared_ptr<RandomSource> random)
    : random_(std::move(random)) {
  if (!random_) random_ = std::make_shared<OpenSslRandomSource>();
}

bool TimestampEncoder::Encode(const TimeSpec& t, uint64_t* out) const {
  if (out == nullptr) return false;

  uint8_t rnd[2] = {0, 0};
  if (!random_->Fill(rnd, sizeof(rnd))) return false;
  const uint64_t nonce =
      ((static_cast<uint64_t>(rnd[0]) << 8) | rnd[1]) & kNonceMask;

  *out = (t.ToNtpTimestamp() & ~kNonceMask) | nonce;
  return true;
}

}  // namespace sntpserver
