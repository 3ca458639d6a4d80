// Copyright (c) 2025 The SNTP Server Authors
/**
 * @file ntp_types.cc
 * @brief NTP packet header accessors and big-endian encode/decode.
 */
#include "sntpserver/ntp_types.hpp"

#include <string>
#include <vector>

namespace sntpserver {

namespace {

constexpr uint8_t kLeapMask = 0xC0;
constexpr uint8_t kVersionMask = 0x38;
constexpr uint8_t kModeMask = 0x07;
constexpr int kLeapShift = 6;
constexpr int kVersionShift = 3;

uint32_t LoadBe32(const uint8_t* src) {
  return (static_cast<uint32_t>(src[0]) << 24) |
         (static_cast<uint32_t>(src[1]) << 16) |
         (static_cast<uint32_t>(src[2]) << 8) |
         (static_cast<uint32_t>(src[3]));
}

}  // namespace

void StoreBe64(uint64_t v, uint8_t* dst) {
  for (int i = 7; i >= 0; --i) {
    dst[i] = static_cast<uint8_t>(v & 0xffU);
    v >>= 8;
  }
}

uint64_t LoadBe64(const uint8_t* src) {
  return (static_cast<uint64_t>(LoadBe32(src)) << 32) |
         static_cast<uint64_t>(LoadBe32(src + 4));
}

uint32_t MakeRefId(const std::string& code) {
  uint32_t id = 0;
  for (size_t i = 0; i < 4; ++i) {
    const uint8_t c =
        i < code.size() ? static_cast<uint8_t>(code[i]) : uint8_t{0};
    id |= static_cast<uint32_t>(c) << (24 - 8 * i);
  }
  return id;
}

LeapIndicator NtpPacket::GetLeapIndicator() const {
  return static_cast<LeapIndicator>((li_vn_mode & kLeapMask) >> kLeapShift);
}

void NtpPacket::SetLeapIndicator(LeapIndicator leap) {
  li_vn_mode = static_cast<uint8_t>(
      (li_vn_mode & ~kLeapMask) |
      ((static_cast<uint8_t>(leap) << kLeapShift) & kLeapMask));
}

uint8_t NtpPacket::GetVersion() const {
  return static_cast<uint8_t>((li_vn_mode & kVersionMask) >> kVersionShift);
}

void NtpPacket::SetVersion(uint8_t version) {
  li_vn_mode = static_cast<uint8_t>(
      (li_vn_mode & ~kVersionMask) |
      (static_cast<uint8_t>(version & 0x07U) << kVersionShift));
}

Mode NtpPacket::GetMode() const {
  return static_cast<Mode>(li_vn_mode & kModeMask);
}

void NtpPacket::SetMode(Mode mode) {
  li_vn_mode = static_cast<uint8_t>((li_vn_mode & ~kModeMask) |
                                    (static_cast<uint8_t>(mode) & kModeMask));
}

void NtpPacket::SetExternalReferenceSource(const std::string& code) {
  ref_id = MakeRefId(code);
}

void NtpPacket::SetKissOfDeath(const std::string& code) {
  ref_id = MakeRefId(code);
}

std::string NtpPacket::ReferenceCode() const {
  std::string code;
  for (int shift = 24; shift >= 0; shift -= 8) {
    const char c = static_cast<char>((ref_id >> shift) & 0xffU);
    if (c == '\0') break;
    code.push_back(c);
  }
  return code;
}

std::vector<uint8_t> NtpPacket::Encode() const {
  std::vector<uint8_t> out;
  out.reserve(kNtpPacketSize);

  auto append_be32 = [&](uint32_t v) {
    out.push_back(static_cast<uint8_t>((v >> 24) & 0xffU));
    out.push_back(static_cast<uint8_t>((v >> 16) & 0xffU));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xffU));
    out.push_back(static_cast<uint8_t>(v & 0xffU));
  };
  auto append_be64 = [&](uint64_t v) {
    append_be32(static_cast<uint32_t>(v >> 32));
    append_be32(static_cast<uint32_t>(v & 0xFFFFFFFFULL));
  };

  out.push_back(li_vn_mode);
  out.push_back(stratum);
  out.push_back(static_cast<uint8_t>(poll));
  out.push_back(static_cast<uint8_t>(precision));
  append_be32(root_delay);
  append_be32(root_dispersion);
  append_be32(ref_id);
  append_be64(ref_timestamp);
  append_be64(orig_timestamp);
  append_be64(recv_timestamp);
  append_be64(tx_timestamp);
  return out;
}

bool NtpPacket::Decode(const uint8_t* data, size_t size, NtpPacket* out) {
  if (out == nullptr || data == nullptr) return false;
  if (size < kNtpPacketSize) return false;

  NtpPacket p;
  p.li_vn_mode = data[0];
  p.stratum = data[1];
  p.poll = static_cast<int8_t>(data[2]);
  p.precision = static_cast<int8_t>(data[3]);
  p.root_delay = LoadBe32(data + 4);
  p.root_dispersion = LoadBe32(data + 8);
  p.ref_id = LoadBe32(data + 12);
  p.ref_timestamp = LoadBe64(data + 16);
  p.orig_timestamp = LoadBe64(data + 24);
  p.recv_timestamp = LoadBe64(data + 32);
  p.tx_timestamp = LoadBe64(data + kTxTimestampOffset);

  *out = p;
  return true;
}

}  // namespace sntpserver
