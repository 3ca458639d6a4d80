// Copyright (c) 2025 The SNTP Server Authors
/**
 * @file ntp_types.hpp
 * @brief SNTP/NTPv4 protocol types and the 48-byte packet codec.
 *
 * Wire layout (RFC 4330 / RFC 5905, all fields big-endian):
 *
 *   offset  size  field
 *   0       1     LI (2 bits) | VN (3 bits) | Mode (3 bits)
 *   1       1     Stratum
 *   2       1     Poll (signed, log2 seconds)
 *   3       1     Precision (signed, log2 seconds)
 *   4       4     Root Delay (NTP short format)
 *   8       4     Root Dispersion (NTP short format)
 *   12      4     Reference ID
 *   16      8     Reference Timestamp
 *   24      8     Origin Timestamp
 *   32      8     Receive Timestamp
 *   40      8     Transmit Timestamp
 *
 * Extension fields and MACs are not supported; bytes past offset 48 are
 * ignored on decode.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "sntpserver/export.hpp"

namespace sntpserver {

/** @brief NTP epoch offset from UNIX epoch (seconds, 1900-01-01 vs 1970-01-01).
 */
constexpr uint32_t kNtpUnixEpochDiff = 2208988800UL;

/** @brief Size of the basic NTP header on the wire. */
constexpr size_t kNtpPacketSize = 48;

/** @brief Byte offset of the transmit timestamp inside the packet. */
constexpr size_t kTxTimestampOffset = 40;

/** Leap second warning carried in the top two header bits. */
enum class LeapIndicator : uint8_t {
  kNoAdjustment = 0,    ///< No leap second pending
  kAddSecond = 1,       ///< Last minute of the day has 61 seconds
  kSubtractSecond = 2,  ///< Last minute of the day has 59 seconds
  kAlarmCondition = 3,  ///< Clock unsynchronized
};

/** Protocol version numbers. */
enum class Version : uint8_t {
  kVersion1 = 1,
  kVersion2 = 2,
  kVersion3 = 3,
  kVersion4 = 4,
};

/** Association modes. */
enum class Mode : uint8_t {
  kReserved = 0,
  kSymmetricActive = 1,
  kSymmetricPassive = 2,
  kClient = 3,
  kServer = 4,
  kBroadcast = 5,
  kControlMessage = 6,
  kPrivate = 7,
};

/** Stratum levels. */
struct Stratum {
  static constexpr uint8_t kUnspecified = 0;
  static constexpr uint8_t kPrimary = 1;    ///< e.g. GPS, atomic clock
  static constexpr uint8_t kSecondary = 2;  ///< Synchronized via NTP
  static constexpr uint8_t kTertiary = 3;
  static constexpr uint8_t kReserved = 255;
};

/** Poll exponents (log2 seconds). */
struct PollInterval {
  static constexpr int8_t kMinimum = 4;   ///< 16 s
  static constexpr int8_t kDefault = 6;   ///< 64 s
  static constexpr int8_t kMaximum = 10;  ///< 1024 s
};

/** Clock precision exponents (log2 seconds). */
struct Precision {
  static constexpr int8_t kOneSecond = 0;
  static constexpr int8_t kOneMillisecond = -10;
  static constexpr int8_t kOneMicrosecond = -20;
  static constexpr int8_t kOneNanosecond = -30;
};

/** Reference identifiers used by stratum 1 servers. */
namespace refsource {
constexpr char kLocal[] = "LOCL";     ///< Uncalibrated local clock
constexpr char kCesium[] = "CESM";    ///< Calibrated cesium clock
constexpr char kRubidium[] = "RBDM";  ///< Calibrated rubidium clock
constexpr char kPulsePerSecond[] = "PPS";
constexpr char kIrig[] = "IRIG";   ///< Inter-Range Instrumentation Group
constexpr char kActs[] = "ACTS";   ///< NIST telephone modem service
constexpr char kUsno[] = "USNO";   ///< USNO telephone modem service
constexpr char kPtb[] = "PTB";     ///< PTB (Germany) modem service
constexpr char kTdf[] = "TDF";     ///< Allouis (France) radio 164 kHz
constexpr char kDcf[] = "DCF";     ///< Mainflingen (Germany) radio 77.5 kHz
constexpr char kMsf[] = "MSF";     ///< Rugby (UK) radio 60 kHz
constexpr char kWwv[] = "WWV";     ///< Ft. Collins (US) radio
constexpr char kWwvb[] = "WWVB";   ///< Boulder (US) radio 60 kHz
constexpr char kWwvh[] = "WWVH";   ///< Kauai Hawaii (US) radio
constexpr char kChu[] = "CHU";     ///< Ottawa (Canada) radio
constexpr char kLoran[] = "LORC";  ///< LORAN-C radionavigation
constexpr char kOmega[] = "OMEG";  ///< OMEGA radionavigation
constexpr char kGps[] = "GPS";     ///< Global Positioning Service
}  // namespace refsource

/** Kiss-of-death codes carried in the reference ID at stratum 0. */
namespace kisscode {
constexpr char kAnycast[] = "ACST";
constexpr char kAuthentication[] = "AUTH";
constexpr char kAutokey[] = "AUTO";
constexpr char kBroadcast[] = "BCST";
constexpr char kCryptographic[] = "CRYP";
constexpr char kDeny[] = "DENY";
constexpr char kLostPeer[] = "DROP";
constexpr char kLocalPolicy[] = "RSTR";
constexpr char kNotSynchronized[] = "INIT";
constexpr char kManycast[] = "MCST";
constexpr char kNoKeyFound[] = "NKEY";
constexpr char kRateExceeded[] = "RATE";
constexpr char kRemote[] = "RMOT";
constexpr char kStepNotSynchronized[] = "STEP";
}  // namespace kisscode

/**
 * @brief Packs up to four ASCII characters into a reference ID.
 *
 * Characters are left-justified and the remainder is zero-filled, so "PPS"
 * becomes 0x50505300.
 */
SNTP_SERVER_API uint32_t MakeRefId(const std::string& code);

/**
 * @brief NTPv4 basic packet (48 bytes on the wire).
 *
 * Fields are kept in host byte order; Encode()/Decode() perform the
 * big-endian conversion. The first header byte is only accessed through
 * the LI/VN/Mode accessors.
 */
struct SNTP_SERVER_API NtpPacket {
  uint8_t li_vn_mode = 0;       ///< Leap Indicator, Version, Mode
  uint8_t stratum = 0;          ///< Stratum level
  int8_t poll = 0;              ///< Poll interval (log2 seconds)
  int8_t precision = 0;         ///< Precision (log2 seconds)
  uint32_t root_delay = 0;      ///< Root delay (NTP short format)
  uint32_t root_dispersion = 0; ///< Root dispersion (NTP short format)
  uint32_t ref_id = 0;          ///< Reference ID
  uint64_t ref_timestamp = 0;   ///< Time the clock was last set or corrected
  uint64_t orig_timestamp = 0;  ///< Client time when the request departed
  uint64_t recv_timestamp = 0;  ///< Server time when the request arrived
  uint64_t tx_timestamp = 0;    ///< Server time when the response departed

  LeapIndicator GetLeapIndicator() const;
  void SetLeapIndicator(LeapIndicator leap);

  /** Returns the 3-bit version number (not range checked). */
  uint8_t GetVersion() const;
  void SetVersion(uint8_t version);
  void SetVersion(Version version) {
    SetVersion(static_cast<uint8_t>(version));
  }

  Mode GetMode() const;
  void SetMode(Mode mode);

  /** Sets the reference ID from a reference clock code (stratum 1). */
  void SetExternalReferenceSource(const std::string& code);

  /** Sets the reference ID from a kiss-of-death code (stratum 0). */
  void SetKissOfDeath(const std::string& code);

  /** Reference ID as ASCII with trailing zero bytes removed. */
  std::string ReferenceCode() const;

  /**
   * @brief Serialize into exactly kNtpPacketSize big-endian bytes.
   */
  std::vector<uint8_t> Encode() const;

  /**
   * @brief Parse a packet from raw bytes.
   * @param data Input bytes; only the first kNtpPacketSize are read.
   * @param size Number of bytes available at data.
   * @param out Parsed packet on success; untouched on failure.
   * @return false when fewer than kNtpPacketSize bytes are available.
   */
  static bool Decode(const uint8_t* data, size_t size, NtpPacket* out);
  static bool Decode(const std::vector<uint8_t>& bytes, NtpPacket* out) {
    return Decode(bytes.data(), bytes.size(), out);
  }
};

inline bool operator==(const NtpPacket& a, const NtpPacket& b) {
  return a.li_vn_mode == b.li_vn_mode && a.stratum == b.stratum &&
         a.poll == b.poll && a.precision == b.precision &&
         a.root_delay == b.root_delay &&
         a.root_dispersion == b.root_dispersion && a.ref_id == b.ref_id &&
         a.ref_timestamp == b.ref_timestamp &&
         a.orig_timestamp == b.orig_timestamp &&
         a.recv_timestamp == b.recv_timestamp &&
         a.tx_timestamp == b.tx_timestamp;
}

inline bool operator!=(const NtpPacket& a, const NtpPacket& b) {
  return !(a == b);
}

/** Writes v big-endian into dst[0..7]. */
void StoreBe64(uint64_t v, uint8_t* dst);

/** Reads a big-endian 64-bit value from src[0..7]. */
uint64_t LoadBe64(const uint8_t* src);

}  // namespace sntpserver
