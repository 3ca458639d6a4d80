// Copyright (c) 2025 The SNTP Server Authors
/**
 * @file random_source.hpp
 * @brief Cryptographically secure random byte source.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "sntpserver/export.hpp"

namespace sntpserver {

/**
 * Interface for random byte providers.
 * Implementations must be thread-safe.
 */
class RandomSource {
 public:
  virtual ~RandomSource() = default;

  /**
   * @brief Fills buf with len random bytes.
   * @return false if the generator could not produce the bytes.
   */
  virtual bool Fill(uint8_t* buf, size_t len) = 0;

  /** Returns a description of the last failure. */
  virtual std::string GetLastError() const { return std::string(); }
};

/**
 * @brief RandomSource backed by OpenSSL RAND_bytes (CSPRNG).
 */
class SNTP_SERVER_API OpenSslRandomSource : public RandomSource {
 public:
  bool Fill(uint8_t* buf, size_t len) override;
  std::string GetLastError() const override;
};

}  // namespace sntpserver
