// Copyright (c) 2025 The SNTP Server Authors
/**
 * @file openssl_random_source.cc
 * @brief RandomSource implementation on top of OpenSSL RAND_bytes().
 */
#include <openssl/err.h>
#include <openssl/rand.h>

#include <climits>
#include <sstream>
#include <string>

#include "sntpserver/random_source.hpp"

namespace sntpserver {

namespace {
// OpenSSL keeps its error queue per thread; the text is kept the same way so
// a caller reads back the failure of its own Fill().
thread_local std::string g_last_error;
}  // namespace

bool OpenSslRandomSource::Fill(uint8_t* buf, size_t len) {
  if (len == 0) return true;
  if (buf == nullptr || len > static_cast<size_t>(INT_MAX)) {
    g_last_error = "invalid buffer";
    return false;
  }
  if (RAND_bytes(buf, static_cast<int>(len)) != 1) {
    const unsigned long err = ERR_get_error();
    char text[256];
    ERR_error_string_n(err, text, sizeof(text));
    std::ostringstream oss;
    oss << "RAND_bytes failed (err=" << err << ": " << text << ")";
    g_last_error = oss.str();
    return false;
  }
  return true;
}

std::string OpenSslRandomSource::GetLastError() const { return g_last_error; }

}  // namespace sntpserver
