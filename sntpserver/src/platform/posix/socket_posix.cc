// Copyright (c) 2025
/**
 * @file socket_posix.cc
 * @brief POSIX (Linux/macOS) implementation of ISocket interface
 */
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include "sntpserver/platform/socket_interface.hpp"

namespace sntpserver {
namespace platform {

namespace {

/** Formats a peer address; IPv4-mapped IPv6 peers are shown as IPv4. */
std::string FormatAddress(const sockaddr_storage& addr) {
  char ip[INET6_ADDRSTRLEN] = {0};
  if (addr.ss_family == AF_INET) {
    const auto* in4 = reinterpret_cast<const sockaddr_in*>(&addr);
    if (inet_ntop(AF_INET, &in4->sin_addr, ip, sizeof(ip)) == nullptr) {
      return std::string();
    }
    return ip;
  }
  if (addr.ss_family == AF_INET6) {
    const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&addr);
    if (IN6_IS_ADDR_V4MAPPED(&in6->sin6_addr)) {
      in_addr in4{};
      std::memcpy(&in4, in6->sin6_addr.s6_addr + 12, sizeof(in4));
      if (inet_ntop(AF_INET, &in4, ip, sizeof(ip)) == nullptr) {
        return std::string();
      }
      return ip;
    }
    if (inet_ntop(AF_INET6, &in6->sin6_addr, ip, sizeof(ip)) == nullptr) {
      return std::string();
    }
    return ip;
  }
  return std::string();
}

uint16_t PortOf(const sockaddr_storage& addr) {
  if (addr.ss_family == AF_INET) {
    return ntohs(reinterpret_cast<const sockaddr_in*>(&addr)->sin_port);
  }
  if (addr.ss_family == AF_INET6) {
    return ntohs(reinterpret_cast<const sockaddr_in6*>(&addr)->sin6_port);
  }
  return 0;
}

}  // namespace

class SocketPosix : public ISocket {
 public:
  SocketPosix() : sock_(-1), family_(AF_UNSPEC) {}

  ~SocketPosix() override { Close(); }

  bool Bind(const std::string& address, uint16_t port) override {
    if (sock_ >= 0) {
      SetLastError("Socket already bound");
      return false;
    }

    sockaddr_storage addr{};
    socklen_t addrlen = 0;
    const bool any = address.empty();
    if (any) {
      // Dual-stack wildcard; falls back to IPv4 when IPv6 is unavailable.
      auto* in6 = reinterpret_cast<sockaddr_in6*>(&addr);
      in6->sin6_family = AF_INET6;
      in6->sin6_addr = in6addr_any;
      in6->sin6_port = htons(port);
      addrlen = sizeof(sockaddr_in6);
    } else if (!Resolve(address, port, &addr, &addrlen)) {
      return false;
    }

    if (!Open(addr.ss_family)) {
      if (!any || errno != EAFNOSUPPORT) return false;
      addr = sockaddr_storage{};
      auto* in4 = reinterpret_cast<sockaddr_in*>(&addr);
      in4->sin_family = AF_INET;
      in4->sin_addr.s_addr = htonl(INADDR_ANY);
      in4->sin_port = htons(port);
      addrlen = sizeof(sockaddr_in);
      if (!Open(AF_INET)) return false;
    }

    if (bind(sock_, reinterpret_cast<sockaddr*>(&addr), addrlen) < 0) {
      CaptureErrno("bind failed");
      Close();
      return false;
    }

    return true;
  }

  uint16_t LocalPort() const override {
    if (sock_ < 0) return 0;
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(sock_, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
      return 0;
    }
    return PortOf(addr);
  }

  WaitResult WaitReadable(int64_t timeout_us) override {
    if (sock_ < 0) {
      SetLastError("Socket not initialized");
      return WaitResult::kError;
    }

    pollfd pfd{};
    pfd.fd = sock_;
    pfd.events = POLLIN;

    // Convert microseconds to milliseconds
    int timeout_ms = static_cast<int>(timeout_us / 1000);

    int ready = poll(&pfd, 1, timeout_ms);

    if (ready < 0) {
      if (errno == EINTR) return WaitResult::kTimeout;
      CaptureErrno("poll failed");
      return WaitResult::kError;
    }
    if (ready == 0) return WaitResult::kTimeout;

    if ((pfd.revents & POLLIN) != 0) return WaitResult::kReadable;
    if ((pfd.revents & (POLLERR | POLLNVAL)) != 0) {
      SetLastError("poll reported socket error");
      return WaitResult::kError;
    }
    return WaitResult::kTimeout;
  }

  bool Receive(Endpoint* from, std::vector<uint8_t>* data,
               size_t max_size) override {
    if (sock_ < 0) {
      SetLastError("Socket not initialized");
      return false;
    }

    data->resize(max_size);
    sockaddr_storage addr{};
    socklen_t addrlen = sizeof(addr);

    ssize_t n = -1;
    do {
      addrlen = sizeof(addr);
      n = recvfrom(sock_, data->data(), max_size, 0,
                   reinterpret_cast<sockaddr*>(&addr), &addrlen);
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
      CaptureErrno("recvfrom failed");
      data->clear();
      return false;
    }

    // Resize to actual received size (0 is a valid empty datagram)
    data->resize(static_cast<size_t>(n));

    from->address = FormatAddress(addr);
    from->port = PortOf(addr);

    return true;
  }

  bool Send(const Endpoint& to, const std::vector<uint8_t>& data) override {
    if (sock_ < 0) {
      SetLastError("Socket not initialized");
      return false;
    }

    sockaddr_storage addr{};
    socklen_t addrlen = 0;
    if (!MakeDestination(to, &addr, &addrlen)) {
      SetLastError("Invalid IP address: " + to.address);
      return false;
    }

    ssize_t sent = sendto(sock_, data.data(), data.size(), 0,
                          reinterpret_cast<const sockaddr*>(&addr), addrlen);

    if (sent < 0) {
      CaptureErrno("sendto failed");
      return false;
    }

    if (sent != static_cast<ssize_t>(data.size())) {
      std::ostringstream oss;
      oss << "Partial send: sent " << sent << " of " << data.size() << " bytes";
      SetLastError(oss.str());
      return false;
    }

    return true;
  }

  void Close() override {
    if (sock_ >= 0) {
      close(sock_);
      sock_ = -1;
    }
  }

  std::string GetLastError() const override {
    std::lock_guard<std::mutex> lk(error_mtx_);
    return last_error_;
  }

 private:
  bool Open(int family) {
    sock_ = socket(family, SOCK_DGRAM, IPPROTO_UDP);
    if (sock_ < 0) {
      CaptureErrno("socket creation failed");
      return false;
    }
    family_ = family;
    if (family == AF_INET6) {
      // Accept IPv4 peers as IPv4-mapped addresses as well.
      int off = 0;
      if (setsockopt(sock_, IPPROTO_IPV6, IPV6_V6ONLY, &off, sizeof(off)) <
          0) {
        CaptureErrno("setsockopt(IPV6_V6ONLY) failed");
        Close();
        return false;
      }
    }
    return true;
  }

  bool Resolve(const std::string& host, uint16_t port, sockaddr_storage* out,
               socklen_t* outlen) {
    *out = sockaddr_storage{};
    auto* in4 = reinterpret_cast<sockaddr_in*>(out);
    if (inet_pton(AF_INET, host.c_str(), &in4->sin_addr) == 1) {
      in4->sin_family = AF_INET;
      in4->sin_port = htons(port);
      *outlen = sizeof(sockaddr_in);
      return true;
    }
    auto* in6 = reinterpret_cast<sockaddr_in6*>(out);
    if (inet_pton(AF_INET6, host.c_str(), &in6->sin6_addr) == 1) {
      in6->sin6_family = AF_INET6;
      in6->sin6_port = htons(port);
      *outlen = sizeof(sockaddr_in6);
      return true;
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_DGRAM;
    hints.ai_protocol = IPPROTO_UDP;
    addrinfo* res = nullptr;
    const int rc = getaddrinfo(host.c_str(), nullptr, &hints, &res);
    if (rc != 0 || res == nullptr ||
        res->ai_addrlen > static_cast<socklen_t>(sizeof(*out))) {
      std::ostringstream oss;
      oss << "resolve failed for '" << host << "' ("
          << (rc != 0 ? gai_strerror(rc) : "no address") << ")";
      SetLastError(oss.str());
      if (res != nullptr) freeaddrinfo(res);
      return false;
    }
    std::memcpy(out, res->ai_addr, res->ai_addrlen);
    *outlen = static_cast<socklen_t>(res->ai_addrlen);
    freeaddrinfo(res);
    if (out->ss_family == AF_INET) {
      in4->sin_port = htons(port);
    } else {
      in6->sin6_port = htons(port);
    }
    return true;
  }

  bool MakeDestination(const Endpoint& to, sockaddr_storage* out,
                       socklen_t* outlen) const {
    *out = sockaddr_storage{};
    in_addr v4{};
    const bool is_v4 = inet_pton(AF_INET, to.address.c_str(), &v4) == 1;
    if (family_ == AF_INET) {
      if (!is_v4) return false;
      auto* in4 = reinterpret_cast<sockaddr_in*>(out);
      in4->sin_family = AF_INET;
      in4->sin_addr = v4;
      in4->sin_port = htons(to.port);
      *outlen = sizeof(sockaddr_in);
      return true;
    }

    auto* in6 = reinterpret_cast<sockaddr_in6*>(out);
    in6->sin6_family = AF_INET6;
    in6->sin6_port = htons(to.port);
    *outlen = sizeof(sockaddr_in6);
    if (is_v4) {
      // ::ffff:a.b.c.d
      in6->sin6_addr.s6_addr[10] = 0xff;
      in6->sin6_addr.s6_addr[11] = 0xff;
      std::memcpy(in6->sin6_addr.s6_addr + 12, &v4, sizeof(v4));
      return true;
    }
    return inet_pton(AF_INET6, to.address.c_str(), &in6->sin6_addr) == 1;
  }

  void CaptureErrno(const std::string& context) {
    int err = errno;
    std::ostringstream oss;
    oss << context << " (errno " << err << ": " << std::strerror(err) << ")";
    SetLastError(oss.str());
    errno = err;
  }

  void SetLastError(const std::string& text) {
    std::lock_guard<std::mutex> lk(error_mtx_);
    last_error_ = text;
  }

  int sock_;
  int family_;
  mutable std::mutex error_mtx_;
  std::string last_error_;
};

// Factory function implementation for POSIX (Linux/macOS)
std::unique_ptr<ISocket> CreatePlatformSocket() {
  return std::unique_ptr<ISocket>(new SocketPosix());
}

}  // namespace platform
}  // namespace sntpserver
