/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.

/**
 * @file socket.hpp
 * @brief POSIX TCP socket RAII wrappers used by the proxy, its clients and
 *        the worker endpoint.
 *
 * TcpSocket and TcpListener own their fd. SocketAddress wraps sockaddr_in
 * and parses "host:port" strings. All errors are returned via
 * ppx::expected<V,E>.
 */

#ifndef PPX_SOCKET_HPP_
#define PPX_SOCKET_HPP_

#include "ppx/platform.hpp"
#include "ppx/vocabulary.hpp"

#if PPX_HAS_NETWORK

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace ppx {

// ============================================================================
// Constants
// ============================================================================

constexpr int32_t kDefaultBacklog = 128;

/// "255.255.255.255:65535" plus terminator.
constexpr uint32_t kAddressStringSize = 22;

// ============================================================================
// SocketError
// ============================================================================

enum class SocketError : uint8_t {
  kInvalidFd = 0,
  kInvalidAddress,
  kBindFailed,
  kListenFailed,
  kConnectFailed,
  kSendFailed,
  kRecvFailed,
  kAcceptFailed,
  kSetOptFailed,
  kTimeout,        ///< Connect or I/O deadline expired.
  kPeerClosed      ///< Orderly EOF before the requested length arrived.
};

inline const char* SocketErrorToString(SocketError e) noexcept {
  switch (e) {
    case SocketError::kInvalidFd:
      return "invalid fd";
    case SocketError::kInvalidAddress:
      return "invalid address";
    case SocketError::kBindFailed:
      return "bind failed";
    case SocketError::kListenFailed:
      return "listen failed";
    case SocketError::kConnectFailed:
      return "connect failed";
    case SocketError::kSendFailed:
      return "send failed";
    case SocketError::kRecvFailed:
      return "recv failed";
    case SocketError::kAcceptFailed:
      return "accept failed";
    case SocketError::kSetOptFailed:
      return "setsockopt failed";
    case SocketError::kTimeout:
      return "timeout";
    case SocketError::kPeerClosed:
      return "peer closed";
  }
  return "unknown";
}

// ============================================================================
// SocketAddress
// ============================================================================

/**
 * @brief IPv4 socket address.
 *
 * Parse() accepts "a.b.c.d:port", "hostname:port" (IPv4 resolution) and
 * ":port" / "*:port" for the wildcard address.
 */
class SocketAddress {
 public:
  SocketAddress() noexcept { std::memset(&addr_, 0, sizeof(addr_)); }

  static expected<SocketAddress, SocketError> FromIpv4(const char* ip,
                                                       uint16_t port) noexcept {
    SocketAddress sa;
    sa.addr_.sin_family = AF_INET;
    sa.addr_.sin_port = htons(port);
    if (::inet_pton(AF_INET, ip, &sa.addr_.sin_addr) != 1) {
      return expected<SocketAddress, SocketError>::error(
          SocketError::kInvalidAddress);
    }
    return expected<SocketAddress, SocketError>::success(sa);
  }

  static SocketAddress Any(uint16_t port) noexcept {
    SocketAddress sa;
    sa.addr_.sin_family = AF_INET;
    sa.addr_.sin_port = htons(port);
    sa.addr_.sin_addr.s_addr = htonl(INADDR_ANY);
    return sa;
  }

  static expected<SocketAddress, SocketError> Parse(const char* text) noexcept {
    if (text == nullptr) {
      return expected<SocketAddress, SocketError>::error(
          SocketError::kInvalidAddress);
    }
    const char* colon = std::strrchr(text, ':');
    if (colon == nullptr || colon[1] == '\0') {
      return expected<SocketAddress, SocketError>::error(
          SocketError::kInvalidAddress);
    }
    char* end = nullptr;
    unsigned long port = std::strtoul(colon + 1, &end, 10);
    if (*end != '\0' || port > 65535UL) {
      return expected<SocketAddress, SocketError>::error(
          SocketError::kInvalidAddress);
    }

    const size_t host_len = static_cast<size_t>(colon - text);
    char host[256];
    if (host_len >= sizeof(host)) {
      return expected<SocketAddress, SocketError>::error(
          SocketError::kInvalidAddress);
    }
    std::memcpy(host, text, host_len);
    host[host_len] = '\0';

    if (host_len == 0U || std::strcmp(host, "*") == 0) {
      return expected<SocketAddress, SocketError>::success(
          Any(static_cast<uint16_t>(port)));
    }
    auto numeric = FromIpv4(host, static_cast<uint16_t>(port));
    if (numeric.has_value()) return numeric;
    return Resolve(host, static_cast<uint16_t>(port));
  }

  const sockaddr* Raw() const noexcept {
    return reinterpret_cast<const sockaddr*>(&addr_);
  }

  sockaddr* RawMut() noexcept { return reinterpret_cast<sockaddr*>(&addr_); }

  socklen_t Size() const noexcept {
    return static_cast<socklen_t>(sizeof(addr_));
  }

  uint16_t Port() const noexcept { return ntohs(addr_.sin_port); }

  /// @brief IPv4 address in host byte order.
  uint32_t Ipv4() const noexcept { return ntohl(addr_.sin_addr.s_addr); }

  /// @brief Format as "a.b.c.d:port" into buf (kAddressStringSize bytes).
  void ToString(char* buf, size_t size) const noexcept {
    char ip[INET_ADDRSTRLEN] = {};
    (void)::inet_ntop(AF_INET, &addr_.sin_addr, ip, sizeof(ip));
    (void)std::snprintf(buf, size, "%s:%u", ip, static_cast<unsigned>(Port()));
  }

 private:
  static expected<SocketAddress, SocketError> Resolve(const char* host,
                                                      uint16_t port) noexcept {
    addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    if (::getaddrinfo(host, nullptr, &hints, &res) != 0 || res == nullptr) {
      return expected<SocketAddress, SocketError>::error(
          SocketError::kInvalidAddress);
    }
    SocketAddress sa;
    std::memcpy(&sa.addr_, res->ai_addr, sizeof(sa.addr_));
    sa.addr_.sin_port = htons(port);
    ::freeaddrinfo(res);
    return expected<SocketAddress, SocketError>::success(sa);
  }

  sockaddr_in addr_;
};

// ============================================================================
// TcpSocket
// ============================================================================

/**
 * @brief RAII TCP stream socket. Movable, not copyable.
 */
class TcpSocket {
 public:
  TcpSocket() noexcept : fd_(-1) {}

  ~TcpSocket() { Close(); }

  TcpSocket(TcpSocket&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

  TcpSocket& operator=(TcpSocket&& other) noexcept {
    if (this != &other) {
      Close();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  TcpSocket(const TcpSocket&) = delete;
  TcpSocket& operator=(const TcpSocket&) = delete;

  static expected<TcpSocket, SocketError> Create() noexcept {
    int32_t fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
      return expected<TcpSocket, SocketError>::error(SocketError::kInvalidFd);
    }
    return expected<TcpSocket, SocketError>::success(TcpSocket(fd));
  }

  /**
   * @brief Create a socket and connect it within timeout_ms.
   *
   * The connect runs non-blocking and is awaited with poll(2); the socket
   * is returned in blocking mode with TCP_NODELAY set.
   */
  static expected<TcpSocket, SocketError> ConnectTo(const SocketAddress& addr,
                                                    uint32_t timeout_ms) noexcept {
    auto created = Create();
    if (!created.has_value()) return created;
    TcpSocket sock = std::move(created.value());

    int32_t flags = ::fcntl(sock.fd_, F_GETFL, 0);
    if (flags < 0 || ::fcntl(sock.fd_, F_SETFL, flags | O_NONBLOCK) < 0) {
      return expected<TcpSocket, SocketError>::error(SocketError::kSetOptFailed);
    }

    int32_t ret = ::connect(sock.fd_, addr.Raw(), addr.Size());
    if (ret < 0 && errno != EINPROGRESS) {
      return expected<TcpSocket, SocketError>::error(
          SocketError::kConnectFailed);
    }
    if (ret < 0) {
      pollfd pfd{sock.fd_, POLLOUT, 0};
      do {
        ret = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
      } while (ret < 0 && errno == EINTR);
      if (ret == 0) {
        return expected<TcpSocket, SocketError>::error(SocketError::kTimeout);
      }
      if (ret < 0) {
        return expected<TcpSocket, SocketError>::error(
            SocketError::kConnectFailed);
      }
      int32_t so_error = 0;
      socklen_t len = sizeof(so_error);
      if (::getsockopt(sock.fd_, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 ||
          so_error != 0) {
        return expected<TcpSocket, SocketError>::error(
            SocketError::kConnectFailed);
      }
    }

    if (::fcntl(sock.fd_, F_SETFL, flags) < 0) {
      return expected<TcpSocket, SocketError>::error(SocketError::kSetOptFailed);
    }
    (void)sock.SetNoDelay(true);
    return expected<TcpSocket, SocketError>::success(std::move(sock));
  }

  // Full-length I/O ----------------------------------------------------------

  /// @brief Send exactly len bytes. Retries on EINTR, never raises SIGPIPE.
  expected<void, SocketError> SendAll(const void* data, size_t len) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    const uint8_t* ptr = static_cast<const uint8_t*>(data);
    size_t remaining = len;
    while (remaining > 0U) {
      ssize_t n = ::send(fd_, ptr, remaining, MSG_NOSIGNAL);
      if (n < 0) {
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
          return expected<void, SocketError>::error(SocketError::kTimeout);
        }
        return expected<void, SocketError>::error(SocketError::kSendFailed);
      }
      ptr += n;
      remaining -= static_cast<size_t>(n);
    }
    return expected<void, SocketError>::success();
  }

  /// @brief Receive exactly len bytes. EOF before that is kPeerClosed.
  expected<void, SocketError> RecvAll(void* buf, size_t len) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    uint8_t* ptr = static_cast<uint8_t*>(buf);
    size_t remaining = len;
    while (remaining > 0U) {
      ssize_t n = ::recv(fd_, ptr, remaining, 0);
      if (n < 0) {
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
          return expected<void, SocketError>::error(SocketError::kTimeout);
        }
        return expected<void, SocketError>::error(SocketError::kRecvFailed);
      }
      if (n == 0) {
        return expected<void, SocketError>::error(SocketError::kPeerClosed);
      }
      ptr += n;
      remaining -= static_cast<size_t>(n);
    }
    return expected<void, SocketError>::success();
  }

  // Options ------------------------------------------------------------------

  /// @brief SO_RCVTIMEO. Zero disables the timeout.
  expected<void, SocketError> SetRecvTimeout(uint32_t timeout_ms) noexcept {
    return SetTimeout(SO_RCVTIMEO, timeout_ms);
  }

  /// @brief SO_SNDTIMEO. Zero disables the timeout.
  expected<void, SocketError> SetSendTimeout(uint32_t timeout_ms) noexcept {
    return SetTimeout(SO_SNDTIMEO, timeout_ms);
  }

  expected<void, SocketError> SetNoDelay(bool enable) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    int32_t opt = enable ? 1 : 0;
    if (::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &opt,
                     static_cast<socklen_t>(sizeof(opt))) < 0) {
      return expected<void, SocketError>::error(SocketError::kSetOptFailed);
    }
    return expected<void, SocketError>::success();
  }

  /// @brief shutdown(2) both directions; wakes a thread blocked in recv.
  void Shutdown() noexcept {
    if (fd_ >= 0) {
      (void)::shutdown(fd_, SHUT_RDWR);
    }
  }

  /** @brief Close the socket. Idempotent. */
  void Close() noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  int32_t Fd() const noexcept { return fd_; }
  bool IsValid() const noexcept { return fd_ >= 0; }

 private:
  friend class TcpListener;

  explicit TcpSocket(int32_t fd) noexcept : fd_(fd) {}

  expected<void, SocketError> SetTimeout(int32_t opt,
                                         uint32_t timeout_ms) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout_ms / 1000U);
    tv.tv_usec = static_cast<suseconds_t>((timeout_ms % 1000U) * 1000U);
    if (::setsockopt(fd_, SOL_SOCKET, opt, &tv,
                     static_cast<socklen_t>(sizeof(tv))) < 0) {
      return expected<void, SocketError>::error(SocketError::kSetOptFailed);
    }
    return expected<void, SocketError>::success();
  }

  int32_t fd_;
};

// ============================================================================
// TcpListener
// ============================================================================

/**
 * @brief RAII TCP listener socket.
 */
class TcpListener {
 public:
  TcpListener() noexcept : fd_(-1) {}

  ~TcpListener() { Close(); }

  TcpListener(TcpListener&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
  }

  TcpListener& operator=(TcpListener&& other) noexcept {
    if (this != &other) {
      Close();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  TcpListener(const TcpListener&) = delete;
  TcpListener& operator=(const TcpListener&) = delete;

  /**
   * @brief Create, bind (SO_REUSEADDR) and listen in one step.
   * @param addr Bind address; port 0 lets the OS pick (see LocalPort()).
   */
  static expected<TcpListener, SocketError> Bind(
      const SocketAddress& addr, int32_t backlog = kDefaultBacklog) noexcept {
    int32_t fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
      return expected<TcpListener, SocketError>::error(SocketError::kInvalidFd);
    }
    TcpListener listener(fd);
    int32_t opt = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt,
                     static_cast<socklen_t>(sizeof(opt))) < 0) {
      return expected<TcpListener, SocketError>::error(
          SocketError::kSetOptFailed);
    }
    if (::bind(fd, addr.Raw(), addr.Size()) < 0) {
      return expected<TcpListener, SocketError>::error(SocketError::kBindFailed);
    }
    if (::listen(fd, backlog) < 0) {
      return expected<TcpListener, SocketError>::error(
          SocketError::kListenFailed);
    }
    return expected<TcpListener, SocketError>::success(std::move(listener));
  }

  /**
   * @brief Accept an incoming connection and fill the peer address.
   */
  expected<TcpSocket, SocketError> Accept(SocketAddress& peer) noexcept {
    if (fd_ < 0) {
      return expected<TcpSocket, SocketError>::error(SocketError::kInvalidFd);
    }
    socklen_t addr_len = peer.Size();
    int32_t client_fd;
    do {
      client_fd = ::accept(fd_, peer.RawMut(), &addr_len);
    } while (client_fd < 0 && errno == EINTR);
    if (client_fd < 0) {
      return expected<TcpSocket, SocketError>::error(SocketError::kAcceptFailed);
    }
    return expected<TcpSocket, SocketError>::success(TcpSocket(client_fd));
  }

  /// @brief Bound port, useful after binding port 0.
  uint16_t LocalPort() const noexcept {
    if (fd_ < 0) return 0;
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
      return 0;
    }
    return ntohs(addr.sin_port);
  }

  /// @brief Unblock a thread waiting in Accept().
  void Shutdown() noexcept {
    if (fd_ >= 0) {
      (void)::shutdown(fd_, SHUT_RDWR);
    }
  }

  void Close() noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  int32_t Fd() const noexcept { return fd_; }
  bool IsValid() const noexcept { return fd_ >= 0; }

 private:
  explicit TcpListener(int32_t fd) noexcept : fd_(fd) {}

  int32_t fd_;
};

}  // namespace ppx

#endif  // PPX_HAS_NETWORK

#endif  // PPX_SOCKET_HPP_
