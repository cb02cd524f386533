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
 */

/**
 * @file socket.hpp
 * @brief POSIX TCP socket RAII wrappers.
 *
 * TcpSocket is the client side used by the HTTP transport and by socket
 * correlation; TcpListener is the accepting side (used by tests and tools).
 * All errors are returned via hostlink::expected<V,E>.
 */

#ifndef HOSTLINK_SOCKET_HPP_
#define HOSTLINK_SOCKET_HPP_

#include "hostlink/platform.hpp"
#include "hostlink/vocabulary.hpp"

#if HOSTLINK_HAS_NETWORK

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace hostlink {

constexpr int32_t kDefaultBacklog = 16;

enum class SocketError : uint8_t {
  kInvalidFd = 0,
  kInvalidAddress,
  kResolveFailed,
  kBindFailed,
  kListenFailed,
  kConnectFailed,
  kTimeout,
  kSendFailed,
  kRecvFailed,
  kAcceptFailed,
  kSetOptFailed,
  kWouldBlock  ///< EAGAIN/EWOULDBLOCK, includes an expired SO_RCVTIMEO.
};

inline const char* SocketErrorToString(SocketError err) noexcept {
  switch (err) {
    case SocketError::kInvalidFd:      return "invalid fd";
    case SocketError::kInvalidAddress: return "invalid address";
    case SocketError::kResolveFailed:  return "resolve failed";
    case SocketError::kBindFailed:     return "bind failed";
    case SocketError::kListenFailed:   return "listen failed";
    case SocketError::kConnectFailed:  return "connect failed";
    case SocketError::kTimeout:        return "timeout";
    case SocketError::kSendFailed:     return "send failed";
    case SocketError::kRecvFailed:     return "recv failed";
    case SocketError::kAcceptFailed:   return "accept failed";
    case SocketError::kSetOptFailed:   return "setsockopt failed";
    case SocketError::kWouldBlock:     return "would block";
  }
  return "unknown";
}

namespace detail {

inline timeval MsToTimeval(uint32_t timeout_ms) noexcept {
  timeval tv;
  tv.tv_sec = static_cast<time_t>(timeout_ms / 1000U);
  tv.tv_usec = static_cast<suseconds_t>((timeout_ms % 1000U) * 1000U);
  return tv;
}

}  // namespace detail

// ============================================================================
// SocketAddress
// ============================================================================

/** @brief IPv4 socket address. */
class SocketAddress {
 public:
  SocketAddress() noexcept { std::memset(&addr_, 0, sizeof(addr_)); }

  /** @brief Dotted-quad literal only; kInvalidAddress otherwise. */
  static expected<SocketAddress, SocketError> FromIpv4(const char* ip,
                                                       uint16_t port) noexcept {
    SocketAddress sa;
    sa.addr_.sin_family = AF_INET;
    sa.addr_.sin_port = htons(port);
    if (ip == nullptr || ::inet_pton(AF_INET, ip, &sa.addr_.sin_addr) != 1) {
      return expected<SocketAddress, SocketError>::error(
          SocketError::kInvalidAddress);
    }
    return expected<SocketAddress, SocketError>::success(sa);
  }

  /**
   * @brief Resolve a host name or literal to its first IPv4 address.
   *
   * Blocks on getaddrinfo(); call from a worker thread.
   */
  static expected<SocketAddress, SocketError> Resolve(const char* host,
                                                      uint16_t port) noexcept {
    auto literal = FromIpv4(host, port);
    if (literal.has_value() || host == nullptr || host[0] == '\0') {
      return literal;
    }

    addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    if (::getaddrinfo(host, nullptr, &hints, &res) != 0 || res == nullptr) {
      return expected<SocketAddress, SocketError>::error(
          SocketError::kResolveFailed);
    }
    SocketAddress sa;
    std::memcpy(&sa.addr_, res->ai_addr, sizeof(sa.addr_));
    sa.addr_.sin_port = htons(port);
    ::freeaddrinfo(res);
    return expected<SocketAddress, SocketError>::success(sa);
  }

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  const sockaddr* Raw() const noexcept {
    return reinterpret_cast<const sockaddr*>(&addr_);
  }

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  sockaddr* RawMut() noexcept { return reinterpret_cast<sockaddr*>(&addr_); }

  socklen_t Size() const noexcept {
    return static_cast<socklen_t>(sizeof(addr_));
  }

  uint16_t Port() const noexcept { return ntohs(addr_.sin_port); }

 private:
  sockaddr_in addr_;
};

// ============================================================================
// TcpSocket
// ============================================================================

/**
 * @brief RAII TCP stream socket. Move-only; the fd is closed on destruction.
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
   * @brief Create a socket and connect within @p timeout_ms.
   *
   * Non-blocking connect, select() for writability, then SO_ERROR. The
   * returned socket is back in blocking mode.
   */
  static expected<TcpSocket, SocketError> ConnectTo(
      const SocketAddress& addr, uint32_t timeout_ms) noexcept {
    auto created = Create();
    if (!created.has_value()) {
      return created;
    }
    TcpSocket sock(static_cast<TcpSocket&&>(created.value()));

    int32_t flags = ::fcntl(sock.fd_, F_GETFL, 0);
    if (flags < 0 || ::fcntl(sock.fd_, F_SETFL, flags | O_NONBLOCK) < 0) {
      return expected<TcpSocket, SocketError>::error(
          SocketError::kSetOptFailed);
    }

    int32_t ret = ::connect(sock.fd_, addr.Raw(), addr.Size());
    if (ret < 0 && errno != EINPROGRESS) {
      return expected<TcpSocket, SocketError>::error(
          SocketError::kConnectFailed);
    }

    if (ret < 0) {
      fd_set write_fds;
      FD_ZERO(&write_fds);
      FD_SET(sock.fd_, &write_fds);
      timeval tv = detail::MsToTimeval(timeout_ms);
      do {
        ret = ::select(sock.fd_ + 1, nullptr, &write_fds, nullptr, &tv);
      } while (ret < 0 && errno == EINTR);
      if (ret == 0) {
        return expected<TcpSocket, SocketError>::error(SocketError::kTimeout);
      }
      if (ret < 0) {
        return expected<TcpSocket, SocketError>::error(
            SocketError::kConnectFailed);
      }

      int32_t so_error = 0;
      socklen_t len = static_cast<socklen_t>(sizeof(so_error));
      if (::getsockopt(sock.fd_, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 ||
          so_error != 0) {
        return expected<TcpSocket, SocketError>::error(
            SocketError::kConnectFailed);
      }
    }

    if (::fcntl(sock.fd_, F_SETFL, flags) < 0) {
      return expected<TcpSocket, SocketError>::error(
          SocketError::kSetOptFailed);
    }
    return expected<TcpSocket, SocketError>::success(
        static_cast<TcpSocket&&>(sock));
  }

  // Operations --------------------------------------------------------------

  /** @brief Send the whole buffer, retrying on EINTR and short writes. */
  expected<void, SocketError> SendAll(const void* data, size_t len) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    const uint8_t* ptr = static_cast<const uint8_t*>(data);
    size_t remaining = len;
    while (remaining > 0U) {
      ssize_t n = ::send(fd_, ptr, remaining, MSG_NOSIGNAL);
      if (n < 0) {
        if (errno == EINTR) {
          continue;
        }
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

  /** @return Bytes read; 0 means the peer closed the connection. */
  expected<int32_t, SocketError> Recv(void* buf, size_t len) noexcept {
    if (fd_ < 0) {
      return expected<int32_t, SocketError>::error(SocketError::kInvalidFd);
    }
    ssize_t n;
    do {
      n = ::recv(fd_, buf, len, 0);
    } while (n < 0 && errno == EINTR);
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return expected<int32_t, SocketError>::error(SocketError::kWouldBlock);
      }
      return expected<int32_t, SocketError>::error(SocketError::kRecvFailed);
    }
    return expected<int32_t, SocketError>::success(static_cast<int32_t>(n));
  }

  expected<void, SocketError> SetRecvTimeout(uint32_t timeout_ms) noexcept {
    return SetTimeout(SO_RCVTIMEO, timeout_ms);
  }

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
    timeval tv = detail::MsToTimeval(timeout_ms);
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

  static expected<TcpListener, SocketError> Create() noexcept {
    int32_t fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
      return expected<TcpListener, SocketError>::error(SocketError::kInvalidFd);
    }
    int32_t opt = 1;
    (void)::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt,
                       static_cast<socklen_t>(sizeof(opt)));
    return expected<TcpListener, SocketError>::success(TcpListener(fd));
  }

  expected<void, SocketError> Bind(const SocketAddress& addr) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    if (::bind(fd_, addr.Raw(), addr.Size()) < 0) {
      return expected<void, SocketError>::error(SocketError::kBindFailed);
    }
    return expected<void, SocketError>::success();
  }

  expected<void, SocketError> Listen(
      int32_t backlog = kDefaultBacklog) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    if (::listen(fd_, backlog) < 0) {
      return expected<void, SocketError>::error(SocketError::kListenFailed);
    }
    return expected<void, SocketError>::success();
  }

  expected<TcpSocket, SocketError> Accept() noexcept {
    if (fd_ < 0) {
      return expected<TcpSocket, SocketError>::error(SocketError::kInvalidFd);
    }
    int32_t client_fd;
    do {
      client_fd = ::accept(fd_, nullptr, nullptr);
    } while (client_fd < 0 && errno == EINTR);
    if (client_fd < 0) {
      return expected<TcpSocket, SocketError>::error(
          SocketError::kAcceptFailed);
    }
    return expected<TcpSocket, SocketError>::success(TcpSocket(client_fd));
  }

  /** @brief Bound port in host byte order (useful after binding port 0). */
  expected<uint16_t, SocketError> LocalPort() const noexcept {
    if (fd_ < 0) {
      return expected<uint16_t, SocketError>::error(SocketError::kInvalidFd);
    }
    SocketAddress sa;
    socklen_t len = sa.Size();
    if (::getsockname(fd_, sa.RawMut(), &len) < 0) {
      return expected<uint16_t, SocketError>::error(SocketError::kInvalidFd);
    }
    return expected<uint16_t, SocketError>::success(sa.Port());
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

}  // namespace hostlink

#endif  // HOSTLINK_HAS_NETWORK

#endif  // HOSTLINK_SOCKET_HPP_
