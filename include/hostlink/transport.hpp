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
 * @file transport.hpp
 * @brief Request/response transport towards the host agent.
 *
 * AgentTransport is the seam the link state machine talks through; tests
 * substitute fakes. HttpTransport is the production implementation: one
 * HTTP/1.1 request per connection ("Connection: close") over TcpSocket, with
 * connect and receive timeouts. A non-2xx status is reported as
 * TransportError::kBadStatus.
 */

#ifndef HOSTLINK_TRANSPORT_HPP_
#define HOSTLINK_TRANSPORT_HPP_

#include "hostlink/log.hpp"
#include "hostlink/platform.hpp"
#include "hostlink/socket.hpp"
#include "hostlink/vocabulary.hpp"

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>

#include <strings.h>
#include <vector>

namespace hostlink {

enum class TransportError : uint8_t {
  kInvalidUrl = 0,
  kResolveFailed,
  kConnectFailed,
  kTimeout,
  kSendFailed,
  kRecvFailed,
  kMalformedResponse,
  kBadStatus,
};

inline const char* TransportErrorToString(TransportError err) noexcept {
  switch (err) {
    case TransportError::kInvalidUrl:        return "invalid url";
    case TransportError::kResolveFailed:     return "resolve failed";
    case TransportError::kConnectFailed:     return "connect failed";
    case TransportError::kTimeout:           return "timeout";
    case TransportError::kSendFailed:        return "send failed";
    case TransportError::kRecvFailed:        return "recv failed";
    case TransportError::kMalformedResponse: return "malformed response";
    case TransportError::kBadStatus:         return "bad status";
  }
  return "unknown";
}

struct HttpReply {
  int32_t status = 0;
  std::string body;
};

// ============================================================================
// AgentTransport
// ============================================================================

class AgentTransport {
 public:
  virtual ~AgentTransport() = default;

  /** @brief Send @p method to @p url and return the value of @p header_name. */
  virtual expected<std::string, TransportError> HeaderProbe(
      const std::string& url, const char* method, const char* header_name) = 0;

  /** @brief Send @p payload with @p method and return the 2xx reply. */
  virtual expected<HttpReply, TransportError> Exchange(
      const std::string& url, const char* method,
      const std::string& payload) = 0;

  /** @brief HEAD @p url; success means a 2xx status. */
  virtual expected<void, TransportError> HeadProbe(const std::string& url) = 0;
};

/** @brief "http://host:port/path". */
inline std::string BuildUrl(const char* host, uint16_t port,
                            const char* path) {
  std::string url("http://");
  url += host;
  url += ':';
  url += std::to_string(port);
  if (path == nullptr || path[0] != '/') {
    url += '/';
  }
  if (path != nullptr) {
    url += path;
  }
  return url;
}

// ============================================================================
// URL / Response Parsing
// ============================================================================

struct UrlParts {
  std::string host;
  uint16_t port = 80;
  std::string path;
};

/** @brief Split an "http://host[:port][/path]" URL. */
inline expected<UrlParts, TransportError> ParseUrl(const std::string& url) {
  static constexpr char kScheme[] = "http://";
  static constexpr size_t kSchemeLen = sizeof(kScheme) - 1U;
  if (url.compare(0, kSchemeLen, kScheme) != 0) {
    return expected<UrlParts, TransportError>::error(TransportError::kInvalidUrl);
  }

  UrlParts parts;
  const size_t path_pos = url.find('/', kSchemeLen);
  std::string authority = url.substr(
      kSchemeLen,
      path_pos == std::string::npos ? std::string::npos : path_pos - kSchemeLen);
  parts.path = (path_pos == std::string::npos) ? "/" : url.substr(path_pos);

  const size_t colon = authority.rfind(':');
  if (colon != std::string::npos) {
    const std::string port_str = authority.substr(colon + 1U);
    char* end = nullptr;
    const long port = std::strtol(port_str.c_str(), &end, 10);
    if (port_str.empty() || end == nullptr || *end != '\0' || port <= 0 ||
        port > 65535) {
      return expected<UrlParts, TransportError>::error(
          TransportError::kInvalidUrl);
    }
    parts.port = static_cast<uint16_t>(port);
    authority.resize(colon);
  }
  if (authority.empty() || authority[0] == '[') {
    return expected<UrlParts, TransportError>::error(TransportError::kInvalidUrl);
  }
  parts.host = authority;
  return expected<UrlParts, TransportError>::success(
      static_cast<UrlParts&&>(parts));
}

struct HttpResponse {
  int32_t status = 0;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;

  /** @brief Case-insensitive header lookup; nullptr if absent. */
  const std::string* FindHeader(const char* name) const noexcept {
    for (const auto& h : headers) {
      if (h.first.size() == std::strlen(name) &&
          ::strncasecmp(h.first.c_str(), name, h.first.size()) == 0) {
        return &h.second;
      }
    }
    return nullptr;
  }
};

namespace detail {

inline std::string Trim(const std::string& s) {
  size_t b = 0U;
  size_t e = s.size();
  while (b < e && (s[b] == ' ' || s[b] == '\t')) {
    ++b;
  }
  while (e > b && (s[e - 1U] == ' ' || s[e - 1U] == '\t' || s[e - 1U] == '\r')) {
    --e;
  }
  return s.substr(b, e - b);
}

/** @return false on a malformed or incomplete chunk stream. */
inline bool DecodeChunked(const std::string& in, std::string& out) {
  size_t pos = 0U;
  for (;;) {
    const size_t eol = in.find("\r\n", pos);
    if (eol == std::string::npos) {
      return false;
    }
    char* end = nullptr;
    const std::string size_line = in.substr(pos, eol - pos);
    const unsigned long chunk = std::strtoul(size_line.c_str(), &end, 16);
    if (end == size_line.c_str()) {
      return false;
    }
    pos = eol + 2U;
    if (chunk == 0UL) {
      return true;
    }
    if (pos + chunk + 2U > in.size() ||
        in.compare(pos + chunk, 2U, "\r\n") != 0) {
      return false;
    }
    out.append(in, pos, chunk);
    pos += chunk + 2U;  // data + CRLF
  }
}

}  // namespace detail

/**
 * @brief Parse a complete raw HTTP/1.x response.
 *
 * Handles Content-Length, chunked transfer encoding and read-to-close
 * bodies. For HEAD requests the body is ignored.
 */
inline expected<HttpResponse, TransportError> ParseHttpResponse(
    const std::string& raw, bool head_request) {
  using Result = expected<HttpResponse, TransportError>;
  const size_t header_end = raw.find("\r\n\r\n");
  if (header_end == std::string::npos || raw.compare(0, 5, "HTTP/") != 0) {
    return Result::error(TransportError::kMalformedResponse);
  }

  HttpResponse resp;
  size_t line_end = raw.find("\r\n");
  const std::string status_line = raw.substr(0, line_end);
  const size_t sp = status_line.find(' ');
  if (sp == std::string::npos || sp + 4U > status_line.size()) {
    return Result::error(TransportError::kMalformedResponse);
  }
  char* end = nullptr;
  const std::string code = status_line.substr(sp + 1U, 3U);
  const long status = std::strtol(code.c_str(), &end, 10);
  if (end == nullptr || *end != '\0' || status < 100 || status > 599) {
    return Result::error(TransportError::kMalformedResponse);
  }
  resp.status = static_cast<int32_t>(status);

  size_t pos = line_end + 2U;
  while (pos < header_end + 2U) {
    line_end = raw.find("\r\n", pos);
    const std::string line = raw.substr(pos, line_end - pos);
    pos = line_end + 2U;
    if (line.empty()) {
      break;
    }
    const size_t colon = line.find(':');
    if (colon == std::string::npos) {
      return Result::error(TransportError::kMalformedResponse);
    }
    resp.headers.emplace_back(detail::Trim(line.substr(0, colon)),
                              detail::Trim(line.substr(colon + 1U)));
  }

  if (head_request || resp.status == 204 || resp.status == 304) {
    return Result::success(static_cast<HttpResponse&&>(resp));
  }

  const std::string rest = raw.substr(header_end + 4U);
  const std::string* te = resp.FindHeader("Transfer-Encoding");
  const std::string* cl = resp.FindHeader("Content-Length");
  if (te != nullptr && ::strncasecmp(te->c_str(), "chunked", 7) == 0) {
    if (!detail::DecodeChunked(rest, resp.body)) {
      return Result::error(TransportError::kMalformedResponse);
    }
  } else if (cl != nullptr) {
    const unsigned long len = std::strtoul(cl->c_str(), &end, 10);
    if (end == cl->c_str() || rest.size() < len) {
      return Result::error(TransportError::kMalformedResponse);
    }
    resp.body = rest.substr(0, len);
  } else {
    resp.body = rest;
  }
  return Result::success(static_cast<HttpResponse&&>(resp));
}

/**
 * @brief True when @p raw already holds a complete response, so reading can
 *        stop before the server closes the connection.
 *
 * A chunked body is complete only once the whole chunk stream, up to the
 * terminating zero-size chunk, decodes. A body with neither framing ends at
 * connection close.
 */
inline bool IsResponseComplete(const std::string& raw, bool head_request) {
  if (raw.find("\r\n\r\n") == std::string::npos) {
    return false;
  }
  if (head_request) {
    return true;
  }
  auto parsed = ParseHttpResponse(raw, false);
  if (!parsed.has_value()) {
    return false;
  }
  const HttpResponse& resp = parsed.value();
  if (resp.status == 204 || resp.status == 304) {
    return true;
  }
  const std::string* te = resp.FindHeader("Transfer-Encoding");
  if (te != nullptr) {
    return ::strncasecmp(te->c_str(), "chunked", 7) == 0;
  }
  return resp.FindHeader("Content-Length") != nullptr;
}

#if HOSTLINK_HAS_NETWORK

// ============================================================================
// HttpTransport
// ============================================================================

struct HttpTransportConfig {
  uint32_t timeout_ms = 5000U;  ///< Connect timeout and per-recv timeout.
  uint32_t max_response_bytes = 1024U * 1024U;
};

class HttpTransport final : public AgentTransport {
 public:
  explicit HttpTransport(const HttpTransportConfig& cfg = HttpTransportConfig{})
      : cfg_(cfg) {}

  expected<std::string, TransportError> HeaderProbe(
      const std::string& url, const char* method,
      const char* header_name) override {
    using Result = expected<std::string, TransportError>;
    auto resp = Perform(url, method, nullptr);
    if (!resp.has_value()) {
      return Result::error(resp.get_error());
    }
    const std::string* value = resp.value().FindHeader(header_name);
    return Result::success(value != nullptr ? *value : std::string());
  }

  expected<HttpReply, TransportError> Exchange(
      const std::string& url, const char* method,
      const std::string& payload) override {
    using Result = expected<HttpReply, TransportError>;
    auto resp = Perform(url, method, &payload);
    if (!resp.has_value()) {
      return Result::error(resp.get_error());
    }
    if (resp.value().status < 200 || resp.value().status > 299) {
      HOSTLINK_LOG_DEBUG("Http", "%s %s -> status %d", method, url.c_str(),
                         resp.value().status);
      return Result::error(TransportError::kBadStatus);
    }
    HttpReply reply;
    reply.status = resp.value().status;
    reply.body = static_cast<std::string&&>(resp.value().body);
    return Result::success(static_cast<HttpReply&&>(reply));
  }

  expected<void, TransportError> HeadProbe(const std::string& url) override {
    auto resp = Perform(url, "HEAD", nullptr);
    if (!resp.has_value()) {
      return expected<void, TransportError>::error(resp.get_error());
    }
    if (resp.value().status < 200 || resp.value().status > 299) {
      HOSTLINK_LOG_DEBUG("Http", "HEAD %s -> status %d", url.c_str(),
                         resp.value().status);
      return expected<void, TransportError>::error(TransportError::kBadStatus);
    }
    return expected<void, TransportError>::success();
  }

 private:
  static TransportError FromSocketError(SocketError err) noexcept {
    switch (err) {
      case SocketError::kTimeout:
      case SocketError::kWouldBlock:
        return TransportError::kTimeout;
      case SocketError::kResolveFailed:
      case SocketError::kInvalidAddress:
        return TransportError::kResolveFailed;
      case SocketError::kSendFailed:
        return TransportError::kSendFailed;
      case SocketError::kRecvFailed:
        return TransportError::kRecvFailed;
      default:
        return TransportError::kConnectFailed;
    }
  }

  expected<HttpResponse, TransportError> Perform(const std::string& url,
                                                 const char* method,
                                                 const std::string* payload) {
    using Result = expected<HttpResponse, TransportError>;
    auto parts_r = ParseUrl(url);
    if (!parts_r.has_value()) {
      return Result::error(parts_r.get_error());
    }
    const UrlParts& parts = parts_r.value();

    auto addr = SocketAddress::Resolve(parts.host.c_str(), parts.port);
    if (!addr.has_value()) {
      HOSTLINK_LOG_DEBUG("Http", "cannot resolve %s", parts.host.c_str());
      return Result::error(FromSocketError(addr.get_error()));
    }

    auto sock_r = TcpSocket::ConnectTo(addr.value(), cfg_.timeout_ms);
    if (!sock_r.has_value()) {
      HOSTLINK_LOG_DEBUG("Http", "connect %s:%u failed: %s",
                         parts.host.c_str(), parts.port,
                         SocketErrorToString(sock_r.get_error()));
      return Result::error(FromSocketError(sock_r.get_error()));
    }
    TcpSocket& sock = sock_r.value();
    if (!sock.SetRecvTimeout(cfg_.timeout_ms).has_value() ||
        !sock.SetSendTimeout(cfg_.timeout_ms).has_value()) {
      return Result::error(TransportError::kConnectFailed);
    }

    std::string request(method);
    request += ' ';
    request += parts.path;
    request += " HTTP/1.1\r\nHost: ";
    request += parts.host;
    request += ':';
    request += std::to_string(parts.port);
    request += "\r\nUser-Agent: hostlink\r\nAccept: */*\r\nConnection: close\r\n";
    if (payload != nullptr) {
      request += "Content-Type: application/json\r\nContent-Length: ";
      request += std::to_string(payload->size());
      request += "\r\n";
    }
    request += "\r\n";
    if (payload != nullptr) {
      request += *payload;
    }

    auto sent = sock.SendAll(request.data(), request.size());
    if (!sent.has_value()) {
      return Result::error(FromSocketError(sent.get_error()) ==
                                   TransportError::kTimeout
                               ? TransportError::kTimeout
                               : TransportError::kSendFailed);
    }

    const bool head = std::strcmp(method, "HEAD") == 0;
    std::string raw;
    char buf[4096];
    const uint64_t deadline = SteadyNowMs() + cfg_.timeout_ms;
    for (;;) {
      if (IsResponseComplete(raw, head)) {
        break;
      }
      if (SteadyNowMs() > deadline) {
        return Result::error(TransportError::kTimeout);
      }
      auto n = sock.Recv(buf, sizeof(buf));
      if (!n.has_value()) {
        return Result::error(n.get_error() == SocketError::kWouldBlock
                                 ? TransportError::kTimeout
                                 : TransportError::kRecvFailed);
      }
      if (n.value() == 0) {
        break;  // peer closed
      }
      raw.append(buf, static_cast<size_t>(n.value()));
      if (raw.size() > cfg_.max_response_bytes) {
        return Result::error(TransportError::kMalformedResponse);
      }
    }

    auto resp = ParseHttpResponse(raw, head);
    if (resp.has_value()) {
      HOSTLINK_LOG_DEBUG("Http", "%s %s -> %d", method, url.c_str(),
                         resp.value().status);
    }
    return resp;
  }

  HttpTransportConfig cfg_;
};

#endif  // HOSTLINK_HAS_NETWORK

}  // namespace hostlink

#endif  // HOSTLINK_TRANSPORT_HPP_
