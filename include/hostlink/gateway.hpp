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
 * @file gateway.hpp
 * @brief Default gateway lookup from the kernel routing table.
 *
 * /proc/net/route layout (tab separated, one header line):
 *
 *   Iface  Destination  Gateway   Flags  RefCnt  Use  Metric  Mask  ...
 *   eth0   00000000     010011AC  0003   0       0    0       00000000
 *
 * Addresses are 32-bit hex in host (little-endian) byte order, so the row
 * above names gateway 172.17.0.1.
 */

#ifndef HOSTLINK_GATEWAY_HPP_
#define HOSTLINK_GATEWAY_HPP_

#include "hostlink/log.hpp"
#include "hostlink/procfs.hpp"
#include "hostlink/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace hostlink {

enum class GatewayError : uint8_t {
  kSourceUnavailable = 0,  ///< Routing table could not be read.
  kMalformed,              ///< Default route row has an unparsable gateway.
};

inline const char* GatewayErrorToString(GatewayError err) noexcept {
  switch (err) {
    case GatewayError::kSourceUnavailable: return "source unavailable";
    case GatewayError::kMalformed:         return "malformed route table";
  }
  return "unknown";
}

// ============================================================================
// Parsing
// ============================================================================

/**
 * @brief Gateway of the first default route (destination 00000000).
 *
 * @return Dotted-quad address, an empty string if there is no default route,
 *         or kMalformed if that row's gateway field is not 8 hex digits.
 */
inline expected<std::string, GatewayError> ParseDefaultGateway(
    const std::string& text) {
  using Result = expected<std::string, GatewayError>;
  size_t pos = text.find('\n');  // skip header
  while (pos != std::string::npos && pos < text.size()) {
    const size_t start = pos + 1U;
    size_t end = text.find('\n', start);
    const std::string line = text.substr(
        start, end == std::string::npos ? std::string::npos : end - start);
    pos = end;

    char iface[32];
    char dest[16];
    char gw[16];
    if (std::sscanf(line.c_str(), "%31s %15s %15s", iface, dest, gw) != 3) {
      continue;
    }
    if (std::string(dest) != "00000000") {
      continue;
    }

    char* parse_end = nullptr;
    const unsigned long raw = std::strtoul(gw, &parse_end, 16);
    if (std::string(gw).size() != 8U || parse_end == nullptr ||
        *parse_end != '\0') {
      return Result::error(GatewayError::kMalformed);
    }
    const uint32_t addr = static_cast<uint32_t>(raw);
    char out[16];
    (void)std::snprintf(out, sizeof(out), "%u.%u.%u.%u", addr & 0xFFU,
                        (addr >> 8) & 0xFFU, (addr >> 16) & 0xFFU,
                        (addr >> 24) & 0xFFU);
    return Result::success(std::string(out));
  }
  return Result::success(std::string());
}

// ============================================================================
// GatewayResolver
// ============================================================================

class GatewayResolver {
 public:
  virtual ~GatewayResolver() = default;

  /** @brief Default gateway read from @p route_source; empty if none. */
  virtual expected<std::string, GatewayError> DefaultGateway(
      const std::string& route_source) = 0;
};

class RouteTableGatewayResolver final : public GatewayResolver {
 public:
  expected<std::string, GatewayError> DefaultGateway(
      const std::string& route_source) override {
    auto text = procfs::ReadFile(route_source);
    if (!text.has_value()) {
      HOSTLINK_LOG_DEBUG("Gateway", "cannot read %s", route_source.c_str());
      return expected<std::string, GatewayError>::error(
          GatewayError::kSourceUnavailable);
    }
    return ParseDefaultGateway(text.value());
  }
};

}  // namespace hostlink

#endif  // HOSTLINK_GATEWAY_HPP_
