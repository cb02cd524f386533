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
 * @file announce.hpp
 * @brief Announce payload codec and the settings the agent hands back.
 *
 * Request (PUT to the discovery path):
 * @code
 *   {"pid":4711,"name":"/usr/bin/app","args":["-v"],
 *    "fd":"7","inode":"socket:[12345]","cpuSetFileContent":"/"}
 * @endcode
 * fd, inode and cpuSetFileContent are omitted when unknown.
 *
 * Response fields read: pid, agentUuid, secrets.matcher, secrets.list,
 * extraHeaders and tracing["extra-http-headers"]. Other fields are ignored.
 * A body that is not a JSON object, or a known field of the wrong type, is
 * rejected.
 */

#ifndef HOSTLINK_ANNOUNCE_HPP_
#define HOSTLINK_ANNOUNCE_HPP_

#include "hostlink/log.hpp"
#include "hostlink/process_identity.hpp"
#include "hostlink/vocabulary.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace hostlink {

enum class AnnounceError : uint8_t {
  kMalformedJson = 0,
  kWrongFieldType,
};

inline const char* AnnounceErrorToString(AnnounceError err) noexcept {
  switch (err) {
    case AnnounceError::kMalformedJson:  return "malformed json";
    case AnnounceError::kWrongFieldType: return "wrong field type";
  }
  return "unknown";
}

struct AnnounceResponse {
  uint32_t pid = 0;
  std::string agent_uuid;
  std::string secrets_matcher;
  std::vector<std::string> secrets_list;
  std::vector<std::string> extra_headers;          ///< Legacy top-level list.
  std::vector<std::string> tracing_extra_headers;  ///< Preferred list.
};

// ============================================================================
// Codec
// ============================================================================

/**
 * @brief JSON payload of the announce request.
 *
 * Bytes that are not valid UTF-8 (common in argv and cpuset content) are
 * replaced by U+FFFD.
 */
inline std::string EncodeDiscoveryInfo(const DiscoveryInfo& info) {
  nlohmann::json j;
  j["pid"] = info.pid;
  j["name"] = info.name;
  j["args"] = info.args;
  if (info.fd.has_value()) {
    j["fd"] = info.fd.value();
  }
  if (info.inode.has_value()) {
    j["inode"] = info.inode.value();
  }
  if (info.cpu_set.has_value()) {
    j["cpuSetFileContent"] = info.cpu_set.value();
  }
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

namespace detail {

inline bool ReadStringList(const nlohmann::json& parent, const char* key,
                           std::vector<std::string>& out) {
  auto it = parent.find(key);
  if (it == parent.end() || it->is_null()) {
    return true;
  }
  if (!it->is_array()) {
    return false;
  }
  for (const auto& item : *it) {
    if (!item.is_string()) {
      return false;
    }
    out.push_back(item.get<std::string>());
  }
  return true;
}

inline bool ReadString(const nlohmann::json& parent, const char* key,
                       std::string& out) {
  auto it = parent.find(key);
  if (it == parent.end() || it->is_null()) {
    return true;
  }
  if (!it->is_string()) {
    return false;
  }
  out = it->get<std::string>();
  return true;
}

}  // namespace detail

inline expected<AnnounceResponse, AnnounceError> DecodeAnnounceResponse(
    const std::string& body) {
  using Result = expected<AnnounceResponse, AnnounceError>;
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    return Result::error(AnnounceError::kMalformedJson);
  }

  AnnounceResponse resp;
  auto pid = j.find("pid");
  if (pid != j.end() && !pid->is_null()) {
    if (!pid->is_number_unsigned() || pid->get<uint64_t>() > UINT32_MAX) {
      return Result::error(AnnounceError::kWrongFieldType);
    }
    resp.pid = static_cast<uint32_t>(pid->get<uint64_t>());
  }
  if (!detail::ReadString(j, "agentUuid", resp.agent_uuid) ||
      !detail::ReadStringList(j, "extraHeaders", resp.extra_headers)) {
    return Result::error(AnnounceError::kWrongFieldType);
  }

  auto secrets = j.find("secrets");
  if (secrets != j.end() && !secrets->is_null()) {
    if (!secrets->is_object() ||
        !detail::ReadString(*secrets, "matcher", resp.secrets_matcher) ||
        !detail::ReadStringList(*secrets, "list", resp.secrets_list)) {
      return Result::error(AnnounceError::kWrongFieldType);
    }
  }

  auto tracing = j.find("tracing");
  if (tracing != j.end() && !tracing->is_null()) {
    if (!tracing->is_object() ||
        !detail::ReadStringList(*tracing, "extra-http-headers",
                                resp.tracing_extra_headers)) {
      return Result::error(AnnounceError::kWrongFieldType);
    }
  }
  return Result::success(static_cast<AnnounceResponse&&>(resp));
}

// ============================================================================
// Settings
// ============================================================================

struct AgentSettings {
  std::string entity_id;  ///< Announced pid, as a string.
  std::string host_id;
  std::string secrets_matcher{"contains-ignore-case"};
  std::vector<std::string> secrets_list{"key", "pass", "secret"};
  std::vector<std::string> extra_http_headers;
};

/// Receives the decoded response of every successful announce.
using SettingsApplyFn = void (*)(const AnnounceResponse& resp, void* ctx);

inline bool IsKnownSecretsMatcher(const std::string& matcher) noexcept {
  static const char* const kMatchers[] = {
      "equals-ignore-case", "equals", "contains-ignore-case",
      "contains",           "regex",  "none"};
  for (const char* m : kMatchers) {
    if (matcher == m) {
      return true;
    }
  }
  return false;
}

/**
 * @brief Default settings applier; keeps the latest settings for readers
 *        on other threads.
 *
 * Register with HostAgentLink via (&SettingsStore::Apply, &store).
 */
class SettingsStore final {
 public:
  static void Apply(const AnnounceResponse& resp, void* ctx) {
    static_cast<SettingsStore*>(ctx)->Update(resp);
  }

  void Update(const AnnounceResponse& resp) {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.entity_id = std::to_string(resp.pid);
    settings_.host_id = resp.agent_uuid;

    if (!resp.secrets_matcher.empty()) {
      if (IsKnownSecretsMatcher(resp.secrets_matcher)) {
        settings_.secrets_matcher = resp.secrets_matcher;
        settings_.secrets_list = resp.secrets_list;
      } else {
        HOSTLINK_LOG_WARN("Announce", "unknown secrets matcher '%s', keeping '%s'",
                          resp.secrets_matcher.c_str(),
                          settings_.secrets_matcher.c_str());
      }
    }

    if (!resp.tracing_extra_headers.empty()) {
      settings_.extra_http_headers = resp.tracing_extra_headers;
    } else if (!resp.extra_headers.empty()) {
      settings_.extra_http_headers = resp.extra_headers;
    }
    ++generation_;
  }

  AgentSettings Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
  }

  /** @brief Number of responses applied so far. */
  uint32_t Generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
  }

 private:
  mutable std::mutex mutex_;
  AgentSettings settings_;
  uint32_t generation_ = 0;
};

}  // namespace hostlink

#endif  // HOSTLINK_ANNOUNCE_HPP_
