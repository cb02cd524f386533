/**
 * @file link_config.hpp
 * @brief LinkOptions: tunables of the host agent link and how they are
 *        loaded from defaults, a config file and the environment.
 *
 * Config file keys live in section [agent]:
 *
 *   [agent]
 *   host = 10.0.0.5
 *   port = 42699
 *   retry_period_ms = 30000
 *   max_retries = 2
 *   timeout_ms = 5000
 *   discovery_path = /com.instana.plugin.cpp.discovery
 *   readiness_path = /com.instana.plugin.cpp
 *   identity_header = Server
 *   identity_value = Instana Agent
 *   route_table = /proc/net/route
 *   proc_root = /proc
 *
 * HOSTLINK_AGENT_HOST and HOSTLINK_AGENT_PORT override host and port.
 * Invalid values are ignored with a warning and the previous value is kept.
 */

#ifndef HOSTLINK_LINK_CONFIG_HPP_
#define HOSTLINK_LINK_CONFIG_HPP_

#include "hostlink/config.hpp"
#include "hostlink/log.hpp"
#include "hostlink/vocabulary.hpp"

#include <cstdint>
#include <cstdlib>

namespace hostlink {

static constexpr uint16_t kDefaultAgentPort = 42699U;
static constexpr uint32_t kDefaultRetryPeriodMs = 30000U;
static constexpr int32_t kDefaultMaxRetries = 2;
static constexpr uint32_t kDefaultTimeoutMs = 5000U;

static constexpr const char* kAgentSection = "agent";
static constexpr const char* kEnvAgentHost = "HOSTLINK_AGENT_HOST";
static constexpr const char* kEnvAgentPort = "HOSTLINK_AGENT_PORT";

struct LinkOptions {
  FixedString<255> host{"localhost"};
  uint16_t port{kDefaultAgentPort};
  uint32_t retry_period_ms{kDefaultRetryPeriodMs};
  int32_t max_retries{kDefaultMaxRetries};  ///< Retry budget, >= 1.
  uint32_t timeout_ms{kDefaultTimeoutMs};   ///< Per-request transport timeout.
  FixedString<63> identity_header{"Server"};
  FixedString<63> identity_value{"Instana Agent"};
  FixedString<127> discovery_path{"/com.instana.plugin.cpp.discovery"};
  FixedString<127> readiness_path{"/com.instana.plugin.cpp"};
  FixedString<127> route_table{"/proc/net/route"};
  FixedString<127> proc_root{"/proc"};
};

namespace detail {

template <uint32_t N>
inline void ApplyString(const ConfigStore& store, const char* key,
                        FixedString<N>& field, bool must_be_path) {
  const char* v = store.FindString(kAgentSection, key);
  if (v == nullptr) {
    return;
  }
  if (v[0] == '\0' || (must_be_path && v[0] != '/')) {
    HOSTLINK_LOG_WARN("Config", "ignoring invalid %s.%s = '%s'", kAgentSection,
                      key, v);
    return;
  }
  field.assign(TruncateToCapacity, v);
}

/** @brief Apply an integer key if it parses and lies in [lo, hi]. */
template <typename T>
inline void ApplyRanged(const ConfigStore& store, const char* key, T& field,
                        int64_t lo, int64_t hi) {
  const char* v = store.FindString(kAgentSection, key);
  if (v == nullptr) {
    return;
  }
  auto parsed = ConfigStore::ParseInt(v);
  if (!parsed.has_value() || parsed.value() < lo || parsed.value() > hi) {
    HOSTLINK_LOG_WARN("Config", "ignoring invalid %s.%s = '%s'", kAgentSection,
                      key, v);
    return;
  }
  field = static_cast<T>(parsed.value());
}

}  // namespace detail

/** @brief @p base with every valid [agent] key of @p store applied. */
inline LinkOptions LinkOptionsFromStore(const ConfigStore& store,
                                        const LinkOptions& base = LinkOptions{}) {
  LinkOptions opts = base;
  detail::ApplyString(store, "host", opts.host, false);
  detail::ApplyRanged(store, "port", opts.port, 1, 65535);
  detail::ApplyRanged(store, "retry_period_ms", opts.retry_period_ms, 1,
                      INT32_MAX);
  detail::ApplyRanged(store, "max_retries", opts.max_retries, 1, 1000);
  detail::ApplyRanged(store, "timeout_ms", opts.timeout_ms, 1, INT32_MAX);
  detail::ApplyString(store, "identity_header", opts.identity_header, false);
  detail::ApplyString(store, "identity_value", opts.identity_value, false);
  detail::ApplyString(store, "discovery_path", opts.discovery_path, true);
  detail::ApplyString(store, "readiness_path", opts.readiness_path, true);
  detail::ApplyString(store, "route_table", opts.route_table, false);
  detail::ApplyString(store, "proc_root", opts.proc_root, false);
  return opts;
}

/** @brief Override host and port from HOSTLINK_AGENT_HOST / _PORT. */
inline void ApplyEnvironment(LinkOptions& opts) {
  const char* host = std::getenv(kEnvAgentHost);
  if (host != nullptr && host[0] != '\0') {
    opts.host.assign(TruncateToCapacity, host);
  }
  const char* port = std::getenv(kEnvAgentPort);
  if (port != nullptr) {
    auto parsed = ConfigStore::ParseInt(port);
    if (parsed.has_value() && parsed.value() >= 1 && parsed.value() <= 65535) {
      opts.port = static_cast<uint16_t>(parsed.value());
    } else {
      HOSTLINK_LOG_WARN("Config", "ignoring invalid %s='%s'", kEnvAgentPort,
                        port);
    }
  }
}

#if defined(HOSTLINK_CONFIG_INI_ENABLED) || defined(HOSTLINK_CONFIG_JSON_ENABLED)
/**
 * @brief Defaults, then @p path (format from its extension), then the
 *        environment.
 */
inline expected<LinkOptions, ConfigError> LoadLinkOptions(const char* path) {
  MultiConfig cfg;
  auto loaded = cfg.LoadFile(path);
  if (!loaded.has_value()) {
    HOSTLINK_LOG_ERROR("Config", "cannot load %s (error %u)", path,
                       static_cast<unsigned>(loaded.get_error()));
    return expected<LinkOptions, ConfigError>::error(loaded.get_error());
  }
  LinkOptions opts = LinkOptionsFromStore(cfg);
  ApplyEnvironment(opts);
  return expected<LinkOptions, ConfigError>::success(opts);
}
#endif

}  // namespace hostlink

#endif  // HOSTLINK_LINK_CONFIG_HPP_
