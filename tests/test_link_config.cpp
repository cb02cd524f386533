/**
 * @file test_link_config.cpp
 * @brief Tests for link_config.hpp
 */

#include "hostlink/link_config.hpp"

#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>

namespace {

struct TestStore : hostlink::ConfigStore {
  using hostlink::ConfigStore::AddEntry;
};

/** Unsets the agent override variables on scope exit. */
struct EnvGuard {
  EnvGuard() { Clear(); }
  ~EnvGuard() { Clear(); }
  static void Clear() {
    ::unsetenv(hostlink::kEnvAgentHost);
    ::unsetenv(hostlink::kEnvAgentPort);
  }
};

}  // namespace

TEST_CASE("link_config - Defaults", "[link_config]") {
  hostlink::LinkOptions opts;
  CHECK(opts.host == "localhost");
  CHECK(opts.port == 42699U);
  CHECK(opts.retry_period_ms == 30000U);
  CHECK(opts.max_retries == 2);
  CHECK(opts.identity_header == "Server");
  CHECK(opts.identity_value == "Instana Agent");
  CHECK(opts.discovery_path == "/com.instana.plugin.cpp.discovery");
  CHECK(opts.readiness_path == "/com.instana.plugin.cpp");
  CHECK(opts.route_table == "/proc/net/route");
}

TEST_CASE("link_config - Store values override defaults", "[link_config]") {
  TestStore store;
  REQUIRE(store.AddEntry("agent", "host", "10.1.1.1"));
  REQUIRE(store.AddEntry("agent", "port", "9000"));
  REQUIRE(store.AddEntry("agent", "retry_period_ms", "250"));
  REQUIRE(store.AddEntry("agent", "max_retries", "4"));
  REQUIRE(store.AddEntry("agent", "timeout_ms", "700"));
  REQUIRE(store.AddEntry("agent", "readiness_path", "/ready"));
  REQUIRE(store.AddEntry("agent", "identity_value", "Other Agent"));
  REQUIRE(store.AddEntry("other", "port", "1"));

  auto opts = hostlink::LinkOptionsFromStore(store);
  CHECK(opts.host == "10.1.1.1");
  CHECK(opts.port == 9000U);
  CHECK(opts.retry_period_ms == 250U);
  CHECK(opts.max_retries == 4);
  CHECK(opts.timeout_ms == 700U);
  CHECK(opts.readiness_path == "/ready");
  CHECK(opts.identity_value == "Other Agent");
  CHECK(opts.discovery_path == "/com.instana.plugin.cpp.discovery");
}

TEST_CASE("link_config - Invalid values keep the previous value",
          "[link_config]") {
  TestStore store;
  REQUIRE(store.AddEntry("agent", "host", ""));
  REQUIRE(store.AddEntry("agent", "port", "0"));
  REQUIRE(store.AddEntry("agent", "retry_period_ms", "soon"));
  REQUIRE(store.AddEntry("agent", "max_retries", "0"));
  REQUIRE(store.AddEntry("agent", "discovery_path", "no-slash"));

  hostlink::LinkOptions base;
  base.port = 1234U;
  auto opts = hostlink::LinkOptionsFromStore(store, base);
  CHECK(opts.host == "localhost");
  CHECK(opts.port == 1234U);
  CHECK(opts.retry_period_ms == 30000U);
  CHECK(opts.max_retries == 2);
  CHECK(opts.discovery_path == "/com.instana.plugin.cpp.discovery");
}

TEST_CASE("link_config - Environment overrides host and port",
          "[link_config]") {
  EnvGuard guard;
  hostlink::LinkOptions opts;

  hostlink::ApplyEnvironment(opts);
  CHECK(opts.host == "localhost");
  CHECK(opts.port == 42699U);

  ::setenv(hostlink::kEnvAgentHost, "172.17.0.1", 1);
  ::setenv(hostlink::kEnvAgentPort, "4000", 1);
  hostlink::ApplyEnvironment(opts);
  CHECK(opts.host == "172.17.0.1");
  CHECK(opts.port == 4000U);

  ::setenv(hostlink::kEnvAgentHost, "", 1);
  ::setenv(hostlink::kEnvAgentPort, "99999", 1);
  hostlink::ApplyEnvironment(opts);
  CHECK(opts.host == "172.17.0.1");
  CHECK(opts.port == 4000U);
}

#ifdef HOSTLINK_CONFIG_INI_ENABLED

TEST_CASE("link_config - LoadLinkOptions from file and environment",
          "[link_config][ini]") {
  EnvGuard guard;
  hostlink_test::TempDir dir;
  REQUIRE(dir.IsValid());
  REQUIRE(dir.WriteFile("link.ini",
                        "[agent]\nhost = 10.9.9.9\nport = 5000\n"
                        "max_retries = 3\n"));
  ::setenv(hostlink::kEnvAgentPort, "5001", 1);

  auto opts = hostlink::LoadLinkOptions(dir.Join("link.ini").c_str());
  REQUIRE(opts.has_value());
  CHECK(opts.value().host == "10.9.9.9");
  CHECK(opts.value().port == 5001U);
  CHECK(opts.value().max_retries == 3);

  auto missing = hostlink::LoadLinkOptions(dir.Join("none.ini").c_str());
  REQUIRE_FALSE(missing.has_value());
  CHECK(missing.get_error() == hostlink::ConfigError::kFileNotFound);
}

#endif  // HOSTLINK_CONFIG_INI_ENABLED
