/**
 * @file test_announce.cpp
 * @brief Tests for announce.hpp
 */

#include "hostlink/announce.hpp"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <string>

using hostlink::AnnounceError;
using hostlink::AnnounceResponse;
using hostlink::DecodeAnnounceResponse;

// ============================================================================
// EncodeDiscoveryInfo
// ============================================================================

TEST_CASE("announce - Encode full discovery info", "[announce]") {
  hostlink::DiscoveryInfo info;
  info.pid = 4711;
  info.name = "/usr/bin/app";
  info.args = {"-v", "--port=8080"};
  info.fd = hostlink::optional<std::string>("7");
  info.inode = hostlink::optional<std::string>("socket:[12345]");
  info.cpu_set = hostlink::optional<std::string>("/");

  auto j = nlohmann::json::parse(hostlink::EncodeDiscoveryInfo(info));
  CHECK(j["pid"] == 4711);
  CHECK(j["name"] == "/usr/bin/app");
  REQUIRE(j["args"].size() == 2U);
  CHECK(j["args"][1] == "--port=8080");
  CHECK(j["fd"] == "7");
  CHECK(j["inode"] == "socket:[12345]");
  CHECK(j["cpuSetFileContent"] == "/");
}

TEST_CASE("announce - Encode omits unknown optional fields", "[announce]") {
  hostlink::DiscoveryInfo info;
  info.pid = 1;
  info.name = "app";

  auto j = nlohmann::json::parse(hostlink::EncodeDiscoveryInfo(info));
  CHECK(j["args"].is_array());
  CHECK(j["args"].empty());
  CHECK_FALSE(j.contains("fd"));
  CHECK_FALSE(j.contains("inode"));
  CHECK_FALSE(j.contains("cpuSetFileContent"));
}

TEST_CASE("announce - Encode replaces bytes that are not UTF-8",
          "[announce]") {
  hostlink::DiscoveryInfo info;
  info.pid = 7;
  info.name = "/opt/\xFF" "app";
  info.args = {"--title=caf\xE9"};
  info.cpu_set = hostlink::optional<std::string>("/grp\xC3");

  const std::string encoded = hostlink::EncodeDiscoveryInfo(info);
  auto j = nlohmann::json::parse(encoded);
  CHECK(j["pid"] == 7);
  const std::string name = j["name"].get<std::string>();
  CHECK(name.compare(0, 5, "/opt/") == 0);
  CHECK(name.find("\xEF\xBF\xBD") != std::string::npos);
  CHECK(name.find("app") != std::string::npos);
  const std::string arg = j["args"][0].get<std::string>();
  CHECK(arg.compare(0, 11, "--title=caf") == 0);
  CHECK(arg.find("\xEF\xBF\xBD") != std::string::npos);
  CHECK(j["cpuSetFileContent"].get<std::string>().compare(0, 4, "/grp") == 0);
}

// ============================================================================
// DecodeAnnounceResponse
// ============================================================================

TEST_CASE("announce - Decode complete response", "[announce]") {
  const std::string body = R"({
    "pid": 4711,
    "agentUuid": "agent-1",
    "secrets": {"matcher": "equals", "list": ["token"]},
    "extraHeaders": ["X-Legacy"],
    "tracing": {"extra-http-headers": ["X-Request-Id"]},
    "unrelated": {"a": 1}
  })";
  auto resp = DecodeAnnounceResponse(body);
  REQUIRE(resp.has_value());
  CHECK(resp.value().pid == 4711U);
  CHECK(resp.value().agent_uuid == "agent-1");
  CHECK(resp.value().secrets_matcher == "equals");
  REQUIRE(resp.value().secrets_list.size() == 1U);
  CHECK(resp.value().secrets_list[0] == "token");
  REQUIRE(resp.value().extra_headers.size() == 1U);
  REQUIRE(resp.value().tracing_extra_headers.size() == 1U);
  CHECK(resp.value().tracing_extra_headers[0] == "X-Request-Id");
}

TEST_CASE("announce - Decode minimal object", "[announce]") {
  auto resp = DecodeAnnounceResponse("{}");
  REQUIRE(resp.has_value());
  CHECK(resp.value().pid == 0U);
  CHECK(resp.value().agent_uuid.empty());
  CHECK(resp.value().secrets_matcher.empty());

  auto nulls = DecodeAnnounceResponse(R"({"pid":null,"secrets":null})");
  REQUIRE(nulls.has_value());
}

TEST_CASE("announce - Decode rejects malformed bodies", "[announce]") {
  CHECK(DecodeAnnounceResponse("").get_error() == AnnounceError::kMalformedJson);
  CHECK(DecodeAnnounceResponse("{\"pid\":").get_error() ==
        AnnounceError::kMalformedJson);
  CHECK(DecodeAnnounceResponse("[1,2]").get_error() ==
        AnnounceError::kMalformedJson);
  CHECK(DecodeAnnounceResponse("\"text\"").get_error() ==
        AnnounceError::kMalformedJson);
}

TEST_CASE("announce - Decode rejects wrong field types", "[announce]") {
  const char* bodies[] = {
      R"({"pid":"4711"})",
      R"({"pid":-3})",
      R"({"pid":4294967296})",
      R"({"pid":18446744073709551615})",
      R"({"agentUuid":5})",
      R"({"secrets":"none"})",
      R"({"secrets":{"list":"key"}})",
      R"({"secrets":{"list":[1]}})",
      R"({"extraHeaders":{}})",
      R"({"tracing":{"extra-http-headers":"X-A"}})",
  };
  for (const char* body : bodies) {
    INFO(body);
    auto resp = DecodeAnnounceResponse(body);
    REQUIRE_FALSE(resp.has_value());
    CHECK(resp.get_error() == AnnounceError::kWrongFieldType);
  }
}

TEST_CASE("announce - Decode accepts the largest 32-bit pid", "[announce]") {
  auto resp = DecodeAnnounceResponse(R"({"pid":4294967295})");
  REQUIRE(resp.has_value());
  CHECK(resp.value().pid == 4294967295U);
}

TEST_CASE("announce - AnnounceErrorToString", "[announce]") {
  CHECK(std::string(hostlink::AnnounceErrorToString(
            AnnounceError::kMalformedJson)) == "malformed json");
  CHECK(std::string(hostlink::AnnounceErrorToString(
            AnnounceError::kWrongFieldType)) == "wrong field type");
}

// ============================================================================
// SettingsStore
// ============================================================================

TEST_CASE("announce - SettingsStore defaults", "[announce][settings]") {
  hostlink::SettingsStore store;
  auto s = store.Snapshot();
  CHECK(store.Generation() == 0U);
  CHECK(s.entity_id.empty());
  CHECK(s.secrets_matcher == "contains-ignore-case");
  REQUIRE(s.secrets_list.size() == 3U);
  CHECK(s.secrets_list[0] == "key");
  CHECK(s.secrets_list[1] == "pass");
  CHECK(s.secrets_list[2] == "secret");
  CHECK(s.extra_http_headers.empty());
}

TEST_CASE("announce - SettingsStore applies a response",
          "[announce][settings]") {
  hostlink::SettingsStore store;
  AnnounceResponse resp;
  resp.pid = 99;
  resp.agent_uuid = "host-a";
  resp.secrets_matcher = "regex";
  resp.secrets_list = {".*token.*"};
  resp.extra_headers = {"X-Legacy"};

  hostlink::SettingsStore::Apply(resp, &store);
  auto s = store.Snapshot();
  CHECK(store.Generation() == 1U);
  CHECK(s.entity_id == "99");
  CHECK(s.host_id == "host-a");
  CHECK(s.secrets_matcher == "regex");
  REQUIRE(s.secrets_list.size() == 1U);
  REQUIRE(s.extra_http_headers.size() == 1U);
  CHECK(s.extra_http_headers[0] == "X-Legacy");
}

TEST_CASE("announce - Tracing headers win over legacy headers",
          "[announce][settings]") {
  hostlink::SettingsStore store;
  AnnounceResponse resp;
  resp.extra_headers = {"X-Legacy"};
  resp.tracing_extra_headers = {"X-New", "X-Other"};
  store.Update(resp);

  auto s = store.Snapshot();
  REQUIRE(s.extra_http_headers.size() == 2U);
  CHECK(s.extra_http_headers[0] == "X-New");
}

TEST_CASE("announce - Unknown secrets matcher keeps previous secrets",
          "[announce][settings]") {
  hostlink::SettingsStore store;
  AnnounceResponse resp;
  resp.secrets_matcher = "fuzzy";
  resp.secrets_list = {"x"};
  store.Update(resp);

  auto s = store.Snapshot();
  CHECK(store.Generation() == 1U);
  CHECK(s.secrets_matcher == "contains-ignore-case");
  CHECK(s.secrets_list.size() == 3U);

  CHECK(hostlink::IsKnownSecretsMatcher("none"));
  CHECK(hostlink::IsKnownSecretsMatcher("equals-ignore-case"));
  CHECK_FALSE(hostlink::IsKnownSecretsMatcher("Equals"));
}

TEST_CASE("announce - Empty lists keep previous headers",
          "[announce][settings]") {
  hostlink::SettingsStore store;
  AnnounceResponse first;
  first.tracing_extra_headers = {"X-Keep"};
  store.Update(first);
  store.Update(AnnounceResponse());

  auto s = store.Snapshot();
  CHECK(store.Generation() == 2U);
  REQUIRE(s.extra_http_headers.size() == 1U);
  CHECK(s.extra_http_headers[0] == "X-Keep");
  CHECK(s.entity_id == "0");
}
