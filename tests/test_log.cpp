/**
 * @file test_log.cpp
 * @brief Tests for log.hpp
 */

#include "hostlink/log.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

namespace {

struct Captured {
  hostlink::log::Level level;
  std::string category;
  std::string message;
};

void CaptureSink(hostlink::log::Level level, const char* category,
                 const char* message, void* ctx) {
  static_cast<std::vector<Captured>*>(ctx)->push_back(
      Captured{level, category, message});
}

}  // namespace

TEST_CASE("Log level defaults", "[log]") {
  // In debug builds default is kDebug, in release kInfo
#ifdef NDEBUG
  REQUIRE(hostlink::log::GetLevel() == hostlink::log::Level::kInfo);
#else
  REQUIRE(hostlink::log::GetLevel() == hostlink::log::Level::kDebug);
#endif
}

TEST_CASE("Log SetLevel", "[log]") {
  auto prev = hostlink::log::GetLevel();
  hostlink::log::SetLevel(hostlink::log::Level::kError);
  REQUIRE(hostlink::log::GetLevel() == hostlink::log::Level::kError);
  REQUIRE(!hostlink::log::IsEnabled(hostlink::log::Level::kWarn));
  REQUIRE(hostlink::log::IsEnabled(hostlink::log::Level::kFatal));
  hostlink::log::SetLevel(prev);
}

TEST_CASE("Log Init and Shutdown", "[log]") {
  REQUIRE(!hostlink::log::IsInitialized());
  hostlink::log::Init();
  REQUIRE(hostlink::log::IsInitialized());
  hostlink::log::Shutdown();
  REQUIRE(!hostlink::log::IsInitialized());
}

TEST_CASE("Log macros write to stderr", "[log]") {
  hostlink::log::SetLevel(hostlink::log::Level::kDebug);
  HOSTLINK_LOG_DEBUG("Test", "debug %d", 1);
  HOSTLINK_LOG_INFO("Test", "info %s", "msg");
  HOSTLINK_LOG_WARN("Test", "warn");
  HOSTLINK_LOG_ERROR("Test", "error %d %d", 1, 2);
  HOSTLINK_LOG_FATAL("Test", "fatal is logged, not fatal to the process");
  REQUIRE(true);
}

TEST_CASE("Log sink receives category and message", "[log]") {
  std::vector<Captured> out;
  hostlink::log::SetLevel(hostlink::log::Level::kDebug);
  hostlink::log::SetSink(&CaptureSink, &out);

  HOSTLINK_LOG_INFO("Announce", "Announced pid: %u", 4711U);
  HOSTLINK_LOG_DEBUG("Lookup", "checking host %s", "10.0.2.2");

  hostlink::log::SetSink(nullptr, nullptr);
  REQUIRE(out.size() == 2U);
  REQUIRE(out[0].level == hostlink::log::Level::kInfo);
  REQUIRE(out[0].category == "Announce");
  REQUIRE(out[0].message == "Announced pid: 4711");
  REQUIRE(out[1].category == "Lookup");
  REQUIRE(out[1].message == "checking host 10.0.2.2");
}

TEST_CASE("Log level hierarchy filtering", "[log]") {
  std::vector<Captured> out;
  hostlink::log::SetSink(&CaptureSink, &out);
  hostlink::log::SetLevel(hostlink::log::Level::kWarn);

  HOSTLINK_LOG_DEBUG("Test", "debug filtered");
  HOSTLINK_LOG_INFO("Test", "info filtered");
  HOSTLINK_LOG_WARN("Test", "warn passes");
  HOSTLINK_LOG_ERROR("Test", "error passes");

  hostlink::log::SetLevel(hostlink::log::Level::kOff);
  HOSTLINK_LOG_ERROR("Test", "off filters everything");

  hostlink::log::SetLevel(hostlink::log::Level::kDebug);
  hostlink::log::SetSink(nullptr, nullptr);
  REQUIRE(out.size() == 2U);
  REQUIRE(out[0].level == hostlink::log::Level::kWarn);
  REQUIRE(out[1].level == hostlink::log::Level::kError);
}

TEST_CASE("Log long message is truncated", "[log]") {
  std::vector<Captured> out;
  hostlink::log::SetLevel(hostlink::log::Level::kDebug);
  hostlink::log::SetSink(&CaptureSink, &out);

  std::string long_msg(2000, 'x');
  HOSTLINK_LOG_INFO("Test", "%s", long_msg.c_str());
  HOSTLINK_LOG_INFO("Test", "");

  hostlink::log::SetSink(nullptr, nullptr);
  REQUIRE(out.size() == 2U);
  REQUIRE(out[0].message.size() == hostlink::log::kMaxMessageLen - 1U);
  REQUIRE(out[1].message.empty());
}

TEST_CASE("Log Shutdown restores the default sink", "[log]") {
  std::vector<Captured> out;
  hostlink::log::SetSink(&CaptureSink, &out);
  hostlink::log::Shutdown();
  HOSTLINK_LOG_WARN("Test", "goes to stderr");
  REQUIRE(out.empty());
}
