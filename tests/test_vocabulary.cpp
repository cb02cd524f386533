/**
 * @file test_vocabulary.cpp
 * @brief Tests for vocabulary.hpp types as the link uses them
 */

#include "hostlink/vocabulary.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace {

struct Reply {
  int32_t status = 0;
  std::string body;
};

/** Sets a flag when destroyed. */
struct Released {
  explicit Released(bool* flag) : flag_(flag) {}
  ~Released() { *flag_ = true; }
  bool* flag_;
};

/** Mimics a strand owner that re-runs steps through member pointers. */
struct Stepper {
  using Step = void (Stepper::*)();
  void Lookup() { ++lookups; }
  void Announce() { ++announces; }

  int lookups = 0;
  int announces = 0;
  uint64_t epoch = 3U;
};

}  // namespace

// ============================================================================
// expected<V, E>
// ============================================================================

TEST_CASE("vocabulary - expected carries a reply or an error code",
          "[vocabulary][expected]") {
  using R = hostlink::expected<Reply, hostlink::ConfigError>;
  Reply reply;
  reply.status = 201;
  reply.body = R"({"pid":7})";

  R ok = R::success(static_cast<Reply&&>(reply));
  REQUIRE(ok.has_value());
  CHECK(ok.value().status == 201);

  R failed = R::error(hostlink::ConfigError::kParseError);
  REQUIRE_FALSE(failed.has_value());
  CHECK(failed.get_error() == hostlink::ConfigError::kParseError);

  failed = ok;
  REQUIRE(failed.has_value());
  CHECK(failed.value().body == R"({"pid":7})");

  std::string body = static_cast<R&&>(ok).value().body;
  CHECK(body == R"({"pid":7})");
}

TEST_CASE("vocabulary - expected<void> reports completion",
          "[vocabulary][expected]") {
  using R = hostlink::expected<void, hostlink::TimerError>;
  CHECK(R::success().has_value());
  R full = R::error(hostlink::TimerError::kSlotsFull);
  REQUIRE_FALSE(full.has_value());
  CHECK(full.get_error() == hostlink::TimerError::kSlotsFull);
}

TEST_CASE("vocabulary - expected value_or falls back on error",
          "[vocabulary][expected]") {
  using R = hostlink::expected<int32_t, hostlink::ConfigError>;
  CHECK(R::success(4242).value_or(-1) == 4242);
  CHECK(R::error(hostlink::ConfigError::kFileNotFound).value_or(-1) == -1);
}

// ============================================================================
// optional<T>
// ============================================================================

TEST_CASE("vocabulary - optional models fd and inode fields",
          "[vocabulary][optional]") {
  hostlink::optional<std::string> fd;
  hostlink::optional<std::string> inode;
  CHECK_FALSE(fd.has_value());
  CHECK(inode.value_or("none") == "none");

  fd = hostlink::optional<std::string>(std::to_string(7));
  inode = hostlink::optional<std::string>("socket:[12345]");
  REQUIRE(fd.has_value());
  CHECK(fd.value() == "7");

  hostlink::optional<std::string> copy = inode;
  inode.reset();
  CHECK_FALSE(inode.has_value());
  REQUIRE(copy.has_value());
  CHECK(copy.value() == "socket:[12345]");

  hostlink::optional<int32_t> pid(31);
  CHECK(pid.value_or(1) == 31);
}

// ============================================================================
// Task / FixedFunction
// ============================================================================

TEST_CASE("vocabulary - Task captures an epoch and a host",
          "[vocabulary][task]") {
  std::string seen;
  uint64_t seen_epoch = 0U;
  const uint64_t epoch = 9U;
  const std::string host = "10.0.2.2";

  hostlink::Task task([&seen, &seen_epoch, epoch, host] {
    seen = host;
    seen_epoch = epoch;
  });
  REQUIRE(static_cast<bool>(task));

  hostlink::Task moved(static_cast<hostlink::Task&&>(task));
  CHECK_FALSE(static_cast<bool>(task));
  moved();
  CHECK(seen == "10.0.2.2");
  CHECK(seen_epoch == 9U);
}

TEST_CASE("vocabulary - Task owns a move-only capture",
          "[vocabulary][task]") {
  bool released = false;
  int delivered = 0;
  {
    auto payload = std::make_unique<Released>(&released);
    hostlink::Task task(
        [&delivered, owned = static_cast<std::unique_ptr<Released>&&>(
                         payload)]() mutable {
          if (owned) {
            ++delivered;
            owned.reset();
          }
        });
    CHECK_FALSE(released);
    task();
    CHECK(released);
    CHECK(delivered == 1);
  }

  released = false;
  {
    hostlink::Task dropped(
        [owned = std::make_unique<Released>(&released)]() mutable {
          owned.reset();
        });
  }
  CHECK(released);
}

TEST_CASE("vocabulary - Task re-runs a step through a member pointer",
          "[vocabulary][task]") {
  Stepper stepper;
  Stepper::Step step = &Stepper::Announce;
  const uint64_t epoch = stepper.epoch;

  hostlink::Task retry([&stepper, epoch, step] {
    if (epoch == stepper.epoch) {
      (stepper.*step)();
    }
  });
  retry();
  CHECK(stepper.announces == 1);
  CHECK(stepper.lookups == 0);

  stepper.epoch = 4U;
  retry();
  CHECK(stepper.announces == 1);
}

TEST_CASE("vocabulary - Task can be cleared", "[vocabulary][task]") {
  int calls = 0;
  hostlink::Task task([&calls] { ++calls; });
  task = nullptr;
  CHECK_FALSE(static_cast<bool>(task));

  task = hostlink::Task([&calls] { calls += 2; });
  task();
  CHECK(calls == 2);
}

// ============================================================================
// FixedString
// ============================================================================

TEST_CASE("vocabulary - FixedString holds option values",
          "[vocabulary][string]") {
  hostlink::FixedString<63> header("Server");
  CHECK(header == "Server");
  CHECK(header.size() == 6U);
  CHECK_FALSE(header == "server");

  hostlink::FixedString<8> host;
  CHECK(host.empty());
  host.assign(hostlink::TruncateToCapacity, "agent.example.internal");
  CHECK(host.size() == 8U);
  CHECK(host == "agent.ex");
  CHECK(host.capacity() == 8U);

  host.assign(hostlink::TruncateToCapacity, nullptr);
  CHECK(host.empty());
  CHECK(std::string(host.c_str()).empty());

  hostlink::FixedString<63> same("Server");
  CHECK(header == same);
}

TEST_CASE("vocabulary - TimerTaskId compares by value",
          "[vocabulary][newtype]") {
  hostlink::TimerTaskId a(1U);
  hostlink::TimerTaskId b(2U);
  CHECK(a != b);
  CHECK(a < b);
  CHECK(a == hostlink::TimerTaskId(1U));
  CHECK(b.value() == 2U);
}
