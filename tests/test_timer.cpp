/**
 * @file test_timer.cpp
 * @brief Tests for timer.hpp
 */

#include "hostlink/timer.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <thread>

namespace {

bool WaitFor(const std::atomic<int>& value, int expected, int timeout_ms) {
  for (int waited = 0; waited < timeout_ms; waited += 5) {
    if (value.load() == expected) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return value.load() == expected;
}

void Forward(hostlink::Task&& task, void* ctx) {
  static_cast<std::atomic<int>*>(ctx)->fetch_add(1);
  task();
}

}  // namespace

// ============================================================================
// Basic API Tests
// ============================================================================

TEST_CASE("TimerScheduler AddOneShot and Remove", "[timer]") {
  hostlink::TimerScheduler sched(4);

  auto result = sched.AddOneShot(100, [] {});
  REQUIRE(result.has_value());
  REQUIRE(result.value().value() > 0);
  REQUIRE(sched.TaskCount() == 1U);

  auto rm = sched.Remove(result.value());
  REQUIRE(rm.has_value());
  REQUIRE(sched.TaskCount() == 0U);

  auto again = sched.Remove(result.value());
  REQUIRE(!again.has_value());
  REQUIRE(again.get_error() == hostlink::TimerError::kNotRunning);
}

TEST_CASE("TimerScheduler invalid delay", "[timer]") {
  hostlink::TimerScheduler sched(4);
  auto zero = sched.AddOneShot(0, [] {});
  REQUIRE(!zero.has_value());
  REQUIRE(zero.get_error() == hostlink::TimerError::kInvalidPeriod);

  auto empty = sched.AddOneShot(10, hostlink::Task());
  REQUIRE(!empty.has_value());
  REQUIRE(empty.get_error() == hostlink::TimerError::kInvalidPeriod);
}

TEST_CASE("TimerScheduler slots full", "[timer]") {
  hostlink::TimerScheduler sched(2);
  REQUIRE(sched.AddOneShot(100, [] {}).has_value());
  REQUIRE(sched.AddOneShot(100, [] {}).has_value());
  auto r3 = sched.AddOneShot(100, [] {});
  REQUIRE(!r3.has_value());
  REQUIRE(r3.get_error() == hostlink::TimerError::kSlotsFull);
}

TEST_CASE("TimerScheduler Start/Stop", "[timer]") {
  hostlink::TimerScheduler sched(4);
  REQUIRE(sched.Start().has_value());
  REQUIRE(sched.IsRunning());

  auto second = sched.Start();
  REQUIRE(!second.has_value());
  REQUIRE(second.get_error() == hostlink::TimerError::kAlreadyRunning);

  sched.Stop();
  REQUIRE(!sched.IsRunning());
  sched.Stop();
}

// ============================================================================
// Firing
// ============================================================================

TEST_CASE("TimerScheduler fires once after the delay", "[timer]") {
  hostlink::TimerScheduler sched(4);
  std::atomic<int> fired{0};
  REQUIRE(sched.Start().has_value());

  auto start = std::chrono::steady_clock::now();
  REQUIRE(sched.AddOneShot(30, [&fired] { fired.fetch_add(1); }).has_value());
  REQUIRE(WaitFor(fired, 1, 2000));
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  REQUIRE(elapsed.count() >= 25);

  std::this_thread::sleep_for(std::chrono::milliseconds(60));
  REQUIRE(fired.load() == 1);
  REQUIRE(sched.TaskCount() == 0U);
  sched.Stop();
}

TEST_CASE("TimerScheduler removed task does not fire", "[timer]") {
  hostlink::TimerScheduler sched(4);
  std::atomic<int> fired{0};
  REQUIRE(sched.Start().has_value());

  auto id = sched.AddOneShot(50, [&fired] { fired.fetch_add(1); });
  REQUIRE(id.has_value());
  REQUIRE(sched.Remove(id.value()).has_value());

  std::this_thread::sleep_for(std::chrono::milliseconds(120));
  REQUIRE(fired.load() == 0);
  sched.Stop();
}

TEST_CASE("TimerScheduler Stop drops armed tasks", "[timer]") {
  hostlink::TimerScheduler sched(4);
  std::atomic<int> fired{0};
  REQUIRE(sched.Start().has_value());
  REQUIRE(sched.AddOneShot(10000, [&fired] { fired.fetch_add(1); })
              .has_value());
  sched.Stop();
  REQUIRE(sched.TaskCount() == 0U);
  REQUIRE(fired.load() == 0);
}

TEST_CASE("TimerScheduler forwards due tasks to the fire target", "[timer]") {
  hostlink::TimerScheduler sched(4);
  std::atomic<int> forwarded{0};
  std::atomic<int> ran{0};
  sched.SetFireTarget(&Forward, &forwarded);
  REQUIRE(sched.Start().has_value());

  REQUIRE(sched.AddOneShot(5, [&ran] { ran.fetch_add(1); }).has_value());
  REQUIRE(sched.AddOneShot(10, [&ran] { ran.fetch_add(1); }).has_value());
  REQUIRE(WaitFor(ran, 2, 2000));
  REQUIRE(forwarded.load() == 2);
  sched.Stop();
}
