/**
 * @file test_executor.cpp
 * @brief Tests for executor.hpp
 */

#include "hostlink/executor.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

namespace {

template <typename Pred>
bool WaitUntil(Pred pred, int timeout_ms) {
  for (int waited = 0; waited < timeout_ms; waited += 5) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return pred();
}

}  // namespace

TEST_CASE("ThreadedExecutor Submit runs off the strand", "[executor]") {
  hostlink::ThreadedExecutor exec;
  std::atomic<int> ran{0};
  std::atomic<bool> on_strand{true};

  REQUIRE(exec.Submit([&] {
    on_strand.store(exec.OnStrand());
    ran.fetch_add(1);
  }));
  REQUIRE(WaitUntil([&] { return ran.load() == 1; }, 2000));
  REQUIRE(!on_strand.load());
  REQUIRE(!exec.OnStrand());
}

TEST_CASE("ThreadedExecutor Dispatch serializes in order", "[executor]") {
  hostlink::ThreadedExecutor exec;
  std::mutex mtx;
  std::vector<int> order;
  std::atomic<bool> all_on_strand{true};

  for (int i = 0; i < 20; ++i) {
    REQUIRE(exec.Dispatch([&, i] {
      if (!exec.OnStrand()) all_on_strand.store(false);
      std::lock_guard<std::mutex> lk(mtx);
      order.push_back(i);
    }));
  }
  exec.Shutdown();
  REQUIRE(all_on_strand.load());
  REQUIRE(order.size() == 20U);
  for (int i = 0; i < 20; ++i) {
    REQUIRE(order[static_cast<size_t>(i)] == i);
  }
}

TEST_CASE("ThreadedExecutor ScheduleAfter lands on the strand", "[executor]") {
  hostlink::ThreadedExecutor exec;
  std::atomic<int> ran{0};
  std::atomic<bool> on_strand{false};

  auto start = std::chrono::steady_clock::now();
  REQUIRE(exec.ScheduleAfter(30, [&] {
    on_strand.store(exec.OnStrand());
    ran.fetch_add(1);
  }));
  REQUIRE(WaitUntil([&] { return ran.load() == 1; }, 2000));
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  REQUIRE(elapsed.count() >= 25);
  REQUIRE(on_strand.load());
}

TEST_CASE("ThreadedExecutor zero delay dispatches immediately", "[executor]") {
  hostlink::ThreadedExecutor exec;
  std::atomic<int> ran{0};
  REQUIRE(exec.ScheduleAfter(0, [&] { ran.fetch_add(1); }));
  REQUIRE(WaitUntil([&] { return ran.load() == 1; }, 2000));
}

TEST_CASE("ThreadedExecutor worker result returns to the strand", "[executor]") {
  hostlink::ThreadedExecutor exec;
  std::atomic<int> result{0};

  REQUIRE(exec.Submit([&] {
    const int computed = 6 * 7;
    (void)exec.Dispatch([&, computed] {
      if (exec.OnStrand()) result.store(computed);
    });
  }));
  REQUIRE(WaitUntil([&] { return result.load() == 42; }, 2000));
}

TEST_CASE("ThreadedExecutor rejects work after Shutdown", "[executor]") {
  hostlink::ThreadedExecutor exec;
  exec.Shutdown();
  REQUIRE(!exec.Submit([] {}));
  REQUIRE(!exec.Dispatch([] {}));
  REQUIRE(!exec.ScheduleAfter(10, [] {}));
  exec.Shutdown();
}

TEST_CASE("Executor interface is usable polymorphically", "[executor]") {
  hostlink::ThreadedExecutorConfig cfg;
  cfg.io_workers = 1;
  cfg.max_timers = 4;
  hostlink::ThreadedExecutor threaded(cfg);
  hostlink::Executor& exec = threaded;
  std::atomic<int> ran{0};
  REQUIRE(exec.Dispatch([&] { ran.fetch_add(1); }));
  REQUIRE(exec.Submit([&] { ran.fetch_add(1); }));
  exec.Shutdown();
  REQUIRE(ran.load() == 2);
}
