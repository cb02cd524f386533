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
 * @file timer.hpp
 * @brief Single-shot timer scheduler driven by a background thread.
 *
 * Each registered task fires exactly once after its delay and then frees its
 * slot. Tasks are moved out of their slot and invoked without the internal
 * mutex held, so a task may schedule further timers. A fire target, when
 * set, receives due tasks instead of running them on the timer thread.
 *
 * All public methods are thread-safe.
 * Compatible with -fno-exceptions -fno-rtti.
 */

#ifndef HOSTLINK_TIMER_HPP_
#define HOSTLINK_TIMER_HPP_

#include "hostlink/log.hpp"
#include "hostlink/platform.hpp"
#include "hostlink/vocabulary.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <thread>

namespace hostlink {

/**
 * @brief Fixed-capacity single-shot timer scheduler.
 *
 *   hostlink::TimerScheduler sched(8);
 *   sched.Start();
 *   sched.AddOneShot(30000, [] { Retry(); });
 *   // ...
 *   sched.Stop();
 *
 * Non-copyable, non-movable.
 */
class TimerScheduler final {
 public:
  /// Receives a due task; takes ownership.
  using FireFn = void (*)(Task&& task, void* ctx);

  explicit TimerScheduler(uint32_t max_tasks = 16)
      : slots_(new TaskSlot[max_tasks]), max_tasks_(max_tasks) {}

  ~TimerScheduler() {
    Stop();
    delete[] slots_;
  }

  TimerScheduler(const TimerScheduler&) = delete;
  TimerScheduler& operator=(const TimerScheduler&) = delete;
  TimerScheduler(TimerScheduler&&) = delete;
  TimerScheduler& operator=(TimerScheduler&&) = delete;

  // --------------------------------------------------------------------------
  // Task Management
  // --------------------------------------------------------------------------

  /**
   * @brief Arm a task that runs once, @p delay_ms from now.
   *
   * @return TimerTaskId on success, or:
   *         - kInvalidPeriod if delay_ms == 0 or the task is empty.
   *         - kSlotsFull     if all slots are armed.
   */
  expected<TimerTaskId, TimerError> AddOneShot(uint32_t delay_ms, Task task) {
    if (delay_ms == 0U || !task) {
      return expected<TimerTaskId, TimerError>::error(
          TimerError::kInvalidPeriod);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (uint32_t i = 0U; i < max_tasks_; ++i) {
      if (!slots_[i].active) {
        slots_[i].task = static_cast<Task&&>(task);
        slots_[i].fire_ns =
            SteadyNowNs() + static_cast<uint64_t>(delay_ms) * 1000000ULL;
        slots_[i].id = next_id_++;
        slots_[i].active = true;
        return expected<TimerTaskId, TimerError>::success(
            TimerTaskId(slots_[i].id));
      }
    }
    HOSTLINK_LOG_WARN("Timer", "all %u timer slots armed", max_tasks_);
    return expected<TimerTaskId, TimerError>::error(TimerError::kSlotsFull);
  }

  /**
   * @brief Disarm a task that has not fired yet.
   *
   * @return Success, or TimerError::kNotRunning if the ID is unknown or the
   *         task already fired.
   */
  expected<void, TimerError> Remove(TimerTaskId task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (uint32_t i = 0U; i < max_tasks_; ++i) {
      if (slots_[i].active && slots_[i].id == task_id.value()) {
        slots_[i].active = false;
        slots_[i].task = nullptr;
        return expected<void, TimerError>::success();
      }
    }
    return expected<void, TimerError>::error(TimerError::kNotRunning);
  }

  /** @brief Route due tasks to @p fn. Call before Start(). */
  void SetFireTarget(FireFn fn, void* ctx) noexcept {
    HOSTLINK_ASSERT(!IsRunning());
    fire_fn_ = fn;
    fire_ctx_ = ctx;
  }

  // --------------------------------------------------------------------------
  // Scheduler Lifecycle
  // --------------------------------------------------------------------------

  expected<void, TimerError> Start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
      return expected<void, TimerError>::error(TimerError::kAlreadyRunning);
    }
    worker_ = std::thread(&TimerScheduler::ScheduleLoop, this);
    return expected<void, TimerError>::success();
  }

  /**
   * @brief Stop the scheduler thread (blocks until it exits).
   *
   * Armed tasks that have not fired are dropped.
   */
  void Stop() {
    running_.store(false, std::memory_order_release);
    if (worker_.joinable()) {
      worker_.join();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    for (uint32_t i = 0U; i < max_tasks_; ++i) {
      slots_[i].active = false;
      slots_[i].task = nullptr;
    }
  }

  bool IsRunning() const noexcept {
    return running_.load(std::memory_order_acquire);
  }

  /** @brief Number of armed tasks. */
  uint32_t TaskCount() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t count = 0U;
    for (uint32_t i = 0U; i < max_tasks_; ++i) {
      if (slots_[i].active) {
        ++count;
      }
    }
    return count;
  }

 private:
  struct TaskSlot {
    Task task;                ///< Callback, empty when the slot is free.
    uint64_t fire_ns = 0;     ///< Absolute fire time (monotonic ns).
    uint32_t id = 0;
    bool active = false;
  };

  static constexpr uint32_t kBatch = 8;

  TaskSlot* slots_;
  uint32_t max_tasks_;
  uint32_t next_id_ = 1;
  FireFn fire_fn_ = nullptr;
  void* fire_ctx_ = nullptr;
  std::atomic<bool> running_{false};
  std::thread worker_;
  mutable std::mutex mutex_;  ///< Guards slots_ and next_id_.

  /**
   * @brief Collect due tasks under the lock, run them outside it, then sleep
   *        half the shortest remaining delay clamped to [1 ms, 10 ms].
   */
  void ScheduleLoop() {
    while (running_.load(std::memory_order_acquire)) {
      Task due[kBatch];
      uint32_t due_count = 0U;
      uint64_t min_remaining = UINT64_MAX;

      {
        std::lock_guard<std::mutex> lock(mutex_);
        const uint64_t now = SteadyNowNs();
        for (uint32_t i = 0U; i < max_tasks_; ++i) {
          if (!slots_[i].active) {
            continue;
          }
          if (now >= slots_[i].fire_ns && due_count < kBatch) {
            due[due_count++] = static_cast<Task&&>(slots_[i].task);
            slots_[i].active = false;
            min_remaining = 0U;
            continue;
          }
          const uint64_t remaining =
              (slots_[i].fire_ns > now) ? (slots_[i].fire_ns - now) : 0U;
          if (remaining < min_remaining) {
            min_remaining = remaining;
          }
        }
      }

      for (uint32_t i = 0U; i < due_count; ++i) {
        if (fire_fn_ != nullptr) {
          fire_fn_(static_cast<Task&&>(due[i]), fire_ctx_);
        } else {
          due[i]();
        }
      }
      if (due_count == kBatch) {
        continue;
      }

      uint64_t sleep_ns = (min_remaining == UINT64_MAX) ? 10000000ULL
                                                         : (min_remaining / 2);
      if (sleep_ns < 1000000ULL) {
        sleep_ns = 1000000ULL;
      }
      if (sleep_ns > 10000000ULL) {
        sleep_ns = 10000000ULL;
      }
      std::this_thread::sleep_for(std::chrono::nanoseconds(sleep_ns));
    }
  }
};

}  // namespace hostlink

#endif  // HOSTLINK_TIMER_HPP_
