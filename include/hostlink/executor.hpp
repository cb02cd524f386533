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
 * @file executor.hpp
 * @brief Execution contexts for asynchronous link actions.
 *
 * An Executor offers three ways to run a Task:
 * - Submit:        concurrently on a worker (blocking I/O allowed)
 * - Dispatch:      serialized on the strand, one task at a time, FIFO
 * - ScheduleAfter: once, on the strand, after a delay
 *
 * ThreadedExecutor backs these with an I/O WorkerPool, a single-worker
 * WorkerPool acting as the strand, and a TimerScheduler whose due tasks are
 * forwarded to the strand.
 */

#ifndef HOSTLINK_EXECUTOR_HPP_
#define HOSTLINK_EXECUTOR_HPP_

#include "hostlink/log.hpp"
#include "hostlink/platform.hpp"
#include "hostlink/timer.hpp"
#include "hostlink/vocabulary.hpp"
#include "hostlink/worker_pool.hpp"

#include <cstdint>

namespace hostlink {

// ============================================================================
// Executor
// ============================================================================

class Executor {
 public:
  virtual ~Executor() = default;

  /** @return false if the task was not accepted (shut down or full). */
  virtual bool Submit(Task task) noexcept = 0;
  virtual bool Dispatch(Task task) noexcept = 0;
  virtual bool ScheduleAfter(uint32_t delay_ms, Task task) noexcept = 0;

  /** @brief Stop all threads. Pending timers are dropped. */
  virtual void Shutdown() noexcept = 0;
};

// ============================================================================
// ThreadedExecutor
// ============================================================================

struct ThreadedExecutorConfig {
  uint32_t io_workers{2U};
  uint32_t queue_depth{kDefaultWorkerQueueDepth};
  uint32_t max_timers{16U};
};

class ThreadedExecutor final : public Executor {
 public:
  explicit ThreadedExecutor(
      const ThreadedExecutorConfig& cfg = ThreadedExecutorConfig{}) noexcept
      : io_(MakePoolConfig("hostlink-io", cfg.io_workers, cfg.queue_depth)),
        strand_(MakePoolConfig("hostlink-strand", 1U, cfg.queue_depth)),
        timer_(cfg.max_timers) {
    timer_.SetFireTarget(&ThreadedExecutor::FireOnStrand, this);
    io_.Start();
    strand_.Start();
    if (!timer_.Start().has_value()) {
      HOSTLINK_LOG_ERROR("Timer", "timer scheduler failed to start");
    }
  }

  ~ThreadedExecutor() override { Shutdown(); }

  ThreadedExecutor(const ThreadedExecutor&) = delete;
  ThreadedExecutor& operator=(const ThreadedExecutor&) = delete;

  bool Submit(Task task) noexcept override {
    return io_.Submit(static_cast<Task&&>(task));
  }

  bool Dispatch(Task task) noexcept override {
    return strand_.Submit(static_cast<Task&&>(task));
  }

  bool ScheduleAfter(uint32_t delay_ms, Task task) noexcept override {
    if (delay_ms == 0U) {
      return Dispatch(static_cast<Task&&>(task));
    }
    if (!timer_.IsRunning()) {
      return false;
    }
    auto r = timer_.AddOneShot(delay_ms, static_cast<Task&&>(task));
    return r.has_value();
  }

  /**
   * @brief Stop timers, drain I/O work, then drain the strand.
   *
   * Must not be called from a task running on this executor.
   */
  void Shutdown() noexcept override {
    timer_.Stop();
    io_.Shutdown();
    strand_.Shutdown();
  }

  bool OnStrand() const noexcept { return strand_.IsWorkerThread(); }

 private:
  static WorkerPoolConfig MakePoolConfig(const char* name, uint32_t workers,
                                         uint32_t depth) noexcept {
    WorkerPoolConfig cfg;
    cfg.name.assign(TruncateToCapacity, name);
    cfg.worker_num = workers;
    cfg.queue_depth = depth;
    return cfg;
  }

  static void FireOnStrand(Task&& task, void* ctx) {
    auto* self = static_cast<ThreadedExecutor*>(ctx);
    if (!self->strand_.Submit(static_cast<Task&&>(task))) {
      HOSTLINK_LOG_WARN("Timer", "strand rejected a due timer task");
    }
  }

  WorkerPool io_;
  WorkerPool strand_;
  TimerScheduler timer_;
};

}  // namespace hostlink

#endif  // HOSTLINK_EXECUTOR_HPP_
