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
 * @file worker_pool.hpp
 * @brief Fixed-size thread pool executing hostlink::Task jobs.
 *
 * Architecture:
 *
 *   Submit() --> bounded ring (mutex + condvar) --> Worker[0..N-1] --> Task()
 *
 * With worker_num == 1 the pool runs jobs strictly in submission order,
 * which hostlink uses as a serializing strand.
 *
 * Usage:
 *   hostlink::WorkerPoolConfig cfg;
 *   cfg.name = "io";
 *   cfg.worker_num = 2;
 *   hostlink::WorkerPool pool(cfg);
 *   pool.Start();
 *   pool.Submit([] { DoWork(); });
 *   pool.Shutdown();
 */

#ifndef HOSTLINK_WORKER_POOL_HPP_
#define HOSTLINK_WORKER_POOL_HPP_

#include "hostlink/platform.hpp"
#include "hostlink/vocabulary.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#ifdef __linux__
#include <pthread.h>
#endif

namespace hostlink {

static constexpr uint32_t kDefaultWorkerQueueDepth = 64U;

struct WorkerPoolConfig {
  FixedString<15> name{"pool"};  ///< Also the thread name on Linux.
  uint32_t worker_num{1U};
  uint32_t queue_depth{kDefaultWorkerQueueDepth};
};

struct WorkerPoolStats {
  uint64_t submitted{0U};
  uint64_t processed{0U};
  uint64_t rejected{0U};  ///< Queue full or pool not running.
};

class WorkerPool final {
 public:
  explicit WorkerPool(const WorkerPoolConfig& cfg) noexcept
      : name_(cfg.name),
        worker_num_(cfg.worker_num > 0U ? cfg.worker_num : 1U),
        queue_depth_(cfg.queue_depth > 0U ? cfg.queue_depth
                                          : kDefaultWorkerQueueDepth),
        ring_(new Task[queue_depth_]) {}

  ~WorkerPool() noexcept { Shutdown(); }

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

  // ======================== Lifecycle ========================

  void Start() noexcept {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mtx_);
    if (running_.load(std::memory_order_acquire)) {
      return;
    }
    {
      std::lock_guard<std::mutex> lk(mtx_);
      shutdown_ = false;
    }
    running_.store(true, std::memory_order_release);
    threads_.reserve(worker_num_);
    for (uint32_t i = 0U; i < worker_num_; ++i) {
      threads_.emplace_back(&WorkerPool::WorkerLoop, this);
    }
  }

  /**
   * @brief Stop accepting jobs, run what is queued, join all workers.
   *
   * Must not be called from one of the pool's own workers.
   */
  void Shutdown() noexcept {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mtx_);
    if (!running_.load(std::memory_order_acquire)) {
      return;
    }
    running_.store(false, std::memory_order_release);
    {
      std::lock_guard<std::mutex> lk(mtx_);
      shutdown_ = true;
    }
    cv_.notify_all();
    for (auto& t : threads_) {
      if (t.joinable()) {
        t.join();
      }
    }
    threads_.clear();
  }

  // ======================== Submission ========================

  /**
   * @brief Queue a job.
   * @return false if the pool is not running or the queue is full.
   */
  bool Submit(Task task) noexcept {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      if (!running_.load(std::memory_order_acquire) || shutdown_ ||
          count_ == queue_depth_) {
        ++rejected_;
        return false;
      }
      ring_[(head_ + count_) % queue_depth_] = static_cast<Task&&>(task);
      ++count_;
      ++submitted_;
    }
    cv_.notify_one();
    return true;
  }

  // ======================== Query ========================

  bool IsRunning() const noexcept {
    return running_.load(std::memory_order_acquire);
  }

  /** @brief True when called from one of this pool's workers. */
  bool IsWorkerThread() const noexcept {
    const std::thread::id self = std::this_thread::get_id();
    for (const auto& t : threads_) {
      if (t.get_id() == self) {
        return true;
      }
    }
    return false;
  }

  WorkerPoolStats GetStats() const noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    WorkerPoolStats s;
    s.submitted = submitted_;
    s.processed = processed_;
    s.rejected = rejected_;
    return s;
  }

  const char* Name() const noexcept { return name_.c_str(); }

 private:
  // ======================== Worker thread ========================

  void WorkerLoop() noexcept {
#ifdef __linux__
    (void)pthread_setname_np(pthread_self(), name_.c_str());
#endif
    for (;;) {
      Task task;
      {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait(lk, [this] { return count_ > 0U || shutdown_; });
        if (count_ == 0U) {
          return;  // shutdown with an empty queue
        }
        task = static_cast<Task&&>(ring_[head_]);
        head_ = (head_ + 1U) % queue_depth_;
        --count_;
      }
      task();
      std::lock_guard<std::mutex> lk(mtx_);
      ++processed_;
    }
  }

  // ======================== Data members ========================

  FixedString<15> name_;
  const uint32_t worker_num_;
  const uint32_t queue_depth_;
  std::unique_ptr<Task[]> ring_;

  mutable std::mutex mtx_;  ///< Guards the ring, shutdown_ and counters.
  std::condition_variable cv_;
  uint32_t head_{0U};
  uint32_t count_{0U};
  bool shutdown_{false};
  uint64_t submitted_{0U};
  uint64_t processed_{0U};
  uint64_t rejected_{0U};

  std::atomic<bool> running_{false};
  std::mutex lifecycle_mtx_;
  std::vector<std::thread> threads_;
};

}  // namespace hostlink

#endif  // HOSTLINK_WORKER_POOL_HPP_
