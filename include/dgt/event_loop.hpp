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
 * @file event_loop.hpp
 * @brief Single-threaded cooperative task loop with one-shot timers.
 *
 * All protocol logic of a Driver (frame handling, request resolution, event
 * dispatch, reconnection) runs on the loop thread, so none of that state
 * needs its own locking. Other threads hand work over with Post(),
 * PostAfter() or RunSync().
 *
 * Posted tasks run in FIFO order. Timers due in the same wake-up run before
 * the tasks posted so far, ordered by deadline.
 */

#ifndef DGT_EVENT_LOOP_HPP_
#define DGT_EVENT_LOOP_HPP_

#include "dgt/platform.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace dgt {

using TimerId = uint64_t;
static constexpr TimerId kInvalidTimerId = 0U;

class EventLoop final {
 public:
  using Task = std::function<void()>;
  using Clock = std::chrono::steady_clock;

  EventLoop() = default;

  /**
   * @brief Stops and joins the loop thread.
   *
   * Destroying the loop from one of its own tasks is a caller bug: the
   * thread is detached and still returns into Run() on a freed object.
   */
  ~EventLoop() {
    DGT_ASSERT(!IsInLoopThread());
    Stop();
    if (worker_.joinable()) {
      worker_.detach();
    }
  }

  EventLoop(const EventLoop&) = delete;
  EventLoop& operator=(const EventLoop&) = delete;

  // --------------------------------------------------------------------------
  // Lifecycle
  // --------------------------------------------------------------------------

  /// @brief Spawn the loop thread. No-op when already running.
  void Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_ || worker_.joinable()) {
      return;
    }
    running_ = true;
    stop_requested_ = false;
    worker_ = std::thread(&EventLoop::Run, this);
  }

  /**
   * @brief Request the loop to exit and join it.
   *
   * From the loop thread itself only the request is recorded; the thread
   * leaves after the current task and is joined by the next Stop() from
   * another thread or by the destructor. Pending tasks are discarded.
   */
  void Stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stop_requested_ = true;
    }
    cv_.notify_all();
    if (IsInLoopThread()) {
      return;
    }
    if (worker_.joinable()) {
      worker_.join();
    }
  }

  bool IsRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_ && !stop_requested_;
  }

  bool IsInLoopThread() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_ && loop_tid_ == std::this_thread::get_id();
  }

  // --------------------------------------------------------------------------
  // Task Submission
  // --------------------------------------------------------------------------

  /// @return false when the loop is stopped (the task is dropped).
  bool Post(Task task) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!running_ || stop_requested_) {
        return false;
      }
      tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
  }

  /**
   * @brief Run @p task once after @p delay_ms.
   * @return Timer id for CancelTimer(), kInvalidTimerId when stopped.
   */
  TimerId PostAfter(uint32_t delay_ms, Task task) {
    TimerId id = kInvalidTimerId;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!running_ || stop_requested_) {
        return kInvalidTimerId;
      }
      id = next_timer_id_++;
      const Clock::time_point due =
          Clock::now() + std::chrono::milliseconds(delay_ms);
      timers_.emplace(std::make_pair(due, id), std::move(task));
      timer_due_.emplace(id, due);
    }
    cv_.notify_one();
    return id;
  }

  /// @return true when the timer was still pending and is now removed.
  bool CancelTimer(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = timer_due_.find(id);
    if (it == timer_due_.end()) {
      return false;
    }
    timers_.erase(std::make_pair(it->second, id));
    timer_due_.erase(it);
    return true;
  }

  /**
   * @brief Run @p task on the loop thread and wait for it to finish.
   *
   * Runs inline when already on the loop thread.
   * @return false when the loop stopped before the task could run.
   */
  bool RunSync(const Task& task) {
    if (IsInLoopThread()) {
      task();
      return true;
    }

    auto call = std::make_shared<SyncCall>();
    auto notifier = std::make_shared<SyncNotifier>();
    notifier->call = call;
    const bool posted = Post([notifier, &task]() {
      task();
      std::lock_guard<std::mutex> lock(notifier->call->mtx);
      notifier->call->ran = true;
    });
    notifier.reset();
    (void)posted;

    std::unique_lock<std::mutex> lock(call->mtx);
    call->cv.wait(lock, [&call]() { return call->finished; });
    return call->ran;
  }

  size_t PendingTimers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timer_due_.size();
  }

 private:
  struct SyncCall {
    std::mutex mtx;
    std::condition_variable cv;
    bool finished = false;
    bool ran = false;
  };

  // Signals completion once the last copy of a RunSync task is gone, which
  // also covers tasks discarded by Stop().
  struct SyncNotifier {
    std::shared_ptr<SyncCall> call;
    ~SyncNotifier() {
      if (call) {
        std::lock_guard<std::mutex> lock(call->mtx);
        call->finished = true;
        call->cv.notify_all();
      }
    }
  };

  void Run() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      loop_tid_ = std::this_thread::get_id();
    }

    std::vector<Task> batch;
    for (;;) {
      {
        std::unique_lock<std::mutex> lock(mutex_);
        for (;;) {
          if (stop_requested_) break;
          if (!tasks_.empty()) break;
          if (!timers_.empty()) {
            const Clock::time_point due = timers_.begin()->first.first;
            if (due <= Clock::now()) break;
            cv_.wait_until(lock, due);
          } else {
            cv_.wait(lock);
          }
        }
        if (stop_requested_) {
          break;
        }

        const Clock::time_point now = Clock::now();
        while (!timers_.empty() && timers_.begin()->first.first <= now) {
          auto it = timers_.begin();
          timer_due_.erase(it->first.second);
          batch.push_back(std::move(it->second));
          timers_.erase(it);
        }
        while (!tasks_.empty()) {
          batch.push_back(std::move(tasks_.front()));
          tasks_.pop_front();
        }
      }

      for (auto& task : batch) {
        if (task) {
          task();
        }
        if (StopRequested()) {
          break;
        }
      }
      batch.clear();
    }

    // Drop whatever is left outside the lock: task destructors may
    // re-enter Post().
    std::deque<Task> leftover_tasks;
    std::map<std::pair<Clock::time_point, TimerId>, Task> leftover_timers;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      running_ = false;
      leftover_tasks.swap(tasks_);
      leftover_timers.swap(timers_);
      timer_due_.clear();
      loop_tid_ = std::thread::id();
    }
    batch.clear();
  }

  bool StopRequested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stop_requested_;
  }

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Task> tasks_;
  std::map<std::pair<Clock::time_point, TimerId>, Task> timers_;
  std::map<TimerId, Clock::time_point> timer_due_;
  TimerId next_timer_id_ = 1U;
  bool running_ = false;
  bool stop_requested_ = false;
  std::thread::id loop_tid_;
  std::thread worker_;
};

}  // namespace dgt

#endif  // DGT_EVENT_LOOP_HPP_
