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
 * @file sync.hpp
 * @brief Caller-side wait primitives: Deadline, CancelToken, ReadySignal.
 *
 * Built on mutex + condition variable. A blocking call takes one Deadline
 * for its whole duration and an optional CancelToken; cancelling the token
 * wakes every wait that registered with it.
 */

#ifndef DGT_SYNC_HPP_
#define DGT_SYNC_HPP_

#include "dgt/platform.hpp"
#include "dgt/vocabulary.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <utility>

namespace dgt {

/// Timeout value meaning "wait forever".
static constexpr uint32_t kWaitForever = UINT32_MAX;

// ============================================================================
// Deadline
// ============================================================================

class Deadline final {
 public:
  using Clock = std::chrono::steady_clock;

  static Deadline After(uint32_t timeout_ms) noexcept {
    Deadline d;
    if (timeout_ms != kWaitForever) {
      d.infinite_ = false;
      d.at_ = Clock::now() + std::chrono::milliseconds(timeout_ms);
    }
    return d;
  }

  static Deadline Never() noexcept { return Deadline(); }

  bool IsInfinite() const noexcept { return infinite_; }
  Clock::time_point At() const noexcept { return at_; }

  bool Expired() const noexcept {
    return !infinite_ && Clock::now() >= at_;
  }

  /// @return Remaining milliseconds (rounded up), kWaitForever if infinite.
  uint32_t RemainingMs() const noexcept {
    if (infinite_) {
      return kWaitForever;
    }
    const auto now = Clock::now();
    if (now >= at_) {
      return 0U;
    }
    const auto us =
        std::chrono::duration_cast<std::chrono::microseconds>(at_ - now)
            .count();
    const uint64_t ms = (static_cast<uint64_t>(us) + 999U) / 1000U;
    return (ms >= kWaitForever) ? (kWaitForever - 1U)
                                : static_cast<uint32_t>(ms);
  }

 private:
  Deadline() noexcept = default;

  bool infinite_ = true;
  Clock::time_point at_{};
};

// ============================================================================
// CancelToken
// ============================================================================

/**
 * @brief Cooperative cancellation shared between a caller and its waits.
 *
 * Hooks registered with OnCancel() run exactly once, on the thread that
 * calls Cancel(), outside the token's lock.
 */
class CancelToken final {
 public:
  using Hook = std::function<void()>;
  using HookId = uint64_t;

  CancelToken() = default;
  CancelToken(const CancelToken&) = delete;
  CancelToken& operator=(const CancelToken&) = delete;

  void Cancel() {
    std::map<HookId, Hook> hooks;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (cancelled_) {
        return;
      }
      cancelled_ = true;
      hooks.swap(hooks_);
    }
    for (auto& entry : hooks) {
      entry.second();
    }
  }

  bool IsCancelled() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return cancelled_;
  }

  /**
   * @brief Register @p hook to run on cancellation.
   * @return Hook id, or 0 if already cancelled (the hook ran inline).
   */
  HookId OnCancel(Hook hook) {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (!cancelled_) {
        const HookId id = next_id_++;
        hooks_.emplace(id, std::move(hook));
        return id;
      }
    }
    hook();
    return 0U;
  }

  void Remove(HookId id) {
    std::lock_guard<std::mutex> lock(mtx_);
    hooks_.erase(id);
  }

 private:
  mutable std::mutex mtx_;
  bool cancelled_ = false;
  HookId next_id_ = 1U;
  std::map<HookId, Hook> hooks_;
};

// ============================================================================
// ReadySignal
// ============================================================================

/**
 * @brief Level-triggered "connection ready" flag.
 *
 * Set() while a Session is Running, Clear() when it dies, Close() once the
 * Driver is closed (terminal: every current and future wait returns
 * kClosed).
 */
class ReadySignal final {
 public:
  void Set() {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (closed_) return;
      set_ = true;
    }
    cv_.notify_all();
  }

  void Clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    set_ = false;
  }

  void Close() {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      closed_ = true;
      set_ = false;
    }
    cv_.notify_all();
  }

  bool IsSet() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return set_;
  }

  bool IsClosed() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return closed_;
  }

  /**
   * @brief Block until set, closed, cancelled or @p deadline.
   * @return success, or kClosed / kCancelled / kTimeout.
   */
  expected<void, DgtError> WaitUntil(const Deadline& deadline,
                                     CancelToken* token = nullptr) {
    CancelToken::HookId hook = 0U;
    if (token != nullptr) {
      hook = token->OnCancel([this]() {
        std::lock_guard<std::mutex> lock(mtx_);
        cv_.notify_all();
      });
    }

    expected<void, DgtError> result = expected<void, DgtError>::success();
    {
      std::unique_lock<std::mutex> lock(mtx_);
      auto done = [this, token]() {
        return set_ || closed_ || (token != nullptr && token->IsCancelled());
      };
      bool woke = true;
      if (deadline.IsInfinite()) {
        cv_.wait(lock, done);
      } else {
        woke = cv_.wait_until(lock, deadline.At(), done);
      }

      if (closed_) {
        result = expected<void, DgtError>::error(DgtError::kClosed);
      } else if (token != nullptr && token->IsCancelled()) {
        result = expected<void, DgtError>::error(DgtError::kCancelled);
      } else if (!woke || !set_) {
        result = expected<void, DgtError>::error(DgtError::kTimeout);
      }
    }

    if (token != nullptr && hook != 0U) {
      token->Remove(hook);
    }
    return result;
  }

 private:
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  bool set_ = false;
  bool closed_ = false;
};

}  // namespace dgt

#endif  // DGT_SYNC_HPP_
