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
 * @file pending_requests.hpp
 * @brief Correlation of outstanding commands with their replies.
 *
 * A PendingRequestTable belongs to one Session and lives on the event-loop
 * thread. Each entry pairs a ReplyKey with the ReplySlot its caller waits
 * on and an optional loop timer. An entry leaves the table exactly once:
 * fulfilled, timed out, cancelled, or failed by FailAll().
 */

#ifndef DGT_PENDING_REQUESTS_HPP_
#define DGT_PENDING_REQUESTS_HPP_

#include "dgt/event_loop.hpp"
#include "dgt/frame_codec.hpp"
#include "dgt/log.hpp"
#include "dgt/sync.hpp"
#include "dgt/vocabulary.hpp"

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace dgt {

// ============================================================================
// ReplySlot
// ============================================================================

/**
 * @brief Thread-safe one-shot completion slot.
 *
 * The first Resolve() wins; later ones are ignored. Callers on other
 * threads block in Wait(); loop-side users attach a continuation instead.
 */
class ReplySlot final {
 public:
  using Result = expected<Frame, DgtError>;
  using Continuation = std::function<void(const Result&)>;

  /// @return false when the slot was already resolved.
  bool Resolve(Result result) {
    Continuation cont;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (result_.has_value()) {
        return false;
      }
      result_.emplace(std::move(result));
      cont = std::move(continuation_);
      continuation_ = nullptr;
    }
    cv_.notify_all();
    if (cont) {
      cont(*result_);
    }
    return true;
  }

  bool Fulfill(Frame frame) { return Resolve(Result::success(std::move(frame))); }
  bool Fail(DgtError err) { return Resolve(Result::error(err)); }

  /// @brief Run @p cont on resolution (immediately if already resolved).
  void SetContinuation(Continuation cont) {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (!result_.has_value()) {
        continuation_ = std::move(cont);
        return;
      }
    }
    cont(*result_);
  }

  bool IsResolved() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return result_.has_value();
  }

  /**
   * @brief Block until resolved or @p deadline.
   * @return The resolution, or kTimeout without resolving the slot.
   */
  Result Wait(const Deadline& deadline) {
    std::unique_lock<std::mutex> lock(mtx_);
    auto done = [this]() { return result_.has_value(); };
    if (deadline.IsInfinite()) {
      cv_.wait(lock, done);
    } else if (!cv_.wait_until(lock, deadline.At(), done)) {
      return Result::error(DgtError::kTimeout);
    }
    return *result_;
  }

 private:
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::optional<Result> result_;
  Continuation continuation_;
};

// ============================================================================
// PendingRequestTable
// ============================================================================

class PendingRequestTable final {
 public:
  explicit PendingRequestTable(EventLoop& loop) : loop_(loop) {}

  ~PendingRequestTable() {
    for (auto& entry : entries_) {
      if (entry.second.timer != kInvalidTimerId) {
        (void)loop_.CancelTimer(entry.second.timer);
      }
    }
  }

  PendingRequestTable(const PendingRequestTable&) = delete;
  PendingRequestTable& operator=(const PendingRequestTable&) = delete;

  /**
   * @brief Add an entry for @p key.
   *
   * @param timeout_ms Entry timeout, kWaitForever for none. On expiry the
   *        entry is removed and the slot resolved with kTimeout.
   * @return kDuplicateRequest when @p key already has an entry.
   */
  expected<void, DgtError> Register(const ReplyKey& key,
                                    std::shared_ptr<ReplySlot> slot,
                                    uint32_t timeout_ms) {
    if (entries_.find(key) != entries_.end()) {
      DGT_LOG_DEBUG("Pending", "duplicate request 0x%02x/0x%02x", key.tag,
                    key.sub);
      return expected<void, DgtError>::error(DgtError::kDuplicateRequest);
    }
    Entry entry;
    entry.slot = std::move(slot);
    if (timeout_ms != kWaitForever) {
      const ReplySlot* raw = entry.slot.get();
      entry.timer = loop_.PostAfter(
          timeout_ms, [this, key, raw]() { OnTimeout(key, raw); });
    }
    entries_.emplace(key, std::move(entry));
    return expected<void, DgtError>::success();
  }

  /// @return true when a pending request matched @p key.
  bool Fulfill(const ReplyKey& key, Frame frame) {
    std::shared_ptr<ReplySlot> slot = Take(key, nullptr);
    if (!slot) {
      return false;
    }
    (void)slot->Fulfill(std::move(frame));
    return true;
  }

  /**
   * @brief Remove the entry for @p key if it still belongs to @p slot and
   *        resolve it with @p reason.
   */
  bool Cancel(const ReplyKey& key, const ReplySlot* slot,
              DgtError reason = DgtError::kCancelled) {
    std::shared_ptr<ReplySlot> owned = Take(key, slot);
    if (!owned) {
      return false;
    }
    (void)owned->Fail(reason);
    return true;
  }

  /// @brief Resolve every entry with @p err in one sweep.
  size_t FailAll(DgtError err) {
    std::map<ReplyKey, Entry> drained;
    drained.swap(entries_);
    for (auto& entry : drained) {
      if (entry.second.timer != kInvalidTimerId) {
        (void)loop_.CancelTimer(entry.second.timer);
      }
    }
    for (auto& entry : drained) {
      (void)entry.second.slot->Fail(err);
    }
    if (!drained.empty()) {
      DGT_LOG_DEBUG("Pending", "failed %zu request(s) with %s",
                    drained.size(), DgtErrorName(err));
    }
    return drained.size();
  }

  size_t Size() const noexcept { return entries_.size(); }

  bool Contains(const ReplyKey& key) const {
    return entries_.find(key) != entries_.end();
  }

 private:
  struct Entry {
    std::shared_ptr<ReplySlot> slot;
    TimerId timer = kInvalidTimerId;
  };

  /// Remove and return the entry's slot; @p owner == nullptr matches any.
  std::shared_ptr<ReplySlot> Take(const ReplyKey& key,
                                  const ReplySlot* owner) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
      return nullptr;
    }
    if (owner != nullptr && it->second.slot.get() != owner) {
      return nullptr;
    }
    if (it->second.timer != kInvalidTimerId) {
      (void)loop_.CancelTimer(it->second.timer);
    }
    std::shared_ptr<ReplySlot> slot = std::move(it->second.slot);
    entries_.erase(it);
    return slot;
  }

  void OnTimeout(const ReplyKey& key, const ReplySlot* owner) {
    auto it = entries_.find(key);
    if (it == entries_.end() || it->second.slot.get() != owner) {
      return;
    }
    it->second.timer = kInvalidTimerId;
    std::shared_ptr<ReplySlot> slot = std::move(it->second.slot);
    entries_.erase(it);
    DGT_LOG_DEBUG("Pending", "request 0x%02x/0x%02x timed out", key.tag,
                  key.sub);
    (void)slot->Fail(DgtError::kTimeout);
  }

  EventLoop& loop_;
  std::map<ReplyKey, Entry> entries_;
};

}  // namespace dgt

#endif  // DGT_PENDING_REQUESTS_HPP_
