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
 * @file session.hpp
 * @brief One live connection to a board over an open Transport.
 *
 * Lifecycle:  Starting --MarkRunning()--> Running --failure/Close()--> Dead
 *
 * A Session decodes the incoming byte stream, stamps each frame with its
 * arrival sequence, and routes it either to the pending request waiting for
 * it or, through the board/clock decoders, to the EventBus. Events are only
 * published while Running, so a candidate port that is still being checked
 * stays silent.
 *
 * Every method runs on the EventLoop thread.
 */

#ifndef DGT_SESSION_HPP_
#define DGT_SESSION_HPP_

#include "dgt/board.hpp"
#include "dgt/clock.hpp"
#include "dgt/event_bus.hpp"
#include "dgt/event_loop.hpp"
#include "dgt/frame_codec.hpp"
#include "dgt/log.hpp"
#include "dgt/pending_requests.hpp"
#include "dgt/protocol.hpp"
#include "dgt/transport.hpp"
#include "dgt/vocabulary.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace dgt {

enum class SessionState : uint8_t {
  kStarting = 0,
  kRunning,
  kDead,
};

inline const char* SessionStateName(SessionState s) noexcept {
  switch (s) {
    case SessionState::kStarting:
      return "Starting";
    case SessionState::kRunning:
      return "Running";
    case SessionState::kDead:
      return "Dead";
    default:
      return "Unknown";
  }
}

class Session final : public std::enable_shared_from_this<Session> {
 public:
  /// Invoked once when the Session dies on its own (not on Close()).
  using DeathCallback = std::function<void(DgtError)>;

  /**
   * @brief Create a Session over an already opened @p transport and start
   *        its I/O threads.
   */
  static std::shared_ptr<Session> Create(EventLoop& loop, EventBus& bus,
                                         std::string port,
                                         std::unique_ptr<Transport> transport,
                                         DeathCallback on_death) {
    std::shared_ptr<Session> s(
        new Session(loop, bus, std::move(port), std::move(on_death)));
    s->StartWorker(std::move(transport));
    return s;
  }

  ~Session() = default;

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  // --------------------------------------------------------------------------
  // Control
  // --------------------------------------------------------------------------

  /// @brief Starting -> Running. Events flow from here on.
  void MarkRunning() {
    if (state_ == SessionState::kStarting) {
      state_ = SessionState::kRunning;
      DGT_LOG_DEBUG("Session", "%s running", port_.c_str());
    }
  }

  /**
   * @brief Encode and queue @p cmd.
   *
   * When @p cmd expects a reply, the pending request is registered before
   * the bytes are queued so the reply can never overtake it.
   *
   * @return kSessionDead after death, kDuplicateRequest when the reply key
   *         is already in use.
   */
  expected<void, DgtError> Send(const Command& cmd, uint32_t timeout_ms,
                                std::shared_ptr<ReplySlot> slot) {
    if (state_ == SessionState::kDead) {
      return expected<void, DgtError>::error(DgtError::kSessionDead);
    }
    const ReplySlot* raw = slot.get();
    if (cmd.expects_reply) {
      DGT_ASSERT(slot != nullptr);
      auto r = pending_.Register(cmd.reply, std::move(slot), timeout_ms);
      if (!r) {
        return r;
      }
    }

    DGT_LOG_DEBUG("Session", "-> 0x%02x (%zu payload bytes)", cmd.tag,
                  cmd.payload.size());
    if (!worker_->Send(EncodeCommand(cmd))) {
      if (cmd.expects_reply) {
        (void)pending_.Cancel(cmd.reply, raw, DgtError::kSessionDead);
      }
      return expected<void, DgtError>::error(DgtError::kSessionDead);
    }
    return expected<void, DgtError>::success();
  }

  /// @brief Send a command that expects no reply.
  expected<void, DgtError> Send(const Command& cmd) {
    DGT_ASSERT(!cmd.expects_reply);
    return Send(cmd, kWaitForever, nullptr);
  }

  /// @brief Drop one caller's pending request (see PendingRequestTable).
  bool CancelRequest(const ReplyKey& key, const ReplySlot* slot,
                     DgtError reason = DgtError::kCancelled) {
    return pending_.Cancel(key, slot, reason);
  }

  /**
   * @brief Tear the Session down without notifying the owner.
   *
   * Same cleanup as a failure: transport closed, pending requests failed
   * with @p pending_error, "disconnected" emitted if the Session was
   * Running.
   */
  void Close(DgtError pending_error = DgtError::kConnectionLost) {
    Die(DgtError::kClosed, pending_error, false);
  }

  // --------------------------------------------------------------------------
  // Accessors
  // --------------------------------------------------------------------------

  SessionState State() const noexcept { return state_; }
  bool IsRunning() const noexcept { return state_ == SessionState::kRunning; }
  bool IsDead() const noexcept { return state_ == SessionState::kDead; }
  const std::string& Port() const noexcept { return port_; }
  const BoardState& Board() const noexcept { return board_; }
  const ClockState& Clock() const noexcept { return clock_; }
  uint64_t FramesReceived() const noexcept { return seq_; }
  size_t PendingCount() const noexcept { return pending_.Size(); }

 private:
  Session(EventLoop& loop, EventBus& bus, std::string port,
          DeathCallback on_death)
      : loop_(loop),
        bus_(bus),
        port_(std::move(port)),
        on_death_(std::move(on_death)),
        pending_(loop) {}

  void StartWorker(std::unique_ptr<Transport> transport) {
    std::weak_ptr<Session> weak = shared_from_this();
    worker_.reset(new TransportWorker(
        loop_, std::move(transport),
        [weak](std::vector<uint8_t> chunk) {
          if (auto self = weak.lock()) self->OnData(chunk);
        },
        [weak](DgtError err) {
          if (auto self = weak.lock()) self->OnIoError(err);
        }));
    worker_->Start();
  }

  // --------------------------------------------------------------------------
  // Inbound Path
  // --------------------------------------------------------------------------

  void OnData(const std::vector<uint8_t>& chunk) {
    if (state_ == SessionState::kDead) {
      return;
    }
    std::shared_ptr<Session> keep_alive = shared_from_this();
    decoder_.Feed(chunk.data(), chunk.size());
    while (state_ != SessionState::kDead) {
      auto r = decoder_.Next();
      if (!r) {
        if (r.get_error() == CodecError::kMalformed) {
          Die(DgtError::kMalformed, DgtError::kConnectionLost, true);
        }
        return;
      }
      Frame frame = std::move(r.value());
      frame.seq = ++seq_;
      HandleFrame(std::move(frame));
    }
  }

  void OnIoError(DgtError err) {
    Die(err, DgtError::kConnectionLost, true);
  }

  void HandleFrame(Frame frame) {
    DGT_LOG_DEBUG("Session", "<- 0x%02x #%llu (%u payload bytes)", frame.tag,
                  static_cast<unsigned long long>(frame.seq), frame.length);
    switch (frame.tag) {
      case kMsgBoardDump:
        HandleBoardDump(std::move(frame));
        break;
      case kMsgFieldUpdate:
        HandleFieldUpdate(frame);
        break;
      case kMsgBwTime:
        HandleBwTime(std::move(frame));
        break;
      default: {
        const uint8_t tag = frame.tag;
        if (!pending_.Fulfill(ReplyKey{tag, 0U}, std::move(frame))) {
          DGT_LOG_DEBUG("Session", "unsolicited message 0x%02x ignored", tag);
        }
        break;
      }
    }
  }

  void HandleBoardDump(Frame frame) {
    auto board = DecodeBoardDump(frame.payload, frame.seq);
    if (!board) {
      DGT_LOG_WARN("Session", "bad board dump (%u bytes)", frame.length);
      return;
    }
    board_ = board.value();
    if (!pending_.Fulfill(ReplyKey{kMsgBoardDump, 0U}, std::move(frame))) {
      Publish(BoardEvent{board_});
    }
  }

  void HandleFieldUpdate(const Frame& frame) {
    auto r = ApplyFieldUpdate(board_, frame.payload, frame.seq);
    if (!r) {
      DGT_LOG_WARN("Session", "bad field update (%u bytes)", frame.length);
      return;
    }
    Publish(BoardEvent{board_});
  }

  void HandleBwTime(Frame frame) {
    if (IsClockAck(frame.payload)) {
      auto ack = DecodeClockAck(frame.payload);
      if (!ack) {
        DGT_LOG_DEBUG("Session", "invalid clock ack ignored");
        return;
      }
      if (ack.value().command == kClockAckButton) {
        auto button = ButtonFromAck(ack.value());
        if (button) {
          Publish(ButtonPressedEvent{button.value()});
        }
        return;
      }
      const uint8_t cmd = ack.value().command;
      if (!pending_.Fulfill(ReplyKey{kMsgBwTime, cmd}, std::move(frame))) {
        DGT_LOG_DEBUG("Session", "unsolicited clock ack 0x%02x", cmd);
      }
      return;
    }

    auto clock = DecodeClockTimes(frame.payload, frame.seq);
    if (!clock) {
      DGT_LOG_DEBUG("Session", "undecodable clock message ignored");
      return;
    }
    clock_ = clock.value();
    if (pending_.Fulfill(ReplyKey{kMsgBwTime, 0U}, std::move(frame))) {
      return;
    }
    // Compared against the last state subscribers saw, not the last reply.
    const bool changed = !have_published_clock_ || clock_ != published_clock_;
    if (changed && state_ == SessionState::kRunning) {
      published_clock_ = clock_;
      have_published_clock_ = true;
      bus_.Emit(ClockEvent{clock_});
    }
  }

  void Publish(const DgtEvent& event) {
    if (state_ == SessionState::kRunning) {
      bus_.Emit(event);
    }
  }

  // --------------------------------------------------------------------------
  // Teardown
  // --------------------------------------------------------------------------

  void Die(DgtError cause, DgtError pending_error, bool notify_owner) {
    if (state_ == SessionState::kDead) {
      return;
    }
    std::shared_ptr<Session> keep_alive = shared_from_this();
    const bool was_running = (state_ == SessionState::kRunning);
    state_ = SessionState::kDead;
    if (cause == DgtError::kClosed) {
      DGT_LOG_DEBUG("Session", "%s closed", port_.c_str());
    } else {
      DGT_LOG_INFO("Session", "%s lost: %s", port_.c_str(),
                   DgtErrorName(cause));
    }

    if (worker_) {
      worker_->Stop();
    }
    (void)pending_.FailAll(pending_error);
    if (was_running) {
      bus_.Emit(DisconnectedEvent{});
    }
    if (notify_owner && on_death_) {
      DeathCallback cb = std::move(on_death_);
      on_death_ = nullptr;
      cb(cause);
    }
  }

  EventLoop& loop_;
  EventBus& bus_;
  std::string port_;
  DeathCallback on_death_;

  SessionState state_ = SessionState::kStarting;
  std::unique_ptr<TransportWorker> worker_;
  FrameDecoder decoder_;
  PendingRequestTable pending_;

  uint64_t seq_ = 0U;
  BoardState board_;
  ClockState clock_;
  ClockState published_clock_;
  bool have_published_clock_ = false;
};

}  // namespace dgt

#endif  // DGT_SESSION_HPP_
