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
 * @file driver.hpp
 * @brief Connection supervisor and public request API for one DGT board.
 *
 * State machine (all transitions on the event-loop thread):
 *
 *   Idle --Start()--> Searching --candidate--> Connecting --version ok-->
 *   Connected --session death--> Searching ... --Close()--> Closed
 *
 * Searching lists the ports matching DriverConfig::port_patterns, retrying
 * with exponential backoff while nothing matches. Connecting opens each
 * candidate in turn and queries it with a version query; only a board that
 * answers becomes the active Session. Once connected the board is asked
 * for a full dump (and field updates), "connected" is emitted and the
 * readiness signal is set.
 *
 * Public requests block the calling thread. One timeout bounds both the
 * wait for a connection and the wait for the reply. Calling them from the
 * event-loop thread (an event handler) returns kWouldDeadlock.
 *
 * Usage:
 * @code
 *   dgt::DriverConfig cfg;
 *   cfg.port_patterns = {"/dev/ttyUSB*"};
 *   dgt::Driver driver(cfg);
 *   driver.On<dgt::BoardEvent>([](const dgt::BoardEvent& e) { ... });
 *   driver.Start();
 *   auto version = driver.GetVersion(5000);
 * @endcode
 */

#ifndef DGT_DRIVER_HPP_
#define DGT_DRIVER_HPP_

#include "dgt/board.hpp"
#include "dgt/clock.hpp"
#include "dgt/config.hpp"
#include "dgt/event_bus.hpp"
#include "dgt/event_loop.hpp"
#include "dgt/frame_codec.hpp"
#include "dgt/log.hpp"
#include "dgt/pending_requests.hpp"
#include "dgt/port_scanner.hpp"
#include "dgt/protocol.hpp"
#include "dgt/session.hpp"
#include "dgt/sync.hpp"
#include "dgt/transport.hpp"
#include "dgt/vocabulary.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace dgt {

enum class DriverState : uint8_t {
  kIdle = 0,
  kSearching,
  kConnecting,
  kConnected,
  kClosed,
};

inline const char* DriverStateName(DriverState s) noexcept {
  switch (s) {
    case DriverState::kIdle:
      return "Idle";
    case DriverState::kSearching:
      return "Searching";
    case DriverState::kConnecting:
      return "Connecting";
    case DriverState::kConnected:
      return "Connected";
    case DriverState::kClosed:
      return "Closed";
    default:
      return "Unknown";
  }
}

class Driver final {
 public:
  /**
   * @param enumerator Port source; SysfsPortEnumerator when null.
   * @param factory    Transport source; SerialPortTransport when empty.
   */
  explicit Driver(DriverConfig config,
                  std::unique_ptr<PortEnumerator> enumerator = nullptr,
                  TransportFactory factory = nullptr)
      : config_(std::move(config)),
        enumerator_(std::move(enumerator)),
        factory_(std::move(factory)) {
#if defined(DGT_PLATFORM_POSIX)
    if (!enumerator_) {
      enumerator_.reset(new SysfsPortEnumerator());
    }
    if (!factory_) {
      factory_ = SerialTransportFactory(config_.baud_rate);
    }
#endif
    DGT_ASSERT(enumerator_ != nullptr);
    DGT_ASSERT(static_cast<bool>(factory_));
    scanner_.reset(new PortScanner(*enumerator_));
    backoff_ms_ = config_.scan_interval_ms;
  }

  /**
   * @brief Close()s the driver.
   *
   * Must not run on the event-loop thread: a Driver destroyed from an event
   * handler would free the loop while its thread is still inside Run().
   */
  ~Driver() {
    DGT_ASSERT(!loop_.IsInLoopThread());
    Close();
  }

  Driver(const Driver&) = delete;
  Driver& operator=(const Driver&) = delete;

  // --------------------------------------------------------------------------
  // Lifecycle
  // --------------------------------------------------------------------------

  /// @brief Start searching for the board. No-op after the first call.
  expected<void, DgtError> Start() {
    if (closed_.load(std::memory_order_acquire)) {
      return expected<void, DgtError>::error(DgtError::kClosed);
    }
    if (started_.exchange(true, std::memory_order_acq_rel)) {
      return expected<void, DgtError>::success();
    }
    loop_.Start();
    DGT_LOG_INFO("Driver", "searching %zu port pattern(s)",
                 config_.port_patterns.size());
    (void)loop_.Post([this]() { Scan(); });
    return expected<void, DgtError>::success();
  }

  /**
   * @brief Terminal shutdown. Idempotent.
   *
   * The active Session is closed (emitting "disconnected" if it was
   * Running), in-flight requests fail with kClosed, and every later request
   * fails with kClosed.
   */
  void Close() {
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
      return;
    }
    ready_.Close();
    (void)loop_.RunSync([this]() { Teardown(); });
    SetState(DriverState::kClosed);
    loop_.Stop();
    DGT_LOG_INFO("Driver", "closed");
  }

  // --------------------------------------------------------------------------
  // Events / Status
  // --------------------------------------------------------------------------

  template <typename T, typename Func>
  SubscriptionHandle On(Func&& fn) {
    return bus_.On<T>(std::forward<Func>(fn));
  }

  bool Off(const SubscriptionHandle& handle) { return bus_.Off(handle); }

  EventBus& Events() noexcept { return bus_; }

  DriverState State() const noexcept {
    return static_cast<DriverState>(state_.load(std::memory_order_acquire));
  }

  bool IsConnected() const { return ready_.IsSet(); }

  /// @return Port of the active connection, "" when not connected.
  std::string ConnectedPort() const {
    std::lock_guard<std::mutex> lock(port_mtx_);
    return connected_port_;
  }

  /// @brief Ports currently attached to the host (diagnostics).
  std::vector<PortInfo> ListPorts() { return scanner_->ListAll(); }

  /// @brief Block until connected.
  expected<void, DgtError> WaitConnected(uint32_t timeout_ms,
                                         CancelToken* token = nullptr) {
    if (loop_.IsInLoopThread()) {
      return expected<void, DgtError>::error(DgtError::kWouldDeadlock);
    }
    return ready_.WaitUntil(Deadline::After(timeout_ms), token);
  }

  const DriverConfig& GetConfig() const noexcept { return config_; }

  // --------------------------------------------------------------------------
  // Board Requests
  // --------------------------------------------------------------------------

  /// @brief Board firmware version, "major.minor".
  expected<std::string, DgtError> GetVersion(uint32_t timeout_ms,
                                             CancelToken* token = nullptr) {
    auto r = Request(BoardQuery(kCmdSendVersion, kMsgVersion), timeout_ms,
                     token);
    if (!r) return expected<std::string, DgtError>::error(r.get_error());
    return DecodeVersion(r.value());
  }

  expected<std::string, DgtError> GetSerialNumber(
      uint32_t timeout_ms, CancelToken* token = nullptr) {
    auto r = Request(BoardQuery(kCmdReturnSerialNr, kMsgSerialNr), timeout_ms,
                     token);
    if (!r) return expected<std::string, DgtError>::error(r.get_error());
    return DecodeText(r.value());
  }

  expected<std::string, DgtError> GetLongSerialNumber(
      uint32_t timeout_ms, CancelToken* token = nullptr) {
    auto r = Request(BoardQuery(kCmdReturnLongSerialNr, kMsgLongSerialNr),
                     timeout_ms, token);
    if (!r) return expected<std::string, DgtError>::error(r.get_error());
    return DecodeText(r.value());
  }

  expected<std::string, DgtError> GetTrademark(uint32_t timeout_ms,
                                               CancelToken* token = nullptr) {
    auto r = Request(BoardQuery(kCmdSendTrademark, kMsgTrademark), timeout_ms,
                     token);
    if (!r) return expected<std::string, DgtError>::error(r.get_error());
    return DecodeText(r.value());
  }

  /// @brief Full board snapshot (also refreshes the session's image).
  expected<BoardState, DgtError> GetBoard(uint32_t timeout_ms,
                                          CancelToken* token = nullptr) {
    auto r = Request(BoardQuery(kCmdSendBoard, kMsgBoardDump), timeout_ms,
                     token);
    if (!r) return expected<BoardState, DgtError>::error(r.get_error());
    return DecodeBoardDump(r.value().payload, r.value().seq);
  }

  // --------------------------------------------------------------------------
  // Clock Requests
  // --------------------------------------------------------------------------

  /// @brief Current clock times.
  expected<ClockState, DgtError> GetClock(uint32_t timeout_ms,
                                          CancelToken* token = nullptr) {
    auto r = Request(ClockTimesQuery(), timeout_ms, token);
    if (!r) return expected<ClockState, DgtError>::error(r.get_error());
    return DecodeClockTimes(r.value().payload, r.value().seq);
  }

  /// @brief Clock firmware version, "major.minor".
  expected<std::string, DgtError> GetClockVersion(
      uint32_t timeout_ms, CancelToken* token = nullptr) {
    auto r = Request(ClockVersionCommand(), timeout_ms, token);
    if (!r) return expected<std::string, DgtError>::error(r.get_error());
    auto ack = DecodeClockAck(r.value().payload);
    if (!ack) return expected<std::string, DgtError>::error(ack.get_error());
    return expected<std::string, DgtError>::success(
        ClockVersionFromAck(ack.value()));
  }

  expected<void, DgtError> ClockBeep(uint32_t duration_ms, uint32_t timeout_ms,
                                     CancelToken* token = nullptr) {
    return Acknowledge(Request(ClockBeepCommand(duration_ms), timeout_ms,
                               token));
  }

  /**
   * @brief Set both times (seconds) and start at most one side.
   * @return kInvalidArgument when both sides are asked to run or a time
   *         exceeds 9:59:59.
   */
  expected<void, DgtError> ClockSet(uint32_t left_s, uint32_t right_s,
                                    bool left_running, bool right_running,
                                    uint32_t timeout_ms,
                                    CancelToken* token = nullptr) {
    if ((left_running && right_running) || left_s > kClockMaxSeconds ||
        right_s > kClockMaxSeconds) {
      return expected<void, DgtError>::error(DgtError::kInvalidArgument);
    }
    return Acknowledge(Request(
        ClockSetNRunCommand(left_s, right_s, left_running, right_running),
        timeout_ms, token));
  }

  /// @brief Show @p text (first 8 characters) on the clock display.
  expected<void, DgtError> ClockText(const std::string& text, bool beep,
                                     uint32_t timeout_ms,
                                     CancelToken* token = nullptr) {
    return Acknowledge(Request(ClockTextCommand(text, beep), timeout_ms,
                               token));
  }

  /// @brief Return the clock display to the running times.
  expected<void, DgtError> ClockEndDisplay(uint32_t timeout_ms,
                                           CancelToken* token = nullptr) {
    return Acknowledge(Request(ClockEndDisplayCommand(), timeout_ms, token));
  }

  /**
   * @brief Send @p cmd once connected and wait for its reply.
   *
   * Lower-level entry point behind every typed request.
   */
  expected<Frame, DgtError> Request(const Command& cmd, uint32_t timeout_ms,
                                    CancelToken* token = nullptr) {
    using Result = expected<Frame, DgtError>;
    if (loop_.IsInLoopThread()) {
      return Result::error(DgtError::kWouldDeadlock);
    }
    if (closed_.load(std::memory_order_acquire)) {
      return Result::error(DgtError::kClosed);
    }
    DGT_ASSERT(cmd.expects_reply);

    const Deadline deadline = Deadline::After(timeout_ms);
    auto ready = ready_.WaitUntil(deadline, token);
    if (!ready) {
      return Result::error(ready.get_error());
    }

    auto slot = std::make_shared<ReplySlot>();
    auto target = std::make_shared<std::weak_ptr<Session>>();
    const uint32_t remaining = deadline.RemainingMs();
    const bool posted = loop_.Post([this, cmd, slot, target, remaining]() {
      if (closed_.load(std::memory_order_acquire)) {
        (void)slot->Fail(DgtError::kClosed);
        return;
      }
      if (!session_ || !session_->IsRunning()) {
        (void)slot->Fail(DgtError::kConnectionLost);
        return;
      }
      *target = session_;
      auto r = session_->Send(cmd, remaining, slot);
      if (!r) {
        (void)slot->Fail(r.get_error() == DgtError::kSessionDead
                             ? DgtError::kConnectionLost
                             : r.get_error());
      }
    });
    if (!posted) {
      return Result::error(DgtError::kClosed);
    }

    const ReplyKey key = cmd.reply;
    auto withdraw = [this, slot, target, key](DgtError reason) {
      (void)loop_.Post([slot, target, key, reason]() {
        if (auto s = target->lock()) {
          (void)s->CancelRequest(key, slot.get(), reason);
        }
      });
    };

    CancelToken::HookId hook = 0U;
    if (token != nullptr) {
      hook = token->OnCancel([slot, withdraw]() {
        withdraw(DgtError::kCancelled);
        (void)slot->Fail(DgtError::kCancelled);
      });
    }
    DGT_SCOPE_EXIT(if (token != nullptr && hook != 0U) token->Remove(hook));

    Result res = slot->Wait(deadline);
    if (!res && res.get_error() == DgtError::kTimeout && !slot->IsResolved()) {
      withdraw(DgtError::kTimeout);
      (void)slot->Fail(DgtError::kTimeout);
    }
    return res;
  }

 private:
  // --------------------------------------------------------------------------
  // Reply Decoding
  // --------------------------------------------------------------------------

  static expected<std::string, DgtError> DecodeVersion(const Frame& f) {
    if (f.payload.size() != 2U) {
      return expected<std::string, DgtError>::error(DgtError::kBadReply);
    }
    char buf[16];
    (void)std::snprintf(buf, sizeof(buf), "%u.%u",
                        static_cast<unsigned>(f.payload[0]),
                        static_cast<unsigned>(f.payload[1]));
    return expected<std::string, DgtError>::success(std::string(buf));
  }

  static expected<std::string, DgtError> DecodeText(const Frame& f) {
    std::string text(f.payload.begin(), f.payload.end());
    while (!text.empty() && (text.back() == '\0' || text.back() == ' ')) {
      text.pop_back();
    }
    return expected<std::string, DgtError>::success(std::move(text));
  }

  static expected<void, DgtError> Acknowledge(
      const expected<Frame, DgtError>& r) {
    if (!r) return expected<void, DgtError>::error(r.get_error());
    return expected<void, DgtError>::success();
  }

  // --------------------------------------------------------------------------
  // Supervisor (loop thread)
  // --------------------------------------------------------------------------

  void SetState(DriverState s) {
    const auto prev =
        static_cast<DriverState>(state_.exchange(static_cast<uint8_t>(s)));
    if (prev != s) {
      DGT_LOG_DEBUG("Driver", "%s -> %s", DriverStateName(prev),
                    DriverStateName(s));
    }
  }

  uint32_t NextBackoff() {
    const uint32_t delay = backoff_ms_;
    backoff_ms_ = std::min(backoff_ms_ * 2U, config_.max_backoff_ms);
    return delay;
  }

  void ScheduleScan(uint32_t delay_ms) {
    SetState(DriverState::kSearching);
    scan_timer_ = loop_.PostAfter(delay_ms, [this]() {
      scan_timer_ = kInvalidTimerId;
      Scan();
    });
  }

  void Scan() {
    if (closed_.load(std::memory_order_acquire)) return;
    SetState(DriverState::kSearching);
    candidates_ = scanner_->ListCandidates(config_.port_patterns);
    next_candidate_ = 0U;
    if (candidates_.empty()) {
      const uint32_t delay = NextBackoff();
      DGT_LOG_DEBUG("Driver", "no matching port, retry in %u ms", delay);
      ScheduleScan(delay);
      return;
    }
    TryNextCandidate();
  }

  void TryNextCandidate() {
    if (closed_.load(std::memory_order_acquire)) return;
    if (next_candidate_ >= candidates_.size()) {
      ScheduleScan(NextBackoff());
      return;
    }
    const PortInfo info = candidates_[next_candidate_++];
    SetState(DriverState::kConnecting);

    std::unique_ptr<Transport> transport = factory_();
    if (!transport) {
      (void)loop_.Post([this]() { TryNextCandidate(); });
      return;
    }
    auto opened = transport->Open(info.path);
    if (!opened) {
      DGT_LOG_DEBUG("Driver", "cannot open %s: %s", info.path.c_str(),
                    DgtErrorName(opened.get_error()));
      (void)loop_.Post([this]() { TryNextCandidate(); });
      return;
    }

    const uint64_t gen = ++generation_;
    handshake_gen_ = gen;
    handshake_session_ = Session::Create(
        loop_, bus_, info.path, std::move(transport),
        [this, gen](DgtError cause) { OnSessionDeath(gen, cause); });

    auto slot = std::make_shared<ReplySlot>();
    auto sent =
        handshake_session_->Send(BoardQuery(kCmdSendVersion, kMsgVersion),
                                 config_.handshake_timeout_ms, slot);
    if (!sent) {
      AbandonHandshake();
      return;
    }
    DGT_LOG_DEBUG("Driver", "querying version on %s", info.path.c_str());
    slot->SetContinuation([this, gen](const ReplySlot::Result& res) {
      const bool ok = res.has_value();
      (void)loop_.Post([this, gen, ok]() { OnHandshakeResult(gen, ok); });
    });
  }

  void AbandonHandshake() {
    if (handshake_session_) {
      handshake_session_->Close();
      handshake_session_.reset();
    }
    handshake_gen_ = 0U;
    (void)loop_.Post([this]() { TryNextCandidate(); });
  }

  void OnHandshakeResult(uint64_t gen, bool ok) {
    if (closed_.load(std::memory_order_acquire) || gen != handshake_gen_ ||
        !handshake_session_) {
      return;
    }
    if (!ok || handshake_session_->IsDead()) {
      DGT_LOG_DEBUG("Driver", "%s did not answer the version query",
                    handshake_session_->Port().c_str());
      AbandonHandshake();
      return;
    }

    session_ = std::move(handshake_session_);
    session_gen_ = gen;
    handshake_gen_ = 0U;
    session_->MarkRunning();
    backoff_ms_ = config_.scan_interval_ms;
    {
      std::lock_guard<std::mutex> lock(port_mtx_);
      connected_port_ = session_->Port();
    }
    if (config_.enable_updates) {
      (void)session_->Send(BoardCommand(kCmdSendUpdateNice));
    }
    (void)session_->Send(BoardCommand(kCmdSendBoard));

    SetState(DriverState::kConnected);
    DGT_LOG_INFO("Driver", "connected to %s", session_->Port().c_str());
    const std::string port = session_->Port();
    bus_.Emit(ConnectedEvent{port});
    if (session_ && session_->IsRunning()) {
      ready_.Set();
    }
  }

  void OnSessionDeath(uint64_t gen, DgtError cause) {
    if (closed_.load(std::memory_order_acquire)) return;
    if (gen == handshake_gen_) {
      // The pending handshake fails with ConnectionLost and moves on.
      return;
    }
    if (gen != session_gen_ || !session_) return;

    DGT_LOG_INFO("Driver", "lost %s (%s), searching",
                 session_->Port().c_str(), DgtErrorName(cause));
    ready_.Clear();
    session_.reset();
    session_gen_ = 0U;
    {
      std::lock_guard<std::mutex> lock(port_mtx_);
      connected_port_.clear();
    }
    backoff_ms_ = config_.scan_interval_ms;
    ScheduleScan(NextBackoff());
  }

  void Teardown() {
    if (scan_timer_ != kInvalidTimerId) {
      (void)loop_.CancelTimer(scan_timer_);
      scan_timer_ = kInvalidTimerId;
    }
    SetState(DriverState::kClosed);
    handshake_gen_ = 0U;
    session_gen_ = 0U;
    if (handshake_session_) {
      handshake_session_->Close(DgtError::kClosed);
      handshake_session_.reset();
    }
    if (session_) {
      session_->Close(DgtError::kClosed);
      session_.reset();
    }
    std::lock_guard<std::mutex> lock(port_mtx_);
    connected_port_.clear();
  }

  DriverConfig config_;
  std::unique_ptr<PortEnumerator> enumerator_;
  TransportFactory factory_;
  std::unique_ptr<PortScanner> scanner_;

  EventBus bus_;
  ReadySignal ready_;
  std::atomic<uint8_t> state_{static_cast<uint8_t>(DriverState::kIdle)};
  std::atomic<bool> started_{false};
  std::atomic<bool> closed_{false};

  mutable std::mutex port_mtx_;
  std::string connected_port_;

  // Loop-thread state
  std::vector<PortInfo> candidates_;
  size_t next_candidate_ = 0U;
  uint32_t backoff_ms_ = 0U;
  TimerId scan_timer_ = kInvalidTimerId;
  uint64_t generation_ = 0U;
  uint64_t handshake_gen_ = 0U;
  uint64_t session_gen_ = 0U;
  std::shared_ptr<Session> handshake_session_;
  std::shared_ptr<Session> session_;

  // Declared last: its thread is joined before the members above go away.
  EventLoop loop_;
};

/// @brief Construct and Start() a Driver in one step.
inline std::unique_ptr<Driver> AutoConnect(
    DriverConfig config, std::unique_ptr<PortEnumerator> enumerator = nullptr,
    TransportFactory factory = nullptr) {
  std::unique_ptr<Driver> driver(
      new Driver(std::move(config), std::move(enumerator), std::move(factory)));
  (void)driver->Start();
  return driver;
}

}  // namespace dgt

#endif  // DGT_DRIVER_HPP_
