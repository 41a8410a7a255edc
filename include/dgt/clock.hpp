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
 * @file clock.hpp
 * @brief DGT3000 clock sub-protocol: command builders and BWTIME decoding.
 *
 * The clock is reached through the board. Every clock command travels as
 *   0x2B [len] 0x03 [cmd] [args...] 0x00
 * and is acknowledged by a BWTIME message whose payload carries four
 * acknowledgement bytes spread over 7-bit fields. A BWTIME message that is
 * not an acknowledgement carries the current clock times instead.
 */

#ifndef DGT_CLOCK_HPP_
#define DGT_CLOCK_HPP_

#include "dgt/frame_codec.hpp"
#include "dgt/protocol.hpp"
#include "dgt/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace dgt {

/// BWTIME payload length (message size minus header).
static constexpr uint32_t kClockPayloadSize = kSizeBwTime - kHeaderSize;
/// Largest time the clock display can show: 9:59:59.
static constexpr uint32_t kClockMaxSeconds = 9U * 3600U + 59U * 60U + 59U;
/// Number of front buttons.
static constexpr uint8_t kClockButtonCount = 5U;

// ============================================================================
// ClockState
// ============================================================================

struct ClockState {
  uint32_t left_time_s = 0U;
  uint32_t right_time_s = 0U;
  bool left_running = false;
  bool right_running = false;
  bool left_flag = false;
  bool right_flag = false;
  bool left_time_per_move = false;
  bool right_time_per_move = false;
  bool left_final_flag = false;
  bool right_final_flag = false;
  bool battery_low = false;
  bool clock_connected = false;
  uint64_t sequence = 0U;

  bool operator==(const ClockState& o) const noexcept {
    return left_time_s == o.left_time_s && right_time_s == o.right_time_s &&
           left_running == o.left_running && right_running == o.right_running &&
           left_flag == o.left_flag && right_flag == o.right_flag &&
           left_time_per_move == o.left_time_per_move &&
           right_time_per_move == o.right_time_per_move &&
           left_final_flag == o.left_final_flag &&
           right_final_flag == o.right_final_flag &&
           battery_low == o.battery_low && clock_connected == o.clock_connected;
  }
  bool operator!=(const ClockState& o) const noexcept { return !(*this == o); }

  /// @brief e.g. "L 0:05:00 (running) | R 0:04:12".
  std::string ToString() const {
    if (!clock_connected) {
      return "no clock";
    }
    char buf[96];
    (void)std::snprintf(
        buf, sizeof(buf), "L %u:%02u:%02u%s%s | R %u:%02u:%02u%s%s%s",
        left_time_s / 3600U, (left_time_s / 60U) % 60U, left_time_s % 60U,
        left_running ? " (running)" : "", left_flag ? " (flag)" : "",
        right_time_s / 3600U, (right_time_s / 60U) % 60U, right_time_s % 60U,
        right_running ? " (running)" : "", right_flag ? " (flag)" : "",
        battery_low ? " [battery low]" : "");
    return std::string(buf);
  }
};

struct ClockAck {
  uint8_t header = 0U;
  uint8_t command = 0U;
  uint8_t arg0 = 0U;
  uint8_t arg1 = 0U;
};

// ============================================================================
// BWTIME Decoding
// ============================================================================

namespace detail {

inline uint32_t FromBcd(uint8_t v) noexcept {
  return static_cast<uint32_t>((v >> 4) & 0x0FU) * 10U +
         static_cast<uint32_t>(v & 0x0FU);
}

}  // namespace detail

/// @brief True when a BWTIME payload is a clock acknowledgement.
inline bool IsClockAck(const std::vector<uint8_t>& p) noexcept {
  if (p.size() < kClockPayloadSize) {
    return false;
  }
  return (p[0] & 0x0FU) == kClockAckNibble ||
         (p[3] & 0x0FU) == kClockAckNibble;
}

/**
 * @brief Reassemble the four acknowledgement bytes of a BWTIME payload.
 * @return kBadReply when the payload is not a well-formed acknowledgement.
 */
inline expected<ClockAck, DgtError> DecodeClockAck(
    const std::vector<uint8_t>& p) {
  if (!IsClockAck(p)) {
    return expected<ClockAck, DgtError>::error(DgtError::kBadReply);
  }
  ClockAck ack;
  ack.header = static_cast<uint8_t>((p[1] & 0x7FU) | ((p[3] << 3) & 0x80U));
  ack.command = static_cast<uint8_t>((p[2] & 0x7FU) | ((p[3] << 2) & 0x80U));
  ack.arg0 = static_cast<uint8_t>((p[4] & 0x7FU) | ((p[0] << 3) & 0x80U));
  ack.arg1 = static_cast<uint8_t>((p[5] & 0x7FU) | ((p[0] << 2) & 0x80U));
  if (ack.header != kClockAckHeader) {
    return expected<ClockAck, DgtError>::error(DgtError::kBadReply);
  }
  return expected<ClockAck, DgtError>::success(ack);
}

/// @brief Button index (0..4) of an unsolicited button acknowledgement.
inline expected<uint8_t, DgtError> ButtonFromAck(const ClockAck& ack) {
  if (ack.command != kClockAckButton || ack.arg1 < 0x31U ||
      ack.arg1 >= 0x31U + kClockButtonCount) {
    return expected<uint8_t, DgtError>::error(DgtError::kBadReply);
  }
  return expected<uint8_t, DgtError>::success(
      static_cast<uint8_t>(ack.arg1 - 0x31U));
}

/// @brief "major.minor" from a version acknowledgement.
inline std::string ClockVersionFromAck(const ClockAck& ack) {
  char buf[16];
  (void)std::snprintf(buf, sizeof(buf), "%u.%u",
                      static_cast<unsigned>(ack.arg0),
                      static_cast<unsigned>(ack.arg1));
  return std::string(buf);
}

/**
 * @brief Decode the clock times of a non-acknowledgement BWTIME payload.
 *
 * Bytes 0-2 hold the right side (hours + flags, BCD minutes, BCD seconds),
 * bytes 3-5 the left side, byte 6 the status bits.
 */
inline expected<ClockState, DgtError> DecodeClockTimes(
    const std::vector<uint8_t>& p, uint64_t sequence = 0U) {
  if (p.size() != kClockPayloadSize || IsClockAck(p)) {
    return expected<ClockState, DgtError>::error(DgtError::kBadReply);
  }
  ClockState st;
  st.right_time_s = static_cast<uint32_t>(p[0] & 0x0FU) * 3600U +
                    detail::FromBcd(p[1]) * 60U + detail::FromBcd(p[2]);
  st.left_time_s = static_cast<uint32_t>(p[3] & 0x0FU) * 3600U +
                   detail::FromBcd(p[4]) * 60U + detail::FromBcd(p[5]);
  st.right_flag = (p[0] & kClockHoursFlagFallen) != 0U;
  st.left_flag = (p[3] & kClockHoursFlagFallen) != 0U;
  st.right_time_per_move = (p[0] & kClockHoursTimePerMove) != 0U;
  st.left_time_per_move = (p[3] & kClockHoursTimePerMove) != 0U;
  st.right_final_flag = (p[0] & kClockHoursFinalFlag) != 0U;
  st.left_final_flag = (p[3] & kClockHoursFinalFlag) != 0U;

  const uint8_t status = p[6];
  const bool running = (status & kClockStatusRunning) != 0U;
  const bool tumbler_right = (status & kClockStatusTumblerRight) != 0U;
  st.right_running = running && tumbler_right;
  st.left_running = running && !tumbler_right;
  st.battery_low = (status & kClockStatusBatteryLow) != 0U;
  st.clock_connected = (status & kClockStatusNoClock) == 0U;
  st.sequence = sequence;
  return expected<ClockState, DgtError>::success(st);
}

// ============================================================================
// Command Builders
// ============================================================================

/**
 * @brief Wrap a clock command in the board's clock message envelope.
 *
 * The reply is the acknowledgement carrying @p clock_cmd.
 */
inline Command ClockCommand(uint8_t clock_cmd,
                            const std::vector<uint8_t>& args = {}) {
  Command cmd;
  cmd.tag = kCmdClockMessage;
  cmd.payload.reserve(args.size() + 4U);
  // Length counts every byte after itself: start, cmd, args, end.
  cmd.payload.push_back(static_cast<uint8_t>(args.size() + 3U));
  cmd.payload.push_back(kClockStartMessage);
  cmd.payload.push_back(clock_cmd);
  cmd.payload.insert(cmd.payload.end(), args.begin(), args.end());
  cmd.payload.push_back(kClockEndMessage);
  cmd.expects_reply = true;
  cmd.reply = ReplyKey{kMsgBwTime, clock_cmd};
  return cmd;
}

inline Command ClockVersionCommand() {
  return ClockCommand(kClockCmdVersion);
}

inline Command ClockEndDisplayCommand() { return ClockCommand(kClockCmdEnd); }

inline Command ClockButtonCommand() { return ClockCommand(kClockCmdButton); }

/// @brief Beep for @p duration_ms, rounded to 64 ms units (1..255).
inline Command ClockBeepCommand(uint32_t duration_ms) {
  uint32_t units = (duration_ms + kClockBeepUnitMs / 2U) / kClockBeepUnitMs;
  if (units < 1U) units = 1U;
  if (units > 255U) units = 255U;
  return ClockCommand(kClockCmdBeep, {static_cast<uint8_t>(units)});
}

/**
 * @brief Set both clock times and start (at most) one side.
 *
 * Times are clamped to kClockMaxSeconds. Callers reject both sides
 * running before building the command.
 */
inline Command ClockSetNRunCommand(uint32_t left_s, uint32_t right_s,
                                   bool left_running, bool right_running) {
  if (left_s > kClockMaxSeconds) left_s = kClockMaxSeconds;
  if (right_s > kClockMaxSeconds) right_s = kClockMaxSeconds;
  uint8_t side = kClockSidePaused;
  if (left_running) {
    side = kClockSideLeftRunning;
  } else if (right_running) {
    side = kClockSideRightRunning;
  }
  std::vector<uint8_t> args = {
      static_cast<uint8_t>(left_s / 3600U),
      static_cast<uint8_t>((left_s / 60U) % 60U),
      static_cast<uint8_t>(left_s % 60U),
      static_cast<uint8_t>(right_s / 3600U),
      static_cast<uint8_t>((right_s / 60U) % 60U),
      static_cast<uint8_t>(right_s % 60U),
      side,
  };
  return ClockCommand(kClockCmdSetNRun, args);
}

/// @brief Show up to 8 ASCII characters; shorter text is space padded.
inline Command ClockTextCommand(const std::string& text, bool beep) {
  std::vector<uint8_t> args(kClockTextLength + 1U, static_cast<uint8_t>(' '));
  for (size_t i = 0U; i < text.size() && i < kClockTextLength; ++i) {
    const unsigned char c = static_cast<unsigned char>(text[i]);
    args[i] = (c >= 0x20U && c < 0x7FU) ? c : static_cast<uint8_t>('?');
  }
  args[kClockTextLength] = beep ? 0x03U : 0x00U;
  return ClockCommand(kClockCmdAscii, args);
}

/// @brief Request the current clock times (answered by a BWTIME message).
inline Command ClockTimesQuery() {
  return BoardQuery(kCmdSendClock, kMsgBwTime);
}

}  // namespace dgt

#endif  // DGT_CLOCK_HPP_
