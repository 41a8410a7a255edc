/**
 * @file test_clock.cpp
 * @brief Tests for clock.hpp: BWTIME decoding and clock command builders.
 */

#include <catch2/catch.hpp>
#include "dgt/clock.hpp"

#include "fake_device.hpp"

#include <vector>

using dgt_test::AckPayload;
using dgt_test::ClockTimesPayload;

// ============================================================================
// Acknowledgements
// ============================================================================

TEST_CASE("clock - Acknowledgement bytes are reassembled", "[clock]") {
  auto p = AckPayload(0x10, 0x88, 0x81, 0x33);
  REQUIRE(dgt::IsClockAck(p));
  auto ack = dgt::DecodeClockAck(p);
  REQUIRE(ack.has_value());
  REQUIRE(ack.value().header == 0x10);
  REQUIRE(ack.value().command == 0x88);
  REQUIRE(ack.value().arg0 == 0x81);
  REQUIRE(ack.value().arg1 == 0x33);
}

TEST_CASE("clock - Button acknowledgement", "[clock]") {
  auto ack = dgt::DecodeClockAck(AckPayload(0x10, 0x88, 0x00, 0x33)).value();
  auto button = dgt::ButtonFromAck(ack);
  REQUIRE(button.has_value());
  REQUIRE(button.value() == 2U);

  ack.arg1 = 0x36;
  REQUIRE_FALSE(dgt::ButtonFromAck(ack).has_value());
}

TEST_CASE("clock - Version acknowledgement", "[clock]") {
  auto ack = dgt::DecodeClockAck(
                 AckPayload(0x10, dgt::kClockCmdVersion, 1, 5))
                 .value();
  REQUIRE(ack.command == dgt::kClockCmdVersion);
  REQUIRE(dgt::ClockVersionFromAck(ack) == "1.5");
}

TEST_CASE("clock - Acknowledgement with wrong header is rejected",
          "[clock]") {
  auto r = dgt::DecodeClockAck(AckPayload(0x11, 0x0B, 0, 0));
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == dgt::DgtError::kBadReply);
}

// ============================================================================
// Clock Times
// ============================================================================

TEST_CASE("clock - Times decode with left side running", "[clock]") {
  auto p = ClockTimesPayload(10, 7, dgt::kClockStatusRunning);
  REQUIRE_FALSE(dgt::IsClockAck(p));
  auto r = dgt::DecodeClockTimes(p, 42U);
  REQUIRE(r.has_value());
  const auto& st = r.value();
  REQUIRE(st.left_time_s == 10U);
  REQUIRE(st.right_time_s == 7U);
  REQUIRE(st.left_running);
  REQUIRE_FALSE(st.right_running);
  REQUIRE(st.clock_connected);
  REQUIRE(st.sequence == 42U);
}

TEST_CASE("clock - Tumbler selects the running side", "[clock]") {
  auto r = dgt::DecodeClockTimes(ClockTimesPayload(
      3600 + 5 * 60 + 30, 59,
      dgt::kClockStatusRunning | dgt::kClockStatusTumblerRight));
  REQUIRE(r.has_value());
  REQUIRE(r.value().left_time_s == 3600U + 330U);
  REQUIRE(r.value().right_time_s == 59U);
  REQUIRE(r.value().right_running);
  REQUIRE_FALSE(r.value().left_running);
}

TEST_CASE("clock - Status bits", "[clock]") {
  auto st = dgt::DecodeClockTimes(
                ClockTimesPayload(0, 0, dgt::kClockStatusBatteryLow))
                .value();
  REQUIRE(st.battery_low);
  REQUIRE_FALSE(st.left_running);
  REQUIRE_FALSE(st.right_running);

  auto none = dgt::DecodeClockTimes(
                  ClockTimesPayload(0, 0, dgt::kClockStatusNoClock))
                  .value();
  REQUIRE_FALSE(none.clock_connected);
  REQUIRE(none.ToString() == "no clock");
}

TEST_CASE("clock - Flag bits in the hours byte", "[clock]") {
  auto p = ClockTimesPayload(0, 0, 0);
  p[0] |= dgt::kClockHoursFlagFallen;
  p[3] |= dgt::kClockHoursFinalFlag;
  auto st = dgt::DecodeClockTimes(p).value();
  REQUIRE(st.right_flag);
  REQUIRE_FALSE(st.left_flag);
  REQUIRE(st.left_final_flag);
}

TEST_CASE("clock - State equality ignores sequence", "[clock]") {
  auto a = dgt::DecodeClockTimes(ClockTimesPayload(10, 7, 1), 1U).value();
  auto b = dgt::DecodeClockTimes(ClockTimesPayload(10, 7, 1), 2U).value();
  auto c = dgt::DecodeClockTimes(ClockTimesPayload(9, 7, 1), 3U).value();
  REQUIRE(a == b);
  REQUIRE(a != c);
}

TEST_CASE("clock - Wrong payload size is rejected", "[clock]") {
  std::vector<uint8_t> p(6U, 0U);
  REQUIRE_FALSE(dgt::DecodeClockTimes(p).has_value());
}

// ============================================================================
// Command Builders
// ============================================================================

TEST_CASE("clock - Version command", "[clock]") {
  auto cmd = dgt::ClockVersionCommand();
  REQUIRE(dgt::EncodeCommand(cmd) ==
          std::vector<uint8_t>{0x2B, 0x03, 0x03, 0x09, 0x00});
  REQUIRE(cmd.reply == dgt::ReplyKey{0x8D, 0x09});
}

TEST_CASE("clock - End display command", "[clock]") {
  REQUIRE(dgt::EncodeCommand(dgt::ClockEndDisplayCommand()) ==
          std::vector<uint8_t>{0x2B, 0x03, 0x03, 0x03, 0x00});
}

TEST_CASE("clock - Button query waits for the button ack", "[clock]") {
  auto cmd = dgt::ClockButtonCommand();
  REQUIRE(dgt::EncodeCommand(cmd) ==
          std::vector<uint8_t>{0x2B, 0x03, 0x03, 0x08, 0x00});
  REQUIRE(cmd.expects_reply);
  REQUIRE(cmd.reply == dgt::ReplyKey{0x8D, 0x08});
}

TEST_CASE("clock - Beep duration is rounded to 64 ms units", "[clock]") {
  REQUIRE(dgt::ClockBeepCommand(100).payload[3] == 2U);
  REQUIRE(dgt::ClockBeepCommand(0).payload[3] == 1U);
  REQUIRE(dgt::ClockBeepCommand(640).payload[3] == 10U);
  REQUIRE(dgt::ClockBeepCommand(100000).payload[3] == 255U);
  REQUIRE(dgt::ClockBeepCommand(100).reply == dgt::ReplyKey{0x8D, 0x0B});
}

TEST_CASE("clock - Set and run command", "[clock]") {
  auto cmd = dgt::ClockSetNRunCommand(10, 7, true, false);
  REQUIRE(dgt::EncodeCommand(cmd) ==
          std::vector<uint8_t>{0x2B, 0x0A, 0x03, 0x0A, 0, 0, 10, 0, 0, 7,
                               0x01, 0x00});

  auto right = dgt::ClockSetNRunCommand(3725, 60, false, true);
  REQUIRE(right.payload[3] == 1U);
  REQUIRE(right.payload[4] == 2U);
  REQUIRE(right.payload[5] == 5U);
  REQUIRE(right.payload[7] == 1U);
  REQUIRE(right.payload[9] == dgt::kClockSideRightRunning);

  auto paused = dgt::ClockSetNRunCommand(0, 0, false, false);
  REQUIRE(paused.payload[9] == dgt::kClockSidePaused);
}

TEST_CASE("clock - Text command pads and sanitises", "[clock]") {
  auto cmd = dgt::ClockTextCommand("Hello", false);
  REQUIRE(dgt::EncodeCommand(cmd) ==
          std::vector<uint8_t>{0x2B, 0x0C, 0x03, 0x0C, 'H', 'e', 'l', 'l',
                               'o', ' ', ' ', ' ', 0x00, 0x00});

  auto long_text = dgt::ClockTextCommand("destroyer\x01", true);
  REQUIRE(long_text.payload[3] == 'd');
  REQUIRE(long_text.payload[10] == 'e');
  REQUIRE(long_text.payload[11] == 0x03);

  auto odd = dgt::ClockTextCommand("a\tb", false);
  REQUIRE(odd.payload[4] == '?');
}

TEST_CASE("clock - Times query", "[clock]") {
  auto cmd = dgt::ClockTimesQuery();
  REQUIRE(dgt::EncodeCommand(cmd) == std::vector<uint8_t>{0x41});
  REQUIRE(cmd.reply == dgt::ReplyKey{0x8D, 0x00});
}
