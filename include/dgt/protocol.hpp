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
 * @file protocol.hpp
 * @brief DGT board and DGT3000 clock wire constants (conformance table).
 *
 * Board -> host messages:
 *   [id | 0x80] [size >> 7 (7 bits)] [size & 0x7F (7 bits)] [payload]
 * where size counts the whole message including the 3-byte header.
 *
 * Host -> board commands are a single command byte. Clock commands are
 * tunnelled through the board as
 *   0x2B [len] 0x03 [clock cmd] [args...] 0x00
 * and the clock answers with an acknowledgement encoded inside a BWTIME
 * message (see clock.hpp).
 */

#ifndef DGT_PROTOCOL_HPP_
#define DGT_PROTOCOL_HPP_

#include <cstdint>

namespace dgt {

// ============================================================================
// Host -> Board Commands
// ============================================================================

static constexpr uint8_t kCmdSendReset = 0x40U;
static constexpr uint8_t kCmdSendClock = 0x41U;
static constexpr uint8_t kCmdSendBoard = 0x42U;
static constexpr uint8_t kCmdSendUpdate = 0x43U;
static constexpr uint8_t kCmdSendUpdateBoard = 0x44U;
static constexpr uint8_t kCmdReturnSerialNr = 0x45U;
static constexpr uint8_t kCmdReturnBusAddress = 0x46U;
static constexpr uint8_t kCmdSendTrademark = 0x47U;
static constexpr uint8_t kCmdSendUpdateNice = 0x4BU;
static constexpr uint8_t kCmdSendVersion = 0x4DU;
static constexpr uint8_t kCmdReturnLongSerialNr = 0x55U;
static constexpr uint8_t kCmdClockMessage = 0x2BU;

// ============================================================================
// Board -> Host Messages
// ============================================================================

static constexpr uint8_t kMessageBit = 0x80U;

static constexpr uint8_t kMsgBoardDump = 0x06U | kMessageBit;
static constexpr uint8_t kMsgBwTime = 0x0DU | kMessageBit;
static constexpr uint8_t kMsgFieldUpdate = 0x0EU | kMessageBit;
static constexpr uint8_t kMsgEeMoves = 0x0FU | kMessageBit;
static constexpr uint8_t kMsgBusAddress = 0x10U | kMessageBit;
static constexpr uint8_t kMsgSerialNr = 0x11U | kMessageBit;
static constexpr uint8_t kMsgTrademark = 0x12U | kMessageBit;
static constexpr uint8_t kMsgVersion = 0x13U | kMessageBit;
static constexpr uint8_t kMsgBatteryStatus = 0x20U | kMessageBit;
static constexpr uint8_t kMsgLongSerialNr = 0x22U | kMessageBit;

/// Header: id(1) + size(2)
static constexpr uint32_t kHeaderSize = 3U;
/// Two 7-bit size bytes
static constexpr uint32_t kMaxMessageSize = 0x3FFFU;

// Total message sizes (header included) for fixed-size messages.
static constexpr uint32_t kSizeBoardDump = 67U;
static constexpr uint32_t kSizeBwTime = 10U;
static constexpr uint32_t kSizeFieldUpdate = 5U;
static constexpr uint32_t kSizeBusAddress = 5U;
static constexpr uint32_t kSizeSerialNr = 8U;
static constexpr uint32_t kSizeVersion = 5U;
static constexpr uint32_t kSizeLongSerialNr = 13U;

/**
 * @brief Expected total size of a fixed-size message.
 * @return 0 for variable-size or unknown message ids.
 */
constexpr uint32_t FixedMessageSize(uint8_t tag) noexcept {
  return (tag == kMsgBoardDump)      ? kSizeBoardDump
         : (tag == kMsgBwTime)       ? kSizeBwTime
         : (tag == kMsgFieldUpdate)  ? kSizeFieldUpdate
         : (tag == kMsgBusAddress)   ? kSizeBusAddress
         : (tag == kMsgSerialNr)     ? kSizeSerialNr
         : (tag == kMsgVersion)      ? kSizeVersion
         : (tag == kMsgLongSerialNr) ? kSizeLongSerialNr
                                     : 0U;
}

// ============================================================================
// Piece Codes
// ============================================================================

static constexpr uint8_t kPieceEmpty = 0x00U;
static constexpr uint8_t kPieceWhitePawn = 0x01U;
static constexpr uint8_t kPieceWhiteRook = 0x02U;
static constexpr uint8_t kPieceWhiteKnight = 0x03U;
static constexpr uint8_t kPieceWhiteBishop = 0x04U;
static constexpr uint8_t kPieceWhiteKing = 0x05U;
static constexpr uint8_t kPieceWhiteQueen = 0x06U;
static constexpr uint8_t kPieceBlackPawn = 0x07U;
static constexpr uint8_t kPieceBlackRook = 0x08U;
static constexpr uint8_t kPieceBlackKnight = 0x09U;
static constexpr uint8_t kPieceBlackBishop = 0x0AU;
static constexpr uint8_t kPieceBlackKing = 0x0BU;
static constexpr uint8_t kPieceBlackQueen = 0x0CU;
// Special marker pieces (draw / white win / black win), no FEN letter.
static constexpr uint8_t kPieceDrawMarker = 0x0DU;
static constexpr uint8_t kPieceWhiteWinMarker = 0x0EU;
static constexpr uint8_t kPieceBlackWinMarker = 0x0FU;

// ============================================================================
// DGT3000 Clock Sub-protocol
// ============================================================================

static constexpr uint8_t kClockStartMessage = 0x03U;
static constexpr uint8_t kClockEndMessage = 0x00U;

static constexpr uint8_t kClockCmdDisplay = 0x01U;
static constexpr uint8_t kClockCmdIcons = 0x02U;
static constexpr uint8_t kClockCmdEnd = 0x03U;
static constexpr uint8_t kClockCmdButton = 0x08U;
static constexpr uint8_t kClockCmdVersion = 0x09U;
static constexpr uint8_t kClockCmdSetNRun = 0x0AU;
static constexpr uint8_t kClockCmdBeep = 0x0BU;
static constexpr uint8_t kClockCmdAscii = 0x0CU;

/// Low nibble marking a BWTIME message as a clock acknowledgement.
static constexpr uint8_t kClockAckNibble = 0x0AU;
/// First acknowledgement byte of every valid clock ack.
static constexpr uint8_t kClockAckHeader = 0x10U;
/// Second acknowledgement byte of an unsolicited button report.
static constexpr uint8_t kClockAckButton = 0x88U;

/// Beep duration unit in milliseconds.
static constexpr uint32_t kClockBeepUnitMs = 64U;
/// Characters shown by the ASCII display command.
static constexpr uint32_t kClockTextLength = 8U;

// Set-and-run side byte.
static constexpr uint8_t kClockSideLeftRunning = 0x01U;
static constexpr uint8_t kClockSideRightRunning = 0x02U;
static constexpr uint8_t kClockSidePaused = 0x04U;

// BWTIME status byte (7th payload byte).
static constexpr uint8_t kClockStatusRunning = 0x01U;
static constexpr uint8_t kClockStatusTumblerRight = 0x02U;
static constexpr uint8_t kClockStatusBatteryLow = 0x04U;
static constexpr uint8_t kClockStatusNoClock = 0x20U;

// BWTIME hours byte flags.
static constexpr uint8_t kClockHoursFlagFallen = 0x10U;
static constexpr uint8_t kClockHoursTimePerMove = 0x20U;
static constexpr uint8_t kClockHoursFinalFlag = 0x40U;

}  // namespace dgt

#endif  // DGT_PROTOCOL_HPP_
