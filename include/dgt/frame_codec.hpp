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
 * @file frame_codec.hpp
 * @brief DGT message framing: stateless decode, streaming decoder, encoders.
 *
 * Board -> host:  [id | 0x80] [size >> 7] [size & 0x7F] [payload]
 * Host -> board:  [command] [payload]
 *
 * DecodeNext() never consumes bytes it cannot fully interpret. Feeding a
 * FrameDecoder byte by byte yields exactly the frames produced by feeding the
 * whole stream at once.
 */

#ifndef DGT_FRAME_CODEC_HPP_
#define DGT_FRAME_CODEC_HPP_

#include "dgt/log.hpp"
#include "dgt/platform.hpp"
#include "dgt/protocol.hpp"
#include "dgt/vocabulary.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace dgt {

// ============================================================================
// Frame / Command / ReplyKey
// ============================================================================

/**
 * @brief One complete board -> host message.
 *
 * @c seq is not on the wire: the Session stamps every frame with its arrival
 * order so snapshots can be ordered by the consumer.
 */
struct Frame {
  uint8_t tag = 0U;
  uint32_t length = 0U;
  std::vector<uint8_t> payload;
  uint64_t seq = 0U;
};

/** @brief Correlation key of a pending request. */
struct ReplyKey {
  uint8_t tag = 0U;
  /// Clock sub-command for clock acknowledgements, 0 otherwise.
  uint8_t sub = 0U;

  bool operator==(const ReplyKey& other) const noexcept {
    return tag == other.tag && sub == other.sub;
  }
  bool operator!=(const ReplyKey& other) const noexcept {
    return !(*this == other);
  }
  bool operator<(const ReplyKey& other) const noexcept {
    return (tag != other.tag) ? (tag < other.tag) : (sub < other.sub);
  }
};

/** @brief One host -> board request. */
struct Command {
  uint8_t tag = 0U;
  std::vector<uint8_t> payload;
  bool expects_reply = false;
  ReplyKey reply;
};

/// @brief Command without a correlated reply (e.g. SEND_UPDATE_NICE).
inline Command BoardCommand(uint8_t tag) {
  Command cmd;
  cmd.tag = tag;
  return cmd;
}

/// @brief Command answered by a board message with tag @p reply_tag.
inline Command BoardQuery(uint8_t tag, uint8_t reply_tag) {
  Command cmd;
  cmd.tag = tag;
  cmd.expects_reply = true;
  cmd.reply = ReplyKey{reply_tag, 0U};
  return cmd;
}

// ============================================================================
// Stateless Decode
// ============================================================================

enum class CodecError : uint8_t {
  kNeedMoreData = 0,
  kMalformed,
};

struct DecodedFrame {
  Frame frame;
  /// Bytes of the input that belong to @c frame.
  size_t consumed = 0U;
};

/**
 * @brief Decode the first complete message in @p data.
 *
 * @return The frame and the number of bytes it occupies, kNeedMoreData when
 *         the buffer holds only a prefix of a valid message, or kMalformed
 *         when the stream cannot be a DGT message (sync loss).
 */
inline expected<DecodedFrame, CodecError> DecodeNext(const uint8_t* data,
                                                     size_t size) {
  using Result = expected<DecodedFrame, CodecError>;
  if (size == 0U) {
    return Result::error(CodecError::kNeedMoreData);
  }

  const uint8_t tag = data[0];
  if ((tag & kMessageBit) == 0U) {
    return Result::error(CodecError::kMalformed);
  }
  for (size_t i = 1U; i < size && i < kHeaderSize; ++i) {
    if ((data[i] & 0x80U) != 0U) {
      return Result::error(CodecError::kMalformed);
    }
  }
  if (size < kHeaderSize) {
    return Result::error(CodecError::kNeedMoreData);
  }

  const uint32_t total = (static_cast<uint32_t>(data[1]) << 7) |
                         static_cast<uint32_t>(data[2]);
  if (total < kHeaderSize) {
    return Result::error(CodecError::kMalformed);
  }
  const uint32_t fixed = FixedMessageSize(tag);
  if (fixed != 0U && total != fixed) {
    return Result::error(CodecError::kMalformed);
  }
  if (size < total) {
    return Result::error(CodecError::kNeedMoreData);
  }

  DecodedFrame out;
  out.frame.tag = tag;
  out.frame.length = total - kHeaderSize;
  out.frame.payload.assign(data + kHeaderSize, data + total);
  out.consumed = total;
  return Result::success(std::move(out));
}

// ============================================================================
// FrameDecoder (streaming)
// ============================================================================

/**
 * @brief Accumulates raw chunks and yields complete frames in order.
 *
 * Once a malformed message is seen the decoder stays malformed until
 * Reset(); the owning Session treats that as connection loss.
 */
class FrameDecoder final {
 public:
  void Feed(const uint8_t* data, size_t size) {
    if (size > 0U) {
      buffer_.insert(buffer_.end(), data, data + size);
    }
  }

  /**
   * @brief Pop the next complete frame.
   * @return kNeedMoreData when no complete frame is buffered.
   */
  expected<Frame, CodecError> Next() {
    if (malformed_) {
      return expected<Frame, CodecError>::error(CodecError::kMalformed);
    }
    auto r = DecodeNext(buffer_.data() + pos_, buffer_.size() - pos_);
    if (!r) {
      if (r.get_error() == CodecError::kMalformed) {
        malformed_ = true;
        DGT_LOG_WARN("Codec", "malformed message (lead byte 0x%02x, %zu buffered)",
                     buffer_[pos_], buffer_.size() - pos_);
      }
      Compact();
      return expected<Frame, CodecError>::error(r.get_error());
    }
    pos_ += r.value().consumed;
    Compact();
    return expected<Frame, CodecError>::success(std::move(r.value().frame));
  }

  size_t Buffered() const noexcept { return buffer_.size() - pos_; }
  bool IsMalformed() const noexcept { return malformed_; }

  void Reset() noexcept {
    buffer_.clear();
    pos_ = 0U;
    malformed_ = false;
  }

 private:
  void Compact() {
    if (pos_ == buffer_.size()) {
      buffer_.clear();
      pos_ = 0U;
    } else if (pos_ >= 4096U) {
      buffer_.erase(buffer_.begin(),
                    buffer_.begin() + static_cast<std::ptrdiff_t>(pos_));
      pos_ = 0U;
    }
  }

  std::vector<uint8_t> buffer_;
  size_t pos_ = 0U;
  bool malformed_ = false;
};

// ============================================================================
// Encoders
// ============================================================================

/// @brief Board envelope for @p frame; exact inverse of DecodeNext().
inline std::vector<uint8_t> EncodeFrame(const Frame& frame) {
  const uint32_t total =
      static_cast<uint32_t>(frame.payload.size()) + kHeaderSize;
  DGT_ASSERT(total <= kMaxMessageSize);
  std::vector<uint8_t> out;
  out.reserve(total);
  out.push_back(static_cast<uint8_t>(frame.tag | kMessageBit));
  out.push_back(static_cast<uint8_t>((total >> 7) & 0x7FU));
  out.push_back(static_cast<uint8_t>(total & 0x7FU));
  out.insert(out.end(), frame.payload.begin(), frame.payload.end());
  return out;
}

/// @brief Host envelope: command byte followed by the payload.
inline std::vector<uint8_t> EncodeCommand(const Command& cmd) {
  std::vector<uint8_t> out;
  out.reserve(1U + cmd.payload.size());
  out.push_back(cmd.tag);
  out.insert(out.end(), cmd.payload.begin(), cmd.payload.end());
  return out;
}

}  // namespace dgt

#endif  // DGT_FRAME_CODEC_HPP_
