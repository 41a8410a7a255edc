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
 * @file board.hpp
 * @brief Board state decoding: full dumps, field updates and FEN rendering.
 *
 * Squares are indexed from the board's point of view: 0 = a8, 7 = h8,
 * 56 = a1, 63 = h1. Piece codes are kept raw; only BoardFen() and
 * ToString() interpret them.
 */

#ifndef DGT_BOARD_HPP_
#define DGT_BOARD_HPP_

#include "dgt/protocol.hpp"
#include "dgt/vocabulary.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace dgt {

static constexpr uint32_t kBoardSquares = 64U;

/// @brief FEN letter for a piece code, '\0' for empty and marker codes.
inline char PieceSymbol(uint8_t code) noexcept {
  static constexpr char kSymbols[] = " PRNBKQprnbkq";
  if (code == kPieceEmpty || code > kPieceBlackQueen) {
    return '\0';
  }
  return kSymbols[code];
}

/// @brief Algebraic name of a square index ("a8" for 0, "h1" for 63).
inline std::string SquareName(uint32_t index) {
  if (index >= kBoardSquares) {
    return "-";
  }
  std::string name(2U, ' ');
  name[0] = static_cast<char>('a' + (index % 8U));
  name[1] = static_cast<char>('8' - (index / 8U));
  return name;
}

// ============================================================================
// BoardState
// ============================================================================

struct BoardState {
  std::array<uint8_t, kBoardSquares> squares{};
  /// Arrival sequence of the frame that produced this snapshot.
  uint64_t sequence = 0U;

  uint8_t At(uint32_t index) const noexcept {
    return (index < kBoardSquares) ? squares[index] : kPieceEmpty;
  }

  /**
   * @brief Piece placement field of a FEN string, rank 8 first.
   *
   * Empty runs are collapsed into digits. Marker codes render as empty.
   */
  std::string BoardFen() const {
    std::string fen;
    fen.reserve(72U);
    for (uint32_t rank = 0U; rank < 8U; ++rank) {
      uint32_t empty = 0U;
      for (uint32_t file = 0U; file < 8U; ++file) {
        const char symbol = PieceSymbol(squares[rank * 8U + file]);
        if (symbol == '\0') {
          ++empty;
          continue;
        }
        if (empty > 0U) {
          fen.push_back(static_cast<char>('0' + empty));
          empty = 0U;
        }
        fen.push_back(symbol);
      }
      if (empty > 0U) {
        fen.push_back(static_cast<char>('0' + empty));
      }
      if (rank != 7U) {
        fen.push_back('/');
      }
    }
    return fen;
  }

  /// @brief 8x8 text diagram, rank 8 on top, '.' for empty squares.
  std::string ToString() const {
    std::string out;
    out.reserve(128U);
    for (uint32_t rank = 0U; rank < 8U; ++rank) {
      for (uint32_t file = 0U; file < 8U; ++file) {
        const char symbol = PieceSymbol(squares[rank * 8U + file]);
        out.push_back(symbol == '\0' ? '.' : symbol);
        out.push_back(file == 7U ? '\n' : ' ');
      }
    }
    return out;
  }

  bool operator==(const BoardState& other) const noexcept {
    return squares == other.squares;
  }
  bool operator!=(const BoardState& other) const noexcept {
    return !(*this == other);
  }
};

// ============================================================================
// Decoders
// ============================================================================

/// @brief Decode a BOARD_DUMP payload (one piece code per square).
inline expected<BoardState, DgtError> DecodeBoardDump(
    const std::vector<uint8_t>& payload, uint64_t sequence = 0U) {
  if (payload.size() != kBoardSquares) {
    return expected<BoardState, DgtError>::error(DgtError::kBadReply);
  }
  BoardState board;
  for (uint32_t i = 0U; i < kBoardSquares; ++i) {
    board.squares[i] = payload[i];
  }
  board.sequence = sequence;
  return expected<BoardState, DgtError>::success(board);
}

/// @brief Apply a FIELD_UPDATE payload [square, piece] to @p board.
inline expected<void, DgtError> ApplyFieldUpdate(
    BoardState& board, const std::vector<uint8_t>& payload,
    uint64_t sequence = 0U) {
  if (payload.size() != 2U || payload[0] >= kBoardSquares) {
    return expected<void, DgtError>::error(DgtError::kBadReply);
  }
  board.squares[payload[0]] = payload[1];
  board.sequence = sequence;
  return expected<void, DgtError>::success();
}

}  // namespace dgt

#endif  // DGT_BOARD_HPP_
