#pragma once

#include "games/othello/Constants.hpp"
#include "util/MultiWordMask.hpp"

#include <array>
#include <cstdint>
#include <string>

namespace othello {

using mask_t = util::MultiWordMask<kNumMaskWords>;
static_assert(kMaxNumCells <= mask_t::kNumBits);

enum Color : int8_t { kBlack = 0, kWhite = 1, kEmpty = 2 };

const Color kStartingColor = kBlack;

// kBlack <-> kWhite, kEmpty -> kEmpty
Color opposite(Color color);

// 'X', 'O' or '_'
char glyph(Color color);

// "black", "white" or "empty"
const char* color_name(Color color);

enum BoardSize : int8_t {
  k6x6 = 6,
  k8x8 = 8,
  k10x10 = 10,
  k12x12 = 12,
};

// Throws IllegalBoardSizeError if size is not one of kLegalBoardSizes.
BoardSize to_board_size(int size);

enum Direction : int8_t {
  kNorth,
  kSouth,
  kEast,
  kWest,
  kNorthEast,
  kNorthWest,
  kSouthEast,
  kSouthWest,
};

constexpr std::array<Direction, 8> kAllDirections = {
  kNorth, kSouth, kEast, kWest, kNorthEast, kNorthWest, kSouthEast, kSouthWest};

/*
 * A board coordinate. (-1, -1) is reserved to mean "no move", i.e. a pass.
 */
struct Move {
  int x = -1;
  int y = -1;

  static Move pass() { return Move{}; }
  bool is_pass() const { return x == -1 && y == -1; }

  // "c4" style, or "-1-1" for a pass
  std::string to_str() const;

  auto operator<=>(const Move&) const = default;
};

}  // namespace othello

#include "inline/games/othello/BasicTypes.inl"
