#pragma once

#include "games/othello/BasicTypes.hpp"
#include "games/othello/SizeMaskRegistry.hpp"

#include <string>
#include <vector>

namespace othello {

/*
 * A set of cells on a square board of a given size, one bit per cell (see Constants.hpp for the
 * bit order).
 *
 * Bitboard is a cheap-to-copy value type. The SizeMasks it points to are owned by a
 * SizeMaskRegistry, which must outlive it. Bits outside the board are always zero.
 */
class Bitboard {
 public:
  explicit Bitboard(const SizeMasks& masks, const mask_t& bits = mask_t());

  int size() const { return masks_->size; }
  const mask_t& bits() const { return bits_; }
  const SizeMasks& masks() const { return *masks_; }

  // Throws OutOfBoundsError if (x, y) is outside the board.
  void set(int x, int y, bool value);
  bool get(int x, int y) const;

  bool in_bounds(int x, int y) const;

  Bitboard shift(Direction direction) const;

  int popcount() const { return bits_.popcount(); }
  bool empty() const { return bits_.empty(); }

  // Coordinates of the set cells, in ascending bit order (row-major, x fastest).
  std::vector<Move> hot_bits_coordinates() const;

  Bitboard operator~() const;
  Bitboard operator&(const Bitboard& other) const;
  Bitboard operator|(const Bitboard& other) const;
  Bitboard operator^(const Bitboard& other) const;
  Bitboard& operator&=(const Bitboard& other);
  Bitboard& operator|=(const Bitboard& other);
  Bitboard& operator^=(const Bitboard& other);

  // Bitboards of different sizes are never equal.
  bool operator==(const Bitboard& other) const;

  size_t hash() const;

  /*
   * One line per row, e.g. for a 3x3 board with (1, 0) set:
   *
   * | ||·|| |
   * | || || |
   * | || || |
   */
  std::string to_str() const;

 private:
  int to_index(int x, int y) const;

  const SizeMasks* masks_;
  mask_t bits_;
};

}  // namespace othello

#include "inline/games/othello/Bitboard.inl"
