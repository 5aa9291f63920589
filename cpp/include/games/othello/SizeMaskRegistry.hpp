#pragma once

#include "games/othello/BasicTypes.hpp"

#include <map>

namespace othello {

/*
 * Masks shared by every bitboard of a given board size.
 *
 * west_mask excludes the leftmost column (x == 0) of every row, east_mask excludes the rightmost
 * column (x == size-1). Horizontal and diagonal shifts clear the column that would otherwise wrap
 * into the neighboring row before shifting.
 */
struct SizeMasks {
  int size = 0;
  int num_cells = 0;
  mask_t full_mask;
  mask_t west_mask;
  mask_t east_mask;

  template <Direction D>
  mask_t shift(const mask_t& bits) const;

  mask_t shift(const mask_t& bits, Direction direction) const;
};

/*
 * Lazily-built, append-only mapping from board size to its SizeMasks. References returned by get()
 * stay valid for the lifetime of the registry.
 *
 * One registry is constructed at process start and passed by reference to every GameState.
 */
class SizeMaskRegistry {
 public:
  // Throws IllegalBoardSizeError unless 1 <= size <= kMaxBoardDimension.
  const SizeMasks& get(int size);

  size_t num_sizes() const { return masks_.size(); }

  static SizeMasks build(int size);

 private:
  std::map<int, SizeMasks> masks_;
};

}  // namespace othello

#include "inline/games/othello/SizeMaskRegistry.inl"
