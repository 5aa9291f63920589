#include "games/othello/SizeMaskRegistry.hpp"

#include "games/othello/Exceptions.hpp"
#include "util/LoggingUtil.hpp"

namespace othello {

const SizeMasks& SizeMaskRegistry::get(int size) {
  auto it = masks_.find(size);
  if (it != masks_.end()) return it->second;

  if (size < 1 || size > kMaxBoardDimension) {
    throw IllegalBoardSizeError("Bitboard size {} outside [1, {}]", size, kMaxBoardDimension);
  }
  LOG_DEBUG("Building masks for board size {}", size);
  return masks_.emplace(size, build(size)).first->second;
}

SizeMasks SizeMaskRegistry::build(int size) {
  SizeMasks masks;
  masks.size = size;
  masks.num_cells = size * size;
  for (int i = 0; i < masks.num_cells; ++i) {
    masks.full_mask.set(i);
    if (i % size != 0) masks.west_mask.set(i);
    if (i % size != size - 1) masks.east_mask.set(i);
  }
  return masks;
}

}  // namespace othello
