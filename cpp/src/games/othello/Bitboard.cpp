#include "games/othello/Bitboard.hpp"

namespace othello {

std::vector<Move> Bitboard::hot_bits_coordinates() const {
  std::vector<Move> coordinates;
  coordinates.reserve(popcount());

  mask_t remaining = bits_;
  while (remaining.any()) {
    mask_t lowest = remaining.lowest_bit();  // v & -v
    int index = lowest.countr_zero();
    coordinates.push_back(Move{index % size(), index / size()});
    remaining ^= lowest;
  }
  return coordinates;
}

std::string Bitboard::to_str() const {
  std::string s;
  for (int y = 0; y < size(); ++y) {
    if (y) s += '\n';
    for (int x = 0; x < size(); ++x) {
      s += get(x, y) ? "|·|" : "| |";
    }
  }
  return s;
}

}  // namespace othello
