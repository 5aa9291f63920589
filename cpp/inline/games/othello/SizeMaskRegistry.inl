#include "games/othello/SizeMaskRegistry.hpp"

namespace othello {

template <Direction D>
inline mask_t SizeMasks::shift(const mask_t& bits) const {
  if constexpr (D == kNorth) {
    return bits >> size;
  } else if constexpr (D == kSouth) {
    return (bits << size) & full_mask;
  } else if constexpr (D == kEast) {
    return (bits & east_mask) << 1;
  } else if constexpr (D == kWest) {
    return (bits & west_mask) >> 1;
  } else if constexpr (D == kNorthEast) {
    return (bits & east_mask) >> (size - 1);
  } else if constexpr (D == kNorthWest) {
    return (bits & west_mask) >> (size + 1);
  } else if constexpr (D == kSouthEast) {
    return ((bits & east_mask) << (size + 1)) & full_mask;
  } else {
    static_assert(D == kSouthWest);
    return ((bits & west_mask) << (size - 1)) & full_mask;
  }
}

inline mask_t SizeMasks::shift(const mask_t& bits, Direction direction) const {
  switch (direction) {
    case kNorth:
      return shift<kNorth>(bits);
    case kSouth:
      return shift<kSouth>(bits);
    case kEast:
      return shift<kEast>(bits);
    case kWest:
      return shift<kWest>(bits);
    case kNorthEast:
      return shift<kNorthEast>(bits);
    case kNorthWest:
      return shift<kNorthWest>(bits);
    case kSouthEast:
      return shift<kSouthEast>(bits);
    default:
      return shift<kSouthWest>(bits);
  }
}

}  // namespace othello
