#include "games/othello/Bitboard.hpp"

#include "games/othello/Exceptions.hpp"
#include "util/Asserts.hpp"

#include <boost/functional/hash.hpp>

namespace othello {

inline Bitboard::Bitboard(const SizeMasks& masks, const mask_t& bits)
    : masks_(&masks), bits_(bits & masks.full_mask) {}

inline bool Bitboard::in_bounds(int x, int y) const {
  return x >= 0 && x < size() && y >= 0 && y < size();
}

inline int Bitboard::to_index(int x, int y) const {
  if (!in_bounds(x, y)) {
    throw OutOfBoundsError("Cell ({}, {}) is outside a board of size {}", x, y, size());
  }
  return y * size() + x;
}

inline void Bitboard::set(int x, int y, bool value) { bits_.set(to_index(x, y), value); }

inline bool Bitboard::get(int x, int y) const { return bits_.test(to_index(x, y)); }

inline Bitboard Bitboard::shift(Direction direction) const {
  return Bitboard(*masks_, masks_->shift(bits_, direction));
}

inline Bitboard Bitboard::operator~() const { return Bitboard(*masks_, ~bits_); }

inline Bitboard Bitboard::operator&(const Bitboard& other) const {
  Bitboard b = *this;
  return b &= other;
}

inline Bitboard Bitboard::operator|(const Bitboard& other) const {
  Bitboard b = *this;
  return b |= other;
}

inline Bitboard Bitboard::operator^(const Bitboard& other) const {
  Bitboard b = *this;
  return b ^= other;
}

inline Bitboard& Bitboard::operator&=(const Bitboard& other) {
  DEBUG_ASSERT(size() == other.size(), "size mismatch ({} != {})", size(), other.size());
  bits_ &= other.bits_;
  return *this;
}

inline Bitboard& Bitboard::operator|=(const Bitboard& other) {
  DEBUG_ASSERT(size() == other.size(), "size mismatch ({} != {})", size(), other.size());
  bits_ |= other.bits_;
  return *this;
}

inline Bitboard& Bitboard::operator^=(const Bitboard& other) {
  DEBUG_ASSERT(size() == other.size(), "size mismatch ({} != {})", size(), other.size());
  bits_ ^= other.bits_;
  return *this;
}

inline bool Bitboard::operator==(const Bitboard& other) const {
  return size() == other.size() && bits_ == other.bits_;
}

inline size_t Bitboard::hash() const {
  size_t seed = 0;
  boost::hash_combine(seed, size());
  boost::hash_combine(seed, bits_.hash());
  return seed;
}

}  // namespace othello
