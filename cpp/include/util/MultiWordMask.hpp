#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace util {

// util::MultiWordMask<W> is a fixed-width unsigned integer of 64*W bits, stored as W little-endian
// 64-bit words (bit k lives in word k/64). It supports the operations needed to treat a board of
// up to 64*W cells as a single integer: bitwise logic, shifts that carry across word boundaries,
// population count and lowest-set-bit isolation.
template <int W>
class MultiWordMask {
 public:
  static_assert(W >= 1, "MultiWordMask requires W >= 1");

  using word_t = uint64_t;
  static constexpr int kNumWords = W;
  static constexpr int kNumBits = 64 * W;

  MultiWordMask() = default;

  // Mask with the low bits set to value.
  explicit MultiWordMask(word_t value) { words_[0] = value; }

  // Mask with exactly one bit set. Returns an empty mask if index is outside [0, kNumBits).
  static MultiWordMask bit(int index);

  // Mask with bits [0, n) set.
  static MultiWordMask low_bits(int n);

  word_t word(int i) const { return words_[i]; }
  void set_word(int i, word_t value) { words_[i] = value; }

  bool test(int index) const;
  void set(int index, bool value = true);

  bool any() const;
  bool empty() const { return !any(); }

  // Classical SWAR bit count, applied per 64-bit word and summed.
  int popcount() const;

  // Index of the lowest set bit, or kNumBits if empty.
  int countr_zero() const;

  // Mask holding only the lowest set bit of *this (v & -v), or empty if *this is empty.
  MultiWordMask lowest_bit() const;

  MultiWordMask operator~() const;

  MultiWordMask& operator&=(const MultiWordMask& o);
  MultiWordMask& operator|=(const MultiWordMask& o);
  MultiWordMask& operator^=(const MultiWordMask& o);
  MultiWordMask& operator<<=(int n);
  MultiWordMask& operator>>=(int n);

  MultiWordMask operator&(const MultiWordMask& o) const;
  MultiWordMask operator|(const MultiWordMask& o) const;
  MultiWordMask operator^(const MultiWordMask& o) const;
  MultiWordMask operator<<(int n) const;
  MultiWordMask operator>>(int n) const;

  bool operator==(const MultiWordMask&) const = default;

  size_t hash() const;
  friend size_t hash_value(const MultiWordMask& m) { return m.hash(); }

  // Returns the low num_bits bits as 0 and 1 chars, most significant first, in the style of
  // std::bitset<N>::to_string().
  std::string to_string(int num_bits = kNumBits) const;

  static int swar_popcount(word_t x);

 private:
  std::array<word_t, W> words_{};
};

}  // namespace util

#include "inline/util/MultiWordMask.inl"
