#include "util/MultiWordMask.hpp"

#include <boost/functional/hash.hpp>

#include <bit>

namespace util {

template <int W>
MultiWordMask<W> MultiWordMask<W>::bit(int index) {
  MultiWordMask m;
  if (index >= 0 && index < kNumBits) {
    m.words_[index / 64] = word_t(1) << (index % 64);
  }
  return m;
}

template <int W>
MultiWordMask<W> MultiWordMask<W>::low_bits(int n) {
  MultiWordMask m;
  for (int i = 0; i < W; ++i) {
    int k = n - 64 * i;
    if (k >= 64) {
      m.words_[i] = ~word_t(0);
    } else if (k > 0) {
      m.words_[i] = (word_t(1) << k) - 1;
    }
  }
  return m;
}

template <int W>
bool MultiWordMask<W>::test(int index) const {
  return (words_[index / 64] >> (index % 64)) & word_t(1);
}

template <int W>
void MultiWordMask<W>::set(int index, bool value) {
  const word_t b = word_t(1) << (index % 64);
  if (value) {
    words_[index / 64] |= b;
  } else {
    words_[index / 64] &= ~b;
  }
}

template <int W>
bool MultiWordMask<W>::any() const {
  for (word_t w : words_) {
    if (w) return true;
  }
  return false;
}

template <int W>
int MultiWordMask<W>::swar_popcount(word_t x) {
  x = x - ((x >> 1) & 0x5555555555555555ull);
  x = (x & 0x3333333333333333ull) + ((x >> 2) & 0x3333333333333333ull);
  x = (x + (x >> 4)) & 0x0f0f0f0f0f0f0f0full;
  x = x + (x >> 8);
  x = x + (x >> 16);
  x = x + (x >> 32);
  return int(x & 0x7f);
}

template <int W>
int MultiWordMask<W>::popcount() const {
  int c = 0;
  for (word_t w : words_) {
    c += swar_popcount(w);
  }
  return c;
}

template <int W>
int MultiWordMask<W>::countr_zero() const {
  for (int i = 0; i < W; ++i) {
    if (words_[i]) return 64 * i + std::countr_zero(words_[i]);
  }
  return kNumBits;
}

template <int W>
MultiWordMask<W> MultiWordMask<W>::lowest_bit() const {
  MultiWordMask m;
  for (int i = 0; i < W; ++i) {
    word_t w = words_[i];
    if (w) {
      m.words_[i] = w & (~w + 1);
      break;
    }
  }
  return m;
}

template <int W>
MultiWordMask<W> MultiWordMask<W>::operator~() const {
  MultiWordMask m;
  for (int i = 0; i < W; ++i) m.words_[i] = ~words_[i];
  return m;
}

template <int W>
MultiWordMask<W>& MultiWordMask<W>::operator&=(const MultiWordMask& o) {
  for (int i = 0; i < W; ++i) words_[i] &= o.words_[i];
  return *this;
}

template <int W>
MultiWordMask<W>& MultiWordMask<W>::operator|=(const MultiWordMask& o) {
  for (int i = 0; i < W; ++i) words_[i] |= o.words_[i];
  return *this;
}

template <int W>
MultiWordMask<W>& MultiWordMask<W>::operator^=(const MultiWordMask& o) {
  for (int i = 0; i < W; ++i) words_[i] ^= o.words_[i];
  return *this;
}

// Shifts toward the most significant bit; bits shifted past kNumBits are lost.
template <int W>
MultiWordMask<W>& MultiWordMask<W>::operator<<=(int n) {
  if (n <= 0) return *this;
  if (n >= kNumBits) {
    words_.fill(0);
    return *this;
  }
  const int word_shift = n / 64;
  const int bit_shift = n % 64;
  for (int i = W - 1; i >= 0; --i) {
    const int src = i - word_shift;
    word_t v = 0;
    if (src >= 0) {
      v = words_[src] << bit_shift;
      if (bit_shift && src > 0) {
        v |= words_[src - 1] >> (64 - bit_shift);
      }
    }
    words_[i] = v;
  }
  return *this;
}

template <int W>
MultiWordMask<W>& MultiWordMask<W>::operator>>=(int n) {
  if (n <= 0) return *this;
  if (n >= kNumBits) {
    words_.fill(0);
    return *this;
  }
  const int word_shift = n / 64;
  const int bit_shift = n % 64;
  for (int i = 0; i < W; ++i) {
    const int src = i + word_shift;
    word_t v = 0;
    if (src < W) {
      v = words_[src] >> bit_shift;
      if (bit_shift && src + 1 < W) {
        v |= words_[src + 1] << (64 - bit_shift);
      }
    }
    words_[i] = v;
  }
  return *this;
}

template <int W>
MultiWordMask<W> MultiWordMask<W>::operator&(const MultiWordMask& o) const {
  MultiWordMask m = *this;
  return m &= o;
}

template <int W>
MultiWordMask<W> MultiWordMask<W>::operator|(const MultiWordMask& o) const {
  MultiWordMask m = *this;
  return m |= o;
}

template <int W>
MultiWordMask<W> MultiWordMask<W>::operator^(const MultiWordMask& o) const {
  MultiWordMask m = *this;
  return m ^= o;
}

template <int W>
MultiWordMask<W> MultiWordMask<W>::operator<<(int n) const {
  MultiWordMask m = *this;
  return m <<= n;
}

template <int W>
MultiWordMask<W> MultiWordMask<W>::operator>>(int n) const {
  MultiWordMask m = *this;
  return m >>= n;
}

template <int W>
size_t MultiWordMask<W>::hash() const {
  return boost::hash_range(words_.begin(), words_.end());
}

template <int W>
std::string MultiWordMask<W>::to_string(int num_bits) const {
  std::string s;
  s.reserve(num_bits);
  for (int k = num_bits - 1; k >= 0; --k) {
    s.push_back(test(k) ? '1' : '0');
  }
  return s;
}

}  // namespace util
