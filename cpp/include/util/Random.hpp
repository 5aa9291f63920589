#pragma once

#include <concepts>
#include <random>
#include <vector>

namespace util {

/*
 * Process-wide pseudo-random source. Unless a nonzero seed is installed via init() or set_seed(),
 * the generator is seeded from the clock.
 *
 * Each sampling function has an overload taking an explicit std::mt19937, for callers that need an
 * independent stream.
 */
class Random {
 public:
  struct Params {
    auto make_options_description();

    int seed = 0;  // 0: seed from the clock
  };

  static void init(const Params&);
  static void set_seed(int seed);

  // Uniform integer in [lower, upper). Throws util::Exception if the range is empty.
  template <std::integral T, std::integral U>
  static auto uniform_sample(std::mt19937& prng, T lower, U upper);

  template <std::integral T, std::integral U>
  static auto uniform_sample(T lower, U upper);

  // Uniformly chosen element of items. Throws util::Exception if items is empty.
  template <typename T>
  static const T& choose(std::mt19937& prng, const std::vector<T>& items);

  template <typename T>
  static const T& choose(const std::vector<T>& items);

  static std::mt19937& default_prng();
};

}  // namespace util

#include "inline/util/Random.inl"
