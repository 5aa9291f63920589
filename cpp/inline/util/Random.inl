#include "util/Random.hpp"

#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"

#include <chrono>
#include <type_traits>

namespace util {

inline auto Random::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Random options");

  return desc.template add_option<"seed">(po::value<int>(&seed)->default_value(seed),
                                          "prng seed (0 seeds from the clock)");
}

inline void Random::init(const Params& params) {
  if (params.seed != 0) set_seed(params.seed);
}

inline void Random::set_seed(int seed) { default_prng().seed(seed); }

template <std::integral T, std::integral U>
auto Random::uniform_sample(std::mt19937& prng, T lower, U upper) {
  using V = std::common_type_t<T, U>;
  if (V(lower) >= V(upper)) {
    throw Exception("Empty sampling range [{}, {})", lower, upper);
  }
  std::uniform_int_distribution<V> dist(V(lower), V(upper) - 1);
  return dist(prng);
}

template <std::integral T, std::integral U>
auto Random::uniform_sample(T lower, U upper) {
  return uniform_sample(default_prng(), lower, upper);
}

template <typename T>
const T& Random::choose(std::mt19937& prng, const std::vector<T>& items) {
  if (items.empty()) {
    throw Exception("Cannot choose from an empty vector");
  }
  return items[uniform_sample(prng, size_t(0), items.size())];
}

template <typename T>
const T& Random::choose(const std::vector<T>& items) {
  return choose(default_prng(), items);
}

inline std::mt19937& Random::default_prng() {
  static std::mt19937 prng(
    std::chrono::high_resolution_clock::now().time_since_epoch().count());
  return prng;
}

}  // namespace util
