#include "search/SearchParams.hpp"

#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"

namespace search {

inline auto SearchParams::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Search options");

  return desc
    .template add_option<"depth", 'd'>(po::value<int>(&depth)->default_value(depth),
                                       "search depth in plies")
    .template add_option<"algorithm", 'a'>(
      po::value<std::string>(&algorithm)->default_value(algorithm),
      "search algorithm: minimax or alphabeta (alias: ab)")
    .template add_option<"heuristic">(
      po::value<std::string>(&heuristic)->default_value(heuristic),
      "leaf evaluation: corners_captured, coin_parity, mobility or all_in_one")
    .template add_flag<"benchmark", "no-benchmark">(&benchmark, "log the time of each search",
                                                    "do not log search times");
}

inline void SearchParams::validate() const {
  if (depth <= 0) {
    throw util::CleanException("AI depth must be positive (got {})", depth);
  }
}

}  // namespace search
