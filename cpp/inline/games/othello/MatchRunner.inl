#include "games/othello/MatchRunner.hpp"

#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"

namespace othello {

inline auto MatchParams::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Match options");

  return desc
    .template add_option<"size", 's'>(po::value<int>(&size)->default_value(size),
                                      "board size (6, 8, 10 or 12)")
    .template add_option<"black-player", 'b'>(
      po::value<std::string>(&black_player)->default_value(black_player),
      "black player type: ai or random")
    .template add_option<"white-player", 'w'>(
      po::value<std::string>(&white_player)->default_value(white_player),
      "white player type: ai or random")
    .template add_option<"num-games", 'n'>(po::value<int>(&num_games)->default_value(num_games),
                                           "number of games to play")
    .template add_option<"save-file", 'o'>(
      po::value<std::string>(&save_file)->default_value(save_file),
      "write the exported game to this file (numbered per game when --num-games > 1)")
    .template add_flag<"print-board", "no-print-board">(&print_board,
                                                        "print the board after every move",
                                                        "only print the final board")
    .template add_hidden_option<"white-depth">(
      po::value<int>(&white_depth)->default_value(white_depth),
      "search depth of the white ai player (0: use --depth)")
    .template add_hidden_option<"white-algorithm">(
      po::value<std::string>(&white_algorithm)->default_value(white_algorithm),
      "search algorithm of the white ai player (empty: use --algorithm)")
    .template add_hidden_option<"white-heuristic">(
      po::value<std::string>(&white_heuristic)->default_value(white_heuristic),
      "heuristic of the white ai player (empty: use --heuristic)");
}

inline void MatchParams::validate() const {
  to_board_size(size);
  for (const std::string& type : {black_player, white_player}) {
    if (type != "ai" && type != "random") {
      throw util::CleanException("Unknown player type \"{}\" (expected ai or random)", type);
    }
  }
  CLEAN_ASSERT(num_games > 0, "--num-games must be positive (got {})", num_games);
  CLEAN_ASSERT(white_depth >= 0, "--white-depth must be non-negative (got {})", white_depth);
}

}  // namespace othello
