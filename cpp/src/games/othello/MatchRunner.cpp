#include "games/othello/MatchRunner.hpp"

#include "games/othello/IO.hpp"
#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"
#include "util/LoggingUtil.hpp"

#include <fmt/format.h>

namespace othello {

MatchRunner::MatchRunner(BoardSize size, SizeMaskRegistry& registry) : state_(size, registry) {}

GameResult MatchRunner::play_game(AbstractPlayer& black, AbstractPlayer& white,
                                  std::ostream* out) {
  state_.restart();
  black.init_game(kBlack);
  white.init_game(kWhite);
  black.start_game();
  white.start_game();

  if (out) IO::print_state(*out, state_);

  while (!state_.is_game_over()) {
    Color color = state_.current_player();
    AbstractPlayer& player = color == kBlack ? black : white;
    Move move = player.get_move(state_);
    RELEASE_ASSERT(!move.is_pass(), "Player {} ({}) passed with {} legal moves available",
                   player.get_name(), color_name(color),
                   state_.get_possible_moves(color).popcount());
    state_.play(move);
    LOG_INFO("Turn {}: {} ({}) plays {}", state_.get_turn_id(), player.get_name(),
             color_name(color), move.to_str());
    if (out) IO::print_state(*out, state_);
  }

  black.end_game(state_);
  white.end_game(state_);

  GameResult result;
  result.black_count = state_.count(kBlack);
  result.white_count = state_.count(kWhite);
  if (result.black_count > result.white_count) {
    result.winner = kBlack;
  } else if (result.white_count > result.black_count) {
    result.winner = kWhite;
  }
  LOG_INFO("Game over: black {} white {} (winner: {})", result.black_count, result.white_count,
           color_name(result.winner));
  return result;
}

void MatchRunner::save_game(const boost::filesystem::path& path) const {
  boost_util::write_str_to_file(IO::export_game(state_), path);
  LOG_INFO("Saved game to {}", path.string());
}

boost::filesystem::path MatchRunner::save_path(const std::string& save_file, int game_index,
                                               int num_games) {
  boost::filesystem::path path(save_file);
  if (num_games <= 1) return path;

  std::string name =
    fmt::format("{}-{}{}", path.stem().string(), game_index + 1, path.extension().string());
  return path.parent_path() / name;
}

}  // namespace othello
