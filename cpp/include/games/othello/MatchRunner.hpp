#pragma once

#include "games/othello/BasicTypes.hpp"
#include "games/othello/GameState.hpp"
#include "games/othello/SizeMaskRegistry.hpp"
#include "games/othello/players/AbstractPlayer.hpp"

#include <boost/filesystem.hpp>

#include <ostream>
#include <string>

namespace othello {

struct MatchParams {
  auto make_options_description();

  // Throws util::CleanException on an invalid combination of values.
  void validate() const;

  int size = 8;
  std::string black_player = "ai";
  std::string white_player = "random";
  int num_games = 1;
  std::string save_file;
  bool print_board = true;

  // Search settings of the white "ai" player. Unset values fall back to the shared search options.
  int white_depth = 0;
  std::string white_algorithm;
  std::string white_heuristic;
};

struct GameResult {
  int black_count = 0;
  int white_count = 0;
  Color winner = kEmpty;  // kEmpty on a draw
};

/*
 * Plays complete games between two players on a board of a fixed size.
 */
class MatchRunner {
 public:
  MatchRunner(BoardSize size, SizeMaskRegistry& registry);

  /*
   * Plays one game from the opening position. If out is non-null, the position is printed there
   * after every move.
   */
  GameResult play_game(AbstractPlayer& black, AbstractPlayer& white, std::ostream* out = nullptr);

  // Position at the end of the last game, with its full history.
  const GameState& state() const { return state_; }

  // Writes IO::export_game() of the last game to path.
  void save_game(const boost::filesystem::path& path) const;

  /*
   * Save file for game game_index (0-based) of num_games: save_file itself for a single game,
   * otherwise "<stem>-<game_index+1><extension>".
   */
  static boost::filesystem::path save_path(const std::string& save_file, int game_index,
                                           int num_games);

 private:
  GameState state_;
};

}  // namespace othello

#include "inline/games/othello/MatchRunner.inl"
