#pragma once

#include "games/othello/BasicTypes.hpp"
#include "games/othello/GameState.hpp"

#include <ostream>
#include <string>

namespace othello {

/*
 * Text rendering of a GameState.
 *
 * The export format (export_game()) is a "# board" section followed by a "# history" section:
 *
 * # board
 * O
 * _ _ _ _ _ _
 * _ _ _ _ _ _
 * _ _ O X _ _
 * _ _ X X X _
 * _ _ _ _ _ _
 * _ _ _ _ _ _
 * # history
 * 1. X e4
 *
 * The second line is the side to move. Each history line is "<turn>. X <move> O <move>"; a turn
 * whose first entry is a White move gets an "X -1-1" placeholder.
 */
struct IO {
  // "c4" style, or "-1-1" for a pass
  static std::string move_to_str(const Move& move) { return move.to_str(); }

  static std::string export_board(const GameState& state);
  static std::string export_history(const GameState& state);
  static std::string export_game(const GameState& state);

  /*
   * Human-readable board with column letters and 1-based row numbers, marking the legal moves of
   * the side to move with "·", followed by the disc counts.
   */
  static void print_state(std::ostream& ss, const GameState& state);
};

}  // namespace othello
