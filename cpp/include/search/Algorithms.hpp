#pragma once

#include "games/othello/BasicTypes.hpp"
#include "games/othello/GameState.hpp"
#include "search/Heuristics.hpp"
#include "search/SearchParams.hpp"

#include <cstdint>
#include <string>

namespace search {

enum Algorithm : int8_t {
  kMinimax,
  kAlphaBeta,
};

/*
 * Depth-limited adversarial search over a single shared GameState.
 *
 * minimax() and alphabeta() walk the tree with play()/pop() pairs on the state they are given, and
 * return it unchanged. Leaves are scored with heuristic(state, max_player); the Empty sentinel
 * scores as 0.
 *
 * A node whose side to move has no legal move, but where the game is not over, is searched again
 * at depth-1 without playing anything. alphabeta() hands such a node to minimax(), so its value
 * does not depend on the window.
 */
struct TreeSearch {
  static score_t minimax(othello::GameState& state, int depth, othello::Color max_player,
                         heuristic_t heuristic);

  // alphabeta(state, d, -kInfinity, kInfinity, c, h) == minimax(state, d, c, h)
  static score_t alphabeta(othello::GameState& state, int depth, score_t alpha, score_t beta,
                           othello::Color max_player, heuristic_t heuristic);

  /*
   * Best move for the side to move, scored from max_player's point of view. Each candidate is
   * played on a fork of state and searched at depth-1 with a fresh window; the first candidate with
   * the strictly best score wins.
   *
   * Returns a pass if depth is 0 or the game is over. When max_player is not the side to move, no
   * candidate can beat the initial bound and a pass is returned.
   */
  static othello::Move find_best_move(const othello::GameState& state, int depth,
                                      othello::Color max_player, Algorithm algorithm,
                                      HeuristicType heuristic, bool benchmark = false);

  // String overload: "minimax" selects minimax, anything else alphabeta. See Heuristics::parse().
  static othello::Move find_best_move(const othello::GameState& state, int depth,
                                      othello::Color max_player, const std::string& algorithm,
                                      const std::string& heuristic, bool benchmark = false);

  static othello::Move find_best_move(const othello::GameState& state, othello::Color max_player,
                                      const SearchParams& params);

  // Uniformly random legal move for the side to move. Throws if there is none.
  static othello::Move random_move(const othello::GameState& state);

  static Algorithm parse_algorithm(const std::string& name);
  static const char* algorithm_name(Algorithm algorithm);
};

}  // namespace search
