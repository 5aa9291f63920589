#pragma once

#include "games/othello/players/AbstractPlayer.hpp"
#include "util/Random.hpp"

namespace othello {

/*
 * RandomPlayer always chooses uniformly at random among the set of legal moves.
 */
class RandomPlayer : public AbstractPlayer {
 public:
  Move get_move(const GameState& state) override {
    return util::Random::choose(
      state.get_possible_moves(state.current_player()).hot_bits_coordinates());
  }
};

}  // namespace othello
