#pragma once

#include "games/othello/BasicTypes.hpp"
#include "games/othello/GameState.hpp"

namespace search {

/*
 * Plays a move on construction and pops it on destruction, so that a search branch always leaves
 * the shared GameState as it found it, including on early exits from pruning or exceptions.
 */
class ScopedMove {
 public:
  ScopedMove(othello::GameState& state, const othello::Move& move) : state_(state) {
    state_.play(move);
  }
  ~ScopedMove() { state_.pop(); }

  ScopedMove(const ScopedMove&) = delete;
  ScopedMove& operator=(const ScopedMove&) = delete;

 private:
  othello::GameState& state_;
};

}  // namespace search
