#pragma once

#include "games/othello/players/AbstractPlayer.hpp"
#include "search/Algorithms.hpp"
#include "search/SearchParams.hpp"

namespace othello {

/*
 * Chooses its move with search::TreeSearch::find_best_move(), maximizing its own color.
 */
class SearchPlayer : public AbstractPlayer {
 public:
  explicit SearchPlayer(const search::SearchParams& params) : params_(params) {
    params_.validate();
  }

  Move get_move(const GameState& state) override {
    return search::TreeSearch::find_best_move(state, get_my_color(), params_);
  }

  const search::SearchParams& params() const { return params_; }

 private:
  const search::SearchParams params_;
};

}  // namespace othello
