#pragma once

#include "games/othello/BasicTypes.hpp"
#include "games/othello/GameState.hpp"

#include <string>

namespace othello {

/*
 * Base class for all players.
 *
 * start_game() and end_game() are called when a game starts or ends. A single player might play
 * multiple games in succession, so override them if there is state to clear between games.
 *
 * get_move() is called when it is this player's turn. The returned move must be legal for the side
 * to move; the state passed in always has at least one legal move.
 */
class AbstractPlayer {
 public:
  virtual ~AbstractPlayer() = default;
  void set_name(const std::string& name) { name_ = name; }
  const std::string& get_name() const { return name_; }
  Color get_my_color() const { return my_color_; }

  void init_game(Color color) { my_color_ = color; }

  virtual void start_game() {}
  virtual Move get_move(const GameState& state) = 0;
  virtual void end_game(const GameState&) {}

 private:
  std::string name_;
  Color my_color_ = kEmpty;
};

}  // namespace othello
