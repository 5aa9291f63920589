#pragma once

#include "games/othello/BasicTypes.hpp"
#include "games/othello/Bitboard.hpp"
#include "games/othello/SizeMaskRegistry.hpp"

#include <cstddef>
#include <functional>
#include <vector>

namespace othello {

/*
 * Snapshot pushed on every play(), including passes. black/white hold the position before the move
 * and player is the side that was to move.
 */
struct HistoryEntry {
  Bitboard black;
  Bitboard white;
  Move move;
  Color player;
};

/*
 * An Othello game in progress: two bitboards, the side to move, and an undo history.
 *
 * play() and pop() must be used with strict LIFO discipline: every play() made during a search
 * must be undone by a matching pop() before its caller continues (see search::ScopedMove).
 *
 * An automatic pass is recorded when the side that would move next has no legal move, so the
 * player to move always has a legal move unless the game is over. pop() undoes such a pass together
 * with the move that caused it.
 */
class GameState {
 public:
  GameState(BoardSize size, SizeMaskRegistry& registry);

  /*
   * Position given explicitly. Throws IllegalBoardSizeError if either bitboard's size differs from
   * size, and util::CleanException if the bitboards overlap.
   */
  GameState(BoardSize size, SizeMaskRegistry& registry, const Bitboard& black,
            const Bitboard& white, Color current_player = kStartingColor);

  BoardSize board_size() const { return board_size_; }
  int size() const { return board_size_; }
  const SizeMasks& masks() const { return *masks_; }

  Color current_player() const { return current_player_; }
  const Bitboard& black() const { return black_; }
  const Bitboard& white() const { return white_; }
  const Bitboard& bitboard(Color color) const { return color == kBlack ? black_ : white_; }

  // Legal destination cells for color.
  Bitboard get_possible_moves(Color color) const;

  // Cells flipped (plus the placed cell) if color placed at (x, y). Does not check legality.
  Bitboard line_cap(int x, int y, Color color) const;

  /*
   * (-1, -1) records a pass without changing the side to move. Any other coordinate must be a
   * legal move for the side to move, else IllegalMoveError is thrown and the state is unchanged.
   */
  void play(int x, int y);
  void play(const Move& move) { play(move.x, move.y); }

  // Throws CannotPopError if the history is empty.
  void pop();

  bool is_game_over() const;
  void force_game_over() { forced_game_over_ = true; }

  // Two history entries (passes included) per turn, starting at 1.
  int get_turn_id() const { return int(history_.size()) / 2 + 1; }

  // Back to the four-disc opening with Black to move and an empty history.
  void restart();

  // Most recent non-pass history entry, or nullptr if there is none.
  const HistoryEntry* get_last_play() const;
  const std::vector<HistoryEntry>& get_history() const { return history_; }

  Color get_player_at(int x, int y) const;
  int count(Color color) const;

  // Copy of the position and side to move, with an empty history.
  GameState fork() const;

  bool operator==(const GameState& other) const;
  size_t hash() const;

 private:
  struct ForkTag {};
  GameState(const GameState& other, ForkTag);

  void init_board();
  const Bitboard& own(Color color) const { return color == kBlack ? black_ : white_; }
  const Bitboard& opp(Color color) const { return color == kBlack ? white_ : black_; }
  bool has_moves(Color color) const;

  BoardSize board_size_;
  const SizeMasks* masks_;
  Bitboard black_;
  Bitboard white_;
  Color current_player_ = kStartingColor;
  std::vector<HistoryEntry> history_;
  bool forced_game_over_ = false;
};

}  // namespace othello

namespace std {

template <>
struct hash<othello::GameState> {
  size_t operator()(const othello::GameState& state) const { return state.hash(); }
};

}  // namespace std
