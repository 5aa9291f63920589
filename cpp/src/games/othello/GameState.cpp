#include "games/othello/GameState.hpp"

#include "games/othello/Exceptions.hpp"
#include "games/othello/MoveGenerator.hpp"
#include "util/LoggingUtil.hpp"

#include <boost/functional/hash.hpp>

namespace othello {

GameState::GameState(BoardSize size, SizeMaskRegistry& registry)
    : board_size_(size),
      masks_(&registry.get(size)),
      black_(*masks_),
      white_(*masks_) {
  LOG_DEBUG("Initializing GameState with size {}", int(size));
  init_board();
}

GameState::GameState(BoardSize size, SizeMaskRegistry& registry, const Bitboard& black,
                     const Bitboard& white, Color current_player)
    : board_size_(size),
      masks_(&registry.get(size)),
      black_(black),
      white_(white),
      current_player_(current_player) {
  if (black.size() != size || white.size() != size) {
    LOG_ERROR("Bitboard size mismatch. Board size: {}, black size: {}, white size: {}", int(size),
              black.size(), white.size());
    throw IllegalBoardSizeError("Bitboard size mismatch: board {}, black {}, white {}", int(size),
                                black.size(), white.size());
  }
  if (!(black & white).empty()) {
    throw util::CleanException("Black and white bitboards overlap:\n{}", (black & white).to_str());
  }
  if (current_player == kEmpty) {
    throw util::CleanException("Side to move must be black or white");
  }
  LOG_DEBUG("Initializing GameState with size {} from bitboards, {} to move", int(size),
            color_name(current_player));
}

GameState::GameState(const GameState& other, ForkTag)
    : board_size_(other.board_size_),
      masks_(other.masks_),
      black_(other.black_),
      white_(other.white_),
      current_player_(other.current_player_) {}

void GameState::init_board() {
  int half = size() / 2;
  white_.set(half - 1, half - 1, true);
  white_.set(half, half, true);
  black_.set(half - 1, half, true);
  black_.set(half, half - 1, true);
}

Bitboard GameState::get_possible_moves(Color color) const {
  if (color == kEmpty) return Bitboard(*masks_);
  return Bitboard(*masks_,
                  MoveGenerator::line_cap_move(own(color).bits(), opp(color).bits(), *masks_));
}

Bitboard GameState::line_cap(int x, int y, Color color) const {
  return Bitboard(*masks_,
                  MoveGenerator::line_cap(x, y, own(color).bits(), opp(color).bits(), *masks_));
}

bool GameState::has_moves(Color color) const {
  return MoveGenerator::line_cap_move(own(color).bits(), opp(color).bits(), *masks_).any();
}

void GameState::play(int x, int y) {
  if (x == -1 && y == -1) {
    LOG_DEBUG("Player {} passes their turn", color_name(current_player_));
    history_.push_back(HistoryEntry{black_, white_, Move::pass(), current_player_});
    return;
  }

  Color player = current_player_;
  bool legal = black_.in_bounds(x, y) && get_possible_moves(player).get(x, y);
  if (!legal) {
    LOG_ERROR("Move ({}, {}) from player {} is illegal", x, y, color_name(player));
    throw IllegalMoveError("Move {}:{} from player {} is illegal", x, y, color_name(player));
  }
  LOG_DEBUG("Move ({}, {}) is legal", x, y);

  history_.push_back(HistoryEntry{black_, white_, Move{x, y}, player});

  Bitboard capture = line_cap(x, y, player);
  if (player == kBlack) {
    black_ |= capture;
    white_ &= ~capture;
  } else {
    white_ |= capture;
    black_ &= ~capture;
  }

  current_player_ = opposite(player);
  if (!has_moves(current_player_)) {
    LOG_DEBUG("Player {} has no legal moves and must pass", color_name(current_player_));
    history_.push_back(HistoryEntry{black_, white_, Move::pass(), current_player_});
    current_player_ = player;
  }
}

void GameState::pop() {
  if (history_.empty()) {
    throw CannotPopError("Cannot pop from this board");
  }

  HistoryEntry entry = history_.back();
  history_.pop_back();
  if (entry.move.is_pass() && !history_.empty()) {
    entry = history_.back();
    history_.pop_back();
  }
  LOG_DEBUG("Undo move {} of player {}", entry.move.to_str(), color_name(entry.player));

  black_ = entry.black;
  white_ = entry.white;
  current_player_ = entry.player;
}

bool GameState::is_game_over() const {
  return forced_game_over_ || (!has_moves(kBlack) && !has_moves(kWhite));
}

void GameState::restart() {
  LOG_DEBUG("Restarting game with board size {}", size());
  history_.clear();
  black_ = Bitboard(*masks_);
  white_ = Bitboard(*masks_);
  current_player_ = kStartingColor;
  forced_game_over_ = false;
  init_board();
}

const HistoryEntry* GameState::get_last_play() const {
  for (auto it = history_.rbegin(); it != history_.rend(); ++it) {
    if (!it->move.is_pass()) return &*it;
  }
  return nullptr;
}

Color GameState::get_player_at(int x, int y) const {
  if (black_.get(x, y)) return kBlack;
  if (white_.get(x, y)) return kWhite;
  return kEmpty;
}

int GameState::count(Color color) const {
  switch (color) {
    case kBlack:
      return black_.popcount();
    case kWhite:
      return white_.popcount();
    default:
      return masks_->num_cells - black_.popcount() - white_.popcount();
  }
}

GameState GameState::fork() const { return GameState(*this, ForkTag{}); }

bool GameState::operator==(const GameState& other) const {
  return current_player_ == other.current_player_ && black_ == other.black_ &&
         white_ == other.white_;
}

size_t GameState::hash() const {
  size_t seed = 0;
  boost::hash_combine(seed, int(current_player_));
  boost::hash_combine(seed, black_.hash());
  boost::hash_combine(seed, white_.hash());
  return seed;
}

}  // namespace othello
