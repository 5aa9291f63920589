#pragma once

#include "util/Exception.hpp"

namespace othello {

// A placement that is not in the legal-move mask of the side to move. UI layers catch this and
// re-prompt.
class IllegalMoveError : public util::CleanException {
 public:
  using util::CleanException::CleanException;
};

// A board size outside {6, 8, 10, 12}, or bitboards whose size disagrees with the board.
class IllegalBoardSizeError : public util::CleanException {
 public:
  using util::CleanException::CleanException;
};

// pop() on a GameState with an empty history.
class CannotPopError : public util::Exception {
 public:
  using util::Exception::Exception;
};

// A cell coordinate outside the board.
class OutOfBoundsError : public util::Exception {
 public:
  using util::Exception::Exception;
};

}  // namespace othello
