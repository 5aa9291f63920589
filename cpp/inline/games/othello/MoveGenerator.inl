#include "games/othello/MoveGenerator.hpp"

namespace othello {

template <Direction D>
inline mask_t MoveGenerator::flood(const mask_t& own, const mask_t& opp, const mask_t& empty,
                                   const SizeMasks& masks) {
  mask_t moves;
  mask_t run = opp & masks.shift<D>(own);
  while (run.any()) {
    mask_t next = masks.shift<D>(run);
    moves |= empty & next;
    run = opp & next;
  }
  return moves;
}

template <Direction D>
inline mask_t MoveGenerator::capture_run(const mask_t& start, const mask_t& own, const mask_t& opp,
                                         const SizeMasks& masks) {
  mask_t run;
  mask_t ptr = start;
  while (true) {
    ptr = masks.shift<D>(ptr);
    if ((ptr & opp).any()) {
      run |= ptr;
    } else if ((ptr & own).any()) {
      return run;
    } else {
      return mask_t();  // walked off the board or onto an empty cell
    }
  }
}

inline mask_t MoveGenerator::line_cap_move(const mask_t& own, const mask_t& opp,
                                           const SizeMasks& masks) {
  mask_t empty = masks.full_mask & ~(own | opp);
  return flood<kNorth>(own, opp, empty, masks) | flood<kSouth>(own, opp, empty, masks) |
         flood<kEast>(own, opp, empty, masks) | flood<kWest>(own, opp, empty, masks) |
         flood<kNorthEast>(own, opp, empty, masks) | flood<kNorthWest>(own, opp, empty, masks) |
         flood<kSouthEast>(own, opp, empty, masks) | flood<kSouthWest>(own, opp, empty, masks);
}

inline mask_t MoveGenerator::line_cap(int x, int y, const mask_t& own, const mask_t& opp,
                                      const SizeMasks& masks) {
  mask_t position = mask_t::bit(y * masks.size + x);
  return position | capture_run<kNorth>(position, own, opp, masks) |
         capture_run<kSouth>(position, own, opp, masks) |
         capture_run<kEast>(position, own, opp, masks) |
         capture_run<kWest>(position, own, opp, masks) |
         capture_run<kNorthEast>(position, own, opp, masks) |
         capture_run<kNorthWest>(position, own, opp, masks) |
         capture_run<kSouthEast>(position, own, opp, masks) |
         capture_run<kSouthWest>(position, own, opp, masks);
}

}  // namespace othello
