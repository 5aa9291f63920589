#pragma once

#include "games/othello/BasicTypes.hpp"
#include "games/othello/SizeMaskRegistry.hpp"

namespace othello {

/*
 * Bulk bit-parallel move generation over raw masks.
 *
 * own and opp are the cells of the player to move and of its opponent. Neither function mutates
 * its inputs.
 */
struct MoveGenerator {
  /*
   * Legal destination cells for the owner of own: every empty cell reached from an own disc by
   * sliding, in one of the 8 directions, across one or more contiguous opp discs.
   */
  static mask_t line_cap_move(const mask_t& own, const mask_t& opp, const SizeMasks& masks);

  /*
   * Cells that change hands when the owner of own places a disc at (x, y). The result includes
   * (x, y) itself.
   *
   * Assumes (x, y) is legal; the result is meaningless otherwise.
   */
  static mask_t line_cap(int x, int y, const mask_t& own, const mask_t& opp,
                         const SizeMasks& masks);

 private:
  template <Direction D>
  static mask_t flood(const mask_t& own, const mask_t& opp, const mask_t& empty,
                      const SizeMasks& masks);

  template <Direction D>
  static mask_t capture_run(const mask_t& start, const mask_t& own, const mask_t& opp,
                            const SizeMasks& masks);
};

}  // namespace othello

#include "inline/games/othello/MoveGenerator.inl"
