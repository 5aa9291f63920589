#pragma once

#include "games/othello/BasicTypes.hpp"
#include "games/othello/GameState.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace search {

using score_t = int;

// std::nullopt is returned when the color being scored is othello::kEmpty.
using heuristic_value_t = std::optional<score_t>;
using heuristic_t = heuristic_value_t (*)(const othello::GameState&, othello::Color);

// Bound on any heuristic magnitude; used as the initial alpha/beta window.
constexpr score_t kInfinity = 10000;

enum HeuristicType : int8_t {
  kCornersCaptured,
  kCoinParity,
  kMobility,
  kAllInOne,
};

/*
 * Static evaluations of a position from the point of view of color. The difference-based ones are
 * percentages in [-100, 100], rounded to the nearest integer, with
 * h(state, opposite(color)) == -h(state, color).
 */
struct Heuristics {
  // Corners owned by color vs. its opponent. 0 if no corner is owned.
  static heuristic_value_t corners_captured(const othello::GameState& state, othello::Color color);

  // Disc count difference. 0 on an empty board.
  static heuristic_value_t coin_parity(const othello::GameState& state, othello::Color color);

  // Legal move count difference. 0 if neither side can move.
  static heuristic_value_t mobility(const othello::GameState& state, othello::Color color);

  // 10 * corners_captured + 4 * mobility + coin_parity, unclamped.
  static heuristic_value_t all_in_one(const othello::GameState& state, othello::Color color);

  static heuristic_t get(HeuristicType type);

  // "corners_captured", "coin_parity", "mobility" or "all_in_one". Any other name maps to
  // kAllInOne.
  static HeuristicType parse(const std::string& name);
  static const char* name(HeuristicType type);
};

}  // namespace search
