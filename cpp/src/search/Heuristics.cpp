#include "search/Heuristics.hpp"

#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"

#include <magic_enum/magic_enum.hpp>

#include <array>
#include <cmath>

namespace search {

namespace {

// round(100 * (mine - theirs) / (mine + theirs)), with 0 for an empty denominator
score_t percent_difference(int mine, int theirs) {
  int total = mine + theirs;
  if (total == 0) return 0;
  return score_t(std::lround(100.0 * (mine - theirs) / total));
}

}  // namespace

heuristic_value_t Heuristics::corners_captured(const othello::GameState& state,
                                               othello::Color color) {
  LOG_TRACE("Calculating corners_captured heuristic for {}", othello::color_name(color));
  int last = state.size() - 1;
  const std::array<othello::Move, 4> corners = {
    othello::Move{0, 0}, othello::Move{last, 0}, othello::Move{0, last}, othello::Move{last, last}};

  othello::Color other = othello::opposite(color);
  int mine = 0;
  int theirs = 0;
  for (const auto& corner : corners) {
    othello::Color owner = state.get_player_at(corner.x, corner.y);
    if (owner == color) mine++;
    if (owner == other) theirs++;
  }
  return percent_difference(mine, theirs);
}

heuristic_value_t Heuristics::coin_parity(const othello::GameState& state, othello::Color color) {
  LOG_TRACE("Calculating coin_parity heuristic for {}", othello::color_name(color));
  if (color == othello::kEmpty) return std::nullopt;
  return percent_difference(state.count(color), state.count(othello::opposite(color)));
}

heuristic_value_t Heuristics::mobility(const othello::GameState& state, othello::Color color) {
  LOG_TRACE("Calculating mobility heuristic for {}", othello::color_name(color));
  int black_moves = state.get_possible_moves(othello::kBlack).popcount();
  int white_moves = state.get_possible_moves(othello::kWhite).popcount();
  if (black_moves + white_moves == 0) return 0;

  switch (color) {
    case othello::kBlack:
      return percent_difference(black_moves, white_moves);
    case othello::kWhite:
      return percent_difference(white_moves, black_moves);
    default:
      return std::nullopt;
  }
}

heuristic_value_t Heuristics::all_in_one(const othello::GameState& state, othello::Color color) {
  constexpr score_t kCornersWeight = 10;
  constexpr score_t kMobilityWeight = 4;
  constexpr score_t kCoinsWeight = 1;

  if (color == othello::kEmpty) return std::nullopt;
  return kCornersWeight * corners_captured(state, color).value_or(0) +
         kMobilityWeight * mobility(state, color).value_or(0) +
         kCoinsWeight * coin_parity(state, color).value_or(0);
}

heuristic_t Heuristics::get(HeuristicType type) {
  switch (type) {
    case kCornersCaptured:
      return corners_captured;
    case kCoinParity:
      return coin_parity;
    case kMobility:
      return mobility;
    case kAllInOne:
      return all_in_one;
    default:
      throw util::Exception("Unknown HeuristicType: {}", int(type));
  }
}

HeuristicType Heuristics::parse(const std::string& name) {
  for (HeuristicType type : magic_enum::enum_values<HeuristicType>()) {
    if (name == Heuristics::name(type)) return type;
  }
  return kAllInOne;
}

const char* Heuristics::name(HeuristicType type) {
  switch (type) {
    case kCornersCaptured:
      return "corners_captured";
    case kCoinParity:
      return "coin_parity";
    case kMobility:
      return "mobility";
    case kAllInOne:
      return "all_in_one";
    default:
      throw util::Exception("Unknown HeuristicType: {}", int(type));
  }
}

}  // namespace search
