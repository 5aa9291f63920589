#include "games/othello/BasicTypes.hpp"
#include "games/othello/Bitboard.hpp"
#include "games/othello/Exceptions.hpp"
#include "games/othello/GameState.hpp"
#include "games/othello/MatchRunner.hpp"
#include "games/othello/SizeMaskRegistry.hpp"
#include "games/othello/players/RandomPlayer.hpp"
#include "games/othello/players/SearchPlayer.hpp"
#include "search/Algorithms.hpp"
#include "search/Heuristics.hpp"
#include "search/ScopedMove.hpp"
#include "search/SearchParams.hpp"
#include "util/Exception.hpp"
#include "util/GTestUtil.hpp"
#include "util/Random.hpp"

#include <gtest/gtest.h>
#include <magic_enum/magic_enum.hpp>

#include <string>
#include <vector>

using Bitboard = othello::Bitboard;
using GameState = othello::GameState;
using Heuristics = search::Heuristics;
using Move = othello::Move;
using SizeMaskRegistry = othello::SizeMaskRegistry;
using TreeSearch = search::TreeSearch;

Bitboard make_bitboard(SizeMaskRegistry& registry, int size, const std::vector<Move>& cells) {
  Bitboard board(registry.get(size));
  for (const Move& m : cells) board.set(m.x, m.y, true);
  return board;
}

// White to move on 6x6 with a single legal move, at (5, 5).
GameState make_single_move_state(SizeMaskRegistry& registry) {
  Bitboard black = make_bitboard(registry, 6, {{4, 4}});
  Bitboard white = make_bitboard(registry, 6, {{3, 3}});
  return GameState(othello::k6x6, registry, black, white, othello::kWhite);
}

// Black to move with no legal move, while White still has one: the game is not over.
GameState make_stalled_state(SizeMaskRegistry& registry) {
  Bitboard black = make_bitboard(registry, 6, {{1, 0}, {2, 0}});
  Bitboard white = make_bitboard(registry, 6, {{0, 0}});
  return GameState(othello::k6x6, registry, black, white, othello::kBlack);
}

void play_random_moves(GameState& state, int num_moves) {
  for (int i = 0; i < num_moves && !state.is_game_over(); ++i) {
    state.play(TreeSearch::random_move(state));
  }
}

TEST(Heuristics, corners_captured) {
  SizeMaskRegistry registry;
  Bitboard black = make_bitboard(registry, 8, {{0, 0}, {7, 0}, {0, 7}, {7, 7}});
  Bitboard white = make_bitboard(registry, 8, {{3, 3}, {4, 4}});
  GameState state(othello::k8x8, registry, black, white);

  EXPECT_EQ(Heuristics::corners_captured(state, othello::kBlack), 100);
  EXPECT_EQ(Heuristics::corners_captured(state, othello::kWhite), -100);

  GameState initial(othello::k8x8, registry);
  EXPECT_EQ(Heuristics::corners_captured(initial, othello::kBlack), 0);

  // 3 corners to 1
  Bitboard b2 = make_bitboard(registry, 6, {{0, 0}, {5, 0}, {0, 5}});
  Bitboard w2 = make_bitboard(registry, 6, {{5, 5}});
  GameState state2(othello::k6x6, registry, b2, w2);
  EXPECT_EQ(Heuristics::corners_captured(state2, othello::kBlack), 50);
  EXPECT_EQ(Heuristics::corners_captured(state2, othello::kWhite), -50);
}

TEST(Heuristics, coin_parity) {
  SizeMaskRegistry registry;
  for (othello::BoardSize size : {othello::k6x6, othello::k8x8, othello::k10x10}) {
    GameState state(size, registry);
    EXPECT_EQ(Heuristics::coin_parity(state, othello::kBlack), 0);
    EXPECT_EQ(Heuristics::coin_parity(state, othello::kWhite), 0);
  }

  Bitboard empty(registry.get(6));
  GameState empty_state(othello::k6x6, registry, empty, empty);
  EXPECT_EQ(Heuristics::coin_parity(empty_state, othello::kBlack), 0);
  EXPECT_EQ(Heuristics::coin_parity(empty_state, othello::kEmpty), std::nullopt);

  // 2 vs 1: 100 / 3 rounds to 33
  GameState stalled = make_stalled_state(registry);
  EXPECT_EQ(Heuristics::coin_parity(stalled, othello::kBlack), 33);
  EXPECT_EQ(Heuristics::coin_parity(stalled, othello::kWhite), -33);

  // 9 vs 7: 100 * 2 / 16 = 12.5, halves round away from zero
  Bitboard b3 = make_bitboard(registry, 6, {{0, 0}, {1, 0}, {2, 0}, {3, 0}, {4, 0}, {5, 0},
                                            {0, 1}, {1, 1}, {2, 1}});
  Bitboard w3 = make_bitboard(registry, 6, {{0, 5}, {1, 5}, {2, 5}, {3, 5}, {4, 5}, {5, 5},
                                            {0, 4}});
  GameState half(othello::k6x6, registry, b3, w3);
  ASSERT_EQ(half.count(othello::kBlack), 9);
  ASSERT_EQ(half.count(othello::kWhite), 7);
  EXPECT_EQ(Heuristics::coin_parity(half, othello::kBlack), 13);
  EXPECT_EQ(Heuristics::coin_parity(half, othello::kWhite), -13);
}

TEST(Heuristics, mobility) {
  SizeMaskRegistry registry;
  GameState stalled = make_stalled_state(registry);
  EXPECT_EQ(Heuristics::mobility(stalled, othello::kBlack), -100);
  EXPECT_EQ(Heuristics::mobility(stalled, othello::kWhite), 100);
  EXPECT_EQ(Heuristics::mobility(stalled, othello::kEmpty), std::nullopt);

  Bitboard empty(registry.get(6));
  GameState empty_state(othello::k6x6, registry, empty, empty);
  EXPECT_EQ(Heuristics::mobility(empty_state, othello::kBlack), 0);
}

TEST(Heuristics, symmetry) {
  SizeMaskRegistry registry;
  util::Random::set_seed(4);
  for (int trial = 0; trial < 30; ++trial) {
    GameState state(othello::k8x8, registry);
    play_random_moves(state, trial * 2);
    for (search::HeuristicType type : magic_enum::enum_values<search::HeuristicType>()) {
      search::heuristic_t h = Heuristics::get(type);
      EXPECT_EQ(h(state, othello::kBlack).value(), -h(state, othello::kWhite).value())
        << Heuristics::name(type);
    }
  }
}

TEST(Heuristics, all_in_one) {
  SizeMaskRegistry registry;
  GameState stalled = make_stalled_state(registry);
  // corners: 0 vs 1 -> -100, mobility -100, coins 33
  EXPECT_EQ(Heuristics::all_in_one(stalled, othello::kBlack), -1000 - 400 + 33);
  EXPECT_EQ(Heuristics::all_in_one(stalled, othello::kEmpty), std::nullopt);
}

TEST(Heuristics, parse) {
  for (search::HeuristicType type : magic_enum::enum_values<search::HeuristicType>()) {
    EXPECT_EQ(Heuristics::parse(Heuristics::name(type)), type);
  }
  EXPECT_EQ(Heuristics::parse("no_such_heuristic"), search::kAllInOne);
  EXPECT_EQ(Heuristics::parse(""), search::kAllInOne);
}

TEST(TreeSearch, parse_algorithm) {
  EXPECT_EQ(TreeSearch::parse_algorithm("minimax"), search::kMinimax);
  EXPECT_EQ(TreeSearch::parse_algorithm("alphabeta"), search::kAlphaBeta);
  EXPECT_EQ(TreeSearch::parse_algorithm("ab"), search::kAlphaBeta);
  EXPECT_STREQ(TreeSearch::algorithm_name(search::kAlphaBeta), "alphabeta");
}

TEST(TreeSearch, alphabeta_matches_minimax) {
  SizeMaskRegistry registry;
  util::Random::set_seed(5);
  for (othello::BoardSize size : {othello::k6x6, othello::k8x8}) {
    for (int trial = 0; trial < 8; ++trial) {
      GameState state(size, registry);
      play_random_moves(state, trial * 3);
      GameState before = state.fork();

      for (search::HeuristicType type : magic_enum::enum_values<search::HeuristicType>()) {
        search::heuristic_t h = Heuristics::get(type);
        for (int depth = 1; depth <= 3; ++depth) {
          for (othello::Color color : {othello::kBlack, othello::kWhite}) {
            search::score_t mm = TreeSearch::minimax(state, depth, color, h);
            search::score_t ab = TreeSearch::alphabeta(state, depth, -search::kInfinity,
                                                       search::kInfinity, color, h);
            EXPECT_EQ(mm, ab) << "size=" << int(size) << " depth=" << depth
                              << " heuristic=" << Heuristics::name(type);
            EXPECT_EQ(state, before);
          }
        }
      }
    }
  }
}

TEST(TreeSearch, stalled_node) {
  SizeMaskRegistry registry;
  GameState state = make_stalled_state(registry);
  ASSERT_FALSE(state.is_game_over());
  ASSERT_TRUE(state.get_possible_moves(othello::kBlack).empty());

  search::heuristic_t h = Heuristics::coin_parity;
  EXPECT_EQ(TreeSearch::minimax(state, 2, othello::kBlack, h), 33);
  EXPECT_EQ(TreeSearch::alphabeta(state, 2, -search::kInfinity, search::kInfinity,
                                  othello::kBlack, h),
            33);
  EXPECT_TRUE(state.get_history().empty());

  // A stalled node is scored by a full-width minimax, whatever the window.
  EXPECT_EQ(TreeSearch::alphabeta(state, 3, 50, 60, othello::kBlack, h), 33);
  EXPECT_EQ(TreeSearch::alphabeta(state, 3, -10, -5, othello::kBlack, h), 33);
  EXPECT_EQ(TreeSearch::alphabeta(state, 3, -search::kInfinity, search::kInfinity,
                                  othello::kWhite, Heuristics::all_in_one),
            TreeSearch::minimax(state, 3, othello::kWhite, Heuristics::all_in_one));
}

TEST(TreeSearch, single_legal_move) {
  SizeMaskRegistry registry;
  GameState state = make_single_move_state(registry);
  ASSERT_EQ(state.get_possible_moves(othello::kWhite).popcount(), 1);

  EXPECT_EQ(TreeSearch::find_best_move(state, 1, othello::kWhite, "minimax", "corners_captured"),
            (Move{5, 5}));

  for (search::Algorithm algorithm : magic_enum::enum_values<search::Algorithm>()) {
    for (search::HeuristicType type : magic_enum::enum_values<search::HeuristicType>()) {
      for (int depth = 1; depth <= 3; ++depth) {
        Move move = TreeSearch::find_best_move(state, depth, othello::kWhite, algorithm, type);
        EXPECT_EQ(move, (Move{5, 5})) << TreeSearch::algorithm_name(algorithm) << "/"
                                      << Heuristics::name(type) << " depth=" << depth;
      }
    }
  }
  EXPECT_TRUE(state.get_history().empty());
}

TEST(TreeSearch, find_best_move_pass_cases) {
  SizeMaskRegistry registry;
  GameState state(othello::k8x8, registry);

  EXPECT_TRUE(TreeSearch::find_best_move(state, 0, othello::kBlack, "minimax", "mobility")
                .is_pass());

  // maximizing for the side not to move never beats the initial bound
  EXPECT_TRUE(TreeSearch::find_best_move(state, 2, othello::kWhite, "alphabeta", "mobility")
                .is_pass());

  GameState over = state.fork();
  over.force_game_over();
  EXPECT_TRUE(TreeSearch::find_best_move(over, 3, othello::kBlack, "minimax", "mobility")
                .is_pass());
}

TEST(TreeSearch, find_best_move_is_legal) {
  SizeMaskRegistry registry;
  util::Random::set_seed(6);
  search::SearchParams params;
  params.depth = 2;
  for (const char* algorithm : {"minimax", "alphabeta"}) {
    params.algorithm = algorithm;
    GameState state(othello::k8x8, registry);
    play_random_moves(state, 10);
    if (state.is_game_over()) continue;

    othello::Color player = state.current_player();
    Move move = TreeSearch::find_best_move(state, player, params);
    ASSERT_FALSE(move.is_pass());
    EXPECT_TRUE(state.get_possible_moves(player).get(move.x, move.y));
  }
}

TEST(TreeSearch, algorithms_agree_on_best_move) {
  SizeMaskRegistry registry;
  util::Random::set_seed(7);
  for (int trial = 0; trial < 5; ++trial) {
    GameState state(othello::k6x6, registry);
    play_random_moves(state, trial * 2);
    if (state.is_game_over()) continue;

    othello::Color player = state.current_player();
    for (search::HeuristicType type : magic_enum::enum_values<search::HeuristicType>()) {
      Move mm = TreeSearch::find_best_move(state, 3, player, search::kMinimax, type);
      Move ab = TreeSearch::find_best_move(state, 3, player, search::kAlphaBeta, type);
      EXPECT_EQ(mm, ab) << Heuristics::name(type);
    }
  }
}

TEST(TreeSearch, random_move) {
  SizeMaskRegistry registry;
  util::Random::set_seed(8);
  GameState state(othello::k10x10, registry);
  for (int i = 0; i < 20; ++i) {
    Move move = TreeSearch::random_move(state);
    EXPECT_TRUE(state.get_possible_moves(othello::kBlack).get(move.x, move.y));
  }

  GameState stalled = make_stalled_state(registry);
  EXPECT_THROW(TreeSearch::random_move(stalled), util::Exception);
}

TEST(ScopedMove, restores_state) {
  SizeMaskRegistry registry;
  GameState state(othello::k8x8, registry);
  GameState before = state.fork();
  {
    search::ScopedMove move(state, Move{2, 3});
    EXPECT_EQ(state.current_player(), othello::kWhite);
    EXPECT_FALSE(state == before);
  }
  EXPECT_EQ(state, before);
  EXPECT_TRUE(state.get_history().empty());

  EXPECT_THROW({ search::ScopedMove bad_move(state, Move{0, 0}); }, othello::IllegalMoveError);
  EXPECT_TRUE(state.get_history().empty());
}

TEST(SearchParams, validate) {
  search::SearchParams params;
  EXPECT_NO_THROW(params.validate());
  params.depth = 0;
  EXPECT_THROW(params.validate(), util::CleanException);
  EXPECT_THROW(othello::SearchPlayer player(params), util::CleanException);
}

TEST(SearchPlayer, completes_match) {
  SizeMaskRegistry registry;
  util::Random::set_seed(9);
  search::SearchParams params;
  params.depth = 2;
  params.algorithm = "alphabeta";
  params.heuristic = "all_in_one";

  othello::SearchPlayer black(params);
  othello::RandomPlayer white;
  othello::MatchRunner runner(othello::k6x6, registry);
  othello::GameResult result = runner.play_game(black, white);
  EXPECT_TRUE(runner.state().is_game_over());
  EXPECT_LE(result.black_count + result.white_count, 36);
  EXPECT_EQ(black.params().depth, 2);
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
