#include "search/Algorithms.hpp"

#include "search/ScopedMove.hpp"
#include "util/CppUtil.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <magic_enum/magic_enum.hpp>

#include <algorithm>
#include <chrono>
#include <vector>

namespace search {

namespace {

score_t evaluate(const othello::GameState& state, othello::Color max_player,
                 heuristic_t heuristic) {
  return heuristic(state, max_player).value_or(0);
}

std::vector<othello::Move> legal_moves(const othello::GameState& state) {
  return state.get_possible_moves(state.current_player()).hot_bits_coordinates();
}

}  // namespace

score_t TreeSearch::minimax(othello::GameState& state, int depth, othello::Color max_player,
                            heuristic_t heuristic) {
  LOG_DEBUG("minimax depth={} player={}", depth, othello::color_name(max_player));

  if (depth == 0 || state.is_game_over()) {
    return evaluate(state, max_player, heuristic);
  }

  std::vector<othello::Move> moves = legal_moves(state);
  if (moves.empty()) {
    return minimax(state, depth - 1, max_player, heuristic);
  }

  bool maximizing = state.current_player() == max_player;
  score_t evaluation = maximizing ? -kInfinity : kInfinity;
  for (const othello::Move& move : moves) {
    ScopedMove scoped_move(state, move);
    score_t score = minimax(state, depth - 1, max_player, heuristic);
    evaluation = maximizing ? std::max(evaluation, score) : std::min(evaluation, score);
  }

  LOG_DEBUG("minimax depth={} returning {}", depth, evaluation);
  return evaluation;
}

score_t TreeSearch::alphabeta(othello::GameState& state, int depth, score_t alpha, score_t beta,
                              othello::Color max_player, heuristic_t heuristic) {
  LOG_DEBUG("alphabeta depth={} player={} alpha={} beta={}", depth,
            othello::color_name(max_player), alpha, beta);

  if (depth == 0 || state.is_game_over()) {
    return evaluate(state, max_player, heuristic);
  }

  std::vector<othello::Move> moves = legal_moves(state);
  if (moves.empty()) {
    return minimax(state, depth - 1, max_player, heuristic);
  }

  score_t evaluation;
  if (state.current_player() == max_player) {
    evaluation = -kInfinity;
    for (const othello::Move& move : moves) {
      ScopedMove scoped_move(state, move);
      evaluation = std::max(evaluation, alphabeta(state, depth - 1, alpha, beta, max_player,
                                                  heuristic));
      alpha = std::max(alpha, evaluation);
      if (beta <= alpha) {
        LOG_DEBUG("alphabeta pruning at depth={} (alpha={} beta={})", depth, alpha, beta);
        break;
      }
    }
  } else {
    evaluation = kInfinity;
    for (const othello::Move& move : moves) {
      ScopedMove scoped_move(state, move);
      evaluation = std::min(evaluation, alphabeta(state, depth - 1, alpha, beta, max_player,
                                                  heuristic));
      beta = std::min(beta, evaluation);
      if (beta <= alpha) {
        LOG_DEBUG("alphabeta pruning at depth={} (alpha={} beta={})", depth, alpha, beta);
        break;
      }
    }
  }

  LOG_DEBUG("alphabeta depth={} returning {}", depth, evaluation);
  return evaluation;
}

othello::Move TreeSearch::find_best_move(const othello::GameState& state, int depth,
                                         othello::Color max_player, Algorithm algorithm,
                                         HeuristicType heuristic_type, bool benchmark) {
  LOG_DEBUG("Finding best move using {} at depth {} for {}", algorithm_name(algorithm), depth,
            othello::color_name(max_player));

  if (depth == 0 || state.is_game_over()) {
    return othello::Move::pass();
  }

  auto start = std::chrono::steady_clock::now();
  heuristic_t heuristic = Heuristics::get(heuristic_type);

  std::vector<othello::Move> moves = legal_moves(state);
  LOG_DEBUG("Evaluating {} possible moves", moves.size());

  othello::Move best_move = othello::Move::pass();
  score_t best_score = max_player == state.current_player() ? -kInfinity : kInfinity;
  for (const othello::Move& move : moves) {
    othello::GameState child = state.fork();
    child.play(move);

    score_t score;
    if (algorithm == kMinimax) {
      score = minimax(child, depth - 1, max_player, heuristic);
    } else {
      score = alphabeta(child, depth - 1, -kInfinity, kInfinity, max_player, heuristic);
    }
    LOG_DEBUG("Move {} evaluated with score {}", move.to_str(), score);

    if (score > best_score) {
      best_score = score;
      best_move = move;
    }
  }

  if (benchmark) {
    auto elapsed = std::chrono::steady_clock::now() - start;
    LOG_INFO("{}/{} search at depth {} took {:.3f}s (best: {}, score: {})",
             algorithm_name(algorithm), Heuristics::name(heuristic_type), depth,
             util::to_ns(elapsed) * 1e-9, best_move.to_str(), best_score);
  }
  return best_move;
}

othello::Move TreeSearch::find_best_move(const othello::GameState& state, int depth,
                                         othello::Color max_player, const std::string& algorithm,
                                         const std::string& heuristic, bool benchmark) {
  return find_best_move(state, depth, max_player, parse_algorithm(algorithm),
                        Heuristics::parse(heuristic), benchmark);
}

othello::Move TreeSearch::find_best_move(const othello::GameState& state,
                                         othello::Color max_player, const SearchParams& params) {
  return find_best_move(state, params.depth, max_player, params.algorithm, params.heuristic,
                        params.benchmark);
}

othello::Move TreeSearch::random_move(const othello::GameState& state) {
  std::vector<othello::Move> moves = legal_moves(state);
  LOG_DEBUG("Selecting random move from {} options", moves.size());
  return util::Random::choose(moves);
}

Algorithm TreeSearch::parse_algorithm(const std::string& name) {
  return name == "minimax" ? kMinimax : kAlphaBeta;
}

const char* TreeSearch::algorithm_name(Algorithm algorithm) {
  switch (algorithm) {
    case kMinimax:
      return "minimax";
    case kAlphaBeta:
      return "alphabeta";
    default:
      throw util::Exception("Unknown Algorithm: {}", magic_enum::enum_integer(algorithm));
  }
}

}  // namespace search
