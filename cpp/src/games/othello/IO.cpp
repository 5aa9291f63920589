#include "games/othello/IO.hpp"

#include "util/LoggingUtil.hpp"

#include <fmt/format.h>

namespace othello {

std::string IO::export_board(const GameState& state) {
  LOG_DEBUG("Exporting board of size {}", state.size());
  std::string s = fmt::format("# board\n{}\n", glyph(state.current_player()));
  int n = state.size();
  for (int y = 0; y < n; ++y) {
    for (int x = 0; x < n; ++x) {
      s += glyph(state.get_player_at(x, y));
      if (x < n - 1) s += ' ';
    }
    if (y < n - 1) s += '\n';
  }
  return s;
}

std::string IO::export_history(const GameState& state) {
  LOG_DEBUG("Exporting history of {} entries", state.get_history().size());
  std::string s = "# history\n";
  const auto& history = state.get_history();
  for (size_t i = 0; i < history.size(); ++i) {
    const HistoryEntry& entry = history[i];
    if (entry.player == kBlack) {
      s += fmt::format("{}. {} {}", i / 2 + 1, kBlackGlyph, move_to_str(entry.move));
    } else {
      if (i % 2 == 0) {
        s += fmt::format("{}. {} {}", i / 2 + 1, kBlackGlyph, kPassStr);
      }
      s += fmt::format(" {} {}\n", kWhiteGlyph, move_to_str(entry.move));
    }
  }
  return s;
}

std::string IO::export_game(const GameState& state) {
  return export_board(state) + "\n" + export_history(state);
}

void IO::print_state(std::ostream& ss, const GameState& state) {
  int n = state.size();
  bool wide = n >= 10;
  Bitboard possible = state.get_possible_moves(state.current_player());

  std::string s = wide ? "   " : "  ";
  for (int x = 0; x < n; ++x) {
    if (x) s += ' ';
    s += char('a' + x);
  }
  for (int y = 0; y < n; ++y) {
    s += fmt::format("\n{}{} ", y + 1, (wide && y < 9) ? " " : "");
    for (int x = 0; x < n; ++x) {
      if (x) s += ' ';
      Color c = state.get_player_at(x, y);
      if (c != kEmpty) {
        s += glyph(c);
      } else if (possible.get(x, y)) {
        s += kPossibleMoveGlyph;
      } else {
        s += kEmptyGlyph;
      }
    }
  }

  ss << s << "\n\n";
  ss << "Score: Player\n";
  ss << fmt::format("{:5}: {} ({})\n", state.count(kBlack), kBlackGlyph, color_name(kBlack));
  ss << fmt::format("{:5}: {} ({})\n", state.count(kWhite), kWhiteGlyph, color_name(kWhite));
  if (!state.is_game_over()) {
    ss << fmt::format("{} to move\n", color_name(state.current_player()));
  }
  ss << std::flush;
}

}  // namespace othello
