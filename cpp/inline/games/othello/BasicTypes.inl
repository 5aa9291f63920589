#include "games/othello/BasicTypes.hpp"

#include "games/othello/Exceptions.hpp"
#include "util/StringUtil.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <string>
#include <vector>

namespace othello {

inline Color opposite(Color color) {
  switch (color) {
    case kBlack:
      return kWhite;
    case kWhite:
      return kBlack;
    default:
      return kEmpty;
  }
}

inline char glyph(Color color) {
  switch (color) {
    case kBlack:
      return kBlackGlyph;
    case kWhite:
      return kWhiteGlyph;
    default:
      return kEmptyGlyph;
  }
}

inline const char* color_name(Color color) {
  switch (color) {
    case kBlack:
      return "black";
    case kWhite:
      return "white";
    default:
      return "empty";
  }
}

inline BoardSize to_board_size(int size) {
  if (std::find(kLegalBoardSizes.begin(), kLegalBoardSizes.end(), size) ==
      kLegalBoardSizes.end()) {
    std::vector<std::string> legal;
    for (int s : kLegalBoardSizes) legal.push_back(std::to_string(s));
    throw IllegalBoardSizeError("board of size {} is not possible (expected {})", size,
                                util::grammatically_join(legal, "or"));
  }
  return BoardSize(size);
}

inline std::string Move::to_str() const {
  if (is_pass()) return kPassStr;
  return fmt::format("{}{}", char('a' + x), y + 1);
}

}  // namespace othello
