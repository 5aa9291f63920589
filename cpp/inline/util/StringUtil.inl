#include "util/StringUtil.hpp"

#include <boost/algorithm/string.hpp>

namespace util {

inline std::vector<std::string> split(const std::string& s, const std::string& sep) {
  namespace ba = boost::algorithm;

  std::vector<std::string> tokens;
  if (sep.empty()) {
    std::string trimmed = ba::trim_copy(s);
    if (trimmed.empty()) return tokens;
    ba::split(tokens, trimmed, ba::is_space(), ba::token_compress_on);
  } else {
    ba::iter_split(tokens, s, ba::first_finder(sep));
  }
  return tokens;
}

inline std::string strip_comment(const std::string& line, char comment_char) {
  return boost::algorithm::trim_copy(line.substr(0, line.find(comment_char)));
}

inline std::string grammatically_join(const std::vector<std::string>& items,
                                      const std::string& conjunction) {
  size_t n = items.size();
  if (n <= 2) return boost::algorithm::join(items, " " + conjunction + " ");

  std::string s;
  for (size_t i = 0; i + 1 < n; ++i) {
    s += items[i] + ", ";
  }
  return s + conjunction + " " + items.back();
}

}  // namespace util
