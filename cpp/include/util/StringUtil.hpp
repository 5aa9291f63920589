#pragma once

#include <string>
#include <vector>

namespace util {

/*
 * split(" a \tb  c ") -> {"a", "b", "c"}
 * split("a,,b", ",") -> {"a", "", "b"}
 *
 * With an empty separator, splits on runs of whitespace and drops empty tokens. Otherwise every
 * occurrence of sep starts a new token.
 */
std::vector<std::string> split(const std::string& s, const std::string& sep = "");

// Text before the first comment_char, with surrounding whitespace trimmed.
std::string strip_comment(const std::string& line, char comment_char = '#');

// {"6", "8", "10"}, "or" -> "6, 8, or 10"
std::string grammatically_join(const std::vector<std::string>& items,
                               const std::string& conjunction);

}  // namespace util

#include "inline/util/StringUtil.inl"
