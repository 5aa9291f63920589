#pragma once

#include <string>

namespace search {

/*
 * Settings of a single find_best_move() call, exposed as cmdline options.
 */
struct SearchParams {
  auto make_options_description();

  // Throws util::CleanException on a non-positive depth.
  void validate() const;

  int depth = 3;
  std::string algorithm = "minimax";
  std::string heuristic = "corners_captured";
  bool benchmark = false;
};

}  // namespace search

#include "inline/search/SearchParams.inl"
