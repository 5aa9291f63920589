#pragma once

namespace util {

constexpr int kDefaultScreenWidth = 80;

/*
 * Column count of the terminal behind stdout, queried once per process. If stdout is redirected,
 * the COLUMNS environment variable is consulted before falling back to kDefaultScreenWidth.
 */
int get_screen_width();

}  // namespace util

#include "inline/util/ScreenUtil.inl"
