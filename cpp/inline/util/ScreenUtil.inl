#include "util/ScreenUtil.hpp"

#include <sys/ioctl.h>
#include <unistd.h>

#include <cstdlib>
#include <string>

namespace util {

namespace detail {

inline int query_screen_width() {
  winsize ws{};
  if (isatty(STDOUT_FILENO) && ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) {
    return ws.ws_col;
  }
  const char* columns = std::getenv("COLUMNS");
  if (columns) {
    int n = std::atoi(columns);
    if (n > 0) return n;
  }
  return kDefaultScreenWidth;
}

}  // namespace detail

inline int get_screen_width() {
  static const int width = detail::query_screen_width();
  return width;
}

}  // namespace util
