#pragma once

#include "util/CppUtil.hpp"

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

#include <string>

/*
 * LOG_INFO("Turn {}: {} plays {}", turn, name, move);
 *
 * Format strings follow fmt::format(). Statements below SPDLOG_ACTIVE_LEVEL are removed by the
 * preprocessor, so LOG_DEBUG()/LOG_TRACE() cost nothing in the search unless the build is
 * configured with -DREVERSI_DEBUG_LOGGING=ON. Their arguments are still type-checked.
 */

#define LOG_TRACE(...)            \
  do {                            \
    USE_UNEVALUATED(__VA_ARGS__); \
    SPDLOG_TRACE(__VA_ARGS__);    \
  } while (0)

#define LOG_DEBUG(...)            \
  do {                            \
    USE_UNEVALUATED(__VA_ARGS__); \
    SPDLOG_DEBUG(__VA_ARGS__);    \
  } while (0)

#define LOG_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define LOG_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)

namespace util {

struct Logging {
  struct Params {
    auto make_options_description();

    std::string log_filename;    // empty: console only
    std::string log_level = "info";
    bool append_mode = false;
    bool omit_timestamps = false;
  };

  /*
   * Installs the default spdlog logger: a console sink, plus a file sink if params.log_filename is
   * set. Throws util::CleanException on an unknown log level.
   */
  static void init(const Params& params);
};

}  // namespace util

#include "inline/util/LoggingUtil.inl"
