#pragma once

#include <fmt/format.h>

#include <exception>
#include <string>
#include <utility>

namespace util {

/*
 * Exception with an fmt-formatted message:
 *
 * throw util::Exception("Cannot pop from an empty history (board size {})", size);
 *
 * Thrown for logic errors. Left uncaught, it terminates the program.
 */
class Exception : public std::exception {
 public:
  Exception() = default;

  template <typename... Ts>
  Exception(fmt::format_string<Ts...> fmt, Ts&&... ts)
      : what_(fmt::format(fmt, std::forward<Ts>(ts)...)) {}

  const char* what() const noexcept override { return what_.c_str(); }

 private:
  std::string what_;
};

/*
 * Error caused by the input rather than by a bug: a bad cmdline value, an unreadable config file, an
 * illegal move. main() catches these, prints the message to stderr and exits with status 1, without
 * a core dump.
 */
class CleanException : public Exception {
 public:
  using Exception::Exception;
};

class DebugAssertionError : public Exception {
 public:
  static constexpr const char* descr() { return "DEBUG_ASSERT"; }
  using Exception::Exception;
};

class ReleaseAssertionError : public Exception {
 public:
  static constexpr const char* descr() { return "RELEASE_ASSERT"; }
  using Exception::Exception;
};

class CleanAssertionError : public CleanException {
 public:
  static constexpr const char* descr() { return "CLEAN_ASSERT"; }
  using CleanException::CleanException;
};

}  // namespace util
