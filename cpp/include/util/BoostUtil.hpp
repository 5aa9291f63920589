#pragma once

#include "util/CppUtil.hpp"

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace boost_util {

/*
 * Value of --name in a raw argument list, given as "--name value" or "--name=value". Returns the
 * empty string if the option is absent or has no value.
 *
 * Used to read an option (such as --config) that decides the defaults of the other options, before
 * the full options_description exists.
 */
std::string get_option_value(const std::vector<std::string>& args, const std::string& name);

// Throws util::CleanException if the file cannot be written.
void write_str_to_file(const std::string& str, const boost::filesystem::path& path);

namespace program_options {

struct Settings {
  // When set, printing an options_description includes its hidden options.
  static inline bool help_full = false;
};

/*
 * Wrapper around boost::program_options::options_description that records every option name and
 * one-letter abbreviation in its type, so that combining two descriptions that define the same
 * option fails to compile instead of failing at startup:
 *
 * namespace po2 = boost_util::program_options;
 * po2::options_description desc("Search options");
 * return desc
 *   .add_option<"depth", 'd'>(po::value<int>(&depth)->default_value(depth), "search depth")
 *   .add_flag<"benchmark", "no-benchmark">(&benchmark, "time each search", "do not time");
 *
 * Each add_*() returns a new options_description whose type includes the added names, so calls
 * must be chained as above.
 */
template <typename StrSeq_ = util::StringLiteralSequence<>,
          util::concepts::IntSequence CharSeq_ = util::int_sequence<>>
class options_description {
 public:
  using StrSeq = StrSeq_;
  using CharSeq = CharSeq_;
  using base_t = boost::program_options::options_description;

  options_description(const char* name);

  template <util::StringLiteral StrLit, char Char = ' ', typename... Ts>
  auto add_option(Ts&&... ts);

  // Shown only by --help-full.
  template <util::StringLiteral StrLit, typename... Ts>
  auto add_hidden_option(Ts&&... ts);

  /*
   * Adds the pair --foo / --no-foo, setting *flag to true / false. --help shows only the one that
   * changes the current value of *flag.
   */
  template <util::StringLiteral TrueStrLit, util::StringLiteral FalseStrLit>
  auto add_flag(bool* flag, const char* true_help, const char* false_help);

  template <typename StrSeq2, util::concepts::IntSequence CharSeq2>
  auto add(const options_description<StrSeq2, CharSeq2>& desc);

  void print(std::ostream& s) const;

  friend std::ostream& operator<<(std::ostream& s, const options_description& desc) {
    desc.print(s);
    return s;
  }

  const base_t& get() const { return *full_base_; }

 private:
  using base_ptr_t = std::shared_ptr<base_t>;

  options_description(base_ptr_t full_base, base_ptr_t base)
      : full_base_(full_base), base_(base) {}

  // Copy of this whose type also records StrLit (and Char, unless it is ' ').
  template <util::StringLiteral StrLit, char Char = ' '>
  auto augment() const;

  template <util::StringLiteral StrLit, char Char>
  static std::string boost_name();

  template <typename, util::concepts::IntSequence>
  friend class boost_util::program_options::options_description;

  base_ptr_t full_base_;  // all options
  base_ptr_t base_;       // options shown by --help
};

/*
 * Parses the command line (argc/argv, or any other arguments accepted by
 * boost::program_options::command_line_parser) against desc. Parse errors are rethrown as
 * util::CleanException.
 */
template <typename T, typename... Ts>
boost::program_options::variables_map parse_args(const T& desc, Ts&&... ts);

}  // namespace program_options

}  // namespace boost_util

#include "inline/util/BoostUtil.inl"
