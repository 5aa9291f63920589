#include "util/BoostUtil.hpp"

#include "util/Exception.hpp"
#include "util/ScreenUtil.hpp"

#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <fmt/format.h>

#include <string>

namespace boost_util {

namespace program_options {

namespace detail {

using option_ptr_t = boost::shared_ptr<boost::program_options::option_description>;

// An option that takes no value, like --help.
inline option_ptr_t make_option(const std::string& name, const std::string& description) {
  namespace po = boost::program_options;
  return boost::make_shared<po::option_description>(name.c_str(), new po::untyped_value(true),
                                                    description.c_str());
}

// value is owned by the returned option.
inline option_ptr_t make_option(const std::string& name,
                                const boost::program_options::value_semantic* value,
                                const std::string& description) {
  return boost::make_shared<boost::program_options::option_description>(name.c_str(), value,
                                                                        description.c_str());
}

}  // namespace detail

template <typename StrSeq, util::concepts::IntSequence CharSeq>
options_description<StrSeq, CharSeq>::options_description(const char* name)
    : full_base_(std::make_shared<base_t>(name, util::get_screen_width() - 1)),
      base_(std::make_shared<base_t>(name, util::get_screen_width() - 1)) {}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <util::StringLiteral StrLit, char Char>
std::string options_description<StrSeq, CharSeq>::boost_name() {
  if constexpr (Char == ' ') {
    return StrLit.value;
  } else {
    return fmt::format("{},{}", StrLit.value, Char);
  }
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <util::StringLiteral StrLit, char Char, typename... Ts>
auto options_description<StrSeq, CharSeq>::add_option(Ts&&... ts) {
  auto out = augment<StrLit, Char>();
  auto option = detail::make_option(boost_name<StrLit, Char>(), std::forward<Ts>(ts)...);
  out.full_base_->add(option);
  out.base_->add(option);
  return out;
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <util::StringLiteral StrLit, typename... Ts>
auto options_description<StrSeq, CharSeq>::add_hidden_option(Ts&&... ts) {
  auto out = augment<StrLit>();
  out.full_base_->add(detail::make_option(boost_name<StrLit, ' '>(), std::forward<Ts>(ts)...));
  return out;
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <util::StringLiteral TrueStrLit, util::StringLiteral FalseStrLit>
auto options_description<StrSeq, CharSeq>::add_flag(bool* flag, const char* true_help,
                                                    const char* false_help) {
  namespace po = boost::program_options;

  auto out = augment<TrueStrLit>().template augment<FalseStrLit>();

  std::string true_desc = fmt::format("{}{}", true_help, *flag ? " (default)" : "");
  std::string false_desc = fmt::format("{}{}", false_help, *flag ? "" : " (default)");

  auto true_option = detail::make_option(
    TrueStrLit.value, po::value<bool>(flag)->implicit_value(true)->zero_tokens(), true_desc);
  auto false_option = detail::make_option(
    FalseStrLit.value, po::value<bool>(flag)->implicit_value(false)->zero_tokens(), false_desc);

  out.full_base_->add(true_option);
  out.full_base_->add(false_option);
  out.base_->add(*flag ? false_option : true_option);
  return out;
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <typename StrSeq2, util::concepts::IntSequence CharSeq2>
auto options_description<StrSeq, CharSeq>::add(const options_description<StrSeq2, CharSeq2>& desc) {
  static_assert(util::no_overlap_v<StrSeq, StrSeq2>, "Options name clash!");
  static_assert(util::no_overlap_v<CharSeq, CharSeq2>, "Options abbreviation clash!");

  using OutT = options_description<util::concat_sequence_t<StrSeq, StrSeq2>,
                                   util::concat_sequence_t<CharSeq, CharSeq2>>;

  full_base_->add(*desc.full_base_);
  base_->add(*desc.base_);
  return OutT(full_base_, base_);
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
void options_description<StrSeq, CharSeq>::print(std::ostream& s) const {
  (Settings::help_full ? full_base_ : base_)->print(s);
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <util::StringLiteral StrLit, char Char>
auto options_description<StrSeq, CharSeq>::augment() const {
  static_assert(!util::string_literal_sequence_contains_v<StrSeq, StrLit>, "Options name clash!");

  if constexpr (Char == ' ') {
    using OutT = options_description<
      util::concat_sequence_t<StrSeq, util::StringLiteralSequence<StrLit>>, CharSeq>;
    return OutT(full_base_, base_);
  } else {
    static_assert(!util::int_sequence_contains_v<CharSeq, int(Char)>,
                  "Options abbreviation clash!");
    using OutT =
      options_description<util::concat_sequence_t<StrSeq, util::StringLiteralSequence<StrLit>>,
                          util::concat_sequence_t<CharSeq, util::int_sequence<int(Char)>>>;
    return OutT(full_base_, base_);
  }
}

namespace detail {

template <typename T>
const T& unwrap(const T& desc) {
  return desc;
}

template <typename S, util::concepts::IntSequence C>
const auto& unwrap(const options_description<S, C>& desc) {
  return desc.get();
}

}  // namespace detail

template <typename T, typename... Ts>
boost::program_options::variables_map parse_args(const T& desc, Ts&&... ts) {
  namespace po = boost::program_options;

  po::variables_map vm;
  try {
    po::store(
      po::command_line_parser(std::forward<Ts>(ts)...).options(detail::unwrap(desc)).run(), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    throw util::CleanException("{}", e.what());
  }
  return vm;
}

}  // namespace program_options

}  // namespace boost_util
