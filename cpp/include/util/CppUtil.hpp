#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <tuple>
#include <type_traits>
#include <utility>

#define XSTR(a) STR(a)
#define STR(a) #a

/*
 * True iff macro is defined as 1 (as with -DFOO=1). Usable in constant expressions:
 *
 * if (IS_MACRO_ENABLED(DEBUG_BUILD)) { ... }
 */
#define IS_MACRO_ENABLED(macro) (XSTR(macro)[0] == '1')

// Type-checks the arguments without evaluating them.
#define USE_UNEVALUATED(...) static_cast<void>(sizeof(std::forward_as_tuple(__VA_ARGS__)))

namespace util {

template <typename Rep, typename Period>
int64_t to_ns(const std::chrono::duration<Rep, Period>& duration) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(duration).count();
}

/*
 * A string literal usable as a template argument:
 *
 * template <util::StringLiteral Name> struct Option {};
 * Option<"depth"> o;
 */
template <size_t N>
struct StringLiteral {
  constexpr StringLiteral(const char (&str)[N]) { std::copy_n(str, N, value); }

  template <size_t M>
  constexpr bool operator==(const StringLiteral<M>& other) const {
    if constexpr (N != M) {
      return false;
    } else {
      return std::equal(value, value + N, other.value);
    }
  }

  char value[N];
};

template <StringLiteral... Strs>
struct StringLiteralSequence {};

template <int... Ints>
using int_sequence = std::integer_sequence<int, Ints...>;

namespace detail {

template <typename Seq, typename Elem>
struct contains;

template <StringLiteral... Strs, StringLiteral S>
struct contains<StringLiteralSequence<Strs...>, StringLiteralSequence<S>> {
  static constexpr bool value = ((Strs == S) || ...);
};

template <int... Ints, int K>
struct contains<int_sequence<Ints...>, int_sequence<K>> {
  static constexpr bool value = ((Ints == K) || ...);
};

template <typename Seq1, typename Seq2>
struct concat;

template <StringLiteral... S1, StringLiteral... S2>
struct concat<StringLiteralSequence<S1...>, StringLiteralSequence<S2...>> {
  using type = StringLiteralSequence<S1..., S2...>;
};

template <int... I1, int... I2>
struct concat<int_sequence<I1...>, int_sequence<I2...>> {
  using type = int_sequence<I1..., I2...>;
};

template <typename Seq1, typename Seq2>
struct disjoint;

template <typename Seq1, StringLiteral... S2>
struct disjoint<Seq1, StringLiteralSequence<S2...>> {
  static constexpr bool value = (!contains<Seq1, StringLiteralSequence<S2>>::value && ...);
};

template <typename Seq1, int... I2>
struct disjoint<Seq1, int_sequence<I2...>> {
  static constexpr bool value = (!contains<Seq1, int_sequence<I2>>::value && ...);
};

template <typename T>
struct is_int_sequence : std::false_type {};

template <int... Ints>
struct is_int_sequence<int_sequence<Ints...>> : std::true_type {};

}  // namespace detail

// int_sequence_contains_v<int_sequence<1, 3, 5>, 3> == true
template <typename Seq, int K>
constexpr bool int_sequence_contains_v = detail::contains<Seq, int_sequence<K>>::value;

template <typename Seq, StringLiteral S>
constexpr bool string_literal_sequence_contains_v =
  detail::contains<Seq, StringLiteralSequence<S>>::value;

// Works on two int_sequence's or two StringLiteralSequence's.
template <typename Seq1, typename Seq2>
using concat_sequence_t = typename detail::concat<Seq1, Seq2>::type;

// True iff the two sequences share no element.
template <typename Seq1, typename Seq2>
constexpr bool no_overlap_v = detail::disjoint<Seq1, Seq2>::value;

namespace concepts {

template <typename T>
concept IntSequence = detail::is_int_sequence<T>::value;

}  // namespace concepts

}  // namespace util
