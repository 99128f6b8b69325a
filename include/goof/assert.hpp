#pragma once

/** \file assert.hpp
 *  \brief Assertion operations returning descriptors instead of aborting.
 *
 * Every check returns std::expected<T, Descriptor>: on success the
 * validated value, on failure the descriptor built from the arguments.
 * Checks are pure, never allocate and never terminate the process.
 */

#include <concepts>
#include <expected>
#include <initializer_list>
#include <ranges>
#include <type_traits>
#include <utility>

#include "goof/descriptors.hpp"

namespace goof {

namespace detail {

template <typename T>
inline constexpr bool nothrow_eq_v =
    std::is_nothrow_copy_constructible_v<T> &&
    noexcept(std::declval<const T&>() == std::declval<const T&>());

template <typename T>
inline constexpr bool nothrow_le_v =
    std::is_nothrow_copy_constructible_v<T> &&
    noexcept(std::declval<const T&>() <= std::declval<const T&>());

template <typename T, typename R, typename F>
constexpr auto check_membership(const T& value, R&& known_set, F&& tag_of)
    -> std::expected<T, UnknownVariant> {
  for (auto&& candidate : known_set) {
    if (value == candidate) return value;
  }
  return std::unexpected(UnknownVariant{std::forward<F>(tag_of)(value)});
}

} // namespace detail

template <typename T>
concept EqualityCheckable = std::copy_constructible<T> && std::equality_comparable<T>;

template <typename T>
concept RangeCheckable = std::copy_constructible<T> && requires(const T& a, const T& b) {
  { a <= b } -> std::convertible_to<bool>;
};

/** \brief Succeeds iff expected == actual.
 *  \return actual on success, Mismatch{expected, actual} otherwise
 *
 * Argument order is part of the contract: the first argument always lands in
 * Mismatch::expected. Both arguments must have the same type; nothing is
 * converted before the comparison.
 */
template <EqualityCheckable T>
[[nodiscard]] constexpr auto assert_eq(const T& expected, const T& actual)
    noexcept(detail::nothrow_eq_v<T>) -> std::expected<T, Mismatch<T>> {
  if (expected == actual) return actual;
  return std::unexpected(Mismatch<T>{expected, actual});
}

/** \brief Succeeds iff lower <= value <= upper.
 *  \return value on success, OutOfRange{value, lower, upper} otherwise
 *
 * Bounds are not validated: with lower > upper no value passes. Values that
 * are unordered with respect to the bounds (NaN) fail.
 */
template <RangeCheckable T>
[[nodiscard]] constexpr auto assert_in(const T& value, const T& lower, const T& upper)
    noexcept(detail::nothrow_le_v<T>) -> std::expected<T, OutOfRange<T>> {
  if (lower <= value && value <= upper) return value;
  return std::unexpected(OutOfRange<T>{value, lower, upper});
}

/** \brief Succeeds iff value equals an element of known_set.
 *
 * The failure records the tag produced by tag_of(value), never the value.
 */
template <std::copy_constructible T, std::ranges::input_range R, typename F>
  requires std::equality_comparable_with<const T&, std::ranges::range_reference_t<R>> &&
           std::is_invocable_r_v<VariantTag, F&, const T&>
[[nodiscard]] constexpr auto assert_known(const T& value, R&& known_set, F tag_of)
    -> std::expected<T, UnknownVariant> {
  return detail::check_membership(value, std::forward<R>(known_set), tag_of);
}

/** \brief assert_known with the tag taken from variant_tag_traits<T>. */
template <Taggable T, std::ranges::input_range R>
  requires std::copy_constructible<T> &&
           std::equality_comparable_with<const T&, std::ranges::range_reference_t<R>>
[[nodiscard]] constexpr auto assert_known(const T& value, R&& known_set)
    -> std::expected<T, UnknownVariant> {
  return detail::check_membership(value, std::forward<R>(known_set),
                                  [](const T& v) { return variant_tag_traits<T>::tag(v); });
}

template <Taggable T>
  requires EqualityCheckable<T>
[[nodiscard]] constexpr auto assert_known(const T& value, std::initializer_list<T> known_set)
    -> std::expected<T, UnknownVariant> {
  return assert_known(value, std::views::all(known_set));
}

/** \brief assert_known for labeled enums; the tag is the enumerator label. */
template <LabeledEnum E, std::ranges::input_range R>
  requires std::equality_comparable_with<const E&, std::ranges::range_reference_t<R>>
[[nodiscard]] constexpr auto assert_known_enum(const E& value, R&& known_set)
    -> std::expected<E, UnknownVariant> {
  return detail::check_membership(value, std::forward<R>(known_set),
                                  [](const E& v) { return label_tag(v); });
}

template <LabeledEnum E>
[[nodiscard]] constexpr auto assert_known_enum(const E& value, std::initializer_list<E> known_set)
    -> std::expected<E, UnknownVariant> {
  return assert_known_enum(value, std::views::all(known_set));
}

// Partial applications --------------------------------------------------------
//
// Small trivially copyable callables binding everything but the checked
// value. They are the intended `op` for try_or_resume.

template <EqualityCheckable T>
struct eq_check {
  T expected;

  template <std::same_as<T> U>
  [[nodiscard]] constexpr auto operator()(const U& actual) const
      noexcept(detail::nothrow_eq_v<T>) -> std::expected<T, Mismatch<T>> {
    return assert_eq(expected, actual);
  }
};

template <RangeCheckable T>
struct in_check {
  T lower;
  T upper;

  template <std::same_as<T> U>
  [[nodiscard]] constexpr auto operator()(const U& value) const
      noexcept(detail::nothrow_le_v<T>) -> std::expected<T, OutOfRange<T>> {
    return assert_in(value, lower, upper);
  }
};

template <EqualityCheckable T>
[[nodiscard]] constexpr auto assert_eq_with(T expected) -> eq_check<T> {
  return eq_check<T>{std::move(expected)};
}

template <RangeCheckable T>
[[nodiscard]] constexpr auto assert_in_with(T lower, T upper) -> in_check<T> {
  return in_check<T>{std::move(lower), std::move(upper)};
}

} // namespace goof
