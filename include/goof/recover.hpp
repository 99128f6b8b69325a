#pragma once

/** \file recover.hpp
 *  \brief Fail-recoverable strategy: turn matched failures into a fallback.
 *
 * A matcher is any predicate over a descriptor type. It is evaluated on the
 * innermost descriptor (Context layers unwrapped); for std::variant failures
 * it is evaluated on the active alternative. A matcher that cannot be called
 * with the descriptor does not match. Unmatched failures come back exactly as
 * they went in, Context included.
 */

#include <concepts>
#include <expected>
#include <functional>
#include <type_traits>
#include <utility>
#include <variant>

#include "goof/context.hpp"
#include "goof/descriptors.hpp"

namespace goof {

namespace detail {

template <typename Matcher, typename D>
constexpr auto matcher_accepts(Matcher& matcher, const D& failure) -> bool {
  const auto& leaf = innermost(failure);
  using Leaf = std::remove_cvref_t<decltype(leaf)>;
  if constexpr (is_variant_v<Leaf>) {
    return std::visit([&](const auto& alt) { return matcher_accepts(matcher, alt); }, leaf);
  } else if constexpr (std::is_invocable_r_v<bool, Matcher&, const Leaf&>) {
    return static_cast<bool>(std::invoke(matcher, leaf));
  } else {
    return false;
  }
}

} // namespace detail

// Matchers --------------------------------------------------------------------

/** \brief Matches every descriptor of exactly type D. */
template <typename D>
struct kind_matcher {
  constexpr auto operator()(const D&) const noexcept -> bool { return true; }
};

template <typename D>
inline constexpr kind_matcher<D> matches{};

/** \brief Matches descriptors of type D satisfying pred. */
template <typename D, typename Pred>
struct predicate_matcher {
  Pred pred;
  constexpr auto operator()(const D& d) const -> bool { return static_cast<bool>(std::invoke(pred, d)); }
};

template <typename D, typename Pred>
[[nodiscard]] constexpr auto matches_if(Pred pred) -> predicate_matcher<D, Pred> {
  return predicate_matcher<D, Pred>{std::move(pred)};
}

struct any_mismatch_t {
  template <typename T>
  constexpr auto operator()(const Mismatch<T>&) const noexcept -> bool { return true; }
};
struct any_out_of_range_t {
  template <typename T>
  constexpr auto operator()(const OutOfRange<T>&) const noexcept -> bool { return true; }
};
struct any_unknown_variant_t {
  constexpr auto operator()(const UnknownVariant&) const noexcept -> bool { return true; }
};

inline constexpr any_mismatch_t any_mismatch{};
inline constexpr any_out_of_range_t any_out_of_range{};
inline constexpr any_unknown_variant_t any_unknown_variant{};

// Combinators -----------------------------------------------------------------

/** \brief Replace a matched failure with fallback; pass everything else through. */
template <typename T, typename E, typename Matcher, typename U>
  requires(!std::is_void_v<T>) && std::constructible_from<T, U&&>
[[nodiscard]] constexpr auto recover(std::expected<T, E> result, Matcher matcher, U&& fallback)
    -> std::expected<T, E> {
  if (result.has_value()) return result;
  if (detail::matcher_accepts(matcher, result.error())) {
    return std::expected<T, E>(std::in_place, std::forward<U>(fallback));
  }
  return result;
}

/** \brief Void checks: a matched failure becomes plain success. */
template <typename E, typename Matcher>
[[nodiscard]] constexpr auto recover(std::expected<void, E> result, Matcher matcher)
    -> std::expected<void, E> {
  if (result.has_value()) return result;
  if (detail::matcher_accepts(matcher, result.error())) return {};
  return result;
}

/** \brief Like recover, but the fallback is computed from the innermost
 *  descriptor, e.g. clamping an OutOfRange value to its bounds.
 */
template <typename T, typename E, typename Matcher, typename Fn>
  requires(!std::is_void_v<T>) && std::is_invocable_r_v<T, Fn&, const innermost_t<E>&>
[[nodiscard]] constexpr auto recover_with(std::expected<T, E> result, Matcher matcher, Fn make_fallback)
    -> std::expected<T, E> {
  if (result.has_value()) return result;
  if (detail::matcher_accepts(matcher, result.error())) {
    return std::expected<T, E>(std::in_place, std::invoke(make_fallback, innermost(result.error())));
  }
  return result;
}

} // namespace goof
