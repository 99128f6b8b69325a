#pragma once

/** \file context.hpp
 *  \brief Diagnostic metadata attached to any failure without changing it.
 *
 * Context nests: wrapping a Context yields Context<Context<E>>, never a
 * collapsed chain. The outermost note is the most general, the innermost
 * describes the most specific failure. Comparisons involving a Context look
 * only at the innermost descriptor.
 */

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>

#include "goof/bounded_string.hpp"
#include "goof/config.hpp"

namespace goof {

/** \brief Opaque 128-bit identifier correlating a failure with an external trace. */
struct CorrelationToken {
  std::uint64_t hi{0};
  std::uint64_t lo{0};

  friend constexpr bool operator==(const CorrelationToken&, const CorrelationToken&) = default;
};

using Note = BoundedString<config::note_capacity>;

template <typename E>
struct Context {
  E inner;
  std::optional<Note> note;
  std::optional<CorrelationToken> correlation;
};

template <typename E> struct is_context : std::false_type {};
template <typename E> struct is_context<Context<E>> : std::true_type {};
template <typename E> inline constexpr bool is_context_v = is_context<E>::value;

template <typename E> struct innermost_type { using type = E; };
template <typename E> struct innermost_type<Context<E>> : innermost_type<E> {};
template <typename E> using innermost_t = typename innermost_type<E>::type;

template <typename E> struct context_depth : std::integral_constant<std::size_t, 0> {};
template <typename E>
struct context_depth<Context<E>> : std::integral_constant<std::size_t, 1 + context_depth<E>::value> {};
template <typename E> inline constexpr std::size_t context_depth_v = context_depth<E>::value;

/** \brief Unwrap every Context layer. */
template <typename E>
[[nodiscard]] constexpr auto innermost(const E& e) noexcept -> const innermost_t<E>& {
  if constexpr (is_context_v<E>) {
    return innermost(e.inner);
  } else {
    return e;
  }
}

/** \brief Equality through Context layers: compares innermost descriptors. */
template <typename A, typename B>
  requires(is_context_v<A> || is_context_v<B>) &&
          std::equality_comparable_with<innermost_t<A>, innermost_t<B>>
constexpr auto operator==(const A& a, const B& b) -> bool {
  return innermost(a) == innermost(b);
}

namespace detail {

template <typename T, typename E, typename F>
constexpr auto wrap_error(std::expected<T, E>&& result, F&& make)
    -> std::expected<T, std::invoke_result_t<F, E&&>> {
  if (result.has_value()) {
    if constexpr (std::is_void_v<T>) {
      return {};
    } else {
      return std::move(*result);
    }
  }
  return std::unexpected(std::forward<F>(make)(std::move(result).error()));
}

} // namespace detail

/** \brief Attach a note (truncated to config::note_capacity) and an optional
 *  correlation token to a failed result. Successful results pass through.
 */
template <typename T, typename E>
[[nodiscard]] constexpr auto with_context(std::expected<T, E> result, std::string_view note,
                                          std::optional<CorrelationToken> correlation = std::nullopt)
    -> std::expected<T, Context<E>> {
  return detail::wrap_error(std::move(result), [&](E&& e) {
    return Context<E>{std::move(e), Note::truncated(note), correlation};
  });
}

/** \brief Attach only a correlation token. */
template <typename T, typename E>
[[nodiscard]] constexpr auto with_correlation(std::expected<T, E> result, CorrelationToken correlation)
    -> std::expected<T, Context<E>> {
  return detail::wrap_error(std::move(result), [&](E&& e) {
    return Context<E>{std::move(e), std::nullopt, correlation};
  });
}

} // namespace goof
