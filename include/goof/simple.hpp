#pragma once

/** \file simple.hpp
 *  \brief Message-only errors: the borrowed Goof and the owning InlineGoof.
 *
 * Goof borrows its text and must not outlive it. InlineGoof copies the text
 * into a fixed inline buffer and is safe to return from any frame.
 */

#include <cstddef>
#include <expected>
#include <string_view>

#include "goof/bounded_string.hpp"
#include "goof/descriptors.hpp"

namespace goof {

namespace detail {

constexpr auto is_space(char c) noexcept -> bool {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

constexpr auto trim(std::string_view s) noexcept -> std::string_view {
  while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
  while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
  return s;
}

} // namespace detail

/** \brief Simplest error: a borrowed message. */
struct Goof {
  std::string_view message;

  /** \brief Message without leading or trailing whitespace. */
  [[nodiscard]] constexpr auto trimmed() const noexcept -> std::string_view {
    return detail::trim(message);
  }

  friend constexpr bool operator==(const Goof&, const Goof&) = default;
};

[[nodiscard]] constexpr auto goof(std::string_view message) noexcept -> Goof {
  return Goof{message};
}

/** \brief Copy text into a BoundedString<N>, failing when it does not fit.
 *  \return OutOfRange{text.size(), 0, N} if text is longer than N
 */
template <std::size_t N>
[[nodiscard]] constexpr auto make_bounded(std::string_view text) noexcept
    -> std::expected<BoundedString<N>, OutOfRange<std::size_t>> {
  if (!BoundedString<N>::fits(text)) {
    return std::unexpected(OutOfRange<std::size_t>{text.size(), 0, N});
  }
  return BoundedString<N>::truncated(text);
}

/** \brief Message error owning its text in an inline buffer of N chars. */
template <std::size_t N>
class BasicInlineGoof {
public:
  constexpr BasicInlineGoof() noexcept = default;
  constexpr explicit BasicInlineGoof(BoundedString<N> message) noexcept : message_(message) {}

  [[nodiscard]] constexpr auto message() const noexcept -> std::string_view { return message_.view(); }
  [[nodiscard]] constexpr auto trimmed() const noexcept -> std::string_view {
    return detail::trim(message_.view());
  }
  [[nodiscard]] static constexpr auto capacity() noexcept -> std::size_t { return N; }

  friend constexpr auto operator==(const BasicInlineGoof& a, const BasicInlineGoof& b) noexcept -> bool {
    return a.message_ == b.message_;
  }

private:
  BoundedString<N> message_{};
};

inline constexpr std::size_t inline_goof_capacity = 40;

using InlineGoof = BasicInlineGoof<inline_goof_capacity>;

/** \brief Build an InlineGoof; fails rather than silently cutting the text. */
template <std::size_t N = inline_goof_capacity>
[[nodiscard]] constexpr auto make_inline_goof(std::string_view text) noexcept
    -> std::expected<BasicInlineGoof<N>, OutOfRange<std::size_t>> {
  auto bounded = make_bounded<N>(text);
  if (!bounded) return std::unexpected(bounded.error());
  return BasicInlineGoof<N>(*bounded);
}

/** \brief Build an InlineGoof keeping at most the first N characters. */
template <std::size_t N = inline_goof_capacity>
[[nodiscard]] constexpr auto truncate_inline_goof(std::string_view text) noexcept -> BasicInlineGoof<N> {
  return BasicInlineGoof<N>(BoundedString<N>::truncated(text));
}

/** \brief Take ownership of a borrowed Goof's text. */
template <std::size_t N = inline_goof_capacity>
[[nodiscard]] constexpr auto to_inline(const Goof& g) noexcept
    -> std::expected<BasicInlineGoof<N>, OutOfRange<std::size_t>> {
  return make_inline_goof<N>(g.message);
}

} // namespace goof
