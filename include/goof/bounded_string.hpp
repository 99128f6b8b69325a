#pragma once

/** \file bounded_string.hpp
 *  \brief Fixed-capacity inline text for notes, labels and messages.
 *
 * Storage lives inside the object; copying copies at most N bytes.
 * Thread-safety: value type, no shared state.
 */

#include <algorithm>
#include <array>
#include <cstddef>
#include <string_view>

namespace goof {

template <std::size_t N>
class BoundedString {
public:
  static_assert(N > 0, "BoundedString cannot be empty");

  constexpr BoundedString() noexcept = default;

  /** \brief Copy the first min(text.size(), N) characters of text. */
  [[nodiscard]] static constexpr auto truncated(std::string_view text) noexcept -> BoundedString {
    BoundedString out;
    out.size_ = std::min(text.size(), N);
    std::copy_n(text.data(), out.size_, out.data_.begin());
    return out;
  }

  /** \brief True when text can be stored without truncation. */
  [[nodiscard]] static constexpr auto fits(std::string_view text) noexcept -> bool {
    return text.size() <= N;
  }

  [[nodiscard]] constexpr auto view() const noexcept -> std::string_view {
    return std::string_view(data_.data(), size_);
  }
  [[nodiscard]] constexpr auto size() const noexcept -> std::size_t { return size_; }
  [[nodiscard]] constexpr auto empty() const noexcept -> bool { return size_ == 0; }
  [[nodiscard]] static constexpr auto capacity() noexcept -> std::size_t { return N; }

  friend constexpr auto operator==(const BoundedString& a, const BoundedString& b) noexcept -> bool {
    return a.view() == b.view();
  }
  friend constexpr auto operator==(const BoundedString& a, std::string_view b) noexcept -> bool {
    return a.view() == b;
  }

private:
  std::array<char, N> data_{};
  std::size_t size_{0};
};

} // namespace goof
