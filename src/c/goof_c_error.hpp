#pragma once
#include <algorithm>
#include <array>
#include <cstddef>
#include <string_view>

namespace goof_c {
  inline constexpr std::size_t last_error_capacity = 128;

  // Shared thread-local error buffer for all C API translation units.
  // Fixed-size so reporting an error never allocates.
  extern thread_local std::array<char, last_error_capacity> g_last_error;

  inline void set_error(std::string_view s) noexcept {
    const std::size_t n = std::min(s.size(), last_error_capacity - 1);
    std::copy_n(s.data(), n, g_last_error.begin());
    g_last_error[n] = '\0';
  }
  inline void clear_error() noexcept {
    g_last_error[0] = '\0';
  }
} // namespace goof_c
