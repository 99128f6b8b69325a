#pragma once

/** \file fixed_vector.hpp
 *  \brief Inline, fixed-capacity vector; never touches the heap.
 *
 * Elements are constructed in place inside an aligned byte buffer, so T does
 * not need a default constructor. Capacity is a template parameter and
 * try_push_back reports exhaustion instead of growing.
 * Thread-safety: not thread-safe; value semantics.
 */

#include <array>
#include <cstddef>
#include <memory>
#include <type_traits>
#include <utility>

namespace goof {

template <typename T, std::size_t N>
class FixedVector {
public:
  static_assert(N > 0, "FixedVector cannot have zero capacity");

  using value_type = T;
  using size_type = std::size_t;
  using iterator = T*;
  using const_iterator = const T*;

  FixedVector() noexcept = default;

  FixedVector(const FixedVector& other) noexcept(std::is_nothrow_copy_constructible_v<T>) {
    for (const auto& v : other) emplace_unchecked(v);
  }

  FixedVector(FixedVector&& other) noexcept(std::is_nothrow_move_constructible_v<T>) {
    for (auto& v : other) emplace_unchecked(std::move(v));
    other.clear();
  }

  FixedVector& operator=(const FixedVector& other) {
    if (this != &other) {
      clear();
      for (const auto& v : other) emplace_unchecked(v);
    }
    return *this;
  }

  FixedVector& operator=(FixedVector&& other) noexcept(std::is_nothrow_move_constructible_v<T>) {
    if (this != &other) {
      clear();
      for (auto& v : other) emplace_unchecked(std::move(v));
      other.clear();
    }
    return *this;
  }

  ~FixedVector() { clear(); }

  /** \brief Append if there is room.
   *  \return false (and no change) when the vector is full
   */
  template <typename... Args>
  [[nodiscard]] auto try_emplace_back(Args&&... args) -> bool {
    if (size_ == N) return false;
    emplace_unchecked(std::forward<Args>(args)...);
    return true;
  }

  [[nodiscard]] auto try_push_back(const T& value) -> bool { return try_emplace_back(value); }
  [[nodiscard]] auto try_push_back(T&& value) -> bool { return try_emplace_back(std::move(value)); }

  auto clear() noexcept -> void {
    while (size_ > 0) {
      --size_;
      std::destroy_at(ptr(size_));
    }
  }

  [[nodiscard]] auto size() const noexcept -> size_type { return size_; }
  [[nodiscard]] auto empty() const noexcept -> bool { return size_ == 0; }
  [[nodiscard]] auto full() const noexcept -> bool { return size_ == N; }
  [[nodiscard]] static constexpr auto capacity() noexcept -> size_type { return N; }

  [[nodiscard]] auto operator[](size_type i) noexcept -> T& { return *ptr(i); }
  [[nodiscard]] auto operator[](size_type i) const noexcept -> const T& { return *ptr(i); }
  [[nodiscard]] auto front() const noexcept -> const T& { return *ptr(0); }
  [[nodiscard]] auto back() const noexcept -> const T& { return *ptr(size_ - 1); }

  [[nodiscard]] auto begin() noexcept -> iterator { return ptr(0); }
  [[nodiscard]] auto end() noexcept -> iterator { return ptr(0) + size_; }
  [[nodiscard]] auto begin() const noexcept -> const_iterator { return ptr(0); }
  [[nodiscard]] auto end() const noexcept -> const_iterator { return ptr(0) + size_; }

  friend auto operator==(const FixedVector& a, const FixedVector& b) -> bool {
    if (a.size_ != b.size_) return false;
    for (size_type i = 0; i < a.size_; ++i) {
      if (!(a[i] == b[i])) return false;
    }
    return true;
  }

private:
  template <typename... Args>
  auto emplace_unchecked(Args&&... args) -> void {
    std::construct_at(ptr(size_), std::forward<Args>(args)...);
    ++size_;
  }

  auto ptr(size_type i) noexcept -> T* {
    return reinterpret_cast<T*>(storage_.data()) + i;
  }
  auto ptr(size_type i) const noexcept -> const T* {
    return reinterpret_cast<const T*>(storage_.data()) + i;
  }

  alignas(T) std::array<std::byte, sizeof(T) * N> storage_{};
  size_type size_{0};
};

} // namespace goof
