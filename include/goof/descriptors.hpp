#pragma once

/** \file descriptors.hpp
 *  \brief Leaf failure descriptors produced by the assertion operations.
 *
 * Every descriptor is a small value type: no heap ownership, copyable when
 * the compared type is, trivially copyable when the compared type is.
 * Fields are recorded exactly as the failing check received them.
 */

#include <concepts>
#include <cstdint>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "goof/bounded_string.hpp"
#include "goof/config.hpp"

namespace goof {

/** \brief "expected == actual" failed. */
template <typename T>
struct Mismatch {
  T expected; /**< first argument of the check */
  T actual;   /**< second argument of the check */

  friend constexpr bool operator==(const Mismatch&, const Mismatch&) = default;
};

/** \brief "lower <= value <= upper" failed. Bounds are not validated. */
template <typename T>
struct OutOfRange {
  T value;
  T lower; /**< inclusive, as given */
  T upper; /**< inclusive, as given */

  friend constexpr bool operator==(const OutOfRange&, const OutOfRange&) = default;
};

/** \brief Bounded discriminant identifying the class of an unmatched value.
 *
 * Holds a numeric index, a negative signed value, or a short label. Negative
 * values keep their own kind so -1 never compares equal to ~0ull. Labels longer than
 * config::label_capacity are truncated, so the size never depends on the
 * compared type.
 */
class VariantTag {
public:
  enum class kind : std::uint8_t { index, label, negative };

  constexpr VariantTag() noexcept = default;

  [[nodiscard]] static constexpr auto from_index(std::uint64_t index) noexcept -> VariantTag {
    VariantTag t;
    t.kind_ = kind::index;
    t.index_ = index;
    return t;
  }

  /** \brief Index tag for v >= 0, negative tag otherwise. */
  template <std::integral I>
  [[nodiscard]] static constexpr auto from_integer(I v) noexcept -> VariantTag {
    if constexpr (std::is_signed_v<I>) {
      if (v < 0) {
        VariantTag t;
        t.kind_ = kind::negative;
        t.index_ = static_cast<std::uint64_t>(static_cast<std::int64_t>(v));
        return t;
      }
    }
    return from_index(static_cast<std::uint64_t>(v));
  }

  [[nodiscard]] static constexpr auto from_label(std::string_view label) noexcept -> VariantTag {
    VariantTag t;
    t.kind_ = kind::label;
    t.label_ = BoundedString<config::label_capacity>::truncated(label);
    return t;
  }

  [[nodiscard]] constexpr auto tag_kind() const noexcept -> kind { return kind_; }
  [[nodiscard]] constexpr auto is_label() const noexcept -> bool { return kind_ == kind::label; }
  [[nodiscard]] constexpr auto is_negative() const noexcept -> bool { return kind_ == kind::negative; }

  /** \brief Numeric discriminant bits; 0 for label tags. */
  [[nodiscard]] constexpr auto index() const noexcept -> std::uint64_t { return index_; }

  /** \brief Numeric discriminant read as a signed value. */
  [[nodiscard]] constexpr auto signed_index() const noexcept -> std::int64_t {
    return static_cast<std::int64_t>(index_);
  }

  /** \brief Label discriminant; empty for index tags. */
  [[nodiscard]] constexpr auto label() const noexcept -> std::string_view { return label_.view(); }

  friend constexpr auto operator==(const VariantTag& a, const VariantTag& b) noexcept -> bool {
    if (a.kind_ != b.kind_) return false;
    return a.kind_ == kind::label ? a.label_ == b.label_ : a.index_ == b.index_;
  }

private:
  kind kind_{kind::index};
  std::uint64_t index_{0};
  BoundedString<config::label_capacity> label_{};
};

/** \brief Value did not match any entry of a known set. */
struct UnknownVariant {
  VariantTag tag;

  friend constexpr bool operator==(const UnknownVariant&, const UnknownVariant&) = default;
};

// Tag derivation -------------------------------------------------------------

/** \brief Derives the VariantTag recorded by assert_known.
 *
 * Integral and enum types use their numeric value, std::variant its active
 * index. Other types specialize this template with a static
 * `tag(const T&) -> VariantTag`.
 */
template <typename T>
struct variant_tag_traits {};

template <typename T>
  requires std::is_integral_v<T>
struct variant_tag_traits<T> {
  static constexpr auto tag(const T& v) noexcept -> VariantTag {
    return VariantTag::from_integer(v);
  }
};

template <typename T>
  requires std::is_enum_v<T>
struct variant_tag_traits<T> {
  static constexpr auto tag(const T& v) noexcept -> VariantTag {
    return VariantTag::from_integer(std::to_underlying(v));
  }
};

template <typename... Ts>
struct variant_tag_traits<std::variant<Ts...>> {
  static constexpr auto tag(const std::variant<Ts...>& v) noexcept -> VariantTag {
    return VariantTag::from_index(static_cast<std::uint64_t>(v.index()));
  }
};

template <typename T>
concept Taggable = requires(const T& v) {
  { variant_tag_traits<T>::tag(v) } -> std::same_as<VariantTag>;
};

/** \brief Enum exposing enumerator labels through an ADL-visible
 *  `goof_variant_label(E) -> std::string_view`.
 */
template <typename E>
concept LabeledEnum = std::is_enum_v<E> && requires(E e) {
  { goof_variant_label(e) } -> std::convertible_to<std::string_view>;
};

/** \brief Label tag for a labeled enum; falls back to the numeric value when
 *  the enumerator has no label.
 */
template <LabeledEnum E>
constexpr auto label_tag(E value) noexcept -> VariantTag {
  const std::string_view label = goof_variant_label(value);
  if (label.empty()) {
    return VariantTag::from_integer(std::to_underlying(value));
  }
  return VariantTag::from_label(label);
}

// Kind traits ----------------------------------------------------------------

template <typename D> struct is_mismatch : std::false_type {};
template <typename T> struct is_mismatch<Mismatch<T>> : std::true_type {};
template <typename D> inline constexpr bool is_mismatch_v = is_mismatch<D>::value;

template <typename D> struct is_out_of_range : std::false_type {};
template <typename T> struct is_out_of_range<OutOfRange<T>> : std::true_type {};
template <typename D> inline constexpr bool is_out_of_range_v = is_out_of_range<D>::value;

template <typename D>
inline constexpr bool is_unknown_variant_v = std::is_same_v<D, UnknownVariant>;

template <typename D>
inline constexpr bool is_leaf_descriptor_v =
    is_mismatch_v<D> || is_out_of_range_v<D> || is_unknown_variant_v<D>;

template <typename D> struct is_variant : std::false_type {};
template <typename... Ts> struct is_variant<std::variant<Ts...>> : std::true_type {};
template <typename D> inline constexpr bool is_variant_v = is_variant<D>::value;

} // namespace goof
