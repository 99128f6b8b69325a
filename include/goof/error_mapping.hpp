#pragma once

/** \file error_mapping.hpp
 *  \brief Map descriptors and wrappers onto core::error_code and C statuses.
 *
 * Lets any failure travel through code that only understands the generic
 * core::error (or the C status enum) without rendering it.
 */

#include <cstddef>
#include <variant>

#include "goof/accumulator.hpp"
#include "goof/c/goof.h"
#include "goof/context.hpp"
#include "goof/descriptors.hpp"
#include "goof/error.hpp"
#include "goof/resumable.hpp"
#include "goof/simple.hpp"

namespace goof {

template <typename T>
constexpr auto error_code_of(const Mismatch<T>&) noexcept -> core::error_code {
  return core::error_code::mismatch;
}
template <typename T>
constexpr auto error_code_of(const OutOfRange<T>&) noexcept -> core::error_code {
  return core::error_code::out_of_range;
}
constexpr auto error_code_of(const UnknownVariant&) noexcept -> core::error_code {
  return core::error_code::unknown_variant;
}
constexpr auto error_code_of(const Goof&) noexcept -> core::error_code {
  return core::error_code::internal;
}
template <std::size_t N>
constexpr auto error_code_of(const BasicInlineGoof<N>&) noexcept -> core::error_code {
  return core::error_code::internal;
}
constexpr auto error_code_of(const core::error& e) noexcept -> core::error_code { return e.code; }

template <typename E, std::size_t N>
constexpr auto error_code_of(const Accumulated<E, N>&) noexcept -> core::error_code {
  return core::error_code::accumulated;
}
template <typename E>
constexpr auto error_code_of(const Context<E>& c) noexcept -> core::error_code {
  return error_code_of(innermost(c));
}
template <typename E, typename Op, typename Input>
constexpr auto error_code_of(const Resumable<E, Op, Input>& r) noexcept -> core::error_code {
  return error_code_of(r.failure);
}
template <typename... Ts>
constexpr auto error_code_of(const std::variant<Ts...>& v) noexcept -> core::error_code {
  if (v.valueless_by_exception()) return core::error_code::internal;
  return std::visit([](const auto& alt) { return error_code_of(alt); }, v);
}

/** \brief Generic error view of any failure. */
template <typename E>
constexpr auto to_error(const E& failure, const char* component = "goof") noexcept -> core::error {
  const auto code = error_code_of(failure);
  return core::error{code, core::error_code_name(code), component};
}

constexpr auto to_c_status(core::error_code ec) noexcept -> goof_status_t {
  switch (ec) {
    case core::error_code::ok: return GOOF_OK;
    case core::error_code::mismatch: return GOOF_E_MISMATCH;
    case core::error_code::out_of_range: return GOOF_E_OUT_OF_RANGE;
    case core::error_code::unknown_variant: return GOOF_E_UNKNOWN_VARIANT;
    case core::error_code::accumulated: return GOOF_E_ACCUMULATED;
    case core::error_code::invalid_state: return GOOF_E_INVALID_STATE;
    case core::error_code::capacity_exceeded: return GOOF_E_CAPACITY_EXCEEDED;
    case core::error_code::internal: return GOOF_E_INTERNAL;
    case core::error_code::invalid_argument: return GOOF_E_INVALID_PARAM;
  }
  return GOOF_E_INTERNAL;
}

constexpr auto from_c_status(goof_status_t st) noexcept -> core::error_code {
  switch (st) {
    case GOOF_OK: return core::error_code::ok;
    case GOOF_E_MISMATCH: return core::error_code::mismatch;
    case GOOF_E_OUT_OF_RANGE: return core::error_code::out_of_range;
    case GOOF_E_UNKNOWN_VARIANT: return core::error_code::unknown_variant;
    case GOOF_E_ACCUMULATED: return core::error_code::accumulated;
    case GOOF_E_INVALID_STATE: return core::error_code::invalid_state;
    case GOOF_E_CAPACITY_EXCEEDED: return core::error_code::capacity_exceeded;
    case GOOF_E_INTERNAL: return core::error_code::internal;
    case GOOF_E_INVALID_PARAM: return core::error_code::invalid_argument;
    default: return core::error_code::internal;
  }
}

} // namespace goof
