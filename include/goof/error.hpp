#pragma once

/**
 * \file error.hpp
 * \brief Library-level error taxonomy used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling; descriptor kinds map onto
 *   the 1000 range (see error_mapping.hpp), library misuse onto the rest.
 * - Message and component point at static strings so an error never owns
 *   heap memory.
 */

#include <cstdint>
#include <expected>

namespace goof::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  mismatch = 1001,
  out_of_range = 1002,
  unknown_variant = 1003,
  accumulated = 1004,
  invalid_state = 4001,
  capacity_exceeded = 5001,
  internal = 9001,
  invalid_argument = 9002,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  const char* message{""};                 /**< short static message */
  const char* component{""};               /**< subsystem, e.g., "goof.accumulator" */
};

/** \brief Stable identifier for a code, suitable for logs and the C boundary. */
constexpr const char* error_code_name(error_code ec) noexcept {
  switch (ec) {
    case error_code::ok: return "ok";
    case error_code::mismatch: return "mismatch";
    case error_code::out_of_range: return "out_of_range";
    case error_code::unknown_variant: return "unknown_variant";
    case error_code::accumulated: return "accumulated";
    case error_code::invalid_state: return "invalid_state";
    case error_code::capacity_exceeded: return "capacity_exceeded";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
  }
  return "internal";
}

} // namespace goof::core
