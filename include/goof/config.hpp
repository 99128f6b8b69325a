#pragma once

/** \file config.hpp
 *  \brief Compile-time configuration knobs.
 *
 * Every knob can be overridden with a preprocessor definition; the CMake
 * build forwards the cache variables of the same name.
 */

#include <cstddef>
#include <cstdint>

#ifndef GOOF_NOTE_CAPACITY
#define GOOF_NOTE_CAPACITY 48
#endif

#ifndef GOOF_LABEL_CAPACITY
#define GOOF_LABEL_CAPACITY 24
#endif

// 0 = drop_and_flag, 1 = reject
#ifndef GOOF_DEFAULT_OVERFLOW_POLICY
#define GOOF_DEFAULT_OVERFLOW_POLICY 0
#endif

namespace goof {

/** \brief What an accumulator does with a failure that no longer fits. */
enum class overflow_policy : std::uint8_t {
  drop_and_flag = 0, /**< drop the failure, set the overflow flag */
  reject = 1,        /**< fail the push itself with capacity_exceeded */
};

namespace config {

/** \brief Maximum characters kept in a Context note. */
inline constexpr std::size_t note_capacity = GOOF_NOTE_CAPACITY;

/** \brief Maximum characters kept in a VariantTag label. */
inline constexpr std::size_t label_capacity = GOOF_LABEL_CAPACITY;

inline constexpr overflow_policy default_overflow_policy =
    GOOF_DEFAULT_OVERFLOW_POLICY == 0 ? overflow_policy::drop_and_flag : overflow_policy::reject;

static_assert(note_capacity > 0, "GOOF_NOTE_CAPACITY must be positive");
static_assert(label_capacity > 0, "GOOF_LABEL_CAPACITY must be positive");
static_assert(GOOF_DEFAULT_OVERFLOW_POLICY == 0 || GOOF_DEFAULT_OVERFLOW_POLICY == 1,
              "GOOF_DEFAULT_OVERFLOW_POLICY must be 0 or 1");

} // namespace config
} // namespace goof
