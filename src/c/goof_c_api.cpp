#include "goof/c/goof.h"

#include <cstdint>
#include <iostream>
#include <span>

#include "goof/accumulator.hpp"
#include "goof/assert.hpp"
#include "goof/core/platform_utils.hpp"
#include "goof/error_mapping.hpp"
#include "goof/version.hpp"

#include "goof_c_error.hpp"

thread_local std::array<char, goof_c::last_error_capacity> goof_c::g_last_error{};
using goof_c::set_error;
using goof_c::clear_error;

namespace {

bool debug_enabled() {
  static const bool enabled = goof::core::env_flag("GOOF_C_DEBUG");
  return enabled;
}

goof_status_t reject(const goof::core::error& e) {
  set_error(e.message);
  if (debug_enabled()) {
    std::cerr << "[goof][c][" << e.component << "] " << goof::core::error_code_name(e.code)
              << ": " << e.message << std::endl;
  }
  return goof::to_c_status(e.code);
}

void store(goof_failure_t* out, const goof::Mismatch<std::int64_t>& m) {
  if (!out) return;
  *out = goof_failure_t{};
  out->kind = GOOF_KIND_MISMATCH;
  out->a = m.expected;
  out->b = m.actual;
}

void store(goof_failure_t* out, const goof::OutOfRange<std::int64_t>& r) {
  if (!out) return;
  *out = goof_failure_t{};
  out->kind = GOOF_KIND_OUT_OF_RANGE;
  out->a = r.value;
  out->b = r.lower;
  out->c = r.upper;
}

void store(goof_failure_t* out, const goof::UnknownVariant& u) {
  if (!out) return;
  *out = goof_failure_t{};
  out->kind = GOOF_KIND_UNKNOWN_VARIANT;
  out->a = u.tag.signed_index();
  out->tag = u.tag.index();
}

template <typename T, typename E>
goof_status_t report(const std::expected<T, E>& r, goof_failure_t* out) {
  if (r.has_value()) return GOOF_OK;
  store(out, r.error());
  return goof::to_c_status(goof::error_code_of(r.error()));
}

goof::accumulator_state state_of(const goof_accumulator_t* acc) {
  return static_cast<goof::accumulator_state>(acc->state);
}

// Only check failures are recordable, and the descriptor must be of the
// matching kind.
bool is_recordable(goof_status_t status, const goof_failure_t& failure) {
  switch (status) {
    case GOOF_E_MISMATCH: return failure.kind == GOOF_KIND_MISMATCH;
    case GOOF_E_OUT_OF_RANGE: return failure.kind == GOOF_KIND_OUT_OF_RANGE;
    case GOOF_E_UNKNOWN_VARIANT: return failure.kind == GOOF_KIND_UNKNOWN_VARIANT;
    default: return false;
  }
}

} // namespace

extern "C" {

GOOF_C_API const char* goof_last_error(void) {
  return goof_c::g_last_error.data();
}

GOOF_C_API const char* goof_version(void) {
  return GOOF_VERSION_STRING;
}

GOOF_C_API goof_status_t goof_assert_eq_i64(int64_t expected, int64_t actual, goof_failure_t* out) {
  clear_error();
  return report(goof::assert_eq<std::int64_t>(expected, actual), out);
}

GOOF_C_API goof_status_t goof_assert_in_i64(int64_t value, int64_t lower, int64_t upper,
                                            goof_failure_t* out) {
  clear_error();
  return report(goof::assert_in<std::int64_t>(value, lower, upper), out);
}

GOOF_C_API goof_status_t goof_assert_known_i64(int64_t value, const int64_t* known, size_t known_len,
                                               goof_failure_t* out) {
  clear_error();
  if (!known && known_len != 0) {
    return reject({goof::core::error_code::invalid_argument, "known set is null", "goof.c"});
  }
  const std::span<const std::int64_t> set(known, known_len);
  return report(goof::assert_known<std::int64_t>(value, set), out);
}

GOOF_C_API goof_status_t goof_accumulator_init(goof_accumulator_t* acc, goof_failure_t* storage,
                                               size_t capacity, goof_overflow_policy_t policy) {
  clear_error();
  if (!acc || !storage || capacity == 0) {
    return reject({goof::core::error_code::invalid_argument, "accumulator storage missing", "goof.c"});
  }
  if (policy != GOOF_OVERFLOW_DROP_AND_FLAG && policy != GOOF_OVERFLOW_REJECT) {
    return reject({goof::core::error_code::invalid_argument, "unknown overflow policy", "goof.c"});
  }
  *acc = goof_accumulator_t{};
  acc->entries = storage;
  acc->capacity = capacity;
  acc->policy = static_cast<uint32_t>(policy);
  acc->state = static_cast<uint32_t>(goof::accumulator_state::empty);
  return GOOF_OK;
}

GOOF_C_API goof_status_t goof_accumulator_push(goof_accumulator_t* acc, goof_status_t status,
                                               const goof_failure_t* failure) {
  clear_error();
  if (!acc || !acc->entries) {
    return reject({goof::core::error_code::invalid_argument, "accumulator is null", "goof.c"});
  }
  if (state_of(acc) == goof::accumulator_state::finalized) {
    return reject(goof::accumulator_finalized_error);
  }
  if (status == GOOF_OK) return GOOF_OK;
  if (!failure) {
    return reject({goof::core::error_code::invalid_argument, "failure descriptor is null", "goof.c"});
  }
  if (!is_recordable(status, *failure)) {
    return reject({goof::core::error_code::invalid_argument, "status is not a check failure", "goof.c"});
  }
  const auto policy = static_cast<goof::overflow_policy>(acc->policy);
  switch (goof::admit(state_of(acc), acc->size, acc->capacity, policy)) {
    case goof::admission::reject_state:
      return reject(goof::accumulator_finalized_error);
    case goof::admission::reject_capacity:
      return reject(goof::accumulator_full_error);
    case goof::admission::drop:
      acc->overflowed = 1;
      ++acc->dropped;
      if (debug_enabled()) {
        std::cerr << "[goof][c] accumulator full, dropped failure #" << acc->dropped << std::endl;
      }
      return GOOF_OK;
    case goof::admission::append:
      break;
  }
  acc->entries[acc->size++] = *failure;
  acc->state = static_cast<uint32_t>(goof::accumulator_state::collecting);
  return GOOF_OK;
}

GOOF_C_API goof_status_t goof_accumulator_finalize(goof_accumulator_t* acc, size_t* out_count) {
  clear_error();
  if (!acc) {
    return reject({goof::core::error_code::invalid_argument, "accumulator is null", "goof.c"});
  }
  acc->state = static_cast<uint32_t>(goof::accumulator_state::finalized);
  if (out_count) *out_count = acc->size;
  return (acc->size == 0 && acc->dropped == 0) ? GOOF_OK : GOOF_E_ACCUMULATED;
}

} // extern "C"
