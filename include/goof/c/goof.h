#ifndef GOOF_C_H
#define GOOF_C_H

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// Versioning and stability
// - GOOF_C_ABI_VERSION increments on incompatible changes.
// - All structs are POD with explicit sizes; callers own all memory.
#define GOOF_C_ABI_VERSION 1

// Symbol visibility
#if defined(_WIN32)
  #if defined(GOOF_C_API_EXPORTS)
    #define GOOF_C_API __declspec(dllexport)
  #else
    #define GOOF_C_API
  #endif
#else
  #define GOOF_C_API __attribute__((visibility("default")))
#endif

// Status codes (mirror goof::core::error_code)
typedef enum {
  GOOF_OK = 0,
  GOOF_E_MISMATCH = 1001,
  GOOF_E_OUT_OF_RANGE = 1002,
  GOOF_E_UNKNOWN_VARIANT = 1003,
  GOOF_E_ACCUMULATED = 1004,
  GOOF_E_INVALID_STATE = 4001,
  GOOF_E_CAPACITY_EXCEEDED = 5001,
  GOOF_E_INTERNAL = 9001,
  GOOF_E_INVALID_PARAM = 9002
} goof_status_t;

typedef enum {
  GOOF_KIND_NONE = 0,
  GOOF_KIND_MISMATCH = 1,       // a = expected, b = actual
  GOOF_KIND_OUT_OF_RANGE = 2,   // a = value, b = lower, c = upper
  GOOF_KIND_UNKNOWN_VARIANT = 3 // tag = discriminant bits, a = same value signed
} goof_failure_kind_t;

// One failure descriptor over 64-bit signed integers.
typedef struct {
  uint32_t kind;  // goof_failure_kind_t
  uint32_t reserved;
  int64_t a;
  int64_t b;
  int64_t c;
  uint64_t tag;
} goof_failure_t;

typedef enum {
  GOOF_OVERFLOW_DROP_AND_FLAG = 0,
  GOOF_OVERFLOW_REJECT = 1
} goof_overflow_policy_t;

// Accumulator over caller-provided storage. Treat fields as read-only;
// mutate only through goof_accumulator_* functions.
typedef struct {
  goof_failure_t* entries; // borrowed, capacity elements
  size_t capacity;
  size_t size;
  size_t dropped;
  uint32_t policy;     // goof_overflow_policy_t
  uint32_t state;      // 0 = empty, 1 = collecting, 2 = finalized
  uint32_t overflowed; // 0 or 1
  uint32_t reserved;
} goof_accumulator_t;

// Checks. On failure `out` (may be NULL) receives the descriptor.
// Return GOOF_OK on success or the failure kind's status.
GOOF_C_API goof_status_t goof_assert_eq_i64(int64_t expected, int64_t actual, goof_failure_t* out);
GOOF_C_API goof_status_t goof_assert_in_i64(int64_t value, int64_t lower, int64_t upper,
                                            goof_failure_t* out);
GOOF_C_API goof_status_t goof_assert_known_i64(int64_t value, const int64_t* known, size_t known_len,
                                               goof_failure_t* out);

// Accumulator lifecycle. `storage` must outlive the accumulator.
GOOF_C_API goof_status_t goof_accumulator_init(goof_accumulator_t* acc, goof_failure_t* storage,
                                               size_t capacity, goof_overflow_policy_t policy);
// Record a check outcome: status GOOF_OK is a no-op. GOOF_E_MISMATCH,
// GOOF_E_OUT_OF_RANGE and GOOF_E_UNKNOWN_VARIANT record *failure, which must
// be non-NULL and of the matching kind. Any other status is GOOF_E_INVALID_PARAM.
GOOF_C_API goof_status_t goof_accumulator_push(goof_accumulator_t* acc, goof_status_t status,
                                               const goof_failure_t* failure);
// GOOF_OK when nothing was recorded, GOOF_E_ACCUMULATED otherwise;
// out_count (may be NULL) receives the number of stored entries.
GOOF_C_API goof_status_t goof_accumulator_finalize(goof_accumulator_t* acc, size_t* out_count);

// Thread-local description of the last rejected call ("" if none).
GOOF_C_API const char* goof_last_error(void);

// Semantic version string, e.g. "0.1.0".
GOOF_C_API const char* goof_version(void);

#ifdef __cplusplus
}
#endif

#endif // GOOF_C_H
