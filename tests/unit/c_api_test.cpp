#include <catch2/catch_test_macros.hpp>

#include <array>
#include <cstdint>
#include <string_view>

#include "goof/c/goof.h"

TEST_CASE("C checks report status and fill the descriptor", "[c]") {
  goof_failure_t f{};
  REQUIRE(goof_assert_eq_i64(3, 3, &f) == GOOF_OK);

  REQUIRE(goof_assert_eq_i64(32, 0, &f) == GOOF_E_MISMATCH);
  REQUIRE(f.kind == GOOF_KIND_MISMATCH);
  REQUIRE(f.a == 32);
  REQUIRE(f.b == 0);

  REQUIRE(goof_assert_in_i64(5, 10, 1, &f) == GOOF_E_OUT_OF_RANGE);
  REQUIRE(f.kind == GOOF_KIND_OUT_OF_RANGE);
  REQUIRE(f.a == 5);
  REQUIRE(f.b == 10);
  REQUIRE(f.c == 1);

  // out may be NULL
  REQUIRE(goof_assert_in_i64(-1, 0, 1, nullptr) == GOOF_E_OUT_OF_RANGE);
}

TEST_CASE("C known-set check", "[c]") {
  const std::array<int64_t, 3> known{2, 4, 8};
  goof_failure_t f{};
  REQUIRE(goof_assert_known_i64(4, known.data(), known.size(), &f) == GOOF_OK);
  REQUIRE(goof_assert_known_i64(5, known.data(), known.size(), &f) == GOOF_E_UNKNOWN_VARIANT);
  REQUIRE(f.kind == GOOF_KIND_UNKNOWN_VARIANT);
  REQUIRE(f.tag == 5u);

  REQUIRE(goof_assert_known_i64(5, nullptr, 2, &f) == GOOF_E_INVALID_PARAM);
  REQUIRE(std::string_view(goof_last_error()) == "known set is null");
}

TEST_CASE("C accumulator collects in order", "[c][accumulator]") {
  std::array<goof_failure_t, 4> storage{};
  goof_accumulator_t acc{};
  REQUIRE(goof_accumulator_init(&acc, storage.data(), storage.size(), GOOF_OVERFLOW_DROP_AND_FLAG) == GOOF_OK);

  for (int64_t v : {1, 2, 3}) {
    goof_failure_t f{};
    const goof_status_t st = goof_assert_eq_i64(2, v, &f);
    REQUIRE(goof_accumulator_push(&acc, st, &f) == GOOF_OK);
  }
  size_t count = 0;
  REQUIRE(goof_accumulator_finalize(&acc, &count) == GOOF_E_ACCUMULATED);
  REQUIRE(count == 2);
  REQUIRE(storage[0].b == 1);
  REQUIRE(storage[1].b == 3);
}

TEST_CASE("C accumulator overflow policies", "[c][accumulator]") {
  std::array<goof_failure_t, 1> storage{};
  goof_failure_t f{};
  const goof_status_t st = goof_assert_eq_i64(0, 1, &f);

  goof_accumulator_t drop{};
  REQUIRE(goof_accumulator_init(&drop, storage.data(), 1, GOOF_OVERFLOW_DROP_AND_FLAG) == GOOF_OK);
  REQUIRE(goof_accumulator_push(&drop, st, &f) == GOOF_OK);
  REQUIRE(goof_accumulator_push(&drop, st, &f) == GOOF_OK);
  REQUIRE(drop.overflowed == 1u);
  REQUIRE(drop.dropped == 1u);
  REQUIRE(drop.size == 1u);

  goof_accumulator_t reject{};
  REQUIRE(goof_accumulator_init(&reject, storage.data(), 1, GOOF_OVERFLOW_REJECT) == GOOF_OK);
  REQUIRE(goof_accumulator_push(&reject, st, &f) == GOOF_OK);
  REQUIRE(goof_accumulator_push(&reject, st, &f) == GOOF_E_CAPACITY_EXCEEDED);
  REQUIRE(std::string_view(goof_last_error()) == "accumulator full");
}

TEST_CASE("C accumulator rejects pushes after finalize and bad arguments", "[c][accumulator]") {
  std::array<goof_failure_t, 2> storage{};
  goof_accumulator_t acc{};
  REQUIRE(goof_accumulator_init(&acc, nullptr, 2, GOOF_OVERFLOW_REJECT) == GOOF_E_INVALID_PARAM);
  REQUIRE(goof_accumulator_init(&acc, storage.data(), 2, static_cast<goof_overflow_policy_t>(9)) ==
          GOOF_E_INVALID_PARAM);
  REQUIRE(goof_accumulator_init(&acc, storage.data(), 2, GOOF_OVERFLOW_REJECT) == GOOF_OK);

  REQUIRE(goof_accumulator_push(&acc, GOOF_E_MISMATCH, nullptr) == GOOF_E_INVALID_PARAM);
  REQUIRE(goof_accumulator_finalize(&acc, nullptr) == GOOF_OK);
  REQUIRE(goof_accumulator_push(&acc, GOOF_OK, nullptr) == GOOF_E_INVALID_STATE);
  REQUIRE(goof_last_error()[0] != '\0');
}

TEST_CASE("C version string", "[c]") {
  REQUIRE(std::string_view(goof_version()) == "0.1.0");
}

TEST_CASE("C accumulator records only check failures of the matching kind", "[c][accumulator]") {
  std::array<goof_failure_t, 4> storage{};
  goof_accumulator_t acc{};
  REQUIRE(goof_accumulator_init(&acc, storage.data(), storage.size(), GOOF_OVERFLOW_REJECT) == GOOF_OK);

  // A rejected check leaves the descriptor unwritten; its status is not a failure.
  goof_failure_t f{};
  const goof_status_t st = goof_assert_known_i64(7, nullptr, 3, &f);
  REQUIRE(st == GOOF_E_INVALID_PARAM);
  REQUIRE(goof_accumulator_push(&acc, st, &f) == GOOF_E_INVALID_PARAM);

  for (goof_status_t misuse : {GOOF_E_CAPACITY_EXCEEDED, GOOF_E_INVALID_STATE, GOOF_E_INTERNAL,
                               GOOF_E_ACCUMULATED}) {
    REQUIRE(goof_accumulator_push(&acc, misuse, &f) == GOOF_E_INVALID_PARAM);
  }

  // Status and descriptor kind must agree.
  goof_failure_t range{};
  REQUIRE(goof_assert_in_i64(9, 0, 5, &range) == GOOF_E_OUT_OF_RANGE);
  REQUIRE(goof_accumulator_push(&acc, GOOF_E_MISMATCH, &range) == GOOF_E_INVALID_PARAM);
  REQUIRE(goof_accumulator_push(&acc, GOOF_E_OUT_OF_RANGE, &range) == GOOF_OK);

  size_t count = 0;
  REQUIRE(goof_accumulator_finalize(&acc, &count) == GOOF_E_ACCUMULATED);
  REQUIRE(count == 1);
  REQUIRE(storage[0].kind == GOOF_KIND_OUT_OF_RANGE);
}

TEST_CASE("C last error is cleared by every check", "[c]") {
  REQUIRE(goof_assert_known_i64(1, nullptr, 1, nullptr) == GOOF_E_INVALID_PARAM);
  REQUIRE(goof_last_error()[0] != '\0');
  REQUIRE(goof_assert_eq_i64(1, 1, nullptr) == GOOF_OK);
  REQUIRE(std::string_view(goof_last_error()).empty());

  REQUIRE(goof_assert_known_i64(1, nullptr, 1, nullptr) == GOOF_E_INVALID_PARAM);
  REQUIRE(goof_assert_in_i64(1, 0, 2, nullptr) == GOOF_OK);
  REQUIRE(std::string_view(goof_last_error()).empty());
}

TEST_CASE("C unknown-variant descriptor keeps negative values", "[c]") {
  const std::array<int64_t, 2> known{0, 1};
  goof_failure_t f{};
  REQUIRE(goof_assert_known_i64(-1, known.data(), known.size(), &f) == GOOF_E_UNKNOWN_VARIANT);
  REQUIRE(f.a == -1);
}
