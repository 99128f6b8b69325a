#include <goof/error.hpp>
#include <goof/error_mapping.hpp>
#include <goof/goof.hpp>
#include <catch2/catch_all.hpp>

#include <string_view>
#include <variant>

using goof::core::error_code;

TEST_CASE("error codes stable subset", "[errors]") {
  REQUIRE(static_cast<unsigned>(error_code::ok) == 0u);
  REQUIRE(static_cast<unsigned>(error_code::mismatch) == 1001u);
  REQUIRE(static_cast<unsigned>(error_code::capacity_exceeded) == 5001u);
  REQUIRE(static_cast<unsigned>(error_code::internal) == 9001u);
}

TEST_CASE("error code names are stable identifiers", "[errors]") {
  REQUIRE(std::string_view(goof::core::error_code_name(error_code::out_of_range)) == "out_of_range");
  REQUIRE(std::string_view(goof::core::error_code_name(error_code::invalid_state)) == "invalid_state");
}

TEST_CASE("descriptors map to their error codes", "[errors][mapping]") {
  using namespace goof;
  REQUIRE(error_code_of(Mismatch<int>{1, 2}) == error_code::mismatch);
  REQUIRE(error_code_of(OutOfRange<int>{1, 2, 3}) == error_code::out_of_range);
  REQUIRE(error_code_of(UnknownVariant{}) == error_code::unknown_variant);
  REQUIRE(error_code_of(goof::goof("x")) == error_code::internal);
}

TEST_CASE("wrappers map to the code of what they carry", "[errors][mapping]") {
  using namespace goof;
  auto ctx = with_context(with_context(assert_in(5, 10, 1), "inner"), "outer");
  REQUIRE(error_code_of(ctx.error()) == error_code::out_of_range);

  std::variant<Mismatch<int>, UnknownVariant> v = UnknownVariant{};
  REQUIRE(error_code_of(v) == error_code::unknown_variant);

  auto parked = try_or_resume(assert_eq_with(1), 2);
  REQUIRE(error_code_of(parked.error()) == error_code::mismatch);

  Accumulator<Mismatch<int>, 1> acc;
  REQUIRE(acc.push(assert_eq(1, 2)).has_value());
  REQUIRE(error_code_of(acc.finalize().error()) == error_code::accumulated);
}

TEST_CASE("to_error produces a generic error view", "[errors][mapping]") {
  const auto e = goof::to_error(goof::Mismatch<int>{1, 2}, "config.loader");
  REQUIRE(e.code == error_code::mismatch);
  REQUIRE(std::string_view(e.message) == "mismatch");
  REQUIRE(std::string_view(e.component) == "config.loader");
}

TEST_CASE("C status mapping round-trips", "[errors][c]") {
  for (auto ec : {error_code::ok, error_code::mismatch, error_code::out_of_range,
                  error_code::unknown_variant, error_code::accumulated, error_code::invalid_state,
                  error_code::capacity_exceeded, error_code::internal, error_code::invalid_argument}) {
    REQUIRE(goof::from_c_status(goof::to_c_status(ec)) == ec);
  }
  REQUIRE(goof::from_c_status(static_cast<goof_status_t>(12345)) == error_code::internal);
}
