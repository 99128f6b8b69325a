#pragma once

/** \file accumulator.hpp
 *  \brief Fail-complete strategy: collect every failure of a batch of checks.
 *
 * State machine: empty -> collecting -> finalized.
 * - push(success): no change.
 * - push(failure): appended while size < N; beyond that the overflow policy
 *   chosen at construction applies (drop_and_flag or reject).
 * - push in finalized: invalid_state error.
 * - finalize(): success if nothing was recorded, else the Accumulated report.
 *
 * Capacity is a template parameter; storage is inline (FixedVector).
 * Thread-safety: not thread-safe; one accumulator per batch.
 */

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <utility>

#include "goof/config.hpp"
#include "goof/error.hpp"
#include "goof/fixed_vector.hpp"

namespace goof {

enum class accumulator_state : std::uint8_t { empty, collecting, finalized };

/** \brief Outcome of offering one failure to an accumulator. */
enum class admission : std::uint8_t {
  append,          /**< store the failure */
  drop,            /**< full under drop_and_flag: discard and flag */
  reject_capacity, /**< full under reject: fail the push */
  reject_state,    /**< already finalized: fail the push */
};

/** \brief Admission rule shared by the C++ accumulator and the C boundary. */
[[nodiscard]] constexpr auto admit(accumulator_state state, std::size_t size, std::size_t capacity,
                                   overflow_policy policy) noexcept -> admission {
  if (state == accumulator_state::finalized) return admission::reject_state;
  if (size < capacity) return admission::append;
  return policy == overflow_policy::drop_and_flag ? admission::drop : admission::reject_capacity;
}

inline constexpr core::error accumulator_full_error{
    core::error_code::capacity_exceeded, "accumulator full", "goof.accumulator"};
inline constexpr core::error accumulator_finalized_error{
    core::error_code::invalid_state, "accumulator already finalized", "goof.accumulator"};

/** \brief Report produced by a finalized accumulator holding failures. */
template <typename E, std::size_t N>
struct Accumulated {
  FixedVector<E, N> entries; /**< encounter order */
  bool overflowed{false};    /**< at least one failure was dropped */
  std::size_t dropped{0};    /**< failures dropped under drop_and_flag */

  [[nodiscard]] auto size() const noexcept -> std::size_t { return entries.size(); }
  [[nodiscard]] static constexpr auto capacity() noexcept -> std::size_t { return N; }
  [[nodiscard]] auto operator[](std::size_t i) const noexcept -> const E& { return entries[i]; }
  [[nodiscard]] auto begin() const noexcept { return entries.begin(); }
  [[nodiscard]] auto end() const noexcept { return entries.end(); }

  friend auto operator==(const Accumulated& a, const Accumulated& b) -> bool {
    return a.overflowed == b.overflowed && a.dropped == b.dropped && a.entries == b.entries;
  }
};

template <typename E, std::size_t N>
class Accumulator {
public:
  using report_type = Accumulated<E, N>;

  explicit Accumulator(overflow_policy policy = config::default_overflow_policy) noexcept
      : policy_(policy) {}

  /** \brief Record the failure of result, if any.
   *  \return capacity_exceeded under the reject policy when full,
   *          invalid_state after finalize()
   */
  template <typename T, typename F>
    requires std::constructible_from<E, F&&>
  auto push(std::expected<T, F> result) -> std::expected<void, core::error> {
    if (state_ == accumulator_state::finalized) {
      return std::unexpected(accumulator_finalized_error);
    }
    if (result.has_value()) return {};
    return push_failure(std::move(result).error());
  }

  /** \brief Record a bare descriptor. */
  template <typename F>
    requires std::constructible_from<E, F&&>
  auto push_failure(F&& failure) -> std::expected<void, core::error> {
    switch (admit(state_, report_.entries.size(), N, policy_)) {
      case admission::reject_state:
        return std::unexpected(accumulator_finalized_error);
      case admission::reject_capacity:
        return std::unexpected(accumulator_full_error);
      case admission::drop:
        report_.overflowed = true;
        ++report_.dropped;
        return {};
      case admission::append:
        break;
    }
    if (!report_.entries.try_emplace_back(std::forward<F>(failure))) {
      return std::unexpected(accumulator_full_error);
    }
    state_ = accumulator_state::collecting;
    return {};
  }

  /** \brief Push several results in order; stops at the first rejected push. */
  template <typename... Results>
  auto push_all(Results&&... results) -> std::expected<void, core::error> {
    std::expected<void, core::error> status{};
    ((status = status.has_value() ? push(std::forward<Results>(results)) : status), ...);
    return status;
  }

  /** \brief Close the batch. Repeated calls return the same outcome. */
  auto finalize() -> std::expected<void, report_type> {
    state_ = accumulator_state::finalized;
    if (report_.entries.empty() && report_.dropped == 0) return {};
    return std::unexpected(report_);
  }

  [[nodiscard]] auto state() const noexcept -> accumulator_state { return state_; }
  [[nodiscard]] auto policy() const noexcept -> overflow_policy { return policy_; }
  [[nodiscard]] auto size() const noexcept -> std::size_t { return report_.entries.size(); }
  [[nodiscard]] auto overflowed() const noexcept -> bool { return report_.overflowed; }
  [[nodiscard]] static constexpr auto capacity() noexcept -> std::size_t { return N; }

private:
  report_type report_{};
  accumulator_state state_{accumulator_state::empty};
  overflow_policy policy_;
};

} // namespace goof
