#pragma once

/** \file resumable.hpp
 *  \brief Resumable strategy: propagate a failure together with what is
 *  needed to re-run the failed check on corrected input.
 *
 * The retry token stores the operation and the input by value. Both must be
 * trivially copyable, so a token can never own heap memory (no
 * std::function, no std::string).
 */

#include <concepts>
#include <expected>
#include <functional>
#include <type_traits>
#include <utility>

namespace goof {

template <typename T> struct is_expected : std::false_type {};
template <typename T, typename E> struct is_expected<std::expected<T, E>> : std::true_type {};
template <typename T> inline constexpr bool is_expected_v = is_expected<T>::value;

template <typename Op, typename Input>
using op_result_t = std::invoke_result_t<const Op&, const Input&>;

/** \brief An operation that can be parked in a RetryToken. */
template <typename Op, typename Input>
concept ResumableOp = std::is_trivially_copyable_v<Op> && std::is_trivially_copyable_v<Input> &&
                      std::invocable<const Op&, const Input&> &&
                      is_expected_v<op_result_t<Op, Input>>;

template <typename Op, typename Input>
struct RetryToken {
  Op op;
  Input input; /**< the input that failed */
};

template <typename E, typename Op, typename Input>
struct Resumable {
  E failure;
  RetryToken<Op, Input> retry_token;
};

template <typename Op, typename Input>
  requires ResumableOp<Op, Input>
using resumable_result_t =
    std::expected<typename op_result_t<Op, Input>::value_type,
                  Resumable<typename op_result_t<Op, Input>::error_type, Op, Input>>;

/** \brief Run op(input); on failure park op and input next to the failure. */
template <typename Op, typename Input>
  requires ResumableOp<Op, Input>
[[nodiscard]] constexpr auto try_or_resume(Op op, Input input) -> resumable_result_t<Op, Input> {
  using R = op_result_t<Op, Input>;
  using Out = resumable_result_t<Op, Input>;
  R r = std::invoke(op, std::as_const(input));
  if (r.has_value()) {
    if constexpr (std::is_void_v<typename R::value_type>) {
      return Out{};
    } else {
      return Out(std::in_place, std::move(*r));
    }
  }
  using Failure = typename Out::error_type;
  return std::unexpected(Failure{std::move(r).error(), RetryToken<Op, Input>{op, input}});
}

/** \brief Re-run the parked operation with corrected input.
 *
 * The failed input is never re-executed: when corrected equals it, the
 * recorded failure is returned without invoking the operation.
 */
template <typename E, typename Op, typename Input>
  requires ResumableOp<Op, Input>
[[nodiscard]] constexpr auto resume(const Resumable<E, Op, Input>& parked,
                                    std::type_identity_t<Input> corrected) -> op_result_t<Op, Input> {
  if constexpr (std::equality_comparable<Input>) {
    if (corrected == parked.retry_token.input) {
      return std::unexpected(parked.failure);
    }
  }
  return std::invoke(parked.retry_token.op, std::as_const(corrected));
}

} // namespace goof
