#ifndef FPEXACT_CORE_CONVERT_HPP
#define FPEXACT_CORE_CONVERT_HPP

// Exact conversions between floats and fixed-width integers.
//
// Each direction is one total detail:: function returning Outcome<R>;
// toInteger/toFloating raise ArithmeticError from it and
// tryToInteger/tryToFloating return std::nullopt from it.
//
// Float -> integer, by target:
//   narrow (double -> int32_t):
//     accepts the open interval (INT32_MIN - 1, INT32_MAX + 1), i.e. every
//     value whose truncation fits the integer.
//   wide (double -> int64_t, float -> int32_t):
//     accepts [-2^(P+1), +2^(P+1)], where every integer is exact, or with
//     EnableExtendedRange [INT_MIN, largest float below INT_MAX], where
//     low-order integer digits may already have been rounded away in the
//     float. The extended range trades that precision for reach; it is
//     not checked beyond the truncation test.
// Integer -> float:
//   accepts [-2^(P+1), +2^(P+1)] only.

#include <cmath>
#include <concepts>
#include <optional>
#include <string>

#include "fpexact/core/binary.hpp"
#include "fpexact/core/errors.hpp"
#include "fpexact/core/exceptions.hpp"
#include "fpexact/core/limits.hpp"
#include "fpexact/core/split.hpp"

namespace fpexact {

struct IntegerOptions {
  // Fail instead of dropping a non-zero fraction.
  bool PreventTruncation = false;
  // Wide targets only: accept the integer type's whole range at the cost
  // of precision.
  bool EnableExtendedRange = false;
};

template <typename I, typename T>
concept IntegerTargetOf =
    SupportedFloat<T> && (std::same_as<I, typename binary_t<T>::narrow_int> ||
                          std::same_as<I, typename binary_t<T>::wide_int>);

template <typename I, typename T>
concept IntegerSourceOf =
    SupportedFloat<T> && std::same_as<I, typename binary_t<T>::wide_int>;

namespace detail {

template <typename I, typename T>
  requires IntegerTargetOf<I, T>
Outcome<I> floatToInteger(T Value, const IntegerOptions &Opts) {
  using Range = ExactIntegerRange<T>;
  using Bounds = IntegerBoundaries<T>;

  if (!std::isfinite(Value))
    return fail<I>(ErrorKind::NotFinite, "not finite", describe(Value));

  if constexpr (!std::same_as<I, typename binary_t<T>::wide_int>) {
    if (!(Bounds::float_for_min_narrow_int - T(1) < Value &&
          Value < Bounds::float_for_max_narrow_int + T(1)))
      return fail<I>(ErrorKind::Range,
                     "out of range of (-2^" +
                         std::to_string(Bounds::narrow_bits) + "-1, 2^" +
                         std::to_string(Bounds::narrow_bits) + ")",
                     describe(Value));
  } else if (!Opts.EnableExtendedRange) {
    if (!(Range::min_value <= Value && Value <= Range::max_value))
      return fail<I>(ErrorKind::Range,
                     "out of significand range of -2^" +
                         std::to_string(Range::exponent) + " .. 2^" +
                         std::to_string(Range::exponent),
                     describe(Value));
  } else {
    if (!(Bounds::float_for_min_wide_int <= Value &&
          Value <= Bounds::max_float_less_than_wide_max))
      return fail<I>(ErrorKind::Range,
                     "out of integer range of [-2^" +
                         std::to_string(Bounds::wide_bits) + ", 2^" +
                         std::to_string(Bounds::wide_bits) + "-1)",
                     describe(Value));
  }

  if (Opts.PreventTruncation && hasNonZeroFraction(Value))
    return fail<I>(ErrorKind::Truncation, "fraction non-zero",
                   describe(Value));

  // In range: the conversion truncates toward zero and cannot overflow.
  return succeed(static_cast<I>(Value));
}

template <typename T, typename I>
  requires IntegerSourceOf<I, T>
Outcome<T> integerToFloat(I Value) {
  using Range = ExactIntegerRange<T>;
  if (!(Range::min_integer <= Value && Value <= Range::max_integer))
    return fail<T>(ErrorKind::Range,
                   "out of significand range of -2^" +
                       std::to_string(Range::exponent) + " .. 2^" +
                       std::to_string(Range::exponent),
                   describe(Value));
  return succeed(static_cast<T>(Value));
}

} // namespace detail

template <typename I, typename T>
  requires IntegerTargetOf<I, T>
I toInteger(T Value, const IntegerOptions &Opts = {}) {
  return settle<exceptions::Throw>(detail::floatToInteger<I>(Value, Opts));
}

template <typename I, typename T>
  requires IntegerTargetOf<I, T>
std::optional<I> tryToInteger(T Value, const IntegerOptions &Opts = {}) {
  return settle<exceptions::ReturnEmpty>(
      detail::floatToInteger<I>(Value, Opts));
}

template <typename T, typename I>
  requires IntegerSourceOf<I, T>
T toFloating(I Value) {
  return settle<exceptions::Throw>(detail::integerToFloat<T>(Value));
}

template <typename T, typename I>
  requires IntegerSourceOf<I, T>
std::optional<T> tryToFloating(I Value) {
  return settle<exceptions::ReturnEmpty>(detail::integerToFloat<T>(Value));
}

} // namespace fpexact

#endif // FPEXACT_CORE_CONVERT_HPP
