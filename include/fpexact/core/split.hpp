#ifndef FPEXACT_CORE_SPLIT_HPP
#define FPEXACT_CORE_SPLIT_HPP

#include <cmath>

#include "fpexact/core/binary.hpp"
#include "fpexact/core/rounding.hpp"

namespace fpexact {

template <typename T> struct IntegralAndFractional {
  T Integral;
  T Fractional;

  IntegralAndFractional operator+() const { return *this; }
  IntegralAndFractional operator-() const { return {-Integral, -Fractional}; }
};

// Integral part of a value, cut in the direction Rnd names. Infinities
// and NaN come back unchanged.
template <RoundingPolicy Rnd = rounding::Default, SupportedFloat T>
T integralPart(T Value) {
  if (Rnd::towards_negative || Value >= T(0))
    return std::floor(Value);
  return -std::floor(-Value);
}

// (integral, value - integral). An infinity gives (inf, NaN); NaN gives
// (NaN, NaN). With TowardZero the fraction carries the value's sign, with
// TowardNegative it lies in [0, 1].
template <RoundingPolicy Rnd = rounding::Default, SupportedFloat T>
IntegralAndFractional<T> split(T Value) {
  T Integral = integralPart<Rnd>(Value);
  return {Integral, Value - Integral};
}

template <RoundingPolicy Rnd = rounding::Default, SupportedFloat T>
T fractionalPart(T Value) {
  return split<Rnd>(Value).Fractional;
}

// True when the value is not an integer. Infinities and NaN count as
// fractional since their fraction is NaN.
template <SupportedFloat T>
bool hasNonZeroFraction(T Value) {
  return fractionalPart<rounding::TowardZero>(Value) != T(0);
}

} // namespace fpexact

#endif // FPEXACT_CORE_SPLIT_HPP
