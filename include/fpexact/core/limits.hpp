#ifndef FPEXACT_CORE_LIMITS_HPP
#define FPEXACT_CORE_LIMITS_HPP

// Boundary constants for exact conversions between floats and integers.
//
// Relative order of the binary64 constants on the number line:
//
//    INT64_MIN       INT32_MIN           INT32_MAX       INT64_MAX
//      -2^63   -2^53   -2^31       0       +2^31-1  +2^53  +2^63-1
//   -----|-------|-------|---- .. --|-- .. ----|-------|-------|----->
//        A       B       C                     D       E      F|
//                [======== exact-integer range =======]
//
//   A  DoubleForMinLong                      -2^63, exact
//   B  MinDoubleForDoubleExactIntegerRange   -2^53
//   C  float_for_min_narrow_int              -2^31
//   D  float_for_max_narrow_int              +2^31-1
//   E  MaxDoubleForDoubleExactIntegerRange   +2^53
//   F  MaxDoubleLessThanMaxLong              2^63-1024, the float just
//                                            below 2^63 (INT64_MAX itself
//                                            has no binary64 encoding)
//
// binary32 has the same picture with 24/31 in place of 53/63, and no C/D
// since int32_t is both its narrow and its wide integer.

#include <cstdint>
#include <limits>

#include "fpexact/core/binary.hpp"

namespace fpexact {

// The contiguous integer interval [-2^(P+1), +2^(P+1)] that a format holds
// without rounding, as the wide integer type and as the float type.
template <SupportedFloat T>
struct ExactIntegerRange {
  using binary = binary_t<T>;
  using wide_int = typename binary::wide_int;

  static constexpr int exponent = binary::significand_bits_with_hidden_bit;

  static constexpr wide_int min_integer = -(wide_int{1} << exponent);
  static constexpr wide_int max_integer = +(wide_int{1} << exponent);

  static constexpr T min_value = -binary::powerOfTwo(exponent);
  static constexpr T max_value = +binary::powerOfTwo(exponent);

  static_assert(T(min_integer) == min_value && T(max_integer) == max_value);
};

// Float encodings of the integer types' bounds.
template <SupportedFloat T>
struct IntegerBoundaries {
  using binary = binary_t<T>;
  using narrow_int = typename binary::narrow_int;
  using wide_int = typename binary::wide_int;

  static constexpr int narrow_bits = std::numeric_limits<narrow_int>::digits;
  static constexpr int wide_bits = std::numeric_limits<wide_int>::digits;

  // Exact only where the format's exact-integer range covers narrow_int.
  static constexpr T float_for_min_narrow_int =
      T(std::numeric_limits<narrow_int>::min());
  static constexpr T float_for_max_narrow_int =
      T(std::numeric_limits<narrow_int>::max());

  static constexpr T float_for_min_wide_int = -binary::powerOfTwo(wide_bits);
  static constexpr T max_float_less_than_wide_max =
      binary::largestBelowPowerOfTwo(wide_bits);
};

// --- Named constants ---

inline constexpr int DoubleSignificandBits = binary64::significand_bits;
inline constexpr int DoubleSignificandBitsWithHiddenBit =
    binary64::significand_bits_with_hidden_bit;
inline constexpr int FloatSignificandBits = binary32::significand_bits;
inline constexpr int FloatSignificandBitsWithHiddenBit =
    binary32::significand_bits_with_hidden_bit;

inline constexpr int DoubleExponentBias = binary64::exponent_bias;
inline constexpr int DoubleMinExponent = binary64::min_exponent;
inline constexpr int DoubleNonfiniteExponent = binary64::nonfinite_exponent;
inline constexpr int64_t DoubleHiddenBitValue = binary64::hidden_bit_value;
inline constexpr int FloatExponentBias = binary32::exponent_bias;
inline constexpr int FloatMinExponent = binary32::min_exponent;
inline constexpr int FloatNonfiniteExponent = binary32::nonfinite_exponent;
inline constexpr int64_t FloatHiddenBitValue = binary32::hidden_bit_value;

inline constexpr int64_t MinLongForDoubleExactIntegerRange =
    ExactIntegerRange<double>::min_integer;
inline constexpr int64_t MaxLongForDoubleExactIntegerRange =
    ExactIntegerRange<double>::max_integer;
inline constexpr int32_t MinIntForFloatExactIntegerRange =
    ExactIntegerRange<float>::min_integer;
inline constexpr int32_t MaxIntForFloatExactIntegerRange =
    ExactIntegerRange<float>::max_integer;

inline constexpr double DoubleForMinLong =
    IntegerBoundaries<double>::float_for_min_wide_int;
inline constexpr double MinDoubleForDoubleExactIntegerRange =
    ExactIntegerRange<double>::min_value;
inline constexpr double MaxDoubleForDoubleExactIntegerRange =
    ExactIntegerRange<double>::max_value;
inline constexpr double MaxDoubleLessThanMaxLong =
    IntegerBoundaries<double>::max_float_less_than_wide_max;

inline constexpr float FloatForMinInt =
    IntegerBoundaries<float>::float_for_min_wide_int;
inline constexpr float MinFloatForFloatExactIntegerRange =
    ExactIntegerRange<float>::min_value;
inline constexpr float MaxFloatForFloatExactIntegerRange =
    ExactIntegerRange<float>::max_value;
inline constexpr float MaxFloatLessThanMaxInt =
    IntegerBoundaries<float>::max_float_less_than_wide_max;

} // namespace fpexact

#endif // FPEXACT_CORE_LIMITS_HPP
