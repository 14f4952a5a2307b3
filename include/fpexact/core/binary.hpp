#ifndef FPEXACT_CORE_BINARY_HPP
#define FPEXACT_CORE_BINARY_HPP

#include <concepts>
#include <cstdint>
#include <limits>

#include "fpexact/core/bits.hpp"
#include "fpexact/core/format.hpp"

namespace fpexact {

// ValidBinaryFormat: a bit geometry, the native C++ type that carries it,
// and the two integer types it converts to must agree with each other.
template <typename Fmt, typename Native, typename NarrowInt, typename WideInt>
concept ValidBinaryFormat =
    std::floating_point<Native> && std::numeric_limits<Native>::is_iec559 &&
    std::signed_integral<NarrowInt> && std::signed_integral<WideInt> &&
    Fmt::is_standard_layout() &&
    int(sizeof(Native) * 8) == Fmt::total_bits &&
    std::numeric_limits<Native>::digits == Fmt::mant_bits + 1 &&
    sizeof(NarrowInt) <= sizeof(WideInt) &&
    // the exact-integer range must fit the wider integer with room to spare
    std::numeric_limits<WideInt>::digits > Fmt::mant_bits + 1;

// Binary describes one IEEE 754 binary interchange format as it is used by
// the conversions: field geometry, exponent bias and the sentinels of the
// decomposed form, and the integer types on either side of the format's
// exact-integer range.
//
//   NarrowInt: an integer type whose whole range the format may hold with
//              fractional digits to spare (binary64 -> int32_t).
//   WideInt:   the integer type that contains the exact-integer range
//              (binary64 -> int64_t, binary32 -> int32_t).
template <typename Fmt, typename Native, typename NarrowInt, typename WideInt>
  requires ValidBinaryFormat<Fmt, Native, NarrowInt, WideInt>
struct Binary {
  using format = Fmt;
  using value_type = Native;
  using storage_type = bits_t<Fmt::total_bits>;
  using narrow_int = NarrowInt;
  using wide_int = WideInt;

  static constexpr int total_bytes = Fmt::total_bytes;

  // Significand width without and with the hidden bit.
  static constexpr int significand_bits = Fmt::mant_bits;
  static constexpr int significand_bits_with_hidden_bit = Fmt::mant_bits + 1;

  static constexpr int biased_exponent_max = int(Fmt::exp_field_max);
  static constexpr int exponent_bias = (1 << (Fmt::exp_bits - 1)) - 1;

  // Exponent of zeros and subnormals, and the sentinel exponent of
  // infinities and NaNs, in the decomposed (unbiased) form.
  static constexpr int min_exponent = 1 - exponent_bias;
  static constexpr int nonfinite_exponent = biased_exponent_max - exponent_bias;

  static constexpr int64_t hidden_bit_value = int64_t{1} << significand_bits;
  static constexpr int64_t significand_limit = hidden_bit_value << 1;

  // Float with the value 2^N (N in the normal exponent range).
  static constexpr Native powerOfTwo(int N) {
    return fromBits<Native>(storage_type(N + exponent_bias)
                            << Fmt::exp_offset);
  }

  // Largest float strictly less than 2^N.
  static constexpr Native largestBelowPowerOfTwo(int N) {
    return fromBits<Native>((storage_type(N + exponent_bias)
                             << Fmt::exp_offset) -
                            1);
  }
};

using binary32 = Binary<fp32_layout, float, int32_t, int32_t>;
using binary64 = Binary<fp64_layout, double, int32_t, int64_t>;

// Native type -> format descriptor.
template <typename T> struct BinaryOf;
template <> struct BinaryOf<float> { using type = binary32; };
template <> struct BinaryOf<double> { using type = binary64; };

template <typename T>
using binary_t = typename BinaryOf<T>::type;

template <typename T>
concept SupportedFloat = requires { typename BinaryOf<T>::type; };

} // namespace fpexact

#endif // FPEXACT_CORE_BINARY_HPP
