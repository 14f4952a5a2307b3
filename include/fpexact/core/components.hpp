#ifndef FPEXACT_CORE_COMPONENTS_HPP
#define FPEXACT_CORE_COMPONENTS_HPP

// Decomposition of a float into (sign, significand, exponent) and back.
//
// The decomposed form of binary64 (binary32: 23/24 bits, -126/+128):
//
//                        sign    exponent       significand
//     normal numbers:     +-1  -1022 .. 1023   2^52 .. 2^53-1
//     subnormal numbers:  +-1      -1022          1 .. 2^52-1
//     zeros:              +-1      -1022             0
//     infinities:         +-1      +1024             0
//     NaNs:               +-1      +1024            > 0
//
// Finite values equal  sign x significand x 2^(exponent - 52).

#include <cstdint>
#include <optional>
#include <string>

#include "fpexact/core/binary.hpp"
#include "fpexact/core/bits.hpp"
#include "fpexact/core/enums.hpp"
#include "fpexact/core/errors.hpp"
#include "fpexact/core/exceptions.hpp"
#include "fpexact/core/format.hpp"

namespace fpexact {

// May hold any values; they are checked only when a float is rebuilt.
struct FloatingPointComponents {
  int Sign = +1;
  int64_t Significand = 0;
  int Exponent = 0;

  bool operator==(const FloatingPointComponents &) const = default;
};

template <SupportedFloat T>
FloatingPointComponents decompose(T Value) {
  using B = binary_t<T>;
  using Fmt = typename B::format;
  using Word = typename B::storage_type;

  Word Bits = toBits(Value);
  int Sign = (Bits & Fmt::sign_mask) ? -1 : +1;
  int Biased = static_cast<int>(extractField(Bits, Fmt::exp_offset,
                                             Fmt::exp_bits));
  auto Stored = static_cast<int64_t>(extractField(Bits, Fmt::mant_offset,
                                                  Fmt::mant_bits));

  if (Biased == 0)
    return {Sign, Stored, B::min_exponent};
  if (Biased == B::biased_exponent_max)
    return {Sign, Stored, B::nonfinite_exponent};
  return {Sign, Stored | B::hidden_bit_value, Biased - B::exponent_bias};
}

// Category of a triple as reconstruct() reads it. Assumes the exponent
// is already in range.
template <SupportedFloat T>
FloatClass classify(const FloatingPointComponents &C) {
  using B = binary_t<T>;
  if (C.Exponent == B::nonfinite_exponent)
    return FloatClass::NonFinite;
  if (C.Exponent == B::min_exponent && C.Significand < B::hidden_bit_value)
    return FloatClass::Subnormal;
  return FloatClass::Normal;
}

namespace detail {

template <SupportedFloat T>
Outcome<T> reconstruct(const FloatingPointComponents &C) {
  using B = binary_t<T>;
  using Fmt = typename B::format;
  using Word = typename B::storage_type;

  if (C.Sign != +1 && C.Sign != -1)
    return fail<T>(ErrorKind::InvalidState,
                   "sign not +-1: " + std::to_string(C.Sign));
  if (C.Exponent < B::min_exponent || C.Exponent > B::nonfinite_exponent)
    return fail<T>(ErrorKind::InvalidState,
                   "exponent out of range of " +
                       std::to_string(B::min_exponent) + " .. " +
                       std::to_string(B::nonfinite_exponent) + ": " +
                       std::to_string(C.Exponent));
  if (C.Significand < 0 || C.Significand >= B::significand_limit)
    return fail<T>(ErrorKind::InvalidState,
                   "significand out of range of 0 .. 2^" +
                       std::to_string(B::significand_bits_with_hidden_bit) +
                       "-1: " + std::to_string(C.Significand));

  FloatClass Class = classify<T>(C);
  if (Class == FloatClass::Normal && C.Significand < B::hidden_bit_value)
    return fail<T>(ErrorKind::InvalidState,
                   "significand not normalized (< 2^" +
                       std::to_string(B::significand_bits) +
                       "): " + std::to_string(C.Significand));

  int Biased = 0;
  switch (Class) {
  case FloatClass::Subnormal: Biased = 0; break;
  case FloatClass::NonFinite: Biased = B::biased_exponent_max; break;
  case FloatClass::Normal:    Biased = C.Exponent + B::exponent_bias; break;
  }

  // The stored field drops the hidden bit; a NaN payload is kept as given.
  Word Bits = (C.Sign < 0 ? Fmt::sign_mask : Word{0}) |
              insertField(Word(Biased), Fmt::exp_offset, Fmt::exp_bits) |
              insertField(Word(C.Significand), Fmt::mant_offset,
                          Fmt::mant_bits);
  return succeed(fromBits<T>(Bits));
}

} // namespace detail

template <SupportedFloat T>
T reconstruct(const FloatingPointComponents &C) {
  return settle<exceptions::Throw>(detail::reconstruct<T>(C));
}

template <SupportedFloat T>
std::optional<T> tryReconstruct(const FloatingPointComponents &C) {
  return settle<exceptions::ReturnEmpty>(detail::reconstruct<T>(C));
}

} // namespace fpexact

#endif // FPEXACT_CORE_COMPONENTS_HPP
