#ifndef FPEXACT_CORE_FORMAT_HPP
#define FPEXACT_CORE_FORMAT_HPP

#include "fpexact/core/bits.hpp"

namespace fpexact {

// Bit geometry of a storage word.
//
// Describes where the sign, biased exponent and stored significand live
// inside the raw encoding, and derives the masks used to pull them apart
// and put them back together. Says nothing about what the fields mean;
// that is Binary's job.
template <int SignBits, int SignOffset, int ExpBits, int ExpOffset,
          int MantBits, int MantOffset, int TotalBits>
struct Format {
  using word_type = bits_t<TotalBits>;

  static constexpr int sign_bits = SignBits;
  static constexpr int sign_offset = SignOffset;
  static constexpr int exp_bits = ExpBits;
  static constexpr int exp_offset = ExpOffset;
  static constexpr int mant_bits = MantBits;
  static constexpr int mant_offset = MantOffset;
  static constexpr int total_bits = TotalBits;
  static constexpr int total_bytes = TotalBits / 8;

  static constexpr word_type sign_mask = word_type{1} << SignOffset;
  static constexpr word_type exp_field_max =
      (word_type{1} << ExpBits) - 1; // all-ones biased exponent
  static constexpr word_type exp_mask = exp_field_max << ExpOffset;
  static constexpr word_type mant_mask =
      ((word_type{1} << MantBits) - 1) << MantOffset;

  static constexpr bool is_standard_layout() {
    return SignBits == 1 && SignOffset == ExpOffset + ExpBits &&
           ExpOffset == MantOffset + MantBits && MantOffset == 0 &&
           TotalBits == SignBits + ExpBits + MantBits;
  }

  static_assert(SignBits == 1, "sign-magnitude formats carry one sign bit");
  static_assert(ExpBits >= 2, "exponent field needs room for 0 and all-ones");
  static_assert(MantBits >= 1, "mantissa field must be at least 1 bit");
  static_assert(TotalBits % 8 == 0, "storage word must be whole bytes");
  static_assert(TotalBits >= SignBits + ExpBits + MantBits,
                "total bits must accommodate all fields");
  static_assert(SignOffset + SignBits <= TotalBits,
                "sign field must fit in storage word");
  static_assert(ExpOffset + ExpBits <= TotalBits,
                "exponent field must fit in storage word");
  static_assert(MantOffset + MantBits <= TotalBits,
                "mantissa field must fit in storage word");
  static_assert((sign_mask & exp_mask) == 0 && (exp_mask & mant_mask) == 0 &&
                    (sign_mask & mant_mask) == 0,
                "fields must not overlap");
};

// Extract a field of `Width` bits starting at bit `Offset` from `Bits`.
template <typename BitsType>
inline constexpr BitsType extractField(BitsType Bits, int Offset, int Width) {
  if (Width == 0)
    return BitsType{0};
  return (Bits >> Offset) & ((BitsType{1} << Width) - 1);
}

// Place the low `Width` bits of `Value` at bit `Offset`; higher bits of
// `Value` are dropped.
template <typename BitsType>
inline constexpr BitsType insertField(BitsType Value, int Offset, int Width) {
  if (Width == 0)
    return BitsType{0};
  return (Value & ((BitsType{1} << Width) - 1)) << Offset;
}

// Standard IEEE 754 field ordering: [S][E][M]
template <int ExpBits, int MantBits>
using IEEE_Layout =
    Format<1,                      // SignBits
           ExpBits + MantBits,     // SignOffset (MSB)
           ExpBits,                // ExpBits
           MantBits,               // ExpOffset
           MantBits,               // MantBits
           0,                      // MantOffset (LSB)
           1 + ExpBits + MantBits  // TotalBits
           >;

using fp32_layout = IEEE_Layout<8, 23>;
using fp64_layout = IEEE_Layout<11, 52>;

} // namespace fpexact

#endif // FPEXACT_CORE_FORMAT_HPP
