// Exact-value validation: check fpexact's bit-level operations against
// values computed by MPFR from the raw fields.
//
//   decompose    sign x significand x 2^(exponent - P) equals the value
//   reconstruct  rebuilds every bit pattern decompose produced
//   split        integral part is trunc/floor, fraction is value - integral
//   constants    every boundary constant is the power of two it names

#include "harness/test_harness.hpp"
#include "oracle/mpfr_exact.hpp"

#include <cmath>
#include <cstdio>
#include <random>

using namespace fpexact;
using namespace fpexact::oracle;
using namespace fpexact::testing;

static constexpr int RandomCount = 1000000;
static constexpr int MaxReported = 10;

// Calls Check on every interesting bit pattern and on RandomCount random
// ones; returns the number of patterns it rejected.
template <typename BinaryType, typename CheckFn>
int forEachPattern(const char *Name, CheckFn Check) {
  using BitsType = typename BinaryType::storage_type;
  constexpr int HexWidth = BinaryType::format::total_bits / 4;

  int Total = 0;
  int Failures = 0;
  auto Run = [&](BitsType Bits) {
    ++Total;
    if (Check(Bits))
      return;
    if (++Failures <= MaxReported) {
      std::fprintf(stderr, "  %s MISMATCH: bits=0x", Name);
      printHex(stderr, Bits, HexWidth);
      std::fprintf(stderr, "\n");
    }
  };

  constexpr auto Values = interestingValues<BinaryType>();
  for (auto Bits : Values)
    Run(Bits);
  RandomValues<BitsType>{42, RandomCount}(Run);

  std::printf("    %-12s %d/%d passed\n", Name, Total - Failures, Total);
  return Failures;
}

static bool sameMpfr(const MpfrFloat &A, const MpfrFloat &B) {
  if (A.isZero() && B.isZero())
    return A.isNegative() == B.isNegative();
  return mpfr_cmp(A, B) == 0;
}

// ===================================================================
// decompose / reconstruct
// ===================================================================

template <typename BinaryType> int verifyComponents() {
  using T = typename BinaryType::value_type;
  using BitsType = typename BinaryType::storage_type;
  using Fmt = typename BinaryType::format;

  int Failures = forEachPattern<BinaryType>("decompose", [](BitsType Bits) {
    FloatingPointComponents C = decompose(fromBits<T>(Bits));
    if (C.Sign != +1 && C.Sign != -1)
      return false;
    if (C.Significand < 0 || C.Significand >= BinaryType::significand_limit)
      return false;

    MpfrFloat Exact = decodeToMpfr<BinaryType>(Bits);
    if (Exact.isNan() || Exact.isInf())
      return C.Exponent == BinaryType::nonfinite_exponent &&
             static_cast<BitsType>(C.Significand) == (Bits & Fmt::mant_mask);
    return sameMpfr(componentsToMpfr<BinaryType>(C), Exact);
  });

  Failures += forEachPattern<BinaryType>("reconstruct", [](BitsType Bits) {
    auto Rebuilt = tryReconstruct<T>(decompose(fromBits<T>(Bits)));
    return Rebuilt && toBits(*Rebuilt) == Bits;
  });

  return Failures;
}

// ===================================================================
// split
// ===================================================================

template <typename BinaryType, typename Rnd> int verifySplit(const char *Name) {
  using T = typename BinaryType::value_type;
  using BitsType = typename BinaryType::storage_type;

  return forEachPattern<BinaryType>(Name, [](BitsType Bits) {
    T Value = fromBits<T>(Bits);
    auto Parts = split<Rnd>(Value);
    if (!std::isfinite(Value))
      return std::isnan(Parts.Fractional) &&
             (std::isnan(Value) ? std::isnan(Parts.Integral)
                                : Parts.Integral == Value);

    MpfrFloat Exact = decodeToMpfr<BinaryType>(Bits);
    MpfrFloat Integral;
    if (Rnd::towards_negative)
      mpfr_floor(Integral, Exact);
    else
      mpfr_trunc(Integral, Exact);
    if (mpfr_cmp(decodeToMpfr<BinaryType>(toBits(Parts.Integral)), Integral) !=
        0)
      return false;

    // value - integral is exact for truncation; flooring a negative value
    // may round the fraction up to 1.
    MpfrFloat Fraction;
    mpfr_sub(Fraction, Exact, Integral, MPFR_RNDN);
    return mpfrToNative<T>(Fraction) == Parts.Fractional;
  });
}

// ===================================================================
// Boundary constants
// ===================================================================

// Sign x 2^Exponent, exactly.
template <typename BinaryType>
bool isPowerOfTwo(typename BinaryType::value_type Value, int Sign,
                  int Exponent) {
  MpfrFloat Exact = decodeToMpfr<BinaryType>(toBits(Value));
  return mpfr_cmp_si_2exp(Exact, Sign, Exponent) == 0;
}

// The largest value below 2^Exponent: its successor is 2^Exponent.
template <typename BinaryType>
bool isLargestBelow(typename BinaryType::value_type Value, int Exponent) {
  MpfrFloat Exact = decodeToMpfr<BinaryType>(toBits(Value));
  MpfrFloat Next = decodeToMpfr<BinaryType>(toBits(Value) + 1);
  return mpfr_cmp_si_2exp(Exact, 1, Exponent) < 0 &&
         mpfr_cmp_si_2exp(Next, 1, Exponent) == 0;
}

static int verifyConstants() {
  struct Entry {
    const char *Name;
    bool Ok;
  };
  Entry Entries[] = {
      {"DoubleForMinLong", isPowerOfTwo<binary64>(DoubleForMinLong, -1, 63)},
      {"MinDoubleForDoubleExactIntegerRange",
       isPowerOfTwo<binary64>(MinDoubleForDoubleExactIntegerRange, -1, 53)},
      {"MaxDoubleForDoubleExactIntegerRange",
       isPowerOfTwo<binary64>(MaxDoubleForDoubleExactIntegerRange, +1, 53)},
      {"MaxDoubleLessThanMaxLong",
       isLargestBelow<binary64>(MaxDoubleLessThanMaxLong, 63)},
      {"FloatForMinInt", isPowerOfTwo<binary32>(FloatForMinInt, -1, 31)},
      {"MinFloatForFloatExactIntegerRange",
       isPowerOfTwo<binary32>(MinFloatForFloatExactIntegerRange, -1, 24)},
      {"MaxFloatForFloatExactIntegerRange",
       isPowerOfTwo<binary32>(MaxFloatForFloatExactIntegerRange, +1, 24)},
      {"MaxFloatLessThanMaxInt",
       isLargestBelow<binary32>(MaxFloatLessThanMaxInt, 31)},
      {"MinLongForDoubleExactIntegerRange",
       mpfr_cmp_si_2exp(integerToMpfr(MinLongForDoubleExactIntegerRange), -1,
                        53) == 0},
      {"MaxLongForDoubleExactIntegerRange",
       mpfr_cmp_si_2exp(integerToMpfr(MaxLongForDoubleExactIntegerRange), +1,
                        53) == 0},
      {"MinIntForFloatExactIntegerRange",
       mpfr_cmp_si_2exp(integerToMpfr(MinIntForFloatExactIntegerRange), -1,
                        24) == 0},
      {"MaxIntForFloatExactIntegerRange",
       mpfr_cmp_si_2exp(integerToMpfr(MaxIntForFloatExactIntegerRange), +1,
                        24) == 0},
  };

  int Failures = 0;
  for (auto &E : Entries) {
    if (!E.Ok) {
      ++Failures;
      std::fprintf(stderr, "  CONSTANT MISMATCH: %s\n", E.Name);
    }
  }
  int Total = static_cast<int>(sizeof(Entries) / sizeof(Entries[0]));
  std::printf("    %-12s %d/%d passed\n", "constants", Total - Failures,
              Total);
  return Failures;
}

// ===================================================================
// Main
// ===================================================================

template <typename BinaryType> int verifyFormat() {
  int Failures = 0;
  Failures += verifyComponents<BinaryType>();
  Failures += verifySplit<BinaryType, rounding::TowardZero>("split");
  Failures += verifySplit<BinaryType, rounding::TowardNegative>("split-floor");
  return Failures;
}

int main() {
  int Failures = 0;

  std::printf("=== binary32 ===\n");
  Failures += verifyFormat<binary32>();

  std::printf("\n=== binary64 ===\n");
  Failures += verifyFormat<binary64>();

  std::printf("\n=== boundary constants ===\n");
  Failures += verifyConstants();

  if (Failures > 0) {
    std::fprintf(stderr, "\nFAILED: %d total failures\n", Failures);
    return 1;
  }

  std::printf("\nPASS: all exact values agree\n");
  return 0;
}
