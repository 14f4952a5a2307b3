#ifndef FPEXACT_TESTS_HARNESS_IMPL_FPEXACT_HPP
#define FPEXACT_TESTS_HARNESS_IMPL_FPEXACT_HPP

// fpexact adapter: the library under test, as one implementation among
// equals.
//
// Provides FpexactAdapter<BinaryType> satisfying the adapter interface:
//   dispatch(Op, BitsType) -> TestOutput
//
// Flags are derived from the optional-returning entry points: Invalid
// when the plain conversion is rejected, Inexact when it succeeds but
// the PreventTruncation form is rejected.

#include <cstdint>

#include "harness/ops.hpp"
#include "fpexact/fpexact.hpp"

namespace fpexact::testing {

template <typename BinaryType> struct FpexactAdapter {
  using T = typename BinaryType::value_type;
  using BitsType = typename BinaryType::storage_type;
  using NarrowInt = typename BinaryType::narrow_int;
  using WideInt = typename BinaryType::wide_int;

  static constexpr const char *name() { return "fpexact"; }

  TestOutput dispatch(Op O, BitsType In) const {
    switch (O) {
    case Op::ToNarrowInt:       return toInt<NarrowInt>(fromBits<T>(In), false);
    case Op::ToWideInt:         return toInt<WideInt>(fromBits<T>(In), false);
    case Op::ToWideIntExtended: return toInt<WideInt>(fromBits<T>(In), true);
    case Op::FromWideInt: {
      auto R = tryToFloating<T>(static_cast<WideInt>(In));
      if (!R)
        return {0, flags::Invalid};
      return {static_cast<uint64_t>(toBits(*R)), 0};
    }
    }
    return {0, flags::Invalid};
  }

private:
  template <typename I> static TestOutput toInt(T Value, bool Extended) {
    IntegerOptions Opts;
    Opts.EnableExtendedRange = Extended;
    auto Truncated = tryToInteger<I>(Value, Opts);
    if (!Truncated)
      return {0, flags::Invalid};
    Opts.PreventTruncation = true;
    uint8_t Flags = tryToInteger<I>(Value, Opts) ? 0 : flags::Inexact;
    return {static_cast<uint64_t>(static_cast<int64_t>(*Truncated)), Flags};
  }
};

} // namespace fpexact::testing

#endif // FPEXACT_TESTS_HARNESS_IMPL_FPEXACT_HPP
