#ifndef FPEXACT_CORE_ENUMS_HPP
#define FPEXACT_CORE_ENUMS_HPP

#include <bit>

namespace fpexact {

// Order of bytes in a FloatBits buffer. Hex text is always BigEndian.
enum class ByteOrder { BigEndian, LittleEndian };

// Byte order of the host. Exposed for interoperability with native
// buffers; never used as a default.
inline constexpr ByteOrder NativeByteOrder =
    std::endian::native == std::endian::big ? ByteOrder::BigEndian
                                            : ByteOrder::LittleEndian;

static_assert(std::endian::native == std::endian::big ||
                  std::endian::native == std::endian::little,
              "mixed-endian hosts are not supported");

enum class FloatClass {
  Normal,    // hidden bit set, biased exponent in [1, all-ones)
  Subnormal, // minimum exponent, hidden bit clear (includes both zeros)
  NonFinite  // all-ones exponent: infinities and NaNs
};

enum class ErrorKind {
  Size,         // byte buffer length differs from the float width
  Format,       // malformed hex text
  Config,       // caller-supplied parameter violates its precondition
  Range,        // value outside the interval the operation accepts
  NotFinite,    // integer conversion of an infinity or NaN
  Truncation,   // non-zero fraction while truncation is disallowed
  InvalidState  // component triple violates the IEEE 754 layout
};

inline constexpr const char *errorKindName(ErrorKind K) {
  switch (K) {
  case ErrorKind::Size:         return "size";
  case ErrorKind::Format:       return "format";
  case ErrorKind::Config:       return "config";
  case ErrorKind::Range:        return "range";
  case ErrorKind::NotFinite:    return "not-finite";
  case ErrorKind::Truncation:   return "truncation";
  case ErrorKind::InvalidState: return "invalid-state";
  }
  return "???";
}

} // namespace fpexact

#endif // FPEXACT_CORE_ENUMS_HPP
