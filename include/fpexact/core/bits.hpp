#ifndef FPEXACT_CORE_BITS_HPP
#define FPEXACT_CORE_BITS_HPP

// bits_t<N>: the unsigned word holding the raw encoding of an N-bit float.
// int_t<N>:  the two's-complement integer of the same width.
//
// Not integers semantically: bits_t is a bag of bits for shift, mask, OR,
// AND. Only the widths of binary32 and binary64 are provided; both map to
// standard fixed-width types so that std::bit_cast applies directly.

#include <bit>
#include <cstdint>

namespace fpexact {

namespace detail {

template <int N>
struct BitsStorage {
  static_assert(N == 32 || N == 64, "only 32-bit and 64-bit words");
};

template <int N>
  requires(N == 32)
struct BitsStorage<N> {
  using type = uint32_t;
  using signed_type = int32_t;
};

template <int N>
  requires(N == 64)
struct BitsStorage<N> {
  using type = uint64_t;
  using signed_type = int64_t;
};

} // namespace detail

template <int N>
using bits_t = typename detail::BitsStorage<N>::type;

template <int N>
using int_t = typename detail::BitsStorage<N>::signed_type;

// Reinterpret a float as its raw word and back. Payload bits of NaNs are
// carried unchanged; no arithmetic touches the value.
template <typename Float>
constexpr bits_t<int(sizeof(Float) * 8)> toBits(Float Value) {
  return std::bit_cast<bits_t<int(sizeof(Float) * 8)>>(Value);
}

template <typename Float>
constexpr Float fromBits(bits_t<int(sizeof(Float) * 8)> Bits) {
  return std::bit_cast<Float>(Bits);
}

} // namespace fpexact

#endif // FPEXACT_CORE_BITS_HPP
