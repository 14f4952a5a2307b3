#ifndef FPEXACT_CORE_CODEC_HPP
#define FPEXACT_CORE_CODEC_HPP

// Byte/Hex codec: float <-> raw bytes <-> hex text.
//
// Byte buffers may be in either byte order and default to big-endian.
// Hex text is always big-endian: the first two digits are the byte that
// holds the sign bit.
//
// Hex grammar accepted by hexToBytes:
//   optional "0x" / "0X" prefix, then digits [0-9A-Fa-f] with any number
//   of '_' anywhere; the digit count must be even.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "fpexact/core/binary.hpp"
#include "fpexact/core/bits.hpp"
#include "fpexact/core/enums.hpp"
#include "fpexact/core/errors.hpp"
#include "fpexact/core/exceptions.hpp"

namespace fpexact {

using Bytes = std::vector<uint8_t>;

struct HexFormat {
  bool WithPrefix = false;         // leading "0x"
  bool Lowercase = false;          // a-f instead of A-F
  std::optional<int> DelimitEvery; // '_' between every N bytes, N >= 1
};

// Hex layout used by floatToHex when none is given: binary64 is grouped
// in 2-byte units, binary32 byte by byte.
template <SupportedFloat T>
constexpr HexFormat defaultHexFormat() {
  return HexFormat{false, false, binary_t<T>::total_bytes == 8 ? 2 : 1};
}

namespace detail {

template <typename Word>
void storeWord(Word W, ByteOrder Order, std::span<uint8_t> Out) {
  constexpr std::size_t Width = sizeof(Word);
  if (Out.size() != Width)
    throw InternalError("word store into a " + std::to_string(Out.size()) +
                        "-byte buffer");
  for (std::size_t I = 0; I < Width; ++I) {
    // I counts from the most significant byte
    auto Byte = static_cast<uint8_t>(W >> (8 * (Width - 1 - I)));
    Out[Order == ByteOrder::BigEndian ? I : Width - 1 - I] = Byte;
  }
}

template <typename Word>
Word loadWord(std::span<const uint8_t> In, ByteOrder Order) {
  constexpr std::size_t Width = sizeof(Word);
  if (In.size() != Width)
    throw InternalError("word load from a " + std::to_string(In.size()) +
                        "-byte buffer");
  Word W = 0;
  for (std::size_t I = 0; I < Width; ++I)
    W = (W << 8) | Word(In[Order == ByteOrder::BigEndian ? I : Width - 1 - I]);
  return W;
}

inline int hexDigitValue(char C) {
  if (C >= '0' && C <= '9')
    return C - '0';
  if (C >= 'A' && C <= 'F')
    return C - 'A' + 10;
  if (C >= 'a' && C <= 'f')
    return C - 'a' + 10;
  return -1;
}

template <SupportedFloat T>
Outcome<T> bytesToFloat(std::span<const uint8_t> In, ByteOrder Order) {
  using Word = typename binary_t<T>::storage_type;
  if (In.size() != sizeof(Word))
    return fail<T>(ErrorKind::Size, "size not " + std::to_string(sizeof(Word)) +
                                        ": " + std::to_string(In.size()));
  return succeed(fromBits<T>(loadWord<Word>(In, Order)));
}

inline Outcome<Bytes> hexToBytes(std::string_view Text,
                                 std::optional<int> MaxSize) {
  if (MaxSize && *MaxSize <= 0)
    return fail<Bytes>(ErrorKind::Config,
                       "maxSize invalid: " + std::to_string(*MaxSize));

  std::string_view Body = Text;
  if (Body.size() >= 2 && Body[0] == '0' && (Body[1] == 'x' || Body[1] == 'X'))
    Body.remove_prefix(2);

  std::string Digits;
  Digits.reserve(Body.size());
  for (char C : Body)
    if (C != '_')
      Digits.push_back(C);

  if (Digits.size() % 2 != 0)
    return fail<Bytes>(ErrorKind::Format, "hexadecimal count not even: " +
                                              std::to_string(Digits.size()));
  // size check before decoding
  if (MaxSize && 2 * static_cast<std::size_t>(*MaxSize) < Digits.size())
    return fail<Bytes>(ErrorKind::Range,
                       "exceeds max size " + std::to_string(*MaxSize) + ": " +
                           std::to_string(Digits.size() / 2));

  Bytes Out;
  Out.reserve(Digits.size() / 2);
  for (std::size_t I = 0; I < Digits.size(); I += 2) {
    int Hi = hexDigitValue(Digits[I]);
    int Lo = hexDigitValue(Digits[I + 1]);
    if (Hi < 0 || Lo < 0)
      return fail<Bytes>(ErrorKind::Format,
                         "malformed hex: " + Digits.substr(I, 2));
    Out.push_back(static_cast<uint8_t>((Hi << 4) | Lo));
  }

  if (MaxSize && static_cast<std::size_t>(*MaxSize) < Out.size())
    return fail<Bytes>(ErrorKind::Range,
                       "exceeds max size " + std::to_string(*MaxSize) + ": " +
                           std::to_string(Out.size()));
  return succeed(std::move(Out));
}

inline Outcome<std::string> bytesToHex(std::span<const uint8_t> In,
                                       const HexFormat &Fmt) {
  if (Fmt.DelimitEvery && *Fmt.DelimitEvery < 1)
    return fail<std::string>(ErrorKind::Config,
                             "delimitEvery less than 1: " +
                                 std::to_string(*Fmt.DelimitEvery));

  const char *Digits = Fmt.Lowercase ? "0123456789abcdef" : "0123456789ABCDEF";
  std::string Out;
  Out.reserve(2 + 3 * In.size());
  if (Fmt.WithPrefix)
    Out += "0x";
  for (std::size_t I = 0; I < In.size(); ++I) {
    if (Fmt.DelimitEvery && I > 0 &&
        I % static_cast<std::size_t>(*Fmt.DelimitEvery) == 0)
      Out.push_back('_');
    Out.push_back(Digits[In[I] >> 4]);
    Out.push_back(Digits[In[I] & 0xF]);
  }
  return succeed(std::move(Out));
}

template <SupportedFloat T>
Outcome<T> hexToFloat(std::string_view Text) {
  auto Decoded = detail::hexToBytes(Text, binary_t<T>::total_bytes);
  if (!Decoded.ok())
    return {T{}, std::move(Decoded.Error)};
  return detail::bytesToFloat<T>(Decoded.Value, ByteOrder::BigEndian);
}

template <SupportedFloat T>
Outcome<std::string> floatToHex(T Value, const HexFormat &Fmt) {
  Bytes Raw(binary_t<T>::total_bytes);
  storeWord(toBits(Value), ByteOrder::BigEndian, Raw);
  return detail::bytesToHex(Raw, Fmt);
}

} // namespace detail

// --- Bytes <-> float ---

template <SupportedFloat T>
T fromBytes(std::span<const uint8_t> In,
            ByteOrder Order = ByteOrder::BigEndian) {
  return settle<exceptions::Throw>(detail::bytesToFloat<T>(In, Order));
}

template <SupportedFloat T>
std::optional<T> tryFromBytes(std::span<const uint8_t> In,
                              ByteOrder Order = ByteOrder::BigEndian) {
  return settle<exceptions::ReturnEmpty>(detail::bytesToFloat<T>(In, Order));
}

template <SupportedFloat T>
Bytes toBytes(T Value, ByteOrder Order = ByteOrder::BigEndian) {
  Bytes Out(binary_t<T>::total_bytes);
  detail::storeWord(toBits(Value), Order, Out);
  return Out;
}

// --- Hex <-> bytes ---

inline Bytes hexToBytes(std::string_view Text,
                        std::optional<int> MaxSize = std::nullopt) {
  return settle<exceptions::Throw>(detail::hexToBytes(Text, MaxSize));
}

inline std::optional<Bytes>
tryHexToBytes(std::string_view Text,
              std::optional<int> MaxSize = std::nullopt) {
  return settle<exceptions::ReturnEmpty>(detail::hexToBytes(Text, MaxSize));
}

inline std::string bytesToHex(std::span<const uint8_t> In,
                              const HexFormat &Fmt = {}) {
  return settle<exceptions::Throw>(detail::bytesToHex(In, Fmt));
}

inline std::optional<std::string> tryBytesToHex(std::span<const uint8_t> In,
                                                const HexFormat &Fmt = {}) {
  return settle<exceptions::ReturnEmpty>(detail::bytesToHex(In, Fmt));
}

// --- Hex <-> float ---

template <SupportedFloat T>
T hexToFloat(std::string_view Text) {
  return settle<exceptions::Throw>(detail::hexToFloat<T>(Text));
}

template <SupportedFloat T>
std::optional<T> tryHexToFloat(std::string_view Text) {
  return settle<exceptions::ReturnEmpty>(detail::hexToFloat<T>(Text));
}

template <SupportedFloat T>
std::string floatToHex(T Value, const HexFormat &Fmt = defaultHexFormat<T>()) {
  return settle<exceptions::Throw>(detail::floatToHex(Value, Fmt));
}

template <SupportedFloat T>
std::optional<std::string>
tryFloatToHex(T Value, const HexFormat &Fmt = defaultHexFormat<T>()) {
  return settle<exceptions::ReturnEmpty>(detail::floatToHex(Value, Fmt));
}

} // namespace fpexact

#endif // FPEXACT_CORE_CODEC_HPP
