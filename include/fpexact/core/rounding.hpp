#ifndef FPEXACT_CORE_ROUNDING_HPP
#define FPEXACT_CORE_ROUNDING_HPP

#include <concepts>

namespace fpexact {

// Direction in which a value is cut to its integral part.
template <typename R>
concept RoundingPolicy = requires {
  { R::towards_negative } -> std::convertible_to<bool>;
};

namespace rounding {

// Truncation. The fractional part has the sign of the value.
struct TowardZero {
  static constexpr bool towards_negative = false;
};

// Floor. The fractional part is never negative.
struct TowardNegative {
  static constexpr bool towards_negative = true;
};

using Default = TowardZero;

static_assert(RoundingPolicy<TowardZero>);
static_assert(RoundingPolicy<TowardNegative>);

} // namespace rounding
} // namespace fpexact

#endif // FPEXACT_CORE_ROUNDING_HPP
