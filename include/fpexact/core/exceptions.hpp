#ifndef FPEXACT_CORE_EXCEPTIONS_HPP
#define FPEXACT_CORE_EXCEPTIONS_HPP

#include <concepts>
#include <optional>
#include <utility>

#include "fpexact/core/errors.hpp"

namespace fpexact {

// An exception policy decides what a caller sees when an Outcome carries a
// Failure, and what the entry point's return type is.
template <typename E>
concept ExceptionPolicy = requires {
  { E::throws } -> std::convertible_to<bool>;
  typename E::template result_type<int>;
};

namespace exceptions {

// Raise Error / ArithmeticError; return the bare value.
struct Throw {
  static constexpr bool throws = true;
  template <typename T> using result_type = T;
};

// Return std::nullopt on failure. No side effects.
struct ReturnEmpty {
  static constexpr bool throws = false;
  template <typename T> using result_type = std::optional<T>;
};

using Default = Throw;

static_assert(ExceptionPolicy<Throw>);
static_assert(ExceptionPolicy<ReturnEmpty>);

} // namespace exceptions

// The one place an Outcome turns into a return value or an exception.
template <ExceptionPolicy Exc, typename T>
typename Exc::template result_type<T> settle(Outcome<T> &&O) {
  if constexpr (Exc::throws) {
    if (O.Error)
      raise(*O.Error);
    return std::move(O.Value);
  } else {
    if (O.Error)
      return std::nullopt;
    return std::move(O.Value);
  }
}

} // namespace fpexact

#endif // FPEXACT_CORE_EXCEPTIONS_HPP
