#ifndef FPEXACT_CORE_ERRORS_HPP
#define FPEXACT_CORE_ERRORS_HPP

// Error taxonomy and the shared total result type.
//
// Every fallible operation is written once as a function returning
// Outcome<T>: either a value, or a Failure describing what was wrong with
// the input. The strict and the optional entry points are thin wrappers
// around that one function (see exceptions.hpp), so they cannot disagree
// on which inputs succeed.

#include <concepts>
#include <cstdio>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "fpexact/core/enums.hpp"

namespace fpexact {

struct Failure {
  ErrorKind Kind;
  std::string Message;
  // Text of the offending numeric value; empty for non-numeric failures.
  std::string Subject;
};

template <typename T> struct Outcome {
  T Value{};
  std::optional<Failure> Error;

  bool ok() const { return !Error.has_value(); }
};

template <typename T>
Outcome<T> succeed(T Value) {
  return {std::move(Value), std::nullopt};
}

template <typename T>
Outcome<T> fail(ErrorKind Kind, std::string Message,
                std::string Subject = {}) {
  return {T{}, Failure{Kind, std::move(Message), std::move(Subject)}};
}

// Bad input.
class Error : public std::runtime_error {
public:
  Error(ErrorKind Kind, const std::string &Message)
      : std::runtime_error(Message), Kind(Kind) {}

  ErrorKind kind() const noexcept { return Kind; }

private:
  ErrorKind Kind;
};

// A numeric value that cannot be converted exactly. what() reads
// "<reason>: <value>".
class ArithmeticError : public Error {
public:
  ArithmeticError(ErrorKind Kind, const std::string &Reason,
                  std::string Subject)
      : Error(Kind, Reason + ": " + Subject), Subject(std::move(Subject)) {}

  const std::string &subject() const noexcept { return Subject; }

private:
  std::string Subject;
};

// A defect in the library itself, never caused by input. Not part of the
// Outcome channel: optional-returning entry points let it propagate.
class InternalError : public std::logic_error {
public:
  explicit InternalError(const std::string &Message)
      : std::logic_error("fpexact internal error: " + Message) {}
};

[[noreturn]] inline void raise(const Failure &F) {
  if (!F.Subject.empty())
    throw ArithmeticError(F.Kind, F.Message, F.Subject);
  throw Error(F.Kind, F.Message);
}

// Text form of a value for error messages. Floats print with enough
// digits to identify the exact value.
template <typename T>
std::string describe(T Value) {
  char Buf[48];
  if constexpr (std::same_as<T, float>) {
    std::snprintf(Buf, sizeof(Buf), "%.9g", static_cast<double>(Value));
  } else if constexpr (std::same_as<T, double>) {
    std::snprintf(Buf, sizeof(Buf), "%.17g", Value);
  } else if constexpr (std::signed_integral<T>) {
    std::snprintf(Buf, sizeof(Buf), "%lld", static_cast<long long>(Value));
  } else {
    std::snprintf(Buf, sizeof(Buf), "%llu",
                  static_cast<unsigned long long>(Value));
  }
  return Buf;
}

} // namespace fpexact

#endif // FPEXACT_CORE_ERRORS_HPP
