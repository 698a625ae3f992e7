#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace ulidcore::core {

// FormatError classifies why a string was rejected as an identifier or time
// field. Recoverable at the boundary: callers map it to "bad identifier" or
// "not found", never to a system fault.
enum class FormatError {
  kInvalidLength,  // NOLINT(readability-identifier-naming)
  kInvalidSymbol,  // NOLINT(readability-identifier-naming)
};

// format_error_message returns a stable, human-readable description.
[[nodiscard]] constexpr std::string_view format_error_message(const FormatError error) {
  switch (error) {
    case FormatError::kInvalidLength:
      return "wrong length";
    case FormatError::kInvalidSymbol:
      return "symbol outside the Crockford Base32 alphabet";
  }
  return "unknown format error";
}

// RangeError is thrown when a timestamp cannot be represented in the 48-bit
// time field. It signals clock corruption or a programming error: propagate,
// never retry.
class RangeError : public std::out_of_range {
 public:
  explicit RangeError(const std::string& what) : std::out_of_range(what) {}
};

// Result<T, E> encodes success (T) or a recoverable failure (E) explicitly.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
// The has_value() check makes error handling mandatory and visible at call sites.
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::move(value)); }
  static Result err(E error) { return Result(std::move(error)); }

  [[nodiscard]] bool has_value() const { return std::holds_alternative<T>(data_); }
  [[nodiscard]] const T& value() const { return std::get<T>(data_); }
  [[nodiscard]] const E& error() const { return std::get<E>(data_); }

 private:
  explicit Result(T value) : data_(std::move(value)) {}
  explicit Result(E error) : data_(std::move(error)) {}

  std::variant<T, E> data_;
};

}  // namespace ulidcore::core
