#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace ulidtool::core {

// Error enumerations following E.14 (use purpose-designed types as error indicators).

enum class DecodeErrorCode {
  kInvalidLength,     // input is not the fixed length of the target format
  kInvalidCharacter,  // character outside the alphabet / numeral system
  kOutOfRange,        // value negative or wider than the target field
  kInvalidFormat,     // structural mismatch (missing prefix, wrong repr tag)
};

// DecodeError is returned by every codec from_* conversion on malformed input.
// detail is a human-readable message suitable for CLI output.
struct DecodeError {
  DecodeErrorCode code{DecodeErrorCode::kInvalidFormat};  // NOLINT(readability-identifier-naming)
  std::string detail;                                     // NOLINT(readability-identifier-naming)
};

[[nodiscard]] constexpr std::string_view to_string(const DecodeErrorCode code) {
  switch (code) {
    case DecodeErrorCode::kInvalidLength:
      return "invalid_length";
    case DecodeErrorCode::kInvalidCharacter:
      return "invalid_character";
    case DecodeErrorCode::kOutOfRange:
      return "out_of_range";
    case DecodeErrorCode::kInvalidFormat:
      return "invalid_format";
  }
  return "unknown";
}

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// This type encodes success (T) or failure (E) explicitly, preventing ignored errors.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
// The has_value() check makes error handling mandatory and visible at call sites.
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool has_value() const { return data_.index() == 0; }
  [[nodiscard]] const T& value() const { return std::get<0>(data_); }
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

 private:
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

  std::variant<T, E> data_;
};

}  // namespace ulidtool::core
