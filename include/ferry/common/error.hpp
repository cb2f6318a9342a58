#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace ferry {

enum class ErrorKind { kInvalidInput, kParseFailure, kOutOfRange };

inline auto ToString(ErrorKind kind) -> std::string_view {
  switch (kind) {
    case ErrorKind::kInvalidInput:
      return "invalid input";
    case ErrorKind::kParseFailure:
      return "parse failure";
    case ErrorKind::kOutOfRange:
      return "out of range";
  }
  return "unknown";
}

struct Error {
  ErrorKind kind;
  std::string message;

  static auto InvalidInput(std::string msg) -> Error {
    return Error{.kind = ErrorKind::kInvalidInput, .message = std::move(msg)};
  }

  static auto ParseFailure(std::string msg) -> Error {
    return Error{.kind = ErrorKind::kParseFailure, .message = std::move(msg)};
  }

  static auto OutOfRange(std::string msg) -> Error {
    return Error{.kind = ErrorKind::kOutOfRange, .message = std::move(msg)};
  }
};

template <typename T>
using Result = std::expected<T, Error>;

}  // namespace ferry
