#pragma once

#include <exception>
#include <expected>
#include <functional>
#include <string_view>
#include <type_traits>
#include <utility>

#include "ferry/common/error.hpp"

namespace ferry {

// Reports `detail` at critical level (raw stderr if the logger is silent)
// and aborts. Core code calls this for corrupted state such as a refcount
// underflow.
[[noreturn]] void AbortContractViolation(
    const char* context, std::string_view detail) noexcept;

[[noreturn]] void AbortContractViolation(
    const char* context, const Error& error) noexcept;

namespace detail {

template <typename T>
struct IsResult : std::false_type {};

template <typename T>
struct IsResult<std::expected<T, Error>> : std::true_type {};

}  // namespace detail

// Runs `fn` on behalf of the extern "C" entry point `context`.
// A Result is unwrapped; an error or any exception aborts the process.
template <typename Fn>
auto GuardBoundary(const char* context, Fn&& fn) noexcept {
  using R = std::invoke_result_t<Fn>;
  try {
    if constexpr (detail::IsResult<R>::value) {
      auto result = std::invoke(std::forward<Fn>(fn));
      if (!result) {
        AbortContractViolation(context, result.error());
      }
      if constexpr (std::is_void_v<typename R::value_type>) {
        return;
      } else {
        return *std::move(result);
      }
    } else {
      return std::invoke(std::forward<Fn>(fn));
    }
  } catch (const std::exception& e) {
    AbortContractViolation(context, e.what());
  } catch (...) {
    AbortContractViolation(context, "unknown exception");
  }
}

}  // namespace ferry
