#include "ferry/common/contract.hpp"

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include <string_view>

#include <fmt/core.h>

#include "ferry/common/error.hpp"
#include "ferry/common/log.hpp"

namespace ferry {

namespace {

void WriteRaw(const char* context, std::string_view detail) noexcept {
  std::fprintf(
      stderr, "ferry: contract violation in %s: %.*s\n", context,
      static_cast<int>(detail.size()), detail.data());
  std::fflush(stderr);
}

}  // namespace

void AbortContractViolation(
    const char* context, std::string_view detail) noexcept {
  bool logged = false;
  try {
    const auto& logger = Logger();
    if (logger->should_log(spdlog::level::critical)) {
      logger->critical("contract violation in {}: {}", context, detail);
      logger->flush();
      logged = true;
    }
  } catch (const std::exception&) {
    logged = false;
  }
  // The message must reach stderr even when logging is off or broken.
  if (!logged) {
    WriteRaw(context, detail);
  }
  std::abort();
}

void AbortContractViolation(const char* context, const Error& error) noexcept {
  std::string message;
  try {
    message = fmt::format("{}: {}", ToString(error.kind), error.message);
  } catch (const std::exception&) {
    AbortContractViolation(context, std::string_view(error.message));
  }
  AbortContractViolation(context, std::string_view(message));
}

}  // namespace ferry
