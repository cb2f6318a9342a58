#pragma once

#include <memory>
#include <string_view>

#include <spdlog/logger.h>

#include "ferry/common/error.hpp"

namespace ferry {

inline constexpr const char* kLoggerName = "ferry";

// Shared stderr logger. Created on first use at level `warn`; the
// SPDLOG_LEVEL environment variable overrides that default.
auto Logger() -> const std::shared_ptr<spdlog::logger>&;

void SetLogLevel(spdlog::level::level_enum level);

// Accepts spdlog level names: trace, debug, info, warn, error, critical, off.
auto ParseLogLevel(std::string_view name) -> Result<spdlog::level::level_enum>;

}  // namespace ferry
