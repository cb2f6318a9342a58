#include "ferry/common/log.hpp"

#include <array>
#include <memory>
#include <string_view>
#include <utility>

#include <fmt/core.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace ferry {

namespace {

auto CreateLogger() -> std::shared_ptr<spdlog::logger> {
  auto logger = spdlog::get(kLoggerName);
  if (logger != nullptr) {
    return logger;
  }
  logger = spdlog::stderr_color_mt(kLoggerName);
  logger->set_level(spdlog::level::warn);
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
  spdlog::cfg::load_env_levels();
  return logger;
}

}  // namespace

auto Logger() -> const std::shared_ptr<spdlog::logger>& {
  static const std::shared_ptr<spdlog::logger> logger = CreateLogger();
  return logger;
}

void SetLogLevel(spdlog::level::level_enum level) {
  Logger()->set_level(level);
}

auto ParseLogLevel(std::string_view name) -> Result<spdlog::level::level_enum> {
  static constexpr std::array<
      std::pair<std::string_view, spdlog::level::level_enum>, 7>
      kLevels = {{
          {"trace", spdlog::level::trace},
          {"debug", spdlog::level::debug},
          {"info", spdlog::level::info},
          {"warn", spdlog::level::warn},
          {"error", spdlog::level::err},
          {"critical", spdlog::level::critical},
          {"off", spdlog::level::off},
      }};
  for (const auto& [level_name, level] : kLevels) {
    if (level_name == name) {
      return level;
    }
  }
  return std::unexpected(
      Error::InvalidInput(fmt::format("unknown log level '{}'", name)));
}

}  // namespace ferry
