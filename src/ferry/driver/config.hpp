#pragma once

#include <filesystem>
#include <optional>

#include <spdlog/common.h>

#include "ferry/common/error.hpp"
#include "units.hpp"

namespace ferry::driver {

inline constexpr const char* kConfigFileName = "ferry.toml";

struct CliConfig {
  std::optional<spdlog::level::level_enum> log_level;
  TimeUnit time_unit = TimeUnit::kNanos;

  // Directory where ferry.toml was found
  std::filesystem::path root_dir;
};

// Search for ferry.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse ferry.toml.
// Returns an error on parse failures or unknown enum values.
auto LoadConfig(const std::filesystem::path& config_path) -> Result<CliConfig>;

}  // namespace ferry::driver
