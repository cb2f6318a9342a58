#include "config.hpp"

#include <filesystem>
#include <optional>
#include <string>

#include <fmt/core.h>
#include <toml++/toml.hpp>

#include "ferry/common/error.hpp"
#include "ferry/common/log.hpp"
#include "units.hpp"

namespace ferry::driver {

namespace fs = std::filesystem;

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> Result<CliConfig> {
  CliConfig config;
  config.root_dir = config_path.parent_path();

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(Error::InvalidInput(fmt::format(
        "failed to parse {}: {}", config_path.string(), e.what())));
  }

  // [log] section
  if (auto level = tbl["log"]["level"].value<std::string>()) {
    auto parsed = ParseLogLevel(*level);
    if (!parsed) {
      return std::unexpected(Error::InvalidInput(fmt::format(
          "{}: log.level: {}", config_path.string(), parsed.error().message)));
    }
    config.log_level = *parsed;
  }

  // [output] section
  if (auto unit = tbl["output"]["time_unit"].value<std::string>()) {
    auto parsed = ParseTimeUnit(*unit);
    if (!parsed || *parsed == TimeUnit::kMinutes) {
      return std::unexpected(Error::InvalidInput(fmt::format(
          "{}: output.time_unit must be one of 's', 'ms', 'us', 'ns'",
          config_path.string())));
    }
    config.time_unit = *parsed;
  }

  return config;
}

}  // namespace ferry::driver
