#include <argparse/argparse.hpp>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>

#include <fmt/core.h>
#include <spdlog/common.h>

#include "commands.hpp"
#include "config.hpp"
#include "ferry/common/log.hpp"
#include "print.hpp"

namespace {

namespace fs = std::filesystem;

auto LoadCliConfig(const argparse::ArgumentParser& program)
    -> std::optional<ferry::driver::CliConfig> {
  std::optional<fs::path> config_path;
  if (auto explicit_path = program.present("--config")) {
    config_path = fs::path(*explicit_path);
    if (!fs::exists(*config_path)) {
      ferry::driver::PrintError(
          fmt::format("config file '{}' not found", config_path->string()));
      return std::nullopt;
    }
  } else {
    config_path = ferry::driver::FindConfig();
  }

  if (!config_path) {
    return ferry::driver::CliConfig{};
  }
  auto config = ferry::driver::LoadConfig(*config_path);
  if (!config) {
    ferry::driver::PrintError(config.error().message);
    return std::nullopt;
  }
  return *config;
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  argparse::ArgumentParser program("ferry", "0.1.0");
  program.add_description("Exercise the ferry native boundary from a shell");
  program.add_argument("--config")
      .help("Path to ferry.toml (default: search upwards)")
      .metavar("path");
  program.add_argument("-v", "--verbose")
      .default_value(false)
      .implicit_value(true)
      .help("Enable debug logging");

  // Subcommand: uuid
  argparse::ArgumentParser uuid_cmd("uuid");
  uuid_cmd.add_description("Generate random version-4 identifiers");
  uuid_cmd.add_argument("-n", "--count")
      .default_value(1)
      .scan<'i', int>()
      .help("Number of identifiers");

  // Subcommand: uuid-parse
  argparse::ArgumentParser uuid_parse_cmd("uuid-parse");
  uuid_parse_cmd.add_description(
      "Print the canonical form and hash of an identifier");
  uuid_parse_cmd.add_argument("text").help("Identifier text");

  // Subcommand: convert
  argparse::ArgumentParser convert_cmd("convert");
  convert_cmd.add_description("Convert a time quantity between units");
  convert_cmd.add_argument("value").help("Quantity to convert");
  convert_cmd.add_argument("--from").required().help(
      "Source unit: min, s, ms, us or ns");
  convert_cmd.add_argument("--to").required().help(
      "Target unit: s, ms, us or ns");

  // Subcommand: now
  argparse::ArgumentParser now_cmd("now");
  now_cmd.add_description("Print the wall-clock time since the UNIX epoch");
  now_cmd.add_argument("--unit").help(
      "s, ms, us or ns (default: output.time_unit from ferry.toml, else ns)");
  now_cmd.add_argument("--iso")
      .default_value(false)
      .implicit_value(true)
      .help("Print an ISO-8601 UTC timestamp instead");

  // Subcommand: precision
  argparse::ArgumentParser precision_cmd("precision");
  precision_cmd.add_description("Print the decimal precision of a numeral");
  precision_cmd.add_argument("numeral").help("Decimal numeral, e.g. 1.2345");

  program.add_subparser(uuid_cmd);
  program.add_subparser(uuid_parse_cmd);
  program.add_subparser(convert_cmd);
  program.add_subparser(now_cmd);
  program.add_subparser(precision_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    ferry::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  auto config = LoadCliConfig(program);
  if (!config) {
    return 1;
  }
  if (config->log_level) {
    ferry::SetLogLevel(*config->log_level);
  }
  if (program.get<bool>("--verbose")) {
    ferry::SetLogLevel(spdlog::level::debug);
  }
  if (!config->root_dir.empty()) {
    ferry::Logger()->debug("using config from {}", config->root_dir.string());
  }

  if (program.is_subcommand_used("uuid")) {
    return ferry::driver::UuidCommand(uuid_cmd);
  }

  if (program.is_subcommand_used("uuid-parse")) {
    return ferry::driver::UuidParseCommand(uuid_parse_cmd);
  }

  if (program.is_subcommand_used("convert")) {
    return ferry::driver::ConvertCommand(convert_cmd);
  }

  if (program.is_subcommand_used("now")) {
    return ferry::driver::NowCommand(now_cmd, *config);
  }

  if (program.is_subcommand_used("precision")) {
    return ferry::driver::PrecisionCommand(precision_cmd);
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
