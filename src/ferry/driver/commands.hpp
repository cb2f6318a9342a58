#pragma once

#include <argparse/argparse.hpp>

#include "config.hpp"

namespace ferry::driver {

auto UuidCommand(const argparse::ArgumentParser& cmd) -> int;
auto UuidParseCommand(const argparse::ArgumentParser& cmd) -> int;
auto ConvertCommand(const argparse::ArgumentParser& cmd) -> int;
auto NowCommand(const argparse::ArgumentParser& cmd, const CliConfig& config)
    -> int;
auto PrecisionCommand(const argparse::ArgumentParser& cmd) -> int;

}  // namespace ferry::driver
