#include "commands.hpp"

#include <cstdint>
#include <string>

#include <argparse/argparse.hpp>
#include <fmt/core.h>

#include "config.hpp"
#include "ferry/common/log.hpp"
#include "ferry/core/shared_string.hpp"
#include "ferry/core/uuid.hpp"
#include "ferry/ferry.h"
#include "print.hpp"
#include "units.hpp"

// Commands call the C ABI the way a host would, except where the input comes
// straight from the user: those go through the core API so a typo is an error
// message instead of an abort.

namespace ferry::driver {

namespace {

// Prints and releases a string owned by the boundary.
void PrintOwnedCstr(const char* text) {
  fmt::print("{}\n", text);
  FerryCstrDrop(text);
}

}  // namespace

auto UuidCommand(const argparse::ArgumentParser& cmd) -> int {
  int count = cmd.get<int>("-n");
  if (count < 0) {
    PrintError(fmt::format("count must be non-negative, got {}", count));
    return 1;
  }

  for (int i = 0; i < count; ++i) {
    FerryUuid4 uuid = FerryUuid4New();
    PrintOwnedCstr(FerryUuid4ToCstr(&uuid));
    FerryUuid4Drop(uuid);
  }

  Logger()->debug(
      "live shared strings after {} identifiers: {}", count,
      core::SharedString::LiveCount());
  return 0;
}

auto UuidParseCommand(const argparse::ArgumentParser& cmd) -> int {
  auto text = cmd.get<std::string>("text");
  auto uuid = core::Uuid4::Parse(text);
  if (!uuid) {
    PrintError(uuid.error().message);
    return 1;
  }
  fmt::print("{}\n", uuid->Value());
  fmt::print("hash {:#018x}\n", uuid->Hash());
  return 0;
}

auto ConvertCommand(const argparse::ArgumentParser& cmd) -> int {
  auto from = ParseTimeUnit(cmd.get<std::string>("--from"));
  if (!from) {
    PrintError(from.error().message);
    return 1;
  }
  auto to = ParseTimeUnit(cmd.get<std::string>("--to"));
  if (!to) {
    PrintError(to.error().message);
    return 1;
  }

  auto value = cmd.get<std::string>("value");
  auto converted = ConvertTime(value, *from, *to);
  if (!converted) {
    PrintError(converted.error().message);
    return 1;
  }
  Logger()->debug(
      "convert {} {} -> {} {}", value, ToString(*from), *converted,
      ToString(*to));
  fmt::print("{}\n", *converted);
  return 0;
}

auto NowCommand(const argparse::ArgumentParser& cmd, const CliConfig& config)
    -> int {
  if (cmd.get<bool>("--iso")) {
    PrintOwnedCstr(FerryUnixNanosToIso8601(FerryUnixTimestampNs()));
    return 0;
  }

  TimeUnit unit = config.time_unit;
  if (auto name = cmd.present<std::string>("--unit")) {
    auto parsed = ParseTimeUnit(*name);
    if (!parsed || *parsed == TimeUnit::kMinutes) {
      PrintError(fmt::format("unsupported unit '{}' for now", *name));
      return 1;
    }
    unit = *parsed;
  }

  switch (unit) {
    case TimeUnit::kSeconds:
      fmt::print("{:.6f}\n", FerryUnixTimestamp());
      break;
    case TimeUnit::kMillis:
      fmt::print("{}\n", FerryUnixTimestampMs());
      break;
    case TimeUnit::kMicros:
      fmt::print("{}\n", FerryUnixTimestampUs());
      break;
    case TimeUnit::kNanos:
    case TimeUnit::kMinutes:
      fmt::print("{}\n", FerryUnixTimestampNs());
      break;
  }
  return 0;
}

auto PrecisionCommand(const argparse::ArgumentParser& cmd) -> int {
  auto numeral = cmd.get<std::string>("numeral");
  uint8_t precision = FerryPrecisionFromCstr(numeral.c_str());
  fmt::print("{}\n", precision);
  return 0;
}

}  // namespace ferry::driver
