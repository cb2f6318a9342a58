#include "units.hpp"

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

#include <fmt/core.h>

#include "ferry/common/error.hpp"
#include "ferry/core/time.hpp"

namespace ferry::driver {

namespace {

auto ParseDouble(std::string_view text) -> Result<double> {
  double value = 0.0;
  const auto* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc() || ptr != end) {
    return std::unexpected(
        Error::InvalidInput(fmt::format("'{}' is not a number", text)));
  }
  return value;
}

auto ParseUnsigned(std::string_view text) -> Result<uint64_t> {
  uint64_t value = 0;
  const auto* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec == std::errc::result_out_of_range) {
    return std::unexpected(
        Error::OutOfRange(fmt::format("'{}' does not fit in 64 bits", text)));
  }
  if (ec != std::errc() || ptr != end) {
    return std::unexpected(Error::InvalidInput(
        fmt::format("'{}' is not a non-negative integer", text)));
  }
  return value;
}

auto ToNanos(std::string_view value, TimeUnit from) -> Result<uint64_t> {
  switch (from) {
    case TimeUnit::kMinutes: {
      auto mins = ParseDouble(value);
      if (!mins) {
        return std::unexpected(mins.error());
      }
      return core::MinsToNanos(*mins);
    }
    case TimeUnit::kSeconds: {
      auto secs = ParseDouble(value);
      if (!secs) {
        return std::unexpected(secs.error());
      }
      return core::SecsToNanos(*secs);
    }
    case TimeUnit::kMillis: {
      auto millis = ParseUnsigned(value);
      if (!millis) {
        return std::unexpected(millis.error());
      }
      return core::MillisToNanos(*millis);
    }
    case TimeUnit::kMicros: {
      auto micros = ParseUnsigned(value);
      if (!micros) {
        return std::unexpected(micros.error());
      }
      return core::MicrosToNanos(*micros);
    }
    case TimeUnit::kNanos:
      return ParseUnsigned(value);
  }
  return std::unexpected(Error::InvalidInput("unknown source unit"));
}

}  // namespace

auto ParseTimeUnit(std::string_view name) -> Result<TimeUnit> {
  if (name == "min") {
    return TimeUnit::kMinutes;
  }
  if (name == "s") {
    return TimeUnit::kSeconds;
  }
  if (name == "ms") {
    return TimeUnit::kMillis;
  }
  if (name == "us") {
    return TimeUnit::kMicros;
  }
  if (name == "ns") {
    return TimeUnit::kNanos;
  }
  return std::unexpected(Error::InvalidInput(fmt::format(
      "unknown time unit '{}', use 'min', 's', 'ms', 'us' or 'ns'", name)));
}

auto ToString(TimeUnit unit) -> std::string_view {
  switch (unit) {
    case TimeUnit::kMinutes:
      return "min";
    case TimeUnit::kSeconds:
      return "s";
    case TimeUnit::kMillis:
      return "ms";
    case TimeUnit::kMicros:
      return "us";
    case TimeUnit::kNanos:
      return "ns";
  }
  return "?";
}

auto ConvertTime(std::string_view value, TimeUnit from, TimeUnit to)
    -> Result<std::string> {
  // Seconds to milliseconds has its own rounding; going through nanoseconds
  // would round twice.
  if (from == TimeUnit::kSeconds && to == TimeUnit::kMillis) {
    auto secs = ParseDouble(value);
    if (!secs) {
      return std::unexpected(secs.error());
    }
    auto millis = core::SecsToMillis(*secs);
    if (!millis) {
      return std::unexpected(millis.error());
    }
    return fmt::format("{}", *millis);
  }

  auto nanos = ToNanos(value, from);
  if (!nanos) {
    return std::unexpected(nanos.error());
  }
  switch (to) {
    case TimeUnit::kSeconds:
      return fmt::format("{}", core::NanosToSecs(*nanos));
    case TimeUnit::kMillis:
      return fmt::format("{}", core::NanosToMillis(*nanos));
    case TimeUnit::kMicros:
      return fmt::format("{}", core::NanosToMicros(*nanos));
    case TimeUnit::kNanos:
      return fmt::format("{}", *nanos);
    case TimeUnit::kMinutes:
      break;
  }
  return std::unexpected(
      Error::InvalidInput("minutes are only supported as a source unit"));
}

}  // namespace ferry::driver
