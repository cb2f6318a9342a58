#include "ferry/core/time.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

#include <fmt/core.h>

#include "ferry/common/error.hpp"

namespace ferry::core {

namespace {

// 2^64 as a double. Every double >= this is beyond uint64_t.
constexpr double kUint64Limit = 18446744073709551616.0;

constexpr uint64_t kSecondsInDay = 86'400;

auto ScaleToUnsigned(double value, uint64_t factor, const char* unit)
    -> Result<uint64_t> {
  if (!std::isfinite(value)) {
    return std::unexpected(Error::OutOfRange(
        fmt::format("{} value {} is not finite", unit, value)));
  }
  if (value < 0.0) {
    return std::unexpected(Error::OutOfRange(
        fmt::format("{} value {} is negative", unit, value)));
  }
  double scaled = std::round(value * static_cast<double>(factor));
  if (scaled >= kUint64Limit) {
    return std::unexpected(Error::OutOfRange(
        fmt::format("{} value {} overflows uint64_t", unit, value)));
  }
  return static_cast<uint64_t>(scaled);
}

auto CheckedScale(uint64_t value, uint64_t factor, const char* unit)
    -> Result<uint64_t> {
  if (value > std::numeric_limits<uint64_t>::max() / factor) {
    return std::unexpected(Error::OutOfRange(
        fmt::format("{} value {} overflows uint64_t", unit, value)));
  }
  return value * factor;
}

auto NowSinceEpoch() -> std::chrono::nanoseconds {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::system_clock::now().time_since_epoch());
}

}  // namespace

auto SecsToNanos(double secs) -> Result<uint64_t> {
  return ScaleToUnsigned(secs, kNanosInSecond, "seconds");
}

auto SecsToMillis(double secs) -> Result<uint64_t> {
  return ScaleToUnsigned(secs, kMillisInSecond, "seconds");
}

auto MinsToNanos(double mins) -> Result<uint64_t> {
  return ScaleToUnsigned(mins, kNanosInMinute, "minutes");
}

auto MillisToNanos(uint64_t millis) -> Result<uint64_t> {
  return CheckedScale(millis, kNanosInMilli, "milliseconds");
}

auto MicrosToNanos(uint64_t micros) -> Result<uint64_t> {
  return CheckedScale(micros, kNanosInMicro, "microseconds");
}

auto UnixTimestamp() -> double {
  return std::chrono::duration<double>(NowSinceEpoch()).count();
}

auto UnixTimestampMs() -> uint64_t {
  return NanosToMillis(UnixTimestampNs());
}

auto UnixTimestampUs() -> uint64_t {
  return NanosToMicros(UnixTimestampNs());
}

auto UnixTimestampNs() -> uint64_t {
  return static_cast<uint64_t>(NowSinceEpoch().count());
}

auto UnixNanosToIso8601(uint64_t nanos) -> std::string {
  // Split before converting: the full range of uint64_t nanoseconds does not
  // fit in std::chrono::nanoseconds (signed 64-bit).
  uint64_t total_secs = nanos / kNanosInSecond;
  uint64_t frac = nanos % kNanosInSecond;
  uint64_t day_count = total_secs / kSecondsInDay;
  uint64_t secs_of_day = total_secs % kSecondsInDay;

  std::chrono::sys_days day{
      std::chrono::days{static_cast<int64_t>(day_count)}};
  std::chrono::year_month_day ymd{day};

  return fmt::format(
      "{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:09}Z",
      static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
      static_cast<unsigned>(ymd.day()), secs_of_day / 3600,
      (secs_of_day % 3600) / 60, secs_of_day % 60, frac);
}

}  // namespace ferry::core
