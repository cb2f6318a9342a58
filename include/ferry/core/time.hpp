#pragma once

#include <cstdint>
#include <string>

#include "ferry/common/error.hpp"

namespace ferry::core {

inline constexpr uint64_t kMillisInSecond = 1'000;
inline constexpr uint64_t kMicrosInSecond = 1'000'000;
inline constexpr uint64_t kNanosInSecond = 1'000'000'000;
inline constexpr uint64_t kNanosInMilli = 1'000'000;
inline constexpr uint64_t kNanosInMicro = 1'000;
inline constexpr uint64_t kSecondsInMinute = 60;
inline constexpr uint64_t kNanosInMinute = kSecondsInMinute * kNanosInSecond;

// Fractional conversions round half away from zero. Negative, NaN and
// infinite inputs, and results beyond uint64_t, are kOutOfRange.
auto SecsToNanos(double secs) -> Result<uint64_t>;
auto SecsToMillis(double secs) -> Result<uint64_t>;
auto MinsToNanos(double mins) -> Result<uint64_t>;

// Checked multiplication; overflow is kOutOfRange.
auto MillisToNanos(uint64_t millis) -> Result<uint64_t>;
auto MicrosToNanos(uint64_t micros) -> Result<uint64_t>;

// Total. Integer results truncate.
constexpr auto NanosToSecs(uint64_t nanos) -> double {
  return static_cast<double>(nanos) / static_cast<double>(kNanosInSecond);
}

constexpr auto NanosToMillis(uint64_t nanos) -> uint64_t {
  return nanos / kNanosInMilli;
}

constexpr auto NanosToMicros(uint64_t nanos) -> uint64_t {
  return nanos / kNanosInMicro;
}

// Wall clock since the UNIX epoch. Non-decreasing only while the system clock
// is not stepped backwards.
auto UnixTimestamp() -> double;
auto UnixTimestampMs() -> uint64_t;
auto UnixTimestampUs() -> uint64_t;
auto UnixTimestampNs() -> uint64_t;

// "YYYY-MM-DDTHH:MM:SS.nnnnnnnnnZ" (UTC, nanosecond fraction always shown).
auto UnixNanosToIso8601(uint64_t nanos) -> std::string;

}  // namespace ferry::core
