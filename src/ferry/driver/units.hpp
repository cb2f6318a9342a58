#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "ferry/common/error.hpp"

namespace ferry::driver {

enum class TimeUnit : uint8_t { kMinutes, kSeconds, kMillis, kMicros, kNanos };

// Accepts "min", "s", "ms", "us", "ns".
auto ParseTimeUnit(std::string_view name) -> Result<TimeUnit>;

auto ToString(TimeUnit unit) -> std::string_view;

// Converts the decimal text `value` from one unit to another and returns the
// result formatted for display. Seconds and minutes accept fractions; the
// integer units do not. Minutes are only valid as a source unit.
auto ConvertTime(std::string_view value, TimeUnit from, TimeUnit to)
    -> Result<std::string>;

}  // namespace ferry::driver
