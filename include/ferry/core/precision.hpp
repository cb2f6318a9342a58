#pragma once

#include <cstdint>
#include <string_view>

namespace ferry::core {

inline constexpr uint8_t kMaxPrecision = 255;

// Decimal places of a numeral.
//
// "1.2345" -> 4, "42" -> 0, "1." -> 0, "1e-8" -> 8, "2.5E-3" -> 3.
// Counting stops at the first non-digit after the first '.', so "1.23abc"
// is 2. When the text has an "e-"/"E-" exponent followed by a digit, the
// exponent is the answer; a bare "e-" ends the fraction, so "1.5e-" is 1.
// Results saturate at kMaxPrecision.
auto PrecisionFromString(std::string_view text) -> uint8_t;

}  // namespace ferry::core
