#include "ferry/core/precision.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace ferry::core {

namespace {

auto IsDigit(char c) -> bool {
  return c >= '0' && c <= '9';
}

// Value of the leading digit run of `text`, saturated at kMaxPrecision.
auto LeadingNumber(std::string_view text) -> uint8_t {
  unsigned value = 0;
  for (char c : text) {
    if (!IsDigit(c)) {
      break;
    }
    value = value * 10 + static_cast<unsigned>(c - '0');
    if (value >= kMaxPrecision) {
      return kMaxPrecision;
    }
  }
  return static_cast<uint8_t>(value);
}

// Length of the leading digit run of `text`, saturated at kMaxPrecision.
auto LeadingDigitCount(std::string_view text) -> uint8_t {
  size_t count = 0;
  while (count < text.size() && IsDigit(text[count])) {
    ++count;
  }
  return count >= kMaxPrecision ? kMaxPrecision : static_cast<uint8_t>(count);
}

}  // namespace

auto PrecisionFromString(std::string_view text) -> uint8_t {
  for (size_t i = 0; i + 1 < text.size(); ++i) {
    if ((text[i] == 'e' || text[i] == 'E') && text[i + 1] == '-' &&
        i + 2 < text.size() && IsDigit(text[i + 2])) {
      return LeadingNumber(text.substr(i + 2));
    }
  }

  auto dot = text.find('.');
  if (dot == std::string_view::npos) {
    return 0;
  }
  return LeadingDigitCount(text.substr(dot + 1));
}

}  // namespace ferry::core
