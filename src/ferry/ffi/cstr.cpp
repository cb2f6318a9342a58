#include <cstdint>

#include "ferry/common/contract.hpp"
#include "ferry/common/error.hpp"
#include "ferry/core/cstr.hpp"
#include "ferry/core/precision.hpp"
#include "ferry/ferry.h"

extern "C" void FerryCstrDrop(const char* ptr) {
  ferry::GuardBoundary(
      "FerryCstrDrop", [ptr] { return ferry::core::ReleaseCstr(ptr); });
}

extern "C" auto FerryPrecisionFromCstr(const char* ptr) -> uint8_t {
  return ferry::GuardBoundary(
      "FerryPrecisionFromCstr", [ptr]() -> ferry::Result<uint8_t> {
        auto text = ferry::core::CstrToView(ptr);
        if (!text) {
          return std::unexpected(text.error());
        }
        return ferry::core::PrecisionFromString(*text);
      });
}
