#include "ferry/core/time.hpp"

#include <cstdint>

#include "ferry/common/contract.hpp"
#include "ferry/core/cstr.hpp"
#include "ferry/ferry.h"

extern "C" auto FerrySecsToNanos(double secs) -> uint64_t {
  return ferry::GuardBoundary(
      "FerrySecsToNanos", [secs] { return ferry::core::SecsToNanos(secs); });
}

extern "C" auto FerrySecsToMillis(double secs) -> uint64_t {
  return ferry::GuardBoundary(
      "FerrySecsToMillis", [secs] { return ferry::core::SecsToMillis(secs); });
}

extern "C" auto FerryMinsToNanos(double mins) -> uint64_t {
  return ferry::GuardBoundary(
      "FerryMinsToNanos", [mins] { return ferry::core::MinsToNanos(mins); });
}

extern "C" auto FerryMillisToNanos(uint64_t millis) -> uint64_t {
  return ferry::GuardBoundary("FerryMillisToNanos", [millis] {
    return ferry::core::MillisToNanos(millis);
  });
}

extern "C" auto FerryMicrosToNanos(uint64_t micros) -> uint64_t {
  return ferry::GuardBoundary("FerryMicrosToNanos", [micros] {
    return ferry::core::MicrosToNanos(micros);
  });
}

extern "C" auto FerryNanosToSecs(uint64_t nanos) -> double {
  return ferry::core::NanosToSecs(nanos);
}

extern "C" auto FerryNanosToMillis(uint64_t nanos) -> uint64_t {
  return ferry::core::NanosToMillis(nanos);
}

extern "C" auto FerryNanosToMicros(uint64_t nanos) -> uint64_t {
  return ferry::core::NanosToMicros(nanos);
}

extern "C" auto FerryUnixTimestamp() -> double {
  return ferry::core::UnixTimestamp();
}

extern "C" auto FerryUnixTimestampMs() -> uint64_t {
  return ferry::core::UnixTimestampMs();
}

extern "C" auto FerryUnixTimestampUs() -> uint64_t {
  return ferry::core::UnixTimestampUs();
}

extern "C" auto FerryUnixTimestampNs() -> uint64_t {
  return ferry::core::UnixTimestampNs();
}

extern "C" auto FerryUnixNanosToIso8601(uint64_t nanos) -> const char* {
  return ferry::GuardBoundary("FerryUnixNanosToIso8601", [nanos] {
    return ferry::core::IntoCstr(ferry::core::UnixNanosToIso8601(nanos));
  });
}
