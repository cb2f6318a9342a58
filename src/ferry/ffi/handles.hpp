#pragma once

#include <fmt/core.h>

#include "ferry/common/error.hpp"
#include "ferry/core/shared_string.hpp"
#include "ferry/ferry.h"

namespace ferry::ffi {

// FerryArcString is the C name of core::SharedString. The C header only ever
// sees it as an incomplete type, so the cast is the whole mapping.
inline auto ToShared(FerryArcString* value) -> core::SharedString* {
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  return reinterpret_cast<core::SharedString*>(value);
}

inline auto ToArc(core::SharedString* value) -> FerryArcString* {
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  return reinterpret_cast<FerryArcString*>(value);
}

// Backing string of a host-supplied identifier. Null pointers are rejected
// before any dereference.
inline auto CheckedShared(const FerryUuid4* uuid, const char* name)
    -> Result<core::SharedString*> {
  if (uuid == nullptr) {
    return std::unexpected(
        Error::InvalidInput(fmt::format("'{}' is a null pointer", name)));
  }
  if (uuid->value == nullptr) {
    return std::unexpected(Error::InvalidInput(
        fmt::format("'{}' holds no value (released or zeroed)", name)));
  }
  return ToShared(uuid->value);
}

}  // namespace ferry::ffi
