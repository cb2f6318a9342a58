#include "ferry/core/uuid.hpp"

#include <cstdint>
#include <utility>

#include <spdlog/spdlog.h>

#include "ferry/common/contract.hpp"
#include "ferry/common/error.hpp"
#include "ferry/common/log.hpp"
#include "ferry/core/cstr.hpp"
#include "ferry/ferry.h"
#include "handles.hpp"

using ferry::Result;
using ferry::core::Uuid4;
using ferry::ffi::CheckedShared;
using ferry::ffi::ToArc;

static_assert(sizeof(FerryUuid4) == sizeof(void*), "FerryUuid4 ABI size");

namespace {

auto IntoHandle(Uuid4 uuid) -> FerryUuid4 {
  return FerryUuid4{.value = ToArc(std::move(uuid).IntoRaw())};
}

}  // namespace

extern "C" auto FerryUuid4New() -> FerryUuid4 {
  return ferry::GuardBoundary(
      "FerryUuid4New", [] { return IntoHandle(Uuid4::New()); });
}

extern "C" auto FerryUuid4Clone(const FerryUuid4* uuid4) -> FerryUuid4 {
  return ferry::GuardBoundary(
      "FerryUuid4Clone", [uuid4]() -> Result<FerryUuid4> {
        auto shared = CheckedShared(uuid4, "uuid4");
        if (!shared) {
          return std::unexpected(shared.error());
        }
        (*shared)->Retain();
        return FerryUuid4{.value = ToArc(*shared)};
      });
}

extern "C" void FerryUuid4Drop(FerryUuid4 uuid4) {
  ferry::GuardBoundary("FerryUuid4Drop", [&uuid4]() -> Result<void> {
    auto shared = CheckedShared(&uuid4, "uuid4");
    if (!shared) {
      return std::unexpected(shared.error());
    }
    if ((*shared)->Release()) {
      SPDLOG_LOGGER_TRACE(ferry::Logger(), "FerryUuid4Drop freed last ref");
    }
    return {};
  });
}

extern "C" auto FerryUuid4FromCstr(const char* ptr) -> FerryUuid4 {
  return ferry::GuardBoundary(
      "FerryUuid4FromCstr", [ptr]() -> Result<FerryUuid4> {
        auto text = ferry::core::CstrToView(ptr);
        if (!text) {
          return std::unexpected(text.error());
        }
        auto uuid = Uuid4::Parse(*text);
        if (!uuid) {
          return std::unexpected(uuid.error());
        }
        return IntoHandle(*std::move(uuid));
      });
}

// Does not consume or modify `uuid`.
extern "C" auto FerryUuid4ToCstr(const FerryUuid4* uuid) -> const char* {
  return ferry::GuardBoundary(
      "FerryUuid4ToCstr", [uuid]() -> Result<const char*> {
        auto shared = CheckedShared(uuid, "uuid");
        if (!shared) {
          return std::unexpected(shared.error());
        }
        return ferry::core::IntoCstr((*shared)->View());
      });
}

extern "C" auto FerryUuid4Eq(const FerryUuid4* lhs, const FerryUuid4* rhs)
    -> uint8_t {
  return ferry::GuardBoundary("FerryUuid4Eq", [lhs, rhs]() -> Result<uint8_t> {
    auto left = CheckedShared(lhs, "lhs");
    if (!left) {
      return std::unexpected(left.error());
    }
    auto right = CheckedShared(rhs, "rhs");
    if (!right) {
      return std::unexpected(right.error());
    }
    return static_cast<uint8_t>((*left)->View() == (*right)->View() ? 1 : 0);
  });
}

extern "C" auto FerryUuid4Hash(const FerryUuid4* uuid) -> uint64_t {
  return ferry::GuardBoundary("FerryUuid4Hash", [uuid]() -> Result<uint64_t> {
    auto shared = CheckedShared(uuid, "uuid");
    if (!shared) {
      return std::unexpected(shared.error());
    }
    return ferry::core::HashUuidText((*shared)->View());
  });
}
