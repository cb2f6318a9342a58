#include "ferry/core/shared_string.hpp"

#include <atomic>
#include <cstdint>
#include <string_view>

#include <spdlog/spdlog.h>

#include "ferry/common/contract.hpp"
#include "ferry/common/log.hpp"

namespace ferry::core {

namespace {

// NOLINTBEGIN(cppcoreguidelines-avoid-non-const-global-variables)
std::atomic<uint64_t> g_live_count{0};
// NOLINTEND(cppcoreguidelines-avoid-non-const-global-variables)

}  // namespace

SharedString::SharedString(std::string_view text) : text_(text) {
  g_live_count.fetch_add(1, std::memory_order_relaxed);
}

SharedString::~SharedString() {
  g_live_count.fetch_sub(1, std::memory_order_relaxed);
}

auto SharedString::Create(std::string_view text) -> SharedString* {
  // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
  return new SharedString(text);
}

void SharedString::Retain() noexcept {
  // A new reference is always derived from an existing one, so no ordering
  // is needed on the increment.
  refcount_.fetch_add(1, std::memory_order_relaxed);
}

auto SharedString::Release() noexcept -> bool {
  uint64_t previous = refcount_.fetch_sub(1, std::memory_order_acq_rel);
  // Catches a release on a live string whose count already reached zero.
  // A release after the string was freed is undefined and is not detected.
  if (previous == 0) {
    AbortContractViolation(
        "SharedString::Release", "reference count already zero");
  }
  if (previous != 1) {
    return false;
  }
  SPDLOG_LOGGER_TRACE(Logger(), "freeing shared string '{}'", text_);
  // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
  delete this;
  return true;
}

auto SharedString::LiveCount() noexcept -> uint64_t {
  return g_live_count.load(std::memory_order_relaxed);
}

}  // namespace ferry::core
