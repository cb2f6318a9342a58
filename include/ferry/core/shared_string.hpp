#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>

namespace ferry::core {

// Immutable string with an intrusive atomic reference count.
//
// Create() returns a pointer holding one reference. Every Retain() must be
// paired with one Release(); the last Release() deletes the object. The text
// never changes after construction, so readers need no synchronization.
class SharedString {
 public:
  static auto Create(std::string_view text) -> SharedString*;

  SharedString(const SharedString&) = delete;
  SharedString(SharedString&&) = delete;
  auto operator=(const SharedString&) -> SharedString& = delete;
  auto operator=(SharedString&&) -> SharedString& = delete;

  void Retain() noexcept;

  // Drops one reference. Returns true when this call freed the string.
  // Releasing a live string whose count is already zero aborts; releasing a
  // freed string is undefined.
  auto Release() noexcept -> bool;

  [[nodiscard]] auto View() const noexcept -> std::string_view {
    return text_;
  }

  // Snapshot; may be stale by the time the caller reads it.
  [[nodiscard]] auto UseCount() const noexcept -> uint64_t {
    return refcount_.load(std::memory_order_acquire);
  }

  // Number of SharedString objects currently alive in the process.
  static auto LiveCount() noexcept -> uint64_t;

 private:
  explicit SharedString(std::string_view text);
  ~SharedString();

  std::atomic<uint64_t> refcount_{1};
  const std::string text_;
};

}  // namespace ferry::core
