#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "ferry/common/error.hpp"
#include "ferry/core/shared_string.hpp"

namespace ferry::core {

// Length of the canonical form "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx".
inline constexpr size_t kUuidTextLength = 36;

// Version-4 identifier held as a shared reference to its canonical text.
//
// Copying shares the backing string (one atomic increment). Equality and
// hashing use the text, never the allocation. A moved-from Uuid4 holds no
// reference and may only be destroyed or assigned to.
class Uuid4 {
 public:
  // Random version 4, RFC 4122 variant.
  static auto New() -> Uuid4;

  // Accepts hyphenated, simple (32 hex), braced and "urn:uuid:" forms in any
  // case. Stores the lowercase hyphenated form.
  static auto Parse(std::string_view text) -> Result<Uuid4>;

  // Adopts one reference held by `value` (the inverse of IntoRaw).
  static auto FromRaw(SharedString* value) -> Uuid4;

  Uuid4(const Uuid4& other) noexcept;
  Uuid4(Uuid4&& other) noexcept;
  auto operator=(const Uuid4& other) noexcept -> Uuid4&;
  auto operator=(Uuid4&& other) noexcept -> Uuid4&;
  ~Uuid4();

  // Gives up ownership of this instance's reference without releasing it.
  [[nodiscard]] auto IntoRaw() && -> SharedString*;

  [[nodiscard]] auto Value() const -> std::string_view {
    return value_->View();
  }

  [[nodiscard]] auto ToString() const -> std::string {
    return std::string(Value());
  }

  // 64-bit FNV-1a of the canonical text; identical across processes.
  [[nodiscard]] auto Hash() const -> uint64_t;

  [[nodiscard]] auto ToBytes() const -> std::array<uint8_t, 16>;

  [[nodiscard]] auto UseCount() const -> uint64_t {
    return value_->UseCount();
  }

  friend auto operator==(const Uuid4& lhs, const Uuid4& rhs) -> bool {
    return lhs.Value() == rhs.Value();
  }

 private:
  explicit Uuid4(SharedString* value) : value_(value) {
  }

  void Reset() noexcept;

  SharedString* value_;
};

auto HashUuidText(std::string_view text) -> uint64_t;

}  // namespace ferry::core

template <>
struct std::hash<ferry::core::Uuid4> {
  auto operator()(const ferry::core::Uuid4& uuid) const -> size_t {
    return static_cast<size_t>(uuid.Hash());
  }
};
