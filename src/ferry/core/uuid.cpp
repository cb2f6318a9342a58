#include "ferry/core/uuid.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fmt/core.h>

#include "ferry/common/error.hpp"
#include "ferry/core/shared_string.hpp"

namespace ferry::core {

namespace {

constexpr std::string_view kUrnPrefix = "urn:uuid:";

auto StartsWithIgnoreCase(std::string_view text, std::string_view prefix)
    -> bool {
  if (text.size() < prefix.size()) {
    return false;
  }
  return std::equal(
      prefix.begin(), prefix.end(), text.begin(), [](char p, char c) {
        return p == ((c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c);
      });
}

// random_generator is not thread-safe; each thread draws from its own.
auto Generator() -> boost::uuids::random_generator& {
  thread_local boost::uuids::random_generator generator;
  return generator;
}

auto ParseBody(std::string_view body) -> boost::uuids::uuid {
  return boost::uuids::string_generator()(body.begin(), body.end());
}

}  // namespace

auto Uuid4::New() -> Uuid4 {
  // Version 4, RFC 4122 variant. Entropy failure throws entropy_error.
  boost::uuids::uuid id = Generator()();
  return Uuid4(SharedString::Create(boost::uuids::to_string(id)));
}

auto Uuid4::Parse(std::string_view text) -> Result<Uuid4> {
  std::string_view body = text;
  if (StartsWithIgnoreCase(body, kUrnPrefix)) {
    body.remove_prefix(kUrnPrefix.size());
  }

  boost::uuids::uuid id{};
  try {
    id = ParseBody(body);
  } catch (const std::runtime_error& e) {
    return std::unexpected(Error::ParseFailure(
        fmt::format("'{}' is not a valid UUID: {}", text, e.what())));
  }
  return Uuid4(SharedString::Create(boost::uuids::to_string(id)));
}

auto Uuid4::FromRaw(SharedString* value) -> Uuid4 {
  return Uuid4(value);
}

Uuid4::Uuid4(const Uuid4& other) noexcept : value_(other.value_) {
  if (value_ != nullptr) {
    value_->Retain();
  }
}

Uuid4::Uuid4(Uuid4&& other) noexcept
    : value_(std::exchange(other.value_, nullptr)) {
}

auto Uuid4::operator=(const Uuid4& other) noexcept -> Uuid4& {
  if (this != &other) {
    if (other.value_ != nullptr) {
      other.value_->Retain();
    }
    Reset();
    value_ = other.value_;
  }
  return *this;
}

auto Uuid4::operator=(Uuid4&& other) noexcept -> Uuid4& {
  if (this != &other) {
    Reset();
    value_ = std::exchange(other.value_, nullptr);
  }
  return *this;
}

Uuid4::~Uuid4() {
  Reset();
}

void Uuid4::Reset() noexcept {
  if (value_ != nullptr) {
    value_->Release();
    value_ = nullptr;
  }
}

auto Uuid4::IntoRaw() && -> SharedString* {
  return std::exchange(value_, nullptr);
}

auto Uuid4::Hash() const -> uint64_t {
  return HashUuidText(Value());
}

auto Uuid4::ToBytes() const -> std::array<uint8_t, 16> {
  // The stored text is canonical, so parsing cannot fail.
  boost::uuids::uuid id = ParseBody(Value());
  std::array<uint8_t, 16> bytes{};
  std::copy(id.begin(), id.end(), bytes.begin());
  return bytes;
}

auto HashUuidText(std::string_view text) -> uint64_t {
  constexpr uint64_t kFnvPrime = 0x00000100000001B3ULL;
  constexpr uint64_t kFnvBasis = 0xcbf29ce484222325ULL;
  uint64_t hash = kFnvBasis;
  for (char c : text) {
    hash ^= static_cast<uint8_t>(c);
    hash *= kFnvPrime;
  }
  return hash;
}

}  // namespace ferry::core
