#include "ferry/core/cstr.hpp"

#include <cstring>
#include <string_view>

#include "ferry/common/error.hpp"

namespace ferry::core {

auto IntoCstr(std::string_view text) -> const char* {
  // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
  auto* buffer = new char[text.size() + 1];
  std::memcpy(buffer, text.data(), text.size());
  // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  buffer[text.size()] = '\0';
  return buffer;
}

auto ReleaseCstr(const char* ptr) -> Result<void> {
  if (ptr == nullptr) {
    return std::unexpected(Error::InvalidInput("C string pointer is null"));
  }
  // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
  delete[] ptr;
  return {};
}

auto CstrToView(const char* ptr) -> Result<std::string_view> {
  if (ptr == nullptr) {
    return std::unexpected(Error::InvalidInput("C string pointer is null"));
  }
  return std::string_view(ptr);
}

}  // namespace ferry::core
