#pragma once

#include <string_view>

#include "ferry/common/error.hpp"

namespace ferry::core {

// Allocates a NUL-terminated copy of `text` for hand-off to the host.
// The result must be released exactly once with ReleaseCstr.
auto IntoCstr(std::string_view text) -> const char*;

// Frees a string produced by IntoCstr. Null is kInvalidInput.
auto ReleaseCstr(const char* ptr) -> Result<void>;

// Borrowed view of a host-supplied C string. Null is kInvalidInput.
auto CstrToView(const char* ptr) -> Result<std::string_view>;

}  // namespace ferry::core
