#include "ferry/core/cvec.hpp"

#include <new>

#include <fmt/core.h>

#include "ferry/common/error.hpp"

namespace ferry::core {

auto CheckCVec(const FerryCVec& cvec) -> Result<void> {
  if (cvec.len > cvec.cap) {
    return std::unexpected(Error::InvalidInput(fmt::format(
        "vector length {} exceeds capacity {}", cvec.len, cvec.cap)));
  }
  if (cvec.ptr == nullptr && cvec.cap != 0) {
    return std::unexpected(Error::InvalidInput(fmt::format(
        "null vector pointer with capacity {}", cvec.cap)));
  }
  if (cvec.ptr != nullptr && cvec.cap == 0) {
    return std::unexpected(
        Error::InvalidInput("non-null vector pointer with zero capacity"));
  }
  return {};
}

auto DropCVec(FerryCVec cvec) -> Result<void> {
  if (IsEmptySentinel(cvec)) {
    return {};
  }
  if (auto checked = CheckCVec(cvec); !checked) {
    return checked;
  }
  // Element size is unknown here, so the unsized form is the only valid one.
  // It pairs with the unsized ::operator new in IntoCVec.
  ::operator delete(cvec.ptr);
  return {};
}

}  // namespace ferry::core
