#pragma once

#include <cstddef>
#include <cstring>
#include <new>
#include <span>
#include <type_traits>
#include <vector>

#include "ferry/common/error.hpp"
#include "ferry/ferry.h"

namespace ferry::core {

// Element types that may travel in a FerryCVec. The untyped FerryCVecDrop
// frees the buffer without running destructors or knowing the alignment, so
// both must be trivial.
template <typename T>
inline constexpr bool kIsCVecElement =
    std::is_trivially_copyable_v<T> && std::is_trivially_destructible_v<T> &&
    alignof(T) <= __STDCPP_DEFAULT_NEW_ALIGNMENT__;

inline auto EmptyCVec() -> FerryCVec {
  return FerryCVec{.ptr = nullptr, .len = 0, .cap = 0};
}

inline auto IsEmptySentinel(const FerryCVec& cvec) -> bool {
  return cvec.ptr == nullptr && cvec.len == 0 && cvec.cap == 0;
}

// len <= cap, and a null pointer only for the empty sentinel.
auto CheckCVec(const FerryCVec& cvec) -> Result<void>;

// Frees the buffer of any kIsCVecElement vector. The sentinel is a no-op.
auto DropCVec(FerryCVec cvec) -> Result<void>;

// Moves `items` into a raw buffer of the same capacity owned by the returned
// handle. A vector with no capacity becomes the empty sentinel.
template <typename T>
auto IntoCVec(std::vector<T> items) -> FerryCVec {
  static_assert(kIsCVecElement<T>, "FerryCVec elements must be trivial");
  if (items.capacity() == 0) {
    return EmptyCVec();
  }
  size_t cap = items.capacity();
  void* buffer = ::operator new(cap * sizeof(T));
  if (!items.empty()) {
    std::memcpy(buffer, items.data(), items.size() * sizeof(T));
  }
  return FerryCVec{.ptr = buffer, .len = items.size(), .cap = cap};
}

// Read-only view of the live elements. The handle keeps ownership.
template <typename T>
auto CVecView(const FerryCVec& cvec) -> std::span<const T> {
  static_assert(kIsCVecElement<T>, "FerryCVec elements must be trivial");
  if (cvec.ptr == nullptr) {
    return {};
  }
  return {static_cast<const T*>(cvec.ptr), cvec.len};
}

// Releases a handle produced by IntoCVec<T>. Deallocation uses `cap`.
template <typename T>
auto ReleaseCVec(FerryCVec cvec) -> Result<void> {
  static_assert(kIsCVecElement<T>, "FerryCVec elements must be trivial");
  if (auto checked = CheckCVec(cvec); !checked) {
    return checked;
  }
  if (cvec.ptr != nullptr) {
    ::operator delete(cvec.ptr, cvec.cap * sizeof(T));
  }
  return {};
}

// Consumes the handle and returns its elements as an owning vector.
template <typename T>
auto FromCVec(FerryCVec cvec) -> Result<std::vector<T>> {
  static_assert(kIsCVecElement<T>, "FerryCVec elements must be trivial");
  if (auto checked = CheckCVec(cvec); !checked) {
    return std::unexpected(checked.error());
  }
  std::vector<T> items;
  items.reserve(cvec.cap);
  auto view = CVecView<T>(cvec);
  items.assign(view.begin(), view.end());
  if (auto released = ReleaseCVec<T>(cvec); !released) {
    return std::unexpected(released.error());
  }
  return items;
}

}  // namespace ferry::core
