#include "ferry/core/cvec.hpp"

#include "ferry/common/contract.hpp"
#include "ferry/ferry.h"

// The host mirrors this struct field by field.
static_assert(sizeof(FerryCVec) == 3 * sizeof(void*), "FerryCVec ABI size");
static_assert(alignof(FerryCVec) == alignof(void*), "FerryCVec ABI alignment");

extern "C" auto FerryCVecNew() -> FerryCVec {
  return ferry::core::EmptyCVec();
}

extern "C" void FerryCVecDrop(FerryCVec cvec) {
  ferry::GuardBoundary(
      "FerryCVecDrop", [cvec] { return ferry::core::DropCVec(cvec); });
}
