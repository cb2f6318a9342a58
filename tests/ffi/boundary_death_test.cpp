#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <limits>

#include "ferry/ferry.h"

namespace ferry {
namespace {

// Every documented contract violation aborts with the name of the entry
// point in the message.
class BoundaryDeathTest : public ::testing::Test {
 protected:
  void SetUp() override {
    GTEST_FLAG_SET(death_test_style, "threadsafe");
  }
};

TEST_F(BoundaryDeathTest, PrecisionFromNullAborts) {
  EXPECT_DEATH(FerryPrecisionFromCstr(nullptr), "FerryPrecisionFromCstr");
}

TEST_F(BoundaryDeathTest, CstrDropNullAborts) {
  EXPECT_DEATH(FerryCstrDrop(nullptr), "FerryCstrDrop");
}

TEST_F(BoundaryDeathTest, UuidFromNullAborts) {
  EXPECT_DEATH(FerryUuid4FromCstr(nullptr), "FerryUuid4FromCstr");
}

TEST_F(BoundaryDeathTest, UuidFromMalformedTextAborts) {
  EXPECT_DEATH(FerryUuid4FromCstr("not-a-uuid"), "not a valid UUID");
}

TEST_F(BoundaryDeathTest, UuidOperationsOnNullAbort) {
  FerryUuid4 empty{.value = nullptr};
  EXPECT_DEATH(FerryUuid4Clone(nullptr), "FerryUuid4Clone");
  EXPECT_DEATH(FerryUuid4Clone(&empty), "FerryUuid4Clone");
  EXPECT_DEATH(FerryUuid4Drop(empty), "FerryUuid4Drop");
  EXPECT_DEATH(FerryUuid4ToCstr(nullptr), "FerryUuid4ToCstr");
  EXPECT_DEATH(FerryUuid4Eq(nullptr, &empty), "FerryUuid4Eq");
  EXPECT_DEATH(FerryUuid4Hash(&empty), "FerryUuid4Hash");
}

TEST_F(BoundaryDeathTest, NegativeSecondsAbort) {
  EXPECT_DEATH(FerrySecsToNanos(-1.0), "FerrySecsToNanos.*negative");
  EXPECT_DEATH(FerrySecsToMillis(std::nan("")), "FerrySecsToMillis");
}

TEST_F(BoundaryDeathTest, IntegerOverflowAborts) {
  EXPECT_DEATH(
      FerryMillisToNanos(std::numeric_limits<uint64_t>::max()),
      "FerryMillisToNanos.*overflows");
  EXPECT_DEATH(
      FerryMicrosToNanos(std::numeric_limits<uint64_t>::max()),
      "FerryMicrosToNanos");
}

TEST_F(BoundaryDeathTest, CVecLengthBeyondCapacityAborts) {
  uint8_t byte = 0;
  FerryCVec corrupt{.ptr = &byte, .len = 2, .cap = 1};
  EXPECT_DEATH(FerryCVecDrop(corrupt), "FerryCVecDrop.*exceeds capacity");
}

}  // namespace
}  // namespace ferry
