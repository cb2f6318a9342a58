#include <gtest/gtest.h>

#include <atomic>
#include <cstdint>
#include <thread>
#include <vector>

#include "ferry/core/shared_string.hpp"

namespace ferry::core {
namespace {

TEST(SharedStringTest, CreateHoldsOneReference) {
  uint64_t before = SharedString::LiveCount();
  SharedString* str = SharedString::Create("abc");
  EXPECT_EQ(str->View(), "abc");
  EXPECT_EQ(str->UseCount(), 1);
  EXPECT_EQ(SharedString::LiveCount(), before + 1);
  EXPECT_TRUE(str->Release());
  EXPECT_EQ(SharedString::LiveCount(), before);
}

TEST(SharedStringTest, FreedExactlyOnceByLastRelease) {
  uint64_t before = SharedString::LiveCount();
  SharedString* str = SharedString::Create("shared");
  constexpr int kClones = 10;
  for (int i = 0; i < kClones; ++i) {
    str->Retain();
  }
  EXPECT_EQ(str->UseCount(), kClones + 1);

  int frees = 0;
  for (int i = 0; i < kClones; ++i) {
    frees += str->Release() ? 1 : 0;
    EXPECT_EQ(SharedString::LiveCount(), before + 1);
  }
  EXPECT_EQ(frees, 0);
  EXPECT_TRUE(str->Release());
  EXPECT_EQ(SharedString::LiveCount(), before);
}

TEST(SharedStringTest, ConcurrentRetainReleaseConverges) {
  uint64_t before = SharedString::LiveCount();
  SharedString* str = SharedString::Create("contended");

  constexpr int kThreads = 8;
  constexpr int kIterations = 10'000;
  std::atomic<int> frees{0};
  std::vector<std::thread> threads;
  threads.reserve(kThreads);
  for (int t = 0; t < kThreads; ++t) {
    str->Retain();  // one reference per thread, handed over below
    threads.emplace_back([str, &frees] {
      for (int i = 0; i < kIterations; ++i) {
        str->Retain();
        if (str->Release()) {
          frees.fetch_add(1);
        }
      }
      if (str->Release()) {
        frees.fetch_add(1);
      }
    });
  }
  if (str->Release()) {
    frees.fetch_add(1);
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(frees.load(), 1);
  EXPECT_EQ(SharedString::LiveCount(), before);
}

}  // namespace
}  // namespace ferry::core
