#include <gtest/gtest.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

#include "ferry/common/error.hpp"
#include "ferry/core/shared_string.hpp"
#include "ferry/core/uuid.hpp"

namespace ferry::core {
namespace {

constexpr const char* kCanonical = "6ba7b810-9dad-11d1-80b4-00c04fd430c8";

class Uuid4Test : public ::testing::Test {
 protected:
  void SetUp() override {
    baseline_ = SharedString::LiveCount();
  }

  void TearDown() override {
    EXPECT_EQ(SharedString::LiveCount(), baseline_) << "leaked SharedString";
  }

 private:
  uint64_t baseline_ = 0;
};

// =============================================================================
// Construction
// =============================================================================

TEST_F(Uuid4Test, NewIsCanonicalVersion4) {
  Uuid4 uuid = Uuid4::New();
  std::string_view text = uuid.Value();
  ASSERT_EQ(text.size(), kUuidTextLength);
  EXPECT_EQ(text[8], '-');
  EXPECT_EQ(text[13], '-');
  EXPECT_EQ(text[18], '-');
  EXPECT_EQ(text[23], '-');
  EXPECT_EQ(text[14], '4');
  EXPECT_NE(std::string_view("89ab").find(text[19]), std::string_view::npos);
  for (char c : text) {
    EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || c == '-')
        << text;
  }
  EXPECT_EQ(uuid.UseCount(), 1);
}

TEST_F(Uuid4Test, NewBytesCarryVersionAndVariant) {
  for (int i = 0; i < 64; ++i) {
    auto bytes = Uuid4::New().ToBytes();
    EXPECT_EQ(bytes[6] & 0xF0, 0x40);
    EXPECT_EQ(bytes[8] & 0xC0, 0x80);
  }
}

TEST_F(Uuid4Test, NewIsUnique) {
  std::unordered_set<std::string> seen;
  for (int i = 0; i < 1000; ++i) {
    EXPECT_TRUE(seen.insert(Uuid4::New().ToString()).second);
  }
}

TEST_F(Uuid4Test, ParseRoundTripsCanonicalText) {
  auto uuid = Uuid4::Parse(kCanonical);
  ASSERT_TRUE(uuid.has_value());
  EXPECT_EQ(uuid->ToString(), kCanonical);
}

TEST_F(Uuid4Test, ParseRoundTripsGeneratedText) {
  Uuid4 original = Uuid4::New();
  auto parsed = Uuid4::Parse(original.Value());
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, original);
}

TEST_F(Uuid4Test, ParseCanonicalizesOtherForms) {
  for (const char* text :
       {"6BA7B810-9DAD-11D1-80B4-00C04FD430C8",
        "6ba7b8109dad11d180b400c04fd430c8",
        "{6ba7b810-9dad-11d1-80b4-00c04fd430c8}",
        "{6BA7B8109DAD11D180B400C04FD430C8}",
        "urn:uuid:6ba7b810-9dad-11d1-80b4-00c04fd430c8",
        "URN:UUID:6BA7B8109DAD11D180B400C04FD430C8"}) {
    auto uuid = Uuid4::Parse(text);
    ASSERT_TRUE(uuid.has_value()) << text;
    EXPECT_EQ(uuid->Value(), kCanonical) << text;
  }
}

TEST_F(Uuid4Test, ParseRejectsMalformedText) {
  for (const char* text :
       {"", "not-a-uuid", "6ba7b810-9dad-11d1-80b4-00c04fd430c",
        "6ba7b810-9dad-11d1-80b4-00c04fd430c8a",
        "6ba7b810x9dad-11d1-80b4-00c04fd430c8",
        "6ba7b810-9dad-11d1-80b4-00c04fd430cg",
        "6ba7b810-9dad-11d1-80b4--0c04fd430c8",
        "{6ba7b810-9dad-11d1-80b4-00c04fd430c8",
        "urn:uuid:{6ba7b810-9dad-11d1-80b4-00c04fd430c8"}) {
    auto uuid = Uuid4::Parse(text);
    ASSERT_FALSE(uuid.has_value()) << text;
    EXPECT_EQ(uuid.error().kind, ErrorKind::kParseFailure) << text;
    EXPECT_NE(uuid.error().message.find("is not a valid UUID"),
              std::string::npos)
        << uuid.error().message;
  }
}

// =============================================================================
// Sharing
// =============================================================================

TEST_F(Uuid4Test, CopySharesBackingString) {
  Uuid4 original = Uuid4::New();
  Uuid4 copy = original;  // NOLINT(performance-unnecessary-copy-initialization)
  EXPECT_EQ(original.UseCount(), 2);
  EXPECT_EQ(original.Value().data(), copy.Value().data());
  EXPECT_EQ(original, copy);
  EXPECT_EQ(original.Hash(), copy.Hash());
}

TEST_F(Uuid4Test, CopiesFreeOnlyAfterLastRelease) {
  uint64_t before = SharedString::LiveCount();
  {
    auto original = std::make_unique<Uuid4>(Uuid4::New());
    EXPECT_EQ(SharedString::LiveCount(), before + 1);

    std::vector<Uuid4> copies(5, *original);
    EXPECT_EQ(original->UseCount(), 6);

    original.reset();
    EXPECT_EQ(SharedString::LiveCount(), before + 1);
    copies.erase(copies.begin() + 1, copies.end());
    EXPECT_EQ(copies.front().UseCount(), 1);
    EXPECT_EQ(SharedString::LiveCount(), before + 1);
  }
  EXPECT_EQ(SharedString::LiveCount(), before);
}

TEST_F(Uuid4Test, MoveTransfersReference) {
  Uuid4 source = Uuid4::New();
  std::string text = source.ToString();
  Uuid4 target = std::move(source);
  EXPECT_EQ(target.Value(), text);
  EXPECT_EQ(target.UseCount(), 1);
}

TEST_F(Uuid4Test, AssignmentReleasesPreviousValue) {
  uint64_t before = SharedString::LiveCount();
  Uuid4 a = Uuid4::New();
  Uuid4 b = Uuid4::New();
  EXPECT_EQ(SharedString::LiveCount(), before + 2);
  a = b;
  EXPECT_EQ(SharedString::LiveCount(), before + 1);
  EXPECT_EQ(b.UseCount(), 2);
}

TEST_F(Uuid4Test, RawHandOffKeepsReference) {
  Uuid4 uuid = Uuid4::New();
  std::string text = uuid.ToString();
  SharedString* raw = std::move(uuid).IntoRaw();
  ASSERT_NE(raw, nullptr);
  EXPECT_EQ(raw->UseCount(), 1);
  Uuid4 restored = Uuid4::FromRaw(raw);
  EXPECT_EQ(restored.Value(), text);
}

// =============================================================================
// Equality and hashing
// =============================================================================

TEST_F(Uuid4Test, EqualityIsByContent) {
  auto a = Uuid4::Parse(kCanonical);
  auto b = Uuid4::Parse("6BA7B810-9DAD-11D1-80B4-00C04FD430C8");
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  EXPECT_NE(a->Value().data(), b->Value().data());
  EXPECT_EQ(*a, *b);
  EXPECT_EQ(a->Hash(), b->Hash());
  EXPECT_EQ(std::hash<Uuid4>{}(*a), std::hash<Uuid4>{}(*b));
}

TEST_F(Uuid4Test, DistinctValuesCompareUnequal) {
  EXPECT_FALSE(Uuid4::New() == Uuid4::New());
}

TEST_F(Uuid4Test, HashIsStableAcrossRuns) {
  EXPECT_EQ(HashUuidText(kCanonical), 0xad05fd9059563830ULL);
}

TEST_F(Uuid4Test, ToBytes) {
  auto uuid = Uuid4::Parse(kCanonical);
  ASSERT_TRUE(uuid.has_value());
  auto bytes = uuid->ToBytes();
  EXPECT_EQ(bytes[0], 0x6b);
  EXPECT_EQ(bytes[1], 0xa7);
  EXPECT_EQ(bytes[6], 0x11);
  EXPECT_EQ(bytes[15], 0xc8);
}

}  // namespace
}  // namespace ferry::core
