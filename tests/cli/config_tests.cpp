#include <gtest/gtest.h>

#include <cstdint>
#include <string>

#include "cli_test_fixture.hpp"

namespace ferry::test {
namespace {

class ConfigTest : public CliTestFixture {};

// Test: output.time_unit selects the unit of `now`
TEST_F(ConfigTest, TimeUnitFromConfig) {
  WriteFerryToml("warn", "s");

  auto result = Run({"now"});

  ASSERT_TRUE(result.Success()) << result.output;
  EXPECT_NE(result.output.find('.'), std::string::npos) << result.output;
  EXPECT_GT(std::stod(result.output), 1'577'836'800.0);
}

// Test: --unit wins over the config file
TEST_F(ConfigTest, CommandLineOverridesConfig) {
  WriteFerryToml("warn", "s");

  auto result = Run({"now", "--unit", "ms"});

  ASSERT_TRUE(result.Success()) << result.output;
  EXPECT_EQ(result.output.find('.'), std::string::npos) << result.output;
  EXPECT_GT(std::stoull(result.output), 1'577'836'800'000ULL);
}

// Test: --config names the file explicitly
TEST_F(ConfigTest, ExplicitConfigPath) {
  WriteFile("conf/custom.toml", "[output]\ntime_unit = \"ms\"\n");

  auto result =
      Run({"--config", (TestDir() / "conf" / "custom.toml").string(), "now"});

  ASSERT_TRUE(result.Success()) << result.output;
  EXPECT_EQ(result.output.find('.'), std::string::npos) << result.output;
}

// Test: debug logging from the config reaches stderr
TEST_F(ConfigTest, DebugLevelFromConfig) {
  WriteFerryToml("debug", "ns");

  auto result = Run({"convert", "1", "--from", "s", "--to", "ms"});

  ASSERT_TRUE(result.Success()) << result.output;
  EXPECT_TRUE(result.Contains("[ferry]")) << result.output;
  EXPECT_TRUE(result.Contains("convert 1 s -> 1000 ms")) << result.output;
}

// Test: --verbose enables debug logging without a config
TEST_F(ConfigTest, VerboseFlag) {
  auto result = Run({"-v", "uuid"});

  ASSERT_TRUE(result.Success()) << result.output;
  EXPECT_TRUE(result.Contains("live shared strings")) << result.output;
}

// Test: malformed TOML is reported, not ignored
TEST_F(ConfigTest, MalformedConfigFails) {
  WriteFile("ferry.toml", "[log\nlevel = ");

  auto result = Run({"precision", "1.5"});

  EXPECT_EQ(result.exit_code, 1);
  EXPECT_TRUE(result.Contains("failed to parse")) << result.output;
}

// Test: unknown enum values are rejected
TEST_F(ConfigTest, UnknownLogLevelFails) {
  WriteFerryToml("loud", "ns");

  auto result = Run({"precision", "1.5"});

  EXPECT_EQ(result.exit_code, 1);
  EXPECT_TRUE(result.Contains("unknown log level 'loud'")) << result.output;
}

TEST_F(ConfigTest, MinutesNotAllowedAsOutputUnit) {
  WriteFerryToml("warn", "min");

  auto result = Run({"now"});

  EXPECT_EQ(result.exit_code, 1);
  EXPECT_TRUE(result.Contains("output.time_unit")) << result.output;
}

// Test: an explicit --config that does not exist is an error
TEST_F(ConfigTest, MissingExplicitConfigFails) {
  auto result = Run({"--config", "absent.toml", "now"});

  EXPECT_EQ(result.exit_code, 1);
  EXPECT_TRUE(result.Contains("not found")) << result.output;
}

}  // namespace
}  // namespace ferry::test
