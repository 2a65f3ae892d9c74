#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "llasm/common/diagnostic/diagnostic.hpp"
#include "llasm/config/lowering_config.hpp"

namespace llasm::config {
namespace {

namespace fs = std::filesystem;

auto GenerateRandomSuffix() -> std::string {
  static std::random_device rd;
  static std::mt19937 gen(rd());
  static std::uniform_int_distribution<> dis(0, 999999);
  return std::to_string(dis(gen));
}

class LoweringConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_dir_ = fs::temp_directory_path() /
                ("llasm_config_test_" + GenerateRandomSuffix());
    fs::create_directories(test_dir_);
  }

  void TearDown() override {
    if (!test_dir_.empty() && fs::exists(test_dir_)) {
      fs::remove_all(test_dir_);
    }
  }

  auto WriteFile(const fs::path& relative, std::string_view content)
      -> fs::path {
    fs::path path = test_dir_ / relative;
    fs::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
    return path;
  }

  static void ExpectConfigError(
      const Result<LoweringConfig>& result, std::string_view fragment) {
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, DiagCode::kConfig);
    EXPECT_EQ(result.error().primary.kind, DiagKind::kHostError);
    EXPECT_NE(result.error().primary.message.find(fragment), std::string::npos)
        << result.error().primary.message;
  }

  fs::path test_dir_;
};

// =============================================================================
// Parsing
// =============================================================================

TEST_F(LoweringConfigTest, EmptyFileGivesDefaults) {
  auto config = ParseConfig("");
  ASSERT_TRUE(config);
  EXPECT_EQ(config->lowering.max_errors, 0);
  EXPECT_TRUE(config->lowering.keep_going);
  EXPECT_EQ(config->log_level, spdlog::level::info);
}

TEST_F(LoweringConfigTest, AllKeys) {
  auto config = ParseConfig(R"(
[lowering]
max_errors = 20
keep_going = false

[log]
level = "debug"
)");
  ASSERT_TRUE(config);
  EXPECT_EQ(config->lowering.max_errors, 20);
  EXPECT_FALSE(config->lowering.keep_going);
  EXPECT_EQ(config->log_level, spdlog::level::debug);
}

TEST_F(LoweringConfigTest, OffIsAValidLevel) {
  auto config = ParseConfig("[log]\nlevel = \"off\"\n");
  ASSERT_TRUE(config);
  EXPECT_EQ(config->log_level, spdlog::level::off);
}

TEST_F(LoweringConfigTest, NegativeMaxErrors) {
  ExpectConfigError(
      ParseConfig("[lowering]\nmax_errors = -1\n", "neg.toml"),
      "neg.toml: 'lowering.max_errors' must be a non-negative integer");
}

TEST_F(LoweringConfigTest, WrongValueTypes) {
  ExpectConfigError(
      ParseConfig("[lowering]\nmax_errors = \"three\"\n"),
      "'lowering.max_errors' must be a non-negative integer");
  ExpectConfigError(
      ParseConfig("[lowering]\nkeep_going = \"yes\"\n"),
      "'lowering.keep_going' must be a boolean");
  ExpectConfigError(
      ParseConfig("[log]\nlevel = 3\n"), "'log.level' must be a string");
}

TEST_F(LoweringConfigTest, UnknownLogLevel) {
  ExpectConfigError(
      ParseConfig("[log]\nlevel = \"loud\"\n"), "unknown log level 'loud'");
}

TEST_F(LoweringConfigTest, MalformedToml) {
  ExpectConfigError(ParseConfig("[lowering\n"), "failed to parse");
}

// =============================================================================
// Discovery and loading
// =============================================================================

TEST_F(LoweringConfigTest, FindConfigWalksUpward) {
  fs::path config = WriteFile(kConfigFileName, "");
  fs::path nested = test_dir_ / "a" / "b";
  fs::create_directories(nested);

  auto found = FindConfig(nested);
  ASSERT_TRUE(found.has_value());
  EXPECT_TRUE(fs::equivalent(*found, config));
}

TEST_F(LoweringConfigTest, NearestConfigWins) {
  WriteFile(kConfigFileName, "");
  fs::path inner = WriteFile(fs::path("sub") / kConfigFileName, "");

  auto found = FindConfig(test_dir_ / "sub");
  ASSERT_TRUE(found.has_value());
  EXPECT_TRUE(fs::equivalent(*found, inner));
}

TEST_F(LoweringConfigTest, LoadConfigRecordsRootDir) {
  fs::path path = WriteFile(
      fs::path("proj") / kConfigFileName, "[lowering]\nmax_errors = 5\n");

  auto config = LoadConfig(path);
  ASSERT_TRUE(config);
  EXPECT_EQ(config->lowering.max_errors, 5);
  EXPECT_EQ(config->root_dir, path.parent_path());
}

TEST_F(LoweringConfigTest, LoadConfigReportsPath) {
  fs::path path = WriteFile(kConfigFileName, "max_errors = = 1\n");

  auto config = LoadConfig(path);
  ExpectConfigError(config, "failed to parse");
  ASSERT_FALSE(config);
  EXPECT_EQ(config.error().subject, path.string());
}

TEST_F(LoweringConfigTest, ApplyLogLevel) {
  auto previous = spdlog::get_level();
  LoweringConfig config;
  config.log_level = spdlog::level::warn;
  ApplyLogLevel(config);
  EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);
  spdlog::set_level(previous);
}

}  // namespace
}  // namespace llasm::config
