/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading.
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace gantt_engine;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "ge_test_config";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.scheduling.default_duration_days, 1);
    EXPECT_EQ(config.scheduling.default_dependency_mode, DependencyMode::Flexible);
    EXPECT_DOUBLE_EQ(config.sequencer.renormalize_gap, 1.0);
    EXPECT_EQ(config.sequencer.precision_digits, 9);
    EXPECT_TRUE(config.logging.log_dir.empty());
    EXPECT_EQ(config.logging.log_level, "info");
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [scheduling]
        default_duration_days = 3
        default_dependency_mode = "Strict"

        [sequencer]
        renormalize_gap = 1000.0
        precision_digits = 6

        [logging]
        log_dir = "/tmp/ge_logs"
        log_level = "debug"
        max_file_size_mb = 10
        rotate_count = 2
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = result.value();
    EXPECT_EQ(config.scheduling.default_duration_days, 3);
    EXPECT_EQ(config.scheduling.default_dependency_mode, DependencyMode::Strict);
    EXPECT_DOUBLE_EQ(config.sequencer.renormalize_gap, 1000.0);
    EXPECT_EQ(config.sequencer.precision_digits, 6);
    EXPECT_EQ(config.logging.log_dir, std::filesystem::path{"/tmp/ge_logs"});
    EXPECT_EQ(config.logging.log_level, "debug");
    EXPECT_EQ(config.logging.max_file_size_mb, 10u);
    EXPECT_EQ(config.logging.rotate_count, 2u);
}

TEST_F(ConfigTest, PartialConfigKeepsDefaults) {
    auto path = write_toml(R"(
        [scheduling]
        default_dependency_mode = "Off"
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->scheduling.default_dependency_mode, DependencyMode::Off);
    EXPECT_EQ(result->scheduling.default_duration_days, 1);
    EXPECT_EQ(result->sequencer.precision_digits, 9);
    EXPECT_EQ(result->logging.log_level, "info");
}

TEST_F(ConfigTest, MissingFile) {
    auto result = load_config(temp_dir_ / "nonexistent.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigError);
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("[scheduling\ndefault_duration_days = ");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigError);
    EXPECT_NE(result.error().message.find("TOML parse error"), std::string::npos);
}

// ─── Validation ──────────────────────────────

TEST(ConfigParseTest, RejectsUnknownMode) {
    auto result = parse_config("[scheduling]\ndefault_dependency_mode = \"Loose\"\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigError);
}

TEST(ConfigParseTest, RejectsNonPositiveDuration) {
    auto result = parse_config("[scheduling]\ndefault_duration_days = 0\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigError);
}

TEST(ConfigParseTest, RejectsPrecisionOutOfRange) {
    EXPECT_FALSE(parse_config("[sequencer]\nprecision_digits = 0\n").has_value());
    EXPECT_FALSE(parse_config("[sequencer]\nprecision_digits = 16\n").has_value());
}

TEST(ConfigParseTest, RejectsGapFinerThanPrecision) {
    auto result = parse_config("[sequencer]\nrenormalize_gap = 1e-10\nprecision_digits = 9\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigError);
    EXPECT_NE(result.error().message.find("renormalize_gap"), std::string::npos);

    EXPECT_FALSE(parse_config("[sequencer]\nrenormalize_gap = 0.01\nprecision_digits = 2\n").has_value());
    EXPECT_TRUE(parse_config("[sequencer]\nrenormalize_gap = 0.03\nprecision_digits = 2\n").has_value());
    EXPECT_TRUE(parse_config("[sequencer]\nrenormalize_gap = 0.5\nprecision_digits = 1\n").has_value());
}

TEST(ConfigParseTest, RejectsUnknownLogLevel) {
    auto result = parse_config("[logging]\nlog_level = \"verbose\"\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("verbose"), std::string::npos);
}

TEST(ConfigParseTest, EmptyTextGivesDefaults) {
    auto result = parse_config("");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->scheduling.default_dependency_mode, DependencyMode::Flexible);
}
