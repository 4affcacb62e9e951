#include "cia/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

namespace cia
{
    namespace fs = std::filesystem;

    class ConfigTest : public ::testing::Test {
    protected:
        void SetUp() override {
            temp_dir_ = fs::temp_directory_path() / "cia_config_test";
            fs::create_directories(temp_dir_);
        }

        void TearDown() override {
            fs::remove_all(temp_dir_);
        }

        fs::path temp_dir_;
    };

    TEST_F(ConfigTest, DefaultValues) {
        const auto config = Config::default_config();

        EXPECT_EQ(config.impact.high_reference_threshold, 10u);
        EXPECT_EQ(config.impact.critical_reference_threshold, 50u);
        EXPECT_EQ(config.impact.reindex_policy, ReindexPolicy::Append);
        EXPECT_EQ(config.impact.comment_prefixes, (std::vector<std::string>{"//", "#", "/*"}));
        EXPECT_EQ(config.report.max_listed_references, 10u);
        EXPECT_TRUE(config.report.include_warnings);
        EXPECT_EQ(config.logging.level, logging::LogLevel::Warn);
        EXPECT_TRUE(config.validate().is_ok());
    }

    TEST_F(ConfigTest, EmptyDocumentMatchesDefaults) {
        auto result = Config::load_from_string("");

        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().impact.high_reference_threshold, 10u);
        EXPECT_EQ(result.value().impact.critical_reference_threshold, 50u);
    }

    TEST_F(ConfigTest, LoadFromString) {
        const std::string toml = R"(
[impact]
high_reference_threshold = 5
critical_reference_threshold = 20
reindex_policy = "replace"
comment_prefixes = ["//", "--"]

[report]
max_listed_references = 3
include_warnings = false

[logging]
level = "debug"
)";

        auto result = Config::load_from_string(toml);
        ASSERT_TRUE(result.is_ok()) << result.error().to_string();

        const auto& config = result.value();
        EXPECT_EQ(config.impact.high_reference_threshold, 5u);
        EXPECT_EQ(config.impact.critical_reference_threshold, 20u);
        EXPECT_EQ(config.impact.reindex_policy, ReindexPolicy::Replace);
        EXPECT_EQ(config.impact.comment_prefixes, (std::vector<std::string>{"//", "--"}));
        EXPECT_EQ(config.report.max_listed_references, 3u);
        EXPECT_FALSE(config.report.include_warnings);
        EXPECT_EQ(config.logging.level, logging::LogLevel::Debug);
    }

    TEST_F(ConfigTest, InvalidTomlIsConfigError) {
        auto result = Config::load_from_string("[impact\nhigh = ");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
        EXPECT_NE(result.error().message().find("Failed to parse TOML configuration"), std::string::npos);
    }

    TEST_F(ConfigTest, NonIntegerThreshold) {
        auto result = Config::load_from_string("[impact]\nhigh_reference_threshold = \"ten\"\n");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().message(), "high_reference_threshold must be an integer");
    }

    TEST_F(ConfigTest, NegativeThreshold) {
        auto result = Config::load_from_string("[report]\nmax_listed_references = -1\n");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().message(), "max_listed_references must be non-negative");
    }

    TEST_F(ConfigTest, UnknownReindexPolicy) {
        auto result = Config::load_from_string("[impact]\nreindex_policy = \"merge\"\n");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().message(), "Unknown reindex policy");
        EXPECT_EQ(result.error().context().value(), "merge");
    }

    TEST_F(ConfigTest, UnknownLogLevel) {
        auto result = Config::load_from_string("[logging]\nlevel = \"loud\"\n");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().message(), "Unknown log level");
    }

    TEST_F(ConfigTest, ValidationRejectsInvertedThresholds) {
        Config config;
        config.impact.high_reference_threshold = 60;
        config.impact.critical_reference_threshold = 50;

        auto result = config.validate();
        ASSERT_TRUE(result.is_err());
        EXPECT_NE(result.error().message().find("Configuration validation failed"), std::string::npos);

        auto loaded = Config::load_from_string(
            "[impact]\nhigh_reference_threshold = 60\ncritical_reference_threshold = 50\n");
        EXPECT_TRUE(loaded.is_err());
    }

    TEST_F(ConfigTest, ValidationRejectsEmptyCommentPrefix) {
        Config config;
        config.impact.comment_prefixes = {"//", "  "};

        EXPECT_TRUE(config.validate().is_err());
    }

    TEST_F(ConfigTest, SaveAndLoadFile) {
        Config config;
        config.impact.high_reference_threshold = 7;
        config.impact.reindex_policy = ReindexPolicy::Replace;
        config.report.include_warnings = false;
        config.logging.level = logging::LogLevel::Info;

        const auto path = temp_dir_ / "cia.toml";
        ASSERT_TRUE(config.save_to_file(path.string()).is_ok());

        auto loaded = Config::load_from_file(path.string());
        ASSERT_TRUE(loaded.is_ok()) << loaded.error().to_string();
        EXPECT_EQ(loaded.value().impact.high_reference_threshold, 7u);
        EXPECT_EQ(loaded.value().impact.reindex_policy, ReindexPolicy::Replace);
        EXPECT_FALSE(loaded.value().report.include_warnings);
        EXPECT_EQ(loaded.value().logging.level, logging::LogLevel::Info);
    }

    TEST_F(ConfigTest, LoadMissingFile) {
        auto result = Config::load_from_file((temp_dir_ / "missing.toml").string());

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
    }

    TEST_F(ConfigTest, ReindexPolicyStrings) {
        EXPECT_STREQ(to_string(ReindexPolicy::Append), "append");
        EXPECT_STREQ(to_string(ReindexPolicy::Replace), "replace");

        auto parsed = reindex_policy_from_string("REPLACE");
        ASSERT_TRUE(parsed.is_ok());
        EXPECT_EQ(parsed.value(), ReindexPolicy::Replace);
    }

}  // namespace cia
