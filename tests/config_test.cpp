#include <gtest/gtest.h>
#include "fluttersec/common/config.hpp"
#include "fluttersec/core/pipeline.hpp"
#include "test_helpers.hpp"
#include <algorithm>

using namespace fluttersec;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        common::Config::instance().reset();
    }

    void TearDown() override {
        common::Config::instance().reset();
    }

    test::TempDir dir_;
};

TEST_F(ConfigTest, DefaultsMatchDocumentedValues) {
    auto defaults = common::Config::createDefaultConfig();
    EXPECT_EQ(defaults.scan.min_string_length, 8u);
    EXPECT_EQ(defaults.scan.max_binary_scan_mb, 512u);
    EXPECT_EQ(defaults.scan.max_extracted_size_mb, 2048u);
    EXPECT_EQ(defaults.scan.max_archive_entries, 100000u);
    EXPECT_EQ(defaults.scan.max_compression_ratio, 250u);
    EXPECT_FALSE(defaults.scan.parallel_detectors);
    EXPECT_EQ(defaults.report.default_format, "console");
    EXPECT_EQ(defaults.report.priority_limit, 5u);
}

TEST_F(ConfigTest, LoadsTomlSections) {
    auto path = dir_ / "config.toml";
    test::writeFile(path,
        "[global]\n"
        "log_level = \"debug\"\n"
        "\n"
        "[scan]\n"
        "min_string_length = 12\n"
        "parallel_detectors = true\n"
        "\n"
        "[report]\n"
        "default_format = \"json\"\n"
        "\n"
        "[rules]\n"
        "extra_env_files = [\"app.env\"]\n"
        "extra_whitelisted_domains = [\"cdn.example.com\"]\n");

    auto& config = common::Config::instance();
    ASSERT_TRUE(config.load(path.string()));

    EXPECT_EQ(config.global().log_level, common::LogLevel::DEBUG);
    EXPECT_EQ(config.global().scan.min_string_length, 12u);
    EXPECT_TRUE(config.global().scan.parallel_detectors);
    EXPECT_EQ(config.global().report.default_format, "json");
    EXPECT_EQ(config.getConfigPath(), path.string());

    auto rules = detect::DetectionRules::fromConfig(config.global());
    EXPECT_NE(std::find(rules.env_files.begin(), rules.env_files.end(), "app.env"), rules.env_files.end());
    EXPECT_NE(std::find(rules.env_files.begin(), rules.env_files.end(), ".env"), rules.env_files.end());
    EXPECT_NE(std::find(rules.whitelisted_domains.begin(), rules.whitelisted_domains.end(), "cdn.example.com"),
              rules.whitelisted_domains.end());
    EXPECT_EQ(rules.min_string_length, 12u);
}

TEST_F(ConfigTest, SetGetAndSaveRoundTrip) {
    auto path = dir_ / "nested" / "config.toml";
    auto& config = common::Config::instance();
    ASSERT_TRUE(config.load(path.string()));

    EXPECT_TRUE(config.setValue("scan.max_archive_entries", "5000"));
    EXPECT_TRUE(config.setValue("report.priority_limit", "3"));
    EXPECT_TRUE(config.setValue("rules.extra_sensitive_extensions", ".bak, .dump"));
    EXPECT_FALSE(config.setValue("scan.no_such_key", "1"));
    EXPECT_FALSE(config.setValue("scan.max_archive_entries", "many"));

    EXPECT_EQ(config.getValue("scan.max_archive_entries"), "5000");
    EXPECT_FALSE(config.getValue("unknown").has_value());

    ASSERT_TRUE(config.save());
    ASSERT_TRUE(std::filesystem::exists(path));

    config.reset();
    ASSERT_TRUE(config.load(path.string()));
    EXPECT_EQ(config.global().scan.max_archive_entries, 5000u);
    EXPECT_EQ(config.global().report.priority_limit, 3u);
    ASSERT_EQ(config.global().rules.extra_sensitive_extensions.size(), 2u);
    EXPECT_EQ(config.global().rules.extra_sensitive_extensions[1], ".dump");
}

TEST_F(ConfigTest, MalformedFileKeepsDefaults) {
    auto path = dir_ / "broken.toml";
    test::writeFile(path, "[scan\nmin_string_length = = 3\n");

    auto& config = common::Config::instance();
    config.load(path.string());
    EXPECT_EQ(config.global().scan.min_string_length, 8u);
}

TEST_F(ConfigTest, PipelineOptionsFollowScanSection) {
    auto config = common::Config::createDefaultConfig();
    config.scan.max_archive_entries = 42;
    config.scan.max_extracted_size_mb = 3;
    config.scan.work_dir = "/tmp/somewhere";

    auto options = core::PipelineOptions::fromConfig(config);
    EXPECT_EQ(options.limits.max_entries, 42u);
    EXPECT_EQ(options.limits.max_total_bytes, 3u * 1024 * 1024);
    EXPECT_EQ(options.work_dir, "/tmp/somewhere");
}
