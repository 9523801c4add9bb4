/**
 * @file test_config.cpp
 * @brief Unit tests for detector configuration
 */

#include <gtest/gtest.h>

#include "sysgram/core/config.hpp"
#include "sysgram/core/errors.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace sysgram::core;

namespace {

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path path;

    void SetUp() override {
        path = std::filesystem::temp_directory_path() /
               (std::string("sysgram_config_") +
                ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".json");
    }

    void TearDown() override {
        std::filesystem::remove(path);
    }

    void WriteConfig(const std::string& content) {
        std::ofstream file(path);
        file << content;
    }
};

} // anonymous namespace

TEST_F(ConfigTest, DefaultsAreValid) {
    DetectorConfig config;
    EXPECT_NO_THROW(config.Validate());

    EXPECT_EQ(config.window_duration, std::chrono::milliseconds(2000));
    EXPECT_EQ(config.gram_size, 3u);
    EXPECT_EQ(config.tree_count, 100u);
    EXPECT_EQ(config.sample_size, 256u);
    EXPECT_DOUBLE_EQ(config.alert_threshold, 0.6);
}

TEST_F(ConfigTest, ValidateNamesInvalidField) {
    auto expect_invalid = [](auto mutate) {
        DetectorConfig config;
        mutate(config);
        EXPECT_THROW(config.Validate(), ConfigurationError);
    };

    expect_invalid([](DetectorConfig& c) { c.window_duration = std::chrono::milliseconds(0); });
    expect_invalid([](DetectorConfig& c) { c.gram_size = 0; });
    expect_invalid([](DetectorConfig& c) { c.tree_count = 0; });
    expect_invalid([](DetectorConfig& c) { c.sample_size = 0; });
    expect_invalid([](DetectorConfig& c) { c.alert_threshold = 1.01; });
    expect_invalid([](DetectorConfig& c) { c.alert_threshold = -0.5; });
    expect_invalid([](DetectorConfig& c) { c.contamination = 0.0; });
    expect_invalid([](DetectorConfig& c) { c.contamination = 0.6; });
    expect_invalid([](DetectorConfig& c) { c.ewma_alpha = 0.0; });
    expect_invalid([](DetectorConfig& c) { c.filter_history = 0; });
    expect_invalid([](DetectorConfig& c) { c.filter_rank = 6; });
    expect_invalid([](DetectorConfig& c) { c.backlog_warning = 0; });
    expect_invalid([](DetectorConfig& c) { c.system_id.clear(); });

    try {
        DetectorConfig config;
        config.gram_size = 0;
        config.Validate();
        FAIL() << "expected ConfigurationError";
    }
    catch (const ConfigurationError& e) {
        EXPECT_NE(std::string(e.what()).find("gram_size"), std::string::npos);
    }
}

TEST_F(ConfigTest, LoadKeepsDefaultsForMissingKeys) {
    WriteConfig(R"({"window_duration_ms": 500, "gram_size": 4, "alert_threshold": 0.75,
                    "system_id": "rtu-7", "range_penalty": false, "future_key": 1})");

    auto config = DetectorConfig::LoadFromFile(path);
    EXPECT_EQ(config.window_duration, std::chrono::milliseconds(500));
    EXPECT_EQ(config.gram_size, 4u);
    EXPECT_DOUBLE_EQ(config.alert_threshold, 0.75);
    EXPECT_EQ(config.system_id, "rtu-7");
    EXPECT_FALSE(config.range_penalty);
    EXPECT_EQ(config.tree_count, 100u);
    EXPECT_EQ(config.seed, 42u);
}

TEST_F(ConfigTest, ToJsonRoundTrips) {
    DetectorConfig original;
    original.window_duration = std::chrono::milliseconds(1500);
    original.tree_count = 64;
    original.seed = 7;
    original.contamination = 0.01;

    WriteConfig(original.ToJson());
    auto loaded = DetectorConfig::LoadFromFile(path);

    EXPECT_EQ(loaded.window_duration, original.window_duration);
    EXPECT_EQ(loaded.tree_count, 64u);
    EXPECT_EQ(loaded.seed, 7u);
    EXPECT_DOUBLE_EQ(loaded.contamination, 0.01);
}

TEST_F(ConfigTest, LoadRejectsBadFiles) {
    EXPECT_THROW(DetectorConfig::LoadFromFile("/nonexistent/sysgram.json"), ConfigurationError);

    WriteConfig("{ broken");
    EXPECT_THROW(DetectorConfig::LoadFromFile(path), ConfigurationError);

    WriteConfig(R"(["not", "an", "object"])");
    EXPECT_THROW(DetectorConfig::LoadFromFile(path), ConfigurationError);

    WriteConfig(R"({"gram_size": "three"})");
    EXPECT_THROW(DetectorConfig::LoadFromFile(path), ConfigurationError);
}

TEST_F(ConfigTest, LoadRejectsNegativeAndFractionalCounts) {
    for (const char* content : {R"({"gram_size": -1})", R"({"tree_count": -5})",
                                R"({"sample_size": 2.5})", R"({"seed": -42})",
                                R"({"window_duration_ms": 1.5})", R"({"window_duration_ms": "2000"})"}) {
        WriteConfig(content);
        EXPECT_THROW(DetectorConfig::LoadFromFile(path), ConfigurationError) << content;
    }

    WriteConfig(R"({"window_duration_ms": 1500, "tree_count": 10})");
    auto config = DetectorConfig::LoadFromFile(path);
    EXPECT_EQ(config.window_duration.count(), 1500);
    EXPECT_EQ(config.tree_count, 10u);
}
