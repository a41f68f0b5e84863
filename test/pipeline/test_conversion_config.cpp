/**
 * @file test_conversion_config.cpp
 * @brief ConversionConfig validation and JSON loading tests
 */

#include <gtest/gtest.h>
#include "pipeline/document_pipeline.h"
#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace docrecon;
using json = nlohmann::json;

namespace {

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = (std::filesystem::temp_directory_path() /
                 ("docrecon_config_" + std::string(::testing::UnitTest::GetInstance()
                                                       ->current_test_info()->name()) + ".json")).string();
    }

    void TearDown() override {
        std::remove(path_.c_str());
    }

    void Write(const std::string& content) {
        std::ofstream ofs(path_);
        ofs << content;
    }

    std::string path_;
};

} // namespace

// ==================== Defaults / Validate ====================

TEST(ConversionConfig, DefaultsAreValid) {
    ConversionConfig config;
    std::string error;
    EXPECT_TRUE(config.Validate(error)) << error;

    EXPECT_FLOAT_EQ(config.classifierConfig.minRegionConfidence, 0.1f);
    EXPECT_EQ(config.classifierConfig.unknownLabelPolicy, UnknownLabelPolicy::Abort);
    EXPECT_FLOAT_EQ(config.mergerConfig.nativeCoverageThreshold, 0.8f);
    EXPECT_FLOAT_EQ(config.orderConfig.columnOverlapThreshold, 0.5f);
    EXPECT_EQ(config.treeConfig.maxHeadingLevel, 6);
    EXPECT_EQ(config.limits.maxNumPages, 0);
    EXPECT_EQ(config.numThreads, 0);
    EXPECT_TRUE(config.useOcr);
}

TEST(ConversionConfig, ValidateRejectsOutOfRange) {
    std::string error;

    ConversionConfig config;
    config.orderConfig.columnOverlapThreshold = 1.5f;
    EXPECT_FALSE(config.Validate(error));
    EXPECT_NE(error.find("columnOverlapThreshold"), std::string::npos);

    config = ConversionConfig();
    config.limits.maxNumPages = -1;
    EXPECT_FALSE(config.Validate(error));

    config = ConversionConfig();
    config.numThreads = -2;
    EXPECT_FALSE(config.Validate(error));
}

// ==================== LoadFromJson ====================

TEST(ConversionConfig, PartialJsonOverlaysDefaults) {
    json j = json::parse(R"({
        "classifier": {"minRegionConfidence": 0.3, "unknownLabelPolicy": "map_to_text"},
        "readingOrder": {"columnOverlapThreshold": 0.25},
        "limits": {"maxNumPages": 50},
        "numThreads": 2,
        "useOcr": false
    })");

    ConversionConfig config;
    std::string error;
    ASSERT_TRUE(ConversionConfig::LoadFromJson(j, config, error)) << error;

    EXPECT_FLOAT_EQ(config.classifierConfig.minRegionConfidence, 0.3f);
    EXPECT_EQ(config.classifierConfig.unknownLabelPolicy, UnknownLabelPolicy::MapToText);
    EXPECT_FLOAT_EQ(config.orderConfig.columnOverlapThreshold, 0.25f);
    EXPECT_EQ(config.limits.maxNumPages, 50);
    EXPECT_EQ(config.numThreads, 2);
    EXPECT_FALSE(config.useOcr);

    // untouched sections keep their defaults
    EXPECT_FLOAT_EQ(config.mergerConfig.spanOverlapThreshold, 0.5f);
    EXPECT_FLOAT_EQ(config.tableConfig.cellOverlapThreshold, 0.5f);
}

TEST(ConversionConfig, UnknownKeysAreIgnored) {
    json j = json::parse(R"({"verbose": true,
                             "table": {"cellOverlapThreshold": 0.6, "maxGridCells": 500, "mode": "fast"}})");

    ConversionConfig config;
    std::string error;
    ASSERT_TRUE(ConversionConfig::LoadFromJson(j, config, error)) << error;
    EXPECT_FLOAT_EQ(config.tableConfig.cellOverlapThreshold, 0.6f);
    EXPECT_EQ(config.tableConfig.maxGridCells, 500);
}

TEST(ConversionConfig, WrongTypesFailWithoutTouchingConfig) {
    ConversionConfig config;
    config.numThreads = 3;
    std::string error;

    EXPECT_FALSE(ConversionConfig::LoadFromJson(
        json::parse(R"({"numThreads": 1, "textMerger": {"spanOverlapThreshold": "high"}})"), config, error));
    EXPECT_EQ(error, "textMerger.spanOverlapThreshold must be a number");
    EXPECT_EQ(config.numThreads, 3);

    EXPECT_FALSE(ConversionConfig::LoadFromJson(json::parse(R"({"numThreads": 1.5})"), config, error));
    EXPECT_EQ(error, "numThreads must be an integer");

    EXPECT_FALSE(ConversionConfig::LoadFromJson(json::parse(R"({"useOcr": "yes"})"), config, error));
    EXPECT_EQ(error, "useOcr must be a boolean");

    EXPECT_FALSE(ConversionConfig::LoadFromJson(json::parse(R"({"limits": 10})"), config, error));
    EXPECT_EQ(error, "limits must be an object");

    EXPECT_FALSE(ConversionConfig::LoadFromJson(json::parse("[1, 2]"), config, error));
    EXPECT_EQ(config.numThreads, 3);
}

TEST(ConversionConfig, InvalidValuesFailValidation) {
    ConversionConfig config;
    std::string error;
    EXPECT_FALSE(ConversionConfig::LoadFromJson(
        json::parse(R"({"classifier": {"minRegionConfidence": 2.0}})"), config, error));
    EXPECT_FLOAT_EQ(config.classifierConfig.minRegionConfidence, 0.1f);

    EXPECT_FALSE(ConversionConfig::LoadFromJson(
        json::parse(R"({"classifier": {"unknownLabelPolicy": "ignore"}})"), config, error));
    EXPECT_NE(error.find("unknownLabelPolicy"), std::string::npos);
}

TEST(ConversionConfig, HeadingStrategies) {
    ConversionConfig config;
    std::string error;
    ASSERT_TRUE(ConversionConfig::LoadFromJson(json::parse(R"({
        "treeBuilder": {"headingStrategy": "font_size", "fontSizeBreakpoints": [20, 16], "maxHeadingLevel": 4}
    })"), config, error)) << error;
    EXPECT_EQ(config.treeConfig.maxHeadingLevel, 4);

    OrderedRegion heading;
    heading.region.cls = RegionClass::SectionHeader;
    heading.tokens.emplace_back();
    heading.tokens.back().fontSize = 17.0f;
    EXPECT_EQ(config.treeConfig.headingLevel(heading), 2);

    EXPECT_FALSE(ConversionConfig::LoadFromJson(
        json::parse(R"({"treeBuilder": {"headingStrategy": "font_size"}})"), config, error));
    EXPECT_FALSE(ConversionConfig::LoadFromJson(
        json::parse(R"({"treeBuilder": {"headingStrategy": "bold"}})"), config, error));

    ASSERT_TRUE(ConversionConfig::LoadFromJson(
        json::parse(R"({"treeBuilder": {"headingStrategy": "default"}})"), config, error)) << error;
    EXPECT_EQ(config.treeConfig.headingLevel(heading), 2);
    heading.text = "4.1.2 Details";
    EXPECT_EQ(config.treeConfig.headingLevel(heading), 4);
}

// ==================== LoadFromFile ====================

TEST_F(ConfigFileTest, LoadsFile) {
    Write(R"({"limits": {"maxNumPages": 7}})");

    ConversionConfig config;
    std::string error;
    ASSERT_TRUE(ConversionConfig::LoadFromFile(path_, config, error)) << error;
    EXPECT_EQ(config.limits.maxNumPages, 7);
}

TEST_F(ConfigFileTest, MalformedFileFails) {
    Write("{\"limits\": ");

    ConversionConfig config;
    std::string error;
    EXPECT_FALSE(ConversionConfig::LoadFromFile(path_, config, error));
    EXPECT_NE(error.find("Failed to parse"), std::string::npos);
}

TEST_F(ConfigFileTest, MissingFileFails) {
    ConversionConfig config;
    std::string error;
    EXPECT_FALSE(ConversionConfig::LoadFromFile(path_ + ".missing", config, error));
    EXPECT_NE(error.find("Failed to open"), std::string::npos);
}
