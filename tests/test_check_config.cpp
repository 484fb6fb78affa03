/**
 * @file test_check_config.cpp
 * @brief Unit tests for YAML check configuration
 *
 * Validates:
 * - Built-in defaults and partial overrides
 * - Parse and type errors reported as ConfigurationException
 * - Value range validation
 * - The shipped config/passcheck.yaml
 */

#include <gtest/gtest.h>
#include <passcheck/checks/CheckConfig.hpp>
#include <passcheck/core/exception.h>

#include <cstdio>
#include <fstream>
#include <string>

using namespace passcheck;
using namespace passcheck::checks;

/**
 * Test 1: An empty document yields the built-in defaults
 */
TEST(CheckConfigTest, EmptyDocumentUsesDefaults) {
    CheckConfig config = parseCheckConfig("");

    EXPECT_DOUBLE_EQ(config.brightness.threshold, 0.5);
    EXPECT_DOUBLE_EQ(config.brightness.min_brightness, 50.0);
    EXPECT_DOUBLE_EQ(config.sharpness.min_variance, 50.0);
    EXPECT_DOUBLE_EQ(config.expression.threshold, 0.4);
    EXPECT_DOUBLE_EQ(config.eye_visibility.closed_ratio, 0.22);
    EXPECT_EQ(config.reflection.bright_level, 250);
    EXPECT_EQ(config.shadow.dark_level, 35);
    EXPECT_EQ(config.background.min_background_pixels, 100);
    EXPECT_NO_THROW(config.validate());
}

/**
 * Test 2: Keys present in the document override only themselves
 */
TEST(CheckConfigTest, PartialOverride) {
    CheckConfig config = parseCheckConfig(
        "brightness:\n"
        "  threshold: 0.7\n"
        "  max_brightness: 210\n"
        "reflection:\n"
        "  bright_level: 245\n");

    EXPECT_DOUBLE_EQ(config.brightness.threshold, 0.7);
    EXPECT_DOUBLE_EQ(config.brightness.max_brightness, 210.0);
    EXPECT_DOUBLE_EQ(config.brightness.min_brightness, 50.0);
    EXPECT_EQ(config.reflection.bright_level, 245);
    EXPECT_DOUBLE_EQ(config.shadow.threshold, 0.5);
}

/**
 * Test 3: Malformed documents and wrong value types
 */
TEST(CheckConfigTest, MalformedYamlThrowsConfigurationException) {
    EXPECT_THROW(parseCheckConfig("brightness: [threshold: 0.5"), core::ConfigurationException);
    EXPECT_THROW(parseCheckConfig("- just\n- a list\n"), core::ConfigurationException);
    EXPECT_THROW(parseCheckConfig("sharpness:\n  min_variance: lots\n"), core::ConfigurationException);
}

TEST(CheckConfigTest, ConfigurationErrorsCarryResultCode) {
    try {
        parseCheckConfig("shadow:\n  dark_level: dark\n");
        FAIL() << "Expected ConfigurationException";
    } catch (const core::Exception& e) {
        EXPECT_EQ(e.getResultCode(), core::ResultCode::ERROR_CONFIGURATION);
        EXPECT_NE(std::string(e.what()).find("shadow.dark_level"), std::string::npos) << e.what();
    }
}

/**
 * Test 4: Out-of-range values are rejected after loading
 */
TEST(CheckConfigTest, InvalidValuesAreRejected) {
    EXPECT_THROW(parseCheckConfig("expression:\n  threshold: 1.2\n"), core::InvalidArgumentException);
    EXPECT_THROW(parseCheckConfig("headwear:\n  threshold: -0.1\n"), core::InvalidArgumentException);
    EXPECT_THROW(parseCheckConfig("brightness:\n  min_brightness: 240\n"), core::InvalidArgumentException);
    EXPECT_THROW(parseCheckConfig("eye_visibility:\n  closed_ratio: 0.3\n"), core::InvalidArgumentException);
    EXPECT_THROW(parseCheckConfig("shadow:\n  uneven_std: 20\n"), core::InvalidArgumentException);
}

TEST(CheckConfigTest, ValidateCatchesProgrammaticChanges) {
    CheckConfig config;
    config.face_position.min_size_ratio = 0.8;
    EXPECT_THROW(config.validate(), core::InvalidArgumentException);

    config = CheckConfig();
    config.reflection.max_bright_ratio = 0.0;
    EXPECT_THROW(config.validate(), core::InvalidArgumentException);
}

TEST(CheckConfigTest, ToStringListsThresholds) {
    CheckConfig config;
    config.background.threshold = 0.65;
    const std::string text = config.toString();
    EXPECT_NE(text.find("brightness=0.5"), std::string::npos) << text;
    EXPECT_NE(text.find("background=0.65"), std::string::npos) << text;
}

/**
 * Test 5: Loading from disk
 */
TEST(CheckConfigTest, MissingFileThrowsConfigurationException) {
    EXPECT_THROW(loadCheckConfig("/nonexistent/passcheck.yaml"), core::ConfigurationException);
}

TEST(CheckConfigTest, LoadsFileFromDisk) {
    const std::string path = ::testing::TempDir() + "passcheck_test_config.yaml";
    {
        std::ofstream out(path);
        out << "sharpness:\n  threshold: 0.65\n  min_variance: 80\n";
    }

    CheckConfig config = loadCheckConfig(path);
    EXPECT_DOUBLE_EQ(config.sharpness.threshold, 0.65);
    EXPECT_DOUBLE_EQ(config.sharpness.min_variance, 80.0);
    std::remove(path.c_str());
}

TEST(CheckConfigTest, ShippedConfigMatchesDefaults) {
    CheckConfig shipped = loadCheckConfig(std::string(PASSCHECK_SOURCE_DIR) + "/config/passcheck.yaml");
    CheckConfig defaults;

    EXPECT_DOUBLE_EQ(shipped.brightness.threshold, defaults.brightness.threshold);
    EXPECT_DOUBLE_EQ(shipped.face_position.max_size_ratio, defaults.face_position.max_size_ratio);
    EXPECT_DOUBLE_EQ(shipped.eye_visibility.acceptable_ratio, defaults.eye_visibility.acceptable_ratio);
    EXPECT_EQ(shipped.reflection.min_blob_area, defaults.reflection.min_blob_area);
    EXPECT_DOUBLE_EQ(shipped.shadow.uneven_std, defaults.shadow.uneven_std);
    EXPECT_DOUBLE_EQ(shipped.headwear.band_height, defaults.headwear.band_height);
    EXPECT_DOUBLE_EQ(shipped.background.mask_height, defaults.background.mask_height);
    EXPECT_EQ(shipped.toString(), defaults.toString());
}
