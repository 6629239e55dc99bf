/**
 * @file test_configuration.cpp
 * @brief Unit tests for YAML configuration, logging and error types
 *
 * Tests:
 * 1. Dotted key lookup and typed defaults
 * 2. File load / reload, parse failures
 * 3. Tracking and calibration section helpers
 * 4. Logger level filtering and file sink
 * 5. Exception codes and context
 */

#include <gtest/gtest.h>
#include <handcal/core/Configuration.hpp>
#include <handcal/core/Logger.hpp>
#include <handcal/core/exception.hpp>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace handcal::core;

class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLevel(LogLevel::WARNING);
        Configuration::getInstance().clear();
        path_ = "/tmp/handcal_config_test_" + std::to_string(::getpid()) + ".yaml";
    }

    void TearDown() override {
        Configuration::getInstance().clear();
        std::remove(path_.c_str());
    }

    void writeFile(const std::string& content) const {
        std::ofstream out(path_, std::ios::trunc);
        out << content;
    }

    std::string path_;
};

/**
 * Test 1: Nested keys resolve through dotted paths
 */
TEST_F(ConfigurationTest, DottedKeys) {
    auto& config = Configuration::getInstance();
    ASSERT_TRUE(config.loadFromString(
        "tracking:\n"
        "  buffer_capacity: 7\n"
        "  min_weight: 0.25\n"
        "name: replay\n"));

    EXPECT_TRUE(config.has("tracking.buffer_capacity"));
    EXPECT_TRUE(config.has("name"));
    EXPECT_FALSE(config.has("tracking.missing"));
    EXPECT_FALSE(config.has("name.child"));
    EXPECT_FALSE(config.has(""));

    EXPECT_EQ(config.get<int>("tracking.buffer_capacity", 0), 7);
    EXPECT_DOUBLE_EQ(config.get<double>("tracking.min_weight", 0.0), 0.25);
    EXPECT_EQ(config.get<std::string>("name"), "replay");

    // Missing or unconvertible values fall back to the default
    EXPECT_EQ(config.get<int>("tracking.missing", 42), 42);
    EXPECT_EQ(config.get<int>("name", -1), -1);
}

/**
 * Test 2: Files load, reload picks up edits, bad input keeps the old document
 */
TEST_F(ConfigurationTest, LoadAndReload) {
    auto& config = Configuration::getInstance();

    writeFile("calibration:\n  pinch_threshold_ratio: 2.0\n");
    ASSERT_TRUE(config.load(path_));
    EXPECT_EQ(config.getFilename(), path_);
    EXPECT_DOUBLE_EQ(config.get<double>("calibration.pinch_threshold_ratio", 0.0), 2.0);

    writeFile("calibration:\n  pinch_threshold_ratio: 3.0\n");
    ASSERT_TRUE(config.reload());
    EXPECT_DOUBLE_EQ(config.get<double>("calibration.pinch_threshold_ratio", 0.0), 3.0);

    EXPECT_FALSE(config.load("/nonexistent/handcal.yaml"));
    EXPECT_FALSE(config.loadFromString("tracking: [unclosed"));
    EXPECT_DOUBLE_EQ(config.get<double>("calibration.pinch_threshold_ratio", 0.0), 3.0);

    config.clear();
    EXPECT_FALSE(config.reload());
    EXPECT_FALSE(config.has("calibration.pinch_threshold_ratio"));
}

/**
 * Test 3: Empty configuration yields the built-in defaults
 */
TEST_F(ConfigurationTest, DefaultSections) {
    auto& config = Configuration::getInstance();

    handcal::gesture::TrackingConfig tracking = config.getTrackingConfig();
    EXPECT_EQ(tracking.buffer_capacity, 5u);
    EXPECT_DOUBLE_EQ(tracking.min_weight, 0.3);
    EXPECT_DOUBLE_EQ(tracking.max_weight, 1.0);
    EXPECT_EQ(tracking.stability_window, 3u);
    EXPECT_EQ(tracking.stability_score_cap, 10);
    EXPECT_EQ(tracking.point_of_interest, handcal::gesture::PointOfInterest::INDEX_TIP);

    handcal::gesture::CalibrationConfig calibration = config.getCalibrationConfig();
    EXPECT_DOUBLE_EQ(calibration.finger_threshold_ratio, 0.12);
    EXPECT_DOUBLE_EQ(calibration.pinch_threshold_ratio, 1.5);
}

/**
 * Test 4: Section values override defaults
 */
TEST_F(ConfigurationTest, CustomSections) {
    auto& config = Configuration::getInstance();
    ASSERT_TRUE(config.loadFromString(
        "tracking:\n"
        "  buffer_capacity: 8\n"
        "  stability_window: 4\n"
        "  landmark_stability_threshold: 6.5\n"
        "  point_of_interest: palm_center\n"
        "calibration:\n"
        "  finger_threshold_ratio: 0.2\n"));

    handcal::gesture::TrackingConfig tracking = config.getTrackingConfig();
    EXPECT_EQ(tracking.buffer_capacity, 8u);
    EXPECT_EQ(tracking.stability_window, 4u);
    EXPECT_DOUBLE_EQ(tracking.landmark_stability_threshold, 6.5);
    EXPECT_EQ(tracking.point_of_interest, handcal::gesture::PointOfInterest::PALM_CENTER);

    handcal::gesture::CalibrationConfig calibration = config.getCalibrationConfig();
    EXPECT_DOUBLE_EQ(calibration.finger_threshold_ratio, 0.2);
    EXPECT_DOUBLE_EQ(calibration.pinch_threshold_ratio, 1.5);
}

/**
 * Test 5: Invalid section values throw ConfigurationException
 */
TEST_F(ConfigurationTest, InvalidSections) {
    auto& config = Configuration::getInstance();

    ASSERT_TRUE(config.loadFromString("tracking:\n  min_weight: 2.0\n"));
    EXPECT_THROW(config.getTrackingConfig(), ConfigurationException);

    ASSERT_TRUE(config.loadFromString("tracking:\n  point_of_interest: thumb\n"));
    EXPECT_THROW(config.getTrackingConfig(), ConfigurationException);

    ASSERT_TRUE(config.loadFromString("calibration:\n  finger_threshold_ratio: -1\n"));
    EXPECT_THROW(config.getCalibrationConfig(), ConfigurationException);

    try {
        config.getCalibrationConfig();
        FAIL() << "Expected ConfigurationException";
    } catch (const ConfigurationException& e) {
        EXPECT_EQ(e.getResultCode(), ResultCode::ERROR_INVALID_PARAMETER);
        EXPECT_NE(e.getContext().find("Configuration.cpp"), std::string::npos);
    }
}

class LoggerTest : public ::testing::Test {
protected:
    void TearDown() override {
        auto& logger = Logger::getInstance();
        logger.closeLogFile();
        logger.setConsoleOutput(true);
        logger.setLevel(LogLevel::WARNING);
    }

    static std::string readAll(const std::string& path) {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

/**
 * Test 6: Minimum level filters lower-severity messages
 */
TEST_F(LoggerTest, LevelFiltering) {
    auto& logger = Logger::getInstance();
    logger.setLevel(LogLevel::WARNING);

    EXPECT_EQ(logger.getLevel(), LogLevel::WARNING);
    EXPECT_FALSE(logger.isEnabled(LogLevel::DEBUG));
    EXPECT_FALSE(logger.isEnabled(LogLevel::INFO));
    EXPECT_TRUE(logger.isEnabled(LogLevel::WARNING));
    EXPECT_TRUE(logger.isEnabled(LogLevel::CRITICAL));

    EXPECT_EQ(Logger::levelToString(LogLevel::INFO), "INFO");
    EXPECT_EQ(Logger::levelToString(LogLevel::ERROR), "ERROR");
}

/**
 * Test 7: Timestamped log file receives component-tagged messages
 */
TEST_F(LoggerTest, FileSink) {
    auto& logger = Logger::getInstance();
    const std::string dir = "/tmp/handcal_test_logs_" + std::to_string(::getpid());

    ASSERT_TRUE(logger.initializeWithTimestamp(dir, LogLevel::INFO));
    logger.setConsoleOutput(false);

    const std::string file = logger.getCurrentLogFile();
    ASSERT_FALSE(file.empty());
    EXPECT_EQ(file.rfind(dir + "/log_handcal_", 0), 0u);

    HANDCAL_LOG_INFO("LoggerTest") << "tracking " << 42;
    HANDCAL_LOG_DEBUG("LoggerTest") << "filtered out";
    logger.warning("plain warning", "Calibrator");
    logger.flush();

    const std::string content = readAll(file);
    EXPECT_NE(content.find("[INFO] [LoggerTest] tracking 42"), std::string::npos);
    EXPECT_NE(content.find("test_configuration.cpp:"), std::string::npos);
    EXPECT_NE(content.find("[WARNING] [Calibrator] plain warning"), std::string::npos);
    EXPECT_EQ(content.find("filtered out"), std::string::npos);

    logger.closeLogFile();
    EXPECT_TRUE(logger.getCurrentLogFile().empty());
    std::remove(file.c_str());
    ::rmdir(dir.c_str());
}

/**
 * Test 8: Result codes and exception context
 */
TEST_F(LoggerTest, ExceptionTypes) {
    EXPECT_EQ(resultCodeToString(ResultCode::SUCCESS), "SUCCESS");
    EXPECT_EQ(resultCodeToString(ResultCode::ERROR_CALIBRATION_INVALID), "ERROR_CALIBRATION_INVALID");

    try {
        HANDCAL_THROW(CalibrationException, "no baseline");
    } catch (const Exception& e) {
        EXPECT_EQ(e.getResultCode(), ResultCode::ERROR_CALIBRATION_INVALID);
        EXPECT_EQ(e.getMessage(), "no baseline");
        EXPECT_NE(e.getContext().find("test_configuration.cpp:"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("no baseline"), std::string::npos);
    }
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
