#include "utils/Logger.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
using namespace episweep;

class LoggerFixture : public ::testing::Test {
protected:
    std::string testDir = "temp_logger_test_dir";
    std::string logPath = testDir + "/episweep.log";

    void SetUp() override {
        fs::remove_all(testDir);
        fs::create_directories(testDir);
        Logger::getInstance().setLogLevel(LogLevel::INFO);
    }

    void TearDown() override {
        Logger::getInstance().enableFileLogging(false);
        Logger::getInstance().setLogLevel(LogLevel::INFO);
        fs::remove_all(testDir);
    }

    std::string readLog() const {
        std::ifstream in(logPath);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }
};

TEST(LogLevelTest, ParseIsCaseInsensitive) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(parseLogLevel("Debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(parseLogLevel("FATAL", level));
    EXPECT_EQ(level, LogLevel::FATAL);
    EXPECT_FALSE(parseLogLevel("loud", level));
    EXPECT_EQ(level, LogLevel::FATAL);
}

TEST_F(LoggerFixture, FileReceivesRecordsUntilDisabled) {
    Logger& logger = Logger::getInstance();
    ASSERT_TRUE(logger.enableFileLogging(true, logPath));
    logger.info("LoggerTest", "sweep started");
    logger.warning("LoggerTest", "unknown key");
    ASSERT_TRUE(logger.enableFileLogging(false));
    logger.info("LoggerTest", "after close");

    const std::string contents = readLog();
    EXPECT_NE(contents.find("[INFO]"), std::string::npos);
    EXPECT_NE(contents.find("[LoggerTest] sweep started"), std::string::npos);
    EXPECT_NE(contents.find("[WARNING]"), std::string::npos);
    EXPECT_EQ(contents.find("after close"), std::string::npos);
}

TEST_F(LoggerFixture, RecordsBelowThresholdAreDropped) {
    Logger& logger = Logger::getInstance();
    logger.setLogLevel(LogLevel::WARNING);
    EXPECT_EQ(logger.getLogLevel(), LogLevel::WARNING);
    ASSERT_TRUE(logger.enableFileLogging(true, logPath));
    logger.debug("LoggerTest", "per-beta detail");
    logger.info("LoggerTest", "stage timing");
    logger.error("LoggerTest", "stage failed");
    logger.enableFileLogging(false);

    const std::string contents = readLog();
    EXPECT_EQ(contents.find("per-beta detail"), std::string::npos);
    EXPECT_EQ(contents.find("stage timing"), std::string::npos);
    EXPECT_NE(contents.find("stage failed"), std::string::npos);
}

TEST_F(LoggerFixture, AppendsAcrossSessions) {
    Logger& logger = Logger::getInstance();
    ASSERT_TRUE(logger.enableFileLogging(true, logPath));
    logger.info("LoggerTest", "first run");
    logger.enableFileLogging(false);
    ASSERT_TRUE(logger.enableFileLogging(true, logPath));
    logger.info("LoggerTest", "second run");
    logger.enableFileLogging(false);

    const std::string contents = readLog();
    EXPECT_NE(contents.find("first run"), std::string::npos);
    EXPECT_NE(contents.find("second run"), std::string::npos);
}

TEST_F(LoggerFixture, UnopenableFileIsReported) {
    EXPECT_FALSE(Logger::getInstance().enableFileLogging(true, testDir + "/missing_dir/episweep.log"));
}
