#include <gtest/gtest.h>
#include "common/logger.h"
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

namespace aep {
namespace test {

class LoggerTest : public testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().enableConsoleOutput(false);
        path_ = testing::TempDir() + "aep_logger_test.log";
        std::remove(path_.c_str());
    }

    void TearDown() override {
        Logger::getInstance().closeLogFile();
        Logger::getInstance().setLevel(LogLevel::INFO);
        std::remove(path_.c_str());
    }

    std::string readLog() const {
        std::ifstream in(path_);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    std::string path_;
};

TEST_F(LoggerTest, LevelThresholdDropsLowerMessages) {
    auto& logger = Logger::getInstance();
    ASSERT_TRUE(logger.setLogFile(path_));
    logger.setLevel(LogLevel::WARNING);
    EXPECT_EQ(logger.getLevel(), LogLevel::WARNING);

    logger.debug("hidden debug");
    logger.log("hidden info");
    logger.warning("visible warning");
    logger.error("visible error");
    logger.closeLogFile();

    std::string text = readLog();
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("[WARNING] visible warning"), std::string::npos);
    EXPECT_NE(text.find("[ERROR] visible error"), std::string::npos);
}

TEST_F(LoggerTest, ClosedFileReceivesNothing) {
    auto& logger = Logger::getInstance();
    ASSERT_TRUE(logger.setLogFile(path_));
    logger.log("before close");
    logger.closeLogFile();
    logger.log("after close");

    std::string text = readLog();
    EXPECT_NE(text.find("before close"), std::string::npos);
    EXPECT_EQ(text.find("after close"), std::string::npos);
}

TEST_F(LoggerTest, UnopenableFileIsReported) {
    EXPECT_FALSE(Logger::getInstance().setLogFile("/nonexistent_directory/aep.log"));
}

TEST_F(LoggerTest, LevelStrings) {
    EXPECT_EQ(Logger::getLevelString(LogLevel::DEBUG), "DEBUG");
    EXPECT_EQ(Logger::getLevelString(LogLevel::ERROR), "ERROR");
}

} // namespace test
} // namespace aep
