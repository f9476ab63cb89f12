#include "utils/Logger.hpp"
#include <gtest/gtest.h>

using namespace riceair;

class LoggerTest : public ::testing::Test {
protected:
    void TearDown() override {
        Logger::getInstance().setLogLevel(LogLevel::INFO);
    }
};

TEST_F(LoggerTest, IsEnabledFollowsTheLogLevel) {
    Logger& logger = Logger::getInstance();

    logger.setLogLevel(LogLevel::WARNING);
    EXPECT_FALSE(logger.isEnabled(LogLevel::DEBUG));
    EXPECT_FALSE(logger.isEnabled(LogLevel::INFO));
    EXPECT_TRUE(logger.isEnabled(LogLevel::WARNING));
    EXPECT_TRUE(logger.isEnabled(LogLevel::ERROR));

    logger.setLogLevel(LogLevel::DEBUG);
    EXPECT_TRUE(logger.isEnabled(LogLevel::DEBUG));
    EXPECT_EQ(logger.getLogLevel(), LogLevel::DEBUG);
}
