// tests/test_console_logger.cpp
#include <iostream>
#include <sstream>
#include <string>

#include "gtest/gtest.h"

#include "../src/logging/ConsoleLogger.hpp"

class ConsoleLoggerTest : public ::testing::Test {
protected:
    std::ostringstream out;
    std::ostringstream err;
    std::streambuf* oldCout = nullptr;
    std::streambuf* oldCerr = nullptr;

    void SetUp() override {
        oldCout = std::cout.rdbuf(out.rdbuf());
        oldCerr = std::cerr.rdbuf(err.rdbuf());
    }

    void TearDown() override {
        std::cout.rdbuf(oldCout);
        std::cerr.rdbuf(oldCerr);
    }
};

TEST_F(ConsoleLoggerTest, FiltersBelowConfiguredLevel) {
    ConsoleLogger logger(LogUtils::LogLevel::WARN);
    logger.debug("debug line");
    logger.info("info line");
    logger.warn("warn line");

    EXPECT_EQ(out.str().find("debug line"), std::string::npos);
    EXPECT_EQ(out.str().find("info line"), std::string::npos);
    EXPECT_NE(out.str().find("[Warning] warn line"), std::string::npos);
}

TEST_F(ConsoleLoggerTest, ErrorsGoToStderr) {
    ConsoleLogger logger(LogUtils::LogLevel::DEBUG);
    logger.error("backend down");

    EXPECT_NE(err.str().find("[Error] backend down"), std::string::npos);
    EXPECT_EQ(out.str().find("backend down"), std::string::npos);
}

TEST_F(ConsoleLoggerTest, SetupIsAlwaysPrinted) {
    ConsoleLogger logger(LogUtils::LogLevel::CERROR);
    logger.setup("listening on 8080");

    EXPECT_NE(out.str().find("[Setup] listening on 8080"), std::string::npos);
}

TEST_F(ConsoleLoggerTest, LinesCarryUtcTimestamp) {
    ConsoleLogger logger(LogUtils::LogLevel::INFO);
    logger.info("hello");

    std::string line = out.str();
    // 2024-01-01T00:00:00.000Z
    ASSERT_GE(line.size(), 24u);
    EXPECT_EQ(line[4], '-');
    EXPECT_EQ(line[10], 'T');
    EXPECT_EQ(line[23], 'Z');
}

TEST_F(ConsoleLoggerTest, LevelCanBeChanged) {
    ConsoleLogger logger(LogUtils::LogLevel::CERROR);
    EXPECT_EQ(logger.getLogLevel(), LogUtils::LogLevel::CERROR);

    logger.setLogLevel(LogUtils::LogLevel::DEBUG);
    logger.debug("now visible");

    EXPECT_EQ(logger.getLogLevel(), LogUtils::LogLevel::DEBUG);
    EXPECT_NE(out.str().find("now visible"), std::string::npos);
}
