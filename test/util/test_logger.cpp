#include <gtest/gtest.h>
#include <iostream>
#include <sstream>
#include "util/Expected.hpp"
#include "util/Logger.hpp"

using namespace hashflow;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override { saved = Logger::instance().level(); }
    void TearDown() override { Logger::instance().setLevel(saved); }

    LogLevel saved{LogLevel::Info};
};

TEST_F(LoggerTest, LevelGatesMessages) {
    auto& log = Logger::instance();

    log.setLevel(LogLevel::Warn);
    EXPECT_TRUE(log.enabled(LogLevel::Error));
    EXPECT_TRUE(log.enabled(LogLevel::Warn));
    EXPECT_FALSE(log.enabled(LogLevel::Info));
    EXPECT_FALSE(log.enabled(LogLevel::Debug));

    log.setLevel(LogLevel::Debug);
    EXPECT_TRUE(log.enabled(LogLevel::Debug));
    EXPECT_EQ(log.level(), LogLevel::Debug);
}

// Test: Every level goes to stderr so stdout holds only command output
TEST_F(LoggerTest, AllLevelsWriteToStderr) {
    auto& log = Logger::instance();
    log.setLevel(LogLevel::Debug);

    std::ostringstream out;
    std::ostringstream err;
    std::streambuf* oldOut = std::cout.rdbuf(out.rdbuf());
    std::streambuf* oldErr = std::cerr.rdbuf(err.rdbuf());
    log.debug("debug line");
    log.info("info line");
    log.error("error line");
    std::cout.rdbuf(oldOut);
    std::cerr.rdbuf(oldErr);

    EXPECT_TRUE(out.str().empty()) << out.str();
    EXPECT_NE(err.str().find("[debug] debug line"), std::string::npos);
    EXPECT_NE(err.str().find("[info ] info line"), std::string::npos);
    EXPECT_NE(err.str().find("[error] error line"), std::string::npos);
}

TEST_F(LoggerTest, ErrorCodeNames) {
    EXPECT_STREQ(errorCodeName(ErrorCode::OpenFailure), "open");
    EXPECT_STREQ(errorCodeName(ErrorCode::ReadFailure), "read");
    EXPECT_STREQ(errorCodeName(ErrorCode::Disconnected), "disconnected");
}
