#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>
#include <vector>
#include "../../src/core/logger/logger.hpp"

using namespace OpenCrawl::Core;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_ = Logger::level();
    }
    void TearDown() override {
        Logger::set_level(saved_);
    }

    int saved_ = LOG_ALL;
};

TEST_F(LoggerTest, ParseLevelIncludesMoreSevere) {
    EXPECT_EQ(parse_log_level("debug"), LOG_ALL);
    EXPECT_EQ(parse_log_level("INFO"), LOG_INFO | LOG_SUCCESS | LOG_WARN | LOG_ERROR);
    EXPECT_EQ(parse_log_level("warn"), LOG_WARN | LOG_ERROR);
    EXPECT_EQ(parse_log_level("error"), LOG_ERROR);
    EXPECT_EQ(parse_log_level("none"), LOG_NONE);
    EXPECT_THROW(parse_log_level("loud"), std::invalid_argument);
}

TEST_F(LoggerTest, CapturesOnlyEnabledLevels) {
    Logger::set_level(LOG_ERROR);
    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    Logger::info("hidden info");
    Logger::error("visible error");
    std::string out = testing::internal::GetCapturedStdout();
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_EQ(out.find("hidden info"), std::string::npos);
    EXPECT_NE(err.find("[ERROR]"), std::string::npos);
    EXPECT_NE(err.find("visible error"), std::string::npos);
}

TEST_F(LoggerTest, InfoGoesToStdout) {
    Logger::set_level(LOG_ALL);
    testing::internal::CaptureStdout();
    Logger::info("fetch line");
    std::string out = testing::internal::GetCapturedStdout();
    EXPECT_NE(out.find("[INFO]"), std::string::npos);
    EXPECT_NE(out.find("fetch line"), std::string::npos);
}

TEST_F(LoggerTest, ConcurrentWriters) {
    Logger::set_level(LOG_NONE);
    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([]() {
            for (int j = 0; j < 200; ++j)
                Logger::info("message " + std::to_string(j));
        });
    }
    for (auto& t : threads)
        t.join();
    EXPECT_EQ(Logger::level(), LOG_NONE);
}
