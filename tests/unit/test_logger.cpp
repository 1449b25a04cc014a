#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "../../src/core/logger/logger.hpp"

using namespace Umbra::Core;

TEST(LoggerTest, SetLevel) {
    Logger::set_level(LOG_NONE);
    Logger::info("Test info message - hidden");
    EXPECT_EQ(Logger::level(), LOG_NONE);
    Logger::set_level(LOG_DEFAULT);
}

TEST(LoggerTest, ParseLevelNames) {
    EXPECT_EQ(Logger::parse_level("none"), LOG_NONE);
    EXPECT_EQ(Logger::parse_level("debug"), LOG_ALL);
    EXPECT_EQ(Logger::parse_level("all"), LOG_ALL);
    EXPECT_EQ(Logger::parse_level("info"), LOG_DEFAULT);
    EXPECT_TRUE(Logger::parse_level("error") & LOG_ERROR);
    EXPECT_FALSE(Logger::parse_level("error") & LOG_INFO);
    EXPECT_THROW(Logger::parse_level("loud"), std::runtime_error);
}

TEST(LoggerTest, RedactsSensitiveTokens) {
    std::string onion = std::string(56, 'q') + ".onion";
    std::string out   = Logger::redact("fetch http://" + onion + "/ via 10.0.0.1 on aa:bb:cc:dd:ee:ff");

    EXPECT_EQ(out.find(onion), std::string::npos);
    EXPECT_EQ(out.find("10.0.0.1"), std::string::npos);
    EXPECT_EQ(out.find("aa:bb:cc"), std::string::npos);
    EXPECT_NE(out.find("[REDACTED]"), std::string::npos);
    EXPECT_EQ(Logger::redact("nothing to hide"), "nothing to hide");
}

TEST(LoggerTest, StressTest) {
    Logger::set_level(LOG_NONE);
    std::vector<std::thread> threads;
    for (int i = 0; i < 20; ++i) {
        threads.emplace_back([]() {
            for (int j = 0; j < 100; ++j)
                Logger::info("Logging from worker");
        });
    }
    for (auto& t : threads)
        t.join();
    Logger::set_level(LOG_DEFAULT);
}
