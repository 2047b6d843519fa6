#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "../../src/core/logger/logger.hpp"

using namespace Spoor::Core;

TEST(LoggerTest, SetLevel) {
    Logger::set_level(LOG_NONE);
    EXPECT_EQ(Logger::level(), LOG_NONE);
    Logger::info("Test info message - hidden");
    Logger::set_level(LOG_ALL);
}

TEST(LoggerTest, LevelFiltering) {
    Logger::set_level(LOG_ERROR);
    Logger::info("This should not be printed");
    Logger::debug("Nor this");
    Logger::error("This should be printed");
    Logger::set_level(LOG_ALL);
}

TEST(LoggerTest, ParseLevel) {
    EXPECT_EQ(Logger::parse_level("quiet"), LOG_NONE);
    EXPECT_EQ(Logger::parse_level("error"), LOG_ERROR);
    EXPECT_EQ(Logger::parse_level("warn"), LOG_WARN | LOG_ERROR);
    EXPECT_EQ(Logger::parse_level("info"), LOG_ALL);
    EXPECT_TRUE(Logger::parse_level("debug") & LOG_DEBUG);
    EXPECT_FALSE(Logger::parse_level("info") & LOG_DEBUG);
    EXPECT_THROW(Logger::parse_level("verbose"), std::runtime_error);
}

TEST(LoggerTest, StressTest) {
    Logger::set_level(LOG_ALL);
    std::vector<std::thread> threads;
    for (int i = 0; i < 50; ++i) {
        threads.emplace_back([]() {
            for (int j = 0; j < 100; ++j) {
                Logger::info("Logging from thread "
                             + std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id())));
            }
        });
    }
    for (auto& t : threads)
        t.join();
}

TEST(LoggerTest, LargeMessage) {
    std::string large(1024 * 1024, 'A');
    Logger::info("Large message test: " + large.substr(0, 10) + "... [size: " + std::to_string(large.size()) + "]");
}
