#include <core/util/logger.h>
#include <gtest/gtest.h>

using tailkit::Logger;

TEST(LoggerTest, ParseLevel) {
    EXPECT_EQ(Logger::ParseLevel("debug"), Logger::Level::debug);
    EXPECT_EQ(Logger::ParseLevel("info"), Logger::Level::info);
    EXPECT_EQ(Logger::ParseLevel("warning"), Logger::Level::warn);
    EXPECT_EQ(Logger::ParseLevel("warn"), Logger::Level::warn);
    EXPECT_EQ(Logger::ParseLevel("error"), Logger::Level::err);
}

TEST(LoggerTest, UnknownLevelIsInfo) {
    EXPECT_EQ(Logger::ParseLevel(""), Logger::Level::info);
    EXPECT_EQ(Logger::ParseLevel("trace"), Logger::Level::info);
    EXPECT_EQ(Logger::ParseLevel("DEBUG"), Logger::Level::info);
}
