#include <gtest/gtest.h>
#include "gnmireverse/common/logger.h"
#include "gnmireverse/core/error.h"

using gnmireverse::common::Logger;

TEST(LoggerTest, ParsesLevelNames) {
    EXPECT_EQ(Logger::ParseLevel("trace"), spdlog::level::trace);
    EXPECT_EQ(Logger::ParseLevel("debug"), spdlog::level::debug);
    EXPECT_EQ(Logger::ParseLevel("info"), spdlog::level::info);
    EXPECT_EQ(Logger::ParseLevel("warning"), spdlog::level::warn);
    EXPECT_EQ(Logger::ParseLevel("warn"), spdlog::level::warn);
    EXPECT_EQ(Logger::ParseLevel("error"), spdlog::level::err);
    EXPECT_EQ(Logger::ParseLevel("err"), spdlog::level::err);
    EXPECT_EQ(Logger::ParseLevel("critical"), spdlog::level::critical);
}

TEST(LoggerTest, OffOnlyWhenAskedFor) {
    EXPECT_EQ(Logger::ParseLevel("off"), spdlog::level::off);
    EXPECT_THROW(Logger::ParseLevel("verbose"), gnmireverse::core::ConfigError);
    EXPECT_THROW(Logger::ParseLevel(""), gnmireverse::core::ConfigError);
    EXPECT_THROW(Logger::ParseLevel("INFO"), gnmireverse::core::ConfigError);
}

TEST(LoggerTest, InitIsRepeatable) {
    Logger::Init();
    Logger::Init();
    EXPECT_NE(spdlog::get("console"), nullptr);
    EXPECT_EQ(spdlog::get_level(), spdlog::level::info);
}
