#include <gtest/gtest.h>
#include "util/logger.hpp"

using namespace agentflow;

TEST(LoggerTests, Smoke_InitInstallsDefaultLogger)
{
    util::init_logger();
    util::init_logger();
    ASSERT_NE(spdlog::default_logger(), nullptr);
    EXPECT_EQ(spdlog::default_logger()->name(), "agentflow");
}

TEST(LoggerTests, Levels_ParseKnownAndFallBack)
{
    EXPECT_EQ(util::parse_log_level("debug"), spdlog::level::debug);
    EXPECT_EQ(util::parse_log_level("warning"), spdlog::level::warn);
    EXPECT_EQ(util::parse_log_level("nonsense"), spdlog::level::info);

    util::set_log_level(spdlog::level::err);
    EXPECT_EQ(spdlog::get_level(), spdlog::level::err);
    util::set_log_level(spdlog::level::info);
}
