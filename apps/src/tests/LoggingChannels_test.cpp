#include "core/LoggingChannels.h"

#include <gtest/gtest.h>

using namespace EvoScope;

TEST(LoggingChannelsTest, ParsesLevelNamesCaseInsensitively)
{
    EXPECT_EQ(LoggingChannels::parseLevelString("TRACE"), spdlog::level::trace);
    EXPECT_EQ(LoggingChannels::parseLevelString("warning"), spdlog::level::warn);
    EXPECT_EQ(LoggingChannels::parseLevelString("err"), spdlog::level::err);
    EXPECT_EQ(LoggingChannels::parseLevelString("off"), spdlog::level::off);
    EXPECT_EQ(LoggingChannels::parseLevelString("loud"), spdlog::level::info);
}

TEST(LoggingChannelsTest, ChannelLoggersAreCreatedOnFirstUse)
{
    const auto layout = LoggingChannels::get(LogChannel::Layout);
    ASSERT_NE(layout, nullptr);
    EXPECT_EQ(layout->name(), "layout");
}

TEST(LoggingChannelsTest, SpecStringSetsPerChannelLevels)
{
    LoggingChannels::configureFromString("*:warn, surface:trace");

    EXPECT_EQ(LoggingChannels::get(LogChannel::Surface)->level(), spdlog::level::trace);
    EXPECT_EQ(LoggingChannels::get(LogChannel::Lineage)->level(), spdlog::level::warn);
    EXPECT_EQ(LoggingChannels::get(LogChannel::Frontier)->level(), spdlog::level::warn);

    LoggingChannels::configureFromString("*:info");
    EXPECT_EQ(LoggingChannels::get(LogChannel::Surface)->level(), spdlog::level::info);
}

TEST(LoggingChannelsTest, MalformedSpecEntriesAreIgnored)
{
    LoggingChannels::configureFromString("*:info");
    LoggingChannels::configureFromString("nocolon,unknown:debug");

    EXPECT_EQ(LoggingChannels::get(LogChannel::Config)->level(), spdlog::level::info);
}
