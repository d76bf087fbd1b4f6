#include "core/LoggingChannels.h"
#include <gtest/gtest.h>

using namespace ArcticLink;

TEST(LoggingChannelsTest, RedactKeepsOnlyAShortPrefix)
{
    EXPECT_EQ(LoggingChannels::redact("eyJhbGciOiJIUzI1NiJ9.payload"), "eyJh****");
    EXPECT_EQ(LoggingChannels::redact("short"), "****");
    EXPECT_EQ(LoggingChannels::redact(""), "<none>");
}

TEST(LoggingChannelsTest, EveryChannelHasALogger)
{
    LoggingChannels::initialize(spdlog::level::off, spdlog::level::off, "test", true);

    for (auto channel : { LogChannel::Discovery,
                          LogChannel::Network,
                          LogChannel::Pairing,
                          LogChannel::Session,
                          LogChannel::State,
                          LogChannel::Storage }) {
        auto logger = LoggingChannels::get(channel);
        ASSERT_NE(logger, nullptr);
        EXPECT_EQ(logger->name(), toString(channel));
    }
}

TEST(LoggingChannelsTest, ChannelSpecAdjustsLevels)
{
    LoggingChannels::initialize(spdlog::level::off, spdlog::level::off, "test", true);

    LoggingChannels::configureFromString("*:warn,network:trace");

    EXPECT_EQ(LoggingChannels::get(LogChannel::Network)->level(), spdlog::level::trace);
    EXPECT_EQ(LoggingChannels::get(LogChannel::Pairing)->level(), spdlog::level::warn);
}
