#include "core/LoggingChannels.h"

#include <gtest/gtest.h>

using namespace GeneticCars;

class LoggingChannelsTest : public ::testing::Test {
protected:
    void TearDown() override { LoggingChannels::resetChannelLevels(); }
};

TEST_F(LoggingChannelsTest, ChannelNamesRoundTrip)
{
    for (const auto& info : LogChannelTable) {
        EXPECT_STREQ(toString(info.channel), info.name);
        EXPECT_EQ(logChannelFromName(info.name), info.channel);
    }
    EXPECT_FALSE(logChannelFromName("physics").has_value());
}

TEST_F(LoggingChannelsTest, ChannelsStartAtTheirDefaultLevels)
{
    EXPECT_EQ(LoggingChannels::get(LogChannel::Evolution)->level(), spdlog::level::info);
    EXPECT_EQ(LoggingChannels::get(LogChannel::Phenotype)->level(), spdlog::level::warn);
}

TEST_F(LoggingChannelsTest, ParsesLevelNamesCaseInsensitively)
{
    EXPECT_EQ(LoggingChannels::parseLevelString("TRACE"), spdlog::level::trace);
    EXPECT_EQ(LoggingChannels::parseLevelString("warning"), spdlog::level::warn);
    EXPECT_EQ(LoggingChannels::parseLevelString("err"), spdlog::level::err);
    EXPECT_EQ(LoggingChannels::parseLevelString("off"), spdlog::level::off);
    EXPECT_FALSE(LoggingChannels::parseLevelString("loud").has_value());
}

TEST_F(LoggingChannelsTest, ConfiguresNamedChannels)
{
    auto result = LoggingChannels::configureFromString("operators:trace, phenotype:debug");

    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(LoggingChannels::get(LogChannel::Operators)->level(), spdlog::level::trace);
    EXPECT_EQ(LoggingChannels::get(LogChannel::Phenotype)->level(), spdlog::level::debug);
    EXPECT_EQ(LoggingChannels::get(LogChannel::Cli)->level(), spdlog::level::info);
}

TEST_F(LoggingChannelsTest, LaterItemsOverrideWildcard)
{
    auto result = LoggingChannels::configureFromString("*:error,evolution:debug");

    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(LoggingChannels::get(LogChannel::Config)->level(), spdlog::level::err);
    EXPECT_EQ(LoggingChannels::get(LogChannel::Evolution)->level(), spdlog::level::debug);
}

TEST_F(LoggingChannelsTest, RejectedItemsAreReportedAndTheRestApplied)
{
    auto result =
        LoggingChannels::configureFromString("physics:debug,cli:loud,config,evolution:warn");

    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("unknown channel 'physics'"), std::string::npos);
    EXPECT_NE(result.errorValue().find("unknown level 'loud'"), std::string::npos);
    EXPECT_NE(result.errorValue().find("'config' (expected channel:level)"), std::string::npos);
    EXPECT_EQ(LoggingChannels::get(LogChannel::Evolution)->level(), spdlog::level::warn);
    EXPECT_EQ(LoggingChannels::get(LogChannel::Cli)->level(), spdlog::level::info);
}

TEST_F(LoggingChannelsTest, EmptySpecChangesNothing)
{
    EXPECT_TRUE(LoggingChannels::configureFromString("").isValue());
    EXPECT_EQ(LoggingChannels::get(LogChannel::Phenotype)->level(), spdlog::level::warn);
}
