#include <gtest/gtest.h>
#include "Utils.hpp"
#include "Logger.hpp"
#include "TestHelpers.hpp"

TEST(UtilsTest, FormatElapsed) {
    EXPECT_EQ(Utils::formatElapsed(0), "0:00");
    EXPECT_EQ(Utils::formatElapsed(5000), "0:05");
    EXPECT_EQ(Utils::formatElapsed(5999), "0:05");
    EXPECT_EQ(Utils::formatElapsed(65000), "1:05");
    EXPECT_EQ(Utils::formatElapsed(3599000), "59:59");
    EXPECT_EQ(Utils::formatElapsed(3661000), "1:01:01");
    EXPECT_EQ(Utils::formatElapsed(-1000), "0:00");
}

TEST(UtilsTest, RideNameUsesUtcDate) {
    EXPECT_EQ(Utils::rideName(BASE_EPOCH_MS), "Ride on Jan 15, 2025");
    EXPECT_EQ(Utils::rideName(BASE_EPOCH_MS + 86399999LL), "Ride on Jan 15, 2025");
}

TEST(UtilsTest, UnitConversions) {
    EXPECT_FLOAT_EQ(Utils::kmhToMph(10.0f), 6.21f);
    EXPECT_FLOAT_EQ(Utils::kmToMiles(42.195f), 26.22f);
    EXPECT_FLOAT_EQ(Utils::kmhToMph(0.0f), 0.0f);
}

TEST(UtilsTest, FormatSpeedAndDistance) {
    EXPECT_EQ(Utils::formatSpeed(25.5f, true), "25.5 km/h");
    EXPECT_EQ(Utils::formatSpeed(15.84f, false), "15.8 mph");
    EXPECT_EQ(Utils::formatDistance(10.5f, true), "10.50 km");
    EXPECT_EQ(Utils::formatDistance(6.52f, false), "6.52 mi");
}

TEST(LoggerTest, ParseLevel) {
    EXPECT_EQ(Logger::parseLevel("error", LOG_LEVEL_INFO), LOG_LEVEL_ERROR);
    EXPECT_EQ(Logger::parseLevel("WARN", LOG_LEVEL_INFO), LOG_LEVEL_WARN);
    EXPECT_EQ(Logger::parseLevel("debug", LOG_LEVEL_INFO), LOG_LEVEL_DEBUG);
    EXPECT_EQ(Logger::parseLevel("verbose", LOG_LEVEL_WARN), LOG_LEVEL_WARN);
    EXPECT_EQ(Logger::parseLevel(nullptr, LOG_LEVEL_INFO), LOG_LEVEL_INFO);
}

TEST(LoggerTest, LevelFiltering) {
    Logger::init(stderr, LOG_LEVEL_WARN);
    EXPECT_TRUE(Logger::isEnabled(LOG_LEVEL_ERROR));
    EXPECT_TRUE(Logger::isEnabled(LOG_LEVEL_WARN));
    EXPECT_FALSE(Logger::isEnabled(LOG_LEVEL_INFO));

    // 出力先なしなら全て無効
    Logger::init(nullptr, LOG_LEVEL_DEBUG);
    EXPECT_FALSE(Logger::isEnabled(LOG_LEVEL_ERROR));
    Logger::init(stderr, LOG_LEVEL_INFO);
}
