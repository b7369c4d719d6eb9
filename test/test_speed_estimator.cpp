#include <gtest/gtest.h>
#include "SpeedEstimator.hpp"
#include "TestHelpers.hpp"

// 大円距離で 100 m 北
static const double LAT_100M = 100.0 / 111194.93;

TEST(SpeedEstimatorTest, UsesGpsSpeedWhenReported) {
    LocationFix fix = makeFixWithSpeed(SF_LAT, SF_LON, BASE_EPOCH_MS, 10.0f);
    SpeedSample sample = SpeedEstimator::estimate(fix, nullptr);
    EXPECT_NEAR(sample.speedKmh, 36.0f, 0.001f);
    EXPECT_EQ(sample.source, SpeedSource::Gps);
    EXPECT_FALSE(sample.isStationary);
    EXPECT_EQ(sample.timestampMs, BASE_EPOCH_MS);
}

TEST(SpeedEstimatorTest, DerivesSpeedFromPreviousFix) {
    LocationFix prev = makeFix(SF_LAT, SF_LON, BASE_EPOCH_MS);
    LocationFix cur = makeFix(SF_LAT + LAT_100M, SF_LON, BASE_EPOCH_MS + 10000);
    SpeedSample sample = SpeedEstimator::estimate(cur, &prev);
    EXPECT_NEAR(sample.speedKmh, 36.0f, 0.05f);
    EXPECT_EQ(sample.source, SpeedSource::Derived);
}

TEST(SpeedEstimatorTest, ZeroGpsSpeedFallsBackToDerived) {
    LocationFix prev = makeFix(SF_LAT, SF_LON, BASE_EPOCH_MS);
    LocationFix cur = makeFixWithSpeed(SF_LAT + LAT_100M, SF_LON, BASE_EPOCH_MS + 10000, 0.0f);
    SpeedSample sample = SpeedEstimator::estimate(cur, &prev);
    EXPECT_EQ(sample.source, SpeedSource::Derived);
    EXPECT_NEAR(sample.speedKmh, 36.0f, 0.05f);
}

TEST(SpeedEstimatorTest, ZeroElapsedTimeIsUnknown) {
    LocationFix prev = makeFix(SF_LAT, SF_LON, BASE_EPOCH_MS);
    LocationFix cur = makeFix(SF_LAT + LAT_100M, SF_LON, BASE_EPOCH_MS);
    SpeedSample sample = SpeedEstimator::estimate(cur, &prev);
    EXPECT_FLOAT_EQ(sample.speedKmh, 0.0f);
    EXPECT_EQ(sample.source, SpeedSource::Unknown);
    EXPECT_TRUE(sample.isStationary);
}

TEST(SpeedEstimatorTest, NoPreviousFixIsUnknown) {
    SpeedSample sample = SpeedEstimator::estimate(makeFix(SF_LAT, SF_LON, BASE_EPOCH_MS), nullptr);
    EXPECT_FLOAT_EQ(sample.speedKmh, 0.0f);
    EXPECT_EQ(sample.source, SpeedSource::Unknown);
    EXPECT_TRUE(sample.isStationary);
}

TEST(SpeedEstimatorTest, JitterBelowOneKmhIsStationary) {
    // 0.2 m/s = 0.72 km/h
    SpeedSample sample = SpeedEstimator::estimate(makeFixWithSpeed(SF_LAT, SF_LON, BASE_EPOCH_MS, 0.2f), nullptr);
    EXPECT_TRUE(sample.isStationary);
    EXPECT_FLOAT_EQ(sample.speedKmh, 0.0f);
}

TEST(SpeedEstimatorTest, ClampsUnrealisticSpeed) {
    SpeedSample sample = SpeedEstimator::estimate(makeFixWithSpeed(SF_LAT, SF_LON, BASE_EPOCH_MS, 50.0f), nullptr);
    EXPECT_NEAR(sample.speedKmh, 100.0f, 0.001f);
    EXPECT_FALSE(sample.isStationary);
}
