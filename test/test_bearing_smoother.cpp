#include <gtest/gtest.h>
#include "BearingSmoother.hpp"
#include "TestHelpers.hpp"

TEST(BearingSmootherTest, UsesGpsBearing) {
    BearingSmoother smoother;
    EXPECT_TRUE(smoother.update(makeFixWithBearing(SF_LAT, SF_LON, BASE_EPOCH_MS, 90.0f), nullptr));
    EXPECT_TRUE(smoother.getEmitted().valid);
    EXPECT_FLOAT_EQ(smoother.getEmitted().degrees, 90.0f);
}

TEST(BearingSmootherTest, DerivesBearingFromMovement) {
    BearingSmoother smoother;
    LocationFix prev = makeFix(SF_LAT, SF_LON, BASE_EPOCH_MS);
    LocationFix cur = makeFix(SF_LAT + 0.0001, SF_LON, BASE_EPOCH_MS + 1000);
    EXPECT_TRUE(smoother.update(cur, &prev));
    EXPECT_NEAR(smoother.getEmitted().degrees, 0.0f, 0.01f);
}

TEST(BearingSmootherTest, KeepsPreviousValueWhenNotMoving) {
    BearingSmoother smoother;
    smoother.update(makeFixWithBearing(SF_LAT, SF_LON, BASE_EPOCH_MS, 45.0f), nullptr);
    LocationFix prev = makeFix(SF_LAT, SF_LON, BASE_EPOCH_MS);
    LocationFix same = makeFix(SF_LAT, SF_LON, BASE_EPOCH_MS + 1000);
    EXPECT_FALSE(smoother.update(same, &prev));
    EXPECT_TRUE(smoother.getEmitted().valid);
    EXPECT_FLOAT_EQ(smoother.getEmitted().degrees, 45.0f);
}

TEST(BearingSmootherTest, SmallChangesAreDebounced) {
    BearingSmoother smoother;
    smoother.update(makeFixWithBearing(SF_LAT, SF_LON, BASE_EPOCH_MS, 100.0f), nullptr);
    EXPECT_FALSE(smoother.update(makeFixWithBearing(SF_LAT, SF_LON, BASE_EPOCH_MS + 1000, 104.0f), nullptr));
    EXPECT_FLOAT_EQ(smoother.getEmitted().degrees, 100.0f);
    EXPECT_FLOAT_EQ(smoother.getEstimate().degrees, 104.0f);

    EXPECT_TRUE(smoother.update(makeFixWithBearing(SF_LAT, SF_LON, BASE_EPOCH_MS + 2000, 106.0f), nullptr));
    EXPECT_FLOAT_EQ(smoother.getEmitted().degrees, 106.0f);
}

TEST(BearingSmootherTest, DebounceMeasuresAcrossNorth) {
    BearingSmoother smoother;
    smoother.update(makeFixWithBearing(SF_LAT, SF_LON, BASE_EPOCH_MS, 358.0f), nullptr);
    // 358 -> 2 は 4 度の変化
    EXPECT_FALSE(smoother.update(makeFixWithBearing(SF_LAT, SF_LON, BASE_EPOCH_MS + 1000, 2.0f), nullptr));
    EXPECT_FLOAT_EQ(smoother.getEmitted().degrees, 358.0f);
}

TEST(BearingSmootherTest, AcceptsLargeJumps) {
    BearingSmoother smoother;
    smoother.update(makeFixWithBearing(SF_LAT, SF_LON, BASE_EPOCH_MS, 10.0f), nullptr);
    EXPECT_TRUE(smoother.update(makeFixWithBearing(SF_LAT, SF_LON, BASE_EPOCH_MS + 1000, 200.0f), nullptr));
    EXPECT_FLOAT_EQ(smoother.getEmitted().degrees, 200.0f);
}

TEST(BearingSmootherTest, ExpiresAfterStalePeriod) {
    BearingSmoother smoother;
    smoother.update(makeFixWithBearing(SF_LAT, SF_LON, BASE_EPOCH_MS, 90.0f), nullptr);

    EXPECT_FALSE(smoother.expire(BASE_EPOCH_MS + 44999));
    EXPECT_TRUE(smoother.getEmitted().valid);

    EXPECT_TRUE(smoother.expire(BASE_EPOCH_MS + 45000));
    EXPECT_FALSE(smoother.getEmitted().valid);
    EXPECT_FALSE(smoother.getEstimate().valid);
    EXPECT_FALSE(smoother.expire(BASE_EPOCH_MS + 90000));
}
