#include <gtest/gtest.h>
#include <cmath>
#include "FixValidator.hpp"
#include "TestHelpers.hpp"

TEST(FixValidatorTest, AcceptsValidFix) {
    FixValidator validator;
    EXPECT_EQ(validator.validate(makeFix(SF_LAT, SF_LON, BASE_EPOCH_MS)), RejectReason::None);
    EXPECT_EQ(validator.getLastAcceptedTimestampMs(), BASE_EPOCH_MS);
}

TEST(FixValidatorTest, RejectsOutOfRangeCoordinates) {
    EXPECT_EQ(FixValidator::checkRange(makeFix(90.5, 0.0, BASE_EPOCH_MS), 50.0f),
              RejectReason::LatitudeOutOfRange);
    EXPECT_EQ(FixValidator::checkRange(makeFix(-91.0, 0.0, BASE_EPOCH_MS), 50.0f),
              RejectReason::LatitudeOutOfRange);
    EXPECT_EQ(FixValidator::checkRange(makeFix(0.0, 180.5, BASE_EPOCH_MS), 50.0f),
              RejectReason::LongitudeOutOfRange);
    EXPECT_EQ(FixValidator::checkRange(makeFix(NAN, 0.0, BASE_EPOCH_MS), 50.0f),
              RejectReason::LatitudeOutOfRange);
}

TEST(FixValidatorTest, BoundaryCoordinatesAreValid) {
    EXPECT_EQ(FixValidator::checkRange(makeFix(90.0, 180.0, BASE_EPOCH_MS), 50.0f), RejectReason::None);
    EXPECT_EQ(FixValidator::checkRange(makeFix(-90.0, -180.0, BASE_EPOCH_MS), 50.0f), RejectReason::None);
}

TEST(FixValidatorTest, RejectsBadAccuracy) {
    EXPECT_EQ(FixValidator::checkRange(makeFix(SF_LAT, SF_LON, BASE_EPOCH_MS, -1.0f), 50.0f),
              RejectReason::NegativeAccuracy);
    EXPECT_EQ(FixValidator::checkRange(makeFix(SF_LAT, SF_LON, BASE_EPOCH_MS, 60.0f), 50.0f),
              RejectReason::AccuracyTooLow);
    // 0 は上限なし
    EXPECT_EQ(FixValidator::checkRange(makeFix(SF_LAT, SF_LON, BASE_EPOCH_MS, 60.0f), 0.0f),
              RejectReason::None);
}

TEST(FixValidatorTest, RejectsNonPositiveTimestamp) {
    EXPECT_EQ(FixValidator::checkRange(makeFix(SF_LAT, SF_LON, 0), 50.0f), RejectReason::InvalidTimestamp);
    EXPECT_EQ(FixValidator::checkRange(makeFix(SF_LAT, SF_LON, -5), 50.0f), RejectReason::InvalidTimestamp);
}

TEST(FixValidatorTest, RejectsOutOfOrderAndDuplicates) {
    FixValidator validator;
    ASSERT_EQ(validator.validate(makeFix(SF_LAT, SF_LON, BASE_EPOCH_MS + 2000)), RejectReason::None);
    EXPECT_EQ(validator.validate(makeFix(SF_LAT, SF_LON, BASE_EPOCH_MS + 1000)), RejectReason::OutOfOrder);
    EXPECT_EQ(validator.validate(makeFix(SF_LAT, SF_LON, BASE_EPOCH_MS + 2000)), RejectReason::OutOfOrder);
    EXPECT_EQ(validator.validate(makeFix(SF_LAT, SF_LON, BASE_EPOCH_MS + 3000)), RejectReason::None);
    EXPECT_EQ(validator.getRejectedCount(), 2u);

    validator.reset();
    EXPECT_EQ(validator.getRejectedCount(), 0u);
    EXPECT_EQ(validator.validate(makeFix(SF_LAT, SF_LON, BASE_EPOCH_MS + 1000)), RejectReason::None);
}
