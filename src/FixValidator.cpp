#include "FixValidator.hpp"
#include "Logger.hpp"
#include <cmath>

static const char* TAG_VALID = "Validator";

const char* rejectReasonName(RejectReason reason) {
    switch (reason) {
        case RejectReason::None:                return "none";
        case RejectReason::LatitudeOutOfRange:  return "latitude out of range";
        case RejectReason::LongitudeOutOfRange: return "longitude out of range";
        case RejectReason::NegativeAccuracy:    return "negative accuracy";
        case RejectReason::AccuracyTooLow:      return "accuracy too low";
        case RejectReason::InvalidTimestamp:    return "invalid timestamp";
        case RejectReason::OutOfOrder:          return "out of order";
    }
    return "unknown";
}

FixValidator::FixValidator(float maxAccuracyMeters) :
    maxAccuracyMeters(maxAccuracyMeters),
    lastAcceptedTimestampMs(0),
    rejectedCount(0)
{}

RejectReason FixValidator::checkRange(const LocationFix& fix, float maxAccuracyMeters) {
    // NaN は比較が全て false になるので明示的に弾く
    if (std::isnan(fix.latitude) || fix.latitude < -90.0 || fix.latitude > 90.0)
        return RejectReason::LatitudeOutOfRange;
    if (std::isnan(fix.longitude) || fix.longitude < -180.0 || fix.longitude > 180.0)
        return RejectReason::LongitudeOutOfRange;
    if (std::isnan(fix.accuracyMeters) || fix.accuracyMeters < 0.0f)
        return RejectReason::NegativeAccuracy;
    if (maxAccuracyMeters > 0.0f && fix.accuracyMeters > maxAccuracyMeters)
        return RejectReason::AccuracyTooLow;
    if (fix.timestampMs <= 0)
        return RejectReason::InvalidTimestamp;
    return RejectReason::None;
}

RejectReason FixValidator::validate(const LocationFix& fix) {
    RejectReason reason = checkRange(fix, maxAccuracyMeters);
    if (reason == RejectReason::None && lastAcceptedTimestampMs > 0 &&
        fix.timestampMs <= lastAcceptedTimestampMs) {
        reason = RejectReason::OutOfOrder;
    }

    if (reason != RejectReason::None) {
        rejectedCount++;
        LOG_DEBUG(TAG_VALID, "Fix rejected (%s) t=%lld lat=%.6f lon=%.6f acc=%.1f",
                  rejectReasonName(reason), (long long)fix.timestampMs,
                  fix.latitude, fix.longitude, fix.accuracyMeters);
        return reason;
    }

    lastAcceptedTimestampMs = fix.timestampMs;
    return RejectReason::None;
}

void FixValidator::reset() {
    lastAcceptedTimestampMs = 0;
    rejectedCount = 0;
}

void FixValidator::setMaxAccuracy(float meters) {
    maxAccuracyMeters = meters;
}

unsigned long FixValidator::getRejectedCount() const {
    return rejectedCount;
}

int64_t FixValidator::getLastAcceptedTimestampMs() const {
    return lastAcceptedTimestampMs;
}
