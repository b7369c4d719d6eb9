#include "BearingSmoother.hpp"
#include "GeoMath.hpp"
#include "Logger.hpp"

static const char* TAG_BEARING = "Bearing";

BearingSmoother::BearingSmoother(float debounceDeg, int64_t staleMs) :
    debounceDeg(debounceDeg),
    staleMs(staleMs)
{}

bool BearingSmoother::update(const LocationFix& fix, const LocationFix* previous) {
    float degrees = 0.0f;
    bool qualifying = false;

    if (fix.hasBearing) {
        degrees = GeoMath::normalizeBearing(fix.bearingDeg);
        qualifying = true;
    } else if (previous != nullptr && GeoMath::haversine(*previous, fix) >= BEARING_MIN_MOVE_M) {
        degrees = GeoMath::initialBearing(previous->latitude, previous->longitude,
                                          fix.latitude, fix.longitude);
        qualifying = true;
    }

    if (!qualifying) {
        return false; // 前回値を保持
    }

    estimate.valid = true;
    estimate.degrees = degrees;
    estimate.lastUpdatedMs = fix.timestampMs;

    // 180度を超える急変もそのまま受け入れる (デバウンスは適用)
    if (!emitted.valid || GeoMath::angularDifference(degrees, emitted.degrees) > debounceDeg) {
        emitted = estimate;
        return true;
    }
    emitted.lastUpdatedMs = fix.timestampMs; // 値は据え置き、鮮度だけ更新
    return false;
}

bool BearingSmoother::expire(int64_t nowMs) {
    if (!estimate.valid || nowMs - estimate.lastUpdatedMs < staleMs) {
        return false;
    }
    LOG_DEBUG(TAG_BEARING, "Bearing stale for %lld ms. Falling back to north-up.",
              (long long)(nowMs - estimate.lastUpdatedMs));
    bool wasEmitted = emitted.valid;
    estimate = BearingEstimate();
    emitted = BearingEstimate();
    return wasEmitted;
}

void BearingSmoother::reset() {
    estimate = BearingEstimate();
    emitted = BearingEstimate();
}

const BearingEstimate& BearingSmoother::getEstimate() const {
    return estimate;
}

const BearingEstimate& BearingSmoother::getEmitted() const {
    return emitted;
}
