#include "SpeedEstimator.hpp"
#include "GeoMath.hpp"
#include "config.hpp"

SpeedSample SpeedEstimator::estimate(const LocationFix& current, const LocationFix* previous) {
    SpeedSample sample;
    sample.timestampMs = current.timestampMs;

    double speedMs = 0.0;
    if (current.hasSpeed && current.speedMps > 0.0f) {
        speedMs = current.speedMps;
        sample.source = SpeedSource::Gps;
    } else if (previous != nullptr) {
        double elapsedSeconds = (double)(current.timestampMs - previous->timestampMs) / 1000.0;
        if (elapsedSeconds > 0.0) {
            speedMs = GeoMath::haversine(*previous, current) / elapsedSeconds;
            sample.source = SpeedSource::Derived;
        } else {
            sample.source = SpeedSource::Unknown;
        }
    } else {
        sample.source = SpeedSource::Unknown;
    }

    // 異常値補正
    const double maxSpeedMs = MAX_SPEED_KMH / MPS_TO_KMH;
    if (speedMs < 0.0) speedMs = 0.0;
    if (speedMs > maxSpeedMs) speedMs = maxSpeedMs;

    sample.isStationary = speedMs < STATIONARY_SPEED_KMH / MPS_TO_KMH;
    sample.speedKmh = sample.isStationary ? 0.0f : (float)(speedMs * MPS_TO_KMH);
    return sample;
}
