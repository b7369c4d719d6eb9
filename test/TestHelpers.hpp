#ifndef TEST_HELPERS_HPP
#define TEST_HELPERS_HPP

#include <stdlib.h>
#include <map>
#include <string>
#include <vector>
#include "LocationFix.hpp"
#include "RideRepository.hpp"
#include "Settings.hpp"

// 2025-01-15 00:00:00 UTC
const int64_t BASE_EPOCH_MS = 1736899200000LL;

const double SF_LAT = 37.7749;
const double SF_LON = -122.4194;

inline LocationFix makeFix(double lat, double lon, int64_t timestampMs, float accuracy = 5.0f) {
    LocationFix fix;
    fix.latitude = lat;
    fix.longitude = lon;
    fix.accuracyMeters = accuracy;
    fix.timestampMs = timestampMs;
    return fix;
}

inline LocationFix makeFixWithSpeed(double lat, double lon, int64_t timestampMs, float speedMps) {
    LocationFix fix = makeFix(lat, lon, timestampMs);
    fix.hasSpeed = true;
    fix.speedMps = speedMps;
    return fix;
}

inline LocationFix makeFixWithBearing(double lat, double lon, int64_t timestampMs, float bearingDeg) {
    LocationFix fix = makeFix(lat, lon, timestampMs);
    fix.hasBearing = true;
    fix.bearingDeg = bearingDeg;
    return fix;
}

class FakeSettings : public SettingsProvider {
public:
    bool autoPauseEnabled = true;
    int thresholdSeconds = 5;
    float maxAccuracy = 50.0f;
    double tolerance = 10.0;

    bool isAutoPauseEnabled() const override { return autoPauseEnabled; }
    int getAutoPauseThresholdSeconds() const override { return thresholdSeconds; }
    float getMaxAccuracyMeters() const override { return maxAccuracy; }
    double getRouteToleranceMeters() const override { return tolerance; }
};

// メモリ上の保存先
class FakeRepository : public RideRepository {
public:
    int64_t nextId = 1;
    bool failSave = false;
    std::map<int64_t, std::vector<LocationFix> > fixes;
    std::vector<RideSession> saved;
    std::vector<int64_t> deleted;

    int64_t createRide(int64_t) override { return nextId++; }
    bool appendFix(int64_t rideId, const LocationFix& fix) override {
        fixes[rideId].push_back(fix);
        return true;
    }
    std::vector<LocationFix> loadFixes(int64_t rideId) override { return fixes[rideId]; }
    bool saveRide(const RideSession& session) override {
        if (failSave) return false;
        saved.push_back(session);
        return true;
    }
    bool deleteRide(int64_t rideId) override {
        fixes.erase(rideId);
        deleted.push_back(rideId);
        return true;
    }
};

// テスト用の一時ディレクトリ (/tmp/ridetrack_XXXXXX)
inline std::string makeTempDir() {
    char templ[] = "/tmp/ridetrack_XXXXXX";
    char* dir = mkdtemp(templ);
    return dir != nullptr ? std::string(dir) : std::string();
}

#endif // TEST_HELPERS_HPP
