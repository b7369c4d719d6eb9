#ifndef LOCATION_FIX_HPP
#define LOCATION_FIX_HPP

#include <stdint.h>
#include <vector>

// 位置情報1件 (外部から約1秒ごとに届く。作成後は変更しない)
struct LocationFix {
    double latitude = 0.0;       // [-90, 90]
    double longitude = 0.0;      // [-180, 180]
    float accuracyMeters = 0.0f; // 精度半径 >= 0
    int64_t timestampMs = 0;     // > 0

    bool hasSpeed = false;       // GPSが速度を報告したか
    float speedMps = 0.0f;
    bool hasBearing = false;     // GPSが方位を報告したか
    float bearingDeg = 0.0f;     // [0, 360)
};

enum class SpeedSource {
    Gps,
    Derived,  // 前回Fixとの位置差から算出
    Unknown
};

struct SpeedSample {
    float speedKmh = 0.0f;
    int64_t timestampMs = 0;
    SpeedSource source = SpeedSource::Unknown;
    bool isStationary = true;
};

struct BearingEstimate {
    bool valid = false;
    float degrees = 0.0f;
    int64_t lastUpdatedMs = 0;
};

struct GeoPoint {
    double latitude = 0.0;
    double longitude = 0.0;

    GeoPoint() {}
    GeoPoint(double lat, double lon) : latitude(lat), longitude(lon) {}

    bool operator==(const GeoPoint& other) const {
        return latitude == other.latitude && longitude == other.longitude;
    }
    bool operator!=(const GeoPoint& other) const { return !(*this == other); }
};

// 点が1つ以下のときは valid=false (呼び出し側で固定ズームを使う)
struct MapBounds {
    bool valid = false;
    GeoPoint southWest;
    GeoPoint northEast;

    bool contains(const GeoPoint& p) const {
        return valid &&
               p.latitude >= southWest.latitude && p.latitude <= northEast.latitude &&
               p.longitude >= southWest.longitude && p.longitude <= northEast.longitude;
    }
};

struct RouteSimplificationResult {
    std::vector<GeoPoint> points;
    double toleranceMeters = 0.0;
};

#endif // LOCATION_FIX_HPP
