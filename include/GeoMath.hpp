#ifndef GEO_MATH_HPP
#define GEO_MATH_HPP

#include "LocationFix.hpp"

class GeoMath {
public:
    // 球面上の大円距離 (ハバーサイン, メートル)
    static double haversine(double lat1, double lon1, double lat2, double lon2);
    static double haversine(const LocationFix& from, const LocationFix& to);
    static double haversine(const GeoPoint& from, const GeoPoint& to);

    // from から to への初期方位 [0, 360)
    static float initialBearing(double lat1, double lon1, double lat2, double lon2);

    // 任意の角度を [0, 360) に正規化
    static float normalizeBearing(float degrees);

    // 円周上での角度差 [0, 180]
    static float angularDifference(float a, float b);

    static double toRadians(double degrees);
    static double toDegrees(double radians);
};

#endif // GEO_MATH_HPP
