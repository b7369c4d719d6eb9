#include "GeoMath.hpp"
#include "config.hpp"
#include <math.h>

double GeoMath::toRadians(double degrees) {
    return degrees * M_PI / 180.0;
}

double GeoMath::toDegrees(double radians) {
    return radians * 180.0 / M_PI;
}

double GeoMath::haversine(double lat1, double lon1, double lat2, double lon2) {
    double dlat = toRadians(lat2 - lat1);
    double dlon = toRadians(lon2 - lon1);
    double a = sin(dlat / 2) * sin(dlat / 2) +
               cos(toRadians(lat1)) * cos(toRadians(lat2)) * sin(dlon / 2) * sin(dlon / 2);
    return EARTH_RADIUS_M * 2 * atan2(sqrt(a), sqrt(1 - a));
}

double GeoMath::haversine(const LocationFix& from, const LocationFix& to) {
    return haversine(from.latitude, from.longitude, to.latitude, to.longitude);
}

double GeoMath::haversine(const GeoPoint& from, const GeoPoint& to) {
    return haversine(from.latitude, from.longitude, to.latitude, to.longitude);
}

float GeoMath::initialBearing(double lat1, double lon1, double lat2, double lon2) {
    double phi1 = toRadians(lat1);
    double phi2 = toRadians(lat2);
    double dlon = toRadians(lon2 - lon1);
    double y = sin(dlon) * cos(phi2);
    double x = cos(phi1) * sin(phi2) - sin(phi1) * cos(phi2) * cos(dlon);
    return normalizeBearing((float)toDegrees(atan2(y, x)));
}

float GeoMath::normalizeBearing(float degrees) {
    float d = fmodf(degrees, 360.0f);
    if (d < 0.0f) d += 360.0f;
    // fmodf(-1e-7, 360) + 360 が 360.0f に丸まる場合
    if (d >= 360.0f) d = 0.0f;
    return d;
}

float GeoMath::angularDifference(float a, float b) {
    float diff = fabsf(normalizeBearing(a) - normalizeBearing(b));
    if (diff > 180.0f) diff = 360.0f - diff;
    return diff;
}
