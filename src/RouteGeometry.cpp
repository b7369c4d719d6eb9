#include "RouteGeometry.hpp"
#include <math.h>
#include <utility>

double RouteGeometry::segmentDistance(const GeoPoint& p, const GeoPoint& a, const GeoPoint& b) {
    // x = 経度, y = 緯度 として平面で計算
    double dx = b.longitude - a.longitude;
    double dy = b.latitude - a.latitude;
    double lengthSq = dx * dx + dy * dy;
    if (lengthSq == 0.0) {
        double ex = p.longitude - a.longitude;
        double ey = p.latitude - a.latitude;
        return sqrt(ex * ex + ey * ey);
    }
    double t = ((p.longitude - a.longitude) * dx + (p.latitude - a.latitude) * dy) / lengthSq;
    if (t < 0.0) t = 0.0;
    if (t > 1.0) t = 1.0;
    double projX = a.longitude + t * dx;
    double projY = a.latitude + t * dy;
    double ex = p.longitude - projX;
    double ey = p.latitude - projY;
    return sqrt(ex * ex + ey * ey);
}

std::vector<GeoPoint> RouteGeometry::simplify(const std::vector<GeoPoint>& points, double toleranceMeters) {
    if (points.size() <= 2) {
        return points;
    }

    const double toleranceDeg = (toleranceMeters > 0.0 ? toleranceMeters : 0.0) / METERS_PER_DEGREE;
    std::vector<bool> keep(points.size(), false);
    keep.front() = true;
    keep.back() = true;

    // 再帰の代わりに区間スタックで処理 (長いルートでもスタック溢れしない)
    std::vector<std::pair<size_t, size_t> > ranges;
    ranges.push_back(std::make_pair((size_t)0, points.size() - 1));

    while (!ranges.empty()) {
        std::pair<size_t, size_t> range = ranges.back();
        ranges.pop_back();
        size_t first = range.first;
        size_t last = range.second;
        if (last <= first + 1) continue;

        double maxDistance = -1.0;
        size_t index = first;
        for (size_t i = first + 1; i < last; i++) {
            double d = segmentDistance(points[i], points[first], points[last]);
            if (d > maxDistance) {
                maxDistance = d;
                index = i;
            }
        }

        if (maxDistance > toleranceDeg) {
            keep[index] = true;
            ranges.push_back(std::make_pair(first, index));
            ranges.push_back(std::make_pair(index, last));
        }
    }

    std::vector<GeoPoint> simplified;
    for (size_t i = 0; i < points.size(); i++) {
        if (keep[i]) simplified.push_back(points[i]);
    }
    return simplified;
}

MapBounds RouteGeometry::bounds(const std::vector<GeoPoint>& points) {
    MapBounds result;
    if (points.size() < 2) {
        return result; // 1点なら呼び出し側で固定ズーム
    }

    double minLat = points[0].latitude, maxLat = points[0].latitude;
    double minLon = points[0].longitude, maxLon = points[0].longitude;
    for (size_t i = 1; i < points.size(); i++) {
        const GeoPoint& p = points[i];
        if (p.latitude < minLat) minLat = p.latitude;
        if (p.latitude > maxLat) maxLat = p.latitude;
        if (p.longitude < minLon) minLon = p.longitude;
        if (p.longitude > maxLon) maxLon = p.longitude;
    }

    result.valid = true;
    result.southWest = GeoPoint(minLat, minLon);
    result.northEast = GeoPoint(maxLat, maxLon);
    return result;
}

bool RouteGeometry::shouldSimplify(const std::vector<GeoPoint>& points) {
    return points.size() >= SIMPLIFY_MIN_POINTS;
}

std::vector<GeoPoint> RouteGeometry::decimate(const std::vector<GeoPoint>& points, size_t maxPoints) {
    if (maxPoints < 3 || points.size() <= maxPoints) {
        return points;
    }
    // 最後の点を別に足すので刻みは maxPoints - 2 区間で割る
    size_t span = points.size() - 1;
    size_t stride = (span + (maxPoints - 2) - 1) / (maxPoints - 2);

    std::vector<GeoPoint> result;
    result.reserve(maxPoints);
    for (size_t i = 0; i < points.size(); i += stride) {
        result.push_back(points[i]);
    }
    if (span % stride != 0) {
        result.push_back(points.back());
    }
    return result;
}

RouteSimplificationResult RouteGeometry::prepareRoute(const std::vector<GeoPoint>& points, double toleranceMeters) {
    RouteSimplificationResult result;
    result.toleranceMeters = toleranceMeters;
    if (!shouldSimplify(points)) {
        result.points = points;
        return result;
    }
    if (points.size() > SIMPLIFY_MAX_INPUT_POINTS) {
        result.points = simplify(decimate(points, SIMPLIFY_MAX_INPUT_POINTS), toleranceMeters);
    } else {
        result.points = simplify(points, toleranceMeters);
    }
    return result;
}

std::vector<GeoPoint> RouteGeometry::toGeoPoints(const std::vector<LocationFix>& fixes) {
    std::vector<GeoPoint> points;
    points.reserve(fixes.size());
    for (size_t i = 0; i < fixes.size(); i++) {
        points.push_back(GeoPoint(fixes[i].latitude, fixes[i].longitude));
    }
    return points;
}

// --- RouteCache ---

RouteCache::RouteCache() : cached(false), cachedCount(0) {}

const RouteSimplificationResult& RouteCache::get(const std::vector<GeoPoint>& points, double toleranceMeters) {
    if (!cached || cachedCount != points.size() || result.toleranceMeters != toleranceMeters) {
        result = RouteGeometry::prepareRoute(points, toleranceMeters);
        cachedCount = points.size();
        cached = true;
    }
    return result;
}

void RouteCache::clear() {
    cached = false;
    cachedCount = 0;
    result = RouteSimplificationResult();
}
