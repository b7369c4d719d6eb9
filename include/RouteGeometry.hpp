#ifndef ROUTE_GEOMETRY_HPP
#define ROUTE_GEOMETRY_HPP

#include <stddef.h>
#include <vector>
#include "LocationFix.hpp"
#include "config.hpp"

class RouteGeometry {
public:
    // Douglas-Peucker による簡略化。2点以下はそのまま返す。端点は必ず残る
    // 許容誤差はメートルから度に換算 (tolerance / 111000)
    static std::vector<GeoPoint> simplify(const std::vector<GeoPoint>& points,
                                          double toleranceMeters = DEFAULT_ROUTE_TOLERANCE_M);

    // 点が2つ未満なら valid=false
    static MapBounds bounds(const std::vector<GeoPoint>& points);

    // 簡略化する価値がある点数か (SIMPLIFY_MIN_POINTS 以上)
    static bool shouldSimplify(const std::vector<GeoPoint>& points);

    // 等間隔に間引いて maxPoints 以下にする。端点は必ず残る
    static std::vector<GeoPoint> decimate(const std::vector<GeoPoint>& points, size_t maxPoints);

    // 短いルートはそのまま、長いルートだけ簡略化する
    // SIMPLIFY_MAX_INPUT_POINTS を超える入力は先に間引く (計算量の上限)
    static RouteSimplificationResult prepareRoute(const std::vector<GeoPoint>& points,
                                                  double toleranceMeters = DEFAULT_ROUTE_TOLERANCE_M);

    static std::vector<GeoPoint> toGeoPoints(const std::vector<LocationFix>& fixes);

private:
    // 点 p から線分 a-b までの距離 (度単位の平面近似)
    static double segmentDistance(const GeoPoint& p, const GeoPoint& a, const GeoPoint& b);
};

// 直近の簡略化結果を (点数, 許容誤差) で覚えておく
// 記録中の点列は追記のみなので点数が同じなら中身も同じ
class RouteCache {
public:
    RouteCache();
    const RouteSimplificationResult& get(const std::vector<GeoPoint>& points, double toleranceMeters);
    void clear();

private:
    bool cached;
    size_t cachedCount;
    RouteSimplificationResult result;
};

#endif // ROUTE_GEOMETRY_HPP
