#ifndef SPEED_ESTIMATOR_HPP
#define SPEED_ESTIMATOR_HPP

#include "LocationFix.hpp"

class SpeedEstimator {
public:
    // 速度の決め方:
    //  1. GPSが報告した速度 (>0) をそのまま使う
    //  2. 無ければ前回Fixとの距離 / 経過時間 (経過時間<=0 なら 0, Unknown)
    //  3. 前回Fixも無ければ 0, Unknown
    // その後 0-100 km/h にクランプし、1 km/h 未満は停止扱いで 0 にする
    // previous は無ければ nullptr
    static SpeedSample estimate(const LocationFix& current, const LocationFix* previous);
};

#endif // SPEED_ESTIMATOR_HPP
