#ifndef RIDE_METRICS_HPP
#define RIDE_METRICS_HPP

#include <stdint.h>
#include "RideData.hpp"

// 距離・走行時間・一時停止時間の積算
// セッションの数値は RideStateMachine 経由でのみ呼ばれる
class RideMetrics {
public:
    explicit RideMetrics(RideSession& session);

    void resetSession();

    // 走行区間 (Recording 中) の開始/終了
    void startMoving(int64_t nowMs);
    void stopMoving(int64_t nowMs);

    // 一時停止区間の開始/終了。endPause は加算した時間を返す
    void beginPause(int64_t nowMs, bool automatic);
    int64_t endPause(int64_t nowMs);

    // Recording 中のみ加算される
    void addDistance(double meters);
    void recordSpeed(float speedKmh);

    // 開いている区間を含めた現在値
    int64_t movingDurationMs(int64_t nowMs) const;
    int64_t pausedDurationMs(int64_t nowMs) const;
    float averageSpeedKmh(int64_t nowMs) const;

    bool isMoving() const;

private:
    RideSession& session;
    bool moving;
    int64_t movingSegmentStartMs;
    bool autoPause; // 現在の一時停止が自動かどうか
};

#endif // RIDE_METRICS_HPP
