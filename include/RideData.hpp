#ifndef RIDE_DATA_HPP
#define RIDE_DATA_HPP

#include <stdint.h>
#include <string>
#include <vector>
#include "LocationFix.hpp"

// --- 状態定義 ---
enum class RideState {
    Idle,            // ライドなし
    WaitingForFix,   // 開始済み、最初の有効Fix待ち
    Recording,       // 記録中
    ManuallyPaused,  // ユーザー操作による一時停止
    AutoPaused       // 停止検知による自動一時停止
};

const char* rideStateName(RideState state);

inline bool isPausedState(RideState state) {
    return state == RideState::ManuallyPaused || state == RideState::AutoPaused;
}

inline bool isActiveState(RideState state) {
    return state == RideState::Recording || isPausedState(state);
}

// ライド1回分の集約 (RideStateMachine だけが変更する)
struct RideSession {
    int64_t id = 0;
    std::string name;
    RideState state = RideState::Idle;
    int64_t startedAtMs = 0;
    int64_t endedAtMs = 0;

    double movingDistanceMeters = 0.0;
    int64_t movingDurationMs = 0;
    int64_t pausedDurationMs = 0;        // manual + auto
    int64_t manualPausedDurationMs = 0;
    int64_t autoPausedDurationMs = 0;

    bool hasPauseStart = false;
    int64_t currentPauseStartMs = 0;

    float maxSpeedKmh = 0.0f;
    unsigned long rejectedFixCount = 0;

    std::vector<LocationFix> points;     // 追記のみ

    void reset() {
        id = 0;
        name.clear();
        state = RideState::Idle;
        startedAtMs = 0;
        endedAtMs = 0;
        movingDistanceMeters = 0.0;
        movingDurationMs = 0;
        pausedDurationMs = 0;
        manualPausedDurationMs = 0;
        autoPausedDurationMs = 0;
        hasPauseStart = false;
        currentPauseStartMs = 0;
        maxSpeedKmh = 0.0f;
        rejectedFixCount = 0;
        points.clear();
    }
};

// 描画側に渡す読み取り専用のスナップショット
struct RideSnapshot {
    RideState state = RideState::Idle;
    double movingDistanceMeters = 0.0;
    int64_t movingDurationMs = 0;
    float currentSpeedKmh = 0.0f;
    float averageSpeedKmh = 0.0f;
    float maxSpeedKmh = 0.0f;
    int64_t pausedDurationMs = 0;        // 一時停止中は現在の区間を含む
    std::vector<GeoPoint> simplifiedRoute;
    MapBounds bounds;
    BearingEstimate bearing;
    bool locationAvailable = true;       // 位置情報の権限/ソースが使えるか
    bool gpsSignalLost = false;          // FIX_TIMEOUT_MS 以上Fixが来ていない
};

#endif // RIDE_DATA_HPP
