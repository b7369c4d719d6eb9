#ifndef RIDE_STATE_MACHINE_HPP
#define RIDE_STATE_MACHINE_HPP

#include <stdint.h>
#include <vector>
#include "config.hpp"
#include "RideData.hpp"
#include "FixValidator.hpp"
#include "SpeedEstimator.hpp"
#include "BearingSmoother.hpp"
#include "PauseTimer.hpp"
#include "RideMetrics.hpp"
#include "RouteGeometry.hpp"
#include "RideRepository.hpp"
#include "Settings.hpp"

enum class RideEvent {
    StartRide,
    FirstValidFix,
    ManualPause,
    ManualResume,
    StationaryTimeout, // 停止状態が閾値以上続いた
    MotionResumed,     // 自動一時停止中に動き出した
    StopRide
};

const char* rideEventName(RideEvent event);

enum class FinishResult {
    Saved,
    TooShort,    // MIN_RIDE_DURATION_MS 未満。保存せず破棄
    SaveFailed,
    NotActive    // 停止できる状態ではなかった
};

// ライド記録の状態機械。セッションを唯一所有し、他のコンポーネントを駆動する
// 時刻は全て呼び出し側から nowMs で渡す
class RideStateMachine {
public:
    // settings / repository は nullptr 可 (デフォルト設定 / 保存なし)
    RideStateMachine(const SettingsProvider* settings, RideRepository* repository);
    // metrics が session を参照しているのでコピー不可
    RideStateMachine(const RideStateMachine&) = delete;
    RideStateMachine& operator=(const RideStateMachine&) = delete;

    // 遷移表。無効な組み合わせは from をそのまま返す
    static RideState transition(RideState from, RideEvent event);

    // --- イベント ---
    bool startRide(int64_t nowMs);
    bool onFix(const LocationFix& fix, int64_t nowMs); // 受理したら true
    bool manualPause(int64_t nowMs);
    bool manualResume(int64_t nowMs);
    FinishResult stopRide(int64_t nowMs);
    void onLocationUnavailable(int64_t nowMs);

    // 約1秒ごとに呼ぶ (方位の鮮度、GPSロスト判定)
    void tick(int64_t nowMs);

    // 一時停止カウンタ。通知タイミングなら true
    bool pollPauseTimer(int64_t nowMs, int64_t& elapsedMs);
    void resubscribePauseTimer();

    RideSnapshot snapshot(int64_t nowMs);

    RideState getState() const;
    const RideSession& getSession() const;
    const RideSession& getFinishedSession() const; // 直前に終了したライド
    const SpeedSample& getLastSample() const;
    bool isPauseTimerRunning() const;

private:
    const SettingsProvider* settings;
    RideRepository* repository;

    RideSession session;
    RideSession finishedSession;
    RideMetrics metrics;
    FixValidator validator;
    BearingSmoother bearing;
    PauseTimer pauseTimer;
    RouteCache routeCache;
    std::vector<GeoPoint> routePoints; // session.points と同じ並び

    bool hasLastFix;
    LocationFix lastFix;       // 直前に受理したFix (状態に関係なく)
    SpeedSample lastSample;
    int64_t lastFixReceivedMs;
    bool locationAvailable;
    bool gpsSignalLost;

    bool inStationaryRun;
    int64_t stationaryRunStartMs;

    double routeToleranceM;

    bool applyEvent(RideEvent event, int64_t nowMs);
    void appendPoint(const LocationFix& fix, const LocationFix* previous);
    bool updateStationaryRun(const SpeedSample& sample); // 自動一時停止すべきなら true
    void resetStationaryRun();
    bool autoPauseEnabled() const;
    int autoPauseThresholdSeconds() const;
};

#endif // RIDE_STATE_MACHINE_HPP
