#include "RideStateMachine.hpp"
#include "GeoMath.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

static const char* TAG_RIDE = "Ride";

const char* rideStateName(RideState state) {
    switch (state) {
        case RideState::Idle:           return "Idle";
        case RideState::WaitingForFix:  return "WaitingForFix";
        case RideState::Recording:      return "Recording";
        case RideState::ManuallyPaused: return "ManuallyPaused";
        case RideState::AutoPaused:     return "AutoPaused";
    }
    return "Unknown";
}

const char* rideEventName(RideEvent event) {
    switch (event) {
        case RideEvent::StartRide:         return "startRide";
        case RideEvent::FirstValidFix:     return "firstValidFix";
        case RideEvent::ManualPause:       return "manualPause";
        case RideEvent::ManualResume:      return "manualResume";
        case RideEvent::StationaryTimeout: return "stationaryFor";
        case RideEvent::MotionResumed:     return "motionResumes";
        case RideEvent::StopRide:          return "stopRide";
    }
    return "unknown";
}

RideStateMachine::RideStateMachine(const SettingsProvider* settings, RideRepository* repository) :
    settings(settings),
    repository(repository),
    metrics(session),
    hasLastFix(false),
    lastFixReceivedMs(0),
    locationAvailable(true),
    gpsSignalLost(false),
    inStationaryRun(false),
    stationaryRunStartMs(0),
    routeToleranceM(DEFAULT_ROUTE_TOLERANCE_M)
{}

RideState RideStateMachine::transition(RideState from, RideEvent event) {
    switch (from) {
        case RideState::Idle:
            if (event == RideEvent::StartRide) return RideState::WaitingForFix;
            return from;
        case RideState::WaitingForFix:
            if (event == RideEvent::FirstValidFix) return RideState::Recording;
            return from;
        case RideState::Recording:
            if (event == RideEvent::ManualPause) return RideState::ManuallyPaused;
            if (event == RideEvent::StationaryTimeout) return RideState::AutoPaused;
            if (event == RideEvent::StopRide) return RideState::Idle;
            return from;
        case RideState::ManuallyPaused:
            if (event == RideEvent::ManualResume) return RideState::Recording;
            if (event == RideEvent::StopRide) return RideState::Idle;
            return from;
        case RideState::AutoPaused:
            if (event == RideEvent::MotionResumed) return RideState::Recording;
            if (event == RideEvent::StopRide) return RideState::Idle;
            return from;
    }
    return from;
}

bool RideStateMachine::applyEvent(RideEvent event, int64_t nowMs) {
    RideState from = session.state;
    RideState to = transition(from, event);
    if (to == from) {
        LOG_DEBUG(TAG_RIDE, "Event %s ignored in state %s", rideEventName(event), rideStateName(from));
        return false;
    }

    // --- 退出処理 ---
    if (from == RideState::Recording) {
        metrics.stopMoving(nowMs);
    }
    if (isPausedState(from)) {
        pauseTimer.stop(); // 一時停止を抜けたら即停止
        int64_t paused = metrics.endPause(nowMs);
        LOG_INFO(TAG_RIDE, "Pause ended after %s", Utils::formatElapsed(paused).c_str());
    }

    session.state = to;

    // --- 進入処理 ---
    if (to == RideState::Recording) {
        metrics.startMoving(nowMs);
        resetStationaryRun();
    }
    if (isPausedState(to)) {
        metrics.beginPause(nowMs, to == RideState::AutoPaused);
        pauseTimer.start(nowMs);
    }

    LOG_INFO(TAG_RIDE, "%s: %s -> %s", rideEventName(event), rideStateName(from), rideStateName(to));
    return true;
}

bool RideStateMachine::startRide(int64_t nowMs) {
    if (transition(session.state, RideEvent::StartRide) == session.state) {
        LOG_DEBUG(TAG_RIDE, "startRide ignored in state %s", rideStateName(session.state));
        return false;
    }

    session.reset();
    metrics.resetSession();
    routePoints.clear();
    routeCache.clear();
    bearing.reset();
    pauseTimer.stop();
    resetStationaryRun();
    hasLastFix = false;
    lastSample = SpeedSample();
    lastFixReceivedMs = nowMs;
    gpsSignalLost = false;

    // 設定はライド開始時点の値を使う
    validator.reset();
    validator.setMaxAccuracy(settings != nullptr ? settings->getMaxAccuracyMeters() : DEFAULT_MAX_ACCURACY_M);
    routeToleranceM = settings != nullptr ? settings->getRouteToleranceMeters() : DEFAULT_ROUTE_TOLERANCE_M;

    session.startedAtMs = nowMs;
    session.id = repository != nullptr ? repository->createRide(nowMs) : nowMs;
    session.name = Utils::rideName(nowMs);

    applyEvent(RideEvent::StartRide, nowMs);
    LOG_INFO(TAG_RIDE, "Started ride %lld (%s). Waiting for first fix.", (long long)session.id, session.name.c_str());
    return true;
}

bool RideStateMachine::onFix(const LocationFix& fix, int64_t nowMs) {
    if (session.state == RideState::Idle) {
        LOG_DEBUG(TAG_RIDE, "Fix ignored: no active ride");
        return false;
    }

    if (validator.validate(fix) != RejectReason::None) {
        session.rejectedFixCount = validator.getRejectedCount();
        return false;
    }

    lastFixReceivedMs = nowMs;
    locationAvailable = true;
    if (gpsSignalLost) {
        LOG_INFO(TAG_RIDE, "GPS signal regained");
        gpsSignalLost = false;
    }

    const LocationFix* previous = hasLastFix ? &lastFix : nullptr;
    SpeedSample sample = SpeedEstimator::estimate(fix, previous);
    bearing.update(fix, previous);
    lastSample = sample;

    switch (session.state) {
        case RideState::WaitingForFix:
            applyEvent(RideEvent::FirstValidFix, nowMs);
            appendPoint(fix, previous);
            metrics.recordSpeed(sample.speedKmh);
            if (updateStationaryRun(sample)) {
                applyEvent(RideEvent::StationaryTimeout, nowMs);
            }
            break;
        case RideState::Recording:
            appendPoint(fix, previous);
            metrics.recordSpeed(sample.speedKmh);
            if (updateStationaryRun(sample)) {
                applyEvent(RideEvent::StationaryTimeout, nowMs);
            }
            break;
        case RideState::AutoPaused:
            // 自動再開は1サンプルでも動いていれば即時
            if (!sample.isStationary) {
                applyEvent(RideEvent::MotionResumed, nowMs);
                appendPoint(fix, previous);
                metrics.recordSpeed(sample.speedKmh);
            }
            break;
        case RideState::ManuallyPaused:
            break; // 速度と方位だけ更新
        case RideState::Idle:
            break;
    }

    lastFix = fix;
    hasLastFix = true;
    return true;
}

bool RideStateMachine::manualPause(int64_t nowMs) {
    return applyEvent(RideEvent::ManualPause, nowMs);
}

bool RideStateMachine::manualResume(int64_t nowMs) {
    return applyEvent(RideEvent::ManualResume, nowMs);
}

FinishResult RideStateMachine::stopRide(int64_t nowMs) {
    // 一時停止の精算とタイマー停止は applyEvent 内で同期的に行われる
    if (!applyEvent(RideEvent::StopRide, nowMs)) {
        return FinishResult::NotActive;
    }

    session.endedAtMs = nowMs;
    session.rejectedFixCount = validator.getRejectedCount();

    FinishResult result = FinishResult::Saved;
    int64_t elapsed = nowMs - session.startedAtMs;
    if (elapsed < MIN_RIDE_DURATION_MS) {
        LOG_INFO(TAG_RIDE, "Ride %lld too short (%lld ms). Discarding.", (long long)session.id, (long long)elapsed);
        if (repository != nullptr && !repository->deleteRide(session.id)) {
            LOG_WARN(TAG_RIDE, "Failed to discard ride %lld", (long long)session.id);
        }
        result = FinishResult::TooShort;
    } else if (repository != nullptr && !repository->saveRide(session)) {
        LOG_ERROR(TAG_RIDE, "Failed to save ride %lld", (long long)session.id);
        result = FinishResult::SaveFailed;
    } else {
        LOG_INFO(TAG_RIDE, "Ride %lld finished: %.1f m, moving %s, paused %s",
                 (long long)session.id, session.movingDistanceMeters,
                 Utils::formatElapsed(session.movingDurationMs).c_str(),
                 Utils::formatElapsed(session.pausedDurationMs).c_str());
    }

    finishedSession = session;
    session.reset();
    metrics.resetSession();
    routePoints.clear();
    routeCache.clear();
    bearing.reset();
    resetStationaryRun();
    hasLastFix = false;
    lastSample = SpeedSample();
    gpsSignalLost = false;
    return result;
}

void RideStateMachine::onLocationUnavailable(int64_t nowMs) {
    if (locationAvailable) {
        LOG_WARN(TAG_RIDE, "Location unavailable (state %s)", rideStateName(session.state));
    }
    locationAvailable = false;
    lastFixReceivedMs = nowMs;
}

void RideStateMachine::tick(int64_t nowMs) {
    bearing.expire(nowMs);

    if (isActiveState(session.state) && !gpsSignalLost && nowMs - lastFixReceivedMs >= FIX_TIMEOUT_MS) {
        // 合成Fixは作らない。速度表示を0にするだけ
        LOG_WARN(TAG_RIDE, "No fix for %lld ms. GPS signal lost.", (long long)(nowMs - lastFixReceivedMs));
        gpsSignalLost = true;
    }
}

bool RideStateMachine::pollPauseTimer(int64_t nowMs, int64_t& elapsedMs) {
    return pauseTimer.poll(nowMs, elapsedMs);
}

void RideStateMachine::resubscribePauseTimer() {
    pauseTimer.resubscribe();
}

RideSnapshot RideStateMachine::snapshot(int64_t nowMs) {
    RideSnapshot snap;
    snap.state = session.state;
    snap.movingDistanceMeters = session.movingDistanceMeters;
    snap.movingDurationMs = metrics.movingDurationMs(nowMs);
    snap.pausedDurationMs = metrics.pausedDurationMs(nowMs);
    snap.currentSpeedKmh = (session.state == RideState::Recording && !gpsSignalLost) ? lastSample.speedKmh : 0.0f;
    snap.averageSpeedKmh = metrics.averageSpeedKmh(nowMs);
    snap.maxSpeedKmh = session.maxSpeedKmh;
    snap.simplifiedRoute = routeCache.get(routePoints, routeToleranceM).points;
    snap.bounds = RouteGeometry::bounds(routePoints);
    snap.bearing = bearing.getEmitted();
    snap.locationAvailable = locationAvailable;
    snap.gpsSignalLost = gpsSignalLost;
    return snap;
}

void RideStateMachine::appendPoint(const LocationFix& fix, const LocationFix* previous) {
    // 距離は直前に受理したFixから測る (一時停止中の移動は含めない)
    if (previous != nullptr && !session.points.empty()) {
        metrics.addDistance(GeoMath::haversine(*previous, fix));
    }
    session.points.push_back(fix);
    routePoints.push_back(GeoPoint(fix.latitude, fix.longitude));

    if (repository != nullptr && !repository->appendFix(session.id, fix)) {
        LOG_WARN(TAG_RIDE, "Failed to persist fix t=%lld", (long long)fix.timestampMs);
    }
}

bool RideStateMachine::updateStationaryRun(const SpeedSample& sample) {
    if (!sample.isStationary) {
        inStationaryRun = false;
        return false;
    }
    if (!inStationaryRun) {
        inStationaryRun = true;
        stationaryRunStartMs = sample.timestampMs;
    }
    if (!autoPauseEnabled()) {
        return false;
    }
    int64_t thresholdMs = (int64_t)autoPauseThresholdSeconds() * 1000;
    return sample.timestampMs - stationaryRunStartMs >= thresholdMs;
}

void RideStateMachine::resetStationaryRun() {
    inStationaryRun = false;
    stationaryRunStartMs = 0;
}

bool RideStateMachine::autoPauseEnabled() const {
    return settings != nullptr ? settings->isAutoPauseEnabled() : DEFAULT_AUTO_PAUSE_ENABLED;
}

int RideStateMachine::autoPauseThresholdSeconds() const {
    // 読むたびに補正する (保存値が不正でもエラーにしない)
    int seconds = settings != nullptr ? settings->getAutoPauseThresholdSeconds() : DEFAULT_AUTO_PAUSE_THRESHOLD_S;
    return sanitizeAutoPauseThreshold(seconds);
}

RideState RideStateMachine::getState() const {
    return session.state;
}

const RideSession& RideStateMachine::getSession() const {
    return session;
}

const RideSession& RideStateMachine::getFinishedSession() const {
    return finishedSession;
}

const SpeedSample& RideStateMachine::getLastSample() const {
    return lastSample;
}

bool RideStateMachine::isPauseTimerRunning() const {
    return pauseTimer.isRunning();
}
