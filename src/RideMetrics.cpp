#include "RideMetrics.hpp"
#include "Logger.hpp"

static const char* TAG_METRICS = "Metrics";

RideMetrics::RideMetrics(RideSession& session) :
    session(session),
    moving(false),
    movingSegmentStartMs(0),
    autoPause(false)
{}

void RideMetrics::resetSession() {
    moving = false;
    movingSegmentStartMs = 0;
    autoPause = false;
}

void RideMetrics::startMoving(int64_t nowMs) {
    if (moving) return;
    moving = true;
    movingSegmentStartMs = nowMs;
}

void RideMetrics::stopMoving(int64_t nowMs) {
    if (!moving) return;
    moving = false;
    if (nowMs > movingSegmentStartMs) {
        session.movingDurationMs += nowMs - movingSegmentStartMs;
    }
}

void RideMetrics::beginPause(int64_t nowMs, bool automatic) {
    if (session.hasPauseStart) {
        LOG_WARN(TAG_METRICS, "Pause already open since %lld. Ignoring.", (long long)session.currentPauseStartMs);
        return;
    }
    session.hasPauseStart = true;
    session.currentPauseStartMs = nowMs;
    autoPause = automatic;
}

int64_t RideMetrics::endPause(int64_t nowMs) {
    if (!session.hasPauseStart) {
        return 0;
    }
    int64_t elapsed = nowMs - session.currentPauseStartMs;
    if (elapsed < 0) {
        // 時計が戻った場合は加算しない
        LOG_WARN(TAG_METRICS, "Clock went backwards during pause (%lld ms). Not counted.", (long long)elapsed);
        elapsed = 0;
    }
    session.pausedDurationMs += elapsed;
    if (autoPause) {
        session.autoPausedDurationMs += elapsed;
    } else {
        session.manualPausedDurationMs += elapsed;
    }
    session.hasPauseStart = false;
    session.currentPauseStartMs = 0;
    return elapsed;
}

void RideMetrics::addDistance(double meters) {
    if (session.state != RideState::Recording || meters <= 0.0) {
        return;
    }
    session.movingDistanceMeters += meters;
}

void RideMetrics::recordSpeed(float speedKmh) {
    if (session.state == RideState::Recording && speedKmh > session.maxSpeedKmh) {
        session.maxSpeedKmh = speedKmh;
    }
}

int64_t RideMetrics::movingDurationMs(int64_t nowMs) const {
    int64_t total = session.movingDurationMs;
    if (moving && nowMs > movingSegmentStartMs) {
        total += nowMs - movingSegmentStartMs;
    }
    return total;
}

int64_t RideMetrics::pausedDurationMs(int64_t nowMs) const {
    int64_t total = session.pausedDurationMs;
    if (session.hasPauseStart && nowMs > session.currentPauseStartMs) {
        total += nowMs - session.currentPauseStartMs;
    }
    return total;
}

float RideMetrics::averageSpeedKmh(int64_t nowMs) const {
    int64_t movingMs = movingDurationMs(nowMs);
    if (movingMs <= 0) {
        return 0.0f;
    }
    return (float)(session.movingDistanceMeters / ((double)movingMs / 1000.0) * 3.6);
}

bool RideMetrics::isMoving() const {
    return moving;
}
