#include "PauseTimer.hpp"

PauseTimer::PauseTimer(int64_t intervalMs, int64_t toleranceMs) :
    intervalMs(intervalMs > 0 ? intervalMs : PAUSE_TIMER_INTERVAL_MS),
    toleranceMs(toleranceMs),
    running(false),
    startMs(0),
    emitPending(false),
    lastEmitMs(0),
    lastSlot(0)
{
    // 許容幅は間隔の半分まで
    if (this->toleranceMs < 0) this->toleranceMs = 0;
    if (this->toleranceMs > this->intervalMs / 2) this->toleranceMs = this->intervalMs / 2;
}

void PauseTimer::start(int64_t pauseStartMs) {
    running = true;
    startMs = pauseStartMs;
    emitPending = true;
    lastEmitMs = pauseStartMs;
    lastSlot = 0;
}

void PauseTimer::stop() {
    running = false;
    emitPending = false;
}

bool PauseTimer::isRunning() const {
    return running;
}

void PauseTimer::resubscribe() {
    if (running) {
        emitPending = true;
    }
}

bool PauseTimer::poll(int64_t nowMs, int64_t& elapsedMs) {
    if (!running) {
        return false;
    }
    // 新しい枠に入った or 時計が戻った場合も通知する
    int64_t slot = slotAt(nowMs);
    bool due = emitPending || slot > lastSlot || nowMs < lastEmitMs;
    if (!due) {
        return false;
    }
    emitPending = false;
    lastEmitMs = nowMs;
    lastSlot = slot;
    elapsedMs = elapsed(nowMs);
    return true;
}

int64_t PauseTimer::elapsed(int64_t nowMs) const {
    if (!running || nowMs <= startMs) {
        return 0;
    }
    return nowMs - startMs;
}

int64_t PauseTimer::getStartMs() const {
    return startMs;
}

int64_t PauseTimer::slotAt(int64_t nowMs) const {
    if (nowMs <= startMs) {
        return 0;
    }
    return (nowMs - startMs + toleranceMs) / intervalMs;
}
