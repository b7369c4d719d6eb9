#ifndef PAUSE_TIMER_HPP
#define PAUSE_TIMER_HPP

#include <stdint.h>
#include "config.hpp"

// 一時停止中の経過時間カウンタ
// 経過時間は毎回 (nowMs - 開始時刻) から計算する。ティック数は数えない
// 通知は開始時刻を基準にした interval 刻みの枠ごとに1回
class PauseTimer {
public:
    explicit PauseTimer(int64_t intervalMs = PAUSE_TIMER_INTERVAL_MS,
                        int64_t toleranceMs = PAUSE_TIMER_TOLERANCE_MS);

    void start(int64_t pauseStartMs);
    void stop();
    bool isRunning() const;

    // 購読し直し (バックグラウンド復帰など)。次の poll で即座に現在値を出す
    void resubscribe();

    // 通知タイミングなら elapsedMs に経過時間を入れて true
    bool poll(int64_t nowMs, int64_t& elapsedMs);

    // 通知間隔に関係なく現在の経過時間
    int64_t elapsed(int64_t nowMs) const;

    int64_t getStartMs() const;

private:
    int64_t intervalMs;
    int64_t toleranceMs;    // 枠の境界より早いポーリングの許容幅
    bool running;
    int64_t startMs;
    bool emitPending;       // start/resubscribe 直後
    int64_t lastEmitMs;
    int64_t lastSlot;       // 最後に通知した枠番号

    int64_t slotAt(int64_t nowMs) const;
};

#endif // PAUSE_TIMER_HPP
