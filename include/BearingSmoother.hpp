#ifndef BEARING_SMOOTHER_HPP
#define BEARING_SMOOTHER_HPP

#include <stdint.h>
#include "LocationFix.hpp"
#include "config.hpp"

class BearingSmoother {
public:
    BearingSmoother(float debounceDeg = BEARING_DEBOUNCE_DEG, int64_t staleMs = BEARING_STALE_MS);

    // 方位の更新。GPS報告値 > 位置差からの算出 > 前回値 の優先順
    // 通知用の値 (getEmitted) が変わったら true
    bool update(const LocationFix& fix, const LocationFix* previous);

    // staleMs 以上更新が無ければ方位を無効化する。通知値が変わったら true
    bool expire(int64_t nowMs);

    void reset();

    const BearingEstimate& getEstimate() const; // 最新の生の推定値
    const BearingEstimate& getEmitted() const;  // デバウンス後の通知値

private:
    float debounceDeg;
    int64_t staleMs;
    BearingEstimate estimate;
    BearingEstimate emitted;
};

#endif // BEARING_SMOOTHER_HPP
