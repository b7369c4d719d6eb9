#ifndef FIX_VALIDATOR_HPP
#define FIX_VALIDATOR_HPP

#include <stdint.h>
#include "LocationFix.hpp"
#include "config.hpp"

enum class RejectReason {
    None,
    LatitudeOutOfRange,
    LongitudeOutOfRange,
    NegativeAccuracy,
    AccuracyTooLow,      // 精度半径が maxAccuracyMeters を超えている
    InvalidTimestamp,    // <= 0
    OutOfOrder           // 直前に受理したFix以前のタイムスタンプ
};

const char* rejectReasonName(RejectReason reason);

class FixValidator {
public:
    explicit FixValidator(float maxAccuracyMeters = DEFAULT_MAX_ACCURACY_M);

    // 値域チェックのみ (状態を持たない)
    static RejectReason checkRange(const LocationFix& fix, float maxAccuracyMeters);

    // 値域 + 順序チェック。受理したら最終タイムスタンプを更新する
    RejectReason validate(const LocationFix& fix);

    void reset(); // ライド開始時に呼ぶ
    void setMaxAccuracy(float meters);

    unsigned long getRejectedCount() const;
    int64_t getLastAcceptedTimestampMs() const;

private:
    float maxAccuracyMeters;
    int64_t lastAcceptedTimestampMs;
    unsigned long rejectedCount;
};

#endif // FIX_VALIDATOR_HPP
