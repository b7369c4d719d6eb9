#ifndef RIDE_REPOSITORY_HPP
#define RIDE_REPOSITORY_HPP

#include <stdint.h>
#include <vector>
#include "LocationFix.hpp"
#include "RideData.hpp"

// ライドの永続化先。保存形式は実装側が決める
class RideRepository {
public:
    virtual ~RideRepository() {}

    // 新しいライドIDを払い出す
    virtual int64_t createRide(int64_t startedAtMs) = 0;
    virtual bool appendFix(int64_t rideId, const LocationFix& fix) = 0;
    virtual std::vector<LocationFix> loadFixes(int64_t rideId) = 0;
    // 終了したライドのサマリを保存
    virtual bool saveRide(const RideSession& session) = 0;
    // 短すぎるライドなど、保存しないライドの後始末
    virtual bool deleteRide(int64_t rideId) = 0;
};

#endif // RIDE_REPOSITORY_HPP
