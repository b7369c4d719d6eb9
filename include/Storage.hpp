#ifndef STORAGE_HPP
#define STORAGE_HPP

#include <string>
#include <vector>
#include <ArduinoJson.h>
#include "config.hpp"
#include "RideRepository.hpp"

// JSONドキュメント容量定義
#define JSON_FIX_CAPACITY 256       // Fix 1行分
#define JSON_SUMMARY_CAPACITY 512   // ライドサマリ 1行分

// 完了ライドの一覧用
struct RideSummary {
    int64_t id = 0;
    std::string name;
    int64_t startedAtMs = 0;
    int64_t endedAtMs = 0;
    double distanceMeters = 0.0;
    int64_t movingDurationMs = 0;
    int64_t manualPausedDurationMs = 0;
    int64_t autoPausedDurationMs = 0;
    float maxSpeedKmh = 0.0f;
    size_t pointCount = 0;
};

// ディレクトリ配下に JSON Lines で保存する
//   ride_<id>.jsonl : Fix を1行ずつ追記
//   rides.jsonl     : 完了ライドのサマリを1行ずつ追記
class Storage : public RideRepository {
public:
    explicit Storage(const std::string& dataDir = DEFAULT_DATA_DIR);
    bool begin(); // 保存先ディレクトリの準備

    int64_t createRide(int64_t startedAtMs) override;
    bool appendFix(int64_t rideId, const LocationFix& fix) override;
    std::vector<LocationFix> loadFixes(int64_t rideId) override;
    bool saveRide(const RideSession& session) override;
    bool deleteRide(int64_t rideId) override;

    std::vector<RideSummary> loadRideSummaries();

    // Fix <-> JSON 変換 (FixLog と共用)
    static void fixToJson(const LocationFix& fix, JsonObject obj);
    static bool fixFromJson(JsonObjectConst obj, LocationFix& fix);

private:
    std::string dataDir;
    bool storageOk;       // 保存先が利用可能か
    int64_t lastRideId;

    std::string ridePath(int64_t rideId) const;
    std::string indexPath() const;
};

#endif // STORAGE_HPP
