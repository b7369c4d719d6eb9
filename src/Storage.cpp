#include "Storage.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <stdio.h>
#include <errno.h>
#include <string.h>

static const char* TAG_STORAGE = "Storage";

Storage::Storage(const std::string& dataDir) :
    dataDir(dataDir),
    storageOk(false),
    lastRideId(0)
{}

bool Storage::begin() {
    storageOk = Utils::ensureDirectory(dataDir.c_str());
    if (!storageOk) {
        LOG_ERROR(TAG_STORAGE, "Data directory %s unavailable. Rides will not be saved.", dataDir.c_str());
        return false;
    }
    LOG_INFO(TAG_STORAGE, "Data directory ready: %s", dataDir.c_str());

    // 既存IDと衝突しないように最後のIDを拾っておく
    std::vector<RideSummary> rides = loadRideSummaries();
    for (size_t i = 0; i < rides.size(); i++) {
        if (rides[i].id > lastRideId) lastRideId = rides[i].id;
    }
    return true;
}

std::string Storage::ridePath(int64_t rideId) const {
    char name[64];
    snprintf(name, sizeof(name), "%s%lld%s", RIDE_FILE_PREFIX, (long long)rideId, RIDE_FILE_SUFFIX);
    return dataDir + "/" + name;
}

std::string Storage::indexPath() const {
    return dataDir + "/" + RIDES_INDEX_FILE;
}

// --- Fix <-> JSON ---

void Storage::fixToJson(const LocationFix& fix, JsonObject obj) {
    obj["t"] = (long long)fix.timestampMs;
    obj["lat"] = fix.latitude;
    obj["lon"] = fix.longitude;
    obj["acc"] = fix.accuracyMeters;
    if (fix.hasSpeed) obj["spd"] = fix.speedMps;
    if (fix.hasBearing) obj["brg"] = fix.bearingDeg;
}

bool Storage::fixFromJson(JsonObjectConst obj, LocationFix& fix) {
    if (!obj["t"].is<long long>() || !obj["lat"].is<double>() || !obj["lon"].is<double>()) {
        return false;
    }
    fix = LocationFix();
    fix.timestampMs = obj["t"].as<long long>();
    fix.latitude = obj["lat"].as<double>();
    fix.longitude = obj["lon"].as<double>();
    fix.accuracyMeters = obj["acc"] | 0.0f;
    if (obj["spd"].is<float>()) {
        fix.hasSpeed = true;
        fix.speedMps = obj["spd"].as<float>();
    }
    if (obj["brg"].is<float>()) {
        fix.hasBearing = true;
        fix.bearingDeg = obj["brg"].as<float>();
    }
    return true;
}

// --- RideRepository ---

int64_t Storage::createRide(int64_t startedAtMs) {
    int64_t id = startedAtMs > lastRideId ? startedAtMs : lastRideId + 1;
    lastRideId = id;
    LOG_INFO(TAG_STORAGE, "Created ride %lld", (long long)id);
    return id;
}

bool Storage::appendFix(int64_t rideId, const LocationFix& fix) {
    if (!storageOk) {
        LOG_DEBUG(TAG_STORAGE, "[appendFix] Storage not available.");
        return false;
    }

    StaticJsonDocument<JSON_FIX_CAPACITY> doc;
    fixToJson(fix, doc.to<JsonObject>());
    std::string line;
    serializeJson(doc, line);

    std::string path = ridePath(rideId);
    if (!Utils::appendLine(path.c_str(), line)) {
        LOG_WARN(TAG_STORAGE, "[appendFix] Failed to append fix to %s", path.c_str());
        return false;
    }
    return true;
}

std::vector<LocationFix> Storage::loadFixes(int64_t rideId) {
    std::vector<LocationFix> fixes;
    std::string path = ridePath(rideId);
    std::string content;
    if (!Utils::readFileContent(path.c_str(), content)) {
        LOG_WARN(TAG_STORAGE, "[loadFixes] No fix log for ride %lld", (long long)rideId);
        return fixes;
    }

    size_t lineNo = 0;
    size_t pos = 0;
    while (pos < content.size()) {
        size_t end = content.find('\n', pos);
        if (end == std::string::npos) end = content.size();
        std::string line = content.substr(pos, end - pos);
        pos = end + 1;
        lineNo++;
        if (line.empty()) continue;

        StaticJsonDocument<JSON_FIX_CAPACITY> doc;
        DeserializationError error = deserializeJson(doc, line);
        LocationFix fix;
        if (error || !fixFromJson(doc.as<JsonObjectConst>(), fix)) {
            // 書き込み途中で落ちた行などは飛ばす
            LOG_WARN(TAG_STORAGE, "[loadFixes] Skipping malformed line %u in %s",
                     (unsigned)lineNo, path.c_str());
            continue;
        }
        fixes.push_back(fix);
    }
    LOG_DEBUG(TAG_STORAGE, "[loadFixes] Loaded %u fixes for ride %lld",
              (unsigned)fixes.size(), (long long)rideId);
    return fixes;
}

bool Storage::saveRide(const RideSession& session) {
    if (!storageOk) {
        LOG_WARN(TAG_STORAGE, "[saveRide] Storage not available.");
        return false;
    }

    StaticJsonDocument<JSON_SUMMARY_CAPACITY> doc;
    doc["id"] = (long long)session.id;
    doc["name"] = session.name.c_str();
    doc["start_ms"] = (long long)session.startedAtMs;
    doc["end_ms"] = (long long)session.endedAtMs;
    doc["dist_m"] = session.movingDistanceMeters;
    doc["moving_ms"] = (long long)session.movingDurationMs;
    doc["manual_pause_ms"] = (long long)session.manualPausedDurationMs;
    doc["auto_pause_ms"] = (long long)session.autoPausedDurationMs;
    doc["max_kmh"] = session.maxSpeedKmh;
    doc["points"] = (unsigned long)session.points.size();

    std::string line;
    serializeJson(doc, line);
    if (!Utils::appendLine(indexPath().c_str(), line)) {
        LOG_ERROR(TAG_STORAGE, "[saveRide] Failed to append ride %lld to index", (long long)session.id);
        return false;
    }
    LOG_INFO(TAG_STORAGE, "[saveRide] Ride %lld saved: %.1f m, %u points",
             (long long)session.id, session.movingDistanceMeters, (unsigned)session.points.size());
    return true;
}

bool Storage::deleteRide(int64_t rideId) {
    std::string path = ridePath(rideId);
    if (remove(path.c_str()) != 0) {
        if (errno == ENOENT) {
            return true; // Fixが1件も無かった
        }
        LOG_WARN(TAG_STORAGE, "[deleteRide] Failed to remove %s: %s", path.c_str(), strerror(errno));
        return false;
    }
    LOG_INFO(TAG_STORAGE, "[deleteRide] Ride %lld discarded", (long long)rideId);
    return true;
}

std::vector<RideSummary> Storage::loadRideSummaries() {
    std::vector<RideSummary> rides;
    std::string content;
    if (!Utils::readFileContent(indexPath().c_str(), content)) {
        return rides; // まだ1件も無い
    }

    size_t pos = 0;
    while (pos < content.size()) {
        size_t end = content.find('\n', pos);
        if (end == std::string::npos) end = content.size();
        std::string line = content.substr(pos, end - pos);
        pos = end + 1;
        if (line.empty()) continue;

        StaticJsonDocument<JSON_SUMMARY_CAPACITY> doc;
        DeserializationError error = deserializeJson(doc, line);
        if (error) {
            LOG_WARN(TAG_STORAGE, "[loadRideSummaries] deserializeJson() failed: %s", error.c_str());
            continue;
        }
        RideSummary summary;
        summary.id = doc["id"] | 0LL;
        summary.name = doc["name"] | "";
        summary.startedAtMs = doc["start_ms"] | 0LL;
        summary.endedAtMs = doc["end_ms"] | 0LL;
        summary.distanceMeters = doc["dist_m"] | 0.0;
        summary.movingDurationMs = doc["moving_ms"] | 0LL;
        summary.manualPausedDurationMs = doc["manual_pause_ms"] | 0LL;
        summary.autoPausedDurationMs = doc["auto_pause_ms"] | 0LL;
        summary.maxSpeedKmh = doc["max_kmh"] | 0.0f;
        summary.pointCount = doc["points"] | 0UL;
        rides.push_back(summary);
    }
    return rides;
}
