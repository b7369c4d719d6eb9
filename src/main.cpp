#include <stdio.h>
#include <string.h>
#include <string>
#include "config.hpp"
#include "Logger.hpp"
#include "Settings.hpp"
#include "Storage.hpp"
#include "FixLog.hpp"
#include "RideStateMachine.hpp"
#include "Utils.hpp"

static const char* TAG_MAIN = "Main";

// --- Global Objects ---
Settings settings;
Storage* storage = nullptr;
RideStateMachine* ride = nullptr;

// --- Global State ---
int64_t clockMs = 0;           // シミュレーション時計 (エポックms)
int64_t lastStatusPrintMs = 0;
bool metricUnits = true;

// 表示 (1行)
void printStatus(int64_t nowMs) {
    RideSnapshot snap = ride->snapshot(nowMs);
    float speed = metricUnits ? snap.currentSpeedKmh : Utils::kmhToMph(snap.currentSpeedKmh);
    float distKm = (float)(snap.movingDistanceMeters / 1000.0);
    float dist = metricUnits ? distKm : Utils::kmToMiles(distKm);

    printf("%-14s %10s %10s  moving %8s  paused %8s",
           rideStateName(snap.state),
           Utils::formatSpeed(speed, metricUnits).c_str(),
           Utils::formatDistance(dist, metricUnits).c_str(),
           Utils::formatElapsed(snap.movingDurationMs).c_str(),
           Utils::formatElapsed(snap.pausedDurationMs).c_str());
    if (snap.bearing.valid) printf("  brg %5.1f", snap.bearing.degrees);
    if (snap.gpsSignalLost) printf("  [GPS LOST]");
    if (!snap.locationAvailable) printf("  [NO LOCATION]");
    printf("\n");
}

// 時計を targetMs まで進める (tick と一時停止カウンタ)
void advanceClock(int64_t targetMs) {
    while (clockMs < targetMs) {
        int64_t step = targetMs - clockMs;
        if (step > REPLAY_TICK_MS) step = REPLAY_TICK_MS;
        clockMs += step;

        ride->tick(clockMs);

        int64_t pausedMs = 0;
        if (ride->pollPauseTimer(clockMs, pausedMs)) {
            printf("  paused %s\n", Utils::formatElapsed(pausedMs).c_str());
        }

        if (clockMs - lastStatusPrintMs >= REPLAY_STATUS_INTERVAL_MS) {
            printStatus(clockMs);
            lastStatusPrintMs = clockMs;
        }
    }
}

void handleEntry(const FixLogEntry& entry) {
    switch (entry.type) {
        case FixLogEntryType::Start:
            ride->startRide(clockMs);
            break;
        case FixLogEntryType::Fix:
            ride->onFix(entry.fix, clockMs);
            break;
        case FixLogEntryType::Unavailable:
            ride->onLocationUnavailable(clockMs);
            break;
        case FixLogEntryType::Pause:
            if (ride->manualPause(clockMs)) printf("  ** paused by rider\n");
            break;
        case FixLogEntryType::Resume:
            if (ride->manualResume(clockMs)) printf("  ** resumed by rider\n");
            break;
        case FixLogEntryType::Stop:
            break; // main で処理
    }
}

void printSummary(FinishResult result) {
    const RideSession& s = ride->getFinishedSession();
    switch (result) {
        case FinishResult::Saved:      printf("\n=== Ride saved ===\n"); break;
        case FinishResult::SaveFailed: printf("\n=== Ride NOT saved (storage error) ===\n"); break;
        case FinishResult::TooShort:   printf("\n=== Ride too short, discarded ===\n"); return;
        case FinishResult::NotActive:  printf("\n=== No active ride ===\n"); return;
    }
    int64_t movingMs = s.movingDurationMs;
    float avgKmh = movingMs > 0 ? (float)(s.movingDistanceMeters / (movingMs / 1000.0) * MPS_TO_KMH) : 0.0f;
    printf("Name     : %s\n", s.name.c_str());
    printf("Distance : %s\n", Utils::formatDistance((float)(s.movingDistanceMeters / 1000.0), true).c_str());
    printf("Moving   : %s\n", Utils::formatElapsed(movingMs).c_str());
    printf("Paused   : %s (manual %s, auto %s)\n",
           Utils::formatElapsed(s.pausedDurationMs).c_str(),
           Utils::formatElapsed(s.manualPausedDurationMs).c_str(),
           Utils::formatElapsed(s.autoPausedDurationMs).c_str());
    printf("Avg speed: %s\n", Utils::formatSpeed(avgKmh, true).c_str());
    printf("Max speed: %s\n", Utils::formatSpeed(s.maxSpeedKmh, true).c_str());
    printf("Points   : %u (rejected %u)\n", (unsigned)s.points.size(), (unsigned)s.rejectedFixCount);
}

void printUsage(const char* prog) {
    fprintf(stderr, "Usage: %s <fixlog.jsonl> [--config <config.json>] [--imperial]\n", prog);
}

int main(int argc, char** argv) {
    const char* logPath = nullptr;
    const char* configPath = CONFIG_JSON_PATH;
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            configPath = argv[++i];
        } else if (strcmp(argv[i], "--imperial") == 0) {
            metricUnits = false;
        } else if (argv[i][0] != '-' && logPath == nullptr) {
            logPath = argv[i];
        } else {
            printUsage(argv[0]);
            return 2;
        }
    }
    if (logPath == nullptr) {
        printUsage(argv[0]);
        return 2;
    }

    Logger::init(stderr, LOG_LEVEL_INFO);
    // 設定ファイルが無ければデフォルトで続行
    if (!settings.loadFromJson(configPath)) {
        LOG_INFO(TAG_MAIN, "Using default settings");
    }
    Logger::setLevel(settings.getLogLevel());
    LOG_INFO(TAG_MAIN, "=== Ride Replay ===");
    LOG_INFO(TAG_MAIN, "Auto-pause %s, threshold %d s",
             settings.isAutoPauseEnabled() ? "on" : "off", settings.getAutoPauseThresholdSeconds());

    Storage rideStorage(settings.getDataDir());
    if (!rideStorage.begin()) {
        LOG_WARN(TAG_MAIN, "Storage unavailable. Continuing without saving.");
    }
    storage = &rideStorage;

    FixLog fixLog;
    if (!fixLog.load(logPath)) {
        LOG_ERROR(TAG_MAIN, "No usable entries in %s", logPath);
        return 1;
    }

    RideStateMachine machine(&settings, storage);
    ride = &machine;

    const std::vector<FixLogEntry>& entries = fixLog.getEntries();
    clockMs = entries.front().timestampMs;
    lastStatusPrintMs = clockMs;

    // start コマンドが無いログは先頭で開始
    if (entries.front().type != FixLogEntryType::Start) {
        ride->startRide(clockMs);
    }

    FinishResult result = FinishResult::NotActive;
    bool stopped = false;
    for (size_t i = 0; i < entries.size() && !stopped; i++) {
        advanceClock(entries[i].timestampMs);
        if (entries[i].type == FixLogEntryType::Stop) {
            result = ride->stopRide(clockMs);
            stopped = true;
        } else {
            handleEntry(entries[i]);
        }
    }

    if (!stopped) {
        LOG_INFO(TAG_MAIN, "End of log. Stopping ride.");
        result = ride->stopRide(clockMs);
    }
    printSummary(result);

    Logger::flush();
    return result == FinishResult::SaveFailed ? 1 : 0;
}
