#include "Settings.hpp"
#include "Utils.hpp"
#include <ArduinoJson.h>

static const char* TAG_SETTINGS = "Settings";

// JSONドキュメント容量
#define JSON_CONFIG_CAPACITY 512

bool isValidAutoPauseThreshold(int seconds) {
    for (int i = 0; i < AUTO_PAUSE_THRESHOLD_COUNT; i++) {
        if (AUTO_PAUSE_THRESHOLDS_S[i] == seconds) return true;
    }
    return false;
}

int sanitizeAutoPauseThreshold(int seconds) {
    return isValidAutoPauseThreshold(seconds) ? seconds : DEFAULT_AUTO_PAUSE_THRESHOLD_S;
}

Settings::Settings() :
    autoPauseEnabled(DEFAULT_AUTO_PAUSE_ENABLED),
    autoPauseThresholdS(DEFAULT_AUTO_PAUSE_THRESHOLD_S),
    maxAccuracyM(DEFAULT_MAX_ACCURACY_M),
    routeToleranceM(DEFAULT_ROUTE_TOLERANCE_M),
    dataDir(DEFAULT_DATA_DIR),
    logLevel(LOG_LEVEL_INFO)
{}

bool Settings::loadFromJson(const char* path) {
    LOG_INFO(TAG_SETTINGS, "Loading config from %s", path);
    std::string content;
    if (!Utils::readFileContent(path, content) || content.empty()) {
        LOG_WARN(TAG_SETTINGS, "Config file not found or empty. Using defaults.");
        return false;
    }
    return loadFromString(content);
}

bool Settings::loadFromString(const std::string& json) {
    StaticJsonDocument<JSON_CONFIG_CAPACITY> doc;
    DeserializationError error = deserializeJson(doc, json);
    if (error) {
        LOG_WARN(TAG_SETTINGS, "deserializeJson() failed: %s. Using defaults.", error.c_str());
        return false;
    }

    if (doc["auto_pause_enabled"].is<bool>()) {
        autoPauseEnabled = doc["auto_pause_enabled"].as<bool>();
    }

    if (doc["auto_pause_threshold_s"].is<int>()) {
        autoPauseThresholdS = doc["auto_pause_threshold_s"].as<int>();
        if (!isValidAutoPauseThreshold(autoPauseThresholdS)) {
            LOG_WARN(TAG_SETTINGS, "Invalid auto_pause_threshold_s %d. Falling back to %d s.",
                     autoPauseThresholdS, DEFAULT_AUTO_PAUSE_THRESHOLD_S);
        }
    } else if (!doc["auto_pause_threshold_s"].isNull()) {
        LOG_WARN(TAG_SETTINGS, "auto_pause_threshold_s has unexpected type. Using default.");
        autoPauseThresholdS = DEFAULT_AUTO_PAUSE_THRESHOLD_S;
    }

    float accuracy = doc["max_accuracy_m"] | maxAccuracyM;
    if (accuracy >= 0.0f) {
        maxAccuracyM = accuracy;
    } else {
        LOG_WARN(TAG_SETTINGS, "Negative max_accuracy_m ignored.");
    }

    double tolerance = doc["route_tolerance_m"] | routeToleranceM;
    if (tolerance > 0.0) {
        routeToleranceM = tolerance;
    } else {
        LOG_WARN(TAG_SETTINGS, "route_tolerance_m must be positive. Keeping %.1f m.", routeToleranceM);
    }

    if (doc["data_dir"].is<const char*>()) {
        dataDir = doc["data_dir"].as<const char*>();
    }

    if (doc["log_level"].is<const char*>()) {
        logLevel = Logger::parseLevel(doc["log_level"].as<const char*>(), logLevel);
    }

    LOG_INFO(TAG_SETTINGS, "Auto-pause %s, threshold %d s, max accuracy %.1f m, tolerance %.1f m",
             autoPauseEnabled ? "on" : "off", getAutoPauseThresholdSeconds(), maxAccuracyM, routeToleranceM);
    return true;
}

bool Settings::saveToJson(const char* path) const {
    StaticJsonDocument<JSON_CONFIG_CAPACITY> doc;
    doc["auto_pause_enabled"] = autoPauseEnabled;
    doc["auto_pause_threshold_s"] = getAutoPauseThresholdSeconds();
    doc["max_accuracy_m"] = maxAccuracyM;
    doc["route_tolerance_m"] = routeToleranceM;
    doc["data_dir"] = dataDir.c_str();

    std::string output;
    serializeJson(doc, output);
    if (!Utils::writeFileContent(path, output)) {
        LOG_ERROR(TAG_SETTINGS, "Failed to write config to %s", path);
        return false;
    }
    return true;
}

bool Settings::isAutoPauseEnabled() const {
    return autoPauseEnabled;
}

int Settings::getAutoPauseThresholdSeconds() const {
    return sanitizeAutoPauseThreshold(autoPauseThresholdS);
}

float Settings::getMaxAccuracyMeters() const {
    return maxAccuracyM;
}

double Settings::getRouteToleranceMeters() const {
    return routeToleranceM;
}

const std::string& Settings::getDataDir() const {
    return dataDir;
}

LogLevel Settings::getLogLevel() const {
    return logLevel;
}

void Settings::setAutoPauseEnabled(bool enabled) {
    autoPauseEnabled = enabled;
}

void Settings::setAutoPauseThresholdSeconds(int seconds) {
    autoPauseThresholdS = seconds;
}

void Settings::setMaxAccuracyMeters(float meters) {
    maxAccuracyM = meters;
}

void Settings::setRouteToleranceMeters(double meters) {
    routeToleranceM = meters;
}

void Settings::setDataDir(const std::string& dir) {
    dataDir = dir;
}
