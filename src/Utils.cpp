#include "Utils.hpp"
#include "config.hpp"
#include "Logger.hpp"
#include <errno.h>
#include <math.h>
#include <stdio.h>
#include <string.h>
#include <sys/stat.h>
#include <time.h>

static const char* TAG_UTILS = "Utils";

std::string Utils::formatElapsed(int64_t ms) {
    if (ms < 0) ms = 0;
    int64_t seconds = ms / 1000;
    int h = (int)(seconds / 3600);
    int m = (int)((seconds % 3600) / 60);
    int s = (int)(seconds % 60);
    char buf[24];
    if (h > 0) {
        snprintf(buf, sizeof(buf), "%d:%02d:%02d", h, m, s);
    } else {
        snprintf(buf, sizeof(buf), "%d:%02d", m, s);
    }
    return std::string(buf);
}

std::string Utils::rideName(int64_t epochMs) {
    static const char* MONTHS[] = {
        "Jan", "Feb", "Mar", "Apr", "May", "Jun",
        "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"
    };
    time_t seconds = (time_t)(epochMs / 1000);
    struct tm timeinfo;
    if (gmtime_r(&seconds, &timeinfo) == nullptr) {
        return "Ride";
    }
    char buf[40];
    snprintf(buf, sizeof(buf), "Ride on %s %d, %d",
             MONTHS[timeinfo.tm_mon], timeinfo.tm_mday, timeinfo.tm_year + 1900);
    return std::string(buf);
}

float Utils::kmhToMph(float kmh) {
    return (float)(round(kmh * KM_TO_MILES * 100.0) / 100.0);
}

float Utils::kmToMiles(float km) {
    return (float)(round(km * KM_TO_MILES * 100.0) / 100.0);
}

std::string Utils::formatSpeed(float speed, bool metric) {
    char buf[24];
    snprintf(buf, sizeof(buf), "%.1f %s", speed, metric ? "km/h" : "mph");
    return std::string(buf);
}

std::string Utils::formatDistance(float distance, bool metric) {
    char buf[24];
    snprintf(buf, sizeof(buf), "%.2f %s", distance, metric ? "km" : "mi");
    return std::string(buf);
}

bool Utils::readFileContent(const char* path, std::string& content) {
    content.clear();
    FILE* file = fopen(path, "rb");
    if (file == nullptr) {
        LOG_DEBUG(TAG_UTILS, "Failed to open %s for reading: %s", path, strerror(errno));
        return false;
    }
    char buf[1024];
    size_t n;
    while ((n = fread(buf, 1, sizeof(buf), file)) > 0) {
        content.append(buf, n);
    }
    bool ok = ferror(file) == 0;
    fclose(file);
    if (!ok) {
        LOG_WARN(TAG_UTILS, "Read error on %s", path);
    }
    return ok;
}

bool Utils::writeFileContent(const char* path, const std::string& content) {
    FILE* file = fopen(path, "wb");
    if (file == nullptr) {
        LOG_WARN(TAG_UTILS, "Failed to open '%s' for writing: %s", path, strerror(errno));
        return false;
    }
    size_t written = fwrite(content.data(), 1, content.size(), file);
    bool closed = fclose(file) == 0;
    if (written != content.size() || !closed) {
        LOG_WARN(TAG_UTILS, "File write failed (written bytes mismatch) on %s", path);
        return false;
    }
    return true;
}

bool Utils::appendLine(const char* path, const std::string& line) {
    FILE* file = fopen(path, "ab");
    if (file == nullptr) {
        LOG_WARN(TAG_UTILS, "Failed to open '%s' for appending: %s", path, strerror(errno));
        return false;
    }
    size_t written = fwrite(line.data(), 1, line.size(), file);
    bool newline = fputc('\n', file) != EOF;
    bool closed = fclose(file) == 0;
    if (written != line.size() || !newline || !closed) {
        LOG_WARN(TAG_UTILS, "File append failed on %s", path);
        return false;
    }
    return true;
}

bool Utils::ensureDirectory(const char* path) {
    struct stat st;
    if (stat(path, &st) == 0) {
        return S_ISDIR(st.st_mode);
    }
    if (mkdir(path, 0755) != 0 && errno != EEXIST) {
        LOG_ERROR(TAG_UTILS, "Failed to create directory %s: %s", path, strerror(errno));
        return false;
    }
    return true;
}
