#include "Logger.hpp"
#include <stdarg.h>
#include <string.h>
#include <strings.h>
#include <chrono>

namespace {
// millis() 相当の基準時刻
std::chrono::steady_clock::time_point logEpoch = std::chrono::steady_clock::now();
}

LogLevel Logger::currentLevel = LOG_LEVEL_INFO;
FILE* Logger::output = stderr;
const char* Logger::levelStrings[] = {
    "ERROR",
    "WARN ",
    "INFO ",
    "DEBUG"
};
char Logger::timeBuffer[32];

void Logger::init(FILE* stream, LogLevel level) {
    output = stream;
    currentLevel = level;
    logEpoch = std::chrono::steady_clock::now();
}

void Logger::setLevel(LogLevel level) {
    currentLevel = level;
}

LogLevel Logger::getLevel() {
    return currentLevel;
}

bool Logger::isEnabled(LogLevel level) {
    return output != nullptr && level <= currentLevel;
}

LogLevel Logger::parseLevel(const char* name, LogLevel fallback) {
    if (name == nullptr) return fallback;
    if (strcasecmp(name, "error") == 0) return LOG_LEVEL_ERROR;
    if (strcasecmp(name, "warn") == 0) return LOG_LEVEL_WARN;
    if (strcasecmp(name, "info") == 0) return LOG_LEVEL_INFO;
    if (strcasecmp(name, "debug") == 0) return LOG_LEVEL_DEBUG;
    return fallback;
}

const char* Logger::getTimeString() {
    unsigned long ms = (unsigned long)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - logEpoch).count();
    unsigned long totalSeconds = ms / 1000;
    unsigned long hours = totalSeconds / 3600;
    unsigned long minutes = (totalSeconds % 3600) / 60;
    unsigned long seconds = totalSeconds % 60;

    snprintf(timeBuffer, sizeof(timeBuffer), "[%02lu:%02lu:%02lu.%03lu]",
             hours % 100, minutes, seconds, ms % 1000);
    return timeBuffer;
}

void Logger::log(LogLevel level, const char* module, const char* format, ...) {
    if (!isEnabled(level)) return;

    char buffer[LOG_BUFFER_SIZE];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    fprintf(output, "%s [%s] [%-8s] %s\n", getTimeString(), levelStrings[level], module, buffer);

    // ERRORは即時フラッシュ
    if (level == LOG_LEVEL_ERROR) {
        flush();
    }
}

void Logger::flush() {
    if (output != nullptr) {
        fflush(output);
    }
}
