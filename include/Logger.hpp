#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <stdio.h>

// ログレベル (小さいほど重要)
enum LogLevel {
    LOG_LEVEL_ERROR = 0,
    LOG_LEVEL_WARN = 1,
    LOG_LEVEL_INFO = 2,
    LOG_LEVEL_DEBUG = 3
};

class Logger {
public:
    // 出力先とレベルを設定 (stream=nullptr で出力なし)
    static void init(FILE* stream, LogLevel level = LOG_LEVEL_INFO);
    static void setLevel(LogLevel level);
    static LogLevel getLevel();
    static bool isEnabled(LogLevel level);

    // "error" / "warn" / "info" / "debug" を解釈する。不明なら fallback
    static LogLevel parseLevel(const char* name, LogLevel fallback);

    static void log(LogLevel level, const char* module, const char* format, ...)
        __attribute__((format(printf, 3, 4)));

    // [HH:MM:SS.mmm] (init からの経過時間)
    static const char* getTimeString();
    static void flush();

private:
    static LogLevel currentLevel;
    static FILE* output;
    static const char* levelStrings[];
    static char timeBuffer[32];
    static const size_t LOG_BUFFER_SIZE = 512;
};

#define LOG_ERROR(module, ...) Logger::log(LOG_LEVEL_ERROR, module, __VA_ARGS__)
#define LOG_WARN(module, ...) Logger::log(LOG_LEVEL_WARN, module, __VA_ARGS__)
#define LOG_INFO(module, ...) Logger::log(LOG_LEVEL_INFO, module, __VA_ARGS__)
#define LOG_DEBUG(module, ...) Logger::log(LOG_LEVEL_DEBUG, module, __VA_ARGS__)

#endif // LOGGER_HPP
