#ifndef FIX_LOG_HPP
#define FIX_LOG_HPP

#include <stdint.h>
#include <string>
#include <vector>
#include "LocationFix.hpp"

enum class FixLogEntryType {
    Fix,
    Unavailable, // {"unavailable":true,"t":...} 位置情報の権限なし/無効
    Start,       // {"cmd":"start","t":...}
    Pause,
    Resume,
    Stop
};

struct FixLogEntry {
    FixLogEntryType type = FixLogEntryType::Fix;
    int64_t timestampMs = 0;
    LocationFix fix; // type == Fix のときのみ有効
};

// リプレイ用の位置ソース (JSON Lines)
// Fix行は Storage と同じキー (t, lat, lon, acc, spd, brg)
class FixLog {
public:
    FixLog();

    bool load(const char* path);
    bool loadFromString(const std::string& content); // 1行も読めなければ false

    static bool parseLine(const std::string& line, FixLogEntry& entry);

    const std::vector<FixLogEntry>& getEntries() const;
    size_t getSkippedLines() const;

private:
    std::vector<FixLogEntry> entries;
    size_t skippedLines;
};

#endif // FIX_LOG_HPP
