#ifndef UTILS_HPP
#define UTILS_HPP

#include <stdint.h>
#include <string>

class Utils {
public:
    // 経過時間を "M:SS" (1時間未満) / "H:MM:SS" に整形
    static std::string formatElapsed(int64_t ms);

    // デフォルトのライド名 "Ride on Jan 15, 2025" (UTC)
    static std::string rideName(int64_t epochMs);

    // 単位換算 (小数第2位で丸め)
    static float kmhToMph(float kmh);
    static float kmToMiles(float km);

    static std::string formatSpeed(float speed, bool metric);     // "25.5 km/h" / "15.8 mph"
    static std::string formatDistance(float distance, bool metric); // "10.50 km" / "6.52 mi"

    // --- ファイル読み書きヘルパー ---
    static bool readFileContent(const char* path, std::string& content);
    static bool writeFileContent(const char* path, const std::string& content);
    static bool appendLine(const char* path, const std::string& line);
    static bool ensureDirectory(const char* path);
};

#endif // UTILS_HPP
