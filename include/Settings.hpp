#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include <string>
#include "config.hpp"
#include "Logger.hpp"

// 設定値の読み取り口。エンジンは必要な時点で毎回読む (リアクティブな購読はしない)
class SettingsProvider {
public:
    virtual ~SettingsProvider() {}
    virtual bool isAutoPauseEnabled() const = 0;
    virtual int getAutoPauseThresholdSeconds() const = 0; // {1,2,5,10,15,30} のいずれか
    virtual float getMaxAccuracyMeters() const = 0;
    virtual double getRouteToleranceMeters() const = 0;
};

bool isValidAutoPauseThreshold(int seconds);
// 不正な値なら DEFAULT_AUTO_PAUSE_THRESHOLD_S
int sanitizeAutoPauseThreshold(int seconds);

// config.json から読み込む設定
class Settings : public SettingsProvider {
public:
    Settings();

    bool loadFromJson(const char* path); // ファイルが無い/壊れている場合はデフォルトのまま false
    bool loadFromString(const std::string& json);
    bool saveToJson(const char* path) const;

    bool isAutoPauseEnabled() const override;
    int getAutoPauseThresholdSeconds() const override;
    float getMaxAccuracyMeters() const override;
    double getRouteToleranceMeters() const override;

    const std::string& getDataDir() const;
    LogLevel getLogLevel() const;

    void setAutoPauseEnabled(bool enabled);
    void setAutoPauseThresholdSeconds(int seconds); // 不正値も保存し、読み出し時に補正する
    void setMaxAccuracyMeters(float meters);
    void setRouteToleranceMeters(double meters);
    void setDataDir(const std::string& dir);

private:
    bool autoPauseEnabled;
    int autoPauseThresholdS; // 保存された生の値
    float maxAccuracyM;
    double routeToleranceM;
    std::string dataDir;
    LogLevel logLevel;
};

#endif // SETTINGS_HPP
