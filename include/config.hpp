#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <stdint.h>

// --- 地球モデル ---
const double EARTH_RADIUS_M = 6371000.0;       // 平均半径 (メートル)
const double METERS_PER_DEGREE = 111000.0;     // 緯度1度あたりの距離 (近似)

// --- 速度判定 ---
const float MPS_TO_KMH = 3.6f;
const float MAX_SPEED_KMH = 100.0f;            // これを超える値は非現実的としてクランプ
const float STATIONARY_SPEED_KMH = 1.0f;       // 1 km/h 未満は停止扱い (GPSジッタ対策)

// --- 位置フィルタ ---
const float DEFAULT_MAX_ACCURACY_M = 50.0f;    // 精度半径がこれより大きいFixは捨てる (0で無効)

// --- 自動一時停止 ---
const int AUTO_PAUSE_THRESHOLDS_S[] = {1, 2, 5, 10, 15, 30};
const int AUTO_PAUSE_THRESHOLD_COUNT = sizeof(AUTO_PAUSE_THRESHOLDS_S) / sizeof(AUTO_PAUSE_THRESHOLDS_S[0]);
const int DEFAULT_AUTO_PAUSE_THRESHOLD_S = 5;
const bool DEFAULT_AUTO_PAUSE_ENABLED = true;

// --- タイマー ---
const int64_t PAUSE_TIMER_INTERVAL_MS = 1000;  // 一時停止カウンタの更新間隔
const int64_t PAUSE_TIMER_TOLERANCE_MS = 200;  // ティックが早めに来てもこの範囲なら通知する
const int64_t FIX_TIMEOUT_MS = 5000;           // この間Fixが無ければGPSロスト扱い
const int64_t MIN_RIDE_DURATION_MS = 5000;     // これより短いライドは保存しない

// --- 方位 ---
const float BEARING_DEBOUNCE_DEG = 5.0f;       // これ以下の変化は通知しない
const int64_t BEARING_STALE_MS = 45000;        // 45秒更新が無ければ方位をリセット
const double BEARING_MIN_MOVE_M = 1.0;         // 位置差から方位を出す最小移動量

// --- ルート表示 ---
const double DEFAULT_ROUTE_TOLERANCE_M = 10.0;
const unsigned int SIMPLIFY_MIN_POINTS = 100;  // これ未満の点数なら簡略化しない
const unsigned int SIMPLIFY_MAX_INPUT_POINTS = 2000; // これを超える点列は間引いてから簡略化する

// --- リプレイ ---
const int64_t REPLAY_TICK_MS = 1000;           // シミュレーション時計の刻み
const int64_t REPLAY_STATUS_INTERVAL_MS = 10000; // 状態表示の間隔

// --- 単位換算 ---
const double KM_TO_MILES = 0.621371;

// --- ファイルパス ---
extern const char* CONFIG_JSON_PATH;       // 設定ファイル
extern const char* DEFAULT_DATA_DIR;       // ライドデータ保存先
extern const char* RIDES_INDEX_FILE;       // 完了ライドのサマリ (.jsonl)
extern const char* RIDE_FILE_PREFIX;       // ride_<id>.jsonl
extern const char* RIDE_FILE_SUFFIX;

#endif // CONFIG_HPP
