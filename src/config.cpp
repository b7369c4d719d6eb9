#include "config.hpp"

// --- ファイルパス ---
const char* CONFIG_JSON_PATH = "config.json";
const char* DEFAULT_DATA_DIR = "rides";
const char* RIDES_INDEX_FILE = "rides.jsonl";
const char* RIDE_FILE_PREFIX = "ride_";
const char* RIDE_FILE_SUFFIX = ".jsonl";
