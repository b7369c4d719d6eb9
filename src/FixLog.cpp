#include "FixLog.hpp"
#include "Storage.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <string.h>
#include <ArduinoJson.h>

static const char* TAG_FIXLOG = "FixLog";

FixLog::FixLog() : skippedLines(0) {}

bool FixLog::load(const char* path) {
    std::string content;
    if (!Utils::readFileContent(path, content)) {
        LOG_ERROR(TAG_FIXLOG, "Failed to open %s", path);
        return false;
    }
    LOG_INFO(TAG_FIXLOG, "Reading %s", path);
    return loadFromString(content);
}

bool FixLog::loadFromString(const std::string& content) {
    entries.clear();
    skippedLines = 0;

    size_t lineNo = 0;
    size_t pos = 0;
    while (pos < content.size()) {
        size_t end = content.find('\n', pos);
        if (end == std::string::npos) end = content.size();
        std::string line = content.substr(pos, end - pos);
        pos = end + 1;
        lineNo++;

        if (!line.empty() && line[line.size() - 1] == '\r') line.erase(line.size() - 1);
        if (line.empty() || line[0] == '#') continue;

        FixLogEntry entry;
        if (!parseLine(line, entry)) {
            LOG_WARN(TAG_FIXLOG, "Skipping line %u: %s", (unsigned)lineNo, line.c_str());
            skippedLines++;
            continue;
        }
        entries.push_back(entry);
    }

    LOG_INFO(TAG_FIXLOG, "Loaded %u entries (%u skipped)", (unsigned)entries.size(), (unsigned)skippedLines);
    return !entries.empty();
}

bool FixLog::parseLine(const std::string& line, FixLogEntry& entry) {
    StaticJsonDocument<JSON_FIX_CAPACITY> doc;
    DeserializationError error = deserializeJson(doc, line);
    if (error) {
        LOG_DEBUG(TAG_FIXLOG, "deserializeJson() failed: %s", error.c_str());
        return false;
    }
    JsonObjectConst obj = doc.as<JsonObjectConst>();
    if (obj.isNull() || !obj["t"].is<long long>()) {
        return false;
    }

    entry = FixLogEntry();
    entry.timestampMs = obj["t"].as<long long>();

    if (obj["unavailable"] | false) {
        entry.type = FixLogEntryType::Unavailable;
        return true;
    }

    const char* cmd = obj["cmd"] | (const char*)nullptr;
    if (cmd != nullptr) {
        if (strcmp(cmd, "start") == 0)       entry.type = FixLogEntryType::Start;
        else if (strcmp(cmd, "pause") == 0)  entry.type = FixLogEntryType::Pause;
        else if (strcmp(cmd, "resume") == 0) entry.type = FixLogEntryType::Resume;
        else if (strcmp(cmd, "stop") == 0)   entry.type = FixLogEntryType::Stop;
        else return false;
        return true;
    }

    entry.type = FixLogEntryType::Fix;
    return Storage::fixFromJson(obj, entry.fix);
}

const std::vector<FixLogEntry>& FixLog::getEntries() const {
    return entries;
}

size_t FixLog::getSkippedLines() const {
    return skippedLines;
}
