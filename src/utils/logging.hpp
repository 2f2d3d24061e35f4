#pragma once

#include <optional>
#include <string>
#include <unordered_map>

namespace tfbot::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

struct LogMessage {
    LogLevel level;
    std::string message;
    std::unordered_map<std::string, std::string> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

std::optional<LogLevel> ParseLogLevel(const std::string& value);

void SetLogConfig(const LogConfig& config);
LogConfig GetLogConfig();
bool IsEnabled(LogLevel level);

// Renders "[tag] LEVEL message key=value ..." with fields sorted by key.
std::string FormatLogLine(const std::string& tag, const LogMessage& msg);

void Log(const std::string& tag, const LogMessage& msg);
void Log(LogLevel level, const std::string& tag, const std::string& message);

inline void LogDebug(const std::string& tag, const std::string& message) {
    Log(LogLevel::kDebug, tag, message);
}

inline void LogInfo(const std::string& tag, const std::string& message) {
    Log(LogLevel::kInfo, tag, message);
}

inline void LogWarn(const std::string& tag, const std::string& message) {
    Log(LogLevel::kWarn, tag, message);
}

inline void LogError(const std::string& tag, const std::string& message) {
    Log(LogLevel::kError, tag, message);
}

}  // namespace tfbot::utils
