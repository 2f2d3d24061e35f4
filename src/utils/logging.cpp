#include "utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>
#include <sstream>
#include <vector>

namespace tfbot::utils {
namespace {

std::mutex& LogMutex() {
    static std::mutex mutex;
    return mutex;
}

LogConfig& MutableConfig() {
    static LogConfig config{};
    return config;
}

}  // namespace

std::optional<LogLevel> ParseLogLevel(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") return LogLevel::kDebug;
    if (lowered == "info") return LogLevel::kInfo;
    if (lowered == "warn" || lowered == "warning") return LogLevel::kWarn;
    if (lowered == "error") return LogLevel::kError;
    return std::nullopt;
}

void SetLogConfig(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(LogMutex());
    MutableConfig() = config;
}

LogConfig GetLogConfig() {
    std::lock_guard<std::mutex> lock(LogMutex());
    return MutableConfig();
}

bool IsEnabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(GetLogConfig().min_level);
}

std::string FormatLogLine(const std::string& tag, const LogMessage& msg) {
    std::ostringstream oss;
    oss << "[" << tag << "] " << ToString(msg.level) << " " << msg.message;
    if (!msg.fields.empty()) {
        std::vector<std::pair<std::string, std::string>> fields(msg.fields.begin(), msg.fields.end());
        std::sort(fields.begin(), fields.end());
        for (const auto& [key, value] : fields) {
            oss << " " << key << "=" << value;
        }
    }
    return oss.str();
}

void Log(const std::string& tag, const LogMessage& msg) {
    if (!IsEnabled(msg.level)) {
        return;
    }
    const auto line = FormatLogLine(tag, msg);
    std::lock_guard<std::mutex> lock(LogMutex());
    std::cerr << line << std::endl;
}

void Log(LogLevel level, const std::string& tag, const std::string& message) {
    Log(tag, LogMessage{level, message, {}});
}

}  // namespace tfbot::utils
