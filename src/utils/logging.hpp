#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace vizrun::utils {

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

std::optional<LogLevel> ParseLogLevel(const std::string& value);

using LogFields = std::vector<std::pair<std::string, std::string>>;

struct LogMessage {
    LogLevel level;
    std::string component;
    std::string message;
    LogFields fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

void SetLogConfig(const LogConfig& config);
LogConfig GetLogConfig();

// Writes "[component] message key=value ..." to stderr. Warn and error lines
// carry the level after the component tag.
void Log(const LogMessage& msg);

inline void LogDebug(std::string component, std::string message, LogFields fields = {}) {
    Log({LogLevel::kDebug, std::move(component), std::move(message), std::move(fields)});
}

inline void LogInfo(std::string component, std::string message, LogFields fields = {}) {
    Log({LogLevel::kInfo, std::move(component), std::move(message), std::move(fields)});
}

inline void LogWarn(std::string component, std::string message, LogFields fields = {}) {
    Log({LogLevel::kWarn, std::move(component), std::move(message), std::move(fields)});
}

inline void LogError(std::string component, std::string message, LogFields fields = {}) {
    Log({LogLevel::kError, std::move(component), std::move(message), std::move(fields)});
}

}  // namespace vizrun::utils
