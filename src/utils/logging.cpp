#include "utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>
#include <sstream>

namespace vizrun::utils {
namespace {

std::mutex g_log_mutex;
LogConfig g_log_config;

bool NeedsQuoting(const std::string& value) {
    if (value.empty()) {
        return true;
    }
    return std::any_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isspace(c) || c == '"';
    });
}

}  // namespace

std::optional<LogLevel> ParseLogLevel(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return std::nullopt;
}

void SetLogConfig(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_config = config;
}

LogConfig GetLogConfig() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return g_log_config;
}

void Log(const LogMessage& msg) {
    std::ostringstream line;
    line << "[" << msg.component << "] ";
    if (msg.level == LogLevel::kWarn || msg.level == LogLevel::kError) {
        line << ToString(msg.level) << " ";
    }
    line << msg.message;
    for (const auto& [key, value] : msg.fields) {
        line << " " << key << "=";
        if (NeedsQuoting(value)) {
            line << "\"" << value << "\"";
        } else {
            line << value;
        }
    }

    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (static_cast<int>(msg.level) < static_cast<int>(g_log_config.min_level)) {
        return;
    }
    std::cerr << line.str() << std::endl;
}

}  // namespace vizrun::utils
