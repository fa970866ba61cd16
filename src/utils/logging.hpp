#pragma once

#include <string>
#include <utility>
#include <vector>

namespace sandgrade::utils {

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

bool ParseLogLevel(const std::string& value, LogLevel& level);

struct LogMessage {
    LogLevel level;
    std::string tag;
    std::string message;
    std::vector<std::pair<std::string, std::string>> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

void SetLogConfig(const LogConfig& config);
LogConfig GetLogConfig();

// Writes one "[tag] message key=value ..." line to stderr.
void Log(const LogMessage& msg);

inline void LogDebug(std::string tag, std::string message,
                     std::vector<std::pair<std::string, std::string>> fields = {}) {
    Log({LogLevel::kDebug, std::move(tag), std::move(message), std::move(fields)});
}

inline void LogInfo(std::string tag, std::string message,
                    std::vector<std::pair<std::string, std::string>> fields = {}) {
    Log({LogLevel::kInfo, std::move(tag), std::move(message), std::move(fields)});
}

inline void LogWarn(std::string tag, std::string message,
                    std::vector<std::pair<std::string, std::string>> fields = {}) {
    Log({LogLevel::kWarn, std::move(tag), std::move(message), std::move(fields)});
}

inline void LogError(std::string tag, std::string message,
                     std::vector<std::pair<std::string, std::string>> fields = {}) {
    Log({LogLevel::kError, std::move(tag), std::move(message), std::move(fields)});
}

}  // namespace sandgrade::utils
