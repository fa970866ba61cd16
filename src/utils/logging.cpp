#include "utils/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <sstream>

namespace sandgrade::utils {
namespace {

std::atomic<int> g_min_level{static_cast<int>(LogLevel::kInfo)};
std::mutex g_write_mutex;

bool NeedsQuoting(const std::string& value) {
    if (value.empty()) {
        return true;
    }
    return std::any_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isspace(c) || c == '"' || c == '=';
    });
}

}  // namespace

bool ParseLogLevel(const std::string& value, LogLevel& level) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") {
        level = LogLevel::kDebug;
    } else if (lowered == "info") {
        level = LogLevel::kInfo;
    } else if (lowered == "warn" || lowered == "warning") {
        level = LogLevel::kWarn;
    } else if (lowered == "error") {
        level = LogLevel::kError;
    } else {
        return false;
    }
    return true;
}

void SetLogConfig(const LogConfig& config) {
    g_min_level.store(static_cast<int>(config.min_level));
}

LogConfig GetLogConfig() {
    LogConfig config{};
    config.min_level = static_cast<LogLevel>(g_min_level.load());
    return config;
}

void Log(const LogMessage& msg) {
    if (static_cast<int>(msg.level) < g_min_level.load()) {
        return;
    }
    std::ostringstream line;
    line << "[" << msg.tag << "] ";
    if (msg.level != LogLevel::kInfo) {
        line << ToString(msg.level) << " ";
    }
    line << msg.message;
    for (const auto& [key, value] : msg.fields) {
        line << " " << key << "=";
        if (NeedsQuoting(value)) {
            line << '"' << value << '"';
        } else {
            line << value;
        }
    }
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << line.str() << std::endl;
}

}  // namespace sandgrade::utils
