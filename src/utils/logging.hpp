#pragma once

#include <optional>
#include <string>
#include <unordered_map>

namespace coderun::utils {

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
    std::string tag;
    std::string message;
    std::unordered_map<std::string, std::string> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

std::optional<LogLevel> ParseLogLevel(const std::string& value);

void SetLogConfig(const LogConfig& config);
LogConfig GetLogConfig();

// Writes "[tag] LEVEL message key=value ..." to stderr. Fields are printed
// in key order so lines stay stable between runs.
void Log(const LogMessage& message);

void Log(LogLevel level,
         const std::string& tag,
         const std::string& message,
         const std::unordered_map<std::string, std::string>& fields = {});

}  // namespace coderun::utils
