#include "utils/logging.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>
#include <sstream>
#include <utility>
#include <vector>

#include "utils/common.hpp"

namespace coderun::utils {
namespace {

std::mutex g_log_mutex;
LogConfig g_log_config{};

}  // namespace

std::optional<LogLevel> ParseLogLevel(const std::string& value) {
    const auto lowered = ToLower(Trim(value));
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

void Log(const LogMessage& message) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (static_cast<int>(message.level) < static_cast<int>(g_log_config.min_level)) {
        return;
    }
    std::ostringstream line;
    line << "[" << message.tag << "] " << ToString(message.level) << " " << message.message;
    if (!message.fields.empty()) {
        std::vector<std::pair<std::string, std::string>> sorted(message.fields.begin(), message.fields.end());
        std::sort(sorted.begin(), sorted.end());
        for (const auto& [key, value] : sorted) {
            line << " " << key << "=" << value;
        }
    }
    std::cerr << line.str() << std::endl;
}

void Log(LogLevel level,
         const std::string& tag,
         const std::string& message,
         const std::unordered_map<std::string, std::string>& fields) {
    Log(LogMessage{level, tag, message, fields});
}

}  // namespace coderun::utils
