#include "config/config_loader.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace coderun::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

void ApplyString(const nlohmann::json& source, const char* key, std::string& target) {
    if (source.contains(key) && source[key].is_string()) {
        const auto value = source[key].get<std::string>();
        if (!value.empty()) {
            target = value;
        }
    }
}

void ApplyRunnerConfig(RunnerConfig& runner, const nlohmann::json& source) {
    if (!source.is_object()) {
        return;
    }
    if (source.contains("timeLimitS") && source["timeLimitS"].is_number()) {
        const auto value = source["timeLimitS"].get<double>();
        if (IsValidTimeLimit(value)) {
            runner.time_limit_s = value;
        } else {
            utils::Log(utils::LogLevel::kWarn, "config", "ignoring out-of-range runner.timeLimitS");
        }
    }
    ApplyString(source, "tempDirName", runner.temp_dir_name);
    ApplyString(source, "cCompiler", runner.c_compiler);
    ApplyString(source, "cppCompiler", runner.cpp_compiler);
    ApplyString(source, "javaCompiler", runner.java_compiler);
    ApplyString(source, "javaLauncher", runner.java_launcher);
    if (source.contains("pythonCandidates") && source["pythonCandidates"].is_array()) {
        std::vector<std::string> candidates;
        for (const auto& item : source["pythonCandidates"]) {
            if (item.is_string() && !item.get<std::string>().empty()) {
                candidates.push_back(item.get<std::string>());
            }
        }
        if (!candidates.empty()) {
            runner.python_candidates = std::move(candidates);
        }
    }
}

double ParseDouble(const std::string& value, double fallback) {
    try {
        return std::stod(value);
    } catch (const std::invalid_argument&) {
        return fallback;
    } catch (const std::out_of_range&) {
        return fallback;
    }
}

}  // namespace

bool IsValidTimeLimit(double seconds) {
    return std::isfinite(seconds) && seconds > 0.0 && seconds <= kMaxTimeLimitS;
}

std::filesystem::path GetConfigPath() {
    const auto explicit_path = GetEnv("CODERUN_CONFIG");
    if (!explicit_path.empty()) {
        return std::filesystem::path(explicit_path);
    }
    return GetHomePath() / ".coderun" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("runner")) {
        ApplyRunnerConfig(config.runner, data["runner"]);
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        const auto& logging = data["logging"];
        if (logging.contains("level") && logging["level"].is_string()) {
            config.logging.level = logging["level"].get<std::string>();
        }
    }
}

void ApplyEnvOverrides(Config& config) {
    const auto time_limit = GetEnvFallback(
        "CODERUN_RUNNER__TIME_LIMIT_S",
        "CODERUN_RUNNER_TIME_LIMIT_S");
    if (!time_limit.empty()) {
        const auto value = ParseDouble(time_limit, config.runner.time_limit_s);
        if (IsValidTimeLimit(value)) {
            config.runner.time_limit_s = value;
        } else {
            utils::Log(utils::LogLevel::kWarn, "config", "ignoring out-of-range time limit",
                       {{"value", time_limit}});
        }
    }

    const auto c_compiler = GetEnvFallback(
        "CODERUN_RUNNER__C_COMPILER",
        "CODERUN_RUNNER_C_COMPILER");
    if (!c_compiler.empty()) {
        config.runner.c_compiler = c_compiler;
    }

    const auto cpp_compiler = GetEnvFallback(
        "CODERUN_RUNNER__CPP_COMPILER",
        "CODERUN_RUNNER_CPP_COMPILER");
    if (!cpp_compiler.empty()) {
        config.runner.cpp_compiler = cpp_compiler;
    }

    const auto java_compiler = GetEnvFallback(
        "CODERUN_RUNNER__JAVA_COMPILER",
        "CODERUN_RUNNER_JAVA_COMPILER");
    if (!java_compiler.empty()) {
        config.runner.java_compiler = java_compiler;
    }

    const auto java_launcher = GetEnvFallback(
        "CODERUN_RUNNER__JAVA_LAUNCHER",
        "CODERUN_RUNNER_JAVA_LAUNCHER");
    if (!java_launcher.empty()) {
        config.runner.java_launcher = java_launcher;
    }

    const auto python_candidates = GetEnvFallback(
        "CODERUN_RUNNER__PYTHON_CANDIDATES",
        "CODERUN_RUNNER_PYTHON_CANDIDATES");
    if (!python_candidates.empty()) {
        auto candidates = utils::SplitCsv(python_candidates);
        if (!candidates.empty()) {
            config.runner.python_candidates = std::move(candidates);
        }
    }

    const auto log_level = GetEnv("CODERUN_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }
}

Config LoadConfigFromFile(const std::filesystem::path& path) {
    Config config{};
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return config;
    }
    std::ifstream input(path);
    if (!input.is_open()) {
        utils::Log(utils::LogLevel::kWarn, "config", "cannot open config file",
                   {{"path", path.string()}});
        return config;
    }
    try {
        nlohmann::json data;
        input >> data;
        ApplyConfigFromJson(config, data);
    } catch (const nlohmann::json::exception& ex) {
        utils::Log(utils::LogLevel::kWarn, "config", "keeping defaults after parse error",
                   {{"path", path.string()}, {"error", ex.what()}});
        return Config{};
    }
    return config;
}

Config LoadConfig() {
    auto config = LoadConfigFromFile(GetConfigPath());
    ApplyEnvOverrides(config);
    return config;
}

}  // namespace coderun::config
