#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace coderun::config {

constexpr double kMaxTimeLimitS = 24.0 * 60.0 * 60.0;

// Finite, positive, and no longer than a day.
bool IsValidTimeLimit(double seconds);

// Resolves $CODERUN_CONFIG, falling back to ~/.coderun/config.json.
std::filesystem::path GetConfigPath();

// Defaults, then the config file, then CODERUN_* environment overrides.
Config LoadConfig();

// Defaults overlaid with a single file. A missing or malformed file keeps the defaults.
Config LoadConfigFromFile(const std::filesystem::path& path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyEnvOverrides(Config& config);

}  // namespace coderun::config
