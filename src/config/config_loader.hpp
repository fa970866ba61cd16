#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace sandgrade::config {

std::filesystem::path DefaultConfigPath();

// Defaults, then the JSON file (when present), then SANDGRADE_* environment
// overrides. Throws core::ConfigError on malformed input or an invalid policy.
EngineConfig LoadConfig();
EngineConfig LoadConfig(const std::filesystem::path& path);

void ApplyConfigFromJson(EngineConfig& config, const nlohmann::json& data);
void ApplyConfigFromEnv(EngineConfig& config);
void ValidateConfig(const EngineConfig& config);

}  // namespace sandgrade::config
