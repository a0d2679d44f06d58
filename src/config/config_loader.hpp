#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace codebox::config {

std::filesystem::path GetConfigPath();

// Defaults, then the JSON file at GetConfigPath(), then environment overrides.
Config LoadConfig();
Config LoadConfig(const std::filesystem::path& path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyEnvOverrides(Config& config);

nlohmann::json ConfigToJson(const Config& config);

}  // namespace codebox::config
