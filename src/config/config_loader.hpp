#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace evalbox::config {

// Defaults, then ~/.evalbox/config.json, then EVALBOX_* environment variables.
Config LoadConfig();
Config LoadConfig(const std::filesystem::path& config_path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyConfigFromEnv(Config& config);

std::filesystem::path GetConfigPath();

}  // namespace evalbox::config
