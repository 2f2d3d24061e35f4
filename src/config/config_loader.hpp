#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#include "config/config_schema.hpp"

namespace tfbot::config {

std::filesystem::path GetHomePath();
std::filesystem::path GetConfigDir();
std::filesystem::path GetConfigPath();

// Expands a leading "~/" against $HOME.
std::string ExpandHome(const std::string& path);

// Defaults, then ~/.tfbot/config.json, then TFBOT_* environment variables.
Config LoadConfig();
Config LoadConfigFrom(const std::filesystem::path& path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyEnvOverrides(Config& config);

// Returns one line per problem; empty when the configuration is usable.
std::vector<std::string> ValidateConfig(const Config& config);

}  // namespace tfbot::config
