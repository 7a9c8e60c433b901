#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace ilbox::config {

// Defaults, then ~/.ilbox/config.json (or $ILBOX_CONFIG), then environment.
Config LoadConfig();

// Exposed for tests: overlays a parsed JSON document onto config.
void ApplyConfigFromJson(Config& config, const nlohmann::json& data);

// Exposed for tests: overlays ILBOX_* and legacy environment variables.
void ApplyConfigFromEnv(Config& config);

std::filesystem::path GetConfigPath();

}  // namespace ilbox::config
