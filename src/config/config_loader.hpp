#pragma once

#include <filesystem>

#include "config/config_schema.hpp"

namespace vizrun::config {

// Defaults, then $VIZRUN_CONFIG or ~/.vizrun/config.json, then VIZRUN_* environment.
Config LoadConfig();

// Defaults, then the given JSON file (if present), then VIZRUN_* environment.
Config LoadConfigFrom(const std::filesystem::path& config_path);

std::filesystem::path DefaultConfigPath();
std::filesystem::path DefaultScratchRoot();

}  // namespace vizrun::config
