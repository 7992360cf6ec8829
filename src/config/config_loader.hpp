#pragma once

#include <filesystem>

#include "config/config_schema.hpp"

namespace courier::config {

// Reads ~/.courier/config.json, then applies COURIER_* environment overrides.
Config LoadConfig();
Config LoadConfig(const std::filesystem::path& config_path);

std::filesystem::path DefaultConfigPath();

}  // namespace courier::config
