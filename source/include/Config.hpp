#pragma once

#include "ServerProfile.hpp"

#include <string>
#include <string_view>

inline constexpr std::string_view CONFIG_FILE = "config.json";

// writes a default configuration when the file does not exist yet.
// throws std::runtime_error on unreadable or malformed configuration.
AppConfig load_config(const std::string& filename);

AppConfig parse_config(std::string_view json);
std::string serialize_config(const AppConfig& config);
void save_config(const std::string& filename, const AppConfig& config);
