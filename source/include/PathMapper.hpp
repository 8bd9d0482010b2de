#pragma once

#include "Errors.hpp"

#include <expected>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

// root_path / (save_path minus path_prefix) / name
// InvalidName unless name is exactly one path component (not empty, ".", ".." or containing '/')
std::expected<std::filesystem::path, Error> compute_source(std::string_view save_path, std::string_view name, const std::optional<std::string>& root_path, const std::optional<std::string>& path_prefix);

// empty when the category has no mapping, which means "leave the torrent alone"
std::optional<std::filesystem::path> compute_destination(const std::optional<std::string>& category, std::string_view name, const std::map<std::string, std::string>& categories);
