#pragma once

#include "Errors.hpp"

#include <expected>
#include <filesystem>
#include <functional>
#include <system_error>

// deletes the source once its copy is complete
using SourceRemover = std::function<std::error_code(const std::filesystem::path&)>;

// remove_all, a linked source loses only the link
std::error_code remove_source_tree(const std::filesystem::path& source);

// copy source to destination, then delete source. directories are moved as a whole tree.
// an existing destination is never merged into or overwritten.
std::expected<void, Error> relocate(const std::filesystem::path& source, const std::filesystem::path& destination, const SourceRemover& remove_source = remove_source_tree);
