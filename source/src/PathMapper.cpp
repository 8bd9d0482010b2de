#include "PathMapper.hpp"

#include <algorithm>
#include <format>
#include <vector>

namespace {

// trailing separators produce empty components, drop them
std::vector<std::filesystem::path> components(const std::filesystem::path& p) {
    std::vector<std::filesystem::path> out;
    for (const auto& part: p) {
        if (!part.empty()) out.push_back(part);
    }
    return out;
}

// a torrent name must stay a single entry inside save_path, "" or ".." would select the staging directory itself
bool is_single_component(std::string_view name) {
    if (name.empty() || name == "." || name == "..") return false;
    return name.find('/') == std::string_view::npos && name.find('\0') == std::string_view::npos;
}

Error invalid_name(std::string_view name) {
    return { ErrorKind::InvalidName, std::format("'{}' is not a plain file or directory name", name) };
}

}

std::expected<std::filesystem::path, Error> compute_source(std::string_view save_path, std::string_view name, const std::optional<std::string>& root_path, const std::optional<std::string>& path_prefix) {
    if (!is_single_component(name)) return std::unexpected(invalid_name(name));

    std::filesystem::path relative{ save_path };

    if (path_prefix) {
        auto save_parts   = components(relative);
        auto prefix_parts = components(std::filesystem::path{ *path_prefix });

        if (prefix_parts.size() > save_parts.size() || !std::equal(prefix_parts.begin(), prefix_parts.end(), save_parts.begin())) {
            return std::unexpected(Error{
                ErrorKind::PathPrefixMismatch,
                std::format("'{}' does not start with prefix '{}'", save_path, *path_prefix)
            });
        }

        relative.clear();
        for (auto it = save_parts.begin() + prefix_parts.size(); it != save_parts.end(); ++it) relative /= *it;
    }

    std::filesystem::path root{ root_path.value_or("") };

    return root / relative / name;
}

std::optional<std::filesystem::path> compute_destination(const std::optional<std::string>& category, std::string_view name, const std::map<std::string, std::string>& categories) {
    if (!category) return std::nullopt;

    auto it = categories.find(*category);
    if (it == categories.end()) return std::nullopt;

    return std::filesystem::path{ it->second } / name;
}
