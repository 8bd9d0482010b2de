#include "FileRelocator.hpp"
#include "Log.hpp"

#include <format>
#include <system_error>

namespace fs = std::filesystem;

namespace {

Error make_error(ErrorKind kind, const fs::path& path, std::string_view what, const std::error_code& ec = {}) {
    if (ec) return { kind, std::format("{}: {} ({})", what, path.string(), ec.message()) };
    return { kind, std::format("{}: {}", what, path.string()) };
}

// a failed copy must not leave a half written destination behind, the next cycle would hit DestinationExists
void discard_partial_copy(const fs::path& destination) {
    std::error_code ec;
    fs::remove_all(destination, ec);
    if (ec) MOVER_LOG_WARN("Could not clean up partial copy at {}: {}", destination.string(), ec.message());
}

}

std::error_code remove_source_tree(const fs::path& source) {
    std::error_code ec;
    fs::remove_all(source, ec);
    return ec;
}

std::expected<void, Error> relocate(const fs::path& source, const fs::path& destination, const SourceRemover& remove_source) {
    std::error_code ec;

    auto link_status = fs::symlink_status(source, ec);
    if (link_status.type() == fs::file_type::not_found) {
        return std::unexpected(make_error(ErrorKind::SourceNotFound, source, "Source path does not exist"));
    }
    if (ec) {
        return std::unexpected(make_error(ErrorKind::UnsupportedSourceType, source, "Cannot inspect source", ec));
    }

    // links are followed, a dangling or looping link has nothing to move
    ec.clear();
    auto source_status = fs::status(source, ec);

    bool is_file = !ec && fs::is_regular_file(source_status);
    bool is_dir  = !ec && fs::is_directory(source_status);

    if (!is_file && !is_dir) {
        return std::unexpected(make_error(ErrorKind::UnsupportedSourceType, source, "Source path is not a file or directory", ec));
    }

    fs::path from = source;
    if (fs::is_symlink(link_status)) {
        from = fs::canonical(source, ec);
        if (ec) return std::unexpected(make_error(ErrorKind::UnsupportedSourceType, source, "Cannot resolve link", ec));
    }

    ec.clear();
    auto destination_status = fs::symlink_status(destination, ec);
    if (fs::exists(destination_status)) {
        return std::unexpected(make_error(ErrorKind::DestinationExists, destination, "Destination already exists"));
    }

    if (destination.has_parent_path()) {
        ec.clear();
        fs::create_directories(destination.parent_path(), ec);
        if (ec) return std::unexpected(make_error(ErrorKind::CopyFailed, destination.parent_path(), "Could not create destination directory", ec));
    }

    ec.clear();
    if (is_file) fs::copy_file(from, destination, fs::copy_options::none, ec);
    else fs::copy(from, destination, fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);

    if (ec) {
        discard_partial_copy(destination);
        return std::unexpected(make_error(ErrorKind::CopyFailed, source, "Copy failed", ec));
    }

    if (auto removed = remove_source(source)) {
        return std::unexpected(make_error(ErrorKind::PartialMove, source, "Copied but could not delete source, manual cleanup required", removed));
    }

    return {};
}
