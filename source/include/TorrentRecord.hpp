#pragma once

#include <optional>
#include <string>

// one completed torrent as reported by a server
struct TorrentRecord {
    std::string save_path;
    std::string name;
    std::optional<std::string> category;
    std::string hash;
};
