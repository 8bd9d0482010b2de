#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

struct ServerProfile {
    std::string url = "http://localhost:8080";
    std::string username = "admin";
    std::string password = "adminadmin";

    // category name -> destination directory
    std::map<std::string, std::string> categories;

    std::optional<std::string> root_path;
    std::optional<std::string> path_prefix;

    // https only. turn off for self-signed certificates
    bool verify_tls = true;

    bool operator==(const ServerProfile&) const = default;
};

struct AppConfig {
    std::vector<ServerProfile> servers;
    std::chrono::seconds rate_limit_delay{5};
    std::chrono::seconds request_timeout{30};
    std::string log_file = "torrent-mover.log";
    std::string max_log_file_size = "10M";
};
