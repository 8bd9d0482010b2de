#include "Config.hpp"
#include "Log.hpp"
#include "Utils.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <stdexcept>

#include <boost/json.hpp>

namespace json = boost::json;

namespace {

[[noreturn]] void bad_field(std::string_view field, std::string_view expected) {
    throw std::runtime_error(std::format("config: '{}' must be {}", field, expected));
}

std::string get_string(const json::object& obj, std::string_view key, std::string fallback) {
    auto* v = obj.if_contains(key);
    if (!v || v->is_null()) return fallback;
    if (!v->is_string()) bad_field(key, "a string");
    return std::string(v->get_string());
}

std::optional<std::string> get_optional_string(const json::object& obj, std::string_view key) {
    auto* v = obj.if_contains(key);
    if (!v || v->is_null()) return std::nullopt;
    if (!v->is_string()) bad_field(key, "a string");
    return std::string(v->get_string());
}

std::chrono::seconds get_seconds(const json::object& obj, std::string_view key, std::chrono::seconds fallback) {
    auto* v = obj.if_contains(key);
    if (!v || v->is_null()) return fallback;

    if (v->is_uint64()) return std::chrono::seconds(static_cast<int64_t>(v->get_uint64()));
    if (v->is_int64() && v->get_int64() >= 0) return std::chrono::seconds(v->get_int64());

    bad_field(key, "a non-negative integer");
}

bool get_bool(const json::object& obj, std::string_view key, bool fallback) {
    auto* v = obj.if_contains(key);
    if (!v || v->is_null()) return fallback;
    if (!v->is_bool()) bad_field(key, "true or false");
    return v->get_bool();
}

ServerProfile parse_server(const json::value& value) {
    if (!value.is_object()) bad_field("servers[]", "an object");
    const auto& obj = value.get_object();

    ServerProfile server;
    server.url      = get_string(obj, "url", server.url);
    server.username = get_string(obj, "username", server.username);
    server.password = get_string(obj, "password", server.password);
    server.root_path   = get_optional_string(obj, "root_path");
    server.path_prefix = get_optional_string(obj, "path_prefix");
    server.verify_tls  = get_bool(obj, "verify_tls", server.verify_tls);

    if (auto* categories = obj.if_contains("categories"); categories && !categories->is_null()) {
        if (!categories->is_object()) bad_field("categories", "an object");

        for (const auto& [name, dest]: categories->get_object()) {
            if (!dest.is_string()) bad_field(std::format("categories.{}", std::string_view(name)), "a string");
            server.categories.emplace(std::string(name), std::string(dest.get_string()));
        }
    }

    return server;
}

json::value to_json(const ServerProfile& server) {
    json::object obj;
    obj["url"] = server.url;
    obj["username"] = server.username;
    obj["password"] = server.password;

    json::object categories;
    for (const auto& [name, dest]: server.categories) categories[name] = dest;
    obj["categories"] = std::move(categories);

    if (server.root_path) obj["root_path"] = *server.root_path;
    else obj["root_path"] = nullptr;

    if (server.path_prefix) obj["path_prefix"] = *server.path_prefix;
    else obj["path_prefix"] = nullptr;

    obj["verify_tls"] = server.verify_tls;

    return obj;
}

}

AppConfig parse_config(std::string_view text) {
    boost::system::error_code ec;
    auto root = json::parse(text, ec);
    if (ec) throw std::runtime_error(std::format("config: invalid JSON: {}", ec.message()));
    if (!root.is_object()) throw std::runtime_error("config: top level must be an object");

    const auto& obj = root.get_object();
    AppConfig config;

    if (auto* servers = obj.if_contains("servers"); servers && !servers->is_null()) {
        if (!servers->is_array()) bad_field("servers", "an array");
        for (const auto& s: servers->get_array()) config.servers.push_back(parse_server(s));
    }

    config.rate_limit_delay  = get_seconds(obj, "rate_limit_delay", config.rate_limit_delay);
    config.request_timeout   = get_seconds(obj, "request_timeout", config.request_timeout);
    config.log_file          = get_string(obj, "log_file", config.log_file);
    config.max_log_file_size = get_string(obj, "max_log_file_size", config.max_log_file_size);

    return config;
}

std::string serialize_config(const AppConfig& config) {
    json::array servers;
    for (const auto& s: config.servers) servers.push_back(to_json(s));

    json::object obj;
    obj["servers"] = std::move(servers);
    obj["rate_limit_delay"] = config.rate_limit_delay.count();
    obj["request_timeout"] = config.request_timeout.count();
    obj["log_file"] = config.log_file;
    obj["max_log_file_size"] = config.max_log_file_size;

    return json::serialize(obj);
}

void save_config(const std::string& filename, const AppConfig& config) {
    std::ofstream out(filename, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Could not create config file: " + filename);

    out << serialize_config(config) << '\n';
    if (!out) throw std::runtime_error("Could not write config file: " + filename);
}

AppConfig load_config(const std::string& filename) {
    if (!std::filesystem::exists(filename)) {
        AppConfig defaults;
        save_config(filename, defaults);
        MOVER_LOG_INFO("Wrote default configuration to {}", filename);
        return defaults;
    }

    return parse_config(read_from_file(filename));
}
