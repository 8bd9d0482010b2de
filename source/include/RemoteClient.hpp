#pragma once

#include "Errors.hpp"
#include "ServerProfile.hpp"
#include "TorrentRecord.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>

namespace http = boost::beast::http;

// value type: one copy per task. copies share only the immutable tls context.
// every call is a single authenticated request, no retries.
class RemoteClient {
public:
    static constexpr std::chrono::seconds DEFAULT_TIMEOUT{ 30 };

    // throws std::invalid_argument for an unusable url or tls setup
    explicit RemoteClient(ServerProfile profile, std::chrono::seconds timeout = DEFAULT_TIMEOUT);

    [[nodiscard]] boost::asio::awaitable<std::expected<bool, Error>> is_online() const;
    [[nodiscard]] boost::asio::awaitable<std::expected<std::vector<TorrentRecord>, Error>> list_completed() const;
    [[nodiscard]] boost::asio::awaitable<std::expected<void, Error>> delete_torrent(std::string hash) const;

    const ServerProfile& profile() const { return _profile; }
    const std::string& host() const { return _host; }
    const std::string& host_header() const { return _host_header; }
    uint16_t port() const { return _port; }

    static std::expected<std::vector<TorrentRecord>, Error> parse_torrents(std::string_view body);

private:
    struct HttpResult {
        unsigned status{};
        std::string body;

        bool ok() const { return status >= 200 && status < 300; }
    };

    [[nodiscard]] boost::asio::awaitable<std::expected<HttpResult, Error>> request(http::verb verb, std::string target) const;

    template <typename Stream>
    boost::asio::awaitable<std::expected<HttpResult, Error>> exchange(Stream& stream, http::request<http::empty_body>& req) const;

    std::string endpoint(std::string_view path) const;

    ServerProfile _profile;
    std::chrono::seconds _timeout;

    std::string _scheme;
    std::string _host;
    std::string _host_header;
    bool        _host_is_name{};
    uint16_t    _port{};
    std::string _base_path;
    std::string _authorization;

    // configured once, read-only afterwards
    std::shared_ptr<boost::asio::ssl::context> _ssl_ctx;
};
