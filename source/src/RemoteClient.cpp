#include "RemoteClient.hpp"
#include "Utils.hpp"

#include <format>
#include <stdexcept>

#include <boost/asio/ssl.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/json.hpp>
#include <boost/url.hpp>

namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
using tcp = net::ip::tcp;

namespace {

Error transport_error(std::string_view step, const std::string& host, const boost::system::error_code& ec) {
    return { ErrorKind::Transport, std::format("{} {} failed: {}", step, host, ec.message()) };
}

Error decode_error(std::string_view what) {
    return { ErrorKind::Decode, std::format("Malformed torrent list: {}", what) };
}

}

RemoteClient::RemoteClient(ServerProfile profile, std::chrono::seconds timeout): _profile(std::move(profile)), _timeout(timeout) {
    auto rv = boost::urls::parse_uri(_profile.url);
    if (!rv) throw std::invalid_argument("Invalid server URL: " + _profile.url);

    auto url = *rv;

    _scheme = std::string(url.scheme());
    if (_scheme != "http" && _scheme != "https") throw std::invalid_argument("Unsupported URL scheme: " + _profile.url);

    _host = std::string(url.host_address());
    if (_host.empty()) throw std::invalid_argument("Missing host in URL: " + _profile.url);

    _host_is_name = url.host_type() == boost::urls::host_type::name;

    if (url.has_port() && !url.port().empty()) _port = url.port_number();
    else _port = (_scheme == "https") ? 443 : 80;

    if (url.host_type() == boost::urls::host_type::ipv6) _host_header = std::format("[{}]:{}", _host, _port);
    else _host_header = std::format("{}:{}", _host, _port);

    _base_path = std::string(url.encoded_path());
    while (!_base_path.empty() && _base_path.back() == '/') _base_path.pop_back();

    _authorization = "Basic " + encode_base64(_profile.username + ":" + _profile.password);

    if (_scheme == "https") {
        _ssl_ctx = std::make_shared<ssl::context>(ssl::context::tlsv12_client);

        if (_profile.verify_tls) {
            boost::system::error_code ec;
            _ssl_ctx->set_default_verify_paths(ec);
            if (ec) throw std::invalid_argument("Could not load system CA certificates: " + ec.message());

            _ssl_ctx->set_verify_mode(ssl::verify_peer);
        }
        else {
            _ssl_ctx->set_verify_mode(ssl::verify_none);
        }
    }
}

std::string RemoteClient::endpoint(std::string_view path) const {
    return _base_path + std::string(path);
}

boost::asio::awaitable<std::expected<bool, Error>> RemoteClient::is_online() const {
    auto res = co_await request(http::verb::get, endpoint("/api/v2/app/version"));
    if (!res) co_return std::unexpected(res.error());

    co_return res->ok();
}

boost::asio::awaitable<std::expected<std::vector<TorrentRecord>, Error>> RemoteClient::list_completed() const {
    auto res = co_await request(http::verb::get, endpoint("/api/v2/torrents/info?filter=completed"));
    if (!res) co_return std::unexpected(res.error());

    if (!res->ok()) {
        co_return std::unexpected(Error{ ErrorKind::Transport, std::format("Listing torrents on {} returned HTTP {}", _host, res->status) });
    }

    co_return parse_torrents(res->body);
}

boost::asio::awaitable<std::expected<void, Error>> RemoteClient::delete_torrent(std::string hash) const {
    boost::urls::url target;
    target.set_encoded_path(endpoint("/api/v2/torrents/delete"));
    target.params().set("hashes", hash);

    auto res = co_await request(http::verb::delete_, std::string(target.encoded_target()));
    if (!res) co_return std::unexpected(res.error());

    if (!res->ok()) {
        co_return std::unexpected(Error{ ErrorKind::Transport, std::format("Deleting {} on {} returned HTTP {}", hash, _host, res->status) });
    }

    co_return std::expected<void, Error>{};
}

std::expected<std::vector<TorrentRecord>, Error> RemoteClient::parse_torrents(std::string_view body) {
    boost::system::error_code ec;
    auto root = boost::json::parse(body, ec);

    if (ec) return std::unexpected(decode_error(ec.message()));
    if (!root.is_array()) return std::unexpected(decode_error("expected a JSON array"));

    std::vector<TorrentRecord> out;
    out.reserve(root.get_array().size());

    for (const auto& entry: root.get_array()) {
        if (!entry.is_object()) return std::unexpected(decode_error("expected an array of objects"));
        const auto& obj = entry.get_object();

        auto required = [&](std::string_view key) -> std::optional<std::string> {
            auto* v = obj.if_contains(key);
            if (!v || !v->is_string()) return std::nullopt;
            return std::string(v->get_string());
        };

        auto save_path = required("save_path");
        auto name      = required("name");
        auto hash      = required("hash");

        if (!save_path || !name || !hash) return std::unexpected(decode_error("entry is missing save_path, name or hash"));

        TorrentRecord record{ std::move(*save_path), std::move(*name), std::nullopt, std::move(*hash) };

        if (auto* category = obj.if_contains("category"); category && !category->is_null()) {
            if (!category->is_string()) return std::unexpected(decode_error("category must be a string"));
            if (!category->get_string().empty()) record.category = std::string(category->get_string());
        }

        out.push_back(std::move(record));
    }

    return out;
}

template <typename Stream>
boost::asio::awaitable<std::expected<RemoteClient::HttpResult, Error>> RemoteClient::exchange(Stream& stream, http::request<http::empty_body>& req) const {
    boost::system::error_code ec;

    beast::get_lowest_layer(stream).expires_after(_timeout);
    co_await http::async_write(stream, req, net::redirect_error(net::use_awaitable, ec));
    if (ec) co_return std::unexpected(transport_error("Writing request to", _host, ec));

    beast::flat_buffer buffer;
    http::response<http::string_body> res;

    co_await http::async_read(stream, buffer, res, net::redirect_error(net::use_awaitable, ec));
    if (ec) co_return std::unexpected(transport_error("Reading response from", _host, ec));

    co_return HttpResult{ res.result_int(), std::move(res.body()) };
}

boost::asio::awaitable<std::expected<RemoteClient::HttpResult, Error>> RemoteClient::request(http::verb verb, std::string target) const {
    auto executor = co_await net::this_coro::executor;
    boost::system::error_code ec;

    http::request<http::empty_body> req{ verb, target, 11 };
    req.set(http::field::host, _host_header);
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    req.set(http::field::authorization, _authorization);

    tcp::resolver resolver(executor);

    // the resolver has no deadline of its own
    net::steady_timer deadline(executor, _timeout);
    deadline.async_wait([&resolver](const boost::system::error_code& ec) {
        if (!ec) resolver.cancel();
    });

    auto results = co_await resolver.async_resolve(_host, std::to_string(_port), net::redirect_error(net::use_awaitable, ec));
    deadline.cancel();
    if (ec) co_return std::unexpected(transport_error("Resolving", _host, ec));

    if (_scheme == "https") {
        beast::ssl_stream<beast::tcp_stream> stream(executor, *_ssl_ctx);

        if (_host_is_name && !SSL_set_tlsext_host_name(stream.native_handle(), _host.c_str())) {
            co_return std::unexpected(Error{ ErrorKind::Transport, std::format("Could not set SNI host name {}", _host) });
        }

        if (_profile.verify_tls) stream.set_verify_callback(ssl::host_name_verification(_host));

        beast::get_lowest_layer(stream).expires_after(_timeout);
        co_await beast::get_lowest_layer(stream).async_connect(results, net::redirect_error(net::use_awaitable, ec));
        if (ec) co_return std::unexpected(transport_error("Connecting to", _host, ec));

        co_await stream.async_handshake(ssl::stream_base::client, net::redirect_error(net::use_awaitable, ec));
        if (ec) co_return std::unexpected(transport_error("TLS handshake with", _host, ec));

        auto result = co_await exchange(stream, req);

        // servers commonly drop the connection without close_notify, the response is already complete
        beast::get_lowest_layer(stream).expires_after(_timeout);
        co_await stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));

        co_return result;
    }

    beast::tcp_stream stream(executor);
    stream.expires_after(_timeout);

    co_await stream.async_connect(results, net::redirect_error(net::use_awaitable, ec));
    if (ec) co_return std::unexpected(transport_error("Connecting to", _host, ec));

    auto result = co_await exchange(stream, req);

    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    co_return result;
}
