#include "MockQbitServer.hpp"

#include <format>
#include <stdexcept>

#include <openssl/evp.h>
#include <openssl/x509.h>

using tcp = boost::asio::ip::tcp;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

namespace {

struct PkeyDeleter { void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); } };
struct X509Deleter { void operator()(X509* p) const { X509_free(p); } };

void use_self_signed_certificate(ssl::context& ctx) {
    std::unique_ptr<EVP_PKEY, PkeyDeleter> key(EVP_EC_gen("prime256v1"));
    if (!key) throw std::runtime_error("could not generate test key");

    std::unique_ptr<X509, X509Deleter> cert(X509_new());
    if (!cert) throw std::runtime_error("could not allocate test certificate");

    ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), 3600);
    X509_set_pubkey(cert.get(), key.get());

    auto* name = X509_get_subject_name(cert.get());
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC, reinterpret_cast<const unsigned char*>("127.0.0.1"), -1, -1, 0);
    X509_set_issuer_name(cert.get(), name);

    if (!X509_sign(cert.get(), key.get(), EVP_sha256())) throw std::runtime_error("could not sign test certificate");

    // the context takes its own references
    if (SSL_CTX_use_certificate(ctx.native_handle(), cert.get()) != 1 || SSL_CTX_use_PrivateKey(ctx.native_handle(), key.get()) != 1) {
        throw std::runtime_error("could not install test certificate");
    }
}

}

MockQbitServer::MockQbitServer(boost::asio::any_io_executor exec, Scheme scheme):
    _exec(exec),
    _acceptor(exec, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)),
    _scheme(scheme)
{
    if (_scheme == Scheme::Https) {
        _ssl_ctx = std::make_unique<ssl::context>(ssl::context::tlsv12_server);
        use_self_signed_certificate(*_ssl_ctx);
    }

    net::co_spawn(_exec, accept_loop(), net::detached);
}

std::string MockQbitServer::url() const {
    return std::format("{}://127.0.0.1:{}", _scheme == Scheme::Https ? "https" : "http", _acceptor.local_endpoint().port());
}

std::string MockQbitServer::key(http::verb method, std::string_view target) {
    auto verb = http::to_string(method);
    return std::format("{} {}", std::string_view(verb.data(), verb.size()), target);
}

void MockQbitServer::respond(http::verb method, std::string target, unsigned status, std::string body) {
    _routes[key(method, target)] = Route{ status, std::move(body) };
}

std::size_t MockQbitServer::count(http::verb method, std::string_view target) const {
    std::size_t n = 0;
    for (const auto& r: _requests) {
        if (r.method == method && r.target == target) ++n;
    }
    return n;
}

void MockQbitServer::handle_request(const http::request<http::dynamic_body>& req, http::response<http::string_body>& res) {
    auto header = [&req](http::field field) {
        auto it = req.find(field);
        if (it == req.end()) return std::string();
        return std::string(it->value().data(), it->value().size());
    };

    std::string target(req.target().data(), req.target().size());
    _requests.push_back({ req.method(), target, header(http::field::host), header(http::field::authorization) });

    auto it = _routes.find(key(req.method(), target));

    if (it == _routes.end()) {
        res.result(http::status::not_found);
        res.body() = "Not Found";
    }
    else {
        res.result(it->second.status);
        res.body() = it->second.body;
    }

    res.set(http::field::content_type, "application/json");
    res.prepare_payload();
}

net::awaitable<void> MockQbitServer::accept_loop() {
    for (;;) {
        boost::system::error_code ec;
        tcp::socket socket = co_await _acceptor.async_accept(net::redirect_error(net::use_awaitable, ec));
        if (ec) co_return;

        net::co_spawn(_exec, handle_connection(std::move(socket)), net::detached);
    }
}

net::awaitable<void> MockQbitServer::handle_connection(tcp::socket socket) {
    boost::system::error_code ec;

    if (_scheme == Scheme::Http) {
        co_await serve(socket);
        socket.shutdown(tcp::socket::shutdown_send, ec);
        co_return;
    }

    ssl::stream<tcp::socket> stream(std::move(socket), *_ssl_ctx);

    co_await stream.async_handshake(ssl::stream_base::server, net::redirect_error(net::use_awaitable, ec));
    if (ec) co_return;

    co_await serve(stream);
    co_await stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
}

template <typename Stream>
net::awaitable<void> MockQbitServer::serve(Stream& stream) {
    boost::system::error_code ec;
    boost::beast::flat_buffer buffer;
    http::request<http::dynamic_body> req;

    co_await http::async_read(stream, buffer, req, net::redirect_error(net::use_awaitable, ec));
    if (ec) co_return;

    http::response<http::string_body> res;
    res.version(req.version());
    handle_request(req, res);

    co_await http::async_write(stream, res, net::redirect_error(net::use_awaitable, ec));
}
