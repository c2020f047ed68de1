#include "wakeify/net/http_transport.hpp"

#include <algorithm>
#include <utility>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include "wakeify/common/string_util.hpp"

namespace wakeify::net {

namespace {
namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

void run_pending(asio::io_context& io_context) {
    io_context.restart();
    io_context.run();
}

TransportError::Kind classify(const beast::error_code& ec) {
    if (ec == beast::error::timeout || ec == asio::error::operation_aborted) {
        return TransportError::Kind::Timeout;
    }
    return TransportError::Kind::Io;
}

http::verb to_verb(HttpMethod method) {
    switch (method) {
    case HttpMethod::Get:
        return http::verb::get;
    case HttpMethod::Post:
        return http::verb::post;
    case HttpMethod::Put:
        return http::verb::put;
    }
    return http::verb::get;
}

}  // namespace

struct BeastTransport::Connection {
    asio::io_context io_context;
    std::unique_ptr<beast::tcp_stream> plain;
    std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> secure;

    beast::tcp_stream& lowest() {
        if (secure) {
            return beast::get_lowest_layer(*secure);
        }
        return *plain;
    }
};

BeastTransport::BeastTransport(std::string user_agent, PoolLimits limits)
    : user_agent_(std::move(user_agent)),
      limits_(limits),
      ssl_context_(std::make_unique<ssl::context>(ssl::context::tls_client)) {
    ssl_context_->set_default_verify_paths();
    ssl_context_->set_verify_mode(ssl::verify_peer);
}

BeastTransport::~BeastTransport() = default;

HttpResponse BeastTransport::perform(const HttpRequest& request) {
    const auto url = Url::parse(request.url);
    const auto origin = url.origin();

    auto connection = acquire(origin);
    const bool reused = connection != nullptr;
    if (!connection) {
        connection = connect(url, request.timeout);
    }

    HttpResponse response;
    try {
        response = exchange(*connection, url, request);
    } catch (const TransportError& ex) {
        if (!reused || ex.kind() == TransportError::Kind::Timeout) {
            throw;
        }
        // The peer may have closed an idle keep-alive connection.
        spdlog::debug("Pooled connection to {} went stale ({}), reconnecting", origin, ex.what());
        connection = connect(url, request.timeout);
        response = exchange(*connection, url, request);
    }

    auto keep_alive = response.header("connection");
    if (!keep_alive || common::to_lower(*keep_alive) != "close") {
        release(origin, std::move(connection));
    }
    return response;
}

std::unique_ptr<BeastTransport::Connection> BeastTransport::acquire(const std::string& origin) {
    std::lock_guard lock(pool_mutex_);
    auto it = idle_.find(origin);
    if (it == idle_.end() || it->second.empty()) {
        return nullptr;
    }
    auto connection = std::move(it->second.back());
    it->second.pop_back();
    return connection;
}

void BeastTransport::release(const std::string& origin, std::unique_ptr<Connection> connection) {
    std::lock_guard lock(pool_mutex_);
    auto it = idle_.find(origin);
    if (it == idle_.end()) {
        while (idle_.size() >= limits_.max_hosts && !origin_order_.empty()) {
            idle_.erase(origin_order_.front());
            origin_order_.pop_front();
        }
        if (limits_.max_hosts == 0) {
            return;
        }
        it = idle_.emplace(origin, std::deque<std::unique_ptr<Connection>>{}).first;
        origin_order_.push_back(origin);
    }
    if (it->second.size() >= limits_.max_idle_per_host) {
        return;
    }
    it->second.push_back(std::move(connection));
}

std::unique_ptr<BeastTransport::Connection> BeastTransport::connect(const Url& url,
                                                                    std::chrono::milliseconds timeout) {
    auto connection = std::make_unique<Connection>();
    auto& io_context = connection->io_context;

    beast::error_code ec;
    bool resolve_timed_out = false;
    tcp::resolver resolver(io_context);
    tcp::resolver::results_type endpoints;
    asio::steady_timer resolve_guard(io_context);
    resolve_guard.expires_after(timeout);
    resolve_guard.async_wait([&](const beast::error_code& wait_ec) {
        if (!wait_ec) {
            resolve_timed_out = true;
            resolver.cancel();
        }
    });
    resolver.async_resolve(url.host, url.port, [&](const beast::error_code& resolve_ec, tcp::resolver::results_type results) {
        ec = resolve_ec;
        endpoints = std::move(results);
        resolve_guard.cancel();
    });
    run_pending(io_context);
    if (resolve_timed_out) {
        throw TransportError(TransportError::Kind::Timeout, "Timed out resolving " + url.host);
    }
    if (ec) {
        throw TransportError(TransportError::Kind::Connect, "Failed to resolve " + url.host + ": " + ec.message());
    }

    if (url.scheme == "https") {
        connection->secure = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(io_context, *ssl_context_);
        if (!SSL_set_tlsext_host_name(connection->secure->native_handle(), url.host.c_str())) {
            throw TransportError(TransportError::Kind::Connect, "Failed to set TLS server name for " + url.host);
        }
        connection->secure->set_verify_callback(ssl::host_name_verification(url.host));
    } else {
        connection->plain = std::make_unique<beast::tcp_stream>(io_context);
    }

    auto& stream = connection->lowest();
    stream.expires_after(timeout);
    stream.async_connect(endpoints, [&](const beast::error_code& connect_ec, const tcp::endpoint&) { ec = connect_ec; });
    run_pending(io_context);
    if (ec) {
        const auto kind = ec == beast::error::timeout ? TransportError::Kind::Timeout : TransportError::Kind::Connect;
        throw TransportError(kind, "Failed to connect to " + url.origin() + ": " + ec.message());
    }

    if (connection->secure) {
        stream.expires_after(timeout);
        connection->secure->async_handshake(ssl::stream_base::client,
                                            [&](const beast::error_code& handshake_ec) { ec = handshake_ec; });
        run_pending(io_context);
        if (ec) {
            throw TransportError(classify(ec), "TLS handshake with " + url.origin() + " failed: " + ec.message());
        }
    }

    stream.expires_never();
    return connection;
}

HttpResponse BeastTransport::exchange(Connection& connection, const Url& url, const HttpRequest& request) {
    http::request<http::string_body> req{to_verb(request.method), url.target, 11};
    req.set(http::field::host, url.host);
    req.set(http::field::user_agent, user_agent_);
    req.keep_alive(true);
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    req.body() = request.body;
    req.prepare_payload();

    beast::error_code ec;
    beast::flat_buffer buffer;
    http::response<http::string_body> res;

    auto on_read = [&](const beast::error_code& read_ec, std::size_t) { ec = read_ec; };
    auto start = [&](auto& stream) {
        http::async_write(stream, req, [&](const beast::error_code& write_ec, std::size_t) {
            if (write_ec) {
                ec = write_ec;
                return;
            }
            http::async_read(stream, buffer, res, on_read);
        });
    };

    connection.lowest().expires_after(request.timeout);
    if (connection.secure) {
        start(*connection.secure);
    } else {
        start(*connection.plain);
    }
    run_pending(connection.io_context);
    if (ec) {
        throw TransportError(classify(ec),
                             std::string(to_string(request.method)) + " " + request.url + " failed: " + ec.message());
    }
    connection.lowest().expires_never();

    HttpResponse response;
    response.status = static_cast<int>(res.result_int());
    response.body = std::move(res.body());
    for (const auto& field : res) {
        response.headers[common::to_lower(std::string(field.name_string()))] = std::string(field.value());
    }
    if (!res.keep_alive()) {
        response.headers["connection"] = "close";
    }
    return response;
}

}  // namespace wakeify::net
