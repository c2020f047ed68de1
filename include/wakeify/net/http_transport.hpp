#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <boost/asio/ssl/context.hpp>

#include "wakeify/net/http_types.hpp"

namespace wakeify::net {

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * @brief Performs one request/response exchange.
     *
     * Any HTTP status is a normal return. Network failures and timeouts
     * raise TransportError.
     */
    virtual HttpResponse perform(const HttpRequest& request) = 0;
};

struct PoolLimits {
    std::size_t max_idle_per_host{4};
    std::size_t max_hosts{16};
};

// Boost.Beast HTTP/1.1 client with a bounded keep-alive pool keyed by origin.
class BeastTransport final : public HttpTransport {
public:
    explicit BeastTransport(std::string user_agent, PoolLimits limits = {});
    ~BeastTransport() override;

    BeastTransport(const BeastTransport&) = delete;
    BeastTransport& operator=(const BeastTransport&) = delete;

    HttpResponse perform(const HttpRequest& request) override;

private:
    struct Connection;

    std::unique_ptr<Connection> acquire(const std::string& origin);
    void release(const std::string& origin, std::unique_ptr<Connection> connection);
    std::unique_ptr<Connection> connect(const Url& url, std::chrono::milliseconds timeout);
    HttpResponse exchange(Connection& connection, const Url& url, const HttpRequest& request);

    const std::string user_agent_;
    const PoolLimits limits_;
    std::unique_ptr<boost::asio::ssl::context> ssl_context_;

    mutable std::mutex pool_mutex_;
    std::unordered_map<std::string, std::deque<std::unique_ptr<Connection>>> idle_;
    std::deque<std::string> origin_order_;
};

}  // namespace wakeify::net
