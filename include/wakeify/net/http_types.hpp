#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace wakeify::net {

struct Url {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;

    // Accepts http:// and https:// URLs. Throws std::invalid_argument otherwise.
    static Url parse(std::string_view text);

    std::string origin() const { return scheme + "://" + host + ":" + port; }
};

enum class HttpMethod { Get, Post, Put };

std::string_view to_string(HttpMethod method) noexcept;

struct HttpRequest {
    HttpMethod method{HttpMethod::Get};
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    std::chrono::milliseconds timeout{std::chrono::seconds(5)};
};

struct HttpResponse {
    int status{0};
    std::string body;
    // Keys are lower-cased.
    std::map<std::string, std::string> headers;

    std::optional<std::string> header(std::string_view name) const;
    bool ok() const noexcept { return status >= 200 && status < 300; }
};

class TransportError : public std::runtime_error {
public:
    enum class Kind { Timeout, Connect, Io };

    TransportError(Kind kind, const std::string& message) : std::runtime_error(message), kind_(kind) {}

    Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

std::string url_encode(std::string_view value);
std::string form_encode(const std::vector<std::pair<std::string, std::string>>& fields);

}  // namespace wakeify::net
