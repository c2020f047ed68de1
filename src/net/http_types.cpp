#include "wakeify/net/http_types.hpp"

#include "wakeify/common/string_util.hpp"

#include <cctype>

namespace wakeify::net {

Url Url::parse(std::string_view text) {
    Url url;
    const auto scheme_end = text.find("://");
    if (scheme_end == std::string_view::npos) {
        throw std::invalid_argument("URL is missing a scheme: " + std::string(text));
    }
    url.scheme = common::to_lower(std::string(text.substr(0, scheme_end)));
    if (url.scheme != "http" && url.scheme != "https") {
        throw std::invalid_argument("Unsupported URL scheme: " + url.scheme);
    }

    auto rest = text.substr(scheme_end + 3);
    const auto path_start = rest.find_first_of("/?");
    auto authority = rest.substr(0, path_start);
    url.target = path_start == std::string_view::npos ? "/" : std::string(rest.substr(path_start));
    if (!url.target.empty() && url.target.front() == '?') {
        url.target.insert(url.target.begin(), '/');
    }

    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string_view::npos) {
            throw std::invalid_argument("Malformed IPv6 host in URL: " + std::string(text));
        }
        url.host = std::string(authority.substr(1, close - 1));
        if (close + 1 < authority.size() && authority[close + 1] == ':') {
            url.port = std::string(authority.substr(close + 2));
        }
    } else {
        const auto colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            url.host = std::string(authority.substr(0, colon));
            url.port = std::string(authority.substr(colon + 1));
        } else {
            url.host = std::string(authority);
        }
    }

    if (url.host.empty()) {
        throw std::invalid_argument("URL is missing a host: " + std::string(text));
    }
    if (url.port.empty()) {
        url.port = url.scheme == "https" ? "443" : "80";
    }
    return url;
}

std::string_view to_string(HttpMethod method) noexcept {
    switch (method) {
    case HttpMethod::Get:
        return "GET";
    case HttpMethod::Post:
        return "POST";
    case HttpMethod::Put:
        return "PUT";
    }
    return "GET";
}

std::optional<std::string> HttpResponse::header(std::string_view name) const {
    auto it = headers.find(common::to_lower(std::string(name)));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string url_encode(std::string_view value) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
        const auto byte = static_cast<unsigned char>(c);
        if (std::isalnum(byte) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(c);
        } else {
            out.push_back('%');
            out.push_back(kHex[byte >> 4]);
            out.push_back(kHex[byte & 0x0F]);
        }
    }
    return out;
}

std::string form_encode(const std::vector<std::pair<std::string, std::string>>& fields) {
    std::string out;
    for (const auto& [key, value] : fields) {
        if (!out.empty()) {
            out.push_back('&');
        }
        out += url_encode(key);
        out.push_back('=');
        out += url_encode(value);
    }
    return out;
}

}  // namespace wakeify::net
