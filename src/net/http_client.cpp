#include "wakeify/net/http_client.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include <spdlog/spdlog.h>

#include "wakeify/common/string_util.hpp"

namespace wakeify::net {

HttpClient::HttpClient(std::shared_ptr<HttpTransport> transport, common::Clock& clock)
    : transport_(std::move(transport)), clock_(clock) {
    if (!transport_) {
        throw std::invalid_argument("HttpClient requires a transport");
    }
}

HttpResponse HttpClient::send(const HttpRequest& request,
                              const RetryPolicy& policy,
                              const common::CancellationToken* token) {
    const int attempts = std::max(1, policy.max_attempts);
    HttpResponse response;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        response = transport_->perform(request);
        if (!is_transient_status(response.status) || attempt == attempts) {
            return response;
        }

        auto delay = policy.backoff_for(attempt);
        if (auto retry_after = parse_retry_after(response)) {
            delay = std::min(std::max(delay, *retry_after), policy.max_backoff);
        }
        spdlog::warn("{} {} returned {} (attempt {}/{}), retrying in {} ms",
                     to_string(request.method),
                     request.url,
                     response.status,
                     attempt,
                     attempts,
                     delay.count());
        if (!clock_.sleep_for(delay, token)) {
            return response;
        }
    }
    return response;
}

std::optional<std::chrono::milliseconds> parse_retry_after(const HttpResponse& response) {
    auto value = response.header("retry-after");
    if (!value) {
        return std::nullopt;
    }
    const auto trimmed = common::trim_copy(*value);
    if (trimmed.empty() || !std::all_of(trimmed.begin(), trimmed.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    try {
        return std::chrono::milliseconds(std::stoll(trimmed) * 1000);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

}  // namespace wakeify::net
