#pragma once

#include <chrono>
#include <memory>
#include <optional>

#include "wakeify/common/clock.hpp"
#include "wakeify/net/http_transport.hpp"
#include "wakeify/net/retry_policy.hpp"

namespace wakeify::net {

// Wraps a transport with bounded retries on transient statuses (429/5xx).
class HttpClient {
public:
    HttpClient(std::shared_ptr<HttpTransport> transport, common::Clock& clock);

    /**
     * @brief Sends @p request, retrying transient statuses per @p policy.
     *
     * Returns the last response once the status is not transient or the
     * attempts are exhausted. Retry-After is honoured up to the policy cap.
     * TransportError propagates without retry.
     */
    HttpResponse send(const HttpRequest& request,
                      const RetryPolicy& policy,
                      const common::CancellationToken* token = nullptr);

    HttpTransport& transport() { return *transport_; }

private:
    std::shared_ptr<HttpTransport> transport_;
    common::Clock& clock_;
};

// Parses a delay-seconds Retry-After value. HTTP-date values are ignored.
std::optional<std::chrono::milliseconds> parse_retry_after(const HttpResponse& response);

}  // namespace wakeify::net
