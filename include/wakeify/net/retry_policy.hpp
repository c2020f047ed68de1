#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>

namespace wakeify::net {

struct RetryPolicy {
    int max_attempts{1};
    std::chrono::milliseconds initial_backoff{0};
    std::chrono::milliseconds max_backoff{0};
    double multiplier{2.0};

    // Delay to wait after the given failed attempt (1-based).
    std::chrono::milliseconds backoff_for(int attempt) const {
        if (attempt < 1 || initial_backoff.count() <= 0) {
            return std::chrono::milliseconds(0);
        }
        const double scaled = static_cast<double>(initial_backoff.count()) * std::pow(multiplier, attempt - 1);
        const double capped = std::min(scaled, static_cast<double>(max_backoff.count()));
        return std::chrono::milliseconds(static_cast<long long>(capped));
    }

    static RetryPolicy none() { return RetryPolicy{}; }

    static RetryPolicy device_default() {
        return RetryPolicy{3, std::chrono::milliseconds(200), std::chrono::seconds(2), 2.0};
    }

    static RetryPolicy cloud_default() {
        return RetryPolicy{3, std::chrono::seconds(1), std::chrono::seconds(10), 2.0};
    }
};

inline bool is_transient_status(int status) noexcept {
    return status == 429 || status == 500 || status == 502 || status == 503 || status == 504;
}

}  // namespace wakeify::net
