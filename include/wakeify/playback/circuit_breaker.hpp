#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "wakeify/common/clock.hpp"

namespace wakeify::playback {

struct CircuitBreakerState {
    int failure_count{0};
    std::optional<common::Clock::time_point> last_failure_time;
    bool is_open{false};
};

struct CircuitBreakerPolicy {
    int failure_threshold{3};
    std::chrono::seconds cooldown{600};
};

// One breaker per folded device name, created on first use.
class CircuitBreakerRegistry {
public:
    struct Entry {
        // Trimmed and lower-cased.
        std::string device_name;
        CircuitBreakerState state;
    };

    explicit CircuitBreakerRegistry(const common::Clock& clock, CircuitBreakerPolicy policy = {});

    /**
     * @brief True while the breaker is open and still cooling down.
     *
     * Once the cooldown has elapsed since the last failure the breaker
     * closes itself and this returns false.
     */
    bool should_bypass_primary(std::string_view device_name);

    void record_failure(std::string_view device_name);
    void record_success(std::string_view device_name);
    void reset(std::string_view device_name);

    CircuitBreakerState state(std::string_view device_name) const;
    std::vector<Entry> snapshot() const;

private:
    CircuitBreakerState& ensure_locked(std::string_view device_name);

    const common::Clock& clock_;
    const CircuitBreakerPolicy policy_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, CircuitBreakerState> breakers_;
};

}  // namespace wakeify::playback
