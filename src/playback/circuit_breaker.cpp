#include "wakeify/playback/circuit_breaker.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "wakeify/common/string_util.hpp"

namespace wakeify::playback {

CircuitBreakerRegistry::CircuitBreakerRegistry(const common::Clock& clock, CircuitBreakerPolicy policy)
    : clock_(clock), policy_(policy) {}

bool CircuitBreakerRegistry::should_bypass_primary(std::string_view device_name) {
    std::lock_guard lock(mutex_);
    auto& breaker = ensure_locked(device_name);
    if (!breaker.is_open) {
        return false;
    }
    if (breaker.last_failure_time && clock_.now() - *breaker.last_failure_time >= policy_.cooldown) {
        spdlog::info("Circuit breaker for {} closed after cooldown", device_name);
        breaker.is_open = false;
        breaker.failure_count = 0;
        return false;
    }
    return true;
}

void CircuitBreakerRegistry::record_failure(std::string_view device_name) {
    std::lock_guard lock(mutex_);
    auto& breaker = ensure_locked(device_name);
    ++breaker.failure_count;
    breaker.last_failure_time = clock_.now();
    if (!breaker.is_open && breaker.failure_count >= policy_.failure_threshold) {
        breaker.is_open = true;
        spdlog::warn("Circuit breaker opened for {} after {} failures", device_name, breaker.failure_count);
    }
}

void CircuitBreakerRegistry::record_success(std::string_view device_name) {
    std::lock_guard lock(mutex_);
    auto& breaker = ensure_locked(device_name);
    breaker = CircuitBreakerState{};
}

void CircuitBreakerRegistry::reset(std::string_view device_name) {
    std::lock_guard lock(mutex_);
    auto& breaker = ensure_locked(device_name);
    breaker = CircuitBreakerState{};
    spdlog::info("Circuit breaker for {} reset", device_name);
}

CircuitBreakerState CircuitBreakerRegistry::state(std::string_view device_name) const {
    std::lock_guard lock(mutex_);
    auto it = breakers_.find(common::fold_name(device_name));
    if (it == breakers_.end()) {
        return {};
    }
    return it->second;
}

std::vector<CircuitBreakerRegistry::Entry> CircuitBreakerRegistry::snapshot() const {
    std::lock_guard lock(mutex_);
    std::vector<Entry> entries;
    entries.reserve(breakers_.size());
    for (const auto& [name, breaker] : breakers_) {
        entries.push_back(Entry{name, breaker});
    }
    std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) { return a.device_name < b.device_name; });
    return entries;
}

CircuitBreakerState& CircuitBreakerRegistry::ensure_locked(std::string_view device_name) {
    return breakers_.try_emplace(common::fold_name(device_name)).first->second;
}

}  // namespace wakeify::playback
