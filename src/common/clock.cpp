#include "wakeify/common/clock.hpp"

#include <thread>

namespace wakeify::common {

void CancellationToken::cancel() {
    {
        std::lock_guard lock(mutex_);
        cancelled_.store(true);
    }
    cv_.notify_all();
}

bool CancellationToken::wait_for(std::chrono::steady_clock::duration timeout) const {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return cancelled_.load(); });
    return !cancelled_.load();
}

Clock::time_point SystemClock::now() const {
    return std::chrono::steady_clock::now();
}

std::chrono::system_clock::time_point SystemClock::wall_now() const {
    return std::chrono::system_clock::now();
}

bool SystemClock::sleep_for(duration d, const CancellationToken* token) {
    if (d <= duration::zero()) {
        return token == nullptr || !token->cancelled();
    }
    if (token == nullptr) {
        std::this_thread::sleep_for(d);
        return true;
    }
    return token->wait_for(d);
}

}  // namespace wakeify::common
