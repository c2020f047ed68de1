#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace wakeify::common {

class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel();
    bool cancelled() const noexcept { return cancelled_.load(); }

    // Blocks for up to `timeout`. Returns false if the token was (or becomes) cancelled.
    bool wait_for(std::chrono::steady_clock::duration timeout) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::atomic_bool cancelled_{false};
};

class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;
    using duration = std::chrono::steady_clock::duration;

    virtual ~Clock() = default;

    virtual time_point now() const = 0;
    virtual std::chrono::system_clock::time_point wall_now() const = 0;

    /**
     * @brief Sleep for @p d, waking early when @p token is cancelled.
     *
     * Returns false when the sleep was cut short by cancellation.
     */
    virtual bool sleep_for(duration d, const CancellationToken* token = nullptr) = 0;
};

class SystemClock final : public Clock {
public:
    time_point now() const override;
    std::chrono::system_clock::time_point wall_now() const override;
    bool sleep_for(duration d, const CancellationToken* token = nullptr) override;
};

template <typename Rep, typename Period>
std::int64_t to_millis(std::chrono::duration<Rep, Period> d) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
}

inline std::chrono::milliseconds seconds_to_millis(double seconds) {
    return std::chrono::milliseconds(static_cast<std::int64_t>(seconds * 1000.0 + (seconds >= 0 ? 0.5 : -0.5)));
}

}  // namespace wakeify::common
