#pragma once

namespace wakeify::model {

// All values are seconds.
struct Timings {
    double poll_fast_period_s{5.0};
    double total_poll_deadline_s{20.0};
    double poll_deadline_extension_s{15.0};
    double debounce_after_seen_s{0.6};
    double retry_404_delay_s{0.7};
    double failover_fire_after_s{2.0};
    double adduser_wait_after_s{5.0};
    double mdns_discovery_timeout_s{1.5};
    double getinfo_timeout_s{1.5};
    double adduser_timeout_s{2.5};
    double device_info_timeout_s{2.0};
    double verify_device_ready_timeout_s{0.5};
    double ip_wake_timeout_s{2.0};
    double confirmation_sleep_s{0.2};
    double poll_sleep_fast_s{0.5};
    double poll_sleep_slow_s{1.0};

    /**
     * @brief Checks every field against its allowed range.
     *
     * Throws std::invalid_argument naming the first offending field.
     */
    void validate() const;
};

}  // namespace wakeify::model
