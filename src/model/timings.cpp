#include "wakeify/model/timings.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace wakeify::model {

namespace {

void check_range(const char* field, double value, double min, double max) {
    if (!std::isfinite(value) || value < min || value > max) {
        throw std::invalid_argument("Timing '" + std::string(field) + "' must be within [" + std::to_string(min) +
                                    ", " + std::to_string(max) + "], got " + std::to_string(value));
    }
}

}  // namespace

void Timings::validate() const {
    check_range("poll_fast_period_s", poll_fast_period_s, 1.0, 20.0);
    check_range("total_poll_deadline_s", total_poll_deadline_s, 5.0, 60.0);
    check_range("poll_deadline_extension_s", poll_deadline_extension_s, 0.0, 60.0);
    check_range("debounce_after_seen_s", debounce_after_seen_s, 0.1, 5.0);
    check_range("retry_404_delay_s", retry_404_delay_s, 0.1, 5.0);
    check_range("failover_fire_after_s", failover_fire_after_s, 0.5, 10.0);
    check_range("adduser_wait_after_s", adduser_wait_after_s, 0.0, 30.0);
    check_range("mdns_discovery_timeout_s", mdns_discovery_timeout_s, 0.5, 10.0);
    check_range("getinfo_timeout_s", getinfo_timeout_s, 0.5, 10.0);
    check_range("adduser_timeout_s", adduser_timeout_s, 0.5, 10.0);
    check_range("device_info_timeout_s", device_info_timeout_s, 0.5, 10.0);
    check_range("verify_device_ready_timeout_s", verify_device_ready_timeout_s, 0.1, 5.0);
    check_range("ip_wake_timeout_s", ip_wake_timeout_s, 0.5, 10.0);
    check_range("confirmation_sleep_s", confirmation_sleep_s, 0.1, 1.0);
    check_range("poll_sleep_fast_s", poll_sleep_fast_s, 0.1, 2.0);
    check_range("poll_sleep_slow_s", poll_sleep_slow_s, 0.1, 5.0);
}

}  // namespace wakeify::model
