#include "wakeify/playback/playback_failure.hpp"

#include <utility>

namespace wakeify::playback {

std::string_view to_tag(FailureReason reason) noexcept {
    switch (reason) {
    case FailureReason::CircuitBreakerOpen:
        return "circuit_breaker_open";
    case FailureReason::NoMdns:
        return "no_mdns";
    case FailureReason::NotInDevicesByDeadline:
        return "not_in_devices_by_deadline";
    case FailureReason::PlayNotConfirmed:
        return "play_not_confirmed_t2";
    case FailureReason::AuthUnavailable:
        return "auth_unavailable";
    case FailureReason::Cancelled:
        return "cancelled";
    case FailureReason::InternalError:
        return "internal_error";
    }
    return "internal_error";
}

PlaybackFailure::PlaybackFailure(FailureReason reason,
                                 const std::string& message,
                                 std::string hint,
                                 model::PhaseMetrics metrics)
    : std::runtime_error(message), reason_(reason), hint_(std::move(hint)), metrics_(std::move(metrics)) {}

}  // namespace wakeify::playback
