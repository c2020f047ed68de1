#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include "wakeify/model/phase_metrics.hpp"

namespace wakeify::playback {

enum class FailureReason {
    CircuitBreakerOpen,
    NoMdns,
    NotInDevicesByDeadline,
    PlayNotConfirmed,
    AuthUnavailable,
    Cancelled,
    InternalError,
};

std::string_view to_tag(FailureReason reason) noexcept;

// Terminal outcome of a play_alarm run. Carries the metrics gathered so far.
class PlaybackFailure : public std::runtime_error {
public:
    PlaybackFailure(FailureReason reason, const std::string& message, std::string hint, model::PhaseMetrics metrics);

    FailureReason reason() const noexcept { return reason_; }
    std::string_view tag() const noexcept { return to_tag(reason_); }
    const std::string& hint() const noexcept { return hint_; }
    const model::PhaseMetrics& metrics() const noexcept { return metrics_; }

private:
    FailureReason reason_;
    std::string hint_;
    model::PhaseMetrics metrics_;
};

}  // namespace wakeify::playback
