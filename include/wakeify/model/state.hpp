#pragma once

#include <string_view>

namespace wakeify::model {

enum class State {
    Unknown,
    Discovered,
    LocalAwake,
    LoggedIn,
    CloudVisible,
    Staged,
    Playing,
    FallbackActive,
    DeepSleepSuspected,
};

inline std::string_view to_string(State state) noexcept {
    switch (state) {
    case State::Unknown:
        return "UNKNOWN";
    case State::Discovered:
        return "DISCOVERED";
    case State::LocalAwake:
        return "LOCAL_AWAKE";
    case State::LoggedIn:
        return "LOGGED_IN";
    case State::CloudVisible:
        return "CLOUD_VISIBLE";
    case State::Staged:
        return "STAGED";
    case State::Playing:
        return "PLAYING";
    case State::FallbackActive:
        return "FALLBACK_ACTIVE";
    case State::DeepSleepSuspected:
        return "DEEP_SLEEP_SUSPECTED";
    }
    return "UNKNOWN";
}

}  // namespace wakeify::model
