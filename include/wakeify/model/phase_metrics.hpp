#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace wakeify::model {

struct ErrorRecord {
    std::string error;
    std::string phase;
    std::chrono::system_clock::time_point timestamp{};
};

struct PhaseMetrics {
    std::optional<std::int64_t> discovered_ms;
    std::optional<std::int64_t> getinfo_ms;
    std::optional<std::int64_t> adduser_ms;
    std::optional<std::int64_t> cloud_visible_ms;
    std::optional<std::int64_t> play_ms;
    std::string branch{"unknown"};
    std::vector<ErrorRecord> errors;
    std::optional<std::int64_t> total_duration_ms;

    void add_error(std::string error, std::string phase, std::chrono::system_clock::time_point when);

    nlohmann::json to_json() const;
};

}  // namespace wakeify::model
