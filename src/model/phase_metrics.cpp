#include "wakeify/model/phase_metrics.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace wakeify::model {

namespace {

std::string format_timestamp(std::chrono::system_clock::time_point when) {
    const auto seconds = std::chrono::system_clock::to_time_t(when);
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count() % 1000;
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
        << (millis < 0 ? millis + 1000 : millis) << 'Z';
    return out.str();
}

nlohmann::json optional_ms(const std::optional<std::int64_t>& value) {
    if (!value) {
        return nullptr;
    }
    return *value;
}

}  // namespace

void PhaseMetrics::add_error(std::string error, std::string phase, std::chrono::system_clock::time_point when) {
    errors.push_back(ErrorRecord{std::move(error), std::move(phase), when});
}

nlohmann::json PhaseMetrics::to_json() const {
    nlohmann::json errors_json = nlohmann::json::array();
    for (const auto& record : errors) {
        errors_json.push_back({
            {"error", record.error},
            {"phase", record.phase},
            {"timestamp", format_timestamp(record.timestamp)},
        });
    }
    return {
        {"discovered_ms", optional_ms(discovered_ms)},
        {"getinfo_ms", optional_ms(getinfo_ms)},
        {"adduser_ms", optional_ms(adduser_ms)},
        {"cloud_visible_ms", optional_ms(cloud_visible_ms)},
        {"play_ms", optional_ms(play_ms)},
        {"branch", branch},
        {"errors", std::move(errors_json)},
        {"total_duration_ms", optional_ms(total_duration_ms)},
    };
}

}  // namespace wakeify::model
