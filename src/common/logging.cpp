#include "wakeify/common/logging.hpp"

#include "wakeify/common/string_util.hpp"

#include <spdlog/pattern_formatter.h>
#include <spdlog/spdlog.h>

#include <ctime>
#include <memory>
#include <string>
#include <utility>

namespace wakeify::common {

namespace {

// %* writes the payload as a quoted JSON string.
constexpr const char* kJsonPattern =
    R"({"timestamp":"%Y-%m-%dT%H:%M:%S.%eZ","level":"%l","thread":%t,"message":%*})";
constexpr const char* kTextPattern = "%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v";

class JsonMessageFlag final : public spdlog::custom_flag_formatter {
public:
    void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
        const nlohmann::json payload = std::string(msg.payload.data(), msg.payload.size());
        const auto quoted = payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        dest.append(quoted.data(), quoted.data() + quoted.size());
    }

    std::unique_ptr<custom_flag_formatter> clone() const override {
        return std::make_unique<JsonMessageFlag>();
    }
};

}  // namespace

LogFormat parse_log_format(std::string_view value) {
    const auto lowered = fold_name(value);
    if (lowered == "text" || lowered == "simple") {
        return LogFormat::Text;
    }
    return LogFormat::Json;
}

void configure_logging(std::string_view level, LogFormat format) {
    auto parsed = spdlog::level::from_str(fold_name(level));
    // from_str maps unknown names to off; "warning" is the spelling used in config files.
    if (fold_name(level) == "warning") {
        parsed = spdlog::level::warn;
    } else if (parsed == spdlog::level::off && fold_name(level) != "off") {
        parsed = spdlog::level::info;
    }
    spdlog::set_level(parsed);
    if (format == LogFormat::Json) {
        auto formatter = std::make_unique<spdlog::pattern_formatter>(spdlog::pattern_time_type::utc);
        formatter->add_flag<JsonMessageFlag>('*').set_pattern(kJsonPattern);
        spdlog::set_formatter(std::move(formatter));
    } else {
        spdlog::set_pattern(kTextPattern);
    }
}

void log_phase_start(std::string_view phase, std::string_view device) {
    spdlog::info("phase={} device={} event=start", phase, device);
}

void log_phase_end(std::string_view phase,
                   std::string_view device,
                   std::optional<std::int64_t> duration_ms,
                   bool success) {
    if (duration_ms) {
        spdlog::info("phase={} device={} event=end success={} duration_ms={}",
                     phase,
                     device,
                     success,
                     *duration_ms);
    } else {
        spdlog::info("phase={} device={} event=end success={}", phase, device, success);
    }
}

void log_state_change(std::string_view device, std::string_view from, std::string_view to) {
    spdlog::info("device={} state {} -> {}", device, from, to);
}

void log_metrics(std::string_view device, const nlohmann::json& metrics) {
    spdlog::info("device={} metrics={}", device, metrics.dump());
}

}  // namespace wakeify::common
