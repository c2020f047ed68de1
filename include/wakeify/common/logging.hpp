#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace wakeify::common {

enum class LogFormat { Json, Text };

LogFormat parse_log_format(std::string_view value);

// Installs the process-wide spdlog pattern and level. Unknown levels fall back to info.
void configure_logging(std::string_view level, LogFormat format);

void log_phase_start(std::string_view phase, std::string_view device);
void log_phase_end(std::string_view phase,
                   std::string_view device,
                   std::optional<std::int64_t> duration_ms,
                   bool success);
void log_state_change(std::string_view device, std::string_view from, std::string_view to);
void log_metrics(std::string_view device, const nlohmann::json& metrics);

}  // namespace wakeify::common
