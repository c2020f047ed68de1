#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "wakeify/cloud/token_manager.hpp"
#include "wakeify/model/device_profile.hpp"
#include "wakeify/model/timings.hpp"

namespace wakeify::config {

struct LoggingConfig {
    std::string level{"info"};
    std::string format{"json"};
};

struct AppConfig {
    cloud::OAuthCredentials oauth;
    std::string context_uri;
    bool shuffle{false};
    std::filesystem::path profile_store_path{"data/devices.json"};
    LoggingConfig logging;
    model::Timings timings;
    std::vector<model::DeviceProfile> targets;
};

using EnvLookup = std::function<std::optional<std::string>(const char*)>;

std::optional<std::string> process_env(const char* name);

/**
 * @brief Reads a YAML config file, applies environment overrides and validates it.
 *
 * Throws std::runtime_error for malformed fields and std::invalid_argument
 * for out-of-range timings or a missing context URI.
 */
AppConfig load_config(const std::filesystem::path& path, const EnvLookup& env = process_env);

AppConfig parse_config(const YAML::Node& root);

// Non-empty environment values replace the corresponding config fields.
void apply_env_overrides(AppConfig& config, const EnvLookup& env);

void validate(const AppConfig& config);

}  // namespace wakeify::config
