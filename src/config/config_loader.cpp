#include "wakeify/config/config_loader.hpp"

#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "wakeify/common/string_util.hpp"
#include "wakeify/model/discovery_result.hpp"

namespace wakeify::config {

namespace {

template <typename T>
T scalar_or_throw(const YAML::Node& node, const std::string& field) {
    if (!node || !node.IsScalar()) {
        throw std::runtime_error("Field '" + field + "' must be a scalar");
    }
    try {
        return node.as<T>();
    } catch (const YAML::BadConversion&) {
        throw std::runtime_error("Field '" + field + "' has an invalid value '" + node.Scalar() + "'");
    }
}

template <typename T>
void read_optional(const YAML::Node& parent, const char* key, const std::string& prefix, T& out) {
    if (auto node = parent[key]; node && !node.IsNull()) {
        out = scalar_or_throw<T>(node, prefix + key);
    }
}

void read_timings(const YAML::Node& node, model::Timings& timings) {
    if (!node || node.IsNull()) {
        return;
    }
    if (!node.IsMap()) {
        throw std::runtime_error("Field 'timings' must be a mapping");
    }
    const std::string prefix = "timings.";
    read_optional(node, "poll_fast_period_s", prefix, timings.poll_fast_period_s);
    read_optional(node, "total_poll_deadline_s", prefix, timings.total_poll_deadline_s);
    read_optional(node, "poll_deadline_extension_s", prefix, timings.poll_deadline_extension_s);
    read_optional(node, "debounce_after_seen_s", prefix, timings.debounce_after_seen_s);
    read_optional(node, "retry_404_delay_s", prefix, timings.retry_404_delay_s);
    read_optional(node, "failover_fire_after_s", prefix, timings.failover_fire_after_s);
    read_optional(node, "adduser_wait_after_s", prefix, timings.adduser_wait_after_s);
    read_optional(node, "mdns_discovery_timeout_s", prefix, timings.mdns_discovery_timeout_s);
    read_optional(node, "getinfo_timeout_s", prefix, timings.getinfo_timeout_s);
    read_optional(node, "adduser_timeout_s", prefix, timings.adduser_timeout_s);
    read_optional(node, "device_info_timeout_s", prefix, timings.device_info_timeout_s);
    read_optional(node, "verify_device_ready_timeout_s", prefix, timings.verify_device_ready_timeout_s);
    read_optional(node, "ip_wake_timeout_s", prefix, timings.ip_wake_timeout_s);
    read_optional(node, "confirmation_sleep_s", prefix, timings.confirmation_sleep_s);
    read_optional(node, "poll_sleep_fast_s", prefix, timings.poll_sleep_fast_s);
    read_optional(node, "poll_sleep_slow_s", prefix, timings.poll_sleep_slow_s);
}

model::DeviceProfile read_target(const YAML::Node& node) {
    model::DeviceProfile profile;
    profile.name = common::trim_copy(scalar_or_throw<std::string>(node["name"], "targets[].name"));
    if (profile.name.empty()) {
        throw std::runtime_error("Field 'targets[].name' must not be empty");
    }
    if (auto instance = node["instance_name"]; instance && !instance.IsNull()) {
        profile.instance_name = scalar_or_throw<std::string>(instance, "targets[].instance_name");
    }
    if (auto names = node["spotify_device_names"]; names && !names.IsNull()) {
        if (!names.IsSequence()) {
            throw std::runtime_error("Field 'targets[].spotify_device_names' must be a sequence");
        }
        for (const auto& name : names) {
            profile.learn_cloud_name(scalar_or_throw<std::string>(name, "targets[].spotify_device_names[]"));
        }
    }
    if (auto ip = node["ip"]; ip && !ip.IsNull()) {
        profile.ip = scalar_or_throw<std::string>(ip, "targets[].ip");
    }
    if (auto port = node["port"]; port && !port.IsNull()) {
        profile.port = scalar_or_throw<std::uint16_t>(port, "targets[].port");
    }
    if (auto auth_path = node["auth_path"]; auth_path && !auth_path.IsNull()) {
        profile.auth_path = model::normalize_auth_path(scalar_or_throw<std::string>(auth_path, "targets[].auth_path"));
    }
    if (auto volume = node["volume_preset"]; volume && !volume.IsNull()) {
        profile.volume_preset = scalar_or_throw<int>(volume, "targets[].volume_preset");
        if (profile.volume_preset < 0 || profile.volume_preset > 100) {
            throw std::runtime_error("Field 'targets[].volume_preset' must be within [0, 100]");
        }
    }
    return profile;
}

}  // namespace

std::optional<std::string> process_env(const char* name) {
    if (const char* value = std::getenv(name)) {
        return std::string(value);
    }
    return std::nullopt;
}

AppConfig parse_config(const YAML::Node& root) {
    if (!root || !root.IsMap()) {
        throw std::runtime_error("Config root must be a mapping");
    }

    AppConfig config;
    if (auto spotify = root["spotify"]; spotify && !spotify.IsNull()) {
        if (!spotify.IsMap()) {
            throw std::runtime_error("Field 'spotify' must be a mapping");
        }
        read_optional(spotify, "client_id", "spotify.", config.oauth.client_id);
        read_optional(spotify, "client_secret", "spotify.", config.oauth.client_secret);
        read_optional(spotify, "refresh_token", "spotify.", config.oauth.refresh_token);
        read_optional(spotify, "redirect_uri", "spotify.", config.oauth.redirect_uri);
        if (auto cache = spotify["token_cache"]; cache && !cache.IsNull()) {
            config.oauth.token_cache_path = scalar_or_throw<std::string>(cache, "spotify.token_cache");
        }
    }

    read_optional(root, "context_uri", "", config.context_uri);
    read_optional(root, "shuffle", "", config.shuffle);
    if (auto store = root["profile_store"]; store && !store.IsNull()) {
        config.profile_store_path = scalar_or_throw<std::string>(store, "profile_store");
    }

    if (auto logging = root["logging"]; logging && !logging.IsNull()) {
        read_optional(logging, "level", "logging.", config.logging.level);
        read_optional(logging, "format", "logging.", config.logging.format);
    }

    read_timings(root["timings"], config.timings);

    if (auto targets = root["targets"]; targets && !targets.IsNull()) {
        if (!targets.IsSequence()) {
            throw std::runtime_error("Field 'targets' must be a sequence");
        }
        for (const auto& target : targets) {
            config.targets.push_back(read_target(target));
        }
    }
    return config;
}

void apply_env_overrides(AppConfig& config, const EnvLookup& env) {
    auto apply = [&](const char* name, std::string& field) {
        if (auto value = env(name); value && !common::trim_copy(*value).empty()) {
            field = common::trim_copy(*value);
            spdlog::debug("Config value overridden by {}", name);
        }
    };
    apply("SPOTIFY_CLIENT_ID", config.oauth.client_id);
    apply("SPOTIFY_CLIENT_SECRET", config.oauth.client_secret);
    apply("SPOTIFY_REFRESH_TOKEN", config.oauth.refresh_token);
    apply("SPOTIFY_REDIRECT_URI", config.oauth.redirect_uri);
    apply("ALARM_CONTEXT_URI", config.context_uri);
    apply("LOG_LEVEL", config.logging.level);
    apply("LOG_FORMAT", config.logging.format);
}

void validate(const AppConfig& config) {
    config.timings.validate();
    if (common::trim_copy(config.context_uri).empty()) {
        throw std::invalid_argument("context_uri must be set in the config or ALARM_CONTEXT_URI");
    }
}

AppConfig load_config(const std::filesystem::path& path, const EnvLookup& env) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& ex) {
        throw std::runtime_error("Failed to read config " + path.string() + ": " + ex.what());
    }
    auto config = parse_config(root);
    apply_env_overrides(config, env);
    validate(config);
    return config;
}

}  // namespace wakeify::config
