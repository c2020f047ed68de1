#include "wakeify/config/config_loader.hpp"
#include "wakeify/config/profile_store.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "wakeify/app/app.hpp"
#include "wakeify/common/logging.hpp"

using wakeify::config::AppConfig;
using wakeify::config::EnvLookup;
using wakeify::config::ProfileStore;
using wakeify::model::DeviceProfile;

namespace {

constexpr const char* kFullConfig = R"(
spotify:
  client_id: abc
  client_secret: shh
  refresh_token: rt-1
  token_cache: /var/lib/wakeify/token.json
context_uri: spotify:playlist:37i9dQZF1DX
shuffle: true
profile_store: /var/lib/wakeify/devices.json
logging:
  level: debug
  format: text
timings:
  total_poll_deadline_s: 25
  poll_sleep_fast_s: 0.25
targets:
  - name: " Living Room "
    instance_name: living-room-speaker
    spotify_device_names: [Living Room Echo, living room echo]
    ip: 192.168.1.42
    port: 41771
    auth_path: zc/
    volume_preset: 20
  - name: Kitchen
)";

EnvLookup env_from(std::map<std::string, std::string> values) {
    return [values](const char* name) -> std::optional<std::string> {
        auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

std::filesystem::path temp_dir(const std::string& label) {
    static int counter = 0;
    const auto suffix = std::to_string(std::chrono::steady_clock::now().time_since_epoch().count() + counter++);
    return std::filesystem::temp_directory_path() / ("wakeify-" + label + "-" + suffix);
}

std::string error_of(const YAML::Node& root) {
    try {
        wakeify::config::parse_config(root);
    } catch (const std::exception& ex) {
        return ex.what();
    }
    return {};
}

wakeify::app::Options parse_args(std::vector<std::string> args) {
    args.insert(args.begin(), "wakeify");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    return wakeify::app::parse_options(static_cast<int>(argv.size()), argv.data());
}

}  // namespace

TEST_CASE("Full config is parsed", "[config]") {
    const auto config = wakeify::config::parse_config(YAML::Load(kFullConfig));

    REQUIRE(config.oauth.client_id == "abc");
    REQUIRE(config.oauth.client_secret == "shh");
    REQUIRE(config.oauth.refresh_token == "rt-1");
    REQUIRE(config.oauth.token_cache_path == std::filesystem::path("/var/lib/wakeify/token.json"));
    REQUIRE(config.context_uri == "spotify:playlist:37i9dQZF1DX");
    REQUIRE(config.shuffle);
    REQUIRE(config.profile_store_path == std::filesystem::path("/var/lib/wakeify/devices.json"));
    REQUIRE(config.logging.level == "debug");
    REQUIRE(config.logging.format == "text");
    REQUIRE(config.timings.total_poll_deadline_s == 25.0);
    REQUIRE(config.timings.poll_sleep_fast_s == 0.25);
    REQUIRE(config.timings.poll_sleep_slow_s == wakeify::model::Timings{}.poll_sleep_slow_s);

    REQUIRE(config.targets.size() == 2);
    const auto& living = config.targets[0];
    REQUIRE(living.name == "Living Room");
    REQUIRE(living.instance_name == std::optional<std::string>("living-room-speaker"));
    REQUIRE(living.spotify_device_names == std::vector<std::string>{"Living Room Echo"});
    REQUIRE(living.ip == std::optional<std::string>("192.168.1.42"));
    REQUIRE(living.port == std::optional<std::uint16_t>(41771));
    REQUIRE(living.auth_path == std::optional<std::string>("/zc"));
    REQUIRE(living.volume_preset == 20);

    const auto& kitchen = config.targets[1];
    REQUIRE_FALSE(kitchen.ip);
    REQUIRE(kitchen.volume_preset == wakeify::model::kDefaultVolumePreset);

    REQUIRE_NOTHROW(wakeify::config::validate(config));
}

TEST_CASE("Environment values override the file", "[config]") {
    auto config = wakeify::config::parse_config(YAML::Load(kFullConfig));
    wakeify::config::apply_env_overrides(config,
                                         env_from({{"SPOTIFY_CLIENT_ID", " env-client "},
                                                   {"SPOTIFY_REFRESH_TOKEN", "   "},
                                                   {"ALARM_CONTEXT_URI", "spotify:album:42"},
                                                   {"LOG_LEVEL", "warn"}}));

    REQUIRE(config.oauth.client_id == "env-client");
    REQUIRE(config.oauth.refresh_token == "rt-1");
    REQUIRE(config.context_uri == "spotify:album:42");
    REQUIRE(config.logging.level == "warn");
    REQUIRE(config.logging.format == "text");
}

TEST_CASE("Malformed config fields are rejected", "[config]") {
    REQUIRE(error_of(YAML::Load("[]")) == "Config root must be a mapping");
    REQUIRE(error_of(YAML::Load("context_uri: [a, b]")).find("must be a scalar") != std::string::npos);
    REQUIRE(error_of(YAML::Load("shuffle: maybe")).find("invalid value 'maybe'") != std::string::npos);
    REQUIRE(error_of(YAML::Load("timings: 5")) == "Field 'timings' must be a mapping");
    REQUIRE(error_of(YAML::Load("targets:\n  - ip: 10.0.0.1")).find("targets[].name") != std::string::npos);
    REQUIRE(error_of(YAML::Load("targets:\n  - name: A\n    volume_preset: 101")).find("[0, 100]") !=
            std::string::npos);
    REQUIRE(error_of(YAML::Load("targets:\n  - name: A\n    port: 70000")).find("targets[].port") !=
            std::string::npos);
}

TEST_CASE("Validation requires a context URI and sane timings", "[config]") {
    AppConfig config;
    REQUIRE_THROWS_AS(wakeify::config::validate(config), std::invalid_argument);

    config.context_uri = "spotify:album:1";
    REQUIRE_NOTHROW(wakeify::config::validate(config));

    config.timings.poll_sleep_slow_s = 0.0;
    REQUIRE_THROWS_AS(wakeify::config::validate(config), std::invalid_argument);
}

TEST_CASE("Config files are loaded from disk", "[config]") {
    const auto dir = temp_dir("config");
    std::filesystem::create_directories(dir);
    const auto path = dir / "wakeify.yaml";
    {
        std::ofstream output(path);
        output << kFullConfig;
    }

    const auto config = wakeify::config::load_config(path, env_from({}));
    REQUIRE(config.targets.size() == 2);

    REQUIRE_THROWS_AS(wakeify::config::load_config(dir / "missing.yaml", env_from({})), std::runtime_error);
    std::filesystem::remove_all(dir);
}

TEST_CASE("Profile store round-trips learned names", "[config][profiles]") {
    const auto dir = temp_dir("profiles");
    ProfileStore store(dir / "nested" / "devices.json");
    REQUIRE(store.load().empty());

    DeviceProfile profile;
    profile.name = "Living Room";
    profile.instance_name = "living-room-speaker";
    profile.spotify_device_names = {"Living Room Echo"};
    profile.ip = "192.168.1.42";
    profile.port = 41771;
    profile.auth_path = "/zc";
    profile.volume_preset = 20;
    store.save({profile, DeviceProfile::unregistered("Garage")});

    const auto loaded = store.load();
    REQUIRE(loaded.size() == 2);
    REQUIRE(loaded[0].name == "Living Room");
    REQUIRE(loaded[0].instance_name == profile.instance_name);
    REQUIRE(loaded[0].spotify_device_names == profile.spotify_device_names);
    REQUIRE(loaded[0].ip == profile.ip);
    REQUIRE(loaded[0].port == profile.port);
    REQUIRE(loaded[0].auth_path == profile.auth_path);
    REQUIRE(loaded[0].volume_preset == 20);
    REQUIRE_FALSE(loaded[1].ip);
    REQUIRE(loaded[1].volume_preset == wakeify::model::kUnregisteredVolumePreset);

    const auto json = wakeify::config::profile_to_json(loaded[1]);
    REQUIRE(json.at("instance_name").is_null());
    REQUIRE(json.at("port").is_null());

    std::filesystem::remove_all(dir);
}

TEST_CASE("Corrupt profile stores are reported", "[config][profiles]") {
    const auto dir = temp_dir("corrupt");
    std::filesystem::create_directories(dir);
    const auto path = dir / "devices.json";

    SECTION("not JSON") {
        std::ofstream(path) << "{not json";
        REQUIRE_THROWS_AS(ProfileStore(path).load(), std::runtime_error);
    }

    SECTION("not an array") {
        std::ofstream(path) << R"({"name": "Kitchen"})";
        REQUIRE_THROWS_AS(ProfileStore(path).load(), std::runtime_error);
    }

    SECTION("empty name") {
        std::ofstream(path) << R"([{"name": "  "}])";
        REQUIRE_THROWS_AS(ProfileStore(path).load(), std::runtime_error);
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("Stored names are merged into configured targets", "[config][profiles]") {
    DeviceProfile configured;
    configured.name = "Living Room";
    configured.volume_preset = 20;

    DeviceProfile stored;
    stored.name = "living room";
    stored.instance_name = "living-room-speaker";
    stored.spotify_device_names = {"Living Room Echo"};
    stored.volume_preset = 80;

    DeviceProfile extra;
    extra.name = "Office";

    const auto merged = wakeify::app::merge_profiles({configured}, {stored, extra});
    REQUIRE(merged.size() == 2);
    REQUIRE(merged[0].name == "Living Room");
    REQUIRE(merged[0].volume_preset == 20);
    REQUIRE(merged[0].instance_name == std::optional<std::string>("living-room-speaker"));
    REQUIRE(merged[0].spotify_device_names == std::vector<std::string>{"Living Room Echo"});
    REQUIRE(merged[1].name == "Office");

    configured.instance_name = "configured-instance";
    wakeify::config::merge_learned(configured, stored);
    REQUIRE(configured.instance_name == std::optional<std::string>("configured-instance"));
}

TEST_CASE("Command line options are parsed", "[app]") {
    const auto alarm = parse_args({"--config", "wakeify.yaml", "--device", " Kitchen "});
    REQUIRE(alarm.config_path == "wakeify.yaml");
    REQUIRE(alarm.device == "Kitchen");
    REQUIRE_FALSE(alarm.discover_all);

    const auto scan = parse_args({"--config", "wakeify.yaml", "--discover-all", "--timeout", "1.5"});
    REQUIRE(scan.discover_all);
    REQUIRE(scan.discover_timeout == std::chrono::milliseconds(1500));

    REQUIRE_THROWS_AS(parse_args({"--device", "Kitchen"}), std::runtime_error);
    REQUIRE_THROWS_AS(parse_args({"--config", "wakeify.yaml"}), std::runtime_error);
    REQUIRE_THROWS_AS(parse_args({"--config", "wakeify.yaml", "--discover-all", "--timeout", "0"}),
                      std::runtime_error);
    REQUIRE_THROWS_AS(parse_args({"--config", "wakeify.yaml", "--discover-all", "--timeout", "soon"}),
                      std::runtime_error);
    REQUIRE_THROWS_AS(parse_args({"--config", "wakeify.yaml", "--verbose"}), std::runtime_error);
}

TEST_CASE("Log formats are recognised", "[logging]") {
    using wakeify::common::LogFormat;
    REQUIRE(wakeify::common::parse_log_format("json") == LogFormat::Json);
    REQUIRE(wakeify::common::parse_log_format("TEXT") == LogFormat::Text);
}
