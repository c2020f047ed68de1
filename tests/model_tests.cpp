#include "wakeify/model/device_profile.hpp"
#include "wakeify/model/discovery_result.hpp"
#include "wakeify/model/phase_metrics.hpp"
#include "wakeify/model/state.hpp"
#include "wakeify/model/timings.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

using namespace wakeify::model;

TEST_CASE("Matching names are folded, deduplicated and ordered", "[model]") {
    DeviceProfile profile;
    profile.name = "  Bedroom Speaker ";
    profile.instance_name = "bedroom speaker";
    profile.spotify_device_names = {"Bedroom Echo", "", "BEDROOM ECHO"};

    REQUIRE(profile.get_all_matching_names() == std::vector<std::string>{"bedroom speaker", "bedroom echo"});
}

TEST_CASE("Cloud names match exactly after folding", "[model]") {
    DeviceProfile profile;
    profile.name = "Bedroom Speaker";
    profile.spotify_device_names = {"Bedroom Echo"};

    REQUIRE(profile.matches_cloud_name("bedroom speaker"));
    REQUIRE(profile.matches_cloud_name("  BEDROOM ECHO  "));
    REQUIRE_FALSE(profile.matches_cloud_name("Bedroom Speaker 2"));
    REQUIRE_FALSE(profile.matches_cloud_name("Bedroom"));
    REQUIRE_FALSE(profile.matches_cloud_name("   "));
}

TEST_CASE("Learning a cloud name is idempotent", "[model]") {
    DeviceProfile profile;
    profile.name = "Kitchen";

    REQUIRE(profile.learn_cloud_name(" Kitchen Echo "));
    REQUIRE_FALSE(profile.learn_cloud_name("kitchen echo"));
    REQUIRE_FALSE(profile.learn_cloud_name(""));
    REQUIRE(profile.spotify_device_names == std::vector<std::string>{"Kitchen Echo"});
}

TEST_CASE("Unregistered profiles use the fallback volume", "[model]") {
    const auto profile = DeviceProfile::unregistered("Garage");
    REQUIRE(profile.name == "Garage");
    REQUIRE(profile.volume_preset == kUnregisteredVolumePreset);
    REQUIRE_FALSE(profile.ip);
    REQUIRE(DeviceProfile{}.volume_preset == kDefaultVolumePreset);
}

TEST_CASE("Auth paths are normalised", "[model]") {
    REQUIRE(normalize_auth_path("/zc") == "/zc");
    REQUIRE(normalize_auth_path("zc/") == "/zc");
    REQUIRE(normalize_auth_path(" //spotifyconnect/zeroconf// ") == "/spotifyconnect/zeroconf");
    REQUIRE(normalize_auth_path("") == "/spotifyconnect/zeroconf");
    REQUIRE(normalize_auth_path("/") == "/spotifyconnect/zeroconf");
}

TEST_CASE("Discovery results are complete only with address, port and path", "[model]") {
    DiscoveryResult result;
    result.address = "10.0.0.2";
    result.port = 80;
    REQUIRE_FALSE(result.is_complete());
    result.auth_path = "/zc";
    REQUIRE(result.is_complete());
}

TEST_CASE("Metrics serialise missing timings as null", "[model]") {
    PhaseMetrics metrics;
    metrics.discovered_ms = 120;
    metrics.branch = "failed:no_mdns";
    metrics.add_error("not found", "discovery", std::chrono::system_clock::from_time_t(1'700'000'000) + std::chrono::milliseconds(42));

    const auto json = metrics.to_json();
    REQUIRE(json.at("discovered_ms") == 120);
    REQUIRE(json.at("play_ms").is_null());
    REQUIRE(json.at("total_duration_ms").is_null());
    REQUIRE(json.at("branch") == "failed:no_mdns");
    REQUIRE(json.at("errors").size() == 1);
    REQUIRE(json.at("errors")[0].at("phase") == "discovery");
    REQUIRE(json.at("errors")[0].at("timestamp") == "2023-11-14T22:13:20.042Z");
}

TEST_CASE("Default timings are valid and ranges are enforced", "[model]") {
    Timings timings;
    REQUIRE_NOTHROW(timings.validate());

    timings.total_poll_deadline_s = 4.0;
    REQUIRE_THROWS_AS(timings.validate(), std::invalid_argument);

    timings = Timings{};
    timings.ip_wake_timeout_s = 11.0;
    try {
        timings.validate();
        FAIL("expected invalid_argument");
    } catch (const std::invalid_argument& ex) {
        REQUIRE(std::string(ex.what()).find("ip_wake_timeout_s") != std::string::npos);
    }
}

TEST_CASE("States print in upper case", "[model]") {
    REQUIRE(to_string(State::Unknown) == "UNKNOWN");
    REQUIRE(to_string(State::CloudVisible) == "CLOUD_VISIBLE");
    REQUIRE(to_string(State::DeepSleepSuspected) == "DEEP_SLEEP_SUSPECTED");
}
