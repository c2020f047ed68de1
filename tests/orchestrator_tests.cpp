#include "wakeify/playback/orchestrator.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "support/fake_services.hpp"
#include "support/manual_clock.hpp"

using namespace std::chrono_literals;
using wakeify::device::AddUserMode;
using wakeify::model::DeviceProfile;
using wakeify::playback::FailureReason;
using wakeify::playback::Orchestrator;
using wakeify::playback::PlaybackFailure;
using wakeify::testing::FakeDirectory;
using wakeify::testing::FakeDiscovery;

namespace {

constexpr const char* kContext = "spotify:playlist:37i9dQZF1DXcBWIGoYBM5M";

DeviceProfile bedroom_profile() {
    DeviceProfile profile;
    profile.name = "Bedroom Speaker";
    profile.volume_preset = 35;
    return profile;
}

struct Harness {
    wakeify::testing::ManualClock clock;
    wakeify::common::CancellationToken cancel;
    FakeDirectory directory{clock};
    wakeify::testing::FakeTokenSource tokens;
    FakeDiscovery discovery;
    wakeify::testing::FakeDeviceClient device;
    wakeify::testing::FakeCredentialProvider credentials;
    Orchestrator orchestrator;

    explicit Harness(std::vector<DeviceProfile> profiles = {bedroom_profile()})
        : orchestrator(Orchestrator::Dependencies{.directory = directory,
                                                  .tokens = tokens,
                                                  .discovery = discovery,
                                                  .device_client = device,
                                                  .credentials = credentials,
                                                  .clock = clock,
                                                  .cancel = cancel},
                       Orchestrator::Settings{.context_uri = kContext},
                       std::move(profiles)) {}

    std::optional<PlaybackFailure> run_expecting_failure(const std::string& name) {
        try {
            orchestrator.play_alarm(name);
        } catch (const PlaybackFailure& failure) {
            return failure;
        }
        return std::nullopt;
    }

    std::vector<std::int64_t> poll_offsets_ms() const {
        std::vector<std::int64_t> offsets;
        for (const auto& when : directory.get_devices_times) {
            offsets.push_back(std::chrono::duration_cast<std::chrono::milliseconds>(when - clock.origin()).count());
        }
        return offsets;
    }
};

}  // namespace

TEST_CASE("Device already in the cloud plays without local discovery", "[orchestrator]") {
    Harness h;
    h.directory.devices = {FakeDirectory::device("dev-1", "Bedroom Speaker", true)};

    const auto metrics = h.orchestrator.play_alarm("Bedroom Speaker");

    REQUIRE(metrics.branch == "webapi_direct");
    REQUIRE(h.discovery.calls == 0);
    REQUIRE(h.device.total_calls() == 0);
    REQUIRE(h.tokens.get_calls == 0);
    REQUIRE(h.directory.commands ==
            std::vector<std::string>{"transfer:dev-1:hold", "volume:dev-1:35", std::string("play:dev-1:") + kContext});
    REQUIRE(metrics.play_ms.has_value());
    REQUIRE(metrics.discovered_ms.has_value());
    REQUIRE(metrics.total_duration_ms.has_value());
    REQUIRE(metrics.errors.empty());
    REQUIRE(h.orchestrator.circuit_breakers().state("Bedroom Speaker").failure_count == 0);
}

TEST_CASE("Discovered device is activated and found by polling", "[orchestrator]") {
    Harness h;
    h.discovery.result = FakeDiscovery::found("Bedroom Speaker", "192.168.1.20");
    h.directory.devices = {FakeDirectory::device("dev-1", "Bedroom Speaker")};
    // fast path and the check right after addUser miss, then two polls.
    h.directory.hidden_calls = 3;

    const auto metrics = h.orchestrator.play_alarm("Bedroom Speaker");

    REQUIRE(metrics.branch == "primary");
    REQUIRE(metrics.errors.empty());
    REQUIRE(metrics.play_ms.has_value());
    REQUIRE(metrics.getinfo_ms.has_value());
    REQUIRE(metrics.adduser_ms.has_value());
    REQUIRE(metrics.cloud_visible_ms.has_value());
    REQUIRE(h.directory.get_devices_times.size() == 4);

    REQUIRE(h.discovery.last_hint == "Bedroom Speaker");
    REQUIRE(h.device.get_info_calls == 1);
    REQUIRE(h.device.add_user_modes == std::vector<AddUserMode>{AddUserMode::AccessToken});
    REQUIRE(h.device.access_tokens == std::vector<std::string>{"access-token"});
    REQUIRE(h.device.endpoints.front().address == "192.168.1.20");
    REQUIRE(h.device.endpoints.front().port == 4070);
    REQUIRE(h.device.endpoints.front().auth_path == "/zc");

    const auto stored = h.orchestrator.profile("bedroom speaker");
    REQUIRE(stored);
    REQUIRE(stored->instance_name == std::optional<std::string>("Bedroom Speaker"));
}

TEST_CASE("No advertisement and no cached address fails with no_mdns", "[orchestrator]") {
    Harness h;

    const auto failure = h.run_expecting_failure("Bedroom Speaker");

    REQUIRE(failure);
    REQUIRE(failure->reason() == FailureReason::NoMdns);
    REQUIRE(failure->tag() == "no_mdns");
    REQUIRE(failure->metrics().branch == "failed:no_mdns");
    REQUIRE(failure->metrics().errors.size() == 1);
    REQUIRE(failure->metrics().errors.front().phase == "discovery");
    REQUIRE_FALSE(failure->hint().empty());
    REQUIRE(h.device.total_calls() == 0);
    REQUIRE(h.orchestrator.circuit_breakers().state("Bedroom Speaker").failure_count == 1);
}

TEST_CASE("Device that never appears fails after the poll deadline", "[orchestrator]") {
    Harness h;
    h.discovery.result = FakeDiscovery::found("Bedroom Speaker", "192.168.1.20");

    SECTION("successful addUser extends the deadline") {
        const auto failure = h.run_expecting_failure("Bedroom Speaker");

        REQUIRE(failure);
        REQUIRE(failure->tag() == "not_in_devices_by_deadline");
        REQUIRE(failure->metrics().adduser_ms.has_value());
        REQUIRE(std::string(failure->what()).find("35 s") != std::string::npos);

        // 5 s addUser wait, then polling runs 35 s with the last poll at 34 s.
        const auto offsets = h.poll_offsets_ms();
        REQUIRE(offsets.back() == 39'000);
        REQUIRE(h.tokens.refresh_checks > 0);
    }

    SECTION("failed addUser keeps the base deadline") {
        h.device.add_user_token_ok = false;

        const auto failure = h.run_expecting_failure("Bedroom Speaker");

        REQUIRE(failure);
        REQUIRE(failure->tag() == "not_in_devices_by_deadline");
        REQUIRE(std::string(failure->what()).find("20 s") != std::string::npos);
        REQUIRE(h.poll_offsets_ms().back() == 19'000);
    }
}

TEST_CASE("Playback that is never confirmed fails with play_not_confirmed_t2", "[orchestrator]") {
    Harness h;
    h.directory.devices = {FakeDirectory::device("dev-1", "Bedroom Speaker")};
    h.directory.playing = false;

    const auto start = h.clock.elapsed();
    const auto failure = h.run_expecting_failure("Bedroom Speaker");

    REQUIRE(failure);
    REQUIRE(failure->tag() == "play_not_confirmed_t2");
    REQUIRE(failure->metrics().play_ms.has_value());
    REQUIRE(h.directory.playing_checks == 10);
    REQUIRE(h.clock.elapsed() - start == 2s);
    REQUIRE(h.orchestrator.circuit_breakers().state("Bedroom Speaker").failure_count == 1);
}

TEST_CASE("Open circuit breaker short-circuits the run", "[orchestrator][circuit_breaker]") {
    Harness h;
    for (int i = 0; i < 3; ++i) {
        REQUIRE(h.run_expecting_failure("Bedroom Speaker")->tag() == "no_mdns");
    }
    REQUIRE(h.orchestrator.circuit_breakers().state("Bedroom Speaker").is_open);

    const auto directory_calls = h.directory.call_count();
    const auto discovery_calls = h.discovery.calls;

    const auto failure = h.run_expecting_failure("Bedroom Speaker");

    REQUIRE(failure);
    REQUIRE(failure->tag() == "circuit_breaker_open");
    REQUIRE(h.directory.call_count() == directory_calls);
    REQUIRE(h.discovery.calls == discovery_calls);
    REQUIRE(h.device.total_calls() == 0);
    REQUIRE(h.tokens.get_calls == 0);
    REQUIRE(h.orchestrator.circuit_breakers().state("Bedroom Speaker").failure_count == 3);

    SECTION("cooldown lets the next run through") {
        h.clock.advance(600s);
        h.directory.devices = {FakeDirectory::device("dev-1", "Bedroom Speaker")};

        const auto metrics = h.orchestrator.play_alarm("Bedroom Speaker");

        REQUIRE(metrics.branch == "webapi_direct");
        REQUIRE(h.orchestrator.circuit_breakers().state("Bedroom Speaker").failure_count == 0);
    }

    SECTION("manual reset closes the breaker") {
        h.orchestrator.reset_circuit_breaker("Bedroom Speaker");
        REQUIRE(h.run_expecting_failure("Bedroom Speaker")->tag() == "no_mdns");
    }
}

TEST_CASE("Polling is fast for five seconds and slow afterwards", "[orchestrator]") {
    Harness h;
    h.discovery.result = FakeDiscovery::found("Bedroom Speaker", "192.168.1.20");
    h.device.add_user_token_ok = false;
    h.directory.devices = {FakeDirectory::device("dev-1", "Bedroom Speaker")};
    h.directory.visible_from = h.clock.now() + 6s;

    const auto metrics = h.orchestrator.play_alarm("Bedroom Speaker");

    std::vector<std::int64_t> expected{0};
    for (std::int64_t t = 0; t <= 5'000; t += 500) {
        expected.push_back(t);
    }
    expected.push_back(6'000);

    REQUIRE(h.poll_offsets_ms() == expected);
    REQUIRE(metrics.branch == "primary");
    REQUIRE(metrics.cloud_visible_ms == std::optional<std::int64_t>(6'000));
}

TEST_CASE("Cloud names reported by the device are learned and matched", "[orchestrator]") {
    Harness h;
    h.discovery.result = FakeDiscovery::found("Bedroom Speaker", "192.168.1.20");
    h.device.device_info = nlohmann::json{{"remoteName", "Bedroom Echo"}, {"deviceID", "abc"}};
    h.directory.devices = {FakeDirectory::device("dev-9", "Bedroom Echo")};
    h.directory.hidden_calls = 1;

    const auto metrics = h.orchestrator.play_alarm("Bedroom Speaker");

    REQUIRE(metrics.branch == "primary_adduser_immediate");
    const auto stored = h.orchestrator.profile("Bedroom Speaker");
    REQUIRE(stored);
    REQUIRE(stored->spotify_device_names == std::vector<std::string>{"Bedroom Echo"});
}

TEST_CASE("Cached address wakes the device before discovery", "[orchestrator]") {
    auto profile = bedroom_profile();
    profile.ip = "10.0.0.5";
    profile.port = 8080;
    Harness h(std::vector<DeviceProfile>{profile});
    h.directory.devices = {FakeDirectory::device("dev-1", "Bedroom Speaker")};
    h.directory.hidden_calls = 1;

    const auto metrics = h.orchestrator.play_alarm("Bedroom Speaker");

    REQUIRE(metrics.branch == "primary_ip_wakeup");
    REQUIRE(h.discovery.calls == 0);
    REQUIRE(h.device.endpoints.front().address == "10.0.0.5");
    REQUIRE(h.device.endpoints.front().port == 8080);
    REQUIRE(h.device.endpoints.front().auth_path == "/spotifyconnect/zeroconf");
}

TEST_CASE("Blob credentials are tried when token login fails", "[orchestrator]") {
    Harness h;
    h.discovery.result = FakeDiscovery::found("Bedroom Speaker", "192.168.1.20");
    h.device.add_user_token_ok = false;
    h.device.add_user_blob_ok = true;
    wakeify::device::AddUserCredentials blob;
    blob.user_name = "sleeper";
    blob.blob = "b10b";
    blob.client_key = "key";
    h.credentials.credentials = blob;
    h.directory.devices = {FakeDirectory::device("dev-1", "Bedroom Speaker")};
    h.directory.hidden_calls = 1;

    const auto metrics = h.orchestrator.play_alarm("Bedroom Speaker");

    REQUIRE(metrics.branch == "primary_adduser_immediate");
    REQUIRE(h.device.add_user_modes == std::vector<AddUserMode>{AddUserMode::AccessToken, AddUserMode::BlobClientKey});
}

TEST_CASE("Directory errors are recorded without aborting the run", "[orchestrator]") {
    Harness h;
    h.discovery.result = FakeDiscovery::found("Bedroom Speaker", "192.168.1.20");
    h.device.add_user_token_ok = false;
    h.directory.devices = {FakeDirectory::device("dev-1", "Bedroom Speaker")};
    h.directory.failing_calls = 2;

    const auto metrics = h.orchestrator.play_alarm("Bedroom Speaker");

    REQUIRE(metrics.branch == "primary");
    REQUIRE(metrics.errors.size() == 2);
    REQUIRE(metrics.errors[0].phase == "webapi_check");
    REQUIRE(metrics.errors[1].phase == "cloud_poll");
}

TEST_CASE("Missing credentials fail with auth_unavailable", "[orchestrator]") {
    Harness h;
    h.discovery.result = FakeDiscovery::found("Bedroom Speaker", "192.168.1.20");
    h.tokens.fail = true;

    const auto failure = h.run_expecting_failure("Bedroom Speaker");

    REQUIRE(failure);
    REQUIRE(failure->tag() == "auth_unavailable");
    REQUIRE(failure->metrics().errors.back().phase == "adduser");
    REQUIRE(h.device.add_user_modes.empty());
}

TEST_CASE("Cancellation aborts at the next sleep", "[orchestrator]") {
    Harness h;
    h.discovery.result = FakeDiscovery::found("Bedroom Speaker", "192.168.1.20");
    h.clock.set_on_sleep([&h](wakeify::common::Clock::duration) { h.orchestrator.cancel(); });

    const auto failure = h.run_expecting_failure("Bedroom Speaker");

    REQUIRE(failure);
    REQUIRE(failure->tag() == "cancelled");
    REQUIRE(failure->metrics().branch == "failed:cancelled");
    REQUIRE(h.orchestrator.circuit_breakers().state("Bedroom Speaker").failure_count == 0);
}

TEST_CASE("Unregistered devices use the fallback volume and are not stored", "[orchestrator]") {
    Harness h(std::vector<DeviceProfile>{});
    h.directory.devices = {FakeDirectory::device("dev-7", "Kitchen")};

    const auto metrics = h.orchestrator.play_alarm("Kitchen");

    REQUIRE(metrics.branch == "webapi_direct");
    REQUIRE(h.directory.commands.at(1) == "volume:dev-7:30");
    REQUIRE_FALSE(h.orchestrator.profile("Kitchen"));
    REQUIRE(h.orchestrator.device_status("Kitchen").registered == false);
    REQUIRE_THROWS_AS(h.orchestrator.device_status("Garage"), std::invalid_argument);
}

TEST_CASE("Profile registry is keyed by folded name", "[orchestrator]") {
    Harness h;

    DeviceProfile office;
    office.name = "Office";
    office.volume_preset = 50;
    h.orchestrator.upsert_profile(office);

    DeviceProfile replacement = bedroom_profile();
    replacement.name = "  BEDROOM speaker";
    replacement.volume_preset = 10;
    h.orchestrator.upsert_profile(replacement);

    const auto all = h.orchestrator.profiles();
    REQUIRE(all.size() == 2);
    REQUIRE(h.orchestrator.profile("bedroom speaker")->volume_preset == 10);
    REQUIRE(h.orchestrator.profile("OFFICE")->volume_preset == 50);

    DeviceProfile unnamed;
    REQUIRE_THROWS_AS(h.orchestrator.upsert_profile(unnamed), std::invalid_argument);
    office.volume_preset = 101;
    REQUIRE_THROWS_AS(h.orchestrator.upsert_profile(office), std::invalid_argument);
}

TEST_CASE("Runs under different spellings count against one breaker", "[orchestrator][circuit_breaker]") {
    Harness h;

    REQUIRE(h.run_expecting_failure("Bedroom Speaker")->tag() == "no_mdns");
    REQUIRE(h.run_expecting_failure("bedroom speaker")->tag() == "no_mdns");
    REQUIRE(h.run_expecting_failure(" BEDROOM SPEAKER ")->tag() == "no_mdns");

    REQUIRE(h.run_expecting_failure("Bedroom speaker")->tag() == "circuit_breaker_open");
    const auto status = h.orchestrator.device_status("bedroom SPEAKER");
    REQUIRE(status.registered);
    REQUIRE(status.circuit_breaker.is_open);
    REQUIRE(status.circuit_breaker.failure_count == 3);

    Harness unregistered(std::vector<DeviceProfile>{});
    REQUIRE(unregistered.run_expecting_failure("Garage")->tag() == "no_mdns");
    REQUIRE(unregistered.orchestrator.device_status("  garage").circuit_breaker.failure_count == 1);
}
