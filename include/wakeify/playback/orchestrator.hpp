#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "wakeify/cloud/cloud_directory.hpp"
#include "wakeify/cloud/token_manager.hpp"
#include "wakeify/common/clock.hpp"
#include "wakeify/device/credential_provider.hpp"
#include "wakeify/device/device_client.hpp"
#include "wakeify/discovery/discovery_service.hpp"
#include "wakeify/model/device_profile.hpp"
#include "wakeify/model/phase_metrics.hpp"
#include "wakeify/model/state.hpp"
#include "wakeify/model/timings.hpp"
#include "wakeify/playback/circuit_breaker.hpp"
#include "wakeify/playback/playback_failure.hpp"

namespace wakeify::playback {

class Orchestrator {
public:
    struct Dependencies {
        cloud::CloudDirectory& directory;
        cloud::AccessTokenSource& tokens;
        discovery::DiscoveryService& discovery;
        device::DeviceClient& device_client;
        device::CredentialProvider& credentials;
        common::Clock& clock;
        common::CancellationToken& cancel;
    };

    struct Settings {
        model::Timings timings{};
        std::string context_uri;
        bool shuffle{false};
        CircuitBreakerPolicy breaker{};
    };

    struct DeviceStatus {
        model::DeviceProfile profile;
        CircuitBreakerState circuit_breaker;
        bool registered{false};
    };

    Orchestrator(Dependencies deps, Settings settings, std::vector<model::DeviceProfile> profiles = {});

    /**
     * @brief Wakes @p device_name and starts the alarm context on it.
     *
     * Returns the metrics of a confirmed run. Every other outcome raises
     * PlaybackFailure whose metrics carry branch "failed:<tag>". Cloud names
     * learned during the run are committed to the profile registry either way.
     */
    model::PhaseMetrics play_alarm(const std::string& device_name);

    // Aborts the current run at its next sleep and every later run.
    void cancel();

    std::optional<model::DeviceProfile> profile(std::string_view name) const;
    std::vector<model::DeviceProfile> profiles() const;
    void upsert_profile(model::DeviceProfile profile);

    // Throws std::invalid_argument for a device with no profile and no breaker history.
    DeviceStatus device_status(std::string_view name) const;
    void reset_circuit_breaker(std::string_view name);

    const CircuitBreakerRegistry& circuit_breakers() const noexcept { return breakers_; }

private:
    struct RunContext {
        std::string device_name;
        model::DeviceProfile profile;
        bool registered{false};
        model::PhaseMetrics metrics;
        model::State state{model::State::Unknown};
        std::string phase{"init"};
        common::Clock::time_point started{};
    };

    void run_phases(RunContext& run);
    std::optional<model::CloudDevice> find_in_cloud(RunContext& run);
    std::optional<model::CloudDevice> pick_device(RunContext& run, const std::vector<model::CloudDevice>& devices);
    std::optional<model::CloudDevice> poll_until_visible(RunContext& run, bool extended);
    void learn_names_from_device(RunContext& run, const device::DeviceEndpoint& endpoint);
    void stage_play_confirm(RunContext& run, const model::CloudDevice& device, std::string_view branch);
    bool confirm_playback(const std::string& device_id);

    [[noreturn]] void fail(RunContext& run, FailureReason reason, const std::string& message);
    void finish(RunContext& run);
    void commit_profile(const RunContext& run);

    void enter_phase(RunContext& run, std::string_view phase);
    void set_state(RunContext& run, model::State state);
    void pause(std::chrono::milliseconds duration);
    std::int64_t elapsed_ms(common::Clock::time_point since) const;

    cloud::CloudDirectory& directory_;
    cloud::AccessTokenSource& tokens_;
    discovery::DiscoveryService& discovery_;
    device::DeviceClient& device_client_;
    device::CredentialProvider& credentials_;
    common::Clock& clock_;
    common::CancellationToken& cancel_;
    const Settings settings_;

    CircuitBreakerRegistry breakers_;
    mutable std::mutex profiles_mutex_;
    std::map<std::string, model::DeviceProfile> profiles_;
};

}  // namespace wakeify::playback
