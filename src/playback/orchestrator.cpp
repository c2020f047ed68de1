#include "wakeify/playback/orchestrator.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <utility>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "wakeify/cloud/errors.hpp"
#include "wakeify/common/logging.hpp"
#include "wakeify/common/string_util.hpp"

namespace wakeify::playback {

namespace {

using std::chrono::milliseconds;

// Explicit phase failure raised inside a run and converted by play_alarm.
class RunAborted : public std::runtime_error {
public:
    RunAborted(FailureReason reason, const std::string& message) : std::runtime_error(message), reason_(reason) {}

    FailureReason reason() const noexcept { return reason_; }

private:
    FailureReason reason_;
};

std::string hint_for(FailureReason reason, const std::string& device_name) {
    switch (reason) {
    case FailureReason::CircuitBreakerOpen:
        return "The device failed repeatedly and is paused for the cooldown window. Check it, then reset its circuit "
               "breaker to retry immediately.";
    case FailureReason::NoMdns:
        return "Check that '" + device_name +
               "' is powered on and on the same network, or record its IP address in the device profile.";
    case FailureReason::NotInDevicesByDeadline:
        return "Open the Spotify app, select '" + device_name +
               "' as the playback device and play any song once to authenticate it. Then retry the alarm.";
    case FailureReason::PlayNotConfirmed:
        return "Playback was started but never reported as playing. Check the device output and that the account "
               "can play on it.";
    case FailureReason::AuthUnavailable:
        return "Set SPOTIFY_CLIENT_ID, SPOTIFY_CLIENT_SECRET and SPOTIFY_REFRESH_TOKEN, or provide a valid token "
               "cache file.";
    case FailureReason::Cancelled:
        return "The run was aborted by shutdown.";
    case FailureReason::InternalError:
        break;
    }
    return "See the log for the underlying error.";
}

std::string join_names(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& name : names) {
        if (!out.empty()) {
            out += ", ";
        }
        out += name;
    }
    return out;
}

std::string format_seconds(double seconds) {
    return fmt::format("{:g}", seconds);
}

}  // namespace

Orchestrator::Orchestrator(Dependencies deps, Settings settings, std::vector<model::DeviceProfile> profiles)
    : directory_(deps.directory),
      tokens_(deps.tokens),
      discovery_(deps.discovery),
      device_client_(deps.device_client),
      credentials_(deps.credentials),
      clock_(deps.clock),
      cancel_(deps.cancel),
      settings_(std::move(settings)),
      breakers_(deps.clock, settings_.breaker) {
    settings_.timings.validate();
    for (auto& profile : profiles) {
        upsert_profile(std::move(profile));
    }
}

model::PhaseMetrics Orchestrator::play_alarm(const std::string& device_name) {
    RunContext run;
    run.device_name = device_name;
    run.started = clock_.now();
    if (auto stored = profile(device_name)) {
        run.profile = std::move(*stored);
        run.registered = true;
    } else {
        spdlog::info("Device {} is not registered, using a minimal profile", device_name);
        run.profile = model::DeviceProfile::unregistered(device_name);
    }

    spdlog::info("Starting alarm playback for device: {}", device_name);
    try {
        run_phases(run);
    } catch (const RunAborted& aborted) {
        fail(run, aborted.reason(), aborted.what());
    } catch (const cloud::AuthError& ex) {
        fail(run, FailureReason::AuthUnavailable, ex.what());
    } catch (const std::exception& ex) {
        fail(run, cancel_.cancelled() ? FailureReason::Cancelled : FailureReason::InternalError, ex.what());
    }
    finish(run);
    spdlog::info("Alarm playback for {} completed via {}", device_name, run.metrics.branch);
    return run.metrics;
}

void Orchestrator::run_phases(RunContext& run) {
    const auto& timings = settings_.timings;
    const auto& name = run.device_name;

    enter_phase(run, "circuit_check");
    if (breakers_.should_bypass_primary(name)) {
        throw RunAborted(FailureReason::CircuitBreakerOpen,
                         "Device '" + name + "' has failed repeatedly and its circuit breaker is open");
    }
    if (cancel_.cancelled()) {
        throw RunAborted(FailureReason::Cancelled, "Run cancelled before start");
    }

    enter_phase(run, "webapi_check");
    const auto webapi_start = clock_.now();
    std::optional<model::CloudDevice> found;
    try {
        found = find_in_cloud(run);
    } catch (const cloud::CloudApiError& ex) {
        spdlog::warn("Cloud check for {} failed: {}, proceeding with local discovery", name, ex.what());
        run.metrics.add_error(ex.what(), run.phase, clock_.wall_now());
    }
    if (found) {
        run.metrics.discovered_ms = elapsed_ms(webapi_start);
        common::log_phase_end(run.phase, name, run.metrics.discovered_ms, true);
        spdlog::info("Device {} already visible in the cloud, skipping local discovery", name);
        set_state(run, model::State::CloudVisible);
        stage_play_confirm(run, *found, "webapi_direct");
        return;
    }
    common::log_phase_end(run.phase, name, elapsed_ms(webapi_start), false);

    if (run.profile.ip) {
        enter_phase(run, "ip_wakeup");
        const auto wake_start = clock_.now();
        const device::DeviceEndpoint cached{
            .address = *run.profile.ip,
            .port = run.profile.port.value_or(80),
            .auth_path = run.profile.auth_path.value_or(std::string(model::kDefaultAuthPath)),
        };
        const bool woke = device_client_.get_info(cached, common::seconds_to_millis(timings.ip_wake_timeout_s));
        common::log_phase_end(run.phase, name, elapsed_ms(wake_start), woke);
        if (woke) {
            try {
                found = find_in_cloud(run);
            } catch (const cloud::CloudApiError& ex) {
                spdlog::warn("Cloud check after IP wake-up failed for {}: {}", name, ex.what());
                run.metrics.add_error(ex.what(), run.phase, clock_.wall_now());
            }
            if (found) {
                spdlog::info("Device {} appeared in the cloud after IP wake-up", name);
                run.metrics.cloud_visible_ms = elapsed_ms(run.started);
                set_state(run, model::State::CloudVisible);
                pause(common::seconds_to_millis(timings.debounce_after_seen_s));
                stage_play_confirm(run, *found, "primary_ip_wakeup");
                return;
            }
        }
    }

    enter_phase(run, "discovery");
    const auto discovery_start = clock_.now();
    const auto discovered =
        discovery_.discover_one(run.profile.name, common::seconds_to_millis(timings.mdns_discovery_timeout_s));
    run.metrics.discovered_ms = elapsed_ms(discovery_start);

    device::DeviceEndpoint endpoint;
    if (discovered.is_complete()) {
        if (!discovered.instance_name.empty() && !run.profile.instance_name) {
            run.profile.instance_name = discovered.instance_name;
            spdlog::debug("Stored instance name '{}' for {}", discovered.instance_name, name);
        }
        endpoint = device::DeviceEndpoint{
            .address = *discovered.address,
            .port = *discovered.port,
            .auth_path = *discovered.auth_path,
        };
    } else if (run.profile.ip) {
        endpoint = device::DeviceEndpoint{
            .address = *run.profile.ip,
            .port = run.profile.port.value_or(80),
            .auth_path = run.profile.auth_path.value_or(std::string(model::kDefaultAuthPath)),
        };
        spdlog::info("mDNS found nothing for {}, using cached address {}:{}", name, endpoint.address, endpoint.port);
    } else {
        common::log_phase_end(run.phase, name, run.metrics.discovered_ms, false);
        set_state(run, model::State::DeepSleepSuspected);
        throw RunAborted(FailureReason::NoMdns, "Device '" + name + "' could not be discovered on the network");
    }
    common::log_phase_end(run.phase, name, run.metrics.discovered_ms, discovered.is_complete());
    set_state(run, model::State::Discovered);

    enter_phase(run, "getinfo");
    const auto getinfo_start = clock_.now();
    const bool local_ok = device_client_.get_info(endpoint, common::seconds_to_millis(timings.getinfo_timeout_s));
    run.metrics.getinfo_ms = elapsed_ms(getinfo_start);
    common::log_phase_end(run.phase, name, run.metrics.getinfo_ms, local_ok);
    if (local_ok) {
        set_state(run, model::State::LocalAwake);
    } else {
        spdlog::warn("getInfo failed for {}, attempting addUser anyway", name);
    }

    enter_phase(run, "adduser");
    const auto adduser_start = clock_.now();
    const auto adduser_timeout = common::seconds_to_millis(timings.adduser_timeout_s);
    device::AddUserCredentials token_credentials;
    token_credentials.access_token = tokens_.get_access_token();
    bool auth_ok = device_client_.add_user(endpoint, device::AddUserMode::AccessToken, token_credentials, adduser_timeout);
    if (!auth_ok) {
        if (auto blob = credentials_.blob_credentials()) {
            spdlog::info("access_token mode failed for {}, trying blob_clientKey mode", name);
            auth_ok = device_client_.add_user(endpoint, device::AddUserMode::BlobClientKey, *blob, adduser_timeout);
        } else {
            spdlog::debug("No blob credentials available for {}", name);
        }
    }
    run.metrics.adduser_ms = elapsed_ms(adduser_start);
    common::log_phase_end(run.phase, name, run.metrics.adduser_ms, auth_ok);

    if (auth_ok) {
        set_state(run, model::State::LoggedIn);
        learn_names_from_device(run, endpoint);
        spdlog::info("Waiting {} s for {} to register after addUser", format_seconds(timings.adduser_wait_after_s), name);
        pause(common::seconds_to_millis(timings.adduser_wait_after_s));
        try {
            found = find_in_cloud(run);
        } catch (const cloud::CloudApiError& ex) {
            spdlog::debug("Quick check after addUser failed for {}: {}", name, ex.what());
        }
        if (found) {
            spdlog::info("Device {} appeared right after the addUser wait", name);
            run.metrics.cloud_visible_ms = elapsed_ms(run.started);
            set_state(run, model::State::CloudVisible);
            pause(common::seconds_to_millis(timings.debounce_after_seen_s));
            stage_play_confirm(run, *found, "primary_adduser_immediate");
            return;
        }
    } else {
        spdlog::warn("addUser failed for {}, continuing in case the device still appears", name);
    }

    enter_phase(run, "cloud_poll");
    const auto poll_start = clock_.now();
    found = poll_until_visible(run, auth_ok);
    if (!found) {
        common::log_phase_end(run.phase, name, elapsed_ms(poll_start), false);
        spdlog::error("Matching names tried for {}: [{}]", name, join_names(run.profile.get_all_matching_names()));
        if (auth_ok) {
            spdlog::error("addUser succeeded but {} never appeared; it may need one manual selection in the app", name);
        }
        const double deadline_s = timings.total_poll_deadline_s + (auth_ok ? timings.poll_deadline_extension_s : 0.0);
        throw RunAborted(FailureReason::NotInDevicesByDeadline,
                         "Device '" + name + "' did not appear in the cloud device list within " +
                             format_seconds(deadline_s) + " s");
    }
    common::log_phase_end(run.phase, name, elapsed_ms(poll_start), true);
    set_state(run, model::State::CloudVisible);
    pause(common::seconds_to_millis(timings.debounce_after_seen_s));
    stage_play_confirm(run, *found, "primary");
}

std::optional<model::CloudDevice> Orchestrator::find_in_cloud(RunContext& run) {
    return pick_device(run, directory_.get_devices(true));
}

std::optional<model::CloudDevice> Orchestrator::pick_device(RunContext& run,
                                                            const std::vector<model::CloudDevice>& devices) {
    for (const auto& device : devices) {
        if (device.name.empty() || !run.profile.matches_cloud_name(device.name)) {
            continue;
        }
        if (device.id.empty()) {
            spdlog::warn("Cloud device '{}' matches {} but has no id", device.name, run.device_name);
            continue;
        }
        if (run.profile.learn_cloud_name(device.name)) {
            spdlog::info("Learned cloud name '{}' for {}", device.name, run.device_name);
        }
        return device;
    }
    return std::nullopt;
}

std::optional<model::CloudDevice> Orchestrator::poll_until_visible(RunContext& run, bool extended) {
    const auto& timings = settings_.timings;
    auto deadline_s = timings.total_poll_deadline_s;
    if (extended) {
        deadline_s += timings.poll_deadline_extension_s;
        spdlog::info("addUser succeeded, extending poll deadline to {} s", format_seconds(deadline_s));
    }

    const auto poll_start = clock_.now();
    const auto deadline = poll_start + common::seconds_to_millis(deadline_s);
    const auto fast_until = poll_start + common::seconds_to_millis(timings.poll_fast_period_s);
    const auto fast_sleep = common::seconds_to_millis(timings.poll_sleep_fast_s);
    const auto slow_sleep = common::seconds_to_millis(timings.poll_sleep_slow_s);

    int attempts = 0;
    while (clock_.now() < deadline) {
        if (attempts > 0 && attempts % 5 == 0) {
            try {
                tokens_.refresh_token_if_needed(false);
            } catch (const cloud::AuthError& ex) {
                spdlog::debug("Token refresh during polling failed: {}", ex.what());
            }
        }
        ++attempts;

        try {
            const auto devices = directory_.get_devices(true);
            if (auto match = pick_device(run, devices)) {
                run.metrics.cloud_visible_ms = elapsed_ms(run.started);
                spdlog::info("Found {} as '{}' after {} poll(s)", run.device_name, match->name, attempts);
                return match;
            }
            if (attempts == 1 || attempts % 5 == 0) {
                std::vector<std::string> names;
                for (const auto& device : devices) {
                    names.push_back(device.name);
                }
                spdlog::info("Poll {} for {}: cloud lists [{}]", attempts, run.device_name, join_names(names));
            }
        } catch (const cloud::CloudApiError& ex) {
            spdlog::warn("Poll {} for {} failed: {}", attempts, run.device_name, ex.what());
            run.metrics.add_error(ex.what(), run.phase, clock_.wall_now());
        }

        pause(clock_.now() < fast_until ? fast_sleep : slow_sleep);
    }
    run.metrics.cloud_visible_ms = elapsed_ms(run.started);
    return std::nullopt;
}

void Orchestrator::learn_names_from_device(RunContext& run, const device::DeviceEndpoint& endpoint) {
    const auto info =
        device_client_.get_device_info(endpoint, common::seconds_to_millis(settings_.timings.device_info_timeout_s));
    if (!info) {
        return;
    }
    static constexpr std::array<const char*, 4> kNameFields{"remoteName", "displayName", "name", "deviceName"};
    for (const auto* field : kNameFields) {
        auto it = info->find(field);
        if (it == info->end() || !it->is_string()) {
            continue;
        }
        const auto value = common::trim_copy(it->get<std::string>());
        if (!value.empty() && run.profile.learn_cloud_name(value)) {
            spdlog::info("Learned device name '{}' from getInfo for {}", value, run.device_name);
        }
    }
}

void Orchestrator::stage_play_confirm(RunContext& run, const model::CloudDevice& device, std::string_view branch) {
    const auto& name = run.device_name;

    enter_phase(run, "stage");
    directory_.put_transfer(device.id, false);
    directory_.put_volume(device.id, run.profile.volume_preset);
    set_state(run, model::State::Staged);
    common::log_phase_end(run.phase, name, std::nullopt, true);

    enter_phase(run, "play");
    const auto play_start = clock_.now();
    directory_.put_play(device.id, settings_.context_uri, settings_.shuffle);
    run.metrics.play_ms = elapsed_ms(play_start);
    common::log_phase_end(run.phase, name, run.metrics.play_ms, true);
    if (*run.metrics.play_ms > 1000) {
        spdlog::warn("Play phase for {} took {} ms", name, *run.metrics.play_ms);
    }

    enter_phase(run, "confirm");
    if (!confirm_playback(device.id)) {
        throw RunAborted(FailureReason::PlayNotConfirmed,
                         "Playback on '" + name + "' was not confirmed within " +
                             format_seconds(settings_.timings.failover_fire_after_s) + " s");
    }
    spdlog::info("Playback confirmed for {}", name);
    set_state(run, model::State::Playing);
    run.metrics.branch = std::string(branch);
    breakers_.record_success(name);
}

bool Orchestrator::confirm_playback(const std::string& device_id) {
    const auto& timings = settings_.timings;
    const auto deadline = clock_.now() + common::seconds_to_millis(timings.failover_fire_after_s);
    const auto check_timeout = common::seconds_to_millis(timings.verify_device_ready_timeout_s);
    while (clock_.now() < deadline) {
        if (directory_.is_playing_on(device_id, check_timeout)) {
            return true;
        }
        pause(common::seconds_to_millis(timings.confirmation_sleep_s));
    }
    return false;
}

void Orchestrator::fail(RunContext& run, FailureReason reason, const std::string& message) {
    const std::string tag(to_tag(reason));
    run.metrics.branch = "failed:" + tag;
    run.metrics.add_error(message, run.phase, clock_.wall_now());
    if (reason != FailureReason::CircuitBreakerOpen && reason != FailureReason::Cancelled) {
        breakers_.record_failure(run.device_name);
    }
    spdlog::error("Alarm failed for {} in phase {} ({}): {}", run.device_name, run.phase, tag, message);
    finish(run);
    throw PlaybackFailure(reason,
                          "Alarm playback failed for '" + run.device_name + "' (reason=" + tag + "): " + message,
                          hint_for(reason, run.device_name),
                          run.metrics);
}

void Orchestrator::finish(RunContext& run) {
    run.metrics.total_duration_ms = elapsed_ms(run.started);
    commit_profile(run);
    common::log_metrics(run.device_name, run.metrics.to_json());
}

void Orchestrator::commit_profile(const RunContext& run) {
    if (!run.registered) {
        return;
    }
    std::lock_guard lock(profiles_mutex_);
    auto it = profiles_.find(common::fold_name(run.profile.name));
    if (it == profiles_.end()) {
        return;
    }
    auto& stored = it->second;
    if (!stored.instance_name && run.profile.instance_name) {
        stored.instance_name = run.profile.instance_name;
    }
    for (const auto& learned : run.profile.spotify_device_names) {
        stored.learn_cloud_name(learned);
    }
}

void Orchestrator::cancel() {
    spdlog::warn("Cancelling alarm playback");
    cancel_.cancel();
}

std::optional<model::DeviceProfile> Orchestrator::profile(std::string_view name) const {
    std::lock_guard lock(profiles_mutex_);
    auto it = profiles_.find(common::fold_name(name));
    if (it == profiles_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<model::DeviceProfile> Orchestrator::profiles() const {
    std::lock_guard lock(profiles_mutex_);
    std::vector<model::DeviceProfile> out;
    out.reserve(profiles_.size());
    for (const auto& [key, stored] : profiles_) {
        out.push_back(stored);
    }
    return out;
}

void Orchestrator::upsert_profile(model::DeviceProfile profile) {
    const auto key = common::fold_name(profile.name);
    if (key.empty()) {
        throw std::invalid_argument("Device profile requires a name");
    }
    if (profile.volume_preset < 0 || profile.volume_preset > 100) {
        throw std::invalid_argument("Volume preset for '" + profile.name + "' must be within [0, 100]");
    }
    std::lock_guard lock(profiles_mutex_);
    profiles_.insert_or_assign(key, std::move(profile));
}

Orchestrator::DeviceStatus Orchestrator::device_status(std::string_view name) const {
    DeviceStatus status;
    if (auto stored = profile(name)) {
        status.profile = std::move(*stored);
        status.registered = true;
    } else {
        const auto key = common::fold_name(name);
        const auto entries = breakers_.snapshot();
        const bool known = std::any_of(entries.begin(), entries.end(), [&](const CircuitBreakerRegistry::Entry& entry) {
            return entry.device_name == key;
        });
        if (!known) {
            throw std::invalid_argument("Target device '" + std::string(name) + "' not found");
        }
        status.profile = model::DeviceProfile::unregistered(std::string(name));
    }
    status.circuit_breaker = breakers_.state(name);
    return status;
}

void Orchestrator::reset_circuit_breaker(std::string_view name) {
    breakers_.reset(name);
}

void Orchestrator::enter_phase(RunContext& run, std::string_view phase) {
    run.phase = std::string(phase);
    common::log_phase_start(phase, run.device_name);
}

void Orchestrator::set_state(RunContext& run, model::State state) {
    if (run.state == state) {
        return;
    }
    common::log_state_change(run.device_name, model::to_string(run.state), model::to_string(state));
    run.state = state;
}

void Orchestrator::pause(milliseconds duration) {
    if (!clock_.sleep_for(duration, &cancel_)) {
        throw RunAborted(FailureReason::Cancelled, "Run cancelled");
    }
}

std::int64_t Orchestrator::elapsed_ms(common::Clock::time_point since) const {
    return common::to_millis(clock_.now() - since);
}

}  // namespace wakeify::playback
