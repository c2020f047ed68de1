#include "wakeify/app/app.hpp"

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <utility>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "wakeify/cloud/web_api_directory.hpp"
#include "wakeify/common/clock.hpp"
#include "wakeify/common/logging.hpp"
#include "wakeify/common/string_util.hpp"
#include "wakeify/config/profile_store.hpp"
#include "wakeify/device/credential_provider.hpp"
#include "wakeify/device/zeroconf_client.hpp"
#include "wakeify/discovery/mdns_discovery.hpp"
#include "wakeify/net/http_transport.hpp"
#include "wakeify/playback/orchestrator.hpp"

namespace wakeify::app {

namespace {

constexpr const char* kDeviceUserAgent = "Wakeify-Zeroconf/1.0";
constexpr const char* kCloudUserAgent = "Wakeify/1.0";

// Runs a signal_set on its own io_context thread for the lifetime of a run.
class SignalWatcher {
public:
    explicit SignalWatcher(playback::Orchestrator& orchestrator)
        : signals_(io_context_, SIGINT, SIGTERM), work_(boost::asio::make_work_guard(io_context_)) {
        signals_.async_wait([&orchestrator](const boost::system::error_code& ec, int signal_number) {
            if (ec) {
                return;
            }
            spdlog::warn("Signal {} received, cancelling alarm run", signal_number);
            orchestrator.cancel();
        });
        thread_ = std::thread([this] { io_context_.run(); });
    }

    ~SignalWatcher() {
        boost::system::error_code ignored;
        signals_.cancel(ignored);
        work_.reset();
        io_context_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
    boost::asio::io_context io_context_;
    boost::asio::signal_set signals_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    std::thread thread_;
};

nlohmann::json discovery_to_json(const model::DiscoveryResult& result) {
    nlohmann::json node;
    node["instance_name"] = result.instance_name;
    node["address"] = result.address ? nlohmann::json(*result.address) : nlohmann::json(nullptr);
    node["port"] = result.port ? nlohmann::json(*result.port) : nlohmann::json(nullptr);
    node["auth_path"] = result.auth_path ? nlohmann::json(*result.auth_path) : nlohmann::json(nullptr);
    node["txt"] = result.txt_records;
    return node;
}

int run_discover_all(const Options& options) {
    discovery::MdnsDiscovery discovery;
    const auto results = discovery.discover_all(options.discover_timeout);
    auto out = nlohmann::json::array();
    for (const auto& result : results) {
        out.push_back(discovery_to_json(result));
    }
    std::cout << out.dump(2) << std::endl;
    spdlog::info("Discovered {} device(s)", results.size());
    return 0;
}

void save_profiles(const config::ProfileStore& store, const playback::Orchestrator& orchestrator) {
    try {
        store.save(orchestrator.profiles());
    } catch (const std::exception& ex) {
        spdlog::warn("Failed to save device profiles to {}: {}", store.path().string(), ex.what());
    }
}

int run_alarm(const Options& options, const config::AppConfig& config) {
    config::ProfileStore store(config.profile_store_path);
    auto profiles = merge_profiles(config.targets, store.load());

    common::SystemClock clock;
    common::CancellationToken cancel;

    auto device_transport = std::make_shared<net::BeastTransport>(kDeviceUserAgent);
    auto cloud_transport = std::make_shared<net::BeastTransport>(kCloudUserAgent);

    cloud::TokenManager tokens(config.oauth, cloud_transport, clock, std::chrono::seconds(120), &cancel);
    cloud::DirectorySettings directory_settings;
    directory_settings.retry_404_delay = common::seconds_to_millis(config.timings.retry_404_delay_s);
    cloud::WebApiDirectory directory(tokens, cloud_transport, clock, directory_settings, &cancel);

    discovery::MdnsDiscovery discovery({}, &cancel);
    device::ZeroconfClient zeroconf(device_transport, clock, net::RetryPolicy::device_default(), &cancel);
    device::UnavailableCredentialProvider credentials;

    playback::Orchestrator orchestrator(
        playback::Orchestrator::Dependencies{
            .directory = directory,
            .tokens = tokens,
            .discovery = discovery,
            .device_client = zeroconf,
            .credentials = credentials,
            .clock = clock,
            .cancel = cancel,
        },
        playback::Orchestrator::Settings{
            .timings = config.timings,
            .context_uri = config.context_uri,
            .shuffle = config.shuffle,
        },
        std::move(profiles));

    SignalWatcher watcher(orchestrator);
    try {
        const auto metrics = orchestrator.play_alarm(options.device);
        std::cout << metrics.to_json().dump(2) << std::endl;
        save_profiles(store, orchestrator);
        return 0;
    } catch (const playback::PlaybackFailure& failure) {
        spdlog::error("{}", failure.what());
        spdlog::error("Hint: {}", failure.hint());
        std::cout << failure.metrics().to_json().dump(2) << std::endl;
        save_profiles(store, orchestrator);
        return 1;
    }
}

}  // namespace

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " --config <config.yaml> --device <name>\n"
              << "       " << argv0 << " --config <config.yaml> --discover-all [--timeout <seconds>]\n";
}

Options parse_options(int argc, char** argv) {
    Options opt;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            opt.config_path = argv[++i];
        } else if (arg == "--device" && i + 1 < argc) {
            opt.device = common::trim_copy(argv[++i]);
        } else if (arg == "--discover-all") {
            opt.discover_all = true;
        } else if (arg == "--timeout" && i + 1 < argc) {
            const std::string value = argv[++i];
            double seconds = 0.0;
            try {
                seconds = std::stod(value);
            } catch (const std::logic_error&) {
                throw std::runtime_error("--timeout expects a number of seconds, got '" + value + "'");
            }
            if (seconds <= 0.0) {
                throw std::runtime_error("--timeout must be positive");
            }
            opt.discover_timeout = common::seconds_to_millis(seconds);
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            std::exit(0);
        } else {
            throw std::runtime_error("Unknown argument: " + arg);
        }
    }

    if (opt.config_path.empty()) {
        throw std::runtime_error("--config is required");
    }
    if (!opt.discover_all && opt.device.empty()) {
        throw std::runtime_error("--device is required unless --discover-all is given");
    }
    return opt;
}

std::vector<model::DeviceProfile> merge_profiles(std::vector<model::DeviceProfile> configured,
                                                 const std::vector<model::DeviceProfile>& stored) {
    for (const auto& entry : stored) {
        const auto key = common::fold_name(entry.name);
        bool merged = false;
        for (auto& profile : configured) {
            if (common::fold_name(profile.name) == key) {
                config::merge_learned(profile, entry);
                merged = true;
                break;
            }
        }
        if (!merged) {
            configured.push_back(entry);
        }
    }
    return configured;
}

int run(const Options& options) {
    try {
        const auto config = config::load_config(options.config_path);
        common::configure_logging(config.logging.level, common::parse_log_format(config.logging.format));
        if (options.discover_all) {
            return run_discover_all(options);
        }
        return run_alarm(options, config);
    } catch (const std::exception& ex) {
        spdlog::error("Fatal error: {}", ex.what());
        return 1;
    }
}

}  // namespace wakeify::app
