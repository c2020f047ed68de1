#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "wakeify/config/config_loader.hpp"
#include "wakeify/model/device_profile.hpp"

namespace wakeify::app {

struct Options {
    std::string config_path;
    std::string device;
    bool discover_all{false};
    std::chrono::milliseconds discover_timeout{std::chrono::seconds(3)};
};

// Throws std::runtime_error on unknown or incomplete arguments.
Options parse_options(int argc, char** argv);
void print_usage(const char* argv0);

// Configured targets first, then profiles only known to the store. Learned names are merged by folded name.
std::vector<model::DeviceProfile> merge_profiles(std::vector<model::DeviceProfile> configured,
                                                 const std::vector<model::DeviceProfile>& stored);

// Returns the process exit code.
int run(const Options& options);

}  // namespace wakeify::app
