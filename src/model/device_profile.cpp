#include "wakeify/model/device_profile.hpp"

#include "wakeify/common/string_util.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace wakeify::model {

std::vector<std::string> DeviceProfile::get_all_matching_names() const {
    std::vector<std::string> names;
    std::unordered_set<std::string> seen;
    auto append = [&](std::string_view raw) {
        auto folded = common::fold_name(raw);
        if (folded.empty()) {
            return;
        }
        if (seen.insert(folded).second) {
            names.push_back(std::move(folded));
        }
    };

    append(name);
    if (instance_name) {
        append(*instance_name);
    }
    for (const auto& learned : spotify_device_names) {
        append(learned);
    }
    return names;
}

bool DeviceProfile::matches_cloud_name(std::string_view cloud_name) const {
    const auto folded = common::fold_name(cloud_name);
    if (folded.empty()) {
        return false;
    }
    const auto names = get_all_matching_names();
    return std::find(names.begin(), names.end(), folded) != names.end();
}

bool DeviceProfile::learn_cloud_name(const std::string& cloud_name) {
    const auto folded = common::fold_name(cloud_name);
    if (folded.empty()) {
        return false;
    }
    for (const auto& known : spotify_device_names) {
        if (common::fold_name(known) == folded) {
            return false;
        }
    }
    spotify_device_names.push_back(common::trim_copy(cloud_name));
    return true;
}

DeviceProfile DeviceProfile::unregistered(std::string name) {
    DeviceProfile profile;
    profile.name = std::move(name);
    profile.volume_preset = kUnregisteredVolumePreset;
    return profile;
}

}  // namespace wakeify::model
