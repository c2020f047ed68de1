#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wakeify::model {

inline constexpr int kDefaultVolumePreset = 35;
inline constexpr int kUnregisteredVolumePreset = 30;

struct DeviceProfile {
    std::string name;
    std::optional<std::string> instance_name;
    std::vector<std::string> spotify_device_names;
    std::optional<std::string> ip;
    std::optional<std::uint16_t> port;
    std::optional<std::string> auth_path;
    int volume_preset{kDefaultVolumePreset};

    /**
     * @brief Every name known to refer to this device, trimmed and case-folded.
     *
     * Canonical name first, then the advertised instance name, then learned
     * cloud names. Duplicates and blanks are dropped; first-seen order is kept.
     */
    std::vector<std::string> get_all_matching_names() const;

    // Exact comparison against get_all_matching_names(); never a substring match.
    bool matches_cloud_name(std::string_view cloud_name) const;

    // Appends to spotify_device_names unless an equal (folded) name is already known.
    bool learn_cloud_name(const std::string& cloud_name);

    static DeviceProfile unregistered(std::string name);
};

}  // namespace wakeify::model
