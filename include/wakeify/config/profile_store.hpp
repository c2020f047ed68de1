#pragma once

#include <filesystem>
#include <vector>

#include <nlohmann/json.hpp>

#include "wakeify/model/device_profile.hpp"

namespace wakeify::config {

nlohmann::json profile_to_json(const model::DeviceProfile& profile);
model::DeviceProfile profile_from_json(const nlohmann::json& node);

/**
 * @brief Adds names learned in @p stored to @p configured.
 *
 * Configured fields win; the stored instance name and cloud aliases only
 * fill what the config leaves empty.
 */
void merge_learned(model::DeviceProfile& configured, const model::DeviceProfile& stored);

// JSON array of device profiles on disk.
class ProfileStore {
public:
    explicit ProfileStore(std::filesystem::path storage_path);

    // A missing file yields an empty list.
    std::vector<model::DeviceProfile> load() const;
    void save(const std::vector<model::DeviceProfile>& profiles) const;

    const std::filesystem::path& path() const noexcept { return storage_path_; }

private:
    std::filesystem::path storage_path_;
};

}  // namespace wakeify::config
