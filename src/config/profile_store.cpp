#include "wakeify/config/profile_store.hpp"

#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "wakeify/common/string_util.hpp"
#include "wakeify/model/discovery_result.hpp"

namespace wakeify::config {

using json = nlohmann::json;

json profile_to_json(const model::DeviceProfile& profile) {
    json node;
    node["name"] = profile.name;
    node["instance_name"] = profile.instance_name ? json(*profile.instance_name) : json(nullptr);
    node["spotify_device_names"] = profile.spotify_device_names;
    node["ip"] = profile.ip ? json(*profile.ip) : json(nullptr);
    node["port"] = profile.port ? json(*profile.port) : json(nullptr);
    node["auth_path"] = profile.auth_path ? json(*profile.auth_path) : json(nullptr);
    node["volume_preset"] = profile.volume_preset;
    return node;
}

model::DeviceProfile profile_from_json(const json& node) {
    model::DeviceProfile profile;
    profile.name = common::trim_copy(node.at("name").get<std::string>());
    if (profile.name.empty()) {
        throw std::runtime_error("Device profile entry has an empty name");
    }
    if (node.contains("instance_name") && !node.at("instance_name").is_null()) {
        profile.instance_name = node.at("instance_name").get<std::string>();
    }
    if (node.contains("spotify_device_names")) {
        for (const auto& name : node.at("spotify_device_names")) {
            profile.learn_cloud_name(name.get<std::string>());
        }
    }
    if (node.contains("ip") && !node.at("ip").is_null()) {
        profile.ip = node.at("ip").get<std::string>();
    }
    if (node.contains("port") && !node.at("port").is_null()) {
        profile.port = node.at("port").get<std::uint16_t>();
    }
    if (node.contains("auth_path") && !node.at("auth_path").is_null()) {
        profile.auth_path = model::normalize_auth_path(node.at("auth_path").get<std::string>());
    }
    profile.volume_preset = node.value("volume_preset", model::kDefaultVolumePreset);
    return profile;
}

void merge_learned(model::DeviceProfile& configured, const model::DeviceProfile& stored) {
    if (!configured.instance_name && stored.instance_name) {
        configured.instance_name = stored.instance_name;
    }
    for (const auto& name : stored.spotify_device_names) {
        configured.learn_cloud_name(name);
    }
}

ProfileStore::ProfileStore(std::filesystem::path storage_path) : storage_path_(std::move(storage_path)) {}

std::vector<model::DeviceProfile> ProfileStore::load() const {
    std::vector<model::DeviceProfile> profiles;
    if (!std::filesystem::exists(storage_path_)) {
        return profiles;
    }

    std::ifstream input(storage_path_);
    if (!input) {
        throw std::runtime_error("Failed to open profile store: " + storage_path_.string());
    }

    json root;
    try {
        input >> root;
    } catch (const json::parse_error& ex) {
        throw std::runtime_error("Profile store " + storage_path_.string() + " is not valid JSON: " + ex.what());
    }
    if (!root.is_array()) {
        throw std::runtime_error("Profile store JSON must be an array");
    }
    for (const auto& entry : root) {
        profiles.push_back(profile_from_json(entry));
    }
    spdlog::debug("Loaded {} device profile(s) from {}", profiles.size(), storage_path_.string());
    return profiles;
}

void ProfileStore::save(const std::vector<model::DeviceProfile>& profiles) const {
    json root = json::array();
    for (const auto& profile : profiles) {
        root.push_back(profile_to_json(profile));
    }

    const auto parent = storage_path_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
    auto tmp = storage_path_;
    tmp += ".tmp";
    {
        std::ofstream output(tmp, std::ios::trunc);
        if (!output) {
            throw std::runtime_error("Failed to write profile store: " + tmp.string());
        }
        output << std::setw(2) << root;
    }
    std::filesystem::rename(tmp, storage_path_);
}

}  // namespace wakeify::config
