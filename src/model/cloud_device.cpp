#include "wakeify/model/cloud_device.hpp"

namespace wakeify::model {

CloudDevice CloudDevice::from_json(const nlohmann::json& node) {
    CloudDevice device;
    // The API reports restricted devices with a null id.
    if (node.contains("id") && node.at("id").is_string()) {
        device.id = node.at("id").get<std::string>();
    }
    device.name = node.value("name", "");
    device.is_active = node.value("is_active", false);
    if (node.contains("volume_percent") && node.at("volume_percent").is_number()) {
        device.volume_percent = node.at("volume_percent").get<int>();
    }
    device.type = node.value("type", "");
    device.is_private_session = node.value("is_private_session", false);
    device.is_restricted = node.value("is_restricted", false);
    return device;
}

}  // namespace wakeify::model
