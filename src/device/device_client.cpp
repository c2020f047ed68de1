#include "wakeify/device/device_client.hpp"

#include "wakeify/model/discovery_result.hpp"

namespace wakeify::device {

std::string DeviceEndpoint::base_url() const {
    const bool ipv6 = address.find(':') != std::string::npos;
    const auto host = ipv6 ? "[" + address + "]" : address;
    return "http://" + host + ":" + std::to_string(port) + model::normalize_auth_path(auth_path) + "/";
}

std::string_view to_string(AddUserMode mode) noexcept {
    switch (mode) {
    case AddUserMode::AccessToken:
        return "access_token";
    case AddUserMode::BlobClientKey:
        return "blob_clientKey";
    }
    return "access_token";
}

}  // namespace wakeify::device
