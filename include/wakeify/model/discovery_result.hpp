#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace wakeify::model {

inline constexpr std::string_view kDefaultAuthPath = "/spotifyconnect/zeroconf";

// Blank input yields kDefaultAuthPath; otherwise one leading '/' and no trailing '/'.
std::string normalize_auth_path(std::string_view path);

struct DiscoveryResult {
    std::optional<std::string> address;
    std::optional<std::uint16_t> port;
    std::optional<std::string> auth_path;
    std::string instance_name;
    std::map<std::string, std::string> txt_records;

    bool is_complete() const noexcept {
        return address.has_value() && port.has_value() && auth_path.has_value();
    }
};

}  // namespace wakeify::model
