#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace wakeify::device {

struct DeviceEndpoint {
    std::string address;
    std::uint16_t port{80};
    std::string auth_path;

    std::string base_url() const;
};

enum class AddUserMode { AccessToken, BlobClientKey };

std::string_view to_string(AddUserMode mode) noexcept;

struct AddUserCredentials {
    std::string access_token;
    std::string user_name;
    std::string blob;
    std::string client_key;
    std::string token_type;
};

struct HealthReport {
    bool reachable{false};
    bool responding{false};
    std::optional<std::int64_t> response_time_ms;
    std::optional<std::string> error;
};

// Local zeroconf auth protocol spoken directly to a device. No operation throws.
class DeviceClient {
public:
    virtual ~DeviceClient() = default;

    virtual bool get_info(const DeviceEndpoint& endpoint, std::chrono::milliseconds timeout) = 0;

    virtual std::optional<nlohmann::json> get_device_info(const DeviceEndpoint& endpoint,
                                                          std::chrono::milliseconds timeout) = 0;

    virtual bool add_user(const DeviceEndpoint& endpoint,
                          AddUserMode mode,
                          const AddUserCredentials& credentials,
                          std::chrono::milliseconds timeout) = 0;

    virtual HealthReport check_health(const DeviceEndpoint& endpoint, std::chrono::milliseconds timeout) = 0;
};

}  // namespace wakeify::device
