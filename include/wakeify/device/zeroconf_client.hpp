#pragma once

#include <memory>

#include "wakeify/common/clock.hpp"
#include "wakeify/device/device_client.hpp"
#include "wakeify/net/http_client.hpp"

namespace wakeify::device {

class ZeroconfClient final : public DeviceClient {
public:
    ZeroconfClient(std::shared_ptr<net::HttpTransport> transport,
                   common::Clock& clock,
                   net::RetryPolicy retry = net::RetryPolicy::device_default(),
                   const common::CancellationToken* cancel = nullptr);

    bool get_info(const DeviceEndpoint& endpoint, std::chrono::milliseconds timeout) override;

    std::optional<nlohmann::json> get_device_info(const DeviceEndpoint& endpoint,
                                                  std::chrono::milliseconds timeout) override;

    /**
     * @brief POSTs addUser with a JSON body.
     *
     * Devices that answer 415 get the same fields form-encoded. Returns
     * true only on HTTP 200.
     */
    bool add_user(const DeviceEndpoint& endpoint,
                  AddUserMode mode,
                  const AddUserCredentials& credentials,
                  std::chrono::milliseconds timeout) override;

    HealthReport check_health(const DeviceEndpoint& endpoint, std::chrono::milliseconds timeout) override;

private:
    std::optional<net::HttpResponse> request_info(const DeviceEndpoint& endpoint, std::chrono::milliseconds timeout);

    net::HttpClient http_;
    common::Clock& clock_;
    net::RetryPolicy retry_;
    const common::CancellationToken* cancel_;
};

}  // namespace wakeify::device
