#include "wakeify/device/zeroconf_client.hpp"

#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace wakeify::device {

namespace {

using Fields = std::vector<std::pair<std::string, std::string>>;

Fields add_user_fields(AddUserMode mode, const AddUserCredentials& credentials) {
    if (mode == AddUserMode::AccessToken) {
        return {{"tokenType", "accesstoken"}, {"accessToken", credentials.access_token}};
    }
    return {
        {"userName", credentials.user_name},
        {"blob", credentials.blob},
        {"clientKey", credentials.client_key},
        {"tokenType", credentials.token_type},
    };
}

std::string to_json_body(const Fields& fields) {
    nlohmann::json body = nlohmann::json::object();
    for (const auto& [key, value] : fields) {
        body[key] = value;
    }
    return body.dump();
}

std::string describe(const DeviceEndpoint& endpoint) {
    return endpoint.address + ":" + std::to_string(endpoint.port);
}

}  // namespace

ZeroconfClient::ZeroconfClient(std::shared_ptr<net::HttpTransport> transport,
                               common::Clock& clock,
                               net::RetryPolicy retry,
                               const common::CancellationToken* cancel)
    : http_(std::move(transport), clock), clock_(clock), retry_(retry), cancel_(cancel) {}

std::optional<net::HttpResponse> ZeroconfClient::request_info(const DeviceEndpoint& endpoint,
                                                              std::chrono::milliseconds timeout) {
    net::HttpRequest request;
    request.method = net::HttpMethod::Get;
    request.url = endpoint.base_url() + "?action=getInfo";
    request.timeout = timeout;
    try {
        return http_.send(request, retry_, cancel_);
    } catch (const net::TransportError& ex) {
        spdlog::warn("getInfo on {} failed: {}", describe(endpoint), ex.what());
    } catch (const std::invalid_argument& ex) {
        spdlog::warn("getInfo on {} has a malformed address: {}", describe(endpoint), ex.what());
    }
    return std::nullopt;
}

bool ZeroconfClient::get_info(const DeviceEndpoint& endpoint, std::chrono::milliseconds timeout) {
    auto response = request_info(endpoint, timeout);
    if (!response) {
        return false;
    }
    if (response->status == 200) {
        spdlog::info("Device {} is awake and responding", describe(endpoint));
        return true;
    }
    spdlog::warn("Device {} returned status {} for getInfo", describe(endpoint), response->status);
    return false;
}

std::optional<nlohmann::json> ZeroconfClient::get_device_info(const DeviceEndpoint& endpoint,
                                                              std::chrono::milliseconds timeout) {
    auto response = request_info(endpoint, timeout);
    if (!response || response->status != 200) {
        if (response) {
            spdlog::warn("Failed to get device info from {}: status {}", describe(endpoint), response->status);
        }
        return std::nullopt;
    }
    auto info = nlohmann::json::parse(response->body, nullptr, false);
    if (info.is_discarded() || !info.is_object()) {
        spdlog::warn("Device {} returned a getInfo body that is not a JSON object", describe(endpoint));
        return std::nullopt;
    }
    return info;
}

bool ZeroconfClient::add_user(const DeviceEndpoint& endpoint,
                              AddUserMode mode,
                              const AddUserCredentials& credentials,
                              std::chrono::milliseconds timeout) {
    const auto fields = add_user_fields(mode, credentials);

    net::HttpRequest request;
    request.method = net::HttpMethod::Post;
    request.url = endpoint.base_url() + "?action=addUser";
    request.timeout = timeout;
    request.headers = {{"Content-Type", "application/json"}};
    request.body = to_json_body(fields);

    try {
        auto response = http_.send(request, retry_, cancel_);
        if (response.status == 200) {
            spdlog::info("addUser ({}) succeeded on {} using JSON", to_string(mode), describe(endpoint));
            return true;
        }

        if (response.status == 415) {
            spdlog::debug("Device {} rejected JSON addUser with 415, retrying form-encoded", describe(endpoint));
            request.headers = {{"Content-Type", "application/x-www-form-urlencoded"}};
            request.body = net::form_encode(fields);
            response = http_.send(request, retry_, cancel_);
            if (response.status == 200) {
                spdlog::info("addUser ({}) succeeded on {} using form data", to_string(mode), describe(endpoint));
                return true;
            }
        }

        spdlog::warn("addUser ({}) failed on {}: status {}, response: {}",
                     to_string(mode),
                     describe(endpoint),
                     response.status,
                     response.body);
    } catch (const net::TransportError& ex) {
        spdlog::warn("addUser ({}) on {} failed: {}", to_string(mode), describe(endpoint), ex.what());
    } catch (const std::invalid_argument& ex) {
        spdlog::warn("addUser on {} has a malformed address: {}", describe(endpoint), ex.what());
    }
    return false;
}

HealthReport ZeroconfClient::check_health(const DeviceEndpoint& endpoint, std::chrono::milliseconds timeout) {
    HealthReport report;
    const auto started = clock_.now();

    net::HttpRequest request;
    request.method = net::HttpMethod::Get;
    request.url = endpoint.base_url() + "?action=getInfo";
    request.timeout = timeout;
    try {
        const auto response = http_.send(request, net::RetryPolicy::none(), cancel_);
        report.reachable = true;
        report.response_time_ms = common::to_millis(clock_.now() - started);
        if (response.status == 200) {
            report.responding = true;
            spdlog::debug("Device {} health check passed ({} ms)", describe(endpoint), *report.response_time_ms);
        } else {
            report.error = "HTTP " + std::to_string(response.status);
            spdlog::debug("Device {} health check failed: {}", describe(endpoint), *report.error);
        }
    } catch (const net::TransportError& ex) {
        const bool timed_out = ex.kind() == net::TransportError::Kind::Timeout;
        report.error = std::string(timed_out ? "Timeout: " : "Connection error: ") + ex.what();
        spdlog::debug("Device {} health check failed: {}", describe(endpoint), *report.error);
    } catch (const std::invalid_argument& ex) {
        report.error = std::string("Invalid address: ") + ex.what();
    }
    return report;
}

}  // namespace wakeify::device
