#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

namespace wakeify::cloud {

// No usable credential, or the token endpoint rejected it.
class AuthError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class CloudApiError : public std::runtime_error {
public:
    CloudApiError(int status, const std::string& message, std::optional<std::chrono::milliseconds> retry_after = {})
        : std::runtime_error(message), status_(status), retry_after_(retry_after) {}

    // 0 when the request never produced an HTTP response.
    int status() const noexcept { return status_; }
    std::optional<std::chrono::milliseconds> retry_after() const noexcept { return retry_after_; }

private:
    int status_;
    std::optional<std::chrono::milliseconds> retry_after_;
};

}  // namespace wakeify::cloud
