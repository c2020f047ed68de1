#pragma once

#include <optional>

#include "wakeify/device/device_client.hpp"

namespace wakeify::device {

// Source of blob/clientKey credentials for the second addUser attempt.
class CredentialProvider {
public:
    virtual ~CredentialProvider() = default;

    virtual std::optional<AddUserCredentials> blob_credentials() = 0;
};

class UnavailableCredentialProvider final : public CredentialProvider {
public:
    std::optional<AddUserCredentials> blob_credentials() override { return std::nullopt; }
};

}  // namespace wakeify::device
