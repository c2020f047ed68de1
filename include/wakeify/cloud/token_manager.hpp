#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "wakeify/common/clock.hpp"
#include "wakeify/net/http_client.hpp"

namespace wakeify::cloud {

struct OAuthCredentials {
    std::string client_id;
    std::string client_secret;
    std::string refresh_token;
    std::string redirect_uri{"https://localhost/callback"};
    std::filesystem::path token_cache_path;
    std::string token_endpoint{"https://accounts.spotify.com/api/token"};
};

struct TokenPayload {
    std::string access_token;
    std::string token_type{"Bearer"};
    std::int64_t expires_in{3600};
    std::int64_t expires_at{0};  // unix seconds
    std::string scope;
    std::string refresh_token;

    nlohmann::json to_json() const;
    static std::optional<TokenPayload> from_json(const nlohmann::json& node);
};

class AccessTokenSource {
public:
    virtual ~AccessTokenSource() = default;

    // Throws AuthError when no token can be produced.
    virtual std::string get_access_token() = 0;

    // Returns true iff this call performed the refresh.
    virtual bool refresh_token_if_needed(bool force = false) = 0;

    // Bumped on every successful refresh.
    virtual std::uint64_t generation() const = 0;
};

/**
 * @brief OAuth refresh-token holder shared by every cloud call.
 *
 * Tokens come from memory, then the cache file, then the configured
 * refresh credential. Concurrent callers that all see a stale token
 * trigger a single network refresh; the others reuse its result.
 */
class TokenManager final : public AccessTokenSource {
public:
    TokenManager(OAuthCredentials credentials,
                 std::shared_ptr<net::HttpTransport> transport,
                 common::Clock& clock,
                 std::chrono::seconds refresh_margin = std::chrono::seconds(120),
                 const common::CancellationToken* cancel = nullptr);

    std::string get_access_token() override;
    bool refresh_token_if_needed(bool force = false) override;
    std::uint64_t generation() const override { return generation_.load(); }

    std::optional<TokenPayload> current() const;

private:
    bool needs_refresh_locked() const;
    void load_cache_locked();
    TokenPayload request_refresh(const std::string& refresh_token);
    void persist(const TokenPayload& payload) const;
    std::int64_t unix_now() const;

    const OAuthCredentials credentials_;
    net::HttpClient http_;
    common::Clock& clock_;
    const std::chrono::seconds refresh_margin_;
    const common::CancellationToken* cancel_;

    mutable std::mutex state_mutex_;
    std::mutex refresh_mutex_;
    std::optional<TokenPayload> payload_;
    bool cache_loaded_{false};
    std::atomic<std::uint64_t> generation_{0};
};

}  // namespace wakeify::cloud
