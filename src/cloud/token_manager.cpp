#include "wakeify/cloud/token_manager.hpp"

#include <fstream>
#include <iomanip>
#include <utility>
#include <vector>

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include "wakeify/cloud/errors.hpp"

namespace wakeify::cloud {

namespace {

using json = nlohmann::json;

std::string base64_encode(const std::string& input) {
    std::vector<unsigned char> output(4 * ((input.size() + 2) / 3) + 1);
    const int written = EVP_EncodeBlock(output.data(),
                                        reinterpret_cast<const unsigned char*>(input.data()),
                                        static_cast<int>(input.size()));
    if (written < 0) {
        throw AuthError("Failed to encode client credentials");
    }
    return std::string(reinterpret_cast<const char*>(output.data()), static_cast<std::size_t>(written));
}

}  // namespace

json TokenPayload::to_json() const {
    return {
        {"access_token", access_token},
        {"token_type", token_type},
        {"expires_in", expires_in},
        {"expires_at", expires_at},
        {"scope", scope},
        {"refresh_token", refresh_token},
    };
}

std::optional<TokenPayload> TokenPayload::from_json(const json& node) {
    if (!node.is_object()) {
        return std::nullopt;
    }
    TokenPayload payload;
    if (node.contains("access_token") && node.at("access_token").is_string()) {
        payload.access_token = node.at("access_token").get<std::string>();
    }
    payload.token_type = node.value("token_type", "Bearer");
    payload.expires_in = node.value("expires_in", static_cast<std::int64_t>(3600));
    payload.expires_at = node.value("expires_at", static_cast<std::int64_t>(0));
    payload.scope = node.value("scope", "");
    if (node.contains("refresh_token") && node.at("refresh_token").is_string()) {
        payload.refresh_token = node.at("refresh_token").get<std::string>();
    }
    if (payload.access_token.empty() && payload.refresh_token.empty()) {
        return std::nullopt;
    }
    return payload;
}

TokenManager::TokenManager(OAuthCredentials credentials,
                           std::shared_ptr<net::HttpTransport> transport,
                           common::Clock& clock,
                           std::chrono::seconds refresh_margin,
                           const common::CancellationToken* cancel)
    : credentials_(std::move(credentials)),
      http_(std::move(transport), clock),
      clock_(clock),
      refresh_margin_(refresh_margin),
      cancel_(cancel) {}

std::string TokenManager::get_access_token() {
    refresh_token_if_needed(false);
    std::lock_guard lock(state_mutex_);
    if (!payload_ || payload_->access_token.empty()) {
        throw AuthError("No access token available");
    }
    return payload_->access_token;
}

bool TokenManager::refresh_token_if_needed(bool force) {
    std::uint64_t observed_generation = 0;
    {
        std::lock_guard lock(state_mutex_);
        load_cache_locked();
        if (!force && !needs_refresh_locked()) {
            return false;
        }
        observed_generation = generation_.load();
    }

    std::lock_guard refresh_lock(refresh_mutex_);
    std::string refresh_token;
    {
        std::lock_guard lock(state_mutex_);
        // Another caller refreshed while this one waited for the refresh lock.
        if (generation_.load() != observed_generation && !needs_refresh_locked()) {
            return false;
        }
        if (payload_ && !payload_->refresh_token.empty()) {
            refresh_token = payload_->refresh_token;
        } else {
            refresh_token = credentials_.refresh_token;
        }
    }
    if (refresh_token.empty()) {
        throw AuthError("No refresh credential available: set SPOTIFY_REFRESH_TOKEN or provide a token cache file");
    }

    auto fresh = request_refresh(refresh_token);
    {
        std::lock_guard lock(state_mutex_);
        payload_ = fresh;
    }
    generation_.fetch_add(1);
    persist(fresh);
    spdlog::info("Access token refreshed, expires in {} s", fresh.expires_in);
    return true;
}

std::optional<TokenPayload> TokenManager::current() const {
    std::lock_guard lock(state_mutex_);
    return payload_;
}

bool TokenManager::needs_refresh_locked() const {
    if (!payload_ || payload_->access_token.empty()) {
        return true;
    }
    return payload_->expires_at - unix_now() < refresh_margin_.count();
}

void TokenManager::load_cache_locked() {
    if (cache_loaded_ || payload_) {
        return;
    }
    cache_loaded_ = true;
    if (credentials_.token_cache_path.empty() || !std::filesystem::exists(credentials_.token_cache_path)) {
        return;
    }
    std::ifstream input(credentials_.token_cache_path);
    if (!input) {
        spdlog::warn("Failed to open token cache {}", credentials_.token_cache_path.string());
        return;
    }
    const auto root = json::parse(input, nullptr, false);
    if (root.is_discarded()) {
        spdlog::warn("Token cache {} is not valid JSON, ignoring it", credentials_.token_cache_path.string());
        return;
    }
    payload_ = TokenPayload::from_json(root);
    if (payload_) {
        spdlog::debug("Loaded token cache from {}", credentials_.token_cache_path.string());
    }
}

TokenPayload TokenManager::request_refresh(const std::string& refresh_token) {
    if (credentials_.client_id.empty() || credentials_.client_secret.empty()) {
        throw AuthError("Client id and secret are required to refresh the access token");
    }

    net::HttpRequest request;
    request.method = net::HttpMethod::Post;
    request.url = credentials_.token_endpoint;
    request.timeout = std::chrono::seconds(10);
    request.headers = {
        {"Authorization", "Basic " + base64_encode(credentials_.client_id + ":" + credentials_.client_secret)},
        {"Content-Type", "application/x-www-form-urlencoded"},
    };
    request.body = net::form_encode({{"grant_type", "refresh_token"}, {"refresh_token", refresh_token}});

    net::HttpResponse response;
    try {
        response = http_.send(request, net::RetryPolicy::cloud_default(), cancel_);
    } catch (const net::TransportError& ex) {
        throw AuthError(std::string("Token endpoint unreachable: ") + ex.what());
    }

    const auto body = json::parse(response.body, nullptr, false);
    if (response.status != 200) {
        std::string reason = "HTTP " + std::to_string(response.status);
        if (!body.is_discarded() && body.is_object() && body.contains("error")) {
            reason += " " + body.at("error").dump();
        }
        throw AuthError("Token endpoint rejected the refresh credential: " + reason);
    }
    if (body.is_discarded() || !body.is_object() || !body.contains("access_token")) {
        throw AuthError("Token endpoint returned a response without access_token");
    }

    TokenPayload payload;
    payload.access_token = body.at("access_token").get<std::string>();
    payload.token_type = body.value("token_type", "Bearer");
    payload.expires_in = body.value("expires_in", static_cast<std::int64_t>(3600));
    payload.expires_at = unix_now() + payload.expires_in;
    payload.scope = body.value("scope", "");
    payload.refresh_token = body.value("refresh_token", refresh_token);
    return payload;
}

void TokenManager::persist(const TokenPayload& payload) const {
    const auto& path = credentials_.token_cache_path;
    if (path.empty()) {
        return;
    }
    std::error_code ec;
    const auto parent = path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }
    const auto staging = path.string() + ".tmp";
    {
        std::ofstream output(staging, std::ios::trunc);
        if (!output) {
            spdlog::warn("Failed to write token cache {}", staging);
            return;
        }
        output << std::setw(2) << payload.to_json();
    }
    std::filesystem::rename(staging, path, ec);
    if (ec) {
        spdlog::warn("Failed to replace token cache {}: {}", path.string(), ec.message());
    }
}

std::int64_t TokenManager::unix_now() const {
    return std::chrono::duration_cast<std::chrono::seconds>(clock_.wall_now().time_since_epoch()).count();
}

}  // namespace wakeify::cloud
