#include "wakeify/cloud/web_api_directory.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

#include "wakeify/cloud/errors.hpp"

namespace wakeify::cloud {

namespace {

using json = nlohmann::json;

std::string api_error_message(const net::HttpResponse& response) {
    const auto body = json::parse(response.body, nullptr, false);
    if (!body.is_discarded() && body.is_object() && body.contains("error")) {
        const auto& error = body.at("error");
        if (error.is_object()) {
            return error.value("message", "");
        }
        if (error.is_string()) {
            return error.get<std::string>();
        }
    }
    return {};
}

}  // namespace

std::optional<std::string> playlist_id_from_uri(std::string_view context_uri) {
    constexpr std::string_view kUriPrefix = "spotify:playlist:";
    constexpr std::string_view kLinkMarker = "/playlist/";
    if (context_uri.substr(0, kUriPrefix.size()) == kUriPrefix) {
        auto id = context_uri.substr(kUriPrefix.size());
        if (!id.empty()) {
            return std::string(id);
        }
        return std::nullopt;
    }
    const auto marker = context_uri.find(kLinkMarker);
    if (marker != std::string_view::npos) {
        auto id = context_uri.substr(marker + kLinkMarker.size());
        id = id.substr(0, id.find_first_of("?#/"));
        if (!id.empty()) {
            return std::string(id);
        }
    }
    return std::nullopt;
}

WebApiDirectory::WebApiDirectory(AccessTokenSource& tokens,
                                 std::shared_ptr<net::HttpTransport> transport,
                                 common::Clock& clock,
                                 DirectorySettings settings,
                                 const common::CancellationToken* cancel,
                                 std::uint32_t seed)
    : tokens_(tokens),
      http_(std::move(transport), clock),
      clock_(clock),
      settings_(std::move(settings)),
      cancel_(cancel),
      rng_(seed) {}

std::vector<model::CloudDevice> WebApiDirectory::get_devices(bool force_refresh) {
    if (!force_refresh) {
        std::lock_guard lock(cache_mutex_);
        if (device_cache_ && clock_.now() - device_cache_time_ < settings_.device_cache_ttl) {
            return *device_cache_;
        }
    }

    const auto response = execute(make_request(net::HttpMethod::Get, "/me/player/devices"), "get devices", settings_.retry);
    std::vector<model::CloudDevice> devices;
    const auto body = json::parse(response.body, nullptr, false);
    if (!body.is_discarded() && body.is_object() && body.contains("devices") && body.at("devices").is_array()) {
        for (const auto& node : body.at("devices")) {
            devices.push_back(model::CloudDevice::from_json(node));
        }
    } else {
        spdlog::warn("Device list response had no devices array");
    }

    std::lock_guard lock(cache_mutex_);
    device_cache_ = devices;
    device_cache_time_ = clock_.now();
    spdlog::debug("Cloud directory lists {} device(s)", devices.size());
    return devices;
}

void WebApiDirectory::put_transfer(const std::string& device_id, bool play) {
    auto request = make_request(net::HttpMethod::Put, "/me/player");
    request.headers.emplace_back("Content-Type", "application/json");
    request.body = json{{"device_ids", json::array({device_id})}, {"play", play}}.dump();
    execute(std::move(request), "transfer playback", settings_.retry);
    invalidate_device_cache();
    spdlog::info("Transferred playback to device {} (play={})", device_id, play);
}

void WebApiDirectory::put_volume(const std::string& device_id, int percent) {
    const auto clamped = std::clamp(percent, 0, 100);
    auto request = make_request(net::HttpMethod::Put,
                                "/me/player/volume?volume_percent=" + std::to_string(clamped) +
                                    "&device_id=" + net::url_encode(device_id));
    execute(std::move(request), "set volume", settings_.retry);
    invalidate_device_cache();
    spdlog::info("Set volume to {}% on device {}", clamped, device_id);
}

void WebApiDirectory::put_play(const std::string& device_id, const std::string& context_uri, bool shuffle) {
    try {
        start_playback(device_id, context_uri, shuffle);
    } catch (const CloudApiError& ex) {
        if (ex.status() != 404) {
            throw;
        }
        spdlog::warn("Device {} not found (404), retrying after {} ms", device_id, settings_.retry_404_delay.count());
        if (!clock_.sleep_for(settings_.retry_404_delay, cancel_)) {
            throw;
        }
        start_playback(device_id, context_uri, shuffle);
        spdlog::info("Retry started playback on device {}", device_id);
    }
    invalidate_device_cache();
}

void WebApiDirectory::start_playback(const std::string& device_id, const std::string& context_uri, bool shuffle) {
    if (shuffle) {
        try {
            execute(make_request(net::HttpMethod::Put,
                                 "/me/player/shuffle?state=true&device_id=" + net::url_encode(device_id)),
                    "set shuffle",
                    settings_.retry);
            spdlog::debug("Shuffle enabled on device {}", device_id);
        } catch (const CloudApiError& ex) {
            spdlog::warn("Failed to set shuffle on device {}: {}", device_id, ex.what());
        }
    }

    json body = json::object();
    if (!context_uri.empty()) {
        body["context_uri"] = context_uri;
        const auto playlist_id = shuffle ? playlist_id_from_uri(context_uri) : std::nullopt;
        if (playlist_id) {
            const auto total = playlist_track_count(*playlist_id);
            if (total && *total > 1) {
                const int position = random_offset(*total);
                body["offset"] = {{"position", position}};
                spdlog::debug("Starting shuffled playlist at position {} of {}", position, *total);
            }
        }
    }

    auto request = make_request(net::HttpMethod::Put, "/me/player/play?device_id=" + net::url_encode(device_id));
    request.headers.emplace_back("Content-Type", "application/json");
    request.body = body.dump();
    execute(std::move(request), "start playback", settings_.retry);
    spdlog::info("Started playback on device {} with context {}", device_id, context_uri.empty() ? "-" : context_uri);
}

void WebApiDirectory::pause_playback(const std::string& device_id) {
    execute(make_request(net::HttpMethod::Put, "/me/player/pause?device_id=" + net::url_encode(device_id)),
            "pause playback",
            settings_.retry);
    invalidate_device_cache();
    spdlog::info("Paused playback on device {}", device_id);
}

bool WebApiDirectory::is_playing_on(const std::string& device_id, std::chrono::milliseconds timeout) {
    auto request = make_request(net::HttpMethod::Get, "/me/player");
    request.timeout = timeout;
    try {
        const auto response = execute(std::move(request), "get playback state", net::RetryPolicy::none());
        if (response.status == 204 || response.body.empty()) {
            return false;
        }
        const auto body = json::parse(response.body, nullptr, false);
        if (body.is_discarded() || !body.is_object() || !body.contains("device") || !body.at("device").is_object()) {
            return false;
        }
        const auto& device = body.at("device");
        const bool on_device = device.contains("id") && device.at("id").is_string() &&
                               device.at("id").get<std::string>() == device_id;
        return on_device && body.value("is_playing", false);
    } catch (const CloudApiError& ex) {
        spdlog::debug("Playback state check for {} failed: {}", device_id, ex.what());
    } catch (const AuthError& ex) {
        spdlog::warn("Playback state check for {} has no token: {}", device_id, ex.what());
    }
    return false;
}

void WebApiDirectory::invalidate_device_cache() {
    std::lock_guard lock(cache_mutex_);
    device_cache_.reset();
}

net::HttpRequest WebApiDirectory::make_request(net::HttpMethod method, const std::string& path) const {
    net::HttpRequest request;
    request.method = method;
    request.url = settings_.api_base + path;
    request.timeout = settings_.request_timeout;
    return request;
}

std::string WebApiDirectory::authorization() {
    auto token = tokens_.get_access_token();
    const auto generation = tokens_.generation();
    std::lock_guard lock(session_mutex_);
    if (!session_ || session_->generation != generation || session_->authorization != "Bearer " + token) {
        session_ = Session{generation, "Bearer " + token};
        spdlog::debug("Cloud API session rebuilt for token generation {}", generation);
    }
    return session_->authorization;
}

net::HttpResponse WebApiDirectory::execute(net::HttpRequest request, std::string_view what, const net::RetryPolicy& policy) {
    bool refreshed = false;
    while (true) {
        auto attempt = request;
        attempt.headers.emplace_back("Authorization", authorization());

        net::HttpResponse response;
        try {
            response = http_.send(attempt, policy, cancel_);
        } catch (const net::TransportError& ex) {
            throw CloudApiError(0, std::string(what) + " failed: " + ex.what());
        }

        if (response.status == 401 && !refreshed) {
            spdlog::warn("{} returned 401, refreshing access token", what);
            refreshed = true;
            tokens_.refresh_token_if_needed(true);
            {
                std::lock_guard lock(session_mutex_);
                session_.reset();
            }
            continue;
        }
        if (response.ok()) {
            return response;
        }

        auto message = std::string(what) + " failed: HTTP " + std::to_string(response.status);
        if (auto detail = api_error_message(response); !detail.empty()) {
            message += " " + detail;
        }
        throw CloudApiError(response.status, message, net::parse_retry_after(response));
    }
}

std::optional<int> WebApiDirectory::playlist_track_count(const std::string& playlist_id) {
    {
        std::lock_guard lock(playlist_mutex_);
        auto it = playlist_cache_.find(playlist_id);
        if (it != playlist_cache_.end() && clock_.now() - it->second.fetched_at < settings_.playlist_cache_ttl) {
            return it->second.total_tracks;
        }
    }

    int total = 0;
    try {
        const auto response =
            execute(make_request(net::HttpMethod::Get, "/playlists/" + net::url_encode(playlist_id) + "?fields=tracks.total"),
                    "get playlist",
                    settings_.retry);
        const auto body = json::parse(response.body, nullptr, false);
        if (body.is_discarded() || !body.is_object() || !body.contains("tracks") || !body.at("tracks").is_object()) {
            spdlog::warn("Playlist {} response had no track count", playlist_id);
            return std::nullopt;
        }
        total = body.at("tracks").value("total", 0);
    } catch (const CloudApiError& ex) {
        spdlog::warn("Could not get playlist info for random offset: {}", ex.what());
        return std::nullopt;
    }

    std::lock_guard lock(playlist_mutex_);
    if (playlist_cache_.find(playlist_id) == playlist_cache_.end()) {
        playlist_order_.push_back(playlist_id);
    }
    playlist_cache_[playlist_id] = PlaylistEntry{total, clock_.now()};
    while (playlist_cache_.size() > settings_.playlist_cache_capacity && !playlist_order_.empty()) {
        playlist_cache_.erase(playlist_order_.front());
        playlist_order_.pop_front();
    }
    return total;
}

int WebApiDirectory::random_offset(int total_tracks) {
    std::lock_guard lock(rng_mutex_);
    std::uniform_int_distribution<int> distribution(0, total_tracks - 1);
    return distribution(rng_);
}

}  // namespace wakeify::cloud
