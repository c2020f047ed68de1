#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "wakeify/cloud/cloud_directory.hpp"
#include "wakeify/cloud/token_manager.hpp"
#include "wakeify/common/clock.hpp"
#include "wakeify/net/http_client.hpp"

namespace wakeify::cloud {

struct DirectorySettings {
    std::string api_base{"https://api.spotify.com/v1"};
    std::chrono::milliseconds device_cache_ttl{750};
    std::chrono::milliseconds retry_404_delay{700};
    std::chrono::seconds playlist_cache_ttl{300};
    std::size_t playlist_cache_capacity{64};
    std::chrono::milliseconds request_timeout{std::chrono::seconds(10)};
    net::RetryPolicy retry{net::RetryPolicy::cloud_default()};
};

// Extracts the playlist id from a spotify:playlist:<id> URI or an open.spotify.com link.
std::optional<std::string> playlist_id_from_uri(std::string_view context_uri);

class WebApiDirectory final : public CloudDirectory {
public:
    WebApiDirectory(AccessTokenSource& tokens,
                    std::shared_ptr<net::HttpTransport> transport,
                    common::Clock& clock,
                    DirectorySettings settings = {},
                    const common::CancellationToken* cancel = nullptr,
                    std::uint32_t seed = std::random_device{}());

    std::vector<model::CloudDevice> get_devices(bool force_refresh = false) override;

    void put_transfer(const std::string& device_id, bool play) override;
    void put_volume(const std::string& device_id, int percent) override;

    /**
     * @brief Starts @p context_uri on the device.
     *
     * With @p shuffle set, shuffle is enabled first and playlists start at a
     * random track. A 404 (device not yet registered for playback) is
     * retried once after DirectorySettings::retry_404_delay.
     */
    void put_play(const std::string& device_id, const std::string& context_uri, bool shuffle) override;
    void pause_playback(const std::string& device_id) override;
    bool is_playing_on(const std::string& device_id, std::chrono::milliseconds timeout) override;

    void invalidate_device_cache();

private:
    struct Session {
        std::uint64_t generation{0};
        std::string authorization;
    };

    struct PlaylistEntry {
        int total_tracks{0};
        common::Clock::time_point fetched_at{};
    };

    net::HttpResponse execute(net::HttpRequest request, std::string_view what, const net::RetryPolicy& policy);
    net::HttpRequest make_request(net::HttpMethod method, const std::string& path) const;
    std::string authorization();
    void start_playback(const std::string& device_id, const std::string& context_uri, bool shuffle);
    std::optional<int> playlist_track_count(const std::string& playlist_id);
    int random_offset(int total_tracks);

    AccessTokenSource& tokens_;
    net::HttpClient http_;
    common::Clock& clock_;
    const DirectorySettings settings_;
    const common::CancellationToken* cancel_;

    std::mutex session_mutex_;
    std::optional<Session> session_;

    std::mutex cache_mutex_;
    std::optional<std::vector<model::CloudDevice>> device_cache_;
    common::Clock::time_point device_cache_time_{};

    std::mutex playlist_mutex_;
    std::unordered_map<std::string, PlaylistEntry> playlist_cache_;
    std::deque<std::string> playlist_order_;

    std::mutex rng_mutex_;
    std::mt19937 rng_;
};

}  // namespace wakeify::cloud
