#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "wakeify/model/cloud_device.hpp"

namespace wakeify::cloud {

// Cloud-side device list and playback commands. Commands raise CloudApiError or AuthError.
class CloudDirectory {
public:
    virtual ~CloudDirectory() = default;

    virtual std::vector<model::CloudDevice> get_devices(bool force_refresh = false) = 0;

    virtual void put_transfer(const std::string& device_id, bool play) = 0;
    virtual void put_volume(const std::string& device_id, int percent) = 0;
    virtual void put_play(const std::string& device_id, const std::string& context_uri, bool shuffle) = 0;
    virtual void pause_playback(const std::string& device_id) = 0;

    // True iff @p device_id is the active device and is playing. Never throws.
    virtual bool is_playing_on(const std::string& device_id, std::chrono::milliseconds timeout) = 0;
};

}  // namespace wakeify::cloud
