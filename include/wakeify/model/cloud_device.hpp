#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace wakeify::model {

struct CloudDevice {
    std::string id;
    std::string name;
    bool is_active{false};
    std::optional<int> volume_percent;
    std::string type;
    bool is_private_session{false};
    bool is_restricted{false};

    static CloudDevice from_json(const nlohmann::json& node);
};

}  // namespace wakeify::model
