#include "wakeify/model/discovery_result.hpp"

#include "wakeify/common/string_util.hpp"

namespace wakeify::model {

std::string normalize_auth_path(std::string_view path) {
    auto normalized = common::trim_copy(path);
    while (!normalized.empty() && normalized.back() == '/') {
        normalized.pop_back();
    }
    while (!normalized.empty() && normalized.front() == '/') {
        normalized.erase(normalized.begin());
    }
    if (normalized.empty()) {
        return std::string(kDefaultAuthPath);
    }
    return "/" + normalized;
}

}  // namespace wakeify::model
