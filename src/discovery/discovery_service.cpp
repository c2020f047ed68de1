#include "wakeify/discovery/discovery_service.hpp"

#include <algorithm>
#include <iterator>

#include <spdlog/spdlog.h>

#include "wakeify/common/string_util.hpp"

namespace wakeify::discovery {

bool is_exact_match(const model::DiscoveryResult& result, std::string_view name_hint) {
    const auto hint = common::fold_name(name_hint);
    return !hint.empty() && common::fold_name(result.instance_name) == hint;
}

std::optional<model::DiscoveryResult> select_best_match(const std::vector<model::DiscoveryResult>& results,
                                                        std::string_view name_hint) {
    std::vector<model::DiscoveryResult> usable;
    std::copy_if(results.begin(), results.end(), std::back_inserter(usable), [](const model::DiscoveryResult& result) {
        return result.is_complete();
    });
    if (usable.empty()) {
        if (!results.empty()) {
            spdlog::debug("{} advertisement(s) seen but none resolved to an address", results.size());
        }
        return std::nullopt;
    }
    const auto hint = common::fold_name(name_hint);
    if (hint.empty()) {
        return usable.front();
    }

    auto exact = std::find_if(usable.begin(), usable.end(), [&](const model::DiscoveryResult& result) {
        return is_exact_match(result, hint);
    });
    if (exact != usable.end()) {
        return *exact;
    }

    auto partial = std::find_if(usable.begin(), usable.end(), [&](const model::DiscoveryResult& result) {
        const auto instance = common::fold_name(result.instance_name);
        return !instance.empty() && (instance.find(hint) != std::string::npos || hint.find(instance) != std::string::npos);
    });
    if (partial != usable.end()) {
        spdlog::info("Discovery hint '{}' partially matched '{}'", name_hint, partial->instance_name);
        return *partial;
    }

    spdlog::info("No advertisement matched '{}', using first available: {}", name_hint, usable.front().instance_name);
    return usable.front();
}

}  // namespace wakeify::discovery
