#pragma once

#include <chrono>
#include <optional>
#include <string_view>
#include <vector>

#include "wakeify/model/discovery_result.hpp"

namespace wakeify::discovery {

class DiscoveryService {
public:
    virtual ~DiscoveryService() = default;

    // Returns an incomplete result when nothing usable was found. Never throws.
    virtual model::DiscoveryResult discover_one(std::string_view name_hint, std::chrono::milliseconds timeout) = 0;

    // Unique resolved advertisements in first-seen order. Never throws.
    virtual std::vector<model::DiscoveryResult> discover_all(std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief Picks the advertisement that best fits @p name_hint.
 *
 * Only complete advertisements are candidates; returns nullopt when
 * none is. Exact case-insensitive instance match first, then a substring
 * match in either direction, then the first candidate. An empty hint
 * selects the first candidate. Looser than cloud name matching, which is
 * always exact.
 */
std::optional<model::DiscoveryResult> select_best_match(const std::vector<model::DiscoveryResult>& results,
                                                        std::string_view name_hint);

bool is_exact_match(const model::DiscoveryResult& result, std::string_view name_hint);

}  // namespace wakeify::discovery
