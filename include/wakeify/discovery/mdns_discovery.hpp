#pragma once

#include <chrono>
#include <functional>
#include <string>

#include "wakeify/common/clock.hpp"
#include "wakeify/discovery/discovery_service.hpp"
#include "wakeify/discovery/service_collector.hpp"

namespace wakeify::discovery {

struct MdnsOptions {
    std::string service_type{"_spotify-connect._tcp.local"};
    std::string multicast_address{"224.0.0.251"};
    unsigned short port{5353};
    std::chrono::milliseconds requery_interval{500};
    std::chrono::milliseconds idle_grace{300};
};

// DNS-SD browser over multicast DNS on Boost.Asio UDP sockets.
class MdnsDiscovery final : public DiscoveryService {
public:
    // A cancelled @p cancel ends any browse early with whatever was collected so far.
    explicit MdnsDiscovery(MdnsOptions options = {}, const common::CancellationToken* cancel = nullptr);

    model::DiscoveryResult discover_one(std::string_view name_hint, std::chrono::milliseconds timeout) override;
    std::vector<model::DiscoveryResult> discover_all(std::chrono::milliseconds timeout) override;

private:
    using StopPredicate = std::function<bool(const ServiceCollector&)>;

    void browse(ServiceCollector& collector,
                std::chrono::milliseconds timeout,
                bool extend_while_active,
                const StopPredicate& stop_when);

    MdnsOptions options_;
    const common::CancellationToken* cancel_;
};

}  // namespace wakeify::discovery
