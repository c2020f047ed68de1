#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "wakeify/discovery/dns_message.hpp"
#include "wakeify/model/discovery_result.hpp"

namespace wakeify::discovery {

// Folds mDNS answers for one service type into per-instance advertisements.
class ServiceCollector {
public:
    explicit ServiceCollector(DomainName service_type);

    // Returns true when a new instance appeared or a known one gained data.
    bool ingest(const DnsMessage& message);

    /**
     * @brief Current advertisements in first-seen order.
     *
     * An instance whose TXT record has not arrived yet has no auth path
     * unless @p assume_default_path is set, in which case the default
     * path is filled in once its address and port are known.
     */
    std::vector<model::DiscoveryResult> results(bool assume_default_path = false) const;

    // Follow-up SRV/TXT/A questions for instances still missing data.
    std::vector<DnsQuestion> pending_questions() const;

    const DomainName& service_type() const noexcept { return service_type_; }

private:
    struct Instance {
        DomainName name;
        std::string label;
        std::optional<DomainName> host;
        std::optional<std::uint16_t> port;
        bool has_txt{false};
        std::map<std::string, std::string> txt;
    };

    Instance* find_or_add(const DomainName& instance_name, bool& added);
    std::optional<std::string> address_for(const Instance& instance) const;

    DomainName service_type_;
    std::vector<Instance> instances_;
    std::unordered_map<std::string, std::string> ipv4_by_host_;
    std::unordered_map<std::string, std::string> ipv6_by_host_;
};

}  // namespace wakeify::discovery
