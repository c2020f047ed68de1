#include "wakeify/discovery/service_collector.hpp"

#include <algorithm>
#include <utility>

#include "wakeify/common/string_util.hpp"

namespace wakeify::discovery {

ServiceCollector::ServiceCollector(DomainName service_type) : service_type_(std::move(service_type)) {}

ServiceCollector::Instance* ServiceCollector::find_or_add(const DomainName& instance_name, bool& added) {
    added = false;
    if (!instance_name.ends_with(service_type_) || instance_name.labels.size() <= service_type_.labels.size()) {
        return nullptr;
    }
    const auto label_count = instance_name.labels.size() - service_type_.labels.size();
    std::string label;
    for (std::size_t i = 0; i < label_count; ++i) {
        if (i > 0) {
            label.push_back('.');
        }
        label += instance_name.labels[i];
    }

    const auto folded = common::fold_name(label);
    auto it = std::find_if(instances_.begin(), instances_.end(), [&](const Instance& instance) {
        return common::fold_name(instance.label) == folded;
    });
    if (it != instances_.end()) {
        return &*it;
    }
    Instance instance;
    instance.name = instance_name;
    instance.label = std::move(label);
    instances_.push_back(std::move(instance));
    added = true;
    return &instances_.back();
}

bool ServiceCollector::ingest(const DnsMessage& message) {
    bool changed = false;
    bool added = false;

    for (const auto& record : message.records) {
        switch (record.type) {
        case record_type::kPtr:
            if (record.ptr && record.name.equals(service_type_)) {
                find_or_add(*record.ptr, added);
                changed = changed || added;
            }
            break;
        case record_type::kSrv:
            if (record.srv) {
                if (auto* instance = find_or_add(record.name, added)) {
                    const bool updated = !instance->port || *instance->port != record.srv->port ||
                                         !instance->host || !instance->host->equals(record.srv->target);
                    instance->port = record.srv->port;
                    instance->host = record.srv->target;
                    changed = changed || added || updated;
                }
            }
            break;
        case record_type::kTxt:
            if (auto* instance = find_or_add(record.name, added)) {
                auto attributes = parse_txt_attributes(record.txt);
                const bool updated = !instance->has_txt || instance->txt != attributes;
                instance->has_txt = true;
                instance->txt = std::move(attributes);
                changed = changed || added || updated;
            }
            break;
        case record_type::kA:
        case record_type::kAaaa:
            if (record.address) {
                auto& table = record.type == record_type::kA ? ipv4_by_host_ : ipv6_by_host_;
                const bool inserted = table.insert_or_assign(record.name.key(), *record.address).second;
                changed = changed || inserted;
            }
            break;
        default:
            break;
        }
    }
    return changed;
}

std::optional<std::string> ServiceCollector::address_for(const Instance& instance) const {
    if (!instance.host) {
        return std::nullopt;
    }
    const auto key = instance.host->key();
    if (auto it = ipv4_by_host_.find(key); it != ipv4_by_host_.end()) {
        return it->second;
    }
    if (auto it = ipv6_by_host_.find(key); it != ipv6_by_host_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::vector<model::DiscoveryResult> ServiceCollector::results(bool assume_default_path) const {
    std::vector<model::DiscoveryResult> out;
    out.reserve(instances_.size());
    for (const auto& instance : instances_) {
        model::DiscoveryResult result;
        result.instance_name = instance.label;
        result.address = address_for(instance);
        result.port = instance.port;
        result.txt_records = instance.txt;
        if (instance.has_txt) {
            auto cpath = instance.txt.find("CPath");
            result.auth_path = model::normalize_auth_path(cpath == instance.txt.end() ? "" : cpath->second);
        } else if (assume_default_path && result.address && result.port) {
            result.auth_path = std::string(model::kDefaultAuthPath);
        }
        out.push_back(std::move(result));
    }
    return out;
}

std::vector<DnsQuestion> ServiceCollector::pending_questions() const {
    std::vector<DnsQuestion> questions;
    for (const auto& instance : instances_) {
        if (!instance.port) {
            questions.push_back(DnsQuestion{instance.name, record_type::kSrv, false});
        }
        if (!instance.has_txt) {
            questions.push_back(DnsQuestion{instance.name, record_type::kTxt, false});
        }
        if (instance.host && !address_for(instance)) {
            questions.push_back(DnsQuestion{*instance.host, record_type::kA, false});
        }
    }
    return questions;
}

}  // namespace wakeify::discovery
