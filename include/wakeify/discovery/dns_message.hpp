#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace wakeify::discovery {

namespace record_type {
inline constexpr std::uint16_t kA = 1;
inline constexpr std::uint16_t kPtr = 12;
inline constexpr std::uint16_t kTxt = 16;
inline constexpr std::uint16_t kAaaa = 28;
inline constexpr std::uint16_t kSrv = 33;
}  // namespace record_type

class DnsDecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Labels are kept separately because DNS-SD instance labels may contain dots.
struct DomainName {
    std::vector<std::string> labels;

    static DomainName from_dotted(std::string_view dotted);

    std::string to_string() const;
    bool ends_with(const DomainName& suffix) const;
    bool equals(const DomainName& other) const;
    std::string key() const;
};

struct DnsQuestion {
    DomainName name;
    std::uint16_t type{record_type::kPtr};
    bool unicast_response{false};
};

struct SrvData {
    std::uint16_t priority{0};
    std::uint16_t weight{0};
    std::uint16_t port{0};
    DomainName target;
};

struct ResourceRecord {
    DomainName name;
    std::uint16_t type{0};
    std::uint16_t record_class{1};
    std::uint32_t ttl{0};

    std::optional<DomainName> ptr;
    std::optional<SrvData> srv;
    std::vector<std::string> txt;
    std::optional<std::string> address;
};

struct DnsMessage {
    std::uint16_t id{0};
    std::uint16_t flags{0};
    std::vector<DnsQuestion> questions;
    // Answer, authority and additional sections in wire order.
    std::vector<ResourceRecord> records;

    bool is_response() const noexcept { return (flags & 0x8000U) != 0; }
};

std::vector<std::uint8_t> encode_query(const std::vector<DnsQuestion>& questions);

/**
 * @brief Decodes a DNS message, following name compression pointers.
 *
 * Unknown record types are kept with only their header fields populated.
 * Throws DnsDecodeError on truncated or malformed input.
 */
DnsMessage decode_message(const std::vector<std::uint8_t>& packet);

// "key=value" entries to a map; keys keep their case, entries without '=' map to "".
std::map<std::string, std::string> parse_txt_attributes(const std::vector<std::string>& entries);

}  // namespace wakeify::discovery
