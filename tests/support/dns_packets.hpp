#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "wakeify/discovery/dns_message.hpp"

namespace wakeify::testing {

// Minimal writer for hand-built responses.
struct PacketBuilder {
    std::vector<std::uint8_t> bytes;

    std::size_t offset() const { return bytes.size(); }

    void u16(std::uint16_t value) {
        bytes.push_back(static_cast<std::uint8_t>(value >> 8U));
        bytes.push_back(static_cast<std::uint8_t>(value & 0xFFU));
    }

    void u32(std::uint32_t value) {
        u16(static_cast<std::uint16_t>(value >> 16U));
        u16(static_cast<std::uint16_t>(value & 0xFFFFU));
    }

    void label(const std::string& text) {
        bytes.push_back(static_cast<std::uint8_t>(text.size()));
        bytes.insert(bytes.end(), text.begin(), text.end());
    }

    void labels(const std::vector<std::string>& parts) {
        for (const auto& part : parts) {
            label(part);
        }
        bytes.push_back(0);
    }

    void pointer(std::size_t target) { u16(static_cast<std::uint16_t>(0xC000U | target)); }

    // Writes type, class, ttl and a placeholder length; returns the length position.
    std::size_t record_header(std::uint16_t type, std::uint16_t record_class = 0x8001) {
        u16(type);
        u16(record_class);
        u32(120);
        const auto length_at = offset();
        u16(0);
        return length_at;
    }

    void patch_length(std::size_t length_at) {
        const auto length = static_cast<std::uint16_t>(offset() - length_at - 2);
        bytes[length_at] = static_cast<std::uint8_t>(length >> 8U);
        bytes[length_at + 1] = static_cast<std::uint8_t>(length & 0xFFU);
    }
};

/**
 * @brief Response advertising one Spotify Connect instance.
 *
 * Carries PTR, SRV, TXT and A records and uses name compression
 * throughout. The A record is left out when @p with_address is false,
 * which leaves the advertisement unresolved.
 */
inline std::vector<std::uint8_t> advertisement(const std::string& instance,
                                               const std::string& host,
                                               std::uint16_t port,
                                               std::array<std::uint8_t, 4> address,
                                               const std::string& cpath = "/zc",
                                               bool with_address = true) {
    namespace record_type = discovery::record_type;

    PacketBuilder p;
    p.u16(0);       // id
    p.u16(0x8400);  // response, authoritative
    p.u16(0);
    p.u16(1);  // answers
    p.u16(0);
    p.u16(with_address ? 3 : 2);  // additional

    const auto service_at = p.offset();
    p.labels({"_spotify-connect", "_tcp", "local"});
    auto length_at = p.record_header(record_type::kPtr, 1);
    const auto instance_at = p.offset();
    p.label(instance);
    p.pointer(service_at);
    p.patch_length(length_at);

    p.pointer(instance_at);
    length_at = p.record_header(record_type::kSrv);
    p.u16(0);
    p.u16(0);
    p.u16(port);
    const auto host_at = p.offset();
    p.label(host);
    p.pointer(service_at + 1 + std::string("_spotify-connect").size() + 1 + std::string("_tcp").size());
    p.patch_length(length_at);

    p.pointer(instance_at);
    length_at = p.record_header(record_type::kTxt);
    p.label("VERSION=1.0");
    p.label("CPath=" + cpath);
    p.label("Stack=SP");
    p.patch_length(length_at);

    if (with_address) {
        p.pointer(host_at);
        length_at = p.record_header(record_type::kA);
        p.bytes.insert(p.bytes.end(), address.begin(), address.end());
        p.patch_length(length_at);
    }
    return p.bytes;
}

inline std::vector<std::uint8_t> living_room_response(const std::string& cpath = "/zc") {
    return advertisement("Living Room", "living-room", 41'771, {192, 168, 1, 42}, cpath);
}

}  // namespace wakeify::testing
