#include "wakeify/discovery/dns_message.hpp"

#include <algorithm>
#include <cstddef>

#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/address_v6.hpp>

#include "wakeify/common/string_util.hpp"

namespace wakeify::discovery {

namespace {

constexpr std::size_t kHeaderSize = 12;
constexpr std::size_t kMaxLabelLength = 63;
constexpr int kMaxCompressionJumps = 32;
// Root name plus type, class, ttl and rdlength.
constexpr std::size_t kMinRecordSize = 11;

class Reader {
public:
    explicit Reader(const std::vector<std::uint8_t>& data) : data_(data) {}

    std::size_t offset() const noexcept { return offset_; }
    void seek(std::size_t offset) { offset_ = offset; }

    std::uint8_t u8() {
        require(1);
        return data_[offset_++];
    }

    std::uint16_t u16() {
        require(2);
        const auto value = static_cast<std::uint16_t>((data_[offset_] << 8U) | data_[offset_ + 1]);
        offset_ += 2;
        return value;
    }

    std::uint32_t u32() {
        const std::uint32_t high = u16();
        const std::uint32_t low = u16();
        return (high << 16U) | low;
    }

    std::string bytes(std::size_t count) {
        require(count);
        std::string out(reinterpret_cast<const char*>(data_.data() + offset_), count);
        offset_ += count;
        return out;
    }

    DomainName name() {
        DomainName result;
        std::size_t cursor = offset_;
        std::optional<std::size_t> resume;
        int jumps = 0;
        while (true) {
            if (cursor >= data_.size()) {
                throw DnsDecodeError("Name runs past end of packet");
            }
            const std::uint8_t length = data_[cursor];
            if ((length & 0xC0U) == 0xC0U) {
                if (cursor + 1 >= data_.size()) {
                    throw DnsDecodeError("Truncated compression pointer");
                }
                if (++jumps > kMaxCompressionJumps) {
                    throw DnsDecodeError("Too many compression pointers");
                }
                if (!resume) {
                    resume = cursor + 2;
                }
                cursor = static_cast<std::size_t>(((length & 0x3FU) << 8U) | data_[cursor + 1]);
                continue;
            }
            if ((length & 0xC0U) != 0) {
                throw DnsDecodeError("Unsupported label type");
            }
            if (length == 0) {
                ++cursor;
                break;
            }
            if (cursor + 1 + length > data_.size()) {
                throw DnsDecodeError("Label runs past end of packet");
            }
            result.labels.emplace_back(reinterpret_cast<const char*>(data_.data() + cursor + 1), length);
            cursor += 1 + length;
        }
        offset_ = resume.value_or(cursor);
        return result;
    }

private:
    void require(std::size_t count) const {
        if (offset_ + count > data_.size()) {
            throw DnsDecodeError("Unexpected end of packet at offset " + std::to_string(offset_));
        }
    }

    const std::vector<std::uint8_t>& data_;
    std::size_t offset_{0};
};

void put_u16(std::vector<std::uint8_t>& out, std::uint16_t value) {
    out.push_back(static_cast<std::uint8_t>((value >> 8U) & 0xFFU));
    out.push_back(static_cast<std::uint8_t>(value & 0xFFU));
}

void put_name(std::vector<std::uint8_t>& out, const DomainName& name) {
    for (const auto& label : name.labels) {
        if (label.empty() || label.size() > kMaxLabelLength) {
            throw std::invalid_argument("DNS label length out of range: '" + label + "'");
        }
        out.push_back(static_cast<std::uint8_t>(label.size()));
        out.insert(out.end(), label.begin(), label.end());
    }
    out.push_back(0);
}

ResourceRecord read_record(Reader& reader) {
    ResourceRecord record;
    record.name = reader.name();
    record.type = reader.u16();
    record.record_class = static_cast<std::uint16_t>(reader.u16() & 0x7FFFU);
    record.ttl = reader.u32();
    const std::uint16_t rdlength = reader.u16();
    const std::size_t rdata_start = reader.offset();
    const std::size_t rdata_end = rdata_start + rdlength;

    switch (record.type) {
    case record_type::kPtr:
        record.ptr = reader.name();
        break;
    case record_type::kSrv: {
        SrvData srv;
        srv.priority = reader.u16();
        srv.weight = reader.u16();
        srv.port = reader.u16();
        srv.target = reader.name();
        record.srv = std::move(srv);
        break;
    }
    case record_type::kTxt:
        while (reader.offset() < rdata_end) {
            const std::uint8_t length = reader.u8();
            if (length > 0) {
                record.txt.push_back(reader.bytes(length));
            }
        }
        break;
    case record_type::kA: {
        if (rdlength != 4) {
            throw DnsDecodeError("A record with length " + std::to_string(rdlength));
        }
        boost::asio::ip::address_v4::bytes_type raw{};
        for (auto& byte : raw) {
            byte = reader.u8();
        }
        record.address = boost::asio::ip::address_v4(raw).to_string();
        break;
    }
    case record_type::kAaaa: {
        if (rdlength != 16) {
            throw DnsDecodeError("AAAA record with length " + std::to_string(rdlength));
        }
        boost::asio::ip::address_v6::bytes_type raw{};
        for (auto& byte : raw) {
            byte = reader.u8();
        }
        record.address = boost::asio::ip::address_v6(raw).to_string();
        break;
    }
    default:
        break;
    }

    if (reader.offset() > rdata_end) {
        throw DnsDecodeError("Record data overran its declared length");
    }
    reader.seek(rdata_end);
    return record;
}

}  // namespace

DomainName DomainName::from_dotted(std::string_view dotted) {
    DomainName name;
    std::size_t start = 0;
    while (start <= dotted.size()) {
        const auto dot = dotted.find('.', start);
        const auto end = dot == std::string_view::npos ? dotted.size() : dot;
        if (end > start) {
            name.labels.emplace_back(dotted.substr(start, end - start));
        }
        if (dot == std::string_view::npos) {
            break;
        }
        start = dot + 1;
    }
    return name;
}

std::string DomainName::to_string() const {
    std::string out;
    for (const auto& label : labels) {
        if (!out.empty()) {
            out.push_back('.');
        }
        out += label;
    }
    return out;
}

bool DomainName::ends_with(const DomainName& suffix) const {
    if (suffix.labels.size() > labels.size()) {
        return false;
    }
    const auto offset = labels.size() - suffix.labels.size();
    for (std::size_t i = 0; i < suffix.labels.size(); ++i) {
        if (!common::iequals(labels[offset + i], suffix.labels[i])) {
            return false;
        }
    }
    return true;
}

bool DomainName::equals(const DomainName& other) const {
    return labels.size() == other.labels.size() && ends_with(other);
}

std::string DomainName::key() const {
    return common::to_lower(to_string());
}

std::vector<std::uint8_t> encode_query(const std::vector<DnsQuestion>& questions) {
    std::vector<std::uint8_t> out;
    out.reserve(kHeaderSize + questions.size() * 48);
    put_u16(out, 0);  // id; mDNS queries use zero
    put_u16(out, 0);  // flags
    put_u16(out, static_cast<std::uint16_t>(questions.size()));
    put_u16(out, 0);
    put_u16(out, 0);
    put_u16(out, 0);
    for (const auto& question : questions) {
        put_name(out, question.name);
        put_u16(out, question.type);
        put_u16(out, static_cast<std::uint16_t>(question.unicast_response ? 0x8001U : 0x0001U));
    }
    return out;
}

DnsMessage decode_message(const std::vector<std::uint8_t>& packet) {
    if (packet.size() < kHeaderSize) {
        throw DnsDecodeError("Packet shorter than DNS header");
    }
    Reader reader(packet);
    DnsMessage message;
    message.id = reader.u16();
    message.flags = reader.u16();
    const std::uint16_t question_count = reader.u16();
    const std::uint16_t answer_count = reader.u16();
    const std::uint16_t authority_count = reader.u16();
    const std::uint16_t additional_count = reader.u16();

    for (std::uint16_t i = 0; i < question_count; ++i) {
        DnsQuestion question;
        question.name = reader.name();
        question.type = reader.u16();
        question.unicast_response = (reader.u16() & 0x8000U) != 0;
        message.questions.push_back(std::move(question));
    }

    const std::size_t record_count =
        static_cast<std::size_t>(answer_count) + authority_count + additional_count;
    message.records.reserve(std::min(record_count, packet.size() / kMinRecordSize));
    for (std::size_t i = 0; i < record_count; ++i) {
        message.records.push_back(read_record(reader));
    }
    return message;
}

std::map<std::string, std::string> parse_txt_attributes(const std::vector<std::string>& entries) {
    std::map<std::string, std::string> attributes;
    for (const auto& entry : entries) {
        const auto eq = entry.find('=');
        if (eq == 0) {
            continue;
        }
        if (eq == std::string::npos) {
            attributes.emplace(entry, "");
        } else {
            attributes.emplace(entry.substr(0, eq), entry.substr(eq + 1));
        }
    }
    return attributes;
}

}  // namespace wakeify::discovery
