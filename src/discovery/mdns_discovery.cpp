#include "wakeify/discovery/mdns_discovery.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <optional>
#include <utility>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/multicast.hpp>
#include <boost/asio/ip/udp.hpp>
#include <spdlog/spdlog.h>

namespace wakeify::discovery {

namespace {
namespace asio = boost::asio;
using udp = asio::ip::udp;
using steady = std::chrono::steady_clock;

constexpr std::size_t kMaxDatagram = 9000;
// Longest single wait before the cancellation token is checked again.
constexpr std::chrono::milliseconds kCancelPoll{100};
}  // namespace

MdnsDiscovery::MdnsDiscovery(MdnsOptions options, const common::CancellationToken* cancel)
    : options_(std::move(options)), cancel_(cancel) {}

model::DiscoveryResult MdnsDiscovery::discover_one(std::string_view name_hint, std::chrono::milliseconds timeout) {
    ServiceCollector collector(DomainName::from_dotted(options_.service_type));
    try {
        browse(collector, timeout, false, [name_hint](const ServiceCollector& current) {
            const auto results = current.results();
            return std::any_of(results.begin(), results.end(), [&](const model::DiscoveryResult& result) {
                return result.is_complete() && is_exact_match(result, name_hint);
            });
        });
    } catch (const std::exception& ex) {
        spdlog::warn("mDNS browse for '{}' failed: {}", name_hint, ex.what());
    }

    auto best = select_best_match(collector.results(true), name_hint);
    if (!best) {
        spdlog::info("No complete mDNS advertisement for '{}' within {} ms", name_hint, timeout.count());
        return {};
    }
    spdlog::info("mDNS selected '{}' at {}:{}{}",
                 best->instance_name,
                 best->address.value_or("?"),
                 best->port ? std::to_string(*best->port) : "?",
                 best->auth_path.value_or(""));
    return *best;
}

std::vector<model::DiscoveryResult> MdnsDiscovery::discover_all(std::chrono::milliseconds timeout) {
    ServiceCollector collector(DomainName::from_dotted(options_.service_type));
    try {
        browse(collector, timeout, true, [](const ServiceCollector&) { return false; });
    } catch (const std::exception& ex) {
        spdlog::warn("mDNS browse failed: {}", ex.what());
    }
    std::vector<model::DiscoveryResult> results;
    for (auto& result : collector.results(true)) {
        if (result.is_complete()) {
            results.push_back(std::move(result));
        } else {
            spdlog::debug("Skipping unresolved mDNS advertisement '{}'", result.instance_name);
        }
    }
    spdlog::info("mDNS browse found {} advertisement(s)", results.size());
    return results;
}

void MdnsDiscovery::browse(ServiceCollector& collector,
                           std::chrono::milliseconds timeout,
                           bool extend_while_active,
                           const StopPredicate& stop_when) {
    asio::io_context io_context;
    udp::socket socket(io_context);
    const auto group = asio::ip::make_address_v4(options_.multicast_address);
    const udp::endpoint destination(group, options_.port);

    boost::system::error_code ec;
    socket.open(udp::v4());
    socket.set_option(asio::socket_base::reuse_address(true));
    socket.bind(udp::endpoint(asio::ip::address_v4::any(), options_.port), ec);
    bool unicast_replies = false;
    if (ec) {
        // Another responder owns the port; ask for unicast replies on an ephemeral one.
        spdlog::debug("mDNS port {} unavailable ({}), using unicast replies", options_.port, ec.message());
        socket.close(ec);
        socket.open(udp::v4());
        socket.bind(udp::endpoint(asio::ip::address_v4::any(), 0));
        unicast_replies = true;
    } else {
        socket.set_option(asio::ip::multicast::join_group(group), ec);
        if (ec) {
            spdlog::warn("Failed to join mDNS group {}: {}", options_.multicast_address, ec.message());
        }
    }
    socket.set_option(asio::ip::multicast::hops(255), ec);

    std::array<std::uint8_t, kMaxDatagram> buffer{};
    udp::endpoint sender;
    bool finished = false;
    std::optional<steady::time_point> last_activity;

    std::function<void()> receive = [&] {
        socket.async_receive_from(asio::buffer(buffer), sender, [&](const boost::system::error_code& receive_ec,
                                                                    std::size_t bytes) {
            if (receive_ec) {
                if (receive_ec != asio::error::operation_aborted) {
                    spdlog::warn("mDNS receive error: {}", receive_ec.message());
                    finished = true;
                    io_context.stop();
                }
                return;
            }
            try {
                const auto message = decode_message(
                    std::vector<std::uint8_t>(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(bytes)));
                if (message.is_response() && collector.ingest(message)) {
                    last_activity = steady::now();
                }
            } catch (const DnsDecodeError& ex) {
                spdlog::debug("Ignoring malformed mDNS packet from {}: {}", sender.address().to_string(), ex.what());
            }
            if (stop_when(collector)) {
                finished = true;
                io_context.stop();
                return;
            }
            receive();
        });
    };
    receive();

    auto send_query = [&] {
        std::vector<DnsQuestion> questions{DnsQuestion{collector.service_type(), record_type::kPtr, unicast_replies}};
        for (auto question : collector.pending_questions()) {
            question.unicast_response = unicast_replies;
            questions.push_back(std::move(question));
        }
        const auto packet = encode_query(questions);
        boost::system::error_code send_ec;
        socket.send_to(asio::buffer(packet), destination, 0, send_ec);
        if (send_ec) {
            spdlog::warn("mDNS query send failed: {}", send_ec.message());
        }
    };

    const auto start = steady::now();
    const auto deadline = start + timeout;
    const auto hard_deadline = deadline + timeout;
    auto next_query = start;
    while (!finished) {
        if (cancel_ && cancel_->cancelled()) {
            spdlog::debug("mDNS browse cancelled");
            break;
        }
        const auto now = steady::now();
        auto effective_deadline = deadline;
        if (extend_while_active && last_activity) {
            effective_deadline = std::max(deadline, std::min(*last_activity + options_.idle_grace, hard_deadline));
        }
        if (now >= effective_deadline) {
            break;
        }
        if (now >= next_query) {
            send_query();
            next_query = now + options_.requery_interval;
        }
        io_context.restart();
        const auto wake_at = std::min<steady::time_point>({next_query, effective_deadline, now + kCancelPoll});
        io_context.run_for(wake_at - now);
    }

    socket.close(ec);
}

}  // namespace wakeify::discovery
