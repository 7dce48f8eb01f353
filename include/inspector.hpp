#pragma once

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <cstddef>
#include <format>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "tftp/message.hpp"
#include "logger/metrics.hpp"

class Config;

namespace net = boost::asio;
using udp = net::ip::udp;

/**
 * Socket-free part of the inspector: decodes one datagram, counts it and
 * renders what should be logged about it.
 */
class DatagramInspector
{
public:
    struct Report
    {
        tftp::result<tftp::Message> decoded;
        std::string line;
        std::string hexdump; // DATA payload or rejected datagram, empty when nothing to dump
    };

    explicit DatagramInspector(size_t hexdump_limit) : dump_limit(hexdump_limit) {}

    [[nodiscard]] Report inspect(std::span<const std::byte> datagram, std::string_view origin);

    [[nodiscard]] InspectorMetrics& metrics() { return mts; }
    [[nodiscard]] const InspectorMetrics& metrics() const { return mts; }

private:
    std::string dump(std::span<const std::byte> sp) const;

    size_t dump_limit;
    InspectorMetrics mts;
};

// Passive UDP listener. Logs every datagram it sees and never replies.
class Inspector
{
public:
    Inspector(net::io_context& io, const Config& config);
    void start();

    [[nodiscard]] udp::endpoint local_endpoint() const { return socket.local_endpoint(); }
    [[nodiscard]] const InspectorMetrics& metrics() const { return insp.metrics(); }

private:
    net::awaitable<void> do_receive();
    void wait_metrics_signal();

    net::io_context& io_ctx;
    udp::socket socket;
    net::signal_set signals;
    net::signal_set metrics_signals;
    DatagramInspector insp;
    std::vector<std::byte> recv_buf;
};

template<>
struct std::formatter<udp::endpoint>
{
    constexpr auto parse(std::format_parse_context& fpc)
    {
        return fpc.begin();
    }

    auto format(const udp::endpoint& ep, std::format_context& fc) const
    {
        return std::format_to(fc.out(), "{}:{}", ep.address().to_string(), ep.port());
    }
};
