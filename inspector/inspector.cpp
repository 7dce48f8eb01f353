#include "inspector.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "fundamentals/bytes.hpp"
#include <boost/asio/signal_set.hpp>
#include <csignal>

DatagramInspector::Report DatagramInspector::inspect(std::span<const std::byte> datagram, std::string_view origin)
{
    mts.datagrams_received++;
    mts.bytes_received += datagram.size();

    Report rep{.decoded = tftp::decode(datagram), .line = {}, .hexdump = {}};
    if (rep.decoded)
    {
        mts.record(*rep.decoded);
        rep.line = std::format("{} {}", origin, *rep.decoded);
        if (const auto* data = std::get_if<tftp::Data>(&*rep.decoded))
        {
            rep.hexdump = dump(data->data());
        }
    }
    else
    {
        mts.record(rep.decoded.error());
        rep.line = std::format("{} rejected {}-byte datagram: {}", origin, datagram.size(), rep.decoded.error());
        rep.hexdump = dump(datagram);
    }
    return rep;
}

std::string DatagramInspector::dump(std::span<const std::byte> sp) const
{
    if (dump_limit == 0 || sp.empty())
    {
        return {};
    }
    if (sp.size() <= dump_limit)
    {
        return bytes::to_hex(sp);
    }
    return std::format("{}... (+{} bytes)", bytes::to_hex(sp.first(dump_limit)), sp.size() - dump_limit);
}


Inspector::Inspector(net::io_context& io, const Config& config)
    : io_ctx(io)
    , socket(io, udp::endpoint(net::ip::make_address(config.inspector().bind_address), config.inspector().port))
    , signals(io, SIGINT, SIGTERM)
    , metrics_signals(io, SIGUSR1)
    , insp(config.inspector().hexdump_limit)
    , recv_buf(config.inspector().max_datagram_size)
{
    LOG_INFO("Listening on {}", socket.local_endpoint());
}

void Inspector::start()
{
    net::co_spawn(io_ctx, do_receive(), net::detached);

    signals.async_wait([this](auto, auto sig)
    {
        LOG_WARN("Received signal {}, shutting down...", sig);
        LOG_INFO("{}", insp.metrics());
        io_ctx.stop();
    });

    wait_metrics_signal();
}

void Inspector::wait_metrics_signal()
{
    metrics_signals.async_wait([this](boost::system::error_code ec, int sig)
    {
        if (ec)
        {
            return;
        }
        if (sig == SIGUSR1)
        {
            LOG_INFO("{}", insp.metrics());
        }
        wait_metrics_signal();
    });
}

net::awaitable<void> Inspector::do_receive()
{
    LOG_DEBUG("do_receive: starting loop, buffer {} bytes", recv_buf.size());
    while (true)
    {
        udp::endpoint sender;
        auto [ec, n] = co_await socket.async_receive_from(net::buffer(recv_buf), sender,
                                                          net::as_tuple(net::use_awaitable));

        if (ec == net::error::operation_aborted)
        {
            co_return;
        }
        if (ec)
        {
            LOG_ERROR("Receive error: {}", ec.message());
            continue;
        }

        auto rep = insp.inspect(std::span<const std::byte>(recv_buf.data(), n), std::format("{}", sender));
        if (rep.decoded)
        {
            LOG_INFO("{}", rep.line);
        }
        else
        {
            LOG_WARN("{}", rep.line);
        }
        if (!rep.hexdump.empty())
        {
            LOG_DEBUG("{} hex: {}", sender, rep.hexdump);
        }
        if (n == recv_buf.size() && n < Config::max_udp_payload)
        {
            LOG_DEBUG("{}: datagram filled the {}-byte buffer and may have been truncated", sender, n);
        }
    }
}
