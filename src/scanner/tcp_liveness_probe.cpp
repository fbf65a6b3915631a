/**
 * @file tcp_liveness_probe.cpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Liveness by TCP connect: an accepted or refused connection proves the host is up.
 */
#include "labnet/scanner.hpp"
#include <boost/asio.hpp>
#include <memory>
#include <optional>

namespace labnet
{

using namespace boost::asio;
using boost::asio::ip::tcp;
using namespace std::chrono;

TcpLivenessProbe::TcpLivenessProbe(std::vector<uint16_t> ports) :
    m_ports(std::move(ports))
{
    if (m_ports.empty())
    {
        throw std::invalid_argument("TcpLivenessProbe requires at least one port");
    }
}

HostRecord TcpLivenessProbe::probe(const std::string& address, steady_clock::duration timeout)
{
    HostRecord record;
    record.address = address;

    boost::system::error_code ec;
    auto ip_address = ip::make_address(address, ec);
    if (ec)
    {
        return record;
    }

    io_context io;
    const auto start = steady_clock::now();
    std::optional<steady_clock::time_point> answered_at;
    std::vector<std::unique_ptr<tcp::socket>> sockets;

    for (auto port : m_ports)
    {
        sockets.push_back(std::make_unique<tcp::socket>(io));
        auto& socket = *sockets.back();
        socket.async_connect(tcp::endpoint(ip_address, port),
            [&](const boost::system::error_code& error)
            {
                if (error == boost::asio::error::operation_aborted)
                {
                    return;
                }
                if (!error || (error == boost::asio::error::connection_refused))
                {
                    if (!answered_at)
                    {
                        answered_at = steady_clock::now();
                        io.stop();
                    }
                }
            });
    }

    io.run_until(start + timeout);

    for (auto& socket : sockets)
    {
        boost::system::error_code ignored;
        socket->close(ignored);
    }

    if (answered_at)
    {
        record.reachable = true;
        record.latency_ms = duration_cast<duration<double, std::milli>>(*answered_at - start).count();
    }
    return record;
}

} // namespace labnet
