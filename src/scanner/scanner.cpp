/**
 * @file scanner.cpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Concurrent liveness sweep of IPv4 networks
 * @{
 */
#include "labnet/scanner.hpp"
#include "logging.hpp"
#include <boost/asio/ip/network_v4.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/system/system_error.hpp>
#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace labnet
{

using namespace boost::asio;

std::vector<HostRecord> ScanResult::reachable() const
{
    std::vector<HostRecord> live;
    std::copy_if(hosts.begin(), hosts.end(), std::back_inserter(live),
                 [](const auto& h) { return h.reachable; });
    return live;
}

Scanner::Scanner(std::shared_ptr<LivenessProbe_T> probe, std::size_t width, log_callback_t log_callback) :
    m_probe(std::move(probe)),
    m_width(std::max<std::size_t>(width, 1)),
    m_log_callback(std::move(log_callback))
{
    if (!m_probe)
    {
        throw std::invalid_argument("Scanner requires a liveness probe");
    }
}

std::vector<std::string> Scanner::expand(const std::string& cidr, std::size_t max_hosts)
{
    boost::system::error_code ec;
    auto network = ip::make_network_v4(cidr, ec);
    if (ec)
    {
        throw std::invalid_argument("Invalid IPv4 network '" + cidr + "': " + ec.message());
    }
    network = network.canonical();

    std::vector<std::string> addresses;
    if (network.prefix_length() >= 31)
    {
        // Point to point and single host networks have no network/broadcast address to skip
        auto first = network.network().to_uint();
        auto count = (network.prefix_length() == 32) ? 1u : 2u;
        for (uint32_t i = 0; (i < count) && (addresses.size() < max_hosts); ++i)
        {
            addresses.push_back(ip::address_v4(first + i).to_string());
        }
        return addresses;
    }

    for (const auto& address : network.hosts())
    {
        if (addresses.size() >= max_hosts)
        {
            break;
        }
        addresses.push_back(address.to_string());
    }
    return addresses;
}

ScanResult Scanner::scan(const std::string& cidr, std::chrono::steady_clock::duration per_host_timeout,
                         std::size_t max_hosts)
{
    ScanResult result;
    result.network = cidr;
    auto addresses = expand(cidr, max_hosts);
    INFO("Scanning " << cidr << " (" << addresses.size() << " hosts)");
    result.hosts = probe_all(addresses, per_host_timeout);
    DBG("Scan of " << cidr << " found " << result.reachable().size() << " live hosts", LOG_LVL_DBG_HI);
    return result;
}

std::vector<ScanResult> Scanner::scan(const std::vector<std::string>& networks,
                                      std::chrono::steady_clock::duration per_host_timeout,
                                      std::size_t max_hosts)
{
    // Validate everything up front so a typo does not cost a partial sweep
    for (const auto& network : networks)
    {
        (void)expand(network, 1);
    }
    std::vector<ScanResult> results;
    for (const auto& network : networks)
    {
        results.push_back(scan(network, per_host_timeout, max_hosts));
    }
    return results;
}

std::vector<HostRecord> Scanner::probe_all(const std::vector<std::string>& addresses,
                                           std::chrono::steady_clock::duration per_host_timeout)
{
    std::vector<HostRecord> records(addresses.size());
    if (addresses.empty())
    {
        return records;
    }

    thread_pool pool(std::min(m_width, addresses.size()));
    for (std::size_t i = 0; i < addresses.size(); ++i)
    {
        post(pool, [this, i, &addresses, &records, per_host_timeout]()
            {
                auto& record = records[i];
                try
                {
                    record = m_probe->probe(addresses[i], per_host_timeout);
                }
                catch (const std::exception& e)
                {
                    ERR("Liveness probe of " << addresses[i] << " failed: " << e.what());
                    record = HostRecord{};
                }
                record.address = addresses[i];
            });
    }
    pool.join();
    return records;
}

} // namespace labnet

/** @} */
