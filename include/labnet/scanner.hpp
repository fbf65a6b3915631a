#ifndef __LABNET_SCANNER_HPP__
#define __LABNET_SCANNER_HPP__
/**
 * @file scanner.hpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * API for sweeping IPv4 ranges for live hosts
 * @{
 */
#include "device_types.hpp"
#include "log.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace labnet
{

constexpr std::size_t DEFAULT_SCAN_WIDTH { 100 };
constexpr std::size_t DEFAULT_MAX_HOSTS { 254 };
constexpr auto DEFAULT_PROBE_TIMEOUT { std::chrono::milliseconds(500) };

/// @brief Liveness check for a single address.
class LivenessProbe_T
{
public:
    virtual ~LivenessProbe_T() = default;

    /// Must return within (approximately) timeout. A host that does not answer in time is
    /// reported as unreachable; this is not an error.
    virtual HostRecord probe(const std::string& address, std::chrono::steady_clock::duration timeout) = 0;
};

/// @brief Liveness probe that treats an accepted or actively refused TCP connection on any of
///  the given ports as proof that the host is up.
class TcpLivenessProbe : public LivenessProbe_T
{
public:
    explicit TcpLivenessProbe(std::vector<uint16_t> ports = { 22, 80, 5025 });

    HostRecord probe(const std::string& address, std::chrono::steady_clock::duration timeout) override;

private:
    std::vector<uint16_t> m_ports;
};

/// @brief Outcome of one scan pass. Every expanded address has exactly one record.
struct ScanResult
{
    std::string network;
    std::vector<HostRecord> hosts;

    std::vector<HostRecord> reachable() const;
};

class Scanner
{
public:
    /// @param probe Liveness probe shared by all workers, must be thread safe.
    /// @param width Number of probes in flight at once.
    Scanner(std::shared_ptr<LivenessProbe_T> probe,
            std::size_t width = DEFAULT_SCAN_WIDTH,
            log_callback_t log_callback = nullptr);

    /// @brief Usable host addresses of an IPv4 network, in address order.
    /// @param cidr e.g. "192.168.2.0/24"; host bits may be set
    /// @param max_hosts Stop after this many addresses
    /// @throw std::invalid_argument if cidr is not an IPv4 network
    static std::vector<std::string> expand(const std::string& cidr, std::size_t max_hosts = DEFAULT_MAX_HOSTS);

    /// @brief Probe every host of a network.
    /// @throw std::invalid_argument if cidr is not an IPv4 network
    ScanResult scan(const std::string& cidr,
                    std::chrono::steady_clock::duration per_host_timeout = DEFAULT_PROBE_TIMEOUT,
                    std::size_t max_hosts = DEFAULT_MAX_HOSTS);

    /// @brief Scan several networks, one ScanResult per network in the given order.
    /// @throw std::invalid_argument if any network is not an IPv4 network
    std::vector<ScanResult> scan(const std::vector<std::string>& networks,
                                 std::chrono::steady_clock::duration per_host_timeout = DEFAULT_PROBE_TIMEOUT,
                                 std::size_t max_hosts = DEFAULT_MAX_HOSTS);

    /// @brief Probe an explicit list of addresses.
    std::vector<HostRecord> probe_all(const std::vector<std::string>& addresses,
                                      std::chrono::steady_clock::duration per_host_timeout = DEFAULT_PROBE_TIMEOUT);

    std::size_t width() const { return m_width; }

private:
    std::shared_ptr<LivenessProbe_T> m_probe;
    std::size_t m_width;
    log_callback_t m_log_callback;
};

} // namespace labnet

#endif // __LABNET_SCANNER_HPP__

/** @} */
