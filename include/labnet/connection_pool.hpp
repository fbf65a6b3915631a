#ifndef __LABNET_CONNECTION_POOL_HPP__
#define __LABNET_CONNECTION_POOL_HPP__
/**
 * @file connection_pool.hpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Process local pool of multiplexed transports, one per (address, principal, port).
 * @{
 */
#include "executor.hpp"
#include "log.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <tuple>

namespace labnet
{

struct PoolKey
{
    std::string address;
    std::string principal;
    uint16_t port { DEFAULT_SSH_PORT };

    bool operator<(const PoolKey& other) const
    {
        return std::tie(address, principal, port) < std::tie(other.address, other.principal, other.port);
    }
};

class ConnectionPool
{
public:
    ConnectionPool(std::shared_ptr<TransportFactory_T> factory,
                   std::chrono::steady_clock::duration establish_timeout = std::chrono::seconds(10),
                   log_callback_t log_callback = nullptr);

    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /// @brief Return the live pooled transport for the endpoint, establishing one if needed.
    ///  Blocks only callers of the same key while a transport is being established.
    /// @return nullptr if no transport could be established; callers fall back to a fresh connection
    std::shared_ptr<Transport_T> acquire(const Endpoint& endpoint);

    /// Same as acquire(endpoint), giving up on a new transport after establish_timeout
    std::shared_ptr<Transport_T> acquire(const Endpoint& endpoint,
                                         std::chrono::steady_clock::duration establish_timeout);

    /// Liveness check that leaves the transport open
    bool is_alive(const std::shared_ptr<Transport_T>& handle) const;

    /// Close and forget the pooled transport for endpoint, if any
    void invalidate(const Endpoint& endpoint);

    void close_all();

    std::size_t size() const;

private:
    struct Slot
    {
        std::mutex mutex;
        std::shared_ptr<Transport_T> transport;
    };

    std::shared_ptr<Slot> slot_for(const PoolKey& key);

    std::shared_ptr<TransportFactory_T> m_factory;
    std::chrono::steady_clock::duration m_establish_timeout;
    log_callback_t m_log_callback;
    mutable std::mutex m_table_mutex;
    std::map<PoolKey, std::shared_ptr<Slot>> m_slots;
};

} // namespace labnet

#endif // __LABNET_CONNECTION_POOL_HPP__

/** @} */
