/**
 * @file connection_pool.cpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Process local pool of multiplexed transports
 * @{
 */
#include "labnet/connection_pool.hpp"
#include "logging.hpp"
#include <vector>

namespace labnet
{

static PoolKey key_of(const Endpoint& endpoint)
{
    return PoolKey{ endpoint.host, endpoint.principal, endpoint.port };
}

ConnectionPool::ConnectionPool(std::shared_ptr<TransportFactory_T> factory,
                               std::chrono::steady_clock::duration establish_timeout,
                               log_callback_t log_callback) :
    m_factory(std::move(factory)),
    m_establish_timeout(establish_timeout),
    m_log_callback(std::move(log_callback))
{
}

ConnectionPool::~ConnectionPool()
{
    close_all();
}

std::shared_ptr<ConnectionPool::Slot> ConnectionPool::slot_for(const PoolKey& key)
{
    std::lock_guard<std::mutex> lock(m_table_mutex);
    auto& slot = m_slots[key];
    if (!slot)
    {
        slot = std::make_shared<Slot>();
    }
    return slot;
}

std::shared_ptr<Transport_T> ConnectionPool::acquire(const Endpoint& endpoint)
{
    return acquire(endpoint, m_establish_timeout);
}

std::shared_ptr<Transport_T> ConnectionPool::acquire(const Endpoint& endpoint,
                                                     std::chrono::steady_clock::duration establish_timeout)
{
    if (!m_factory)
    {
        return nullptr;
    }
    auto slot = slot_for(key_of(endpoint));

    // Only callers for the same key wait here
    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->transport)
    {
        if (slot->transport->is_alive())
        {
            DBG("Reusing pooled transport for " << endpoint.principal << "@" << endpoint.host, LOG_LVL_DBG_LOW);
            return slot->transport;
        }
        DBG("Pooled transport for " << endpoint.host << " is dead, replacing it", LOG_LVL_DBG_MID);
        slot->transport->close();
        slot->transport.reset();
    }

    slot->transport = m_factory->establish(endpoint, establish_timeout);
    if (!slot->transport)
    {
        DBG("Unable to establish pooled transport for " << endpoint.host, LOG_LVL_DBG_HI);
    }
    return slot->transport;
}

bool ConnectionPool::is_alive(const std::shared_ptr<Transport_T>& handle) const
{
    return handle && handle->is_alive();
}

void ConnectionPool::invalidate(const Endpoint& endpoint)
{
    std::shared_ptr<Slot> slot;
    {
        std::lock_guard<std::mutex> lock(m_table_mutex);
        auto it = m_slots.find(key_of(endpoint));
        if (it == m_slots.end())
        {
            return;
        }
        slot = it->second;
        m_slots.erase(it);
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->transport)
    {
        slot->transport->close();
        slot->transport.reset();
    }
}

void ConnectionPool::close_all()
{
    std::map<PoolKey, std::shared_ptr<Slot>> slots;
    {
        std::lock_guard<std::mutex> lock(m_table_mutex);
        slots.swap(m_slots);
    }
    for (auto& [key, slot] : slots)
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->transport)
        {
            slot->transport->close();
            slot->transport.reset();
        }
    }
}

std::size_t ConnectionPool::size() const
{
    std::vector<std::shared_ptr<Slot>> slots;
    {
        std::lock_guard<std::mutex> lock(m_table_mutex);
        for (const auto& [key, slot] : m_slots)
        {
            slots.push_back(slot);
        }
    }
    std::size_t count { 0 };
    for (const auto& slot : slots)
    {
        std::lock_guard<std::mutex> slot_lock(slot->mutex);
        if (slot->transport)
        {
            ++count;
        }
    }
    return count;
}

} // namespace labnet

/** @} */
