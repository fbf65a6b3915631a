#ifndef __LABNET_CANCELLATION_HPP__
#define __LABNET_CANCELLATION_HPP__
/**
 * @file cancellation.hpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Cooperative cancellation flag shared between racing network operations.
 */
#include <atomic>

namespace labnet
{

/// @brief Shared flag checked by long running operations at each network boundary.
///  Cancellation is best effort: an operation already blocked in the network stack
///  finishes (or times out) before it observes the flag.
class CancellationToken
{
public:
    void cancel() noexcept
    {
        m_cancelled.store(true, std::memory_order_release);
    }

    bool is_cancelled() const noexcept
    {
        return m_cancelled.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> m_cancelled { false };
};

} // namespace labnet

#endif // __LABNET_CANCELLATION_HPP__
