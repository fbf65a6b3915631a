#ifndef _LABNET_TCP_EXCHANGE_H_
#define _LABNET_TCP_EXCHANGE_H_
/**
 * @file tcp_exchange.hpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * One shot request/reply over TCP with a hard deadline
 */
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace labnet
{

enum class ReplyEnd : uint8_t
{
    NEWLINE,        ///< reply is complete at the first '\n'
    CONNECTION_CLOSE,
};

/// @brief Connect, send request and read the reply before the deadline.
/// @return the reply, std::nullopt on connect failure, timeout or an empty reply
std::optional<std::string> tcp_exchange(const std::string& host,
                                        uint16_t port,
                                        const std::string& request,
                                        std::chrono::steady_clock::duration timeout,
                                        ReplyEnd reply_end);

} // namespace labnet

#endif // _LABNET_TCP_EXCHANGE_H_
