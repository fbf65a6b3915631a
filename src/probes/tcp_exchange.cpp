/**
 * @file tcp_exchange.cpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * One shot request/reply over TCP with a hard deadline
 */
#include "tcp_exchange.hpp"
#include <boost/asio.hpp>

namespace labnet
{

using namespace boost::asio;
using boost::asio::ip::tcp;

constexpr std::size_t MAX_REPLY_SIZE { 64 * 1024 };

std::optional<std::string> tcp_exchange(const std::string& host,
                                        uint16_t port,
                                        const std::string& request,
                                        std::chrono::steady_clock::duration timeout,
                                        ReplyEnd reply_end)
{
    boost::system::error_code ec;
    auto address = ip::make_address(host, ec);
    if (ec)
    {
        return std::nullopt;
    }

    io_context io;
    tcp::socket socket(io);
    std::string reply;
    bool complete { false };

    auto on_read = [&](const boost::system::error_code& error, std::size_t)
        {
            // A closed connection ends a CONNECTION_CLOSE reply normally
            if ((error == boost::asio::error::eof) && (reply_end == ReplyEnd::CONNECTION_CLOSE))
            {
                complete = true;
            }
            else if (!error)
            {
                complete = true;
            }
        };

    socket.async_connect(tcp::endpoint(address, port),
        [&](const boost::system::error_code& error)
        {
            if (error)
            {
                return;
            }
            async_write(socket, buffer(request),
                [&](const boost::system::error_code& write_error, std::size_t)
                {
                    if (write_error)
                    {
                        return;
                    }
                    if (reply_end == ReplyEnd::NEWLINE)
                    {
                        async_read_until(socket, dynamic_buffer(reply, MAX_REPLY_SIZE), '\n', on_read);
                    }
                    else
                    {
                        async_read(socket, dynamic_buffer(reply, MAX_REPLY_SIZE), on_read);
                    }
                });
        });

    io.run_until(std::chrono::steady_clock::now() + timeout);
    socket.close(ec);

    if (!complete || reply.empty())
    {
        return std::nullopt;
    }
    return reply;
}

} // namespace labnet
