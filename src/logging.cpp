/**
 * @file logging.cpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Default console log sink
 */
#include "labnet/log.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>

namespace labnet
{

using namespace std::chrono;

namespace
{

struct ConsoleSink
{
    explicit ConsoleSink(uint32_t level) :
        debug_level(level),
        start_time(steady_clock::now())
    {
    }

    void operator()(const std::string& msg, uint32_t level)
    {
        if ((LOG_LVL_ERROR != level) && (level > debug_level))
        {
            return;
        }
        duration<double> since_start { duration_cast<duration<double>>(steady_clock::now() - start_time) };
        std::lock_guard<std::mutex> lock(mutex);
        if (LOG_LVL_ERROR == level)
        {
            std::cerr << "[" << std::fixed << std::setprecision(6) << since_start.count() << "] "
                      << " {ERR} " << msg << std::endl;
        }
        else
        {
            std::cout << "[" << std::fixed << std::setprecision(6) << since_start.count() << "] "
                      << msg << std::endl;
        }
    }

    const uint32_t debug_level;
    const steady_clock::time_point start_time;
    std::mutex mutex;
};

} // namespace

log_callback_t make_default_logger(uint32_t debug_level)
{
    auto sink = std::make_shared<ConsoleSink>(debug_level);
    return [sink](const std::string& msg, uint32_t level)
        {
            (*sink)(msg, level);
        };
}

} // namespace labnet
