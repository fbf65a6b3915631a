#ifndef __LABNET_LOG_HPP__
#define __LABNET_LOG_HPP__
/**
 * @file log.hpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Log sink type and levels shared by all labnet components.
 */
#include <cstdint>
#include <functional>
#include <string>

namespace labnet
{

/// @brief Destination for library log messages. A null callback disables logging.
typedef std::function<void (const std::string& msg, uint32_t level)> log_callback_t;

inline constexpr uint32_t LOG_LVL_ERROR     { 0 };
inline constexpr uint32_t LOG_LVL_INFO      { 1 };
inline constexpr uint32_t LOG_LVL_DBG_HI    { 2 };
inline constexpr uint32_t LOG_LVL_DBG_MID   { 3 };
inline constexpr uint32_t LOG_LVL_DBG_LOW   { 4 };

/// @brief Create the default console log sink.
///
/// Errors are always written to std::cerr, other messages are written to std::cout
/// when their level is at or below debug_level. Each line is stamped with the number of
/// seconds since the sink was created. The returned callable may be shared between threads.
/// @param debug_level Highest level (LOG_LVL_*) that is printed.
log_callback_t make_default_logger(uint32_t debug_level = LOG_LVL_INFO);

} // namespace labnet

#endif // __LABNET_LOG_HPP__
