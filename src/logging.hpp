#ifndef _LABNET_LOGGING_H_
#define _LABNET_LOGGING_H_
/**
 * @file logging.hpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Stream style log macros used inside the library. They expect a member (or local)
 * named m_log_callback of type labnet::log_callback_t.
 */
#include "labnet/log.hpp"
#include <sstream>

#define DBG(m,l)                                        \
     do                                                 \
     {                                                  \
         if (m_log_callback) {                          \
             std::stringstream ss {};                   \
             ss << m;                                   \
             m_log_callback(ss.str(), l);               \
         }                                              \
     } while(false)

#define INFO(m) DBG(m, ::labnet::LOG_LVL_INFO)

#define ERR(m)                                          \
    do                                                  \
    {                                                   \
        if (m_log_callback) {                           \
            std::stringstream ss {};                    \
            ss << m;                                    \
            m_log_callback(ss.str(), ::labnet::LOG_LVL_ERROR); \
        }                                               \
    } while(false)

#endif // _LABNET_LOGGING_H_
