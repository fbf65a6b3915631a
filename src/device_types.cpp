/**
 * @file device_types.cpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Text names of the labnet enumerations
 */
#include "labnet/device_types.hpp"
#include "labnet/executor.hpp"
#include "labnet/identity_prober.hpp"
#include <string>

namespace labnet
{

const char* to_string(Classification classification)
{
    switch (classification)
    {
    case Classification::GENERIC:       return "generic";
    case Classification::POWER_SWITCH:  return "power_switch";
    case Classification::INSTRUMENT:    return "instrument";
    case Classification::UNCLASSIFIED:  return "unclassified";
    }
    return "unclassified";
}

const char* to_string(DataSource source)
{
    switch (source)
    {
    case DataSource::STATIC_CONFIG: return "static_config";
    case DataSource::DISCOVERED:    return "discovered";
    }
    return "discovered";
}

const char* to_string(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::NONE:                   return "none";
    case ErrorKind::UNREACHABLE:            return "unreachable";
    case ErrorKind::AUTHENTICATION_FAILED:  return "authentication_failed";
    case ErrorKind::TIMEOUT:                return "timeout";
    case ErrorKind::TRANSPORT_REFUSED:      return "transport_refused";
    case ErrorKind::CACHE_CORRUPT:          return "cache_corrupt";
    case ErrorKind::RELAY_UNAVAILABLE:      return "relay_unavailable";
    case ErrorKind::NOT_FOUND:              return "not_found";
    case ErrorKind::CANCELLED:              return "cancelled";
    case ErrorKind::COMMAND_FAILED:         return "command_failed";
    }
    return "none";
}

const char* to_string(ExecOutcome outcome)
{
    switch (outcome)
    {
    case ExecOutcome::OK:                       return "ok";
    case ExecOutcome::AUTHENTICATION_FAILED:    return "authentication_failed";
    case ExecOutcome::TIMEOUT:                  return "timeout";
    case ExecOutcome::REFUSED:                  return "refused";
    case ExecOutcome::UNREACHABLE:              return "unreachable";
    case ExecOutcome::CANCELLED:                return "cancelled";
    case ExecOutcome::TRANSPORT_ERROR:          return "transport_error";
    }
    return "transport_error";
}

const char* to_string(AttemptOutcome outcome)
{
    switch (outcome)
    {
    case AttemptOutcome::SUCCESS:                   return "success";
    case AttemptOutcome::AUTHENTICATION_FAILED:     return "authentication_failed";
    case AttemptOutcome::TIMEOUT:                   return "timeout";
    case AttemptOutcome::REFUSED:                   return "refused";
    case AttemptOutcome::UNREACHABLE:               return "unreachable";
    case AttemptOutcome::CANCELLED:                 return "cancelled";
    case AttemptOutcome::ERROR:                     return "error";
    }
    return "error";
}

Classification classification_from_string(std::string_view text)
{
    if (text == "generic")
    {
        return Classification::GENERIC;
    }
    if (text == "power_switch")
    {
        return Classification::POWER_SWITCH;
    }
    if (text == "instrument")
    {
        return Classification::INSTRUMENT;
    }
    if (text == "unclassified")
    {
        return Classification::UNCLASSIFIED;
    }
    throw std::invalid_argument("Unknown classification: " + std::string(text));
}

DataSource data_source_from_string(std::string_view text)
{
    if (text == "static_config")
    {
        return DataSource::STATIC_CONFIG;
    }
    if (text == "discovered")
    {
        return DataSource::DISCOVERED;
    }
    throw std::invalid_argument("Unknown data source: " + std::string(text));
}

} // namespace labnet
