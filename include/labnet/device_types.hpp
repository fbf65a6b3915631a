#ifndef __LABNET_DEVICE_TYPES_HPP__
#define __LABNET_DEVICE_TYPES_HPP__
/**
 * @file device_types.hpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Declares the records exchanged between the discovery, cache and access components.
 */
#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace labnet
{

/// What kind of device answers at an address
enum class Classification : uint8_t
{
    GENERIC,        ///< SSH capable host (board, server, ...)
    POWER_SWITCH,   ///< Network controlled power switch
    INSTRUMENT,     ///< SCPI test instrument
    UNCLASSIFIED,   ///< Nothing is known yet
};

/// Where a device record came from
enum class DataSource : uint8_t
{
    STATIC_CONFIG,
    DISCOVERED,
};

/// Failure categories reported by every component
enum class ErrorKind : uint8_t
{
    NONE,
    UNREACHABLE,            ///< No response from the host
    AUTHENTICATION_FAILED,  ///< Host answered but rejected the credential
    TIMEOUT,                ///< Operation exceeded its budget
    TRANSPORT_REFUSED,      ///< Connection actively rejected
    CACHE_CORRUPT,          ///< Durable cache could not be parsed
    RELAY_UNAVAILABLE,      ///< Relay gateway itself could not be reached
    NOT_FOUND,              ///< Device reference could not be resolved
    CANCELLED,              ///< Operation abandoned by its owner
    COMMAND_FAILED,         ///< Transport worked, remote command exited non-zero
};

/// @brief Result of a single liveness probe during a scan.
struct HostRecord
{
    std::string address;
    bool reachable { false };
    std::optional<double> latency_ms;
};

/// @brief State reported by a network power switch.
struct PowerSwitchAttributes
{
    std::optional<bool> power_on;
    std::optional<double> power_watts;
    std::string switch_name;
    std::string firmware;
};

/// @brief Identity reported by a test instrument in answer to *IDN?
struct InstrumentAttributes
{
    std::string manufacturer;
    std::string model;
    std::string serial_number;
    std::string firmware;
    uint16_t port { 0 };
};

/// @brief Durable record of who/what a network address is.
struct DeviceIdentity
{
    std::string address;
    std::string hostname;           ///< empty when the login handshake never succeeded
    std::string unique_id;
    std::string principal;          ///< login that completed the handshake
    std::string firmware_version;
    Classification classification { Classification::UNCLASSIFIED };
    bool classification_confident { true };
    std::string type_hint;
    std::optional<PowerSwitchAttributes> power_switch;
    std::optional<InstrumentAttributes> instrument;
    std::vector<std::string> controls;  ///< ids of devices powered by this switch, lookup only
    bool relay_eligible { false };
    std::chrono::system_clock::time_point last_contact { };
    std::chrono::system_clock::time_point cached_at { };
    DataSource source { DataSource::DISCOVERED };

    bool is_identified() const
    {
        return !hostname.empty();
    }

    bool is_classified() const
    {
        return classification != Classification::UNCLASSIFIED;
    }
};

const char* to_string(Classification classification);
const char* to_string(DataSource source);
const char* to_string(ErrorKind kind);

/// @throw std::invalid_argument if text does not name a classification
Classification classification_from_string(std::string_view text);
/// @throw std::invalid_argument if text does not name a data source
DataSource data_source_from_string(std::string_view text);

} // namespace labnet

#endif // __LABNET_DEVICE_TYPES_HPP__
