#ifndef __LABNET_DEVICE_DIRECTORY_HPP__
#define __LABNET_DEVICE_DIRECTORY_HPP__
/**
 * @file device_directory.hpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Unified view of the lab built from the static configuration, the cache and live discovery.
 * @{
 */
#include "device_cache.hpp"
#include "device_types.hpp"
#include "identity_prober.hpp"
#include "lab_config.hpp"
#include "log.hpp"
#include "scanner.hpp"
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace labnet
{

enum class DeviceStatus : uint8_t
{
    ONLINE,         ///< reachable and identified, or configured and reachable
    DISCOVERED,     ///< reachable but unidentified
    OFFLINE,        ///< configured but not seen
};

enum class SshStatus : uint8_t
{
    OK,
    AUTH_FAILED,
    TIMEOUT,
    REFUSED,
    ERROR,
    UNKNOWN,
};

const char* to_string(DeviceStatus status);
const char* to_string(SshStatus status);
/// @throw std::invalid_argument on unknown text
DeviceStatus device_status_from_string(const std::string& text);
/// @throw std::invalid_argument on unknown text
SshStatus ssh_status_from_string(const std::string& text);

/// @brief One row of the directory.
struct DeviceRecord
{
    std::string id;
    std::string friendly_name;
    std::string address;
    std::string hostname;
    Classification classification { Classification::UNCLASSIFIED };
    bool classification_confident { true };
    std::string type_hint;
    DeviceStatus status { DeviceStatus::OFFLINE };
    std::optional<double> latency_ms;
    SshStatus ssh_status { SshStatus::UNKNOWN };
    std::string ssh_principal;
    std::string firmware_version;
    std::optional<PowerSwitchAttributes> power_switch;
    std::optional<InstrumentAttributes> instrument;
    std::string powered_by;                 ///< id of the switch powering this device
    std::vector<std::string> controls;      ///< ids of devices powered by this switch
    std::optional<std::chrono::system_clock::duration> cache_age;
    std::optional<std::chrono::system_clock::time_point> last_seen;
    bool relay_eligible { false };
    DataSource source { DataSource::DISCOVERED };
    std::chrono::system_clock::time_point refreshed_at { };

    /// Display kind: classification, or the type hint for generic hosts
    std::string kind() const;
};

enum class SortKey : uint8_t
{
    ADDRESS,
    NAME,
    STATUS,
    LAST_SEEN,
};

/// @throw std::invalid_argument on unknown text
SortKey sort_key_from_string(const std::string& text);

struct DirectoryFilter
{
    std::optional<std::string> kind;        ///< classification name or type hint
    std::optional<DeviceStatus> status;
    std::optional<std::string> search;      ///< case-insensitive substring of address, hostname, names or id
    std::optional<SshStatus> ssh_status;
    std::optional<bool> power_on;           ///< power switches in the given state
    SortKey sort { SortKey::ADDRESS };
    bool descending { false };
    std::size_t limit { 0 };                ///< 0 means unlimited
};

struct DirectorySummary
{
    std::size_t total { 0 };
    std::map<std::string, std::size_t> by_kind;
    std::map<std::string, std::size_t> by_status;
    std::map<std::string, std::size_t> by_ssh_status;
};

class DeviceDirectory
{
public:
    DeviceDirectory(const LabConfig& lab,
                    DeviceCache_T& cache,
                    Scanner& scanner,
                    IdentityProber& prober,
                    log_callback_t log_callback = nullptr);

    /// @brief Scan networks, identify reachable hosts and rebuild the directory.
    /// @param networks Defaults to the configured target network when empty.
    /// @throw std::invalid_argument on a malformed network
    /// @throw CacheError if the cache could not be written
    std::vector<DeviceRecord> refresh(const std::vector<std::string>& networks = {}, bool force_refresh = false);

    /// @brief Rebuild the directory from the static configuration and the cache only.
    std::vector<DeviceRecord> load_cached();

    /// @brief Combine scan and identification results with the cache and static configuration.
    ///  Pure with respect to the network: the same inputs give the same records.
    std::vector<DeviceRecord> merge(const std::vector<HostRecord>& hosts,
                                    const std::vector<IdentificationResult>& results,
                                    std::chrono::system_clock::time_point now) const;

    /// @brief Filter, sort and limit the current records.
    std::vector<DeviceRecord> query(const DirectoryFilter& filter) const;

    /// Records of the last refresh
    std::vector<DeviceRecord> records() const;

    static std::vector<DeviceRecord> apply(std::vector<DeviceRecord> records, const DirectoryFilter& filter);

    static DirectorySummary summarize(const std::vector<DeviceRecord>& records);

private:
    const LabConfig& m_lab;
    DeviceCache_T& m_cache;
    Scanner& m_scanner;
    IdentityProber& m_prober;
    log_callback_t m_log_callback;
    mutable std::mutex m_mutex;
    std::vector<DeviceRecord> m_records;
};

} // namespace labnet

#endif // __LABNET_DEVICE_DIRECTORY_HPP__

/** @} */
