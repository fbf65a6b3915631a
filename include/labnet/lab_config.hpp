#ifndef __LABNET_LAB_CONFIG_HPP__
#define __LABNET_LAB_CONFIG_HPP__
/**
 * @file lab_config.hpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Static device directory and discovery settings read from lab_devices.json
 * @{
 */
#include "device_cache.hpp"
#include "device_types.hpp"
#include "executor.hpp"
#include "identity_prober.hpp"
#include "log.hpp"
#include "scanner.hpp"
#include <chrono>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace labnet
{

constexpr const char* DEFAULT_TARGET_NETWORK { "192.168.2.0/24" };
constexpr uint16_t DEFAULT_RELAY_SSH_PORT { 5025 };

/// @brief Raised when the lab configuration exists but can not be understood.
class ConfigError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/// @brief A device described by the static directory.
struct StaticDevice
{
    std::string id;
    std::string name;
    std::string friendly_name;
    std::string address;
    std::string hostname;
    std::string principal { "root" };
    uint16_t ssh_port { DEFAULT_SSH_PORT };
    std::string device_type;            ///< free-form kind, e.g. "tasmota_device"
    std::string power_switch;           ///< id of the switch powering this device
    bool relay_eligible { false };
    std::string password_env;           ///< variable holding the login password, keys are used when empty
    std::string identity_file;
    std::string description;
    std::string model;
    std::string manufacturer;
    std::vector<std::string> tags;

    /// Classification implied by device_type
    Classification classification_hint() const;

    /// friendly_name, else name, else id
    const std::string& display_name() const;

    /// Login password read from password_env, std::nullopt when unset
    std::optional<std::string> password() const;
};

/// @brief Tunables for scanning and identification.
struct DiscoverySettings
{
    std::vector<std::string> principals { "fio", "root" };
    std::size_t scan_width { DEFAULT_SCAN_WIDTH };
    std::size_t identity_width { 10 };
    std::size_t classification_width { 10 };
    std::chrono::milliseconds probe_timeout { DEFAULT_PROBE_TIMEOUT };
    std::chrono::milliseconds attempt_timeout { 5000 };
    std::chrono::milliseconds classification_timeout { 2000 };
    std::size_t max_hosts { DEFAULT_MAX_HOSTS };
    std::optional<std::string> identity_file;   ///< private key for every login
    CacheConfig cache;
};

class LabConfig
{
public:
    LabConfig() = default;

    /// @brief Read a lab configuration file. A missing file gives an empty directory.
    /// @throw ConfigError if the file exists but can not be parsed
    static LabConfig load(const std::string& path, log_callback_t log_callback = nullptr);

    /// @brief Parse a lab configuration from JSON text.
    /// @throw ConfigError if the text can not be parsed
    static LabConfig parse(const std::string& text);

    /// Devices keyed by id, template/example entries excluded
    const std::map<std::string, StaticDevice>& devices() const { return m_devices; }

    void add_device(const StaticDevice& device);

    /// @brief Find a device by id, friendly name, name, hostname or address (case-insensitive).
    const StaticDevice* find(const std::string& ref) const;

    const StaticDevice* find_by_address(const std::string& address) const;

    /// Ids of the devices powered by the switch with the given id
    std::vector<std::string> controlled_by(const std::string& switch_id) const;

    const std::string& target_network() const { return m_target_network; }
    void set_target_network(const std::string& network) { m_target_network = network; }

    const std::vector<std::string>& lab_networks() const { return m_lab_networks; }

    const std::optional<Endpoint>& relay_gateway() const { return m_relay_gateway; }
    void set_relay_gateway(const Endpoint& gateway) { m_relay_gateway = gateway; }

    const DiscoverySettings& discovery() const { return m_discovery; }
    DiscoverySettings& discovery() { return m_discovery; }

    /// @brief Prober configuration derived from discovery settings and the static directory.
    ProberConfig prober_config() const;

private:
    std::map<std::string, StaticDevice> m_devices;
    std::string m_target_network { DEFAULT_TARGET_NETWORK };
    std::vector<std::string> m_lab_networks;
    std::optional<Endpoint> m_relay_gateway;
    DiscoverySettings m_discovery;
};

/// @brief File locations resolved from the environment.
struct Settings
{
    std::string config_path;
    std::string cache_path;

    /// LABNET_CONFIG / LABNET_ROOT / LABNET_CACHE, falling back to ~/.config/labnet and ~/.cache/labnet
    static Settings from_environment();
};

/// @brief Load the configuration at settings.config_path and apply environment overrides
///  (TARGET_NETWORK, relay gateway password variable).
LabConfig load_lab_config(const Settings& settings, log_callback_t log_callback = nullptr);

} // namespace labnet

#endif // __LABNET_LAB_CONFIG_HPP__

/** @} */
