/**
 * @file lab_config.cpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * lab_devices.json parsing and environment overrides
 * @{
 */
#include "labnet/lab_config.hpp"
#include "logging.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace labnet
{

using json = nlohmann::json;
namespace fs = std::filesystem;

constexpr auto DEFAULT_PASSWORD_ENV { "LABNET_RELAY_PASSWORD" };

static std::optional<std::string> env_value(const char* name)
{
    const char* value = std::getenv(name);
    if ((value == nullptr) || (*value == '\0'))
    {
        return std::nullopt;
    }
    return std::string(value);
}

Classification StaticDevice::classification_hint() const
{
    if (device_type == "tasmota_device")
    {
        return Classification::POWER_SWITCH;
    }
    if (device_type == "test_equipment")
    {
        return Classification::INSTRUMENT;
    }
    if (device_type.empty() || (device_type == "other"))
    {
        return Classification::UNCLASSIFIED;
    }
    return Classification::GENERIC;
}

const std::string& StaticDevice::display_name() const
{
    if (!friendly_name.empty())
    {
        return friendly_name;
    }
    if (!name.empty())
    {
        return name;
    }
    return id;
}

std::optional<std::string> StaticDevice::password() const
{
    if (password_env.empty())
    {
        return std::nullopt;
    }
    return env_value(password_env.c_str());
}

static StaticDevice parse_device(const std::string& id, const json& j)
{
    StaticDevice device;
    device.id = id;
    device.name = j.value("name", "");
    device.friendly_name = j.value("friendly_name", "");
    device.address = j.value("ip", "");
    device.hostname = j.value("hostname", "");
    device.principal = j.value("ssh_user", "root");
    if (j.contains("ports") && j["ports"].is_object())
    {
        device.ssh_port = j["ports"].value<uint16_t>("ssh", DEFAULT_SSH_PORT);
    }
    device.device_type = j.value("device_type", "");
    device.power_switch = j.value("power_switch", "");
    device.relay_eligible = j.value("relay", false);
    device.password_env = j.value("password_env", "");
    device.identity_file = j.value("identity_file", "");
    device.description = j.value("description", "");
    device.model = j.value("model", "");
    device.manufacturer = j.value("manufacturer", "");
    device.tags = j.value("tags", std::vector<std::string>{});
    return device;
}

static void parse_infrastructure(const json& j, LabConfig& config)
{
    if (j.contains("network_access"))
    {
        const auto& access = j["network_access"];
        config.set_target_network(access.value("target_network", std::string(DEFAULT_TARGET_NETWORK)));
    }
    if (j.contains("relay_gateway") && j["relay_gateway"].is_object())
    {
        const auto& relay = j["relay_gateway"];
        Endpoint gateway;
        gateway.host = relay.value("host", "");
        gateway.port = relay.value<uint16_t>("port", DEFAULT_RELAY_SSH_PORT);
        gateway.principal = relay.value("user", "root");
        if (relay.contains("identity_file"))
        {
            gateway.identity_file = relay["identity_file"].get<std::string>();
        }
        const auto password_env = relay.value("password_env", std::string(DEFAULT_PASSWORD_ENV));
        gateway.password = env_value(password_env.c_str());
        if (!gateway.host.empty())
        {
            config.set_relay_gateway(gateway);
        }
    }
}

static void parse_discovery(const json& j, DiscoverySettings& discovery)
{
    using namespace std::chrono;
    discovery.principals = j.value("principals", discovery.principals);
    discovery.scan_width = j.value("scan_width", discovery.scan_width);
    discovery.identity_width = j.value("identity_width", discovery.identity_width);
    discovery.classification_width = j.value("classification_width", discovery.classification_width);
    discovery.max_hosts = j.value("max_hosts", discovery.max_hosts);
    if (j.contains("identity_file"))
    {
        discovery.identity_file = j["identity_file"].get<std::string>();
    }
    discovery.probe_timeout = milliseconds(j.value("probe_timeout_ms", discovery.probe_timeout.count()));
    discovery.attempt_timeout = milliseconds(j.value("attempt_timeout_ms", discovery.attempt_timeout.count()));
    discovery.classification_timeout =
        milliseconds(j.value("classification_timeout_ms", discovery.classification_timeout.count()));
    if (j.contains("identity_expiry_hours"))
    {
        discovery.cache.identity_expiry = hours(j["identity_expiry_hours"].get<int64_t>());
    }
    if (j.contains("liveness_expiry_minutes"))
    {
        discovery.cache.liveness_expiry = minutes(j["liveness_expiry_minutes"].get<int64_t>());
    }
}

LabConfig LabConfig::parse(const std::string& text)
{
    LabConfig config;
    try
    {
        auto j = json::parse(text);
        if (!j.is_object())
        {
            throw ConfigError("lab configuration must be a JSON object");
        }
        if (j.contains("devices"))
        {
            for (const auto& [id, value] : j["devices"].items())
            {
                if (!value.is_object() || (value.value("status", "") == "template") ||
                    (value.value("device_type", "") == "example"))
                {
                    continue;
                }
                config.add_device(parse_device(id, value));
            }
        }
        if (j.contains("lab_infrastructure"))
        {
            parse_infrastructure(j["lab_infrastructure"], config);
            const auto& infrastructure = j["lab_infrastructure"];
            if (infrastructure.contains("network_access"))
            {
                config.m_lab_networks = infrastructure["network_access"].value("lab_networks", std::vector<std::string>{});
            }
        }
        if (j.contains("discovery"))
        {
            parse_discovery(j["discovery"], config.m_discovery);
        }
    }
    catch (const json::exception& e)
    {
        throw ConfigError(std::string("invalid lab configuration: ") + e.what());
    }
    return config;
}

LabConfig LabConfig::load(const std::string& path, log_callback_t log_callback)
{
    auto& m_log_callback = log_callback;
    std::error_code ec;
    if (!fs::exists(path, ec))
    {
        DBG("No lab configuration at " << path << ", using an empty directory", LOG_LVL_DBG_HI);
        return LabConfig{};
    }
    std::ifstream in(path);
    if (!in)
    {
        throw ConfigError("unable to read lab configuration " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    try
    {
        auto config = parse(buffer.str());
        DBG("Loaded " << config.devices().size() << " devices from " << path, LOG_LVL_DBG_HI);
        return config;
    }
    catch (const ConfigError& e)
    {
        ERR(path << ": " << e.what());
        throw ConfigError(path + ": " + e.what());
    }
}

void LabConfig::add_device(const StaticDevice& device)
{
    m_devices[device.id] = device;
}

const StaticDevice* LabConfig::find(const std::string& ref) const
{
    if (ref.empty())
    {
        return nullptr;
    }
    auto it = m_devices.find(ref);
    if (it != m_devices.end())
    {
        return &it->second;
    }
    using boost::algorithm::iequals;
    for (const auto& [id, device] : m_devices)
    {
        if (iequals(id, ref) || iequals(device.friendly_name, ref) || iequals(device.name, ref) ||
            iequals(device.hostname, ref) || (device.address == ref))
        {
            return &device;
        }
    }
    return nullptr;
}

const StaticDevice* LabConfig::find_by_address(const std::string& address) const
{
    for (const auto& [id, device] : m_devices)
    {
        if (!address.empty() && (device.address == address))
        {
            return &device;
        }
    }
    return nullptr;
}

std::vector<std::string> LabConfig::controlled_by(const std::string& switch_id) const
{
    std::vector<std::string> ids;
    for (const auto& [id, device] : m_devices)
    {
        if (device.power_switch == switch_id)
        {
            ids.push_back(id);
        }
    }
    return ids;
}

ProberConfig LabConfig::prober_config() const
{
    ProberConfig config;
    config.principals = m_discovery.principals;
    config.attempt_timeout = m_discovery.attempt_timeout;
    config.classification_timeout = m_discovery.classification_timeout;
    config.identity_width = m_discovery.identity_width;
    config.classification_width = m_discovery.classification_width;
    config.identity_file = m_discovery.identity_file;
    for (const auto& [id, device] : m_devices)
    {
        if (device.address.empty())
        {
            continue;
        }
        if (device.classification_hint() == Classification::POWER_SWITCH)
        {
            auto controlled = controlled_by(id);
            if (!controlled.empty())
            {
                config.controls[device.address] = controlled;
            }
        }
        if (device.relay_eligible)
        {
            config.relay_addresses.push_back(device.address);
        }
    }
    return config;
}

Settings Settings::from_environment()
{
    const auto home = env_value("HOME").value_or(".");
    const auto root = env_value("LABNET_ROOT").value_or(home + "/.config/labnet");

    Settings settings;
    settings.config_path = env_value("LABNET_CONFIG").value_or(root + "/config/lab_devices.json");
    settings.cache_path = env_value("LABNET_CACHE").value_or(home + "/.cache/labnet/device_cache.json");
    return settings;
}

LabConfig load_lab_config(const Settings& settings, log_callback_t log_callback)
{
    auto config = LabConfig::load(settings.config_path, log_callback);
    if (auto network = env_value("TARGET_NETWORK"))
    {
        config.set_target_network(*network);
    }
    return config;
}

} // namespace labnet

/** @} */
