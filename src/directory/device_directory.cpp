/**
 * @file device_directory.cpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Merging of scan, identification, cache and static configuration into device records
 * @{
 */
#include "labnet/device_directory.hpp"
#include "logging.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <algorithm>
#include <set>

namespace labnet
{

using namespace std::chrono;

const char* to_string(DeviceStatus status)
{
    switch (status)
    {
    case DeviceStatus::ONLINE:      return "online";
    case DeviceStatus::DISCOVERED:  return "discovered";
    case DeviceStatus::OFFLINE:     return "offline";
    }
    return "offline";
}

const char* to_string(SshStatus status)
{
    switch (status)
    {
    case SshStatus::OK:             return "ok";
    case SshStatus::AUTH_FAILED:    return "auth_failed";
    case SshStatus::TIMEOUT:        return "timeout";
    case SshStatus::REFUSED:        return "refused";
    case SshStatus::ERROR:          return "error";
    case SshStatus::UNKNOWN:        return "unknown";
    }
    return "unknown";
}

DeviceStatus device_status_from_string(const std::string& text)
{
    for (auto status : { DeviceStatus::ONLINE, DeviceStatus::DISCOVERED, DeviceStatus::OFFLINE })
    {
        if (boost::algorithm::iequals(text, to_string(status)))
        {
            return status;
        }
    }
    throw std::invalid_argument("Unknown device status: " + text);
}

SshStatus ssh_status_from_string(const std::string& text)
{
    for (auto status : { SshStatus::OK, SshStatus::AUTH_FAILED, SshStatus::TIMEOUT,
                         SshStatus::REFUSED, SshStatus::ERROR, SshStatus::UNKNOWN })
    {
        if (boost::algorithm::iequals(text, to_string(status)))
        {
            return status;
        }
    }
    throw std::invalid_argument("Unknown ssh status: " + text);
}

SortKey sort_key_from_string(const std::string& text)
{
    const auto key = boost::algorithm::to_lower_copy(text);
    if ((key == "ip") || (key == "address"))
    {
        return SortKey::ADDRESS;
    }
    if ((key == "name") || (key == "friendly_name"))
    {
        return SortKey::NAME;
    }
    if (key == "status")
    {
        return SortKey::STATUS;
    }
    if (key == "last_seen")
    {
        return SortKey::LAST_SEEN;
    }
    throw std::invalid_argument("Unknown sort key: " + text);
}

std::string DeviceRecord::kind() const
{
    if (((classification == Classification::GENERIC) || (classification == Classification::UNCLASSIFIED)) &&
        !type_hint.empty())
    {
        return type_hint;
    }
    return to_string(classification);
}

/// Numeric IPv4 ordering, unparsable addresses last
static bool address_less(const std::string& a, const std::string& b)
{
    boost::system::error_code ec_a;
    boost::system::error_code ec_b;
    auto ip_a = boost::asio::ip::make_address_v4(a, ec_a);
    auto ip_b = boost::asio::ip::make_address_v4(b, ec_b);
    if (!ec_a && !ec_b)
    {
        return ip_a.to_uint() < ip_b.to_uint();
    }
    if (ec_a != ec_b)
    {
        return !ec_a;
    }
    return a < b;
}

static SshStatus ssh_status_of(const std::vector<CredentialAttempt>& attempts)
{
    auto any = [&attempts](AttemptOutcome outcome)
        {
            return std::any_of(attempts.begin(), attempts.end(),
                               [outcome](const auto& a) { return a.outcome == outcome; });
        };
    if (any(AttemptOutcome::SUCCESS))
    {
        return SshStatus::OK;
    }
    if (any(AttemptOutcome::AUTHENTICATION_FAILED))
    {
        return SshStatus::AUTH_FAILED;
    }
    if (any(AttemptOutcome::REFUSED))
    {
        return SshStatus::REFUSED;
    }
    if (any(AttemptOutcome::TIMEOUT))
    {
        return SshStatus::TIMEOUT;
    }
    return SshStatus::ERROR;
}

DeviceDirectory::DeviceDirectory(const LabConfig& lab,
                                 DeviceCache_T& cache,
                                 Scanner& scanner,
                                 IdentityProber& prober,
                                 log_callback_t log_callback) :
    m_lab(lab),
    m_cache(cache),
    m_scanner(scanner),
    m_prober(prober),
    m_log_callback(std::move(log_callback))
{
}

std::vector<DeviceRecord> DeviceDirectory::refresh(const std::vector<std::string>& networks, bool force_refresh)
{
    const auto targets = networks.empty() ? std::vector<std::string>{ m_lab.target_network() } : networks;
    const auto& discovery = m_lab.discovery();

    std::map<std::string, HostRecord> unique_hosts;
    for (const auto& scan : m_scanner.scan(targets, discovery.probe_timeout, discovery.max_hosts))
    {
        for (const auto& host : scan.hosts)
        {
            auto& entry = unique_hosts[host.address];
            if (!entry.reachable)
            {
                entry = host;
            }
        }
    }

    std::vector<HostRecord> hosts;
    std::vector<std::string> live;
    for (const auto& [address, host] : unique_hosts)
    {
        hosts.push_back(host);
        if (host.reachable)
        {
            live.push_back(address);
        }
    }
    INFO("Found " << live.size() << " live hosts, identifying");
    auto results = m_prober.identify(live, force_refresh);
    auto records = merge(hosts, results, system_clock::now());

    std::lock_guard<std::mutex> lock(m_mutex);
    m_records = records;
    return records;
}

std::vector<DeviceRecord> DeviceDirectory::load_cached()
{
    const auto now = system_clock::now();
    std::vector<HostRecord> hosts;
    std::vector<IdentificationResult> results;
    for (const auto& [address, stored] : m_cache.all())
    {
        auto identity = m_cache.get(address);
        if (!identity)
        {
            continue;
        }
        HostRecord host;
        host.address = address;
        host.reachable = is_contact_fresh(*identity, now, m_cache.config().liveness_expiry);
        hosts.push_back(host);

        IdentificationResult result;
        result.address = address;
        result.identity = identity;
        result.from_cache = true;
        results.push_back(result);
    }
    auto records = merge(hosts, results, now);

    std::lock_guard<std::mutex> lock(m_mutex);
    m_records = records;
    return records;
}

std::vector<DeviceRecord> DeviceDirectory::merge(const std::vector<HostRecord>& hosts,
                                                 const std::vector<IdentificationResult>& results,
                                                 system_clock::time_point now) const
{
    std::map<std::string, const HostRecord*> host_by_address;
    for (const auto& host : hosts)
    {
        host_by_address[host.address] = &host;
    }
    std::map<std::string, const IdentificationResult*> result_by_address;
    for (const auto& result : results)
    {
        result_by_address[result.address] = &result;
    }

    // Every reachable host plus every configured device
    std::set<std::string> addresses;
    for (const auto& host : hosts)
    {
        if (host.reachable)
        {
            addresses.insert(host.address);
        }
    }
    std::vector<DeviceRecord> records;
    for (const auto& [id, device] : m_lab.devices())
    {
        if (device.address.empty())
        {
            DeviceRecord record;
            record.id = id;
            record.friendly_name = device.display_name();
            record.hostname = device.hostname;
            record.classification = device.classification_hint();
            record.type_hint = device.device_type;
            record.powered_by = device.power_switch;
            record.relay_eligible = device.relay_eligible;
            record.source = DataSource::STATIC_CONFIG;
            record.refreshed_at = now;
            records.push_back(record);
            continue;
        }
        addresses.insert(device.address);
    }

    for (const auto& address : addresses)
    {
        DeviceRecord record;
        record.address = address;
        record.refreshed_at = now;

        const HostRecord* host = host_by_address.count(address) ? host_by_address[address] : nullptr;
        const IdentificationResult* result = result_by_address.count(address) ? result_by_address[address] : nullptr;
        const bool reachable = host && host->reachable;

        std::optional<DeviceIdentity> identity;
        if (result && result->identity)
        {
            identity = result->identity;
        }
        else
        {
            identity = m_cache.get(address);
        }

        const auto* device = m_lab.find_by_address(address);
        if (device)
        {
            record.id = device->id;
            record.friendly_name = device->display_name();
            record.hostname = device->hostname;
            record.classification = device->classification_hint();
            record.type_hint = device->device_type;
            record.powered_by = device->power_switch;
            record.relay_eligible = device->relay_eligible;
            record.ssh_principal = device->principal;
            record.source = DataSource::STATIC_CONFIG;
        }

        if (identity)
        {
            if (record.hostname.empty())
            {
                record.hostname = identity->hostname;
            }
            // Protocol detection is authoritative, a generic login does not override configuration
            const bool detected = (identity->classification == Classification::POWER_SWITCH) ||
                                  (identity->classification == Classification::INSTRUMENT);
            if (detected || (record.classification == Classification::UNCLASSIFIED))
            {
                record.classification = identity->classification;
                record.classification_confident = identity->classification_confident;
            }
            if (record.type_hint.empty())
            {
                record.type_hint = identity->type_hint;
            }
            record.power_switch = identity->power_switch;
            record.instrument = identity->instrument;
            record.firmware_version = identity->firmware_version;
            if (!identity->principal.empty())
            {
                record.ssh_principal = identity->principal;
            }
            record.controls = identity->controls;
            record.relay_eligible = record.relay_eligible || identity->relay_eligible;
            record.cache_age = now - identity->cached_at;
            if (identity->last_contact != system_clock::time_point{})
            {
                record.last_seen = identity->last_contact;
            }
        }

        if (record.id.empty())
        {
            record.id = record.hostname.empty() ? address : record.hostname;
        }
        if (record.friendly_name.empty())
        {
            record.friendly_name = record.hostname.empty() ? ("Device at " + address) : record.hostname;
        }
        if ((record.classification == Classification::UNCLASSIFIED) && !record.hostname.empty())
        {
            if (auto guess = IdentityProber::classification_from_hostname(record.hostname))
            {
                record.classification = *guess;
                record.classification_confident = false;
            }
        }
        if (record.type_hint.empty() && !record.hostname.empty())
        {
            record.type_hint = IdentityProber::type_hint_from_hostname(record.hostname);
        }
        if (device && (record.classification == Classification::POWER_SWITCH))
        {
            auto controlled = m_lab.controlled_by(device->id);
            if (!controlled.empty())
            {
                record.controls = controlled;
            }
        }

        if (reachable)
        {
            const bool known = device || (identity && (identity->is_identified() || identity->is_classified()));
            record.status = known ? DeviceStatus::ONLINE : DeviceStatus::DISCOVERED;
            record.latency_ms = host->latency_ms;
            if (result && !result->from_cache)
            {
                record.last_seen = now;
            }
        }
        else
        {
            record.status = DeviceStatus::OFFLINE;
        }

        if (result && !result->attempts.empty())
        {
            record.ssh_status = ssh_status_of(result->attempts);
        }
        else if (identity && identity->is_identified())
        {
            record.ssh_status = SshStatus::OK;
        }
        records.push_back(std::move(record));
    }

    std::stable_sort(records.begin(), records.end(),
                     [](const auto& a, const auto& b) { return address_less(a.address, b.address); });
    return records;
}

std::vector<DeviceRecord> DeviceDirectory::records() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records;
}

std::vector<DeviceRecord> DeviceDirectory::query(const DirectoryFilter& filter) const
{
    return apply(records(), filter);
}

static bool matches(const DeviceRecord& record, const DirectoryFilter& filter)
{
    using boost::algorithm::iequals;
    using boost::algorithm::icontains;
    if (filter.kind && !iequals(record.kind(), *filter.kind) &&
        !iequals(to_string(record.classification), *filter.kind) && !iequals(record.type_hint, *filter.kind))
    {
        return false;
    }
    if (filter.status && (record.status != *filter.status))
    {
        return false;
    }
    if (filter.ssh_status && (record.ssh_status != *filter.ssh_status))
    {
        return false;
    }
    if (filter.power_on)
    {
        if (!record.power_switch || !record.power_switch->power_on ||
            (*record.power_switch->power_on != *filter.power_on))
        {
            return false;
        }
    }
    if (filter.search && !filter.search->empty())
    {
        const auto& text = *filter.search;
        if (!icontains(record.address, text) && !icontains(record.hostname, text) &&
            !icontains(record.friendly_name, text) && !icontains(record.id, text))
        {
            return false;
        }
    }
    return true;
}

std::vector<DeviceRecord> DeviceDirectory::apply(std::vector<DeviceRecord> records, const DirectoryFilter& filter)
{
    records.erase(std::remove_if(records.begin(), records.end(),
                                 [&filter](const auto& r) { return !matches(r, filter); }),
                  records.end());

    auto less = [&filter](const DeviceRecord& a, const DeviceRecord& b)
        {
            switch (filter.sort)
            {
            case SortKey::NAME:
                return boost::algorithm::ilexicographical_compare(a.friendly_name, b.friendly_name);
            case SortKey::STATUS:
                return a.status < b.status;
            case SortKey::LAST_SEEN:
                return a.last_seen.value_or(system_clock::time_point{}) < b.last_seen.value_or(system_clock::time_point{});
            case SortKey::ADDRESS:
                break;
            }
            return address_less(a.address, b.address);
        };
    std::stable_sort(records.begin(), records.end(),
                     [&](const auto& a, const auto& b) { return filter.descending ? less(b, a) : less(a, b); });

    if ((filter.limit > 0) && (records.size() > filter.limit))
    {
        records.resize(filter.limit);
    }
    return records;
}

DirectorySummary DeviceDirectory::summarize(const std::vector<DeviceRecord>& records)
{
    DirectorySummary summary;
    summary.total = records.size();
    for (const auto& record : records)
    {
        ++summary.by_kind[record.kind()];
        ++summary.by_status[to_string(record.status)];
        ++summary.by_ssh_status[to_string(record.ssh_status)];
    }
    return summary;
}

} // namespace labnet

/** @} */
