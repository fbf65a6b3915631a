/**
 * @file device_cache.cpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * In-memory and JSON file backed device identity caches
 * @{
 */
#include "labnet/device_cache.hpp"
#include "identity_json.hpp"
#include "logging.hpp"
#include <boost/scope_exit.hpp>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace labnet
{

using json = nlohmann::json;
using namespace std::chrono;
namespace fs = std::filesystem;

bool is_contact_fresh(const DeviceIdentity& identity,
                      system_clock::time_point now,
                      system_clock::duration liveness_expiry)
{
    if (identity.last_contact == system_clock::time_point{})
    {
        return false;
    }
    return (now - identity.last_contact) <= liveness_expiry;
}

static bool is_expired(const DeviceIdentity& identity, system_clock::time_point now, const CacheConfig& config)
{
    return (now - identity.cached_at) > config.identity_expiry;
}

static std::size_t drop_expired(std::map<std::string, DeviceIdentity>& entries,
                                system_clock::time_point now,
                                const CacheConfig& config)
{
    std::size_t dropped { 0 };
    for (auto it = entries.begin(); it != entries.end();)
    {
        if (is_expired(it->second, now, config))
        {
            it = entries.erase(it);
            ++dropped;
        }
        else
        {
            ++it;
        }
    }
    return dropped;
}

/*****************************************************************************
 * MemoryDeviceCache
 */

MemoryDeviceCache::MemoryDeviceCache(CacheConfig config, wall_clock_t clock) :
    m_config(config),
    m_clock(std::move(clock))
{
}

std::optional<DeviceIdentity> MemoryDeviceCache::get(const std::string& address) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(address);
    if ((it == m_entries.end()) || is_expired(it->second, m_clock(), m_config))
    {
        return std::nullopt;
    }
    return it->second;
}

void MemoryDeviceCache::put(const std::string& address, const DeviceIdentity& identity)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto entry = identity;
    entry.address = address;
    entry.cached_at = m_clock();
    m_entries[address] = std::move(entry);
}

std::map<std::string, DeviceIdentity> MemoryDeviceCache::all() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries;
}

bool MemoryDeviceCache::remove(const std::string& address)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.erase(address) > 0;
}

std::size_t MemoryDeviceCache::compact()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return drop_expired(m_entries, m_clock(), m_config);
}

void MemoryDeviceCache::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
}

/*****************************************************************************
 * FileDeviceCache
 */

struct FileDeviceCache::Impl
{
    Impl(const std::string& path, CacheConfig config, log_callback_t log_callback, wall_clock_t clock) :
        m_path(path),
        m_config(config),
        m_log_callback(std::move(log_callback)),
        m_clock(std::move(clock))
    {
        load();
    }

    void load();
    /// Make entries the durable snapshot. Memory is only updated by the caller on success.
    void write_snapshot(const std::map<std::string, DeviceIdentity>& entries);
    void commit(std::map<std::string, DeviceIdentity> entries)
    {
        write_snapshot(entries);
        m_entries.swap(entries);
    }

    const std::string m_path;
    const CacheConfig m_config;
    log_callback_t m_log_callback;
    wall_clock_t m_clock;
    mutable std::mutex m_mutex;
    std::map<std::string, DeviceIdentity> m_entries;
    bool m_corrupt { false };
};

void FileDeviceCache::Impl::load()
{
    std::error_code ec;
    if (!fs::exists(m_path, ec))
    {
        DBG("No device cache at " << m_path << ", starting empty", LOG_LVL_DBG_HI);
        return;
    }
    std::ifstream in(m_path);
    if (!in)
    {
        throw CacheError("Unable to read device cache " + m_path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    const auto text = buffer.str();
    if (text.find_first_not_of(" \t\r\n") == std::string::npos)
    {
        return;
    }

    try
    {
        auto j = json::parse(text);
        if (!j.is_object())
        {
            throw std::invalid_argument("top level is not an object");
        }
        std::map<std::string, DeviceIdentity> loaded;
        for (auto& [address, value] : j.items())
        {
            auto identity = value.get<DeviceIdentity>();
            identity.address = address;
            loaded[address] = std::move(identity);
        }
        m_entries.swap(loaded);
        DBG("Loaded " << m_entries.size() << " cached devices from " << m_path, LOG_LVL_DBG_HI);
    }
    catch (const json::exception& e)
    {
        m_corrupt = true;
        ERR("Device cache " << m_path << " is corrupt (" << e.what() << ")");
    }
    catch (const std::invalid_argument& e)
    {
        m_corrupt = true;
        ERR("Device cache " << m_path << " is corrupt (" << e.what() << ")");
    }

    if (m_corrupt)
    {
        const auto backup = m_path + ".bak";
        fs::copy_file(m_path, backup, fs::copy_options::overwrite_existing, ec);
        if (ec)
        {
            ERR("Unable to back up corrupt cache to " << backup << ": " << ec.message());
        }
        else
        {
            INFO("Corrupt device cache saved as " << backup << ", starting empty");
        }
        m_entries.clear();
    }
}

static void write_all(int fd, const std::string& data, const std::string& path)
{
    const char* p = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0)
    {
        auto written = ::write(fd, p, remaining);
        if (written < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            throw CacheError("Write to " + path + " failed: " + std::strerror(errno));
        }
        p += written;
        remaining -= static_cast<std::size_t>(written);
    }
}

void FileDeviceCache::Impl::write_snapshot(const std::map<std::string, DeviceIdentity>& entries)
{
    json j = json::object();
    for (const auto& [address, identity] : entries)
    {
        j[address] = identity;
    }
    const auto data = j.dump(2);
    const auto tmp_path = m_path + ".tmp";

    const auto parent = fs::path(m_path).parent_path();
    if (!parent.empty())
    {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec)
        {
            throw CacheError("Unable to create cache directory " + parent.string() + ": " + ec.message());
        }
    }

    int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0)
    {
        throw CacheError("Unable to open " + tmp_path + ": " + std::strerror(errno));
    }
    bool committed { false };
    BOOST_SCOPE_EXIT(&fd, &committed, &tmp_path)
    {
        if (fd >= 0)
        {
            ::close(fd);
        }
        if (!committed)
        {
            ::unlink(tmp_path.c_str());
        }
    }
    BOOST_SCOPE_EXIT_END

    write_all(fd, data, tmp_path);
    if (::fsync(fd) != 0)
    {
        throw CacheError("fsync of " + tmp_path + " failed: " + std::strerror(errno));
    }
    if (::close(fd) != 0)
    {
        fd = -1;
        throw CacheError("close of " + tmp_path + " failed: " + std::strerror(errno));
    }
    fd = -1;
    if (::rename(tmp_path.c_str(), m_path.c_str()) != 0)
    {
        throw CacheError("rename of " + tmp_path + " failed: " + std::strerror(errno));
    }
    committed = true;

    // Make the rename itself durable
    const auto dir = parent.empty() ? std::string(".") : parent.string();
    int dir_fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dir_fd >= 0)
    {
        if (::fsync(dir_fd) != 0)
        {
            DBG("fsync of " << dir << " failed: " << std::strerror(errno), LOG_LVL_DBG_MID);
        }
        ::close(dir_fd);
    }
}

FileDeviceCache::FileDeviceCache(const std::string& path,
                                 CacheConfig config,
                                 log_callback_t log_callback,
                                 wall_clock_t clock) :
    pimpl(std::make_unique<Impl>(path, config, std::move(log_callback), std::move(clock)))
{
}

FileDeviceCache::~FileDeviceCache() = default;

std::optional<DeviceIdentity> FileDeviceCache::get(const std::string& address) const
{
    std::lock_guard<std::mutex> lock(pimpl->m_mutex);
    auto it = pimpl->m_entries.find(address);
    if ((it == pimpl->m_entries.end()) || is_expired(it->second, pimpl->m_clock(), pimpl->m_config))
    {
        return std::nullopt;
    }
    return it->second;
}

void FileDeviceCache::put(const std::string& address, const DeviceIdentity& identity)
{
    std::lock_guard<std::mutex> lock(pimpl->m_mutex);
    auto entries = pimpl->m_entries;
    auto entry = identity;
    entry.address = address;
    entry.cached_at = pimpl->m_clock();
    entries[address] = std::move(entry);
    pimpl->commit(std::move(entries));
}

std::map<std::string, DeviceIdentity> FileDeviceCache::all() const
{
    std::lock_guard<std::mutex> lock(pimpl->m_mutex);
    return pimpl->m_entries;
}

bool FileDeviceCache::remove(const std::string& address)
{
    std::lock_guard<std::mutex> lock(pimpl->m_mutex);
    if (pimpl->m_entries.count(address) == 0)
    {
        return false;
    }
    auto entries = pimpl->m_entries;
    entries.erase(address);
    pimpl->commit(std::move(entries));
    return true;
}

std::size_t FileDeviceCache::compact()
{
    std::lock_guard<std::mutex> lock(pimpl->m_mutex);
    auto entries = pimpl->m_entries;
    auto dropped = drop_expired(entries, pimpl->m_clock(), pimpl->m_config);
    if (dropped > 0)
    {
        pimpl->commit(std::move(entries));
    }
    return dropped;
}

void FileDeviceCache::clear()
{
    std::lock_guard<std::mutex> lock(pimpl->m_mutex);
    pimpl->commit({});
}

const CacheConfig& FileDeviceCache::config() const
{
    return pimpl->m_config;
}

bool FileDeviceCache::was_corrupt() const
{
    return pimpl->m_corrupt;
}

ErrorKind FileDeviceCache::load_status() const
{
    return pimpl->m_corrupt ? ErrorKind::CACHE_CORRUPT : ErrorKind::NONE;
}

const std::string& FileDeviceCache::path() const
{
    return pimpl->m_path;
}

std::string FileDeviceCache::backup_path() const
{
    return pimpl->m_path + ".bak";
}

} // namespace labnet

/** @} */
