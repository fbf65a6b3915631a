#ifndef __LABNET_DEVICE_CACHE_HPP__
#define __LABNET_DEVICE_CACHE_HPP__
/**
 * @file device_cache.hpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Expiring store of device identities keyed by network address.
 * @{
 */
#include "device_types.hpp"
#include "log.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

namespace labnet
{

typedef std::function<std::chrono::system_clock::time_point ()> wall_clock_t;

struct CacheConfig
{
    std::chrono::system_clock::duration identity_expiry { std::chrono::hours(7 * 24) };
    std::chrono::system_clock::duration liveness_expiry { std::chrono::minutes(10) };
};

/// @brief Raised when the durable cache can not be written.
class CacheError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/// @brief True when the last successful contact with the device is recent enough to trust.
bool is_contact_fresh(const DeviceIdentity& identity,
                      std::chrono::system_clock::time_point now,
                      std::chrono::system_clock::duration liveness_expiry);

/// @brief Cache interface. Implementations are internally synchronized.
class DeviceCache_T
{
public:
    virtual ~DeviceCache_T() = default;

    /// @return the entry for address, or std::nullopt if absent or older than the identity expiry
    virtual std::optional<DeviceIdentity> get(const std::string& address) const = 0;

    /// Insert or replace the entry for address. The entry is stamped with the current time.
    /// @throw CacheError if the entry could not be made durable
    virtual void put(const std::string& address, const DeviceIdentity& identity) = 0;

    /// Every stored entry, expired ones included until the next compact()
    virtual std::map<std::string, DeviceIdentity> all() const = 0;

    /// @return true if an entry was removed
    virtual bool remove(const std::string& address) = 0;

    /// Drop expired entries.
    /// @return number of entries dropped
    virtual std::size_t compact() = 0;

    virtual void clear() = 0;

    virtual const CacheConfig& config() const = 0;

    /// ErrorKind::CACHE_CORRUPT if the stored entries had to be discarded on start-up
    virtual ErrorKind load_status() const { return ErrorKind::NONE; }
};

/// @brief Cache held only in process memory.
class MemoryDeviceCache : public DeviceCache_T
{
public:
    explicit MemoryDeviceCache(CacheConfig config = CacheConfig{},
                               wall_clock_t clock = &std::chrono::system_clock::now);

    std::optional<DeviceIdentity> get(const std::string& address) const override;
    void put(const std::string& address, const DeviceIdentity& identity) override;
    std::map<std::string, DeviceIdentity> all() const override;
    bool remove(const std::string& address) override;
    std::size_t compact() override;
    void clear() override;
    const CacheConfig& config() const override { return m_config; }

private:
    CacheConfig m_config;
    wall_clock_t m_clock;
    mutable std::mutex m_mutex;
    std::map<std::string, DeviceIdentity> m_entries;
};

/// @brief Cache persisted as a JSON snapshot.
///
/// Every change writes a complete snapshot to "<path>.tmp", syncs it to disk and atomically
/// renames it over the durable file, so a crash at any point leaves either the old or the new
/// snapshot. If the durable file cannot be parsed on start-up it is copied to "<path>.bak"
/// and the cache starts empty.
class FileDeviceCache : public DeviceCache_T
{
public:
    FileDeviceCache(const std::string& path,
                    CacheConfig config = CacheConfig{},
                    log_callback_t log_callback = nullptr,
                    wall_clock_t clock = &std::chrono::system_clock::now);

    virtual ~FileDeviceCache() override;

    std::optional<DeviceIdentity> get(const std::string& address) const override;
    void put(const std::string& address, const DeviceIdentity& identity) override;
    std::map<std::string, DeviceIdentity> all() const override;
    bool remove(const std::string& address) override;
    std::size_t compact() override;
    void clear() override;
    const CacheConfig& config() const override;
    ErrorKind load_status() const override;

    /// True if the durable file was unreadable at start-up and has been reset.
    bool was_corrupt() const;

    const std::string& path() const;
    std::string backup_path() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pimpl;
};

} // namespace labnet

#endif // __LABNET_DEVICE_CACHE_HPP__

/** @} */
