#ifndef __LABNET_ACCESS_ROUTER_HPP__
#define __LABNET_ACCESS_ROUTER_HPP__
/**
 * @file access_router.hpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Resolves a device reference to a route and executes commands or transfers over it,
 * falling back to the relay gateway when the direct route fails.
 * @{
 */
#include "connection_pool.hpp"
#include "device_cache.hpp"
#include "device_types.hpp"
#include "executor.hpp"
#include "lab_config.hpp"
#include "log.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace labnet
{

enum class PlanMode : uint8_t
{
    DIRECT,
    RELAYED,
};

const char* to_string(PlanMode mode);

/// @brief How one device is reached.
struct AccessPlan
{
    std::string device_id;
    Endpoint target;
    PlanMode mode { PlanMode::DIRECT };
    std::optional<Endpoint> gateway;    ///< set for RELAYED plans
    bool relay_eligible { false };
};

struct AccessResult
{
    std::string device_id;
    std::string address;
    bool success { false };
    std::optional<PlanMode> plan_used;  ///< unset when the reference did not resolve
    bool relay_attempted { false };
    ErrorKind error { ErrorKind::NONE };
    std::string message;
    int exit_code { -1 };
    std::string stdout_text;
    std::string stderr_text;
};

struct RouterConfig
{
    std::chrono::steady_clock::duration direct_timeout { std::chrono::seconds(10) };
    std::chrono::steady_clock::duration relayed_timeout { std::chrono::seconds(60) };
    std::chrono::steady_clock::duration copy_timeout { std::chrono::seconds(60) };
    std::chrono::steady_clock::duration relayed_copy_timeout { std::chrono::seconds(120) };
    std::chrono::steady_clock::duration sync_timeout { std::chrono::seconds(300) };
    std::chrono::steady_clock::duration relayed_sync_timeout { std::chrono::seconds(300) };
    std::size_t batch_width { 10 };
    std::size_t copy_width { 4 };   ///< concurrent files of copy_files_to
};

/// One file of a multi-file copy
struct FileCopy
{
    std::string local_path;
    std::string remote_path;
};

class AccessRouter
{
public:
    /// @param pool Optional; without one every attempt opens a fresh connection.
    AccessRouter(const LabConfig& lab,
                 const DeviceCache_T& cache,
                 CommandExecutor_T& executor,
                 ConnectionPool* pool = nullptr,
                 RouterConfig config = RouterConfig{},
                 log_callback_t log_callback = nullptr);

    /// @brief Direct plan for a device reference (id, name, hostname, unique id or address).
    /// @param principal Overrides the configured login when not empty.
    /// @return std::nullopt if the reference is unknown
    std::optional<AccessPlan> resolve(const std::string& device_ref, const std::string& principal = {}) const;

    /// @brief The relayed counterpart of a direct plan.
    /// @return std::nullopt if the device is not relay eligible or no gateway is configured
    std::optional<AccessPlan> relayed(const AccessPlan& direct) const;

    AccessResult execute(const std::string& device_ref, const std::string& command,
                         const std::string& principal = {});

    /// Push a local file or directory to the device
    AccessResult copy_to(const std::string& device_ref, const std::string& local_path,
                         const std::string& remote_path, const std::string& principal = {});

    /// Pull a remote file or directory from the device
    AccessResult copy_from(const std::string& device_ref, const std::string& remote_path,
                           const std::string& local_path, const std::string& principal = {});

    /// Mirror a local directory to the device with rsync
    AccessResult sync_to(const std::string& device_ref, const std::string& local_dir,
                         const std::string& remote_dir, bool delete_extraneous = false,
                         const std::vector<std::string>& excludes = {},
                         const std::string& principal = {});

    /// @brief Push several files to one device concurrently over a single pooled connection.
    ///  Each file falls back to the relay on its own.
    /// @return one result per file, in input order
    std::vector<AccessResult> copy_files_to(const std::string& device_ref,
                                            const std::vector<FileCopy>& files,
                                            std::size_t width = 0,
                                            const std::string& principal = {});

    /// @brief Run command on every device independently.
    /// @return one result per reference, in input order
    std::vector<AccessResult> execute_batch(const std::vector<std::string>& device_refs,
                                            const std::string& command,
                                            const std::string& principal = {},
                                            std::size_t width = 0);

    const RouterConfig& config() const { return m_config; }

private:
    typedef std::function<ExecResult (const AccessPlan& plan, const ExecOptions& options)> attempt_t;

    AccessResult route(const std::string& device_ref, const std::string& principal,
                       std::chrono::steady_clock::duration direct_timeout,
                       std::chrono::steady_clock::duration relayed_timeout,
                       const attempt_t& attempt);

    /// Direct attempt over transport, then the relayed one
    AccessResult route_plan(const AccessPlan& plan, const std::shared_ptr<Transport_T>& transport,
                            std::chrono::steady_clock::duration direct_timeout,
                            std::chrono::steady_clock::duration relayed_timeout,
                            const attempt_t& attempt);

    const LabConfig& m_lab;
    const DeviceCache_T& m_cache;
    CommandExecutor_T& m_executor;
    ConnectionPool* m_pool;
    const RouterConfig m_config;
    log_callback_t m_log_callback;
};

} // namespace labnet

#endif // __LABNET_ACCESS_ROUTER_HPP__

/** @} */
