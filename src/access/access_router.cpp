/**
 * @file access_router.cpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Direct first, relayed second access to lab devices
 * @{
 */
#include "labnet/access_router.hpp"
#include "logging.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <algorithm>

namespace labnet
{

using namespace std::chrono;

constexpr auto DEFAULT_PRINCIPAL { "root" };

const char* to_string(PlanMode mode)
{
    switch (mode)
    {
    case PlanMode::DIRECT:  return "direct";
    case PlanMode::RELAYED: return "relayed";
    }
    return "direct";
}

static ErrorKind error_kind_of(ExecOutcome outcome)
{
    switch (outcome)
    {
    case ExecOutcome::OK:                       return ErrorKind::NONE;
    case ExecOutcome::AUTHENTICATION_FAILED:    return ErrorKind::AUTHENTICATION_FAILED;
    case ExecOutcome::TIMEOUT:                  return ErrorKind::TIMEOUT;
    case ExecOutcome::REFUSED:                  return ErrorKind::TRANSPORT_REFUSED;
    case ExecOutcome::UNREACHABLE:              return ErrorKind::UNREACHABLE;
    case ExecOutcome::CANCELLED:                return ErrorKind::CANCELLED;
    case ExecOutcome::TRANSPORT_ERROR:          return ErrorKind::UNREACHABLE;
    }
    return ErrorKind::UNREACHABLE;
}

static std::string describe(const ExecResult& result)
{
    std::string text { to_string(result.outcome) };
    if (!result.stderr_text.empty())
    {
        text += ": " + result.stderr_text;
        while (!text.empty() && ((text.back() == '\n') || (text.back() == '\r')))
        {
            text.pop_back();
        }
    }
    return text;
}

/// Fill the outcome of a completed transport into result
static void complete(AccessResult& result, PlanMode mode, ExecResult&& exec)
{
    result.plan_used = mode;
    result.exit_code = exec.exit_code;
    result.stdout_text = std::move(exec.stdout_text);
    result.stderr_text = std::move(exec.stderr_text);
    result.success = (exec.exit_code == 0);
    result.error = result.success ? ErrorKind::NONE : ErrorKind::COMMAND_FAILED;
    result.message = result.success ? std::string("ok")
                                    : "command exited with status " + std::to_string(exec.exit_code);
}

AccessRouter::AccessRouter(const LabConfig& lab,
                           const DeviceCache_T& cache,
                           CommandExecutor_T& executor,
                           ConnectionPool* pool,
                           RouterConfig config,
                           log_callback_t log_callback) :
    m_lab(lab),
    m_cache(cache),
    m_executor(executor),
    m_pool(pool),
    m_config(config),
    m_log_callback(std::move(log_callback))
{
}

std::optional<AccessPlan> AccessRouter::resolve(const std::string& device_ref, const std::string& principal) const
{
    AccessPlan plan;
    if (const auto* device = m_lab.find(device_ref); device && !device->address.empty())
    {
        plan.device_id = device->id;
        plan.target.host = device->address;
        plan.target.port = device->ssh_port;
        plan.target.principal = device->principal;
        plan.target.password = device->password();
        if (!device->identity_file.empty())
        {
            plan.target.identity_file = device->identity_file;
        }
        plan.relay_eligible = device->relay_eligible;
    }
    else
    {
        std::optional<DeviceIdentity> found;
        for (const auto& [address, identity] : m_cache.all())
        {
            if ((address == device_ref) || boost::algorithm::iequals(identity.hostname, device_ref) ||
                (!identity.unique_id.empty() && (identity.unique_id == device_ref)))
            {
                found = m_cache.get(address);
                if (found)
                {
                    break;
                }
            }
        }
        if (found)
        {
            plan.device_id = found->hostname.empty() ? found->address : found->hostname;
            plan.target.host = found->address;
            plan.target.principal = found->principal.empty() ? DEFAULT_PRINCIPAL : found->principal;
            plan.relay_eligible = found->relay_eligible;
        }
        else
        {
            boost::system::error_code ec;
            boost::asio::ip::make_address_v4(device_ref, ec);
            if (ec)
            {
                return std::nullopt;
            }
            plan.device_id = device_ref;
            plan.target.host = device_ref;
            plan.target.principal = DEFAULT_PRINCIPAL;
        }
    }
    if (!plan.target.identity_file)
    {
        plan.target.identity_file = m_lab.discovery().identity_file;
    }
    if (!principal.empty())
    {
        plan.target.principal = principal;
    }
    return plan;
}

std::optional<AccessPlan> AccessRouter::relayed(const AccessPlan& direct) const
{
    if (!direct.relay_eligible || !m_lab.relay_gateway())
    {
        return std::nullopt;
    }
    AccessPlan plan = direct;
    plan.mode = PlanMode::RELAYED;
    plan.gateway = m_lab.relay_gateway();
    return plan;
}

AccessResult AccessRouter::route(const std::string& device_ref, const std::string& principal,
                                 steady_clock::duration direct_timeout,
                                 steady_clock::duration relayed_timeout,
                                 const attempt_t& attempt)
{
    AccessResult result;
    result.device_id = device_ref;
    auto plan = resolve(device_ref, principal);
    if (!plan)
    {
        result.error = ErrorKind::NOT_FOUND;
        result.message = "unknown device '" + device_ref + "'";
        return result;
    }
    std::shared_ptr<Transport_T> transport;
    if (m_pool)
    {
        transport = m_pool->acquire(plan->target, direct_timeout);
    }
    return route_plan(*plan, transport, direct_timeout, relayed_timeout, attempt);
}

AccessResult AccessRouter::route_plan(const AccessPlan& plan, const std::shared_ptr<Transport_T>& transport,
                                      steady_clock::duration direct_timeout,
                                      steady_clock::duration relayed_timeout,
                                      const attempt_t& attempt)
{
    AccessResult result;
    result.device_id = plan.device_id;
    result.address = plan.target.host;

    ExecOptions options;
    options.timeout = direct_timeout;
    options.transport = transport;
    auto direct = attempt(plan, options);
    if (direct.transport_ok())
    {
        complete(result, PlanMode::DIRECT, std::move(direct));
        return result;
    }

    DBG("Direct access to " << plan.device_id << " (" << plan.target.host << ") failed: " << describe(direct),
        LOG_LVL_DBG_HI);
    if (m_pool && options.transport)
    {
        m_pool->invalidate(plan.target);
    }
    result.plan_used = PlanMode::DIRECT;
    result.error = error_kind_of(direct.outcome);
    result.message = "direct: " + describe(direct);
    result.exit_code = direct.exit_code;
    result.stderr_text = direct.stderr_text;
    if (direct.outcome == ExecOutcome::CANCELLED)
    {
        return result;
    }

    auto relay_plan = relayed(plan);
    if (!relay_plan)
    {
        return result;
    }

    INFO("Retrying " << plan.device_id << " through relay gateway " << relay_plan->gateway->host);
    result.relay_attempted = true;
    ExecOptions relay_options;
    relay_options.timeout = relayed_timeout;
    relay_options.relay = relay_plan->gateway;
    auto relayed_exec = attempt(*relay_plan, relay_options);
    if (relayed_exec.transport_ok())
    {
        complete(result, PlanMode::RELAYED, std::move(relayed_exec));
        return result;
    }

    result.plan_used = PlanMode::RELAYED;
    result.exit_code = relayed_exec.exit_code;
    result.stderr_text = relayed_exec.stderr_text;
    if (relayed_exec.gateway_failed)
    {
        result.error = ErrorKind::RELAY_UNAVAILABLE;
        result.message += "; relay gateway " + relay_plan->gateway->host + ": " + describe(relayed_exec);
    }
    else
    {
        result.error = error_kind_of(relayed_exec.outcome);
        result.message += "; relayed: " + describe(relayed_exec);
    }
    ERR("Unable to reach " << plan.device_id << ": " << result.message);
    return result;
}

std::vector<AccessResult> AccessRouter::copy_files_to(const std::string& device_ref,
                                                      const std::vector<FileCopy>& files,
                                                      std::size_t width,
                                                      const std::string& principal)
{
    std::vector<AccessResult> results(files.size());
    if (files.empty())
    {
        return results;
    }
    auto plan = resolve(device_ref, principal);
    if (!plan)
    {
        for (auto& result : results)
        {
            result.device_id = device_ref;
            result.error = ErrorKind::NOT_FOUND;
            result.message = "unknown device '" + device_ref + "'";
        }
        return results;
    }

    // Every file shares the one multiplexed connection
    std::shared_ptr<Transport_T> transport;
    if (m_pool)
    {
        transport = m_pool->acquire(plan->target, m_config.direct_timeout);
    }
    DBG("Copying " << files.size() << " files to " << plan->device_id
        << (transport ? " over a pooled connection" : ""), LOG_LVL_DBG_MID);

    width = (width == 0) ? m_config.copy_width : width;
    boost::asio::thread_pool pool(std::max<std::size_t>(1, std::min(width, files.size())));
    for (std::size_t i = 0; i < files.size(); ++i)
    {
        boost::asio::post(pool, [this, i, &files, &plan, &transport, &results]()
            {
                TransferRequest request;
                request.direction = TransferRequest::Direction::PUSH;
                request.local_path = files[i].local_path;
                request.remote_path = files[i].remote_path;
                try
                {
                    results[i] = route_plan(*plan, transport, m_config.copy_timeout, m_config.relayed_copy_timeout,
                                            [this, &request](const AccessPlan& p, const ExecOptions& options)
                                            {
                                                return m_executor.transfer(p.target, request, options);
                                            });
                }
                catch (const std::exception& e)
                {
                    ERR("Copy of " << files[i].local_path << " to " << plan->device_id << " failed: " << e.what());
                    results[i].device_id = plan->device_id;
                    results[i].address = plan->target.host;
                    results[i].error = ErrorKind::UNREACHABLE;
                    results[i].message = e.what();
                }
            });
    }
    pool.join();
    return results;
}

AccessResult AccessRouter::execute(const std::string& device_ref, const std::string& command,
                                   const std::string& principal)
{
    return route(device_ref, principal, m_config.direct_timeout, m_config.relayed_timeout,
                 [this, &command](const AccessPlan& plan, const ExecOptions& options)
                 {
                     return m_executor.run(plan.target, command, options);
                 });
}

AccessResult AccessRouter::copy_to(const std::string& device_ref, const std::string& local_path,
                                   const std::string& remote_path, const std::string& principal)
{
    TransferRequest request;
    request.direction = TransferRequest::Direction::PUSH;
    request.local_path = local_path;
    request.remote_path = remote_path;
    return route(device_ref, principal, m_config.copy_timeout, m_config.relayed_copy_timeout,
                 [this, &request](const AccessPlan& plan, const ExecOptions& options)
                 {
                     return m_executor.transfer(plan.target, request, options);
                 });
}

AccessResult AccessRouter::copy_from(const std::string& device_ref, const std::string& remote_path,
                                     const std::string& local_path, const std::string& principal)
{
    TransferRequest request;
    request.direction = TransferRequest::Direction::PULL;
    request.local_path = local_path;
    request.remote_path = remote_path;
    return route(device_ref, principal, m_config.copy_timeout, m_config.relayed_copy_timeout,
                 [this, &request](const AccessPlan& plan, const ExecOptions& options)
                 {
                     return m_executor.transfer(plan.target, request, options);
                 });
}

AccessResult AccessRouter::sync_to(const std::string& device_ref, const std::string& local_dir,
                                   const std::string& remote_dir, bool delete_extraneous,
                                   const std::vector<std::string>& excludes, const std::string& principal)
{
    TransferRequest request;
    request.direction = TransferRequest::Direction::PUSH;
    request.mode = TransferRequest::Mode::SYNC;
    request.local_path = local_dir;
    request.remote_path = remote_dir;
    request.delete_extraneous = delete_extraneous;
    request.excludes = excludes;
    return route(device_ref, principal, m_config.sync_timeout, m_config.relayed_sync_timeout,
                 [this, &request](const AccessPlan& plan, const ExecOptions& options)
                 {
                     return m_executor.transfer(plan.target, request, options);
                 });
}

std::vector<AccessResult> AccessRouter::execute_batch(const std::vector<std::string>& device_refs,
                                                      const std::string& command,
                                                      const std::string& principal,
                                                      std::size_t width)
{
    std::vector<AccessResult> results(device_refs.size());
    if (device_refs.empty())
    {
        return results;
    }
    width = (width == 0) ? m_config.batch_width : width;
    boost::asio::thread_pool pool(std::max<std::size_t>(1, std::min(width, device_refs.size())));
    for (std::size_t i = 0; i < device_refs.size(); ++i)
    {
        boost::asio::post(pool, [this, i, &device_refs, &command, &principal, &results]()
            {
                try
                {
                    results[i] = execute(device_refs[i], command, principal);
                }
                catch (const std::exception& e)
                {
                    ERR("Batch execution on " << device_refs[i] << " failed: " << e.what());
                    results[i].device_id = device_refs[i];
                    results[i].error = ErrorKind::UNREACHABLE;
                    results[i].message = e.what();
                }
            });
    }
    pool.join();
    return results;
}

} // namespace labnet

/** @} */
