#ifndef __LABNET_EXECUTOR_HPP__
#define __LABNET_EXECUTOR_HPP__
/**
 * @file executor.hpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Abstractions for running commands and copying files on a remote device.
 * @{
 */
#include "cancellation.hpp"
#include "log.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace labnet
{

constexpr uint16_t DEFAULT_SSH_PORT { 22 };

/// @brief Where and as whom to log in.
struct Endpoint
{
    std::string host;
    uint16_t port { DEFAULT_SSH_PORT };
    std::string principal;
    std::optional<std::string> password;        ///< prefer keys, used through sshpass when set
    std::optional<std::string> identity_file;
};

/// Outcome of the transport, independent of the remote command's exit code
enum class ExecOutcome : uint8_t
{
    OK,
    AUTHENTICATION_FAILED,
    TIMEOUT,
    REFUSED,
    UNREACHABLE,
    CANCELLED,
    TRANSPORT_ERROR,
};

const char* to_string(ExecOutcome outcome);

struct ExecResult
{
    ExecOutcome outcome { ExecOutcome::TRANSPORT_ERROR };
    int exit_code { -1 };
    std::string stdout_text;
    std::string stderr_text;
    bool gateway_failed { false };  ///< relayed only: the gateway hop itself failed

    /// The transport reached the device and the remote side ran to completion
    bool transport_ok() const
    {
        return outcome == ExecOutcome::OK;
    }

    bool succeeded() const
    {
        return transport_ok() && (exit_code == 0);
    }
};

/// @brief Programs and options used by the OpenSSH based implementations.
struct SshSettings
{
    std::string ssh_program { "ssh" };
    std::string scp_program { "scp" };
    std::string rsync_program { "rsync" };
    std::string sshpass_program { "sshpass" };
    std::string control_dir { "/tmp/labnet-ssh" };     ///< ControlPath sockets of pooled masters
    std::chrono::seconds server_alive_interval { 15 };
    bool strict_host_key_checking { false };
};

/// @brief A reusable, multiplexed channel to one device.
class Transport_T
{
public:
    virtual ~Transport_T() = default;

    /// No-op round trip over the channel; never tears it down.
    virtual bool is_alive() = 0;

    /// Tear the channel down. Subsequent is_alive() calls return false.
    virtual void close() = 0;

    /// Rendezvous used by the executor to reuse the channel (e.g. an ssh ControlPath).
    virtual std::string control_path() const = 0;
};

/// @brief Creates transports for the connection pool.
class TransportFactory_T
{
public:
    virtual ~TransportFactory_T() = default;

    /// @return A live transport, or nullptr if none could be established within timeout.
    virtual std::shared_ptr<Transport_T> establish(const Endpoint& endpoint,
                                                   std::chrono::steady_clock::duration timeout) = 0;

    /// @brief Factory of OpenSSH control masters (ssh -M) reused through their ControlPath.
    static std::shared_ptr<TransportFactory_T> create_ssh_master(const SshSettings& settings = SshSettings{},
                                                                 log_callback_t log_callback = nullptr);
};

struct ExecOptions
{
    std::chrono::steady_clock::duration timeout { std::chrono::seconds(10) };
    std::shared_ptr<Transport_T> transport;             ///< pooled channel, nullptr for a fresh connection
    std::shared_ptr<const CancellationToken> cancel;
    std::optional<Endpoint> relay;                      ///< gateway for a two hop execution
};

struct TransferRequest
{
    enum class Direction : uint8_t { PUSH, PULL };
    enum class Mode : uint8_t { COPY, SYNC };

    Direction direction { Direction::PUSH };
    Mode mode { Mode::COPY };
    std::string local_path;
    std::string remote_path;
    bool preserve { true };
    bool compress { true };
    bool delete_extraneous { false };   ///< SYNC only
    std::vector<std::string> excludes;  ///< SYNC only
};

/// @brief Runs commands and transfers against a device endpoint.
class CommandExecutor_T
{
public:
    virtual ~CommandExecutor_T() = default;

    virtual ExecResult run(const Endpoint& target, const std::string& command, const ExecOptions& options) = 0;

    /// @throw std::invalid_argument if the request is malformed
    virtual ExecResult transfer(const Endpoint& target, const TransferRequest& request, const ExecOptions& options) = 0;

    /// @brief Executor running ssh, scp and rsync as child processes.
    static std::shared_ptr<CommandExecutor_T> create_ssh(const SshSettings& settings = SshSettings{},
                                                         log_callback_t log_callback = nullptr);
};

} // namespace labnet

#endif // __LABNET_EXECUTOR_HPP__

/** @} */
