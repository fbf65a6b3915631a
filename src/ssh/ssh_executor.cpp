/**
 * @file ssh_executor.cpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * CommandExecutor_T running the OpenSSH client tools as child processes
 * @{
 */
#include "labnet/executor.hpp"
#include "logging.hpp"
#include "process_runner.hpp"
#include "ssh_command.hpp"
#include <boost/algorithm/string/join.hpp>
#include <map>

namespace labnet
{

using namespace std::chrono;

class SshExecutor : public CommandExecutor_T
{
public:
    SshExecutor(const SshSettings& settings, log_callback_t log_callback) :
        m_settings(settings),
        m_log_callback(std::move(log_callback))
    {
    }

    ExecResult run(const Endpoint& target, const std::string& command, const ExecOptions& options) override;
    ExecResult transfer(const Endpoint& target, const TransferRequest& request, const ExecOptions& options) override;

private:
    ExecResult launch(const std::vector<std::string>& argv, const Endpoint& credentials, const ExecOptions& options,
                      std::map<std::string, std::string> env = {}, const std::string& input = {});
    static std::string control_path_of(const ExecOptions& options);

    const SshSettings m_settings;
    log_callback_t m_log_callback;
};

std::string SshExecutor::control_path_of(const ExecOptions& options)
{
    return options.transport ? options.transport->control_path() : std::string{};
}

ExecResult SshExecutor::launch(const std::vector<std::string>& argv, const Endpoint& credentials,
                               const ExecOptions& options, std::map<std::string, std::string> env,
                               const std::string& input)
{
    if (credentials.password)
    {
        env["SSHPASS"] = *credentials.password;
    }
    auto full_argv = with_password(m_settings, credentials, argv);
    DBG("exec: " << boost::algorithm::join(argv, " "), LOG_LVL_DBG_LOW);

    auto output = run_process(full_argv, env, options.timeout, options.cancel.get(), input);

    ExecResult result;
    result.exit_code = output.exit_code;
    result.stdout_text = std::move(output.stdout_text);
    result.stderr_text = std::move(output.stderr_text);
    if (!output.started)
    {
        result.outcome = output.cancelled ? ExecOutcome::CANCELLED : ExecOutcome::TRANSPORT_ERROR;
        result.stderr_text = output.launch_error;
        if (!output.launch_error.empty())
        {
            ERR("Unable to launch " << argv.front() << ": " << output.launch_error);
        }
    }
    else if (output.cancelled)
    {
        result.outcome = ExecOutcome::CANCELLED;
    }
    else if (output.timed_out)
    {
        result.outcome = ExecOutcome::TIMEOUT;
    }
    else
    {
        result.outcome = ExecOutcome::OK;
    }
    return result;
}

ExecResult SshExecutor::run(const Endpoint& target, const std::string& command, const ExecOptions& options)
{
    if (!options.relay)
    {
        // Through sshpass the exit status alone can not tell a remote exit code from a failed login
        const bool marked = target.password.has_value();
        auto argv = ssh_command_argv(m_settings, target, marked ? mark_started(command) : command, options.timeout,
                                     control_path_of(options));
        auto result = launch(argv, target, options);
        if (result.outcome != ExecOutcome::OK)
        {
            return result;
        }
        if (marked && strip_marker(result.stderr_text, REMOTE_STARTED_MARKER))
        {
            return result;
        }
        result.outcome = classify_ssh_failure(result.exit_code, result.stderr_text, marked);
        return result;
    }

    const auto& gateway = *options.relay;
    RelayedCommand relayed { gateway, target, command };
    auto argv = ssh_command_argv(m_settings, gateway, relayed.gateway_command(m_settings, options.timeout), options.timeout);
    auto result = launch(argv, gateway, options, {}, relayed.gateway_input());
    if (result.outcome != ExecOutcome::OK)
    {
        return result;
    }

    const bool started = strip_marker(result.stderr_text, REMOTE_STARTED_MARKER);
    const bool target_hop_failed = strip_marker(result.stderr_text, RELAY_TARGET_FAILED_MARKER);
    if (started)
    {
        return result;
    }
    if (target_hop_failed)
    {
        // The gateway ran the nested ssh, the exit status is the inner client's
        result.outcome = classify_ssh_failure(result.exit_code, result.stderr_text, target.password.has_value());
        return result;
    }
    result.outcome = classify_ssh_failure(result.exit_code, result.stderr_text, gateway.password.has_value());
    if ((result.outcome == ExecOutcome::OK) && (result.exit_code != 0))
    {
        // Neither the command nor the nested ssh ran, e.g. sshpass is missing on the gateway
        result.outcome = ExecOutcome::TRANSPORT_ERROR;
    }
    if (result.outcome != ExecOutcome::OK)
    {
        result.gateway_failed = true;
        DBG("Relay gateway " << gateway.host << " failed: " << to_string(result.outcome), LOG_LVL_DBG_HI);
    }
    return result;
}

ExecResult SshExecutor::transfer(const Endpoint& target, const TransferRequest& request, const ExecOptions& options)
{
    // With a relay the jump host is reached through ProxyJump or ProxyCommand, pooled channels do not apply
    const auto control_path = options.relay ? std::string{} : control_path_of(options);
    auto argv = transfer_argv(m_settings, target, request, options.timeout, control_path, options.relay);
    std::map<std::string, std::string> env;
    if (options.relay && options.relay->password)
    {
        env[RELAY_SSHPASS_VARIABLE] = *options.relay->password;
    }
    auto result = launch(argv, target, options, env);
    if (result.outcome != ExecOutcome::OK)
    {
        return result;
    }
    result.outcome = classify_transfer_failure(request.mode, result.exit_code, result.stderr_text,
                                               target.password.has_value());
    if (options.relay && (result.outcome != ExecOutcome::OK))
    {
        const auto& gateway = *options.relay;
        const auto& text = result.stderr_text;
        const bool forwarding_failed = (text.find("stdio forwarding failed") != std::string::npos) ||
                                       (text.find("open failed") != std::string::npos);
        // A proxy that never connected leaves ssh talking to a closed pipe
        const bool proxy_closed = (text.find("UNKNOWN port") != std::string::npos) &&
                                  (text.find("Permission denied") == std::string::npos);
        if (!forwarding_failed && ((text.find(gateway.host) != std::string::npos) || proxy_closed))
        {
            result.gateway_failed = true;
        }
    }
    return result;
}

std::shared_ptr<CommandExecutor_T> CommandExecutor_T::create_ssh(const SshSettings& settings, log_callback_t log_callback)
{
    return std::make_shared<SshExecutor>(settings, std::move(log_callback));
}

} // namespace labnet

/** @} */
