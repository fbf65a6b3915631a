/**
 * @file ssh_command.cpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * OpenSSH command line construction and diagnostics
 * @{
 */
#include "ssh_command.hpp"
#include <algorithm>
#include <array>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace labnet
{

using namespace std::chrono;

std::string shell_quote(const std::string& text)
{
    std::string quoted { "'" };
    for (auto c : text)
    {
        if (c == '\'')
        {
            quoted += "'\\''";
        }
        else
        {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

static std::string join_quoted(const std::vector<std::string>& argv)
{
    std::string line;
    for (const auto& arg : argv)
    {
        if (!line.empty())
        {
            line += ' ';
        }
        line += shell_quote(arg);
    }
    return line;
}

std::string mark_started(const std::string& command)
{
    return "echo " + shell_quote(REMOTE_STARTED_MARKER) + " >&2; " + command;
}

bool strip_marker(std::string& text, const char* marker)
{
    bool found { false };
    std::string kept;
    std::size_t begin { 0 };
    while (begin < text.size())
    {
        auto end = text.find('\n', begin);
        end = (end == std::string::npos) ? text.size() : end + 1;
        auto line = text.substr(begin, end - begin);
        if (line.find(marker) != std::string::npos)
        {
            found = true;
        }
        else
        {
            kept += line;
        }
        begin = end;
    }
    text.swap(kept);
    return found;
}

std::string login_of(const Endpoint& endpoint)
{
    if (endpoint.principal.empty())
    {
        return endpoint.host;
    }
    return endpoint.principal + "@" + endpoint.host;
}

std::string control_path_for(const SshSettings& settings, const Endpoint& endpoint)
{
    return settings.control_dir + "/" + login_of(endpoint) + "-" + std::to_string(endpoint.port);
}

std::vector<std::string> common_ssh_options(const SshSettings& settings,
                                            const Endpoint& endpoint,
                                            steady_clock::duration connect_timeout)
{
    const auto connect_secs = std::max<long long>(1, duration_cast<seconds>(connect_timeout).count());
    std::vector<std::string> options;
    if (endpoint.password)
    {
        options.insert(options.end(), { "-o", "NumberOfPasswordPrompts=1" });
    }
    else
    {
        options.insert(options.end(), { "-o", "BatchMode=yes" });
    }
    if (settings.strict_host_key_checking)
    {
        options.insert(options.end(), { "-o", "StrictHostKeyChecking=yes" });
    }
    else
    {
        options.insert(options.end(), { "-o", "StrictHostKeyChecking=no",
                                        "-o", "UserKnownHostsFile=/dev/null" });
    }
    options.insert(options.end(), { "-o", "LogLevel=ERROR",
                                    "-o", "ConnectTimeout=" + std::to_string(connect_secs),
                                    "-o", "ServerAliveInterval=" + std::to_string(settings.server_alive_interval.count()) });
    if (endpoint.identity_file)
    {
        options.insert(options.end(), { "-i", *endpoint.identity_file, "-o", "IdentitiesOnly=yes" });
    }
    return options;
}

static void add_control_path(std::vector<std::string>& argv, const std::string& control_path)
{
    if (!control_path.empty())
    {
        argv.insert(argv.end(), { "-o", "ControlPath=" + control_path, "-o", "ControlMaster=no" });
    }
}

static std::string jump_spec(const Endpoint& relay)
{
    return login_of(relay) + ":" + std::to_string(relay.port);
}

static std::vector<std::string> relay_options(const SshSettings& settings, const Endpoint& relay,
                                              steady_clock::duration connect_timeout)
{
    if (relay.password)
    {
        return { "-o", "ProxyCommand=" + relay_proxy_command(settings, relay, connect_timeout) };
    }
    return { "-J", jump_spec(relay) };
}

std::vector<std::string> ssh_command_argv(const SshSettings& settings,
                                          const Endpoint& target,
                                          const std::string& command,
                                          steady_clock::duration connect_timeout,
                                          const std::string& control_path)
{
    std::vector<std::string> argv { settings.ssh_program };
    auto options = common_ssh_options(settings, target, connect_timeout);
    argv.insert(argv.end(), options.begin(), options.end());
    add_control_path(argv, control_path);
    argv.insert(argv.end(), { "-p", std::to_string(target.port), login_of(target), command });
    return argv;
}

std::string RelayedCommand::gateway_command(const SshSettings& settings, steady_clock::duration connect_timeout) const
{
    auto inner = ssh_command_argv(settings, target, mark_started(command), connect_timeout);
    std::string line;
    if (target.password)
    {
        line = "IFS= read -r SSHPASS; export SSHPASS; " + shell_quote(settings.sshpass_program) + " -e ";
    }
    line += join_quoted(inner);
    // 255 is ssh's own failure, 5 and 6 are sshpass' wrong password and unknown host key
    const char* failed_codes = target.password ? "255|5|6" : "255";
    line += "; rc=$?; case $rc in " + std::string(failed_codes) + ") echo " + shell_quote(RELAY_TARGET_FAILED_MARKER) +
            " >&2;; esac; exit $rc";
    return line;
}

std::string RelayedCommand::gateway_input() const
{
    return target.password ? *target.password + "\n" : std::string{};
}

std::string relay_proxy_command(const SshSettings& settings, const Endpoint& relay,
                                steady_clock::duration connect_timeout)
{
    // Run by ssh through the shell; ProxyCommand values may not carry nested single quotes
    std::string line = std::string("env SSHPASS=\"$") + RELAY_SSHPASS_VARIABLE + "\" " + settings.sshpass_program +
                       " -e " + settings.ssh_program;
    for (const auto& option : common_ssh_options(settings, relay, connect_timeout))
    {
        line += " " + option;
    }
    line += " -W %h:%p -p " + std::to_string(relay.port) + " " + login_of(relay);
    return line;
}

static void validate(const TransferRequest& request)
{
    if (request.local_path.empty())
    {
        throw std::invalid_argument("Transfer requires a local path");
    }
    if (request.remote_path.empty())
    {
        throw std::invalid_argument("Transfer requires a remote path");
    }
    if ((request.mode == TransferRequest::Mode::COPY) &&
        (request.delete_extraneous || !request.excludes.empty()))
    {
        throw std::invalid_argument("delete and exclude options only apply to a directory sync");
    }
}

std::vector<std::string> transfer_argv(const SshSettings& settings,
                                       const Endpoint& target,
                                       const TransferRequest& request,
                                       steady_clock::duration connect_timeout,
                                       const std::string& control_path,
                                       const std::optional<Endpoint>& relay)
{
    validate(request);

    const auto remote = login_of(target) + ":" + request.remote_path;
    const bool push = (request.direction == TransferRequest::Direction::PUSH);
    const auto& source = push ? request.local_path : remote;
    const auto& destination = push ? remote : request.local_path;
    auto options = common_ssh_options(settings, target, connect_timeout);
    add_control_path(options, control_path);

    std::vector<std::string> argv;
    if (request.mode == TransferRequest::Mode::COPY)
    {
        argv.push_back(settings.scp_program);
        argv.push_back("-r");
        if (request.preserve)
        {
            argv.push_back("-p");
        }
        if (request.compress)
        {
            argv.push_back("-C");
        }
        argv.insert(argv.end(), options.begin(), options.end());
        argv.insert(argv.end(), { "-P", std::to_string(target.port) });
        if (relay)
        {
            auto hop = relay_options(settings, *relay, connect_timeout);
            argv.insert(argv.end(), hop.begin(), hop.end());
        }
    }
    else
    {
        argv.push_back(settings.rsync_program);
        argv.push_back(request.preserve ? "-a" : "-r");
        if (request.compress)
        {
            argv.push_back("-z");
        }
        if (request.delete_extraneous)
        {
            argv.push_back("--delete");
        }
        for (const auto& pattern : request.excludes)
        {
            argv.push_back("--exclude=" + pattern);
        }
        std::vector<std::string> rsh { settings.ssh_program };
        rsh.insert(rsh.end(), options.begin(), options.end());
        rsh.insert(rsh.end(), { "-p", std::to_string(target.port) });
        if (relay)
        {
            auto hop = relay_options(settings, *relay, connect_timeout);
            rsh.insert(rsh.end(), hop.begin(), hop.end());
        }
        argv.insert(argv.end(), { "-e", join_quoted(rsh) });
    }
    argv.push_back(source);
    argv.push_back(destination);
    return argv;
}

std::vector<std::string> with_password(const SshSettings& settings, const Endpoint& endpoint, std::vector<std::string> argv)
{
    if (!endpoint.password)
    {
        return argv;
    }
    std::vector<std::string> wrapped { settings.sshpass_program, "-e" };
    wrapped.insert(wrapped.end(), argv.begin(), argv.end());
    return wrapped;
}

static std::optional<ExecOutcome> match_diagnostic(const std::string& stderr_text)
{
    typedef std::pair<const char*, ExecOutcome> pattern_t;
    static const std::array<pattern_t, 17> PATTERNS {{
        { "Permission denied (", ExecOutcome::AUTHENTICATION_FAILED },
        { "Too many authentication failures", ExecOutcome::AUTHENTICATION_FAILED },
        { "Authentication failed", ExecOutcome::AUTHENTICATION_FAILED },
        { "Connection refused", ExecOutcome::REFUSED },
        { "timed out", ExecOutcome::TIMEOUT },
        { "Connection timeout", ExecOutcome::TIMEOUT },
        { "No route to host", ExecOutcome::UNREACHABLE },
        { "Could not resolve hostname", ExecOutcome::UNREACHABLE },
        { "Network is unreachable", ExecOutcome::UNREACHABLE },
        { "Host is down", ExecOutcome::UNREACHABLE },
        { "Name or service not known", ExecOutcome::UNREACHABLE },
        { "Connection closed by", ExecOutcome::TRANSPORT_ERROR },
        { "Connection reset by", ExecOutcome::TRANSPORT_ERROR },
        { "kex_exchange_identification", ExecOutcome::TRANSPORT_ERROR },
        { "lost connection", ExecOutcome::TRANSPORT_ERROR },
        { "Host key verification failed", ExecOutcome::TRANSPORT_ERROR },
        { "stdio forwarding failed", ExecOutcome::TRANSPORT_ERROR },
    }};
    for (const auto& [text, outcome] : PATTERNS)
    {
        if (stderr_text.find(text) != std::string::npos)
        {
            return outcome;
        }
    }
    return std::nullopt;
}

static std::optional<ExecOutcome> sshpass_failure(int exit_code)
{
    switch (exit_code)
    {
    case 5:     // incorrect password
        return ExecOutcome::AUTHENTICATION_FAILED;
    case 2:     // conflicting arguments
    case 3:     // runtime error
    case 6:     // host public key unknown
        return ExecOutcome::TRANSPORT_ERROR;
    default:
        return std::nullopt;
    }
}

ExecOutcome classify_ssh_failure(int exit_code, const std::string& stderr_text, bool via_sshpass)
{
    if (exit_code == 0)
    {
        return ExecOutcome::OK;
    }
    if (via_sshpass)
    {
        if (auto failure = sshpass_failure(exit_code))
        {
            return *failure;
        }
    }
    if (exit_code != 255)
    {
        return ExecOutcome::OK;
    }
    return match_diagnostic(stderr_text).value_or(ExecOutcome::TRANSPORT_ERROR);
}

ExecOutcome classify_transfer_failure(TransferRequest::Mode mode, int exit_code, const std::string& stderr_text,
                                      bool via_sshpass)
{
    if (exit_code == 0)
    {
        return ExecOutcome::OK;
    }
    if (via_sshpass && (stderr_text.find("rsync error:") == std::string::npos))
    {
        if (auto failure = sshpass_failure(exit_code))
        {
            return *failure;
        }
    }
    if (auto diagnostic = match_diagnostic(stderr_text))
    {
        return *diagnostic;
    }
    if (exit_code == 255)
    {
        return ExecOutcome::TRANSPORT_ERROR;
    }
    if (mode == TransferRequest::Mode::SYNC)
    {
        switch (exit_code)
        {
        case 30:    // timeout in data send/receive
        case 35:    // timeout waiting for daemon connection
            return ExecOutcome::TIMEOUT;
        case 10:    // error in socket I/O
        case 12:    // error in rsync protocol data stream
            return ExecOutcome::TRANSPORT_ERROR;
        default:
            break;
        }
    }
    return ExecOutcome::OK;
}

} // namespace labnet

/** @} */
