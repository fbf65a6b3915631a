#ifndef _LABNET_SSH_COMMAND_H_
#define _LABNET_SSH_COMMAND_H_
/**
 * @file ssh_command.hpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Builders for the OpenSSH command lines run by the executor and the control masters.
 * @{
 */
#include "labnet/executor.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace labnet
{

/// Written to stderr by the gateway when the nested hop to the target fails
constexpr auto RELAY_TARGET_FAILED_MARKER { "labnet-relay: target hop failed" };

/// Written to stderr by the remote shell before a marked command runs
constexpr auto REMOTE_STARTED_MARKER { "labnet-remote: command started" };

/// Environment variable carrying the gateway password to the ProxyCommand of a relayed transfer
constexpr auto RELAY_SSHPASS_VARIABLE { "LABNET_RELAY_SSHPASS" };

/// @brief POSIX single quote escaping; the result is one shell word.
std::string shell_quote(const std::string& text);

/// "principal@host", or just host when no principal is set
std::string login_of(const Endpoint& endpoint);

/// Default rendezvous socket of the control master for endpoint
std::string control_path_for(const SshSettings& settings, const Endpoint& endpoint);

/// @brief Prefix command so that the remote shell reports REMOTE_STARTED_MARKER first.
///  Once the marker is seen any exit status belongs to the command, not to ssh or sshpass.
std::string mark_started(const std::string& command);

/// @brief Remove every line containing marker from text.
/// @return true if at least one line was removed
bool strip_marker(std::string& text, const char* marker);

/// @brief Options shared by every ssh, scp and rsync invocation.
std::vector<std::string> common_ssh_options(const SshSettings& settings,
                                            const Endpoint& endpoint,
                                            std::chrono::steady_clock::duration connect_timeout);

/// @brief Full argv of "ssh ... login command".
/// @param control_path Reuse a pooled master when not empty.
std::vector<std::string> ssh_command_argv(const SshSettings& settings,
                                          const Endpoint& target,
                                          const std::string& command,
                                          std::chrono::steady_clock::duration connect_timeout,
                                          const std::string& control_path = {});

/// @brief The two hop encoding: a command for the gateway that runs command on target.
///  The target command is marked with mark_started(). A target password is never part of the
///  command line; the gateway reads it from the first line of its standard input.
struct RelayedCommand
{
    Endpoint gateway;
    Endpoint target;
    std::string command;

    /// Shell text executed on the gateway. Every layer of nesting is quoted with shell_quote.
    std::string gateway_command(const SshSettings& settings,
                                std::chrono::steady_clock::duration connect_timeout) const;

    /// Standard input for the gateway command: the target password line, or empty
    std::string gateway_input() const;
};

/// @brief ProxyCommand reaching relay through "sshpass -e ssh -W", the password taken from
///  RELAY_SSHPASS_VARIABLE.
std::string relay_proxy_command(const SshSettings& settings,
                                const Endpoint& relay,
                                std::chrono::steady_clock::duration connect_timeout);

/// @brief argv of an scp or rsync transfer, optionally jumping through relay.
///  A relay with a password is reached through relay_proxy_command(), otherwise through ProxyJump.
/// @throw std::invalid_argument if the request is malformed
std::vector<std::string> transfer_argv(const SshSettings& settings,
                                       const Endpoint& target,
                                       const TransferRequest& request,
                                       std::chrono::steady_clock::duration connect_timeout,
                                       const std::string& control_path = {},
                                       const std::optional<Endpoint>& relay = std::nullopt);

/// Prefix argv with "sshpass -e" when the endpoint carries a password.
std::vector<std::string> with_password(const SshSettings& settings,
                                       const Endpoint& endpoint,
                                       std::vector<std::string> argv);

/// @brief Map the exit status and diagnostics of ssh to a transport outcome.
///  Only exit status 255 (and sshpass' own failures) denote a transport failure; anything
///  else is the remote command's exit code and yields ExecOutcome::OK.
/// @param via_sshpass The command line was prefixed by with_password() and the command did not
///  report REMOTE_STARTED_MARKER.
ExecOutcome classify_ssh_failure(int exit_code, const std::string& stderr_text, bool via_sshpass = false);

/// @brief Same as classify_ssh_failure for scp and rsync, whose exit codes do not
///  separate transport from file errors. An exit reported by rsync itself ("rsync error:")
///  is never read as an sshpass failure.
ExecOutcome classify_transfer_failure(TransferRequest::Mode mode, int exit_code, const std::string& stderr_text,
                                      bool via_sshpass = false);

} // namespace labnet

#endif // _LABNET_SSH_COMMAND_H_

/** @} */
