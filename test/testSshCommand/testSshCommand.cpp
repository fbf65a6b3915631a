/**
 * @file testSshCommand.cpp
 *
 * Copyright 2023 PreAct Technologies
 *
 */
#include "script.hpp"
#include "ssh/ssh_command.hpp"
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <boost/filesystem.hpp>
#include <boost/process.hpp>
#include <algorithm>
#include <fstream>

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Not;

using namespace labnet;
using namespace std::chrono;
namespace bp = boost::process;

namespace {

Endpoint endpoint(const std::string& host, const std::string& principal, uint16_t port = DEFAULT_SSH_PORT)
{
    Endpoint e;
    e.host = host;
    e.principal = principal;
    e.port = port;
    return e;
}

/// Run a command line through /bin/sh and return what it printed
std::string sh_output(const std::string& line)
{
    bp::ipstream out;
    bp::child c(bp::search_path("sh"), "-c", line, bp::std_out > out);
    std::string text;
    std::string part;
    while (std::getline(out, part))
    {
        if (!text.empty())
        {
            text += '\n';
        }
        text += part;
    }
    c.wait();
    return text;
}

/// Same as sh_output, feeding input to the shell's standard input
std::string sh_output(const std::string& line, const std::string& input)
{
    bp::ipstream out;
    bp::opstream in;
    bp::child c(bp::search_path("sh"), "-c", line, bp::std_out > out, bp::std_in < in);
    in << input;
    in.flush();
    in.pipe().close();
    std::string text;
    std::string part;
    while (std::getline(out, part))
    {
        if (!text.empty())
        {
            text += '\n';
        }
        text += part;
    }
    c.wait();
    return text;
}

bool contains_pair(const std::vector<std::string>& argv, const std::string& flag, const std::string& value)
{
    for (std::size_t i = 0; i + 1 < argv.size(); ++i)
    {
        if ((argv[i] == flag) && (argv[i + 1] == value))
        {
            return true;
        }
    }
    return false;
}

} // namespace

TEST(testSshCommand, shellQuoteSurvivesTheShell)
{
    const std::vector<std::string> words {
        "plain",
        "with space",
        "it's quoted",
        "$HOME `id` $(id)",
        "semi; colon && pipe | x",
        "",
    };
    for (const auto& word : words)
    {
        EXPECT_EQ(sh_output("printf '%s' " + shell_quote(word)), word) << word;
    }
}

TEST(testSshCommand, loginOf)
{
    EXPECT_EQ(login_of(endpoint("192.168.2.10", "fio")), "fio@192.168.2.10");
    EXPECT_EQ(login_of(endpoint("192.168.2.10", "")), "192.168.2.10");
}

TEST(testSshCommand, commandArgvUsesBatchModeWithoutPassword)
{
    SshSettings settings;
    auto argv = ssh_command_argv(settings, endpoint("192.168.2.10", "root", 2222), "uname -a", seconds(7));
    ASSERT_GE(argv.size(), 4u);
    EXPECT_EQ(argv.front(), "ssh");
    EXPECT_EQ(argv.back(), "uname -a");
    EXPECT_EQ(argv[argv.size() - 2], "root@192.168.2.10");
    EXPECT_TRUE(contains_pair(argv, "-p", "2222"));
    EXPECT_TRUE(contains_pair(argv, "-o", "BatchMode=yes"));
    EXPECT_TRUE(contains_pair(argv, "-o", "ConnectTimeout=7"));
    EXPECT_THAT(argv, Not(Contains(HasSubstr("ControlPath"))));
}

TEST(testSshCommand, commandArgvReusesControlPath)
{
    SshSettings settings;
    auto argv = ssh_command_argv(settings, endpoint("192.168.2.10", "root"), "true", seconds(5), "/tmp/labnet-ssh/x");
    EXPECT_TRUE(contains_pair(argv, "-o", "ControlPath=/tmp/labnet-ssh/x"));
    EXPECT_TRUE(contains_pair(argv, "-o", "ControlMaster=no"));
}

TEST(testSshCommand, passwordSwitchesToSshpass)
{
    SshSettings settings;
    auto target = endpoint("192.168.2.10", "root");
    target.password = "secret";
    auto argv = with_password(settings, target, ssh_command_argv(settings, target, "true", seconds(5)));
    ASSERT_GE(argv.size(), 3u);
    EXPECT_EQ(argv[0], "sshpass");
    EXPECT_EQ(argv[1], "-e");
    EXPECT_EQ(argv[2], "ssh");
    EXPECT_THAT(argv, Not(Contains("secret")));
    EXPECT_TRUE(contains_pair(argv, "-o", "NumberOfPasswordPrompts=1"));

    auto keyed = endpoint("192.168.2.10", "root");
    auto plain = with_password(settings, keyed, { "ssh", "x" });
    EXPECT_THAT(plain, ElementsAre("ssh", "x"));
}

TEST(testSshCommand, controlPathIsPerEndpoint)
{
    SshSettings settings;
    EXPECT_NE(control_path_for(settings, endpoint("192.168.2.10", "root")),
              control_path_for(settings, endpoint("192.168.2.10", "fio")));
    EXPECT_NE(control_path_for(settings, endpoint("192.168.2.10", "root", 22)),
              control_path_for(settings, endpoint("192.168.2.10", "root", 2222)));
    EXPECT_EQ(control_path_for(settings, endpoint("192.168.2.10", "root")).rfind(settings.control_dir, 0), 0u);
}

TEST(testSshCommand, relayedCommandQuotesEveryLayer)
{
    SshSettings settings;
    settings.ssh_program = "echo";
    RelayedCommand relayed { endpoint("10.0.0.1", "gw", 5025), endpoint("192.168.2.10", "root"),
                             "echo 'hello world' | wc -c" };
    const auto line = relayed.gateway_command(settings, seconds(5));

    // With ssh replaced by echo the gateway line prints the argv of the nested hop
    const auto printed = sh_output(line);
    EXPECT_THAT(printed, HasSubstr(std::string("root@192.168.2.10 echo '") + REMOTE_STARTED_MARKER +
                                   "' >&2; echo 'hello world' | wc -c"));
    EXPECT_THAT(line, HasSubstr(RELAY_TARGET_FAILED_MARKER));
}

TEST(testSshCommand, relayedCommandMarksTargetHopFailure)
{
    SshSettings settings;
    settings.ssh_program = "false";
    RelayedCommand relayed { endpoint("10.0.0.1", "gw"), endpoint("192.168.2.10", "root"), "true" };
    auto line = relayed.gateway_command(settings, seconds(5));

    // false exits 1, which is a remote exit status and not a hop failure
    EXPECT_THAT(sh_output("(" + line + ") 2>&1"), Not(HasSubstr(RELAY_TARGET_FAILED_MARKER)));

    // A stand in ssh that fails the way ssh does when it can not reach the target
    Script fake_ssh("exit 255");
    settings.ssh_program = fake_ssh.path();
    line = relayed.gateway_command(settings, seconds(5));
    EXPECT_THAT(sh_output("(" + line + ") 2>&1"), HasSubstr(RELAY_TARGET_FAILED_MARKER));
}

TEST(testSshCommand, relayedCommandReadsTargetPasswordFromInput)
{
    // The stand in sshpass drops "-e" and runs the rest, the stand in ssh prints what it was given
    Script fake_sshpass("shift\nexec \"$@\"");
    Script fake_ssh("printf 'password=%s\\n' \"$SSHPASS\"");
    SshSettings settings;
    settings.ssh_program = fake_ssh.path();
    settings.sshpass_program = fake_sshpass.path();
    auto target = endpoint("192.168.2.10", "root");
    target.password = "it's secret";
    RelayedCommand relayed { endpoint("10.0.0.1", "gw"), target, "true" };

    const auto line = relayed.gateway_command(settings, seconds(5));
    EXPECT_THAT(line, Not(HasSubstr("secret")));
    EXPECT_THAT(line, HasSubstr(shell_quote(fake_sshpass.path()) + " -e "));
    EXPECT_EQ(relayed.gateway_input(), "it's secret\n");
    EXPECT_EQ(sh_output(line, relayed.gateway_input()), "password=it's secret");

    RelayedCommand keyed { endpoint("10.0.0.1", "gw"), endpoint("192.168.2.10", "root"), "true" };
    EXPECT_TRUE(keyed.gateway_input().empty());
    EXPECT_THAT(keyed.gateway_command(settings, seconds(5)), Not(HasSubstr("read -r SSHPASS")));
}

TEST(testSshCommand, startedMarkerPrecedesTheCommand)
{
    const auto printed = sh_output("(" + mark_started("echo done; exit 5") + ") 2>&1; echo rc=$?");
    EXPECT_EQ(printed, std::string(REMOTE_STARTED_MARKER) + "\ndone\nrc=5");

    std::string text = std::string("warning: x\n") + REMOTE_STARTED_MARKER + "\nreal error\n";
    EXPECT_TRUE(strip_marker(text, REMOTE_STARTED_MARKER));
    EXPECT_EQ(text, "warning: x\nreal error\n");
    EXPECT_FALSE(strip_marker(text, REMOTE_STARTED_MARKER));
    EXPECT_EQ(text, "warning: x\nreal error\n");
}

TEST(testSshCommand, copyPushUsesScp)
{
    SshSettings settings;
    TransferRequest request;
    request.direction = TransferRequest::Direction::PUSH;
    request.local_path = "/tmp/build.tar";
    request.remote_path = "/opt/build.tar";
    auto argv = transfer_argv(settings, endpoint("192.168.2.10", "root"), request, seconds(5));
    ASSERT_GE(argv.size(), 3u);
    EXPECT_EQ(argv.front(), "scp");
    EXPECT_THAT(argv, Contains("-r"));
    EXPECT_THAT(argv, Contains("-p"));
    EXPECT_THAT(argv, Contains("-C"));
    EXPECT_TRUE(contains_pair(argv, "-P", "22"));
    EXPECT_EQ(argv[argv.size() - 2], "/tmp/build.tar");
    EXPECT_EQ(argv.back(), "root@192.168.2.10:/opt/build.tar");
}

TEST(testSshCommand, copyPullReversesEnds)
{
    SshSettings settings;
    TransferRequest request;
    request.direction = TransferRequest::Direction::PULL;
    request.local_path = "./logs";
    request.remote_path = "/var/log/app";
    request.preserve = false;
    request.compress = false;
    auto argv = transfer_argv(settings, endpoint("192.168.2.10", "fio"), request, seconds(5));
    EXPECT_EQ(argv[argv.size() - 2], "fio@192.168.2.10:/var/log/app");
    EXPECT_EQ(argv.back(), "./logs");
    EXPECT_THAT(argv, Not(Contains("-C")));
}

TEST(testSshCommand, relayedCopyJumpsThroughGateway)
{
    SshSettings settings;
    TransferRequest request;
    request.local_path = "a";
    request.remote_path = "b";
    auto argv = transfer_argv(settings, endpoint("192.168.2.10", "root"), request, seconds(5), {},
                              endpoint("10.0.0.1", "gw", 5025));
    EXPECT_TRUE(contains_pair(argv, "-J", "gw@10.0.0.1:5025"));
}

TEST(testSshCommand, relayedCopyWithGatewayPasswordUsesProxyCommand)
{
    SshSettings settings;
    TransferRequest request;
    request.local_path = "a";
    request.remote_path = "b";
    auto gateway = endpoint("10.0.0.1", "gw", 5025);
    gateway.password = "gwsecret";
    auto argv = transfer_argv(settings, endpoint("192.168.2.10", "root"), request, seconds(5), {}, gateway);

    EXPECT_THAT(argv, Not(Contains("-J")));
    EXPECT_THAT(argv, Not(Contains(HasSubstr("gwsecret"))));
    auto proxy = std::find_if(argv.begin(), argv.end(), [](const std::string& a) { return a.rfind("ProxyCommand=", 0) == 0; });
    ASSERT_NE(proxy, argv.end());
    EXPECT_EQ(*proxy, relay_proxy_command(settings, gateway, seconds(5)).insert(0, "ProxyCommand="));
    EXPECT_EQ(proxy->rfind(std::string("ProxyCommand=env SSHPASS=\"$") + RELAY_SSHPASS_VARIABLE + "\" sshpass -e ssh ", 0), 0u);
    EXPECT_THAT(*proxy, HasSubstr(" -W %h:%p -p 5025 gw@10.0.0.1"));
    EXPECT_THAT(*proxy, HasSubstr("NumberOfPasswordPrompts=1"));
    EXPECT_THAT(*proxy, Not(HasSubstr("'")));
}

TEST(testSshCommand, syncUsesRsyncWithRemoteShell)
{
    SshSettings settings;
    TransferRequest request;
    request.mode = TransferRequest::Mode::SYNC;
    request.local_path = "src/";
    request.remote_path = "/opt/src";
    request.delete_extraneous = true;
    request.excludes = { ".git", "*.o" };
    auto argv = transfer_argv(settings, endpoint("192.168.2.10", "root", 2222), request, seconds(5), {},
                              endpoint("10.0.0.1", "gw"));
    EXPECT_EQ(argv.front(), "rsync");
    EXPECT_THAT(argv, Contains("-a"));
    EXPECT_THAT(argv, Contains("-z"));
    EXPECT_THAT(argv, Contains("--delete"));
    EXPECT_THAT(argv, Contains("--exclude=.git"));
    EXPECT_THAT(argv, Contains("--exclude=*.o"));

    auto e = std::find(argv.begin(), argv.end(), "-e");
    ASSERT_NE(e, argv.end());
    ASSERT_NE(e + 1, argv.end());
    EXPECT_EQ((e + 1)->rfind("'ssh'", 0), 0u);
    EXPECT_THAT(*(e + 1), HasSubstr("'-p' '2222'"));
    EXPECT_THAT(*(e + 1), HasSubstr("'-J' 'gw@10.0.0.1:22'"));
}

TEST(testSshCommand, malformedTransferThrows)
{
    SshSettings settings;
    auto target = endpoint("192.168.2.10", "root");

    TransferRequest no_local;
    no_local.remote_path = "/opt";
    EXPECT_THROW(transfer_argv(settings, target, no_local, seconds(5)), std::invalid_argument);

    TransferRequest no_remote;
    no_remote.local_path = "a";
    EXPECT_THROW(transfer_argv(settings, target, no_remote, seconds(5)), std::invalid_argument);

    TransferRequest copy_with_delete;
    copy_with_delete.local_path = "a";
    copy_with_delete.remote_path = "b";
    copy_with_delete.delete_extraneous = true;
    EXPECT_THROW(transfer_argv(settings, target, copy_with_delete, seconds(5)), std::invalid_argument);

    TransferRequest copy_with_exclude;
    copy_with_exclude.local_path = "a";
    copy_with_exclude.remote_path = "b";
    copy_with_exclude.excludes = { "x" };
    EXPECT_THROW(transfer_argv(settings, target, copy_with_exclude, seconds(5)), std::invalid_argument);
}

TEST(testSshCommand, classifySshFailure)
{
    EXPECT_EQ(classify_ssh_failure(0, ""), ExecOutcome::OK);
    EXPECT_EQ(classify_ssh_failure(1, "grep: no match"), ExecOutcome::OK);
    EXPECT_EQ(classify_ssh_failure(255, "root@192.168.2.10: Permission denied (publickey,password)."),
              ExecOutcome::AUTHENTICATION_FAILED);
    EXPECT_EQ(classify_ssh_failure(255, "ssh: connect to host 192.168.2.10 port 22: Connection refused"),
              ExecOutcome::REFUSED);
    EXPECT_EQ(classify_ssh_failure(255, "ssh: connect to host 192.168.2.10 port 22: Connection timed out"),
              ExecOutcome::TIMEOUT);
    EXPECT_EQ(classify_ssh_failure(255, "ssh: connect to host 192.168.2.10 port 22: No route to host"),
              ExecOutcome::UNREACHABLE);
    EXPECT_EQ(classify_ssh_failure(255, ""), ExecOutcome::TRANSPORT_ERROR);
}

TEST(testSshCommand, classifySshpassFailure)
{
    EXPECT_EQ(classify_ssh_failure(5, "", true), ExecOutcome::AUTHENTICATION_FAILED);
    EXPECT_EQ(classify_ssh_failure(6, "", true), ExecOutcome::TRANSPORT_ERROR);
    // Without sshpass the same codes are remote exit statuses
    EXPECT_EQ(classify_ssh_failure(5, "", false), ExecOutcome::OK);
}

TEST(testSshCommand, rsyncOwnExitIsNotReadAsSshpassFailure)
{
    using Mode = TransferRequest::Mode;
    EXPECT_EQ(classify_transfer_failure(Mode::SYNC, 5, "", true), ExecOutcome::AUTHENTICATION_FAILED);
    EXPECT_EQ(classify_transfer_failure(Mode::SYNC, 3, "rsync error: errors selecting input/output files, dirs (code 3)", true),
              ExecOutcome::OK);
}

TEST(testSshCommand, classifyTransferFailure)
{
    using Mode = TransferRequest::Mode;
    EXPECT_EQ(classify_transfer_failure(Mode::COPY, 0, ""), ExecOutcome::OK);
    EXPECT_EQ(classify_transfer_failure(Mode::COPY, 1, "scp: /opt/x: No such file or directory"), ExecOutcome::OK);
    EXPECT_EQ(classify_transfer_failure(Mode::COPY, 1, "ssh: connect to host 192.168.2.10 port 22: Connection refused"),
              ExecOutcome::REFUSED);
    EXPECT_EQ(classify_transfer_failure(Mode::SYNC, 30, ""), ExecOutcome::TIMEOUT);
    EXPECT_EQ(classify_transfer_failure(Mode::SYNC, 12, ""), ExecOutcome::TRANSPORT_ERROR);
    EXPECT_EQ(classify_transfer_failure(Mode::SYNC, 23, "some files vanished"), ExecOutcome::OK);
    EXPECT_EQ(classify_transfer_failure(Mode::COPY, 255, ""), ExecOutcome::TRANSPORT_ERROR);
}
