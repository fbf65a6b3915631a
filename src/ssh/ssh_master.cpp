/**
 * @file ssh_master.cpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Pooled transports backed by OpenSSH control masters (ssh -M)
 * @{
 */
#include "labnet/executor.hpp"
#include "logging.hpp"
#include "process_runner.hpp"
#include "ssh_command.hpp"
#include <boost/process.hpp>
#include <filesystem>
#include <mutex>
#include <thread>

namespace labnet
{

namespace bp = boost::process;
using namespace std::chrono;

constexpr auto CHECK_TIMEOUT { seconds(3) };
constexpr auto ESTABLISH_POLL { milliseconds(100) };

class SshMasterTransport : public Transport_T
{
public:
    SshMasterTransport(const SshSettings& settings, const Endpoint& endpoint, std::string control_path,
                       bp::child master, log_callback_t log_callback) :
        m_settings(settings),
        m_endpoint(endpoint),
        m_control_path(std::move(control_path)),
        m_master(std::move(master)),
        m_log_callback(std::move(log_callback))
    {
    }

    ~SshMasterTransport() override
    {
        close();
    }

    bool is_alive() override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return check_locked();
    }

    void close() override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed)
        {
            return;
        }
        m_closed = true;
        std::error_code ec;
        if (m_master.running(ec))
        {
            auto output = run_process(control_argv("exit"), {}, CHECK_TIMEOUT);
            if (output.exit_code != 0)
            {
                DBG("ssh -O exit on " << m_control_path << " failed: " << output.stderr_text, LOG_LVL_DBG_MID);
            }
            if (m_master.running(ec))
            {
                m_master.terminate(ec);
            }
        }
        m_master.wait(ec);
        DBG("Closed control master " << m_control_path, LOG_LVL_DBG_MID);
    }

    std::string control_path() const override
    {
        return m_control_path;
    }

    bool master_running()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::error_code ec;
        return !m_closed && m_master.running(ec);
    }

    /// Control socket answers; the master process has to be running
    bool check_locked()
    {
        std::error_code ec;
        if (m_closed || !m_master.running(ec))
        {
            return false;
        }
        auto output = run_process(control_argv("check"), {}, CHECK_TIMEOUT);
        return output.started && !output.timed_out && (output.exit_code == 0);
    }

private:
    std::vector<std::string> control_argv(const std::string& operation) const
    {
        return { m_settings.ssh_program, "-o", "ControlPath=" + m_control_path, "-O", operation,
                 "-p", std::to_string(m_endpoint.port), login_of(m_endpoint) };
    }

    const SshSettings m_settings;
    const Endpoint m_endpoint;
    const std::string m_control_path;
    bp::child m_master;
    log_callback_t m_log_callback;
    std::mutex m_mutex;
    bool m_closed { false };
};

class SshMasterFactory : public TransportFactory_T
{
public:
    SshMasterFactory(const SshSettings& settings, log_callback_t log_callback) :
        m_settings(settings),
        m_log_callback(std::move(log_callback))
    {
    }

    std::shared_ptr<Transport_T> establish(const Endpoint& endpoint, steady_clock::duration timeout) override;

private:
    const SshSettings m_settings;
    log_callback_t m_log_callback;
};

std::shared_ptr<Transport_T> SshMasterFactory::establish(const Endpoint& endpoint, steady_clock::duration timeout)
{
    std::error_code ec;
    std::filesystem::create_directories(m_settings.control_dir, ec);
    if (ec)
    {
        ERR("Unable to create control directory " << m_settings.control_dir << ": " << ec.message());
        return nullptr;
    }

    const auto control_path = control_path_for(m_settings, endpoint);
    std::filesystem::remove(control_path, ec);

    std::vector<std::string> argv { m_settings.ssh_program, "-M", "-N" };
    auto options = common_ssh_options(m_settings, endpoint, timeout);
    argv.insert(argv.end(), options.begin(), options.end());
    argv.insert(argv.end(), { "-o", "ControlPath=" + control_path, "-o", "ControlPersist=no",
                              "-p", std::to_string(endpoint.port), login_of(endpoint) });
    argv = with_password(m_settings, endpoint, argv);

    boost::filesystem::path program { argv.front() };
    if (program.filename() == program)
    {
        program = bp::search_path(argv.front());
    }
    if (program.empty())
    {
        ERR(argv.front() << " not found on PATH");
        return nullptr;
    }
    bp::environment env = boost::this_process::environment();
    if (endpoint.password)
    {
        env["SSHPASS"] = *endpoint.password;
    }

    std::shared_ptr<SshMasterTransport> transport;
    try
    {
        bp::child master(program, bp::args(std::vector<std::string>(argv.begin() + 1, argv.end())), env,
                         bp::std_in.close(), bp::std_out > bp::null, bp::std_err > bp::null);
        transport = std::make_shared<SshMasterTransport>(m_settings, endpoint, control_path, std::move(master),
                                                         m_log_callback);
    }
    catch (const bp::process_error& e)
    {
        ERR("Unable to start control master for " << endpoint.host << ": " << e.what());
        return nullptr;
    }

    const auto deadline = steady_clock::now() + timeout;
    while (steady_clock::now() < deadline)
    {
        if (!transport->master_running())
        {
            break;
        }
        if (std::filesystem::exists(control_path, ec) && transport->is_alive())
        {
            DBG("Control master up for " << login_of(endpoint) << " at " << control_path, LOG_LVL_DBG_MID);
            return transport;
        }
        std::this_thread::sleep_for(ESTABLISH_POLL);
    }
    DBG("Control master for " << login_of(endpoint) << " did not come up", LOG_LVL_DBG_HI);
    transport->close();
    return nullptr;
}

std::shared_ptr<TransportFactory_T> TransportFactory_T::create_ssh_master(const SshSettings& settings,
                                                                          log_callback_t log_callback)
{
    return std::make_shared<SshMasterFactory>(settings, std::move(log_callback));
}

} // namespace labnet

/** @} */
