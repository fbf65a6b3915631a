/**
 * @file process_runner.cpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Child process execution on top of Boost.Process
 */
#include "process_runner.hpp"
#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>
#include <future>
#include <system_error>

namespace labnet
{

namespace bp = boost::process;
using namespace std::chrono;

constexpr auto POLL_INTERVAL { milliseconds(20) };

ProcessOutput run_process(const std::vector<std::string>& argv,
                          const std::map<std::string, std::string>& extra_env,
                          steady_clock::duration timeout,
                          const CancellationToken* cancel,
                          const std::string& input)
{
    ProcessOutput output;
    if (argv.empty())
    {
        output.launch_error = "empty command line";
        return output;
    }
    if (cancel && cancel->is_cancelled())
    {
        output.cancelled = true;
        return output;
    }

    boost::filesystem::path program { argv.front() };
    if (program.filename() == program)
    {
        program = bp::search_path(argv.front());
        if (program.empty())
        {
            output.launch_error = argv.front() + " not found on PATH";
            return output;
        }
    }
    const std::vector<std::string> args(argv.begin() + 1, argv.end());

    bp::environment env = boost::this_process::environment();
    for (const auto& [name, value] : extra_env)
    {
        env[name] = value;
    }

    boost::asio::io_context io;
    std::future<std::string> out;
    std::future<std::string> err;
    bp::child child;
    try
    {
        if (input.empty())
        {
            child = bp::child(program, bp::args(args), env,
                              bp::std_in.close(), bp::std_out > out, bp::std_err > err, io);
        }
        else
        {
            child = bp::child(program, bp::args(args), env,
                              bp::std_in < boost::asio::buffer(input), bp::std_out > out, bp::std_err > err, io);
        }
    }
    catch (const bp::process_error& e)
    {
        output.launch_error = e.what();
        return output;
    }
    output.started = true;

    const auto deadline = steady_clock::now() + timeout;
    while (true)
    {
        io.run_for(POLL_INTERVAL);
        if (io.stopped())
        {
            break;
        }
        if (cancel && cancel->is_cancelled())
        {
            output.cancelled = true;
            break;
        }
        if (steady_clock::now() >= deadline)
        {
            output.timed_out = true;
            break;
        }
    }

    std::error_code ec;
    if (output.cancelled || output.timed_out)
    {
        child.terminate(ec);
        child.wait(ec);
        return output;
    }

    child.wait(ec);
    output.exit_code = child.exit_code();
    output.stdout_text = out.get();
    output.stderr_text = err.get();
    return output;
}

} // namespace labnet
