#ifndef _LABNET_PROCESS_RUNNER_H_
#define _LABNET_PROCESS_RUNNER_H_
/**
 * @file process_runner.hpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Runs a child process with captured output, a hard deadline and cooperative cancellation.
 */
#include "labnet/cancellation.hpp"
#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace labnet
{

struct ProcessOutput
{
    bool started { false };     ///< false if the program could not be launched
    bool timed_out { false };
    bool cancelled { false };
    int exit_code { -1 };
    std::string stdout_text;
    std::string stderr_text;
    std::string launch_error;
};

/// @param argv Program followed by its arguments; the program is looked up on PATH.
/// @param extra_env Variables added to the inherited environment.
/// @param input Written to the child's standard input, which is then closed.
ProcessOutput run_process(const std::vector<std::string>& argv,
                          const std::map<std::string, std::string>& extra_env,
                          std::chrono::steady_clock::duration timeout,
                          const CancellationToken* cancel = nullptr,
                          const std::string& input = {});

} // namespace labnet

#endif // _LABNET_PROCESS_RUNNER_H_
