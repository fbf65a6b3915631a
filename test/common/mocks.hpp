#ifndef __LABNET_TEST_MOCKS_H_
#define __LABNET_TEST_MOCKS_H_
/**
 * @file mocks.hpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Mocks of the network collaborators for unit testing.
 */
#include <gmock/gmock.h>
#include "labnet/executor.hpp"
#include "labnet/identity_prober.hpp"
#include "labnet/scanner.hpp"

namespace labnet {

class MockExecutor : public CommandExecutor_T
{
public:
    MOCK_METHOD(ExecResult, run, (const Endpoint& target, const std::string& command, const ExecOptions& options), (override));
    MOCK_METHOD(ExecResult, transfer, (const Endpoint& target, const TransferRequest& request, const ExecOptions& options), (override));
};

class MockTransport : public Transport_T
{
public:
    MOCK_METHOD(bool, is_alive, (), (override));
    MOCK_METHOD(void, close, (), (override));
    MOCK_METHOD(std::string, control_path, (), (const, override));
};

class MockTransportFactory : public TransportFactory_T
{
public:
    MOCK_METHOD(std::shared_ptr<Transport_T>, establish, (const Endpoint& endpoint,
        std::chrono::steady_clock::duration timeout), (override));
};

class MockLivenessProbe : public LivenessProbe_T
{
public:
    MOCK_METHOD(HostRecord, probe, (const std::string& address, std::chrono::steady_clock::duration timeout), (override));
};

class MockClassificationProbe : public ClassificationProbe_T
{
public:
    const char* name() const override { return "mock"; }
    MOCK_METHOD(ClassificationOutcome, probe, (const std::string& address,
        std::chrono::steady_clock::duration timeout), (override));
};

inline ExecResult exec_ok(const std::string& out, int exit_code = 0)
{
    ExecResult result;
    result.outcome = ExecOutcome::OK;
    result.exit_code = exit_code;
    result.stdout_text = out;
    return result;
}

inline ExecResult exec_failed(ExecOutcome outcome, const std::string& err = {})
{
    ExecResult result;
    result.outcome = outcome;
    result.exit_code = 255;
    result.stderr_text = err;
    return result;
}

/// Wall clock that tests move by hand
class ManualClock
{
public:
    explicit ManualClock(std::chrono::system_clock::time_point start = std::chrono::system_clock::time_point(std::chrono::hours(24 * 365 * 50))) :
        m_now(std::make_shared<std::chrono::system_clock::time_point>(start))
    {
    }

    wall_clock_t function() const
    {
        auto now = m_now;
        return [now]() { return *now; };
    }

    void advance(std::chrono::system_clock::duration d) { *m_now += d; }
    std::chrono::system_clock::time_point now() const { return *m_now; }

private:
    std::shared_ptr<std::chrono::system_clock::time_point> m_now;
};

} // end namespace labnet
#endif // __LABNET_TEST_MOCKS_H_
