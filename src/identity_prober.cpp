/**
 * @file identity_prober.cpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Classification probes and credential racing for live hosts
 * @{
 */
#include "labnet/identity_prober.hpp"
#include "logging.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <algorithm>
#include <array>
#include <future>
#include <initializer_list>
#include <mutex>
#include <sstream>

namespace labnet
{

using namespace boost::asio;
using namespace std::chrono;

const char* const IdentityProber::HANDSHAKE_COMMAND {
    "hostname; "
    "cat /etc/machine-id 2>/dev/null || echo; "
    "(. /etc/os-release 2>/dev/null; echo \"${VERSION_ID:-}\")"
};

namespace
{

/// Shared state of the credential race for one address
struct RaceState
{
    explicit RaceState(const std::string& address_, const std::vector<std::string>& principals) :
        address(address_),
        cancel(std::make_shared<CancellationToken>())
    {
        for (const auto& principal : principals)
        {
            attempts.push_back(CredentialAttempt{ address_, principal, AttemptOutcome::ERROR, {} });
        }
    }

    const std::string address;
    std::shared_ptr<CancellationToken> cancel;
    std::mutex mutex;
    std::vector<CredentialAttempt> attempts;
    std::optional<std::pair<std::string, LoginIdentity>> winner;
};

AttemptOutcome attempt_outcome_of(ExecOutcome outcome)
{
    switch (outcome)
    {
    case ExecOutcome::OK:                       return AttemptOutcome::SUCCESS;
    case ExecOutcome::AUTHENTICATION_FAILED:    return AttemptOutcome::AUTHENTICATION_FAILED;
    case ExecOutcome::TIMEOUT:                  return AttemptOutcome::TIMEOUT;
    case ExecOutcome::REFUSED:                  return AttemptOutcome::REFUSED;
    case ExecOutcome::UNREACHABLE:              return AttemptOutcome::UNREACHABLE;
    case ExecOutcome::CANCELLED:                return AttemptOutcome::CANCELLED;
    case ExecOutcome::TRANSPORT_ERROR:          return AttemptOutcome::ERROR;
    }
    return AttemptOutcome::ERROR;
}

bool contains_any(const std::string& text, std::initializer_list<const char*> needles)
{
    return std::any_of(needles.begin(), needles.end(),
                       [&text](const char* needle) { return text.find(needle) != std::string::npos; });
}

} // namespace

struct IdentityProber::Impl
{
    Impl(DeviceCache_T& cache, CommandExecutor_T& executor,
         std::vector<std::shared_ptr<ClassificationProbe_T>> probes,
         ProberConfig config, log_callback_t log_callback) :
        m_cache(cache),
        m_executor(executor),
        m_probes(std::move(probes)),
        m_config(std::move(config)),
        m_log_callback(std::move(log_callback))
    {
    }

    /// One login attempt of a race; safe to call from any pool thread
    void attempt(RaceState& race, std::size_t index);

    void post_race(thread_pool& pool, RaceState& race)
    {
        for (std::size_t i = 0; i < race.attempts.size(); ++i)
        {
            post(pool, [this, &race, i]() { this->attempt(race, i); });
        }
    }

    ClassificationOutcome classify(const std::string& address);

    /// Fold fresh facts into the cached identity
    std::optional<DeviceIdentity> merge(const std::string& address,
                                        const std::optional<DeviceIdentity>& existing,
                                        const std::optional<std::pair<std::string, LoginIdentity>>& login,
                                        const ClassificationOutcome& classification) const;

    bool is_fresh(const std::optional<DeviceIdentity>& entry) const
    {
        return entry && (entry->is_identified() || entry->is_classified());
    }

    bool is_relay_address(const std::string& address) const
    {
        return std::find(m_config.relay_addresses.begin(), m_config.relay_addresses.end(), address)
               != m_config.relay_addresses.end();
    }

    DeviceCache_T& m_cache;
    CommandExecutor_T& m_executor;
    std::vector<std::shared_ptr<ClassificationProbe_T>> m_probes;
    const ProberConfig m_config;
    log_callback_t m_log_callback;
};

void IdentityProber::Impl::attempt(RaceState& race, std::size_t index)
{
    std::string principal;
    {
        std::lock_guard<std::mutex> lock(race.mutex);
        principal = race.attempts[index].principal;
    }
    if (race.cancel->is_cancelled())
    {
        std::lock_guard<std::mutex> lock(race.mutex);
        race.attempts[index].outcome = AttemptOutcome::CANCELLED;
        race.attempts[index].detail = "another login already succeeded";
        return;
    }

    Endpoint endpoint;
    endpoint.host = race.address;
    endpoint.port = m_config.ssh_port;
    endpoint.principal = principal;
    endpoint.identity_file = m_config.identity_file;

    ExecOptions options;
    options.timeout = m_config.attempt_timeout;
    options.cancel = race.cancel;

    AttemptOutcome outcome { AttemptOutcome::ERROR };
    std::string detail;
    std::optional<LoginIdentity> identity;
    try
    {
        auto result = m_executor.run(endpoint, HANDSHAKE_COMMAND, options);
        outcome = attempt_outcome_of(result.outcome);
        detail = boost::algorithm::trim_copy(result.stderr_text);
        if (outcome == AttemptOutcome::SUCCESS)
        {
            if (result.exit_code == 0)
            {
                identity = IdentityProber::parse_handshake(result.stdout_text);
            }
            if (!identity)
            {
                outcome = AttemptOutcome::ERROR;
                detail = "unexpected handshake reply (exit code " + std::to_string(result.exit_code) + ")";
            }
        }
    }
    catch (const std::exception& e)
    {
        outcome = AttemptOutcome::ERROR;
        detail = e.what();
        ERR("Login attempt " << principal << "@" << race.address << " failed: " << e.what());
    }

    std::lock_guard<std::mutex> lock(race.mutex);
    auto& record = race.attempts[index];
    if ((outcome == AttemptOutcome::SUCCESS) && race.winner)
    {
        // Late success, the race is already decided
        record.outcome = AttemptOutcome::CANCELLED;
        record.detail = "superseded by " + race.winner->first;
        return;
    }
    record.outcome = outcome;
    record.detail = detail;
    if (outcome == AttemptOutcome::SUCCESS)
    {
        race.winner = std::make_pair(principal, *identity);
        race.cancel->cancel();
        DBG("Identified " << race.address << " as " << identity->hostname << " (" << principal << ")",
            LOG_LVL_DBG_HI);
    }
}

ClassificationOutcome IdentityProber::Impl::classify(const std::string& address)
{
    // Every probe runs at once, the first match in probe order wins
    std::vector<std::future<ClassificationOutcome>> answers;
    for (const auto& probe : m_probes)
    {
        answers.push_back(std::async(std::launch::async, [this, probe, &address]()
            {
                return probe->probe(address, m_config.classification_timeout);
            }));
    }

    std::optional<ClassificationOutcome> matched;
    for (std::size_t i = 0; i < answers.size(); ++i)
    {
        try
        {
            auto outcome = answers[i].get();
            if (!matched && !std::holds_alternative<UnknownOutcome>(outcome))
            {
                DBG(address << " answered the " << m_probes[i]->name() << " probe", LOG_LVL_DBG_HI);
                matched = std::move(outcome);
            }
        }
        catch (const std::exception& e)
        {
            ERR(m_probes[i]->name() << " probe of " << address << " failed: " << e.what());
        }
    }
    return matched.value_or(ClassificationOutcome{ UnknownOutcome{} });
}

std::optional<DeviceIdentity> IdentityProber::Impl::merge(
    const std::string& address,
    const std::optional<DeviceIdentity>& existing,
    const std::optional<std::pair<std::string, LoginIdentity>>& login,
    const ClassificationOutcome& classification) const
{
    const bool classified = !std::holds_alternative<UnknownOutcome>(classification);
    if (!login && !classified)
    {
        return std::nullopt;
    }

    DeviceIdentity identity = existing.value_or(DeviceIdentity{});
    identity.address = address;
    identity.source = DataSource::DISCOVERED;
    identity.last_contact = system_clock::now();
    identity.relay_eligible = identity.relay_eligible || is_relay_address(address);

    if (login)
    {
        const auto& [principal, reply] = *login;
        identity.hostname = reply.hostname;
        identity.unique_id = reply.unique_id.empty() ? reply.hostname : reply.unique_id;
        identity.principal = principal;
        identity.firmware_version = reply.firmware_version;
        auto hint = IdentityProber::type_hint_from_hostname(reply.hostname);
        if (!hint.empty())
        {
            identity.type_hint = hint;
        }
    }

    if (auto power = std::get_if<PowerSwitchOutcome>(&classification))
    {
        identity.classification = Classification::POWER_SWITCH;
        identity.classification_confident = true;
        identity.power_switch = power->attributes;
        identity.instrument.reset();
        auto controls = m_config.controls.find(address);
        identity.controls = (controls != m_config.controls.end()) ? controls->second : std::vector<std::string>{};
    }
    else if (auto instrument = std::get_if<InstrumentOutcome>(&classification))
    {
        identity.classification = Classification::INSTRUMENT;
        identity.classification_confident = true;
        identity.instrument = instrument->attributes;
        identity.power_switch.reset();
        identity.controls.clear();
    }
    else if (!identity.is_classified() || !identity.classification_confident)
    {
        identity.classification = Classification::GENERIC;
        identity.classification_confident = true;
    }
    return identity;
}

IdentityProber::IdentityProber(DeviceCache_T& cache,
                               CommandExecutor_T& executor,
                               std::vector<std::shared_ptr<ClassificationProbe_T>> probes,
                               ProberConfig config,
                               log_callback_t log_callback) :
    pimpl(std::make_unique<Impl>(cache, executor, std::move(probes), std::move(config), std::move(log_callback)))
{
    if (pimpl->m_config.principals.empty())
    {
        throw std::invalid_argument("IdentityProber requires at least one principal");
    }
}

IdentityProber::~IdentityProber() = default;

std::vector<IdentificationResult> IdentityProber::identify(const std::vector<std::string>& addresses,
                                                           bool force_refresh)
{
    auto& m_log_callback = pimpl->m_log_callback;
    std::vector<IdentificationResult> results(addresses.size());
    std::vector<std::optional<DeviceIdentity>> existing(addresses.size());
    std::vector<std::unique_ptr<RaceState>> races(addresses.size());
    std::vector<ClassificationOutcome> classifications(addresses.size(), UnknownOutcome{});

    std::vector<std::size_t> pending;
    for (std::size_t i = 0; i < addresses.size(); ++i)
    {
        results[i].address = addresses[i];
        existing[i] = pimpl->m_cache.get(addresses[i]);
        if (!force_refresh && pimpl->is_fresh(existing[i]))
        {
            results[i].identity = existing[i];
            results[i].from_cache = true;
            continue;
        }
        pending.push_back(i);
    }
    DBG("Identifying " << pending.size() << " of " << addresses.size() << " hosts ("
        << (addresses.size() - pending.size()) << " from cache)", LOG_LVL_DBG_HI);
    if (pending.empty())
    {
        return results;
    }

    {
        thread_pool classification_pool(std::max<std::size_t>(1, std::min(pimpl->m_config.classification_width, pending.size())));
        thread_pool identity_pool(std::max<std::size_t>(1, pimpl->m_config.identity_width));
        for (auto i : pending)
        {
            races[i] = std::make_unique<RaceState>(addresses[i], pimpl->m_config.principals);
            pimpl->post_race(identity_pool, *races[i]);
            post(classification_pool, [this, i, &addresses, &classifications]()
                {
                    classifications[i] = pimpl->classify(addresses[i]);
                });
        }
        identity_pool.join();
        classification_pool.join();
    }

    for (auto i : pending)
    {
        auto& race = *races[i];
        results[i].attempts = race.attempts;
        results[i].identity = pimpl->merge(addresses[i], existing[i], race.winner, classifications[i]);
        if (results[i].identity)
        {
            pimpl->m_cache.put(addresses[i], *results[i].identity);
            if (auto stored = pimpl->m_cache.get(addresses[i]))
            {
                results[i].identity = stored;
            }
        }
        else
        {
            DBG(addresses[i] << " is reachable but unidentified", LOG_LVL_DBG_MID);
        }
    }
    return results;
}

IdentificationResult IdentityProber::identify(const std::string& address, bool force_refresh)
{
    return identify(std::vector<std::string>{ address }, force_refresh).front();
}

std::optional<std::pair<std::string, LoginIdentity>> IdentityProber::race_credentials(
    const std::string& address, std::vector<CredentialAttempt>& attempts)
{
    RaceState race(address, pimpl->m_config.principals);
    {
        thread_pool pool(std::max<std::size_t>(1, std::min(pimpl->m_config.identity_width, race.attempts.size())));
        pimpl->post_race(pool, race);
        pool.join();
    }
    attempts = race.attempts;
    return race.winner;
}

ClassificationOutcome IdentityProber::classify(const std::string& address)
{
    return pimpl->classify(address);
}

std::optional<LoginIdentity> IdentityProber::parse_handshake(const std::string& output)
{
    std::vector<std::string> lines;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line))
    {
        lines.push_back(boost::algorithm::trim_copy(line));
    }
    if (lines.empty() || lines[0].empty())
    {
        return std::nullopt;
    }
    LoginIdentity identity;
    identity.hostname = lines[0];
    identity.unique_id = (lines.size() > 1) ? lines[1] : std::string{};
    identity.firmware_version = (lines.size() > 2) ? lines[2] : std::string{};
    return identity;
}

std::optional<Classification> IdentityProber::classification_from_hostname(const std::string& hostname)
{
    const auto name = boost::algorithm::to_lower_copy(hostname);
    if (contains_any(name, { "tasmota" }))
    {
        return Classification::POWER_SWITCH;
    }
    if (contains_any(name, { "dmm", "scope", "keysight", "rigol", "siglent" }))
    {
        return Classification::INSTRUMENT;
    }
    return std::nullopt;
}

std::string IdentityProber::type_hint_from_hostname(const std::string& hostname)
{
    const auto name = boost::algorithm::to_lower_copy(hostname);
    if (contains_any(name, { "eink" }))
    {
        return "eink_board";
    }
    if (contains_any(name, { "sentai" }))
    {
        return "sentai_board";
    }
    if (contains_any(name, { "board", "dev", "test", "lab" }))
    {
        return "development_board";
    }
    if (contains_any(name, { "router", "switch", "gateway" }))
    {
        return "network_device";
    }
    return {};
}

const ProberConfig& IdentityProber::config() const
{
    return pimpl->m_config;
}

} // namespace labnet

/** @} */
