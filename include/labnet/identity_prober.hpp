#ifndef __LABNET_IDENTITY_PROBER_HPP__
#define __LABNET_IDENTITY_PROBER_HPP__
/**
 * @file identity_prober.hpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * API for classifying live hosts and resolving their identity
 * @{
 */
#include "device_cache.hpp"
#include "device_types.hpp"
#include "executor.hpp"
#include "log.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace labnet
{

struct UnknownOutcome
{
};

struct PowerSwitchOutcome
{
    PowerSwitchAttributes attributes;
};

struct InstrumentOutcome
{
    InstrumentAttributes attributes;
};

/// Typed result of a classification probe
typedef std::variant<UnknownOutcome, PowerSwitchOutcome, InstrumentOutcome> ClassificationOutcome;

/// @brief Lightweight protocol probe that recognises one class of device.
class ClassificationProbe_T
{
public:
    virtual ~ClassificationProbe_T() = default;

    virtual const char* name() const = 0;

    /// @return UnknownOutcome when the device does not speak the probed protocol
    virtual ClassificationOutcome probe(const std::string& address,
                                        std::chrono::steady_clock::duration timeout) = 0;
};

/// @brief Recognises power switches through their HTTP status command.
class PowerSwitchProbe : public ClassificationProbe_T
{
public:
    explicit PowerSwitchProbe(uint16_t port = 80);
    const char* name() const override { return "power-switch"; }
    ClassificationOutcome probe(const std::string& address, std::chrono::steady_clock::duration timeout) override;

    /// @brief Interpret a raw HTTP reply to the status command.
    /// @return the switch attributes, std::nullopt if the reply is not a power switch status
    static std::optional<PowerSwitchAttributes> parse_status_reply(const std::string& reply);

private:
    uint16_t m_port;
};

/// @brief Recognises SCPI instruments through *IDN?
class InstrumentProbe : public ClassificationProbe_T
{
public:
    explicit InstrumentProbe(std::vector<uint16_t> ports = { 5025, 5024, 3490, 3491 });
    const char* name() const override { return "instrument"; }
    ClassificationOutcome probe(const std::string& address, std::chrono::steady_clock::duration timeout) override;

    /// @brief Interpret a "manufacturer,model,serial,firmware" identification string.
    static std::optional<InstrumentAttributes> parse_idn_reply(const std::string& reply);

private:
    std::vector<uint16_t> m_ports;
};

enum class AttemptOutcome : uint8_t
{
    SUCCESS,
    AUTHENTICATION_FAILED,
    TIMEOUT,
    REFUSED,
    UNREACHABLE,
    CANCELLED,
    ERROR,
};

const char* to_string(AttemptOutcome outcome);

/// @brief One login attempt of a credential race.
struct CredentialAttempt
{
    std::string address;
    std::string principal;
    AttemptOutcome outcome { AttemptOutcome::ERROR };
    std::string detail;
};

struct IdentificationResult
{
    std::string address;
    /// Set when the device was identified or classified (now or from a fresh cache entry).
    std::optional<DeviceIdentity> identity;
    bool from_cache { false };
    std::vector<CredentialAttempt> attempts;

    /// Reachable but no stable identity yet.
    bool is_unidentified() const
    {
        return !identity.has_value() || !identity->is_identified();
    }
};

struct ProberConfig
{
    std::vector<std::string> principals { "fio", "root" };  ///< preferred first
    uint16_t ssh_port { DEFAULT_SSH_PORT };
    std::optional<std::string> identity_file;
    std::chrono::steady_clock::duration attempt_timeout { std::chrono::seconds(5) };
    std::chrono::steady_clock::duration classification_timeout { std::chrono::seconds(2) };
    std::size_t identity_width { 10 };
    std::size_t classification_width { 10 };
    /// Power switch address -> ids of the devices it powers
    std::map<std::string, std::vector<std::string>> controls;
    /// Addresses that are only reachable through the relay gateway
    std::vector<std::string> relay_addresses;
};

/// @brief Login handshake reply from a generic host.
struct LoginIdentity
{
    std::string hostname;
    std::string unique_id;
    std::string firmware_version;
};

class IdentityProber
{
public:
    /// Command run by every credential attempt; prints hostname, machine id and OS version.
    static const char* const HANDSHAKE_COMMAND;

    IdentityProber(DeviceCache_T& cache,
                   CommandExecutor_T& executor,
                   std::vector<std::shared_ptr<ClassificationProbe_T>> probes,
                   ProberConfig config = ProberConfig{},
                   log_callback_t log_callback = nullptr);

    ~IdentityProber();

    /// @brief Run one identification pass over live addresses.
    ///  Results are returned in the order of addresses.
    /// @param force_refresh Ignore fresh cache entries.
    std::vector<IdentificationResult> identify(const std::vector<std::string>& addresses, bool force_refresh = false);

    IdentificationResult identify(const std::string& address, bool force_refresh = false);

    /// @brief Race all candidate principals against one address.
    /// @param attempts Receives one record per principal.
    /// @return identity of the first successful attempt, std::nullopt if none succeeded
    std::optional<std::pair<std::string, LoginIdentity>> race_credentials(const std::string& address,
                                                                         std::vector<CredentialAttempt>& attempts);

    /// @brief Run every classification probe against one address.
    ClassificationOutcome classify(const std::string& address);

    /// Parse the output of HANDSHAKE_COMMAND
    static std::optional<LoginIdentity> parse_handshake(const std::string& output);

    /// Low confidence classification from a hostname, used only when no protocol probe matched
    static std::optional<Classification> classification_from_hostname(const std::string& hostname);

    /// Device kind hint such as "eink_board" derived from a hostname; empty if nothing matches
    static std::string type_hint_from_hostname(const std::string& hostname);

    const ProberConfig& config() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pimpl;
};

} // namespace labnet

#endif // __LABNET_IDENTITY_PROBER_HPP__

/** @} */
