/**
 * @file power_switch_probe.cpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Recognises Tasmota style power switches from their "Status 0" HTTP reply
 */
#include "labnet/identity_prober.hpp"
#include "tcp_exchange.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>

namespace labnet
{

using json = nlohmann::json;

constexpr auto STATUS_PATH { "/cm?cmnd=Status%200" };

PowerSwitchProbe::PowerSwitchProbe(uint16_t port) :
    m_port(port)
{
}

static std::optional<bool> power_state_from(const json& value)
{
    if (value.is_boolean())
    {
        return value.get<bool>();
    }
    if (value.is_number_integer())
    {
        return value.get<int>() != 0;
    }
    if (value.is_string())
    {
        auto text = value.get<std::string>();
        std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::toupper(c); });
        if ((text == "ON") || (text == "1"))
        {
            return true;
        }
        if ((text == "OFF") || (text == "0"))
        {
            return false;
        }
    }
    return std::nullopt;
}

std::optional<PowerSwitchAttributes> PowerSwitchProbe::parse_status_reply(const std::string& reply)
{
    std::string body { reply };
    auto header_end = reply.find("\r\n\r\n");
    if (reply.rfind("HTTP/", 0) == 0)
    {
        if (header_end == std::string::npos)
        {
            return std::nullopt;
        }
        auto status_line = reply.substr(0, reply.find("\r\n"));
        if (status_line.find(" 200") == std::string::npos)
        {
            return std::nullopt;
        }
        body = reply.substr(header_end + 4);
    }

    try
    {
        auto j = json::parse(body);
        if (!j.is_object() || !j.contains("Status") || !j["Status"].is_object())
        {
            return std::nullopt;
        }
        const auto& status = j["Status"];
        PowerSwitchAttributes attributes;
        if (status.contains("Power"))
        {
            attributes.power_on = power_state_from(status["Power"]);
        }
        if (j.contains("StatusSTS") && j["StatusSTS"].contains("POWER"))
        {
            attributes.power_on = power_state_from(j["StatusSTS"]["POWER"]);
        }
        if (j.contains("StatusSNS") && j["StatusSNS"].contains("ENERGY"))
        {
            const auto& energy = j["StatusSNS"]["ENERGY"];
            if (energy.contains("Power") && energy["Power"].is_number())
            {
                attributes.power_watts = energy["Power"].get<double>();
            }
        }
        if (j.contains("StatusFWR") && j["StatusFWR"].contains("Version"))
        {
            attributes.firmware = j["StatusFWR"]["Version"].get<std::string>();
        }
        if (status.contains("DeviceName") && status["DeviceName"].is_string())
        {
            attributes.switch_name = status["DeviceName"].get<std::string>();
        }
        if (attributes.switch_name.empty() && status.contains("FriendlyName") &&
            status["FriendlyName"].is_array() && !status["FriendlyName"].empty())
        {
            attributes.switch_name = status["FriendlyName"][0].get<std::string>();
        }
        return attributes;
    }
    catch (const json::exception&)
    {
        return std::nullopt;
    }
}

ClassificationOutcome PowerSwitchProbe::probe(const std::string& address, std::chrono::steady_clock::duration timeout)
{
    const std::string request = std::string("GET ") + STATUS_PATH + " HTTP/1.0\r\n"
                                "Host: " + address + "\r\n"
                                "Connection: close\r\n\r\n";
    auto reply = tcp_exchange(address, m_port, request, timeout, ReplyEnd::CONNECTION_CLOSE);
    if (!reply)
    {
        return UnknownOutcome{};
    }
    auto attributes = parse_status_reply(*reply);
    if (!attributes)
    {
        return UnknownOutcome{};
    }
    return PowerSwitchOutcome{ *attributes };
}

} // namespace labnet
