/**
 * @file instrument_probe.cpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Recognises SCPI test instruments from their *IDN? reply
 */
#include "labnet/identity_prober.hpp"
#include "tcp_exchange.hpp"
#include <boost/algorithm/string.hpp>

namespace labnet
{

InstrumentProbe::InstrumentProbe(std::vector<uint16_t> ports) :
    m_ports(std::move(ports))
{
}

std::optional<InstrumentAttributes> InstrumentProbe::parse_idn_reply(const std::string& reply)
{
    auto line = boost::algorithm::trim_copy(reply);
    std::vector<std::string> fields;
    boost::algorithm::split(fields, line, boost::algorithm::is_any_of(","));
    if (fields.size() < 4)
    {
        return std::nullopt;
    }
    for (auto& field : fields)
    {
        boost::algorithm::trim(field);
    }
    if (fields[0].empty() || fields[1].empty())
    {
        return std::nullopt;
    }
    InstrumentAttributes attributes;
    attributes.manufacturer = fields[0];
    attributes.model = fields[1];
    attributes.serial_number = fields[2];
    attributes.firmware = fields[3];
    return attributes;
}

ClassificationOutcome InstrumentProbe::probe(const std::string& address, std::chrono::steady_clock::duration timeout)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (auto port : m_ports)
    {
        const auto remaining = deadline - std::chrono::steady_clock::now();
        if (remaining <= std::chrono::steady_clock::duration::zero())
        {
            break;
        }
        auto reply = tcp_exchange(address, port, "*IDN?\n", remaining, ReplyEnd::NEWLINE);
        if (!reply)
        {
            continue;
        }
        auto attributes = parse_idn_reply(*reply);
        if (attributes)
        {
            attributes->port = port;
            return InstrumentOutcome{ *attributes };
        }
    }
    return UnknownOutcome{};
}

} // namespace labnet
