/**
 * @file identity_json.cpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * JSON encoding of DeviceIdentity
 */
#include "identity_json.hpp"

namespace labnet
{

using json = nlohmann::json;
using namespace std::chrono;

double to_epoch_seconds(system_clock::time_point tp)
{
    return duration_cast<duration<double>>(tp.time_since_epoch()).count();
}

system_clock::time_point from_epoch_seconds(double seconds)
{
    return system_clock::time_point(duration_cast<system_clock::duration>(duration<double>(seconds)));
}

void to_json(json& j, const PowerSwitchAttributes& attributes)
{
    j = json::object();
    if (attributes.power_on)
    {
        j["power_on"] = *attributes.power_on;
    }
    if (attributes.power_watts)
    {
        j["power_watts"] = *attributes.power_watts;
    }
    j["switch_name"] = attributes.switch_name;
    j["firmware"] = attributes.firmware;
}

void from_json(const json& j, PowerSwitchAttributes& attributes)
{
    attributes = PowerSwitchAttributes{};
    if (j.contains("power_on") && !j["power_on"].is_null())
    {
        attributes.power_on = j["power_on"].get<bool>();
    }
    if (j.contains("power_watts") && !j["power_watts"].is_null())
    {
        attributes.power_watts = j["power_watts"].get<double>();
    }
    attributes.switch_name = j.value("switch_name", "");
    attributes.firmware = j.value("firmware", "");
}

void to_json(json& j, const InstrumentAttributes& attributes)
{
    j = json{ { "manufacturer", attributes.manufacturer },
              { "model", attributes.model },
              { "serial_number", attributes.serial_number },
              { "firmware", attributes.firmware },
              { "port", attributes.port } };
}

void from_json(const json& j, InstrumentAttributes& attributes)
{
    attributes.manufacturer = j.value("manufacturer", "");
    attributes.model = j.value("model", "");
    attributes.serial_number = j.value("serial_number", "");
    attributes.firmware = j.value("firmware", "");
    attributes.port = j.value<uint16_t>("port", 0);
}

void to_json(json& j, const DeviceIdentity& identity)
{
    j = json{ { "address", identity.address },
              { "hostname", identity.hostname },
              { "unique_id", identity.unique_id },
              { "principal", identity.principal },
              { "firmware_version", identity.firmware_version },
              { "classification", to_string(identity.classification) },
              { "classification_confident", identity.classification_confident },
              { "type_hint", identity.type_hint },
              { "controls", identity.controls },
              { "relay_eligible", identity.relay_eligible },
              { "last_contact", to_epoch_seconds(identity.last_contact) },
              { "cached_at", to_epoch_seconds(identity.cached_at) },
              { "source", to_string(identity.source) } };
    if (identity.power_switch)
    {
        j["power_switch"] = *identity.power_switch;
    }
    if (identity.instrument)
    {
        j["instrument"] = *identity.instrument;
    }
}

void from_json(const json& j, DeviceIdentity& identity)
{
    identity = DeviceIdentity{};
    identity.address = j.value("address", "");
    identity.hostname = j.value("hostname", "");
    identity.unique_id = j.value("unique_id", "");
    identity.principal = j.value("principal", "");
    identity.firmware_version = j.value("firmware_version", "");
    identity.classification = classification_from_string(j.value("classification", "unclassified"));
    identity.classification_confident = j.value("classification_confident", true);
    identity.type_hint = j.value("type_hint", "");
    identity.controls = j.value("controls", std::vector<std::string>{});
    identity.relay_eligible = j.value("relay_eligible", false);
    identity.last_contact = from_epoch_seconds(j.value("last_contact", 0.0));
    identity.cached_at = from_epoch_seconds(j.value("cached_at", 0.0));
    identity.source = data_source_from_string(j.value("source", "discovered"));
    if (j.contains("power_switch") && j["power_switch"].is_object())
    {
        identity.power_switch = j["power_switch"].get<PowerSwitchAttributes>();
    }
    if (j.contains("instrument") && j["instrument"].is_object())
    {
        identity.instrument = j["instrument"].get<InstrumentAttributes>();
    }
}

} // namespace labnet
