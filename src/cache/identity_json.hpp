#ifndef _LABNET_IDENTITY_JSON_H_
#define _LABNET_IDENTITY_JSON_H_
/**
 * @file identity_json.hpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * JSON encoding of DeviceIdentity used by the durable cache.
 */
#include "labnet/device_types.hpp"
#include <nlohmann/json.hpp>

namespace labnet
{

void to_json(nlohmann::json& j, const PowerSwitchAttributes& attributes);
void from_json(const nlohmann::json& j, PowerSwitchAttributes& attributes);

void to_json(nlohmann::json& j, const InstrumentAttributes& attributes);
void from_json(const nlohmann::json& j, InstrumentAttributes& attributes);

/// Timestamps are written as fractional seconds since the epoch.
void to_json(nlohmann::json& j, const DeviceIdentity& identity);

/// @throw nlohmann::json::exception or std::invalid_argument on malformed input
void from_json(const nlohmann::json& j, DeviceIdentity& identity);

double to_epoch_seconds(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point from_epoch_seconds(double seconds);

} // namespace labnet

#endif // _LABNET_IDENTITY_JSON_H_
