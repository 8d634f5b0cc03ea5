// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
// Copyright (c) 2025 Alfie Ardinata.

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "pathprobe/results.hpp"

namespace pathprobe {

// Found by nlohmann::json through ADL: `nlohmann::json j = result;`
void to_json(nlohmann::json& j, const DnsResult& r);
void to_json(nlohmann::json& j, const TcpResult& r);
void to_json(nlohmann::json& j, const RouteHop& h);
void to_json(nlohmann::json& j, const RoutingResult& r);
void to_json(nlohmann::json& j, const StabilitySample& s);
void to_json(nlohmann::json& j, const StabilityResult& r);
void to_json(nlohmann::json& j, const ProbeFailure& f);
void to_json(nlohmann::json& j, const DiagnosticStep& s);
void to_json(nlohmann::json& j, const Issue& i);
void to_json(nlohmann::json& j, const DiagnosticReport& r);

// null when the probe never ran, {"error": {...}} when it failed.
template <typename T>
nlohmann::json slot_to_json(const ProbeSlot<T>& slot) {
    if (!slot) return nullptr;
    if (!*slot) return nlohmann::json{{"error", slot->error()}};
    return nlohmann::json(**slot);
}

[[nodiscard]] std::string report_to_string(const DiagnosticReport& r, int indent = 2);

}  // namespace pathprobe
