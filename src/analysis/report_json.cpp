// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
// Copyright (c) 2025 Alfie Ardinata.

#include "pathprobe/report_json.hpp"

namespace pathprobe {

namespace {

template <typename T>
nlohmann::json optional_json(const std::optional<T>& v) {
    if (!v) return nullptr;
    return nlohmann::json(*v);
}

nlohmann::json degradation_json(const std::optional<ProbeError>& kind) {
    if (!kind) return nullptr;
    return std::string(to_string(*kind));
}

}  // namespace

void to_json(nlohmann::json& j, const DnsResult& r) {
    j = nlohmann::json{{"domain", r.domain},
                       {"resolved_ips", r.resolved_ips},
                       {"lookup_time_ms", r.lookup_time_ms},
                       {"ttl", optional_json(r.ttl)},
                       {"nameservers", r.nameservers},
                       {"provider", optional_json(r.provider)},
                       {"notes", r.notes}};
}

void to_json(nlohmann::json& j, const TcpResult& r) {
    j = nlohmann::json{{"dns_ms", r.dns_ms},
                       {"connect_ms", r.connect_ms},
                       {"ssl_ms", r.ssl_ms},
                       {"ttfb_ms", r.ttfb_ms},
                       {"total_ms", r.total_ms},
                       {"connect_segment_ms", r.connect_segment_ms},
                       {"ssl_segment_ms", r.ssl_segment_ms},
                       {"ttfb_segment_ms", r.ttfb_segment_ms},
                       {"transfer_segment_ms", r.transfer_segment_ms},
                       {"http_code", r.http_code},
                       {"download_speed_bps", r.download_speed_bps},
                       {"remote_ip", optional_json(r.remote_ip)},
                       {"redirect_count", r.redirect_count},
                       {"anomalies", r.anomalies}};
}

void to_json(nlohmann::json& j, const RouteHop& h) {
    j = nlohmann::json{{"hop_number", h.hop_number},
                       {"ip_address", optional_json(h.ip_address)},
                       {"hostname", optional_json(h.hostname)},
                       {"rtt_ms", optional_json(h.rtt_ms)},
                       {"packet_loss_percent", h.packet_loss_percent},
                       {"is_bottleneck", h.is_bottleneck}};
}

void to_json(nlohmann::json& j, const RoutingResult& r) {
    j = nlohmann::json{{"target_ip", r.target_ip},
                       {"hops", r.hops},
                       {"total_hops", r.total_hops},
                       {"total_time_ms", r.total_time_ms},
                       {"bottleneck_hops", r.bottleneck_hops},
                       {"unresponsive_hops", r.unresponsive_hops},
                       {"truncated", r.truncated},
                       {"degradation", degradation_json(r.degradation)},
                       {"notes", r.notes}};
}

void to_json(nlohmann::json& j, const StabilitySample& s) {
    j = nlohmann::json{{"attempt", s.attempt},
                       {"success", s.success},
                       {"http_code", s.http_code},
                       {"elapsed_ms", s.elapsed_ms},
                       {"error", optional_json(s.error)},
                       {"raw_output", optional_json(s.raw_output)}};
}

void to_json(nlohmann::json& j, const StabilityResult& r) {
    j = nlohmann::json{{"total_tests", r.total_tests},
                       {"successful_tests", r.successful_tests},
                       {"success_rate", r.success_rate},
                       {"min_time_ms", r.min_time_ms},
                       {"avg_time_ms", r.avg_time_ms},
                       {"max_time_ms", r.max_time_ms},
                       {"range_jitter_ms", r.range_jitter_ms},
                       {"mean_delta_jitter_ms", r.mean_delta_jitter_ms},
                       {"samples", r.samples},
                       {"truncated", r.truncated},
                       {"degradation", degradation_json(r.degradation)},
                       {"notes", r.notes}};
}

void to_json(nlohmann::json& j, const ProbeFailure& f) {
    j = nlohmann::json{{"kind", std::string(to_string(f.kind))},
                       {"message", f.message},
                       {"raw_output", f.raw_output},
                       {"recommendation", f.recommendation}};
}

void to_json(nlohmann::json& j, const DiagnosticStep& s) {
    j = nlohmann::json{{"id", std::string(to_string(s.id))},
                       {"status", std::string(to_string(s.status))},
                       {"result", optional_json(s.result_text)},
                       {"duration_ms", optional_json(s.duration_ms)},
                       {"recommendation", optional_json(s.recommendation)}};
}

void to_json(nlohmann::json& j, const Issue& i) {
    j = nlohmann::json{{"category", std::string(to_string(i.category))},
                       {"severity", std::string(to_string(i.severity))},
                       {"title", i.title},
                       {"description", i.description},
                       {"possible_causes", i.possible_causes},
                       {"solutions", i.solutions}};
}

void to_json(nlohmann::json& j, const DiagnosticReport& r) {
    j = nlohmann::json{{"target_url", r.target_url},
                       {"domain", r.domain},
                       {"timestamp", r.timestamp},
                       {"dns", slot_to_json(r.dns)},
                       {"tcp", slot_to_json(r.tcp)},
                       {"routing", slot_to_json(r.routing)},
                       {"stability", slot_to_json(r.stability)},
                       {"steps", r.steps},
                       {"score", r.score},
                       {"overall_status", std::string(to_string(r.overall_status))},
                       {"issues", r.issues},
                       {"recommendations", r.recommendations},
                       {"notes", r.notes},
                       {"cancelled", r.cancelled},
                       {"duration_ms", r.duration_ms},
                       {"capture_dir", optional_json(r.capture_dir)}};
}

std::string report_to_string(const DiagnosticReport& r, int indent) {
    // Raw tool output is not guaranteed to be valid UTF-8.
    return nlohmann::json(r).dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace pathprobe
