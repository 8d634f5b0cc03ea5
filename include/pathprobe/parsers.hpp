/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pathprobe/probe_capability.hpp"
#include "pathprobe/results.hpp"

namespace pathprobe {

// Write-out template handed to curl by the connection timing probe. String
// fields are quoted because curl prints http_code as "000" on failure.
inline constexpr std::string_view kCurlTimingTemplate =
    R"({"dns": %{time_namelookup}, "connect": %{time_connect}, "ssl": %{time_appconnect}, )"
    R"("ttfb": %{time_starttransfer}, "total": %{time_total}, "http_code": "%{http_code}", )"
    R"("speed": %{speed_download}, "remote_ip": "%{remote_ip}", "redirects": %{num_redirects}})";

// Maps launch problems (missing tool, timeout, stop request) to a failure.
// A normal exit, whatever its status, passes.
std::expected<void, ProbeFailure> check_invocation(const ProbeInvocation& inv,
                                                   std::string_view tool);

// `dig +short` output: address lines in order, CNAME targets and comments
// skipped. No address at all is a network_unreachable failure.
std::expected<std::vector<std::string>, ProbeFailure> parse_dig_addresses(std::string_view out);

// TTL of the first A/AAAA record in `dig +noall +answer` output.
std::expected<std::uint32_t, ProbeFailure> parse_dig_ttl(std::string_view out);

std::expected<std::vector<std::string>, ProbeFailure> parse_dig_nameservers(std::string_view out);

[[nodiscard]] std::optional<std::string> detect_provider(const std::vector<std::string>& nameservers);

// Parses the kCurlTimingTemplate output and derives the per-phase segments.
std::expected<TcpResult, ProbeFailure> parse_curl_timing(std::string_view out);

// Fills the *_segment_ms fields from the cumulative timers. A negative delta
// is clamped to 0 and recorded in `anomalies`.
void derive_segments(TcpResult& r);

// `traceroute -n -q 1` output. Hop numbers must be strictly ascending.
std::expected<std::vector<RouteHop>, ProbeFailure> parse_traceroute(std::string_view out);

// Flags hops whose RTT jumps more than `delta_ms` over the previous responding
// hop, or exceeds `ceiling_ms`. Returns the indices of the flagged hops.
std::vector<std::size_t> mark_bottlenecks(std::vector<RouteHop>& hops,
                                          std::int64_t delta_ms,
                                          std::int64_t ceiling_ms);

// `-w %{http_code}` output.
std::expected<int, ProbeFailure> parse_http_code(std::string_view out);

[[nodiscard]] StabilityResult summarize_stability(std::vector<StabilitySample> samples);

}  // namespace pathprobe
