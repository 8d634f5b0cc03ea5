/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include <algorithm>
#include <format>
#include <utility>

#include "pathprobe/log.hpp"
#include "pathprobe/parsers.hpp"
#include "pathprobe/probes.hpp"
#include "pathprobe/utils.hpp"

namespace pathprobe {

std::expected<RoutingResult, ProbeFailure> RouteTracer::run(const std::string& target_ip,
                                                            std::stop_token stop) {
    ProbeCommand cmd{std::string(Config::TRACEROUTE_BINARY),
                     {"-n",
                      "-m", std::to_string(options_.max_hops),
                      "-w", std::to_string(Config::ROUTE_WAIT_SEC),
                      "-q", "1",
                      target_ip},
                     Config::ROUTE_TIMEOUT,
                     "traceroute"};
    auto inv = capability_.invoke(cmd, stop);

    auto ok = check_invocation(inv, Config::TRACEROUTE_BINARY);
    bool partial = !ok && ok.error().kind == ProbeError::Timeout;
    if (!ok && !partial) {
        return std::unexpected(std::move(ok.error()));
    }

    auto hops = parse_traceroute(inv.stdout_text);
    if (!hops) {
        if (partial) {
            return std::unexpected(std::move(ok.error()));
        }
        if (inv.exit_code != 0) {
            return std::unexpected(ProbeFailure{
                ProbeError::NetworkUnreachable,
                std::format("traceroute exited with code {}: {}",
                            inv.exit_code, first_line(inv.stderr_text)),
                inv.stdout_text + inv.stderr_text,
                "Some networks block traceroute; try again from another network."});
        }
        Log::debug("traceroute parse error, raw output:\n{}", inv.stdout_text);
        return std::unexpected(std::move(hops.error()));
    }

    RoutingResult result;
    result.target_ip = target_ip;
    result.hops = std::move(*hops);
    result.total_hops = static_cast<int>(result.hops.size());
    result.total_time_ms = inv.elapsed_ms;
    result.bottleneck_hops = mark_bottlenecks(
        result.hops, options_.bottleneck_delta_ms, options_.bottleneck_ceiling_ms);
    result.unresponsive_hops = static_cast<int>(
        std::ranges::count_if(result.hops, [](const RouteHop& h) { return !h.ip_address; }));

    if (partial) {
        result.truncated = true;
        result.degradation = ProbeError::PartialDegradation;
        result.notes.push_back(std::format(
            "Partial degradation: traceroute timed out after {} ms, {} hop(s) recorded",
            inv.elapsed_ms, result.total_hops));
    }
    if (inv.truncated) {
        result.notes.push_back("traceroute output exceeded the capture limit and was cut");
    }

    Log::debug("route: {} hops, {} bottleneck(s), {} unresponsive",
               result.total_hops, result.bottleneck_hops.size(), result.unresponsive_hops);
    return result;
}

}  // namespace pathprobe
