/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <stop_token>
#include <string>

#include "pathprobe/config.hpp"
#include "pathprobe/probe_capability.hpp"
#include "pathprobe/results.hpp"

namespace pathprobe {

// Resolves A records, then TTL and nameservers on a best-effort basis.
class DnsProbe {
    ProbeCapability& capability_;

   public:
    explicit DnsProbe(ProbeCapability& capability) : capability_(capability) {}

    std::expected<DnsResult, ProbeFailure> run(const std::string& domain, std::stop_token stop = {});

   private:
    std::optional<ProbeInvocation> best_effort(ProbeCommand cmd,
                                               std::stop_token stop,
                                               DnsResult& result);
};

// One timed GET through curl's write-out timers.
class ConnectionTimingProbe {
    ProbeCapability& capability_;

   public:
    explicit ConnectionTimingProbe(ProbeCapability& capability) : capability_(capability) {}

    std::expected<TcpResult, ProbeFailure> run(const std::string& url, std::stop_token stop = {});
};

struct RouteOptions {
    int max_hops = Config::ROUTE_MAX_HOPS;
    std::int64_t bottleneck_delta_ms = Config::BOTTLENECK_DELTA_MS;
    std::int64_t bottleneck_ceiling_ms = Config::BOTTLENECK_CEILING_MS;
};

class RouteTracer {
    ProbeCapability& capability_;
    RouteOptions options_;

   public:
    RouteTracer(ProbeCapability& capability, RouteOptions options)
        : capability_(capability), options_(options) {}

    std::expected<RoutingResult, ProbeFailure> run(const std::string& target_ip,
                                                   std::stop_token stop = {});
};

struct StabilityOptions {
    int samples = Config::STABILITY_SAMPLES;
    std::chrono::milliseconds pause = Config::STABILITY_PAUSE;
    std::chrono::milliseconds budget = Config::STABILITY_BUDGET;
};

// Sequential status-code requests. Collects its own samples.
class StabilitySampler {
    ProbeCapability& capability_;
    StabilityOptions options_;

   public:
    StabilitySampler(ProbeCapability& capability, StabilityOptions options)
        : capability_(capability), options_(options) {}

    std::expected<StabilityResult, ProbeFailure> run(const std::string& url,
                                                     std::stop_token stop = {});
};

// Terminal step status and the one-line text shown next to it.
struct StepVerdict {
    StepStatus status = StepStatus::Error;
    std::string message;
    std::optional<std::string> recommendation;
};

[[nodiscard]] StepVerdict failure_verdict(const ProbeFailure& failure);

[[nodiscard]] StepVerdict dns_verdict(const std::expected<DnsResult, ProbeFailure>& r);

// tcp, ssl and http, in that order.
[[nodiscard]] std::array<StepVerdict, 3> connection_verdicts(
    const std::expected<TcpResult, ProbeFailure>& r, bool uses_tls);

[[nodiscard]] StepVerdict routing_verdict(const std::expected<RoutingResult, ProbeFailure>& r);
[[nodiscard]] StepVerdict stability_verdict(const std::expected<StabilityResult, ProbeFailure>& r);

}  // namespace pathprobe
