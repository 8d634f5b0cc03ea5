/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include <format>

#include "pathprobe/probes.hpp"

namespace pathprobe {

namespace {

constexpr std::int64_t kSlowConnectMs = 500;
constexpr std::int64_t kSlowSslMs = 500;
constexpr std::int64_t kSlowTotalMs = 3000;

std::optional<std::string> non_empty(const std::string& s) {
    if (s.empty()) return std::nullopt;
    return s;
}

}  // namespace

StepVerdict failure_verdict(const ProbeFailure& failure) {
    if (failure.kind == ProbeError::Cancelled) {
        return {StepStatus::Error, "cancelled", std::nullopt};
    }
    return {StepStatus::Error,
            std::format("{}: {}", to_string(failure.kind), failure.message),
            non_empty(failure.recommendation)};
}

StepVerdict dns_verdict(const std::expected<DnsResult, ProbeFailure>& r) {
    if (!r) return failure_verdict(r.error());

    auto msg = std::format("{} address(es) in {} ms", r->resolved_ips.size(), r->lookup_time_ms);
    if (r->provider) msg += std::format(", {}", *r->provider);

    if (r->lookup_time_ms > Config::DNS_WARN_MS) {
        return {StepStatus::Warning, std::move(msg),
                "Switch to a faster resolver such as 1.1.1.1 or 8.8.8.8."};
    }
    return {StepStatus::Success, std::move(msg), std::nullopt};
}

std::array<StepVerdict, 3> connection_verdicts(const std::expected<TcpResult, ProbeFailure>& r,
                                               bool uses_tls) {
    if (!r) {
        auto f = failure_verdict(r.error());
        return {f, f, f};
    }
    const auto& t = *r;
    std::array<StepVerdict, 3> out;

    auto& tcp = out[0];
    tcp.message = std::format("connect {} ms, total {} ms", t.connect_segment_ms, t.total_ms);
    if (t.connect_segment_ms >= kSlowConnectMs || t.total_ms >= kSlowTotalMs) {
        tcp.status = StepStatus::Warning;
        tcp.recommendation = "The server is far away or the path is congested; a closer region or VPN may help.";
    } else {
        tcp.status = StepStatus::Success;
    }

    auto& ssl = out[1];
    if (!uses_tls) {
        ssl.status = StepStatus::Success;
        ssl.message = "no TLS (plain HTTP)";
    } else if (t.ssl_ms == 0) {
        ssl.status = StepStatus::Error;
        ssl.message = "TLS handshake did not complete";
        ssl.recommendation = "Check the server certificate and TLS configuration.";
    } else if (t.ssl_segment_ms >= kSlowSslMs) {
        ssl.status = StepStatus::Warning;
        ssl.message = std::format("handshake {} ms", t.ssl_segment_ms);
        ssl.recommendation = "A long certificate chain or missing OCSP stapling slows the handshake.";
    } else {
        ssl.status = StepStatus::Success;
        ssl.message = std::format("handshake {} ms", t.ssl_segment_ms);
    }

    auto& http = out[2];
    http.message = std::format("HTTP {}", t.http_code);
    if (t.redirect_count > 0) http.message += std::format(" after {} redirect(s)", t.redirect_count);
    if (t.http_code == 0) {
        http.status = StepStatus::Error;
        http.message = "no HTTP response";
    } else if (t.http_code >= 400) {
        http.status = StepStatus::Warning;
        http.recommendation = t.http_code >= 500 ? "The server reported an internal error; retry later."
                                                 : "Check that the URL is correct and accessible.";
    } else if (t.http_code >= 200) {
        http.status = StepStatus::Success;
    } else {
        http.status = StepStatus::Warning;
    }
    return out;
}

StepVerdict routing_verdict(const std::expected<RoutingResult, ProbeFailure>& r) {
    if (!r) return failure_verdict(r.error());

    auto msg = std::format("{} hops, {} bottleneck(s), {} unresponsive",
                           r->total_hops, r->bottleneck_hops.size(), r->unresponsive_hops);
    if (r->truncated) msg += " (partial)";

    bool mostly_silent = r->total_hops > 0 && r->unresponsive_hops * 2 > r->total_hops;
    if (mostly_silent || !r->bottleneck_hops.empty() || r->truncated) {
        return {StepStatus::Warning, std::move(msg),
                "Latency rises along the path; a VPN or a closer endpoint may route around it."};
    }
    return {StepStatus::Success, std::move(msg), std::nullopt};
}

StepVerdict stability_verdict(const std::expected<StabilityResult, ProbeFailure>& r) {
    if (!r) return failure_verdict(r.error());

    auto msg = std::format("{}/{} ok, avg {} ms, jitter {} ms",
                           r->successful_tests, r->total_tests,
                           r->avg_time_ms, r->mean_delta_jitter_ms);
    if (r->truncated) msg += " (partial)";
    if (r->success_rate >= 100.0) {
        if (r->truncated) {
            return {StepStatus::Warning, std::move(msg),
                    "The server answers very slowly; retry later or lower --samples."};
        }
        return {StepStatus::Success, std::move(msg), std::nullopt};
    }
    if (r->success_rate >= 80.0) {
        return {StepStatus::Warning, std::move(msg), "Check Wi-Fi signal strength and retry in a few minutes."};
    }
    return {StepStatus::Error, std::move(msg), "Use a wired connection and restart the modem or router."};
}

}  // namespace pathprobe
