/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include <format>
#include <utility>

#include "pathprobe/log.hpp"
#include "pathprobe/parsers.hpp"
#include "pathprobe/probes.hpp"
#include "pathprobe/utils.hpp"

namespace pathprobe {

std::expected<DnsResult, ProbeFailure> DnsProbe::run(const std::string& domain,
                                                     std::stop_token stop) {
    DnsResult result;
    result.domain = domain;

    if (is_ip_address(domain)) {
        result.resolved_ips.push_back(domain);
        result.notes.push_back("Target is an IP address, DNS lookup skipped");
        return result;
    }

    ProbeCommand cmd{std::string(Config::DIG_BINARY),
                     {"+short", domain, "A", "+time=2", "+tries=1"},
                     Config::DNS_TIMEOUT,
                     "dns_a"};
    auto inv = capability_.invoke(cmd, stop);

    if (auto ok = check_invocation(inv, Config::DIG_BINARY); !ok) {
        return std::unexpected(std::move(ok.error()));
    }
    if (inv.exit_code != 0) {
        return std::unexpected(ProbeFailure{
            ProbeError::NetworkUnreachable,
            std::format("dig exited with code {}: {}",
                        inv.exit_code,
                        first_line(inv.stderr_text.empty() ? inv.stdout_text : inv.stderr_text)),
            inv.stdout_text + inv.stderr_text,
            "Check your network connection and DNS resolver settings."});
    }

    auto ips = parse_dig_addresses(inv.stdout_text);
    if (!ips) {
        return std::unexpected(std::move(ips.error()));
    }
    result.resolved_ips = std::move(*ips);
    result.lookup_time_ms = inv.elapsed_ms;
    Log::debug("dns: {} -> {} address(es) in {} ms",
               domain, result.resolved_ips.size(), result.lookup_time_ms);

    if (auto ttl_inv = best_effort({std::string(Config::DIG_BINARY),
                                    {domain, "+noall", "+answer"},
                                    Config::DNS_AUX_TIMEOUT,
                                    "dns_ttl"},
                                   stop,
                                   result)) {
        if (auto ttl = parse_dig_ttl(ttl_inv->stdout_text)) {
            result.ttl = *ttl;
        } else {
            result.notes.push_back(std::format("TTL unavailable: {}", ttl.error().message));
        }
    }

    if (auto ns_inv = best_effort({std::string(Config::DIG_BINARY),
                                   {domain, "NS", "+short"},
                                   Config::DNS_AUX_TIMEOUT,
                                   "dns_ns"},
                                  stop,
                                  result)) {
        if (auto ns = parse_dig_nameservers(ns_inv->stdout_text)) {
            result.nameservers = std::move(*ns);
            result.provider = detect_provider(result.nameservers);
        } else {
            result.notes.push_back(std::format("Nameservers unavailable: {}", ns.error().message));
        }
    }

    return result;
}

std::optional<ProbeInvocation> DnsProbe::best_effort(ProbeCommand cmd,
                                                     std::stop_token stop,
                                                     DnsResult& result) {
    if (stop.stop_requested()) return std::nullopt;

    auto inv = capability_.invoke(cmd, stop);
    auto ok = check_invocation(inv, Config::DIG_BINARY);
    if (!ok) {
        Log::debug("{}: {}", cmd.label, ok.error().message);
        if (ok.error().kind != ProbeError::Cancelled) {
            result.notes.push_back(std::format("{} skipped: {}", cmd.label, ok.error().message));
        }
        return std::nullopt;
    }
    if (inv.exit_code != 0) {
        result.notes.push_back(std::format("{} skipped: dig exited with code {}", cmd.label, inv.exit_code));
        return std::nullopt;
    }
    return inv;
}

}  // namespace pathprobe
