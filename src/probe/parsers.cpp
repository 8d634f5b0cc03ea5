/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "pathprobe/parsers.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <numeric>
#include <utility>

#include <nlohmann/json.hpp>

#include "pathprobe/utils.hpp"

namespace pathprobe {

namespace {

ProbeFailure parse_failure(std::string message, std::string_view raw) {
    return ProbeFailure{ProbeError::ParseError,
                        std::move(message),
                        std::string(raw),
                        "Re-run with --capture and inspect the raw tool output."};
}

std::string install_hint(std::string_view tool) {
    if (tool == "dig") {
        return "Install dig (dnsutils on Debian/Ubuntu, bind-utils on Fedora/RHEL).";
    }
    if (tool == "traceroute") {
        return "Install the traceroute package.";
    }
    return std::format("Install {} and make sure it is on PATH.", tool);
}

bool all_digits(std::string_view s) {
    return !s.empty() && std::ranges::all_of(s, [](char c) { return c >= '0' && c <= '9'; });
}

std::optional<double> json_seconds(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return std::nullopt;
    return it->get<double>();
}

std::int64_t clamp_segment(std::int64_t value, std::string_view name, TcpResult& r) {
    if (value >= 0) return value;
    r.anomalies.push_back(
        std::format("{} segment was negative ({} ms), clamped to 0", name, value));
    return 0;
}

struct ProviderRule {
    std::string_view needle;
    std::string_view name;
};

constexpr std::array<ProviderRule, 8> kProviders = {{
    {"cloudflare", "Cloudflare"},
    {"awsdns", "AWS Route53"},
    {"akamai", "Akamai"},
    {"fastly", "Fastly"},
    {"azure", "Azure"},
    {"google", "Google Cloud"},
    {"nsone", "NS1"},
    {"ultradns", "UltraDNS"},
}};

}  // namespace

std::expected<void, ProbeFailure> check_invocation(const ProbeInvocation& inv,
                                                   std::string_view tool) {
    if (inv.tool_missing || inv.exit_code == 127) {
        return std::unexpected(ProbeFailure{ProbeError::ToolUnavailable,
                                            std::format("{} is not available", tool),
                                            inv.stderr_text,
                                            install_hint(tool)});
    }
    if (inv.cancelled) {
        return std::unexpected(ProbeFailure{
            ProbeError::Cancelled, "cancelled", inv.stdout_text, ""});
    }
    if (inv.timed_out) {
        return std::unexpected(ProbeFailure{
            ProbeError::Timeout,
            std::format("{} timed out after {} ms", tool, inv.elapsed_ms),
            inv.stdout_text,
            "Check your connection and firewall, then try again."});
    }
    if (!inv.launch_error.empty()) {
        return std::unexpected(ProbeFailure{ProbeError::Internal,
                                            std::format("cannot run {}: {}", tool, inv.launch_error),
                                            inv.stderr_text,
                                            ""});
    }
    return {};
}

std::expected<std::vector<std::string>, ProbeFailure> parse_dig_addresses(std::string_view out) {
    std::vector<std::string> ips;
    for (auto line : split_lines(out)) {
        auto t = trim_sv(line);
        if (t.empty() || t.starts_with(';')) continue;
        if (is_ip_address(t)) ips.emplace_back(t);
    }
    if (ips.empty()) {
        return std::unexpected(ProbeFailure{ProbeError::NetworkUnreachable,
                                            "DNS returned no addresses",
                                            std::string(out),
                                            "Check the domain name, then try another resolver "
                                            "such as 1.1.1.1 or 8.8.8.8."});
    }
    return ips;
}

std::expected<std::uint32_t, ProbeFailure> parse_dig_ttl(std::string_view out) {
    for (auto line : split_lines(out)) {
        auto t = trim_sv(line);
        if (t.empty() || t.starts_with(';')) continue;
        auto f = split_ws(t);
        // name ttl class type rdata
        if (f.size() < 5 || (f[3] != "A" && f[3] != "AAAA")) continue;
        auto ttl = parse_number<std::uint32_t>(f[1]);
        if (!ttl) {
            return std::unexpected(parse_failure(std::format("bad TTL '{}'", f[1]), out));
        }
        return *ttl;
    }
    return std::unexpected(parse_failure("no A/AAAA record in answer section", out));
}

std::expected<std::vector<std::string>, ProbeFailure> parse_dig_nameservers(std::string_view out) {
    std::vector<std::string> ns;
    for (auto line : split_lines(out)) {
        auto t = trim_sv(line);
        if (t.empty() || t.starts_with(';')) continue;
        if (t.find_first_of(" \t") != std::string_view::npos || t.find('.') == std::string_view::npos) {
            return std::unexpected(parse_failure(std::format("unexpected NS line '{}'", t), out));
        }
        if (t.ends_with('.')) t.remove_suffix(1);
        ns.push_back(to_lower(t));
    }
    return ns;
}

std::optional<std::string> detect_provider(const std::vector<std::string>& nameservers) {
    for (const auto& rule : kProviders) {
        for (const auto& ns : nameservers) {
            if (to_lower(ns).find(rule.needle) != std::string::npos) {
                return std::string(rule.name);
            }
        }
    }
    return std::nullopt;
}

std::expected<TcpResult, ProbeFailure> parse_curl_timing(std::string_view out) {
    auto body = trim_sv(out);
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::unexpected(parse_failure("timing output is not valid JSON", out));
    }

    auto dns = json_seconds(j, "dns");
    auto connect = json_seconds(j, "connect");
    auto ssl = json_seconds(j, "ssl");
    auto ttfb = json_seconds(j, "ttfb");
    auto total = json_seconds(j, "total");
    if (!dns || !connect || !ssl || !ttfb || !total) {
        return std::unexpected(parse_failure("timing output misses a phase timer", out));
    }

    TcpResult r;
    r.dns_ms = seconds_to_millis(*dns);
    r.connect_ms = seconds_to_millis(*connect);
    r.ssl_ms = seconds_to_millis(*ssl);
    r.ttfb_ms = seconds_to_millis(*ttfb);
    r.total_ms = seconds_to_millis(*total);

    if (auto it = j.find("http_code"); it != j.end()) {
        if (it->is_number_integer()) {
            r.http_code = it->get<int>();
        } else if (it->is_string()) {
            auto code = parse_number<int>(it->get_ref<const std::string&>());
            if (!code) {
                return std::unexpected(parse_failure("http_code is not a number", out));
            }
            r.http_code = *code;
        }
    }
    if (auto speed = json_seconds(j, "speed")) {
        r.download_speed_bps = *speed;
    }
    if (auto it = j.find("remote_ip"); it != j.end() && it->is_string()) {
        auto ip = it->get<std::string>();
        if (!ip.empty()) r.remote_ip = std::move(ip);
    }
    if (auto it = j.find("redirects"); it != j.end() && it->is_number_integer()) {
        r.redirect_count = it->get<int>();
    }

    derive_segments(r);
    return r;
}

void derive_segments(TcpResult& r) {
    r.anomalies.clear();
    r.connect_segment_ms = clamp_segment(r.connect_ms - r.dns_ms, "connect", r);

    // appconnect stays 0 without TLS; the request then starts after connect.
    std::int64_t request_start = r.connect_ms;
    if (r.ssl_ms > 0) {
        r.ssl_segment_ms = clamp_segment(r.ssl_ms - r.connect_ms, "ssl", r);
        request_start = r.ssl_ms;
    } else {
        r.ssl_segment_ms = 0;
    }

    r.ttfb_segment_ms = clamp_segment(r.ttfb_ms - request_start, "ttfb", r);
    r.transfer_segment_ms = clamp_segment(r.total_ms - r.ttfb_ms, "transfer", r);
}

std::expected<std::vector<RouteHop>, ProbeFailure> parse_traceroute(std::string_view out) {
    std::vector<RouteHop> hops;

    for (auto line : split_lines(out)) {
        auto f = split_ws(line);
        // Skips the "traceroute to ..." header and wrapped continuation lines.
        if (f.empty() || !all_digits(f[0])) continue;

        auto num = parse_number<int>(f[0]);
        if (!num) {
            return std::unexpected(parse_failure(std::format("bad hop number '{}'", f[0]), out));
        }
        if (!hops.empty() && *num <= hops.back().hop_number) {
            return std::unexpected(parse_failure(
                std::format("hop {} follows hop {}", *num, hops.back().hop_number), out));
        }

        RouteHop hop;
        hop.hop_number = *num;

        if (f.size() < 2 || f[1] == "*") {
            hop.packet_loss_percent = 100.0;
            hops.push_back(std::move(hop));
            continue;
        }

        std::size_t rtt_from = 2;
        if (is_ip_address(f[1])) {
            hop.ip_address = std::string(f[1]);
        } else if (f.size() > 2 && f[2].size() > 2 && f[2].front() == '(' && f[2].back() == ')' &&
                   is_ip_address(f[2].substr(1, f[2].size() - 2))) {
            hop.hostname = std::string(f[1]);
            hop.ip_address = std::string(f[2].substr(1, f[2].size() - 2));
            rtt_from = 3;
        } else {
            return std::unexpected(
                parse_failure(std::format("cannot read hop {} address '{}'", *num, f[1]), out));
        }

        for (std::size_t i = rtt_from; i + 1 < f.size(); ++i) {
            if (f[i + 1] != "ms") continue;
            auto rtt = parse_millis(f[i]);
            if (!rtt) {
                return std::unexpected(
                    parse_failure(std::format("bad RTT '{}' on hop {}", f[i], *num), out));
            }
            hop.rtt_ms = *rtt;
            break;
        }
        hops.push_back(std::move(hop));
    }

    if (hops.empty()) {
        return std::unexpected(parse_failure("no hops in traceroute output", out));
    }
    return hops;
}

std::vector<std::size_t> mark_bottlenecks(std::vector<RouteHop>& hops,
                                          std::int64_t delta_ms,
                                          std::int64_t ceiling_ms) {
    std::vector<std::size_t> flagged;
    std::optional<std::int64_t> prev;

    for (std::size_t i = 0; i < hops.size(); ++i) {
        auto& hop = hops[i];
        hop.is_bottleneck = false;
        if (!hop.ip_address || !hop.rtt_ms) continue;

        std::int64_t rtt = *hop.rtt_ms;
        if ((prev && rtt - *prev > delta_ms) || rtt > ceiling_ms) {
            hop.is_bottleneck = true;
            flagged.push_back(i);
        }
        prev = rtt;
    }
    return flagged;
}

std::expected<int, ProbeFailure> parse_http_code(std::string_view out) {
    auto t = trim_sv(out);
    if (t.size() != 3 || !all_digits(t)) {
        return std::unexpected(parse_failure(std::format("unexpected status '{}'", first_line(t)), out));
    }
    auto code = parse_number<int>(t);
    if (!code) {
        return std::unexpected(parse_failure("status is not a number", out));
    }
    return *code;
}

StabilityResult summarize_stability(std::vector<StabilitySample> samples) {
    StabilityResult r;
    r.total_tests = static_cast<int>(samples.size());

    std::vector<std::int64_t> times;
    times.reserve(samples.size());
    for (const auto& s : samples) {
        if (s.success) times.push_back(s.elapsed_ms);
    }
    r.successful_tests = static_cast<int>(times.size());
    r.success_rate = r.total_tests == 0
                         ? 0.0
                         : static_cast<double>(r.successful_tests) / r.total_tests * 100.0;

    if (!times.empty()) {
        auto [lo, hi] = std::ranges::minmax_element(times);
        r.min_time_ms = *lo;
        r.max_time_ms = *hi;
        r.avg_time_ms = std::accumulate(times.begin(), times.end(), std::int64_t{0}) /
                        static_cast<std::int64_t>(times.size());
        r.range_jitter_ms = r.max_time_ms - r.min_time_ms;
    }
    if (times.size() >= 2) {
        std::int64_t sum = 0;
        for (std::size_t i = 1; i < times.size(); ++i) {
            sum += times[i] > times[i - 1] ? times[i] - times[i - 1] : times[i - 1] - times[i];
        }
        r.mean_delta_jitter_ms = sum / static_cast<std::int64_t>(times.size() - 1);
    }

    r.samples = std::move(samples);
    return r;
}

}  // namespace pathprobe
