/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "pathprobe/cli_renderer.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <iostream>
#include <print>
#include <string>
#include <string_view>

#include "pathprobe/classifier.hpp"
#include "pathprobe/color.hpp"
#include "pathprobe/config.hpp"
#include "pathprobe/utils.hpp"

namespace pathprobe::CliRenderer {

namespace {

constexpr int kLabelWidth = Config::APP_INFO_LABEL_WIDTH;

std::string_view status_color(OverallStatus status) {
    switch (status) {
        case OverallStatus::Excellent:
        case OverallStatus::Good:
            return Color::GREEN;
        case OverallStatus::Acceptable:
            return Color::YELLOW;
        case OverallStatus::Poor:
        case OverallStatus::Failed:
            return Color::RED;
    }
    return Color::RESET;
}

std::string_view severity_color(IssueSeverity severity) {
    switch (severity) {
        case IssueSeverity::Info:
            return Color::CYAN;
        case IssueSeverity::Warning:
            return Color::YELLOW;
        case IssueSeverity::Error:
            return Color::RED;
    }
    return Color::RESET;
}

std::string_view grade_color(Grade g) {
    switch (g) {
        case Grade::Good:
            return Color::GREEN;
        case Grade::Acceptable:
            return Color::YELLOW;
        case Grade::Slow:
            return Color::RED;
    }
    return Color::RESET;
}

void section(std::string_view title) {
    std::println("\n -> {}", Color::colorize(title, Color::BOLD));
}

void field(std::string_view label, std::string_view value) {
    std::println(" {:<{}} : {}", label, kLabelWidth, value);
}

void failure_section(std::string_view title, const ProbeFailure& f) {
    section(title);
    field("Error", Color::colorize(std::format("{} ({})", f.message, to_string(f.kind)), Color::RED));
    if (!f.recommendation.empty()) {
        field("Suggestion", f.recommendation);
    }
}

std::string join(const std::vector<std::string>& items, std::string_view sep) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += sep;
        out += item;
    }
    return out;
}

void render_summary(const DiagnosticReport& r) {
    print_centered_header("Executive Summary");
    auto status = std::string(to_string(r.overall_status));
    std::ranges::transform(status, status.begin(), [](unsigned char c) { return std::toupper(c); });

    field("Target", Color::colorize(r.target_url, Color::CYAN));
    field("Checked at", r.timestamp);
    field("Score", Color::colorize(std::format("{}/100", r.score), status_color(r.overall_status)));
    field("Status", Color::colorize(status, status_color(r.overall_status)));

    auto count = [&](IssueSeverity s) {
        return std::ranges::count_if(r.issues, [s](const Issue& i) { return i.severity == s; });
    };
    field("Issues",
          std::format("{} error(s), {} warning(s), {} info",
                      Color::colorize(std::to_string(count(IssueSeverity::Error)), Color::RED),
                      Color::colorize(std::to_string(count(IssueSeverity::Warning)), Color::YELLOW),
                      Color::colorize(std::to_string(count(IssueSeverity::Info)), Color::CYAN)));
    field("Duration", std::format("{:.1f} s", static_cast<double>(r.duration_ms) / 1000.0));
    if (r.cancelled) {
        field("Run", Color::colorize("cancelled, results are incomplete", Color::YELLOW));
    }
}

void render_dns(const DiagnosticReport& r) {
    if (!r.dns) return;
    if (!*r.dns) {
        failure_section("DNS", r.dns->error());
        return;
    }
    const auto& d = **r.dns;
    section("DNS");
    field("Addresses", Color::colorize(join(d.resolved_ips, ", "), Color::CYAN));
    field("Lookup time", std::format("{} ms", d.lookup_time_ms));
    field("TTL", d.ttl ? std::format("{} s", *d.ttl) : std::string("-"));
    field("Nameservers", d.nameservers.empty() ? std::string("-") : join(d.nameservers, ", "));
    if (d.provider) field("Provider", Color::colorize(*d.provider, Color::GREEN));
}

void render_timing(const DiagnosticReport& r) {
    if (!r.tcp) return;
    if (!*r.tcp) {
        failure_section("Connection Timing", r.tcp->error());
        return;
    }
    const auto& t = **r.tcp;
    Thresholds th;
    section("Connection Timing");
    std::println(" {:<{}}   {:>10}   {}", "Phase", kLabelWidth, "Time", "Rating");

    auto row = [&](std::string_view label, std::int64_t ms, Band band) {
        auto g = grade(ms, band);
        std::println(" {:<{}}   {:>10}   {}",
                     label, kLabelWidth,
                     std::format("{} ms", ms),
                     Color::colorize(to_string(g), grade_color(g)));
    };
    row("DNS lookup", t.dns_ms, th.dns);
    row("TCP connect", t.connect_segment_ms, th.connect);
    if (t.ssl_ms > 0) row("TLS handshake", t.ssl_segment_ms, th.ssl);
    row("Time to first byte", t.ttfb_ms, th.ttfb);
    row("Total", t.total_ms, th.total);

    field("HTTP status", std::to_string(t.http_code));
    if (t.redirect_count > 0) field("Redirects", std::to_string(t.redirect_count));
    if (t.remote_ip) field("Remote IP", *t.remote_ip);
    field("Download speed", std::format("{:.1f} KB/s", t.download_speed_bps / 1024.0));
}

void render_route(const DiagnosticReport& r) {
    if (!r.routing) return;
    if (!*r.routing) {
        failure_section("Route", r.routing->error());
        return;
    }
    const auto& route = **r.routing;
    section(std::format("Route to {}", route.target_ip));
    std::println(" {:>3}  {:<18} {:>8}  {}", "Hop", "Address", "RTT", "");
    for (const auto& hop : route.hops) {
        if (!hop.ip_address) {
            std::println(" {:>3}  {}", hop.hop_number, Color::colorize("* (no reply)", Color::GRAY));
            continue;
        }
        std::string rtt = hop.rtt_ms ? std::format("{} ms", *hop.rtt_ms) : "-";
        std::println(" {:>3}  {:<18} {:>8}  {}",
                     hop.hop_number,
                     *hop.ip_address,
                     rtt,
                     hop.is_bottleneck ? Color::colorize("bottleneck", Color::RED) : "");
    }
    field("Hops", std::format("{} ({} unresponsive)", route.total_hops, route.unresponsive_hops));
}

void render_stability(const DiagnosticReport& r) {
    if (!r.stability) return;
    if (!*r.stability) {
        failure_section("Stability", r.stability->error());
        return;
    }
    const auto& s = **r.stability;
    section("Stability");
    auto rate_color = s.success_rate >= 100.0 ? Color::GREEN
                      : s.success_rate >= 80.0 ? Color::YELLOW
                                               : Color::RED;
    field("Success rate",
          Color::colorize(std::format("{:.0f}% ({}/{})", s.success_rate, s.successful_tests, s.total_tests),
                          rate_color));
    if (s.successful_tests > 0) {
        field("Min / Avg / Max",
              std::format("{} / {} / {} ms", s.min_time_ms, s.avg_time_ms, s.max_time_ms));
        field("Range jitter", std::format("{} ms", s.range_jitter_ms));
        field("Mean-delta jitter", std::format("{} ms", s.mean_delta_jitter_ms));
        field("Assessment", jitter_assessment(s.mean_delta_jitter_ms));
    }
}

void render_issues(const DiagnosticReport& r) {
    section("Issues");
    if (r.issues.empty()) {
        std::println(" {}", Color::colorize("No issues detected.", Color::GREEN));
        return;
    }
    for (const auto& issue : r.issues) {
        std::string tag = std::format("[{}]", to_string(issue.severity));
        std::println(" {} {} ({})",
                     Color::colorize(tag, severity_color(issue.severity)),
                     Color::colorize(issue.title, Color::BOLD),
                     to_string(issue.category));
        std::println("     {}", issue.description);
        for (const auto& cause : issue.possible_causes) {
            std::println("     - {}", Color::colorize(cause, Color::GRAY));
        }
    }
}

void render_recommendations(const DiagnosticReport& r) {
    if (r.recommendations.empty()) return;
    section("Recommendations");
    int n = 0;
    for (const auto& rec : r.recommendations) {
        std::println(" {:>2}. {}", ++n, rec);
    }
}

}  // namespace

std::string status_tag(StepStatus status) {
    switch (status) {
        case StepStatus::Pending:
            return Color::colorize("[WAIT]", Color::GRAY);
        case StepStatus::Running:
            return Color::colorize("[ .. ]", Color::BLUE);
        case StepStatus::Success:
            return Color::colorize("[ OK ]", Color::GREEN);
        case StepStatus::Warning:
            return Color::colorize("[WARN]", Color::YELLOW);
        case StepStatus::Error:
            return Color::colorize("[FAIL]", Color::RED);
    }
    return "[????]";
}

std::string_view step_label(StepId id) {
    switch (id) {
        case StepId::Dns:
            return "DNS";
        case StepId::Tcp:
            return "TCP";
        case StepId::Ssl:
            return "TLS";
        case StepId::Http:
            return "HTTP";
        case StepId::Routing:
            return "Routing";
        case StepId::Stability:
            return "Stability";
    }
    return "?";
}

std::string jitter_assessment(std::int64_t mean_delta_jitter_ms) {
    if (mean_delta_jitter_ms < 30) return Color::colorize("Stable", Color::GREEN);
    if (mean_delta_jitter_ms <= 100) return Color::colorize("Moderate variation", Color::YELLOW);
    return Color::colorize("Unstable, high variation", Color::RED);
}

void render_event(const ProgressEvent& event) {
    std::println(" {} {:<10} {}", status_tag(event.status), step_label(event.step), event.message);
    std::cout << std::flush;
}

void render_report(const DiagnosticReport& report) {
    std::println("");
    render_summary(report);
    render_dns(report);
    render_timing(report);
    render_route(report);
    render_stability(report);
    render_issues(report);
    render_recommendations(report);

    if (!report.notes.empty()) {
        section("Notes");
        for (const auto& note : report.notes) {
            std::println(" * {}", note);
        }
    }
    if (report.capture_dir) {
        std::println("");
        field("Raw output saved to", Color::colorize(*report.capture_dir, Color::CYAN));
    }
    print_line();
}

}  // namespace pathprobe::CliRenderer
