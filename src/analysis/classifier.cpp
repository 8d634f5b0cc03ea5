/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "pathprobe/classifier.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace pathprobe {

namespace {

constexpr int kBottleneckDeduction = 5;
constexpr int kBottleneckCap = 15;

// Collects issues and deductions in detection order.
class Findings {
    Analysis& out_;
    int deductions_ = 0;
    bool hard_failure_ = false;

   public:
    explicit Findings(Analysis& out) : out_(out) {}

    void add(IssueKind kind, IssueCategory category, IssueSeverity severity,
             std::string title, std::string description, int deduction,
             const RuleContext& ctx = {}) {
        auto advice = lookup_advice(kind, ctx);
        out_.issues.push_back(Issue{category, severity, std::move(title), std::move(description),
                                    std::move(advice.causes), std::move(advice.solutions)});
        deductions_ += deduction;
    }

    void fail() {
        hard_failure_ = true;
    }

    void note(std::string text) {
        out_.notes.push_back(std::move(text));
    }

    [[nodiscard]] int deductions() const {
        return deductions_;
    }

    [[nodiscard]] bool hard_failure() const {
        return hard_failure_;
    }
};

bool cancelled(const ProbeFailure& f) {
    return f.kind == ProbeError::Cancelled;
}

RuleContext context_of(const ProbeFailure& f) {
    return RuleContext{f.kind, f.message, 0};
}

// One graded timing metric: info issue when acceptable, warning when slow.
struct TimingRule {
    IssueKind acceptable;
    IssueKind slow;
    IssueCategory category;
    std::string_view label;
    int acceptable_deduction;
    int slow_deduction;
};

void grade_timing(Findings& f, const TimingRule& rule, std::int64_t ms, Band band) {
    switch (grade(ms, band)) {
        case Grade::Good:
            return;
        case Grade::Acceptable:
            f.add(rule.acceptable, rule.category, IssueSeverity::Info,
                  std::format("{} is acceptable", rule.label),
                  std::format("{}: {} ms (good is under {} ms)", rule.label, ms, band.good),
                  rule.acceptable_deduction);
            return;
        case Grade::Slow:
            f.add(rule.slow, rule.category, IssueSeverity::Warning,
                  std::format("Slow {}", rule.label),
                  std::format("{}: {} ms (should be under {} ms)", rule.label, ms, band.acceptable),
                  rule.slow_deduction);
            return;
    }
}

void classify_dns(Findings& f, const ProbeSlot<DnsResult>& dns, const Thresholds& th) {
    if (!dns) {
        f.add(IssueKind::DnsFailure, IssueCategory::Dns, IssueSeverity::Error,
              "DNS was not resolved", "The DNS lookup did not run", 0);
        f.fail();
        return;
    }
    if (!*dns) {
        const auto& err = dns->error();
        if (!cancelled(err)) {
            f.add(IssueKind::DnsFailure, IssueCategory::Dns, IssueSeverity::Error,
                  "Cannot resolve DNS", err.message, 0, context_of(err));
        }
        f.fail();
        return;
    }

    const auto& d = **dns;
    if (d.resolved_ips.empty()) {
        f.add(IssueKind::DnsFailure, IssueCategory::Dns, IssueSeverity::Error,
              "Cannot resolve DNS", std::format("No IP address found for {}", d.domain), 0);
        f.fail();
        return;
    }

    grade_timing(f, {IssueKind::DnsAcceptable, IssueKind::DnsSlow, IssueCategory::Dns,
                     "DNS lookup", 5, 10},
                 d.lookup_time_ms, th.dns);

    if (d.provider) {
        f.note(std::format("DNS is served by {}", *d.provider));
    }
    for (const auto& n : d.notes) f.note(n);
}

void classify_tcp(Findings& f, const ProbeSlot<TcpResult>& tcp, const Thresholds& th) {
    if (!tcp) return;
    if (!*tcp) {
        const auto& err = tcp->error();
        if (cancelled(err)) return;
        f.add(IssueKind::TcpFailure, IssueCategory::Tcp, IssueSeverity::Error,
              "Cannot connect", err.message, 0, context_of(err));
        f.fail();
        return;
    }

    const auto& t = **tcp;
    if (t.http_code == 0) {
        f.add(IssueKind::TcpFailure, IssueCategory::Tcp, IssueSeverity::Error,
              "Cannot connect", "The connection failed without an HTTP response", 0);
        f.fail();
        return;
    }

    grade_timing(f, {IssueKind::ConnectAcceptable, IssueKind::ConnectSlow, IssueCategory::Tcp,
                     "TCP connect", 5, 15},
                 t.connect_segment_ms, th.connect);
    if (t.ssl_ms > 0) {
        grade_timing(f, {IssueKind::SslAcceptable, IssueKind::SslSlow, IssueCategory::Ssl,
                         "TLS handshake", 5, 10},
                     t.ssl_segment_ms, th.ssl);
    }
    grade_timing(f, {IssueKind::TtfbAcceptable, IssueKind::TtfbSlow, IssueCategory::Http,
                     "time to first byte", 5, 15},
                 t.ttfb_ms, th.ttfb);
    grade_timing(f, {IssueKind::TotalAcceptable, IssueKind::TotalSlow, IssueCategory::Http,
                     "total load time", 5, 15},
                 t.total_ms, th.total);

    RuleContext ctx{std::nullopt, {}, t.http_code};
    if (t.http_code >= 400 && t.http_code < 500) {
        f.add(IssueKind::HttpClientError, IssueCategory::Http, IssueSeverity::Warning,
              std::format("HTTP error {}", t.http_code),
              "The server returned a client-side error", 10, ctx);
    } else if (t.http_code >= 500) {
        f.add(IssueKind::HttpServerError, IssueCategory::Http, IssueSeverity::Error,
              std::format("HTTP error {}", t.http_code),
              "The server reported an internal error", 20, ctx);
    }

    for (const auto& a : t.anomalies) {
        f.note(std::format("Timing anomaly: {}", a));
    }
}

void classify_routing(Findings& f, const ProbeSlot<RoutingResult>& routing, const Thresholds& th) {
    if (!routing) return;
    if (!*routing) {
        const auto& err = routing->error();
        if (cancelled(err)) return;
        f.add(IssueKind::RoutingFailure, IssueCategory::Routing, IssueSeverity::Warning,
              "Route trace failed", err.message, 5, context_of(err));
        return;
    }

    const auto& r = **routing;
    int budget = kBottleneckCap;
    for (auto idx : r.bottleneck_hops) {
        const auto& hop = r.hops.at(idx);
        int deduction = std::min(kBottleneckDeduction, budget);
        budget -= deduction;
        f.add(IssueKind::BottleneckHop, IssueCategory::Routing, IssueSeverity::Warning,
              std::format("Bottleneck at hop {}", hop.hop_number),
              std::format("Hop {} ({}) answers in {} ms",
                          hop.hop_number,
                          hop.ip_address.value_or("*"),
                          hop.rtt_ms.value_or(0)),
              deduction);
    }

    if (!r.hops.empty()) {
        double ratio = static_cast<double>(r.unresponsive_hops) / static_cast<double>(r.hops.size());
        if (ratio > th.unresponsive_ratio) {
            f.add(IssueKind::ManyUnresponsiveHops, IssueCategory::Routing, IssueSeverity::Info,
                  "Many hops do not respond",
                  std::format("{:.0f}% of the traced hops did not respond", ratio * 100.0), 0);
        }
    }
    if (r.total_hops > th.many_hops) {
        f.add(IssueKind::ManyHops, IssueCategory::Routing, IssueSeverity::Info,
              "Long route", std::format("{} hops to the destination", r.total_hops), 5);
    }
    for (const auto& n : r.notes) f.note(n);
}

void classify_stability(Findings& f, const ProbeSlot<StabilityResult>& stability, const Thresholds& th) {
    if (!stability) return;
    if (!*stability) {
        const auto& err = stability->error();
        if (cancelled(err)) return;
        f.add(IssueKind::StabilityFailure, IssueCategory::Stability, IssueSeverity::Warning,
              "Stability test incomplete", err.message, 10, context_of(err));
        return;
    }

    const auto& s = **stability;
    for (const auto& n : s.notes) f.note(n);
    if (s.total_tests > 0 && s.success_rate == 0.0) {
        f.add(IssueKind::StabilityDown, IssueCategory::Stability, IssueSeverity::Error,
              "Every request failed",
              std::format("0 of {} requests succeeded", s.total_tests), 0);
        f.fail();
        return;
    }
    if (s.success_rate < th.stability_warning_rate) {
        f.add(IssueKind::StabilityPoor, IssueCategory::Stability, IssueSeverity::Error,
              "Unstable connection",
              std::format("Only {:.0f}% of requests succeeded", s.success_rate), 30);
    } else if (s.success_rate < 100.0) {
        f.add(IssueKind::StabilityDegraded, IssueCategory::Stability, IssueSeverity::Warning,
              "Some requests failed",
              std::format("Success rate: {:.0f}%", s.success_rate), 10);
    }

    if (s.mean_delta_jitter_ms > th.jitter_ms) {
        f.add(IssueKind::HighJitter, IssueCategory::Stability, IssueSeverity::Warning,
              "High jitter",
              std::format("Response time varies by {} ms between consecutive requests",
                          s.mean_delta_jitter_ms),
              5);
    }
}

}  // namespace

Grade grade(std::int64_t ms, Band band) noexcept {
    if (ms < band.good) return Grade::Good;
    if (ms < band.acceptable) return Grade::Acceptable;
    return Grade::Slow;
}

std::string_view to_string(Grade g) noexcept {
    switch (g) {
        case Grade::Good:
            return "Good";
        case Grade::Acceptable:
            return "Acceptable";
        case Grade::Slow:
            return "Slow";
    }
    return "Unknown";
}

OverallStatus band_for(int score) noexcept {
    if (score >= 90) return OverallStatus::Excellent;
    if (score >= 75) return OverallStatus::Good;
    if (score >= 50) return OverallStatus::Acceptable;
    if (score >= 25) return OverallStatus::Poor;
    return OverallStatus::Failed;
}

Analysis classify(const ProbeSlot<DnsResult>& dns,
                  const ProbeSlot<TcpResult>& tcp,
                  const ProbeSlot<RoutingResult>& routing,
                  const ProbeSlot<StabilityResult>& stability,
                  const Thresholds& thresholds) {
    Analysis out;
    Findings f(out);

    classify_dns(f, dns, thresholds);
    classify_tcp(f, tcp, thresholds);
    classify_routing(f, routing, thresholds);
    classify_stability(f, stability, thresholds);

    if (f.hard_failure()) {
        out.score = 0;
        out.overall_status = OverallStatus::Failed;
    } else {
        out.score = std::clamp(100 - f.deductions(), 0, 100);
        out.overall_status = band_for(out.score);
    }

    for (const auto& issue : out.issues) {
        for (const auto& s : issue.solutions) {
            if (std::ranges::find(out.recommendations, s) == out.recommendations.end()) {
                out.recommendations.push_back(s);
            }
        }
    }
    return out;
}

}  // namespace pathprobe
