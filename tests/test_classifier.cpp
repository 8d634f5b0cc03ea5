/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include <gtest/gtest.h>

#include <algorithm>
#include <format>
#include <string>

#include "pathprobe/classifier.hpp"

using namespace pathprobe;

namespace {

ProbeSlot<DnsResult> fast_dns() {
    DnsResult d;
    d.domain = "example.com";
    d.resolved_ips = {"93.184.216.34"};
    d.lookup_time_ms = 20;
    return d;
}

TcpResult fast_tcp() {
    TcpResult t;
    t.dns_ms = 20;
    t.connect_ms = 60;
    t.ssl_ms = 120;
    t.ttfb_ms = 250;
    t.total_ms = 300;
    t.connect_segment_ms = 40;
    t.ssl_segment_ms = 60;
    t.ttfb_segment_ms = 130;
    t.transfer_segment_ms = 50;
    t.http_code = 200;
    return t;
}

RoutingResult clean_route(int hop_count = 6) {
    RoutingResult r;
    r.target_ip = "93.184.216.34";
    for (int i = 1; i <= hop_count; ++i) {
        RouteHop h;
        h.hop_number = i;
        h.ip_address = std::format("10.0.0.{}", i);
        h.rtt_ms = i * 2;
        r.hops.push_back(h);
    }
    r.total_hops = hop_count;
    return r;
}

StabilityResult steady(int total = 10, int ok = 10, std::int64_t jitter = 5) {
    StabilityResult s;
    s.total_tests = total;
    s.successful_tests = ok;
    s.success_rate = total == 0 ? 0.0 : static_cast<double>(ok) / total * 100.0;
    s.mean_delta_jitter_ms = jitter;
    return s;
}

ProbeFailure failure(ProbeError kind, std::string message) {
    return ProbeFailure{kind, std::move(message), "", ""};
}

bool has_issue(const Analysis& a, IssueSeverity severity, std::string_view title_part) {
    return std::ranges::any_of(a.issues, [&](const Issue& i) {
        return i.severity == severity && i.title.find(title_part) != std::string::npos;
    });
}

}  // namespace

TEST(Grade, BandsAreExclusiveUpperBounds) {
    Band b{100, 200};
    EXPECT_EQ(grade(99, b), Grade::Good);
    EXPECT_EQ(grade(100, b), Grade::Acceptable);
    EXPECT_EQ(grade(199, b), Grade::Acceptable);
    EXPECT_EQ(grade(200, b), Grade::Slow);
}

TEST(Grade, ScoreBands) {
    EXPECT_EQ(band_for(100), OverallStatus::Excellent);
    EXPECT_EQ(band_for(92), OverallStatus::Excellent);
    EXPECT_EQ(band_for(89), OverallStatus::Good);
    EXPECT_EQ(band_for(60), OverallStatus::Acceptable);
    EXPECT_EQ(band_for(25), OverallStatus::Poor);
    EXPECT_EQ(band_for(10), OverallStatus::Failed);
}

TEST(Classify, HealthyTargetIsExcellent) {
    auto a = classify(fast_dns(), fast_tcp(), clean_route(), steady());
    EXPECT_EQ(a.score, 100);
    EXPECT_EQ(a.overall_status, OverallStatus::Excellent);
    EXPECT_TRUE(a.issues.empty());
    EXPECT_TRUE(a.recommendations.empty());
}

TEST(Classify, DnsFailureIsHardFailure) {
    ProbeSlot<DnsResult> dns = std::unexpected(failure(ProbeError::NetworkUnreachable, "NXDOMAIN"));
    auto a = classify(dns, std::nullopt, std::nullopt, std::nullopt);
    EXPECT_EQ(a.score, 0);
    EXPECT_EQ(a.overall_status, OverallStatus::Failed);
    ASSERT_EQ(a.issues.size(), 1u);
    EXPECT_EQ(a.issues[0].category, IssueCategory::Dns);
    EXPECT_EQ(a.issues[0].severity, IssueSeverity::Error);
    EXPECT_FALSE(a.recommendations.empty());
}

TEST(Classify, MissingDnsResultIsHardFailure) {
    auto a = classify(std::nullopt, fast_tcp(), clean_route(), steady());
    EXPECT_EQ(a.overall_status, OverallStatus::Failed);
    EXPECT_EQ(a.score, 0);
}

TEST(Classify, ConnectionFailureIsHardFailure) {
    auto a = classify(fast_dns(), std::unexpected(failure(ProbeError::Timeout, "curl timed out")),
                      clean_route(), steady());
    EXPECT_EQ(a.overall_status, OverallStatus::Failed);
    EXPECT_TRUE(has_issue(a, IssueSeverity::Error, "Cannot connect"));

    auto no_response = fast_tcp();
    no_response.http_code = 0;
    auto b = classify(fast_dns(), no_response, clean_route(), steady());
    EXPECT_EQ(b.overall_status, OverallStatus::Failed);
}

TEST(Classify, EveryStabilityRequestFailing) {
    auto a = classify(fast_dns(), fast_tcp(), clean_route(), steady(10, 0));
    EXPECT_EQ(a.overall_status, OverallStatus::Failed);
    EXPECT_TRUE(has_issue(a, IssueSeverity::Error, "Every request failed"));
}

TEST(Classify, SlowTimingsDeductPerMetric) {
    auto tcp = fast_tcp();
    tcp.connect_segment_ms = 700;  // slow: -15
    tcp.ssl_segment_ms = 350;      // acceptable: -5
    tcp.ttfb_ms = 1200;            // slow: -15
    tcp.total_ms = 1500;           // acceptable: -5
    auto a = classify(fast_dns(), tcp, clean_route(), steady());
    EXPECT_EQ(a.score, 60);
    EXPECT_EQ(a.overall_status, OverallStatus::Acceptable);
    EXPECT_TRUE(has_issue(a, IssueSeverity::Warning, "Slow TCP connect"));
    EXPECT_TRUE(has_issue(a, IssueSeverity::Info, "TLS handshake is acceptable"));
}

TEST(Classify, PlainHttpSkipsTlsGrading) {
    auto tcp = fast_tcp();
    tcp.ssl_ms = 0;
    tcp.ssl_segment_ms = 900;
    auto a = classify(fast_dns(), tcp, clean_route(), steady());
    EXPECT_EQ(a.score, 100);
}

TEST(Classify, HttpErrors) {
    auto client = fast_tcp();
    client.http_code = 404;
    auto a = classify(fast_dns(), client, clean_route(), steady());
    EXPECT_EQ(a.score, 90);
    ASSERT_EQ(a.issues.size(), 1u);
    EXPECT_EQ(a.issues[0].title, "HTTP error 404");
    EXPECT_EQ(a.recommendations, (std::vector<std::string>{"Check that the URL is correct"}));

    auto server = fast_tcp();
    server.http_code = 503;
    auto b = classify(fast_dns(), server, clean_route(), steady());
    EXPECT_EQ(b.score, 80);
    EXPECT_TRUE(has_issue(b, IssueSeverity::Error, "HTTP error 503"));
}

TEST(Classify, BottleneckDeductionIsCapped) {
    auto route = clean_route(8);
    for (std::size_t i : {1u, 2u, 3u, 4u, 5u}) {
        route.hops[i].is_bottleneck = true;
        route.bottleneck_hops.push_back(i);
    }
    auto a = classify(fast_dns(), fast_tcp(), route, steady());
    EXPECT_EQ(std::ranges::count_if(a.issues, [](const Issue& i) {
                  return i.title.starts_with("Bottleneck");
              }),
              5);
    EXPECT_EQ(a.score, 85);
}

TEST(Classify, RouteShape) {
    auto route = clean_route(22);
    for (int i = 0; i < 8; ++i) {
        route.hops[i].ip_address.reset();
        route.hops[i].rtt_ms.reset();
    }
    route.unresponsive_hops = 8;
    auto a = classify(fast_dns(), fast_tcp(), route, steady());
    EXPECT_TRUE(has_issue(a, IssueSeverity::Info, "Many hops do not respond"));
    EXPECT_TRUE(has_issue(a, IssueSeverity::Info, "Long route"));
    // Unresponsive hops alone cost nothing.
    EXPECT_EQ(a.score, 95);
}

TEST(Classify, RoutingFailureIsNotFatal) {
    auto a = classify(fast_dns(), fast_tcp(),
                      std::unexpected(failure(ProbeError::ToolUnavailable, "traceroute is not available")),
                      steady());
    EXPECT_EQ(a.score, 95);
    EXPECT_EQ(a.overall_status, OverallStatus::Excellent);
    EXPECT_TRUE(has_issue(a, IssueSeverity::Warning, "Route trace failed"));
    EXPECT_EQ(a.issues[0].solutions.front(), "Install traceroute and run the diagnostic again");
}

TEST(Classify, StabilityDegradation) {
    auto degraded = classify(fast_dns(), fast_tcp(), clean_route(), steady(10, 9));
    EXPECT_EQ(degraded.score, 90);
    EXPECT_TRUE(has_issue(degraded, IssueSeverity::Warning, "Some requests failed"));

    auto poor = classify(fast_dns(), fast_tcp(), clean_route(), steady(10, 7));
    EXPECT_EQ(poor.score, 70);
    EXPECT_TRUE(has_issue(poor, IssueSeverity::Error, "Unstable connection"));

    auto jittery = classify(fast_dns(), fast_tcp(), clean_route(), steady(10, 10, 150));
    EXPECT_EQ(jittery.score, 95);
    EXPECT_TRUE(has_issue(jittery, IssueSeverity::Warning, "High jitter"));
}

TEST(Classify, CancelledProbesAddNoIssue) {
    auto cancelled = failure(ProbeError::Cancelled, "cancelled");
    auto a = classify(fast_dns(), fast_tcp(), std::unexpected(cancelled), std::unexpected(cancelled));
    EXPECT_TRUE(a.issues.empty());
    EXPECT_EQ(a.score, 100);
}

TEST(Classify, HeavyDeductionsReachFailedBand) {
    auto tcp = fast_tcp();
    tcp.connect_segment_ms = 900;
    tcp.ssl_segment_ms = 900;
    tcp.ttfb_ms = 2000;
    tcp.total_ms = 4000;
    tcp.http_code = 500;
    DnsResult dns = *fast_dns().value();
    dns.lookup_time_ms = 400;
    auto a = classify(dns, tcp, clean_route(), steady(10, 7, 300));
    // 10 + 15 + 10 + 15 + 15 + 20 + 30 + 5
    EXPECT_EQ(a.score, 0);
    EXPECT_EQ(a.overall_status, OverallStatus::Failed);
}

TEST(Classify, RecommendationsAreDeduplicated) {
    auto a = classify(fast_dns(), std::unexpected(failure(ProbeError::Timeout, "curl timed out")),
                      clean_route(), steady(10, 7));
    auto isp = std::ranges::count(a.recommendations,
                                  std::string("Contact your ISP if the problem persists"));
    EXPECT_EQ(isp, 1);
    EXPECT_EQ(a.recommendations.front(), "Open the site in a browser to confirm it is up");
}

TEST(Classify, NotesCarryProviderAndAnomalies) {
    DnsResult dns = *fast_dns().value();
    dns.provider = "Cloudflare";
    dns.notes = {"TTL lookup failed: timed out"};
    auto tcp = fast_tcp();
    tcp.anomalies = {"ssl segment was negative (-3 ms), clamped to 0"};
    auto a = classify(dns, tcp, clean_route(), steady());
    EXPECT_EQ(a.notes.size(), 3u);
    EXPECT_EQ(a.notes[0], "DNS is served by Cloudflare");
}

TEST(Advice, FirstMatchingRowWins) {
    auto missing = lookup_advice(IssueKind::DnsFailure, RuleContext{ProbeError::ToolUnavailable, "", 0});
    ASSERT_FALSE(missing.causes.empty());
    EXPECT_EQ(missing.causes[0], "dig is not installed");

    auto tls = lookup_advice(IssueKind::TcpFailure,
                             RuleContext{ProbeError::NetworkUnreachable, "SSL certificate problem", 0});
    EXPECT_NE(tls.solutions[0].find("openssl"), std::string::npos);

    auto limited = lookup_advice(IssueKind::HttpClientError, RuleContext{std::nullopt, "", 429});
    EXPECT_EQ(limited.solutions[0], "Wait before retrying");

    auto fallback = lookup_advice(IssueKind::HttpClientError, RuleContext{std::nullopt, "", 418});
    EXPECT_EQ(fallback.solutions[0], "Check that the URL is correct");
}
