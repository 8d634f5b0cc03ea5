/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <map>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "pathprobe/pipeline.hpp"
#include "pathprobe/report_json.hpp"
#include "scripted_capability.hpp"

using namespace pathprobe;
using namespace pathprobe::test;

namespace {

constexpr std::string_view kTimingOk =
    R"({"dns": 0.040, "connect": 0.080, "ssl": 0.150, "ttfb": 0.300, "total": 0.350, )"
    R"("http_code": "200", "speed": 48000, "remote_ip": "93.184.216.34", "redirects": 0})";

constexpr std::string_view kRouteOk =
    "traceroute to 93.184.216.34 (93.184.216.34), 15 hops max, 60 byte packets\n"
    " 1  192.168.1.1  1.100 ms\n"
    " 2  10.10.0.1  4.200 ms\n"
    " 3  10.20.0.1  6.000 ms\n"
    " 4  72.14.215.85  9.300 ms\n"
    " 5  108.170.252.1  11.700 ms\n"
    " 6  142.250.61.1  14.000 ms\n"
    " 7  152.195.64.1  17.900 ms\n"
    " 8  93.184.216.34  18.200 ms\n";

void script_dns(ScriptedCapability& cap) {
    cap.on("dns_a", output("93.184.216.34\n", 40));
    cap.on("dns_ttl", output("example.com.\t\t3600\tIN\tA\t93.184.216.34\n", 30));
    cap.on("dns_ns", output("a.iana-servers.net.\nb.iana-servers.net.\n", 30));
}

void script_healthy(ScriptedCapability& cap) {
    script_dns(cap);
    cap.on("curl_timing", output(std::string(kTimingOk), 350));
    cap.on("traceroute", output(std::string(kRouteOk), 2100));
    cap.on("stability_", output("200", 50));
}

PipelineOptions fast_options(int samples = 5) {
    PipelineOptions opts;
    opts.stability.samples = samples;
    opts.stability.pause = std::chrono::milliseconds(0);
    return opts;
}

DiagnosticRequest request_for(std::string_view target) {
    auto req = make_request(target);
    if (!req) throw std::invalid_argument(req.error());
    return *req;
}

// Drains a subscription on its own thread, like the terminal printer does.
class EventRecorder {
    std::vector<ProgressEvent> events_;
    std::jthread thread_;

   public:
    explicit EventRecorder(EventChannel& channel)
        : thread_([this, sub = channel.subscribe()]() mutable {
              while (auto ev = sub.next()) events_.push_back(std::move(*ev));
          }) {}

    const std::vector<ProgressEvent>& finish() {
        if (thread_.joinable()) thread_.join();
        return events_;
    }
};

}  // namespace

TEST(Pipeline, HealthyTargetIsExcellent) {
    ScriptedCapability cap;
    script_healthy(cap);
    EventChannel channel;
    EventRecorder recorder(channel);

    Pipeline pipeline(cap, channel, fast_options(10));
    auto report = pipeline.run(request_for("example.com"));
    const auto& events = recorder.finish();

    EXPECT_EQ(pipeline.state(), PipelineState::Done);
    EXPECT_EQ(report.overall_status, OverallStatus::Excellent);
    EXPECT_EQ(report.score, 100);
    EXPECT_TRUE(report.issues.empty());
    EXPECT_FALSE(report.cancelled);

    ASSERT_TRUE(report.dns && report.dns->has_value());
    EXPECT_EQ((*report.dns)->ttl, 3600u);
    EXPECT_EQ((*report.dns)->nameservers.size(), 2u);

    ASSERT_TRUE(report.tcp && report.tcp->has_value());
    EXPECT_EQ((*report.tcp)->http_code, 200);
    EXPECT_EQ((*report.tcp)->ssl_segment_ms, 70);

    ASSERT_TRUE(report.routing && report.routing->has_value());
    EXPECT_EQ((*report.routing)->total_hops, 8);
    EXPECT_TRUE((*report.routing)->bottleneck_hops.empty());

    ASSERT_TRUE(report.stability && report.stability->has_value());
    EXPECT_EQ((*report.stability)->total_tests, 10);
    EXPECT_DOUBLE_EQ((*report.stability)->success_rate, 100.0);
    EXPECT_EQ((*report.stability)->avg_time_ms, 50);

    for (auto id : kAllSteps) {
        ASSERT_NE(report.step(id), nullptr);
        EXPECT_EQ(report.step(id)->status, StepStatus::Success) << to_string(id);
        EXPECT_TRUE(report.step(id)->duration_ms.has_value());
    }
    EXPECT_FALSE(events.empty());
    EXPECT_TRUE(channel.closed());
}

TEST(Pipeline, EventsNeverRegressPerStep) {
    ScriptedCapability cap;
    script_healthy(cap);
    EventChannel channel;
    EventRecorder recorder(channel);

    Pipeline pipeline(cap, channel, fast_options());
    pipeline.run(request_for("example.com"));
    const auto& events = recorder.finish();

    std::map<StepId, StepStatus> last;
    std::map<StepId, int> terminals;
    for (const auto& ev : events) {
        if (auto it = last.find(ev.step); it != last.end()) {
            EXPECT_FALSE(is_terminal(it->second)) << to_string(ev.step);
            EXPECT_GE(status_rank(ev.status), status_rank(it->second));
        }
        last[ev.step] = ev.status;
        if (is_terminal(ev.status)) ++terminals[ev.step];
    }
    for (auto id : kAllSteps) {
        EXPECT_EQ(terminals[id], 1) << to_string(id);
    }

    // The DNS step completes before any other step starts.
    ASSERT_GE(events.size(), 2u);
    EXPECT_EQ(events[0].step, StepId::Dns);
    EXPECT_EQ(events[1].step, StepId::Dns);
    EXPECT_TRUE(is_terminal(events[1].status));
    EXPECT_TRUE(events[1].data.has_value());
}

TEST(Pipeline, DnsFailureSkipsEveryOtherProbe) {
    ScriptedCapability cap;
    cap.on("dns_a", output(";; connection timed out; no servers could be reached\n", 2000, 9));
    cap.on("curl_timing", output(std::string(kTimingOk)));
    cap.on("traceroute", output(std::string(kRouteOk)));
    cap.on("stability_", output("200"));
    EventChannel channel;
    EventRecorder recorder(channel);

    Pipeline pipeline(cap, channel, fast_options());
    auto report = pipeline.run(request_for("no-such-host.invalid"));
    const auto& events = recorder.finish();

    ASSERT_EQ(events.size(), 2u);
    for (const auto& ev : events) EXPECT_EQ(ev.step, StepId::Dns);
    EXPECT_EQ(events[1].status, StepStatus::Error);

    EXPECT_EQ(pipeline.state(), PipelineState::Failed);
    EXPECT_EQ(report.overall_status, OverallStatus::Failed);
    EXPECT_EQ(report.score, 0);
    EXPECT_FALSE(cap.called("curl_timing"));
    EXPECT_FALSE(cap.called("traceroute"));
    EXPECT_FALSE(cap.called("stability_"));

    ASSERT_TRUE(report.dns.has_value());
    ASSERT_FALSE(report.dns->has_value());
    EXPECT_EQ(report.dns->error().kind, ProbeError::NetworkUnreachable);
    EXPECT_FALSE(report.tcp.has_value());
    EXPECT_FALSE(report.routing.has_value());
    EXPECT_FALSE(report.stability.has_value());

    EXPECT_EQ(report.step(StepId::Dns)->status, StepStatus::Error);
    EXPECT_EQ(report.step(StepId::Tcp)->status, StepStatus::Pending);
    EXPECT_EQ(report.step(StepId::Stability)->status, StepStatus::Pending);
    ASSERT_FALSE(report.issues.empty());
    EXPECT_EQ(report.issues[0].category, IssueCategory::Dns);
}

TEST(Pipeline, ConnectionTimeoutFailsTheTarget) {
    ScriptedCapability cap;
    script_dns(cap);
    cap.on("curl_timing", timed_out(32000));
    cap.on("traceroute", output(std::string(kRouteOk), 2100));
    cap.on("stability_", output("200", 50));
    EventChannel channel;

    Pipeline pipeline(cap, channel, fast_options());
    auto report = pipeline.run(request_for("example.com"));

    ASSERT_TRUE(report.tcp.has_value());
    ASSERT_FALSE(report.tcp->has_value());
    EXPECT_EQ(report.tcp->error().kind, ProbeError::Timeout);
    EXPECT_EQ(report.overall_status, OverallStatus::Failed);
    EXPECT_EQ(report.step(StepId::Tcp)->status, StepStatus::Error);
    EXPECT_EQ(report.step(StepId::Http)->status, StepStatus::Error);

    auto tcp_errors = std::ranges::count_if(report.issues, [](const Issue& i) {
        return i.category == IssueCategory::Tcp && i.severity == IssueSeverity::Error;
    });
    EXPECT_EQ(tcp_errors, 1);
    // The other probes still ran to completion.
    EXPECT_EQ(report.step(StepId::Routing)->status, StepStatus::Success);
    EXPECT_EQ(report.step(StepId::Stability)->status, StepStatus::Success);
}

TEST(Pipeline, LatencyJumpMarksBottleneckHop) {
    ScriptedCapability cap;
    script_dns(cap);
    cap.on("curl_timing", output(std::string(kTimingOk), 350));
    cap.on("traceroute", output(" 1  192.168.1.1  1.000 ms\n"
                                " 2  10.10.0.1  5.000 ms\n"
                                " 3  10.20.0.1  12.000 ms\n"
                                " 4  72.14.215.85  20.000 ms\n"
                                " 5  108.170.252.1  31.000 ms\n"
                                " 6  142.250.61.1  40.000 ms\n"
                                " 7  152.195.64.1  180.000 ms\n"
                                " 8  93.184.216.34  182.000 ms\n",
                                4000));
    cap.on("stability_", output("200", 50));
    EventChannel channel;

    Pipeline pipeline(cap, channel, fast_options());
    auto report = pipeline.run(request_for("example.com"));

    ASSERT_TRUE(report.routing && report.routing->has_value());
    const auto& route = **report.routing;
    ASSERT_EQ(route.hops.size(), 8u);
    EXPECT_TRUE(route.hops[6].is_bottleneck);
    EXPECT_NE(std::ranges::find(route.bottleneck_hops, std::size_t{6}), route.bottleneck_hops.end());
    EXPECT_EQ(report.step(StepId::Routing)->status, StepStatus::Warning);
}

TEST(Pipeline, TracerouteTimeoutKeepsPartialRoute) {
    ScriptedCapability cap;
    script_dns(cap);
    cap.on("curl_timing", output(std::string(kTimingOk), 350));
    cap.on("traceroute", timed_out(30000, " 1  192.168.1.1  1.000 ms\n 2  *\n 3  *\n"));
    cap.on("stability_", output("200", 50));
    EventChannel channel;

    Pipeline pipeline(cap, channel, fast_options());
    auto report = pipeline.run(request_for("example.com"));

    ASSERT_TRUE(report.routing && report.routing->has_value());
    EXPECT_TRUE((*report.routing)->truncated);
    EXPECT_EQ((*report.routing)->total_hops, 3);
    EXPECT_EQ((*report.routing)->unresponsive_hops, 2);
    EXPECT_EQ((*report.routing)->degradation, ProbeError::PartialDegradation);
    EXPECT_EQ(report.step(StepId::Routing)->status, StepStatus::Warning);
    EXPECT_TRUE(std::ranges::any_of(report.notes, [](const std::string& n) {
        return n.starts_with("Partial degradation");
    }));
}

TEST(Pipeline, MissingTracerouteDegradesOnlyRouting) {
    ScriptedCapability cap;
    script_dns(cap);
    cap.on("curl_timing", output(std::string(kTimingOk), 350));
    cap.on("stability_", output("200", 50));
    EventChannel channel;

    Pipeline pipeline(cap, channel, fast_options());
    auto report = pipeline.run(request_for("example.com"));

    ASSERT_TRUE(report.routing.has_value());
    ASSERT_FALSE(report.routing->has_value());
    EXPECT_EQ(report.routing->error().kind, ProbeError::ToolUnavailable);
    EXPECT_EQ(report.step(StepId::Routing)->status, StepStatus::Error);
    EXPECT_TRUE(report.step(StepId::Routing)->recommendation.has_value());

    EXPECT_EQ(report.step(StepId::Http)->status, StepStatus::Success);
    EXPECT_EQ(report.score, 95);
    EXPECT_EQ(report.overall_status, OverallStatus::Excellent);
}

TEST(Pipeline, FlakyTargetLosesStabilityPoints) {
    ScriptedCapability cap;
    script_dns(cap);
    cap.on("curl_timing", output(std::string(kTimingOk), 350));
    cap.on("traceroute", output(std::string(kRouteOk), 2100));
    std::atomic<int> attempt{0};
    cap.on("stability_", [&](const ProbeCommand&) {
        // Requests 4, 8 and 10 fail.
        int n = ++attempt;
        if (n % 4 == 0 || n == 10) return output("000", 3000, 28);
        return output("200", 60);
    });
    EventChannel channel;

    Pipeline pipeline(cap, channel, fast_options(10));
    auto report = pipeline.run(request_for("https://example.com/"));

    ASSERT_TRUE(report.stability && report.stability->has_value());
    EXPECT_EQ((*report.stability)->successful_tests, 7);
    EXPECT_EQ(report.step(StepId::Stability)->status, StepStatus::Error);
    EXPECT_EQ(report.score, 70);
    EXPECT_EQ(report.overall_status, OverallStatus::Acceptable);
}

TEST(Pipeline, SlowServerIsGradedNotFailed) {
    ScriptedCapability cap;
    script_dns(cap);
    cap.on("curl_timing",
           output(R"({"dns": 0.040, "connect": 0.700, "ssl": 1.300, "ttfb": 2.500, "total": 3.600, )"
                  R"("http_code": "200", "speed": 1000, "remote_ip": "93.184.216.34", "redirects": 0})",
                  3600));
    cap.on("traceroute", output(std::string(kRouteOk), 2100));
    cap.on("stability_", output("200", 50));
    EventChannel channel;

    Pipeline pipeline(cap, channel, fast_options());
    auto report = pipeline.run(request_for("example.com"));

    EXPECT_EQ(report.step(StepId::Tcp)->status, StepStatus::Warning);
    EXPECT_EQ(report.step(StepId::Ssl)->status, StepStatus::Warning);
    // connect -15, TLS -10, TTFB -15, total -15
    EXPECT_EQ(report.score, 45);
    EXPECT_EQ(report.overall_status, OverallStatus::Poor);
    EXPECT_FALSE(report.recommendations.empty());
}

TEST(Pipeline, ProbeExceptionBecomesInternalFailure) {
    ScriptedCapability cap;
    script_dns(cap);
    cap.on("curl_timing", output(std::string(kTimingOk), 350));
    cap.on("traceroute", [](const ProbeCommand&) -> ProbeInvocation {
        throw std::runtime_error("boom");
    });
    cap.on("stability_", output("200", 50));
    EventChannel channel;

    Pipeline pipeline(cap, channel, fast_options());
    auto report = pipeline.run(request_for("example.com"));

    ASSERT_TRUE(report.routing.has_value());
    ASSERT_FALSE(report.routing->has_value());
    EXPECT_EQ(report.routing->error().kind, ProbeError::Internal);
    EXPECT_EQ(report.routing->error().message, "internal error: boom");
    EXPECT_EQ(report.step(StepId::Stability)->status, StepStatus::Success);
    EXPECT_EQ(pipeline.state(), PipelineState::Done);
}

TEST(Pipeline, NonStandardThrowStaysInsideTheWorker) {
    ScriptedCapability cap;
    script_dns(cap);
    cap.on("curl_timing", [](const ProbeCommand&) -> ProbeInvocation { throw 42; });
    cap.on("traceroute", output(std::string(kRouteOk), 2100));
    cap.on("stability_", output("200", 50));
    EventChannel channel;
    EventRecorder recorder(channel);

    Pipeline pipeline(cap, channel, fast_options());
    DiagnosticReport report;
    ASSERT_NO_THROW(report = pipeline.run(request_for("example.com")));
    const auto& events = recorder.finish();

    ASSERT_TRUE(report.tcp.has_value());
    ASSERT_FALSE(report.tcp->has_value());
    EXPECT_EQ(report.tcp->error().kind, ProbeError::Internal);
    EXPECT_EQ(report.tcp->error().message, "internal error: unknown exception");
    for (auto id : {StepId::Tcp, StepId::Ssl, StepId::Http}) {
        EXPECT_EQ(report.step(id)->status, StepStatus::Error) << to_string(id);
    }
    EXPECT_EQ(report.step(StepId::Routing)->status, StepStatus::Success);
    EXPECT_EQ(report.step(StepId::Stability)->status, StepStatus::Success);
    EXPECT_EQ(pipeline.state(), PipelineState::Done);

    std::map<StepId, StepStatus> last;
    for (const auto& ev : events) last[ev.step] = ev.status;
    for (auto id : kAllSteps) {
        EXPECT_TRUE(is_terminal(last[id])) << to_string(id);
    }
}

TEST(Pipeline, StopBeforeStartCancelsRun) {
    ScriptedCapability cap;
    script_healthy(cap);
    EventChannel channel;
    std::stop_source source;
    source.request_stop();

    Pipeline pipeline(cap, channel, fast_options());
    auto report = pipeline.run(request_for("example.com"), source.get_token());

    EXPECT_TRUE(report.cancelled);
    ASSERT_FALSE(report.notes.empty());
    EXPECT_EQ(report.notes.back(), "Run was cancelled; results are incomplete");
    EXPECT_FALSE(cap.called("curl_timing"));
    EXPECT_TRUE(channel.closed());
}

TEST(Pipeline, StopDuringStabilityEndsRun) {
    ScriptedCapability cap;
    script_dns(cap);
    cap.on("curl_timing", output(std::string(kTimingOk), 350));
    cap.on("traceroute", output(std::string(kRouteOk), 2100));
    std::stop_source source;
    cap.on("stability_03", [&](const ProbeCommand&) {
        source.request_stop();
        ProbeInvocation inv;
        inv.cancelled = true;
        return inv;
    });
    cap.on("stability_", output("200", 50));
    EventChannel channel;

    Pipeline pipeline(cap, channel, fast_options(10));
    auto report = pipeline.run(request_for("example.com"), source.get_token());

    EXPECT_TRUE(report.cancelled);
    ASSERT_TRUE(report.stability.has_value());
    ASSERT_FALSE(report.stability->has_value());
    EXPECT_EQ(report.stability->error().kind, ProbeError::Cancelled);
    EXPECT_FALSE(cap.called("stability_04"));
}

TEST(Pipeline, RunsOnlyOnce) {
    ScriptedCapability cap;
    script_healthy(cap);
    EventChannel channel;

    Pipeline pipeline(cap, channel, fast_options());
    pipeline.run(request_for("example.com"));
    EXPECT_THROW(pipeline.run(request_for("example.com")), std::logic_error);
}

TEST(Pipeline, IpTargetSkipsDig) {
    ScriptedCapability cap;
    cap.on("curl_timing", output(std::string(kTimingOk), 350));
    cap.on("traceroute", output(std::string(kRouteOk), 2100));
    cap.on("stability_", output("200", 50));
    EventChannel channel;

    Pipeline pipeline(cap, channel, fast_options());
    auto report = pipeline.run(request_for("https://93.184.216.34/"));

    EXPECT_FALSE(cap.called("dns_"));
    ASSERT_TRUE(report.dns && report.dns->has_value());
    EXPECT_EQ((*report.dns)->resolved_ips.front(), "93.184.216.34");
    EXPECT_EQ(report.overall_status, OverallStatus::Excellent);
}

TEST(Pipeline, ReportSerializesToJson) {
    ScriptedCapability cap;
    script_healthy(cap);
    EventChannel channel;

    Pipeline pipeline(cap, channel, fast_options());
    auto report = pipeline.run(request_for("example.com"));

    auto j = nlohmann::json::parse(report_to_string(report));
    EXPECT_EQ(j["domain"], "example.com");
    EXPECT_EQ(j["overall_status"], "excellent");
    EXPECT_EQ(j["score"], 100);
    EXPECT_EQ(j["steps"].size(), kAllSteps.size());
    EXPECT_EQ(j["tcp"]["http_code"], 200);
}

TEST(Pipeline, InvalidUtf8InToolOutputStillSerializes) {
    DiagnosticReport report;
    report.target_url = "https://example.com";
    report.domain = "example.com";
    report.dns = std::expected<DnsResult, ProbeFailure>(std::unexpected(
        ProbeFailure{ProbeError::ParseError, "bad", "caf\xe9 \xff", ""}));
    for (auto id : kAllSteps) report.steps.push_back(DiagnosticStep{id});

    std::string text;
    ASSERT_NO_THROW(text = report_to_string(report));
    auto j = nlohmann::json::parse(text);
    EXPECT_EQ(j["dns"]["error"]["kind"], "parse_error");
    EXPECT_EQ(j["dns"]["error"]["raw_output"], "caf\ufffd \ufffd");
}
