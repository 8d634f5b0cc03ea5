/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "pathprobe/pipeline.hpp"

#include <array>
#include <chrono>
#include <format>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include "pathprobe/log.hpp"
#include "pathprobe/report_json.hpp"
#include "pathprobe/utils.hpp"

namespace pathprobe {

namespace {

// Probe boundary: nothing a probe throws reaches the orchestrator.
template <typename T, typename F>
std::expected<T, ProbeFailure> guarded(StepId step, F&& fn) {
    try {
        return fn();
    } catch (const std::exception& e) {
        Log::error("{} probe threw: {}", to_string(step), e.what());
        return std::unexpected(ProbeFailure{
            ProbeError::Internal, std::format("internal error: {}", e.what()), "", ""});
    } catch (...) {
        Log::error("{} probe threw a non-standard exception", to_string(step));
        return std::unexpected(
            ProbeFailure{ProbeError::Internal, "internal error: unknown exception", "", ""});
    }
}

template <typename T>
void fill_abandoned(ProbeSlot<T>& slot, const std::string& fault) {
    if (slot || fault.empty()) return;
    slot = std::expected<T, ProbeFailure>(
        std::unexpected(ProbeFailure{ProbeError::Internal, fault, "", ""}));
}

template <typename T>
nlohmann::json event_data(const std::expected<T, ProbeFailure>& r) {
    if (!r) return nlohmann::json{{"error", r.error()}};
    return nlohmann::json(*r);
}

class ChannelCloser {
    EventChannel& channel_;

   public:
    explicit ChannelCloser(EventChannel& channel) : channel_(channel) {}
    ~ChannelCloser() {
        channel_.close();
    }

    ChannelCloser(const ChannelCloser&) = delete;
    ChannelCloser& operator=(const ChannelCloser&) = delete;
};

std::size_t index_of(StepId id) {
    return static_cast<std::size_t>(id);
}

}  // namespace

std::string_view to_string(PipelineState state) noexcept {
    switch (state) {
        case PipelineState::Idle:
            return "idle";
        case PipelineState::DnsPhase:
            return "dns_phase";
        case PipelineState::ParallelPhase:
            return "parallel_phase";
        case PipelineState::AnalysisPhase:
            return "analysis_phase";
        case PipelineState::Done:
            return "done";
        case PipelineState::Failed:
            return "failed";
    }
    return "unknown";
}

Pipeline::Pipeline(ProbeCapability& capability, EventChannel& channel, PipelineOptions options)
    : capability_(capability),
      channel_(channel),
      publisher_(channel.publisher()),
      options_(options) {}

void Pipeline::transition(PipelineState next) {
    auto prev = state_.exchange(next);
    Log::debug("pipeline: {} -> {}", to_string(prev), to_string(next));
}

void Pipeline::begin_step(DiagnosticReport& report, StepId id, std::string message) {
    report.steps[index_of(id)].status = StepStatus::Running;
    publisher_.publish({id, StepStatus::Running, std::move(message), std::nullopt});
}

void Pipeline::finish_step(DiagnosticReport& report, StepId id, StepVerdict verdict,
                           std::int64_t duration_ms, std::optional<nlohmann::json> data) {
    auto& step = report.steps[index_of(id)];
    step.status = verdict.status;
    step.result_text = verdict.message;
    step.duration_ms = duration_ms;
    step.recommendation = std::move(verdict.recommendation);
    Log::info("{}: {} ({})", to_string(id), to_string(verdict.status), verdict.message);
    publisher_.publish({id, verdict.status, std::move(verdict.message), std::move(data)});
}

void Pipeline::abandon_steps(DiagnosticReport& report, const std::vector<StepId>& steps,
                             const std::string& fault) {
    Log::error("worker for {} aborted: {}", to_string(steps.front()), fault);
    for (auto id : steps) {
        auto& step = report.steps[index_of(id)];
        if (!is_terminal(step.status)) {
            step.status = StepStatus::Error;
            step.result_text = fault;
        }
        if (!is_terminal(channel_.last_status(id))) {
            publisher_.publish({id, StepStatus::Error, fault, std::nullopt});
        }
    }
}

DiagnosticReport Pipeline::run(const DiagnosticRequest& request, std::stop_token stop) {
    auto idle = PipelineState::Idle;
    if (!state_.compare_exchange_strong(idle, PipelineState::DnsPhase)) {
        throw std::logic_error("Pipeline::run may only be called once");
    }
    Log::debug("pipeline: idle -> dns_phase");
    ChannelCloser closer(channel_);

    auto started = std::chrono::steady_clock::now();

    DiagnosticReport report;
    report.target_url = request.target_url;
    report.domain = request.domain;
    report.timestamp = utc_timestamp(std::chrono::system_clock::now());
    for (auto id : kAllSteps) {
        report.steps.push_back(DiagnosticStep{id});
    }

    begin_step(report, StepId::Dns, std::format("Resolving {}", request.domain));
    auto dns_start = std::chrono::steady_clock::now();
    auto dns = guarded<DnsResult>(StepId::Dns, [&] {
        return DnsProbe(capability_).run(request.domain, stop);
    });
    finish_step(report, StepId::Dns, dns_verdict(dns), elapsed_ms(dns_start), event_data(dns));
    report.dns = dns;

    if (!dns || dns->resolved_ips.empty()) {
        transition(PipelineState::Failed);
    } else {
        transition(PipelineState::ParallelPhase);
        const std::string target_ip = dns->resolved_ips.front();

        // A worker that throws outside its probe ends its own steps with an
        // error; the other workers and the analysis still run.
        std::array<std::string, 3> faults;
        auto spawn = [&](std::string& fault, std::vector<StepId> steps, auto body) {
            return std::jthread([this, &report, &fault, steps = std::move(steps), body] {
                try {
                    body();
                } catch (const std::exception& e) {
                    fault = std::format("internal error: {}", e.what());
                    abandon_steps(report, steps, fault);
                } catch (...) {
                    fault = "internal error: unknown exception";
                    abandon_steps(report, steps, fault);
                }
            });
        };
        {
            auto tcp = spawn(faults[0], {StepId::Tcp, StepId::Ssl, StepId::Http},
                             [&] { run_connection(report, request, stop); });
            auto route = spawn(faults[1], {StepId::Routing},
                               [&] { run_routing(report, target_ip, stop); });
            auto stab = spawn(faults[2], {StepId::Stability},
                              [&] { run_stability(report, request, stop); });
        }
        fill_abandoned(report.tcp, faults[0]);
        fill_abandoned(report.routing, faults[1]);
        fill_abandoned(report.stability, faults[2]);
        transition(PipelineState::AnalysisPhase);
    }

    auto analysis = classify(report.dns, report.tcp, report.routing, report.stability,
                             options_.thresholds);
    report.score = analysis.score;
    report.overall_status = analysis.overall_status;
    report.issues = std::move(analysis.issues);
    report.recommendations = std::move(analysis.recommendations);
    report.notes = std::move(analysis.notes);

    report.cancelled = stop.stop_requested();
    if (report.cancelled) {
        report.notes.push_back("Run was cancelled; results are incomplete");
    }
    report.duration_ms = elapsed_ms(started);

    if (state() != PipelineState::Failed) {
        transition(PipelineState::Done);
    }
    return report;
}

void Pipeline::run_connection(DiagnosticReport& report, const DiagnosticRequest& request,
                              std::stop_token stop) {
    begin_step(report, StepId::Tcp, "Connecting");
    begin_step(report, StepId::Ssl, request.uses_tls ? "Negotiating TLS" : "Plain HTTP");
    begin_step(report, StepId::Http, std::format("GET {}", request.target_url));

    auto start = std::chrono::steady_clock::now();
    auto tcp = guarded<TcpResult>(StepId::Tcp, [&] {
        return ConnectionTimingProbe(capability_).run(request.target_url, stop);
    });
    auto took = elapsed_ms(start);

    auto verdicts = connection_verdicts(tcp, request.uses_tls);
    report.tcp = tcp;
    finish_step(report, StepId::Tcp, std::move(verdicts[0]), took, event_data(tcp));
    finish_step(report, StepId::Ssl, std::move(verdicts[1]), took, std::nullopt);
    finish_step(report, StepId::Http, std::move(verdicts[2]), took, std::nullopt);
}

void Pipeline::run_routing(DiagnosticReport& report, const std::string& target_ip,
                           std::stop_token stop) {
    begin_step(report, StepId::Routing, std::format("Tracing route to {}", target_ip));

    auto start = std::chrono::steady_clock::now();
    auto routing = guarded<RoutingResult>(StepId::Routing, [&] {
        return RouteTracer(capability_, options_.route).run(target_ip, stop);
    });
    report.routing = routing;
    finish_step(report, StepId::Routing, routing_verdict(routing), elapsed_ms(start),
                event_data(routing));
}

void Pipeline::run_stability(DiagnosticReport& report, const DiagnosticRequest& request,
                             std::stop_token stop) {
    begin_step(report, StepId::Stability,
               std::format("Sending {} requests", options_.stability.samples));

    auto start = std::chrono::steady_clock::now();
    auto stability = guarded<StabilityResult>(StepId::Stability, [&] {
        return StabilitySampler(capability_, options_.stability).run(request.target_url, stop);
    });
    report.stability = stability;
    finish_step(report, StepId::Stability, stability_verdict(stability), elapsed_ms(start),
                event_data(stability));
}

}  // namespace pathprobe
