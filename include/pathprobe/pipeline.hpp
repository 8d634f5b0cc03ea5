/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <atomic>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "pathprobe/classifier.hpp"
#include "pathprobe/events.hpp"
#include "pathprobe/probe_capability.hpp"
#include "pathprobe/probes.hpp"
#include "pathprobe/results.hpp"

namespace pathprobe {

enum class PipelineState { Idle, DnsPhase, ParallelPhase, AnalysisPhase, Done, Failed };

[[nodiscard]] std::string_view to_string(PipelineState state) noexcept;

struct PipelineOptions {
    RouteOptions route;
    StabilityOptions stability;
    Thresholds thresholds;
};

// DNS gate, then connection timing, routing and stability in parallel, then
// classification. Runs once; the event channel is closed when run() returns.
class Pipeline {
    ProbeCapability& capability_;
    EventChannel& channel_;
    EventPublisher publisher_;
    PipelineOptions options_;
    std::atomic<PipelineState> state_{PipelineState::Idle};

   public:
    Pipeline(ProbeCapability& capability, EventChannel& channel, PipelineOptions options = {});

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    // Throws std::logic_error when called a second time.
    DiagnosticReport run(const DiagnosticRequest& request, std::stop_token stop = {});

    [[nodiscard]] PipelineState state() const noexcept {
        return state_.load();
    }

   private:
    void transition(PipelineState next);
    void begin_step(DiagnosticReport& report, StepId id, std::string message);
    void finish_step(DiagnosticReport& report, StepId id, StepVerdict verdict,
                     std::int64_t duration_ms, std::optional<nlohmann::json> data);
    void abandon_steps(DiagnosticReport& report, const std::vector<StepId>& steps,
                       const std::string& fault);

    void run_connection(DiagnosticReport& report, const DiagnosticRequest& request, std::stop_token stop);
    void run_routing(DiagnosticReport& report, const std::string& target_ip, std::stop_token stop);
    void run_stability(DiagnosticReport& report, const DiagnosticRequest& request, std::stop_token stop);
};

}  // namespace pathprobe
