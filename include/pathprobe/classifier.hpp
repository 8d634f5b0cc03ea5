/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pathprobe/results.hpp"

namespace pathprobe {

// Upper bounds (exclusive) of the "good" and "acceptable" bands, in ms.
struct Band {
    std::int64_t good;
    std::int64_t acceptable;
};

struct Thresholds {
    Band dns{100, 200};
    Band connect{200, 500};
    Band ssl{300, 500};
    Band ttfb{500, 1000};
    Band total{1000, 3000};

    std::int64_t jitter_ms = 100;
    int many_hops = 20;
    double unresponsive_ratio = 0.30;
    double stability_warning_rate = 80.0;
};

enum class Grade { Good, Acceptable, Slow };

[[nodiscard]] Grade grade(std::int64_t ms, Band band) noexcept;
[[nodiscard]] std::string_view to_string(Grade g) noexcept;

// 90-100 excellent, 75-89 good, 50-74 acceptable, 25-49 poor, 0-24 failed.
[[nodiscard]] OverallStatus band_for(int score) noexcept;

enum class IssueKind {
    DnsFailure,
    DnsAcceptable,
    DnsSlow,
    TcpFailure,
    ConnectAcceptable,
    ConnectSlow,
    SslAcceptable,
    SslSlow,
    TtfbAcceptable,
    TtfbSlow,
    TotalAcceptable,
    TotalSlow,
    HttpClientError,
    HttpServerError,
    BottleneckHop,
    ManyUnresponsiveHops,
    ManyHops,
    RoutingFailure,
    StabilityDegraded,
    StabilityPoor,
    StabilityDown,
    HighJitter,
    StabilityFailure
};

// What the advice tables match on.
struct RuleContext {
    std::optional<ProbeError> error;
    std::string_view message;
    int http_code = 0;
};

struct Advice {
    std::vector<std::string> causes;
    std::vector<std::string> solutions;
};

// First matching entry of the table for `kind`; every table ends in a
// catch-all row.
[[nodiscard]] Advice lookup_advice(IssueKind kind, const RuleContext& ctx);

struct Analysis {
    int score = 0;
    OverallStatus overall_status = OverallStatus::Failed;
    std::vector<Issue> issues;
    std::vector<std::string> recommendations;
    std::vector<std::string> notes;
};

// Pure. A never-run probe (nullopt) contributes nothing; a cancelled one
// contributes no issue.
[[nodiscard]] Analysis classify(const ProbeSlot<DnsResult>& dns,
                                const ProbeSlot<TcpResult>& tcp,
                                const ProbeSlot<RoutingResult>& routing,
                                const ProbeSlot<StabilityResult>& stability,
                                const Thresholds& thresholds = {});

}  // namespace pathprobe
