// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
// Copyright (c) 2025 Alfie Ardinata.

#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pathprobe {

enum class StepId { Dns, Tcp, Ssl, Http, Routing, Stability };

inline constexpr std::array<StepId, 6> kAllSteps = {
    StepId::Dns, StepId::Tcp, StepId::Ssl, StepId::Http, StepId::Routing, StepId::Stability};

enum class StepStatus { Pending, Running, Success, Warning, Error };

[[nodiscard]] std::string_view to_string(StepId id) noexcept;
[[nodiscard]] std::optional<StepId> parse_step_id(std::string_view text) noexcept;
[[nodiscard]] std::string_view to_string(StepStatus status) noexcept;
[[nodiscard]] std::optional<StepStatus> parse_step_status(std::string_view text) noexcept;

// pending = 0, running = 1, every terminal status = 2.
[[nodiscard]] int status_rank(StepStatus status) noexcept;
[[nodiscard]] bool is_terminal(StepStatus status) noexcept;

struct DiagnosticRequest {
    std::string target_url;
    std::string domain;
    std::optional<std::uint16_t> port;
    bool uses_tls = true;
};

// Normalizes a domain or URL. A missing scheme defaults to https.
[[nodiscard]] std::expected<DiagnosticRequest, std::string> make_request(std::string_view raw);

struct DiagnosticStep {
    StepId id = StepId::Dns;
    StepStatus status = StepStatus::Pending;
    std::optional<std::string> result_text;
    std::optional<std::int64_t> duration_ms;
    std::optional<std::string> recommendation;
};

struct DnsResult {
    std::string domain;
    std::vector<std::string> resolved_ips;
    std::int64_t lookup_time_ms = 0;
    std::optional<std::uint32_t> ttl;
    std::vector<std::string> nameservers;
    std::optional<std::string> provider;
    // Best-effort lookups (TTL, NS) that failed without failing the probe.
    std::vector<std::string> notes;
};

struct TcpResult {
    // Cumulative timers, as reported by the timing client.
    std::int64_t dns_ms = 0;
    std::int64_t connect_ms = 0;
    std::int64_t ssl_ms = 0;
    std::int64_t ttfb_ms = 0;
    std::int64_t total_ms = 0;

    // Per-phase durations, each clamped to >= 0.
    std::int64_t connect_segment_ms = 0;
    std::int64_t ssl_segment_ms = 0;
    std::int64_t ttfb_segment_ms = 0;
    std::int64_t transfer_segment_ms = 0;

    int http_code = 0;
    double download_speed_bps = 0.0;
    std::optional<std::string> remote_ip;
    int redirect_count = 0;
    std::vector<std::string> anomalies;
};

struct RouteHop {
    int hop_number = 0;
    std::optional<std::string> ip_address;
    std::optional<std::string> hostname;
    std::optional<std::int64_t> rtt_ms;
    double packet_loss_percent = 0.0;
    bool is_bottleneck = false;
};

enum class ProbeError {
    ToolUnavailable,
    Timeout,
    ParseError,
    NetworkUnreachable,
    PartialDegradation,
    Cancelled,
    Internal
};

[[nodiscard]] std::string_view to_string(ProbeError err) noexcept;

struct RoutingResult {
    std::string target_ip;
    std::vector<RouteHop> hops;
    int total_hops = 0;
    std::int64_t total_time_ms = 0;
    std::vector<std::size_t> bottleneck_hops;
    int unresponsive_hops = 0;
    // Set when traceroute timed out and only the hops printed so far are kept.
    bool truncated = false;
    // PartialDegradation whenever truncated is set.
    std::optional<ProbeError> degradation;
    std::vector<std::string> notes;
};

struct StabilitySample {
    int attempt = 0;
    bool success = false;
    int http_code = 0;
    std::int64_t elapsed_ms = 0;
    std::optional<std::string> error;
    // Unparsable curl output, kept as printed.
    std::optional<std::string> raw_output;
};

struct StabilityResult {
    int total_tests = 0;
    int successful_tests = 0;
    double success_rate = 0.0;
    std::int64_t min_time_ms = 0;
    std::int64_t avg_time_ms = 0;
    std::int64_t max_time_ms = 0;
    std::int64_t range_jitter_ms = 0;
    std::int64_t mean_delta_jitter_ms = 0;
    std::vector<StabilitySample> samples;
    // Set when the time budget ran out before every sample was taken.
    bool truncated = false;
    std::optional<ProbeError> degradation;
    std::vector<std::string> notes;
};

struct ProbeFailure {
    ProbeError kind = ProbeError::Internal;
    std::string message;
    std::string raw_output;
    std::string recommendation;
};

// nullopt: the probe never ran. Unexpected: it ran and failed.
template <typename T>
using ProbeSlot = std::optional<std::expected<T, ProbeFailure>>;

enum class IssueCategory { Dns, Tcp, Ssl, Http, Routing, Stability };
enum class IssueSeverity { Info, Warning, Error };

[[nodiscard]] std::string_view to_string(IssueCategory category) noexcept;
[[nodiscard]] std::string_view to_string(IssueSeverity severity) noexcept;

struct Issue {
    IssueCategory category = IssueCategory::Dns;
    IssueSeverity severity = IssueSeverity::Info;
    std::string title;
    std::string description;
    std::vector<std::string> possible_causes;
    std::vector<std::string> solutions;
};

enum class OverallStatus { Excellent, Good, Acceptable, Poor, Failed };

[[nodiscard]] std::string_view to_string(OverallStatus status) noexcept;

struct DiagnosticReport {
    std::string target_url;
    std::string domain;
    std::string timestamp;

    ProbeSlot<DnsResult> dns;
    ProbeSlot<TcpResult> tcp;
    ProbeSlot<RoutingResult> routing;
    ProbeSlot<StabilityResult> stability;

    std::vector<DiagnosticStep> steps;
    int score = 0;
    OverallStatus overall_status = OverallStatus::Failed;
    std::vector<Issue> issues;
    std::vector<std::string> recommendations;
    std::vector<std::string> notes;

    bool cancelled = false;
    std::int64_t duration_ms = 0;
    std::optional<std::string> capture_dir;

    [[nodiscard]] const DiagnosticStep* step(StepId id) const;
};

}  // namespace pathprobe
