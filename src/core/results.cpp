// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
// Copyright (c) 2025 Alfie Ardinata.

#include "pathprobe/results.hpp"

#include <algorithm>
#include <cctype>
#include <format>

#include "pathprobe/config.hpp"
#include "pathprobe/utils.hpp"

namespace pathprobe {

std::string_view to_string(StepId id) noexcept {
    switch (id) {
        case StepId::Dns:
            return "dns";
        case StepId::Tcp:
            return "tcp";
        case StepId::Ssl:
            return "ssl";
        case StepId::Http:
            return "http";
        case StepId::Routing:
            return "routing";
        case StepId::Stability:
            return "stability";
    }
    return "unknown";
}

std::optional<StepId> parse_step_id(std::string_view text) noexcept {
    for (StepId id : kAllSteps) {
        if (to_string(id) == text) {
            return id;
        }
    }
    return std::nullopt;
}

std::string_view to_string(StepStatus status) noexcept {
    switch (status) {
        case StepStatus::Pending:
            return "pending";
        case StepStatus::Running:
            return "running";
        case StepStatus::Success:
            return "success";
        case StepStatus::Warning:
            return "warning";
        case StepStatus::Error:
            return "error";
    }
    return "unknown";
}

std::optional<StepStatus> parse_step_status(std::string_view text) noexcept {
    for (StepStatus s : {StepStatus::Pending,
                         StepStatus::Running,
                         StepStatus::Success,
                         StepStatus::Warning,
                         StepStatus::Error}) {
        if (to_string(s) == text) {
            return s;
        }
    }
    return std::nullopt;
}

int status_rank(StepStatus status) noexcept {
    switch (status) {
        case StepStatus::Pending:
            return 0;
        case StepStatus::Running:
            return 1;
        case StepStatus::Success:
        case StepStatus::Warning:
        case StepStatus::Error:
            return 2;
    }
    return 2;
}

bool is_terminal(StepStatus status) noexcept {
    return status_rank(status) == 2;
}

std::string_view to_string(ProbeError err) noexcept {
    switch (err) {
        case ProbeError::ToolUnavailable:
            return "tool_unavailable";
        case ProbeError::Timeout:
            return "timeout";
        case ProbeError::ParseError:
            return "parse_error";
        case ProbeError::NetworkUnreachable:
            return "network_unreachable";
        case ProbeError::PartialDegradation:
            return "partial_degradation";
        case ProbeError::Cancelled:
            return "cancelled";
        case ProbeError::Internal:
            return "internal";
    }
    return "internal";
}

std::string_view to_string(IssueCategory category) noexcept {
    switch (category) {
        case IssueCategory::Dns:
            return "dns";
        case IssueCategory::Tcp:
            return "tcp";
        case IssueCategory::Ssl:
            return "ssl";
        case IssueCategory::Http:
            return "http";
        case IssueCategory::Routing:
            return "routing";
        case IssueCategory::Stability:
            return "stability";
    }
    return "dns";
}

std::string_view to_string(IssueSeverity severity) noexcept {
    switch (severity) {
        case IssueSeverity::Info:
            return "info";
        case IssueSeverity::Warning:
            return "warning";
        case IssueSeverity::Error:
            return "error";
    }
    return "info";
}

std::string_view to_string(OverallStatus status) noexcept {
    switch (status) {
        case OverallStatus::Excellent:
            return "excellent";
        case OverallStatus::Good:
            return "good";
        case OverallStatus::Acceptable:
            return "acceptable";
        case OverallStatus::Poor:
            return "poor";
        case OverallStatus::Failed:
            return "failed";
    }
    return "failed";
}

const DiagnosticStep* DiagnosticReport::step(StepId id) const {
    auto it = std::ranges::find(steps, id, &DiagnosticStep::id);
    return it == steps.end() ? nullptr : &*it;
}

namespace {

bool valid_host_char(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '.' || c == '_';
}

}  // namespace

std::expected<DiagnosticRequest, std::string> make_request(std::string_view raw) {
    std::string_view input = trim_sv(raw);
    if (input.empty()) {
        return std::unexpected("Target is empty");
    }
    if (std::ranges::any_of(input, [](unsigned char c) { return std::isspace(c); })) {
        return std::unexpected(std::format("Target '{}' contains whitespace", input));
    }

    DiagnosticRequest req;
    std::string scheme;
    std::string_view rest = input;

    if (auto pos = input.find("://"); pos != std::string_view::npos) {
        scheme = to_lower(input.substr(0, pos));
        if (scheme != "http" && scheme != "https") {
            return std::unexpected(std::format("Unsupported scheme '{}' (use http or https)", scheme));
        }
        rest = input.substr(pos + 3);
        req.target_url = scheme + "://" + std::string(rest);
    } else {
        scheme = "https";
        req.target_url = std::string(Config::DEFAULT_SCHEME) + std::string(input);
    }
    req.uses_tls = scheme == "https";

    std::string_view authority = rest.substr(0, rest.find_first_of("/?#"));
    if (auto at = authority.rfind('@'); at != std::string_view::npos) {
        authority.remove_prefix(at + 1);
    }

    std::string_view host = authority;
    std::string_view port;
    if (authority.starts_with('[')) {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return std::unexpected(std::format("Malformed IPv6 literal in '{}'", input));
        }
        host = authority.substr(1, close - 1);
        auto tail = authority.substr(close + 1);
        if (tail.starts_with(':')) {
            port = tail.substr(1);
        } else if (!tail.empty()) {
            return std::unexpected(std::format("Malformed authority in '{}'", input));
        }
    } else if (auto colon = authority.find(':'); colon != std::string_view::npos) {
        host = authority.substr(0, colon);
        port = authority.substr(colon + 1);
    }

    if (host.empty()) {
        return std::unexpected(std::format("Cannot extract domain from '{}'", input));
    }
    if (!is_ip_address(host) && !std::ranges::all_of(host, valid_host_char)) {
        return std::unexpected(std::format("Invalid host name '{}'", host));
    }

    if (!port.empty()) {
        auto p = parse_number<std::uint16_t>(port);
        if (!p || *p == 0) {
            return std::unexpected(std::format("Invalid port '{}'", port));
        }
        req.port = *p;
    }

    req.domain = to_lower(host);
    return req;
}

}  // namespace pathprobe
