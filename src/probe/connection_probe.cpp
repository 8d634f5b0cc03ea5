/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include <format>
#include <string_view>
#include <utility>

#include "pathprobe/log.hpp"
#include "pathprobe/parsers.hpp"
#include "pathprobe/probes.hpp"
#include "pathprobe/utils.hpp"

namespace pathprobe {

namespace {

// curl(1) EXIT CODES, the ones a plain GET runs into.
std::string_view curl_exit_reason(int code) {
    switch (code) {
        case 3:
            return "malformed URL";
        case 6:
            return "could not resolve host";
        case 7:
            return "failed to connect (connection refused or port blocked)";
        case 28:
            return "operation timed out";
        case 35:
            return "TLS handshake failed";
        case 47:
            return "too many redirects";
        case 51:
        case 60:
            return "TLS certificate verification failed";
        case 52:
            return "server returned an empty reply";
        case 56:
            return "connection reset while receiving data";
        default:
            return "transfer failed";
    }
}

}  // namespace

std::expected<TcpResult, ProbeFailure> ConnectionTimingProbe::run(const std::string& url,
                                                                  std::stop_token stop) {
    // curl enforces --max-time itself; the outer limit only catches a hung process.
    ProbeCommand cmd{std::string(Config::CURL_BINARY),
                     {"-o", "/dev/null",
                      "-s", "-L",
                      "-w", std::string(kCurlTimingTemplate),
                      "--connect-timeout", std::to_string(Config::HTTP_CONNECT_TIMEOUT_SEC),
                      "--max-time", std::to_string(Config::HTTP_TIMEOUT_SEC),
                      url},
                     Config::HTTP_TIMEOUT + std::chrono::seconds(2),
                     "curl_timing"};
    auto inv = capability_.invoke(cmd, stop);

    if (auto ok = check_invocation(inv, Config::CURL_BINARY); !ok) {
        return std::unexpected(std::move(ok.error()));
    }

    if (inv.exit_code != 0) {
        auto reason = curl_exit_reason(inv.exit_code);
        auto detail = trim_sv(inv.stderr_text);
        return std::unexpected(ProbeFailure{
            inv.exit_code == 28 ? ProbeError::Timeout : ProbeError::NetworkUnreachable,
            detail.empty() ? std::format("curl exit {}: {}", inv.exit_code, reason)
                           : std::format("curl exit {}: {} ({})", inv.exit_code, reason, first_line(detail)),
            inv.stdout_text + inv.stderr_text,
            "Open the URL in a browser to confirm the site is up, then check firewalls and proxies."});
    }

    auto timing = parse_curl_timing(inv.stdout_text);
    if (!timing) {
        Log::debug("curl timing parse error, raw output:\n{}", inv.stdout_text);
        return std::unexpected(std::move(timing.error()));
    }
    if (timing->http_code == 0) {
        return std::unexpected(ProbeFailure{ProbeError::NetworkUnreachable,
                                            "no HTTP response received",
                                            inv.stdout_text,
                                            "Check that the server is listening on the target port."});
    }

    Log::debug("timing: dns {} connect {} ssl {} ttfb {} total {} (HTTP {})",
               timing->dns_ms, timing->connect_ms, timing->ssl_ms,
               timing->ttfb_ms, timing->total_ms, timing->http_code);
    return timing;
}

}  // namespace pathprobe
