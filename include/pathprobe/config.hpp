/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace pathprobe::Config {
    constexpr std::string_view APP_NAME = "pathprobe";
    constexpr std::string_view APP_VERSION = "1.0.0";
    constexpr int APP_INFO_LABEL_WIDTH = 20;
    constexpr std::size_t TERM_WIDTH = 78;

    constexpr std::string_view DEFAULT_SCHEME = "https://";
    constexpr std::string_view CAPTURE_ROOT = "diagnostic-logs";
    constexpr std::string_view CAPTURE_LOG_NAME = "diagnostic.log";
    constexpr std::string_view CAPTURE_REPORT_NAME = "report.json";

    // Capability limits
    constexpr std::size_t MAX_OUTPUT_BYTES = 4 * 1024 * 1024;
    constexpr auto KILL_GRACE = std::chrono::milliseconds(500);
    constexpr auto POLL_SLICE = std::chrono::milliseconds(100);

    // DNS probe
    constexpr auto DNS_TIMEOUT = std::chrono::seconds(5);
    constexpr auto DNS_AUX_TIMEOUT = std::chrono::seconds(3);
    constexpr std::string_view DIG_BINARY = "dig";

    // Connection timing probe
    constexpr auto HTTP_TIMEOUT = std::chrono::seconds(30);
    constexpr long HTTP_TIMEOUT_SEC = 30;
    constexpr long HTTP_CONNECT_TIMEOUT_SEC = 10;
    constexpr std::string_view CURL_BINARY = "curl";

    // Routing probe
    constexpr auto ROUTE_TIMEOUT = std::chrono::seconds(30);
    constexpr int ROUTE_MAX_HOPS = 15;
    constexpr int ROUTE_WAIT_SEC = 1;
    constexpr std::string_view TRACEROUTE_BINARY = "traceroute";

    // Stability probe
    constexpr int STABILITY_SAMPLES = 10;
    constexpr int STABILITY_MAX_SAMPLES = 100;
    constexpr long STABILITY_ATTEMPT_TIMEOUT_SEC = 5;
    constexpr long STABILITY_CONNECT_TIMEOUT_SEC = 3;
    constexpr auto STABILITY_PAUSE = std::chrono::milliseconds(100);
    constexpr auto STABILITY_BUDGET = std::chrono::seconds(60);

    // Step thresholds (ms)
    constexpr std::int64_t DNS_WARN_MS = 100;
    constexpr std::int64_t BOTTLENECK_DELTA_MS = 50;
    constexpr std::int64_t BOTTLENECK_CEILING_MS = 150;
}  // namespace pathprobe::Config
