/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include <condition_variable>
#include <format>
#include <mutex>
#include <utility>
#include <vector>

#include "pathprobe/log.hpp"
#include "pathprobe/parsers.hpp"
#include "pathprobe/probes.hpp"
#include "pathprobe/utils.hpp"

namespace pathprobe {

namespace {

// Returns false when the stop token fired during the pause.
bool pause_for(std::chrono::milliseconds d, std::stop_token stop) {
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock lock(m);
    cv.wait_for(lock, stop, d, [] { return false; });
    return !stop.stop_requested();
}

ProbeFailure cancelled_failure() {
    return ProbeFailure{ProbeError::Cancelled, "cancelled", "", ""};
}

}  // namespace

std::expected<StabilityResult, ProbeFailure> StabilitySampler::run(const std::string& url,
                                                                   std::stop_token stop) {
    std::vector<StabilitySample> samples;
    samples.reserve(static_cast<std::size_t>(options_.samples));

    auto start = std::chrono::steady_clock::now();

    for (int attempt = 1; attempt <= options_.samples; ++attempt) {
        if (stop.stop_requested()) {
            return std::unexpected(cancelled_failure());
        }
        if (std::chrono::steady_clock::now() - start >= options_.budget) {
            if (samples.empty()) {
                return std::unexpected(ProbeFailure{
                    ProbeError::Timeout,
                    std::format("stability budget of {} ms exhausted before the first attempt",
                                options_.budget.count()),
                    "",
                    "The server answers very slowly; retry later or lower --samples."});
            }
            Log::warn("stability budget of {} ms exhausted after {} of {} attempts",
                      options_.budget.count(), attempt - 1, options_.samples);
            auto result = summarize_stability(std::move(samples));
            result.truncated = true;
            result.degradation = ProbeError::PartialDegradation;
            result.notes.push_back(std::format(
                "Partial degradation: stability budget of {} ms ran out after {} of {} requests",
                options_.budget.count(), result.total_tests, options_.samples));
            return result;
        }

        ProbeCommand cmd{std::string(Config::CURL_BINARY),
                         {"-o", "/dev/null",
                          "-s",
                          "-w", "%{http_code}",
                          "--connect-timeout", std::to_string(Config::STABILITY_CONNECT_TIMEOUT_SEC),
                          "--max-time", std::to_string(Config::STABILITY_ATTEMPT_TIMEOUT_SEC),
                          url},
                         std::chrono::seconds(Config::STABILITY_ATTEMPT_TIMEOUT_SEC + 1),
                         std::format("stability_{:02}", attempt)};
        auto inv = capability_.invoke(cmd, stop);

        StabilitySample sample;
        sample.attempt = attempt;
        sample.elapsed_ms = inv.elapsed_ms;

        if (auto ok = check_invocation(inv, Config::CURL_BINARY); !ok) {
            // Only a timed out attempt counts as a sample; the rest end the run.
            if (ok.error().kind != ProbeError::Timeout) {
                return std::unexpected(std::move(ok.error()));
            }
            sample.error = ok.error().message;
        } else {
            auto code = parse_http_code(inv.stdout_text);
            if (code) {
                sample.http_code = *code;
            } else {
                sample.error = code.error().message;
                sample.raw_output = inv.stdout_text;
            }
            if (inv.exit_code != 0) {
                sample.error = std::format("curl exit {}", inv.exit_code);
            }
            sample.success = inv.exit_code == 0 && sample.http_code >= 200 && sample.http_code < 400;
            if (!sample.success && !sample.error) {
                sample.error = std::format("HTTP {}", sample.http_code);
            }
        }

        Log::debug("stability {}/{}: {} in {} ms",
                   attempt, options_.samples,
                   sample.success ? "ok" : sample.error.value_or("failed"),
                   sample.elapsed_ms);
        samples.push_back(std::move(sample));

        if (attempt < options_.samples && !pause_for(options_.pause, stop)) {
            return std::unexpected(cancelled_failure());
        }
    }

    return summarize_stability(std::move(samples));
}

}  // namespace pathprobe
