/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace pathprobe {

class RawCaptureSink;

struct ProbeCommand {
    std::string tool;
    std::vector<std::string> args;
    std::chrono::milliseconds timeout{0};
    // File stem used by raw captures ("dns_a", "stability_03", ...).
    std::string label;
};

struct ProbeInvocation {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = -1;
    std::int64_t elapsed_ms = 0;
    bool timed_out = false;
    bool tool_missing = false;
    bool cancelled = false;
    bool truncated = false;
    std::string launch_error;
};

[[nodiscard]] std::string describe(const ProbeCommand& cmd);

// Runs one external diagnostic utility with a bounded timeout. Implementations
// must be safe to call from several probe threads at once.
class ProbeCapability {
   public:
    virtual ~ProbeCapability() = default;
    virtual ProbeInvocation invoke(const ProbeCommand& cmd, std::stop_token stop) = 0;
};

// fork/exec of the named tool, searched on PATH.
class ProcessCapability final : public ProbeCapability {
   public:
    ProbeInvocation invoke(const ProbeCommand& cmd, std::stop_token stop) override;
};

// Serves the "curl" tool in-process through libcurl and forwards every other
// tool to `fallback`.
class LibcurlCapability final : public ProbeCapability {
    ProbeCapability& fallback_;

   public:
    explicit LibcurlCapability(ProbeCapability& fallback) : fallback_(fallback) {}
    ProbeInvocation invoke(const ProbeCommand& cmd, std::stop_token stop) override;
};

// Writes every invocation through `sink` after forwarding it to `inner`.
class CapturingCapability final : public ProbeCapability {
    ProbeCapability& inner_;
    RawCaptureSink& sink_;

   public:
    CapturingCapability(ProbeCapability& inner, RawCaptureSink& sink)
        : inner_(inner), sink_(sink) {}
    ProbeInvocation invoke(const ProbeCommand& cmd, std::stop_token stop) override;
};

}  // namespace pathprobe
