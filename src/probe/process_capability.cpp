/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "pathprobe/probe_capability.hpp"

#include <cerrno>
#include <exception>
#include <format>
#include <system_error>

#include "pathprobe/capture.hpp"
#include "pathprobe/child_process.hpp"
#include "pathprobe/log.hpp"

namespace pathprobe {

std::string describe(const ProbeCommand& cmd) {
    std::string text = cmd.tool;
    for (const auto& arg : cmd.args) {
        text += ' ';
        text += arg;
    }
    return text;
}

ProbeInvocation ProcessCapability::invoke(const ProbeCommand& cmd, std::stop_token stop) {
    ProbeInvocation inv;

    std::vector<std::string> argv;
    argv.reserve(cmd.args.size() + 1);
    argv.push_back(cmd.tool);
    argv.insert(argv.end(), cmd.args.begin(), cmd.args.end());

    Log::debug("exec: {}", describe(cmd));

    try {
        ChildProcess child(argv);
        auto res = child.wait(cmd.timeout, stop);
        inv.stdout_text = std::move(res.stdout_text);
        inv.stderr_text = std::move(res.stderr_text);
        inv.exit_code = res.exit_code;
        inv.elapsed_ms = res.elapsed_ms;
        inv.timed_out = res.timed_out;
        inv.cancelled = res.cancelled;
        inv.truncated = res.truncated;
    } catch (const std::system_error& e) {
        int code = e.code().value();
        inv.tool_missing = code == ENOENT || code == EACCES || code == ENOTDIR;
        inv.launch_error = e.what();
        inv.exit_code = 127;
    }

    Log::debug("exit: {} -> code={} elapsed={}ms{}{}",
               cmd.tool,
               inv.exit_code,
               inv.elapsed_ms,
               inv.timed_out ? " (timed out)" : "",
               inv.cancelled ? " (cancelled)" : "");
    return inv;
}

ProbeInvocation CapturingCapability::invoke(const ProbeCommand& cmd, std::stop_token stop) {
    ProbeInvocation inv = inner_.invoke(cmd, stop);
    if (auto res = sink_.write(cmd, inv); !res) {
        Log::warn("Raw capture for '{}' failed: {}", cmd.label, res.error());
    }
    return inv;
}

}  // namespace pathprobe
