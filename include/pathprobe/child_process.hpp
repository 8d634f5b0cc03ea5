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
#include <stop_token>
#include <string>
#include <vector>

#include <sys/types.h>

#include "pathprobe/file_descriptor.hpp"

namespace pathprobe {

struct ProcessResult {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = -1;
    std::int64_t elapsed_ms = 0;
    bool timed_out = false;
    bool cancelled = false;
    bool truncated = false;
};

// A child running in its own process group with stdout and stderr captured.
// The group is terminated (SIGTERM, then SIGKILL) on timeout, on a stop
// request, or when the object is destroyed while the child is still alive.
class ChildProcess {
    FileDescriptor stdout_fd_;
    FileDescriptor stderr_fd_;
    pid_t pid_ = -1;
    std::chrono::steady_clock::time_point started_;

   public:
    // Throws std::system_error when the executable cannot be started; the
    // error code is the errno reported by execvp (ENOENT for a missing tool).
    explicit ChildProcess(const std::vector<std::string>& args);

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    [[nodiscard]] pid_t pid() const noexcept {
        return pid_;
    }

    ProcessResult wait(std::chrono::milliseconds timeout, std::stop_token stop = {});

   private:
    void terminate_group() noexcept;
    int reap_blocking() noexcept;
};

}  // namespace pathprobe
