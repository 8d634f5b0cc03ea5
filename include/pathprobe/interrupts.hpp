/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <atomic>
#include <csignal>
#include <stop_token>
#include <thread>

namespace pathprobe {

extern std::atomic<bool> g_interrupted;

void signal_handler(int) noexcept;

class SignalGuard {
   public:
    SignalGuard();
    ~SignalGuard();

    SignalGuard(const SignalGuard&) = delete;
    SignalGuard& operator=(const SignalGuard&) = delete;

   private:
    struct sigaction old_int_ {};
    struct sigaction old_term_ {};
};

// Turns SIGINT/SIGTERM into a stop request on `source`. The handler itself
// only flips g_interrupted; a watcher thread forwards it.
class InterruptBridge {
    std::stop_source& source_;
    std::jthread watcher_;

   public:
    explicit InterruptBridge(std::stop_source& source);
    ~InterruptBridge() = default;

    InterruptBridge(const InterruptBridge&) = delete;
    InterruptBridge& operator=(const InterruptBridge&) = delete;
};

}  // namespace pathprobe
