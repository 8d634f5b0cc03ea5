// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
// Copyright (c) 2025 Alfie Ardinata.

#include "pathprobe/interrupts.hpp"

#include <chrono>
#include <csignal>

#include "pathprobe/config.hpp"

namespace pathprobe {

std::atomic<bool> g_interrupted{false};

void signal_handler(int) noexcept {
    g_interrupted = true;
}

SignalGuard::SignalGuard() {
    struct sigaction sa = {};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);

    sigaction(SIGINT, &sa, &old_int_);
    sigaction(SIGTERM, &sa, &old_term_);
}

SignalGuard::~SignalGuard() {
    sigaction(SIGINT, &old_int_, nullptr);
    sigaction(SIGTERM, &old_term_, nullptr);
}

InterruptBridge::InterruptBridge(std::stop_source& source)
    : source_(source), watcher_([this](std::stop_token st) {
          while (!st.stop_requested()) {
              if (g_interrupted) {
                  source_.request_stop();
                  return;
              }
              std::this_thread::sleep_for(Config::POLL_SLICE);
          }
      }) {}

}  // namespace pathprobe
