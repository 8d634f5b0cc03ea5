/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <atomic>
#include <format>
#include <string>
#include <string_view>

namespace pathprobe::Color {
constexpr std::string_view RESET = "\033[0m";
constexpr std::string_view RED = "\033[31m";
constexpr std::string_view GREEN = "\033[32m";
constexpr std::string_view YELLOW = "\033[33m";
constexpr std::string_view BLUE = "\033[34m";
constexpr std::string_view CYAN = "\033[36m";
constexpr std::string_view GRAY = "\033[90m";
constexpr std::string_view BOLD = "\033[1m";

// Cleared by --no-color or when stdout is not a terminal.
inline std::atomic<bool> enabled{true};

inline std::string colorize(std::string_view text, std::string_view color) {
    if (!enabled.load(std::memory_order_relaxed)) {
        return std::string(text);
    }
    return std::format("{}{}{}", color, text, RESET);
}
}  // namespace pathprobe::Color
