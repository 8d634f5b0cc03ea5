// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
// Copyright (c) 2025 Alfie Ardinata.

#include "pathprobe/log.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <mutex>
#include <print>
#include <system_error>

#include "pathprobe/color.hpp"
#include "pathprobe/utils.hpp"

namespace pathprobe {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Warn};
std::mutex g_log_mutex;
std::ofstream g_log_file;

std::string_view level_color(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return Color::GRAY;
        case LogLevel::Info:
            return Color::CYAN;
        case LogLevel::Warn:
            return Color::YELLOW;
        case LogLevel::Error:
            return Color::RED;
        case LogLevel::Off:
            return Color::RESET;
    }
    return Color::RESET;
}

std::string clock_prefix() {
    auto now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    return std::format("{:%H:%M:%S}", now);
}

}  // namespace

std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Off:
            return "OFF";
    }
    return "INFO";
}

std::expected<LogLevel, std::string> parse_log_level(std::string_view raw) {
    std::string normalized = to_lower(trim_sv(raw));
    if (normalized == "debug") return LogLevel::Debug;
    if (normalized == "info") return LogLevel::Info;
    if (normalized == "warn" || normalized == "warning") return LogLevel::Warn;
    if (normalized == "error") return LogLevel::Error;
    if (normalized == "off" || normalized == "none") return LogLevel::Off;
    return std::unexpected(
        std::format("invalid log level '{}' (expected debug|info|warn|error|off)", raw));
}

namespace Log {

void set_level(LogLevel level) {
    g_level.store(level, std::memory_order_relaxed);
}

LogLevel level() {
    return g_level.load(std::memory_order_relaxed);
}

std::expected<void, std::string> open_file(const std::filesystem::path& path) {
    std::lock_guard lock(g_log_mutex);
    if (g_log_file.is_open()) {
        g_log_file.close();
    }
    g_log_file.open(path, std::ios::out | std::ios::app);
    if (!g_log_file) {
        return std::unexpected(std::format("Cannot open log file '{}': {}",
                                           path.string(),
                                           std::system_category().message(errno)));
    }
    return {};
}

void close_file() {
    std::lock_guard lock(g_log_mutex);
    if (g_log_file.is_open()) {
        g_log_file.close();
    }
}

void write(LogLevel level, std::string_view message) {
    if (level == LogLevel::Off || level < g_level.load(std::memory_order_relaxed)) {
        return;
    }

    std::string stamp = clock_prefix();
    std::string tag = std::format("[{}]", to_string(level));

    std::lock_guard lock(g_log_mutex);
    std::println(stderr, "{} {} {}", stamp, Color::colorize(tag, level_color(level)), message);
    if (g_log_file.is_open()) {
        g_log_file << stamp << ' ' << tag << ' ' << message << '\n';
        g_log_file.flush();
    }
}

}  // namespace Log
}  // namespace pathprobe
