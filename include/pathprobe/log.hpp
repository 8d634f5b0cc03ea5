/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <expected>
#include <filesystem>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace pathprobe {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

[[nodiscard]] std::string_view to_string(LogLevel level) noexcept;
[[nodiscard]] std::expected<LogLevel, std::string> parse_log_level(std::string_view raw);

namespace Log {

void set_level(LogLevel level);
[[nodiscard]] LogLevel level();

// Mirrors every line (without colors) into `path` until close_file() is called.
std::expected<void, std::string> open_file(const std::filesystem::path& path);
void close_file();

void write(LogLevel level, std::string_view message);

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args) {
    if (level() <= LogLevel::Debug)
        write(LogLevel::Debug, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args) {
    if (level() <= LogLevel::Info)
        write(LogLevel::Info, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void warn(std::format_string<Args...> fmt, Args&&... args) {
    if (level() <= LogLevel::Warn)
        write(LogLevel::Warn, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args) {
    if (level() <= LogLevel::Error)
        write(LogLevel::Error, std::format(fmt, std::forward<Args>(args)...));
}

}  // namespace Log
}  // namespace pathprobe
