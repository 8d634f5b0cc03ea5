/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <chrono>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace pathprobe {

std::size_t get_term_width();
void print_line();
void print_centered_header(std::string_view text);

[[nodiscard]] constexpr std::string_view trim_sv(std::string_view str) noexcept {
    auto first = str.find_first_not_of(" \t\n\r\v\f");
    if (first == std::string_view::npos)
        return {};
    auto last = str.find_last_not_of(" \t\n\r\v\f");
    return str.substr(first, last - first + 1);
}

[[nodiscard]] std::string to_lower(std::string_view text);
[[nodiscard]] std::vector<std::string_view> split_lines(std::string_view text);
[[nodiscard]] std::vector<std::string_view> split_ws(std::string_view text);
[[nodiscard]] bool is_ip_address(std::string_view text);

// Keeps the first line only and caps the length, for one-line status messages.
[[nodiscard]] std::string first_line(std::string_view text, std::size_t max_len = 120);

template <typename T>
std::expected<T, std::errc> parse_number(std::string_view sv) {
    T value{};
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec == std::errc()) {
        if (ptr == sv.data() + sv.size()) {
            return value;
        }
        return std::unexpected(std::errc::invalid_argument);
    }
    return std::unexpected(ec);
}

// "12.345" (milliseconds) -> 12. Truncates the fraction, never rounds.
[[nodiscard]] std::expected<std::int64_t, std::errc> parse_millis(std::string_view sv);

// Seconds as reported by curl's write-out (0.123456) -> 123.
[[nodiscard]] std::int64_t seconds_to_millis(double seconds) noexcept;

[[nodiscard]] inline std::int64_t elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - start)
        .count();
}

[[nodiscard]] std::string utc_timestamp(std::chrono::system_clock::time_point tp);
[[nodiscard]] std::string compact_timestamp(std::chrono::system_clock::time_point tp);

}  // namespace pathprobe
