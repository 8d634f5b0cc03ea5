#include "pathprobe/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <format>
#include <iostream>
#include <print>

#include <arpa/inet.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include "pathprobe/config.hpp"

namespace pathprobe {

std::size_t get_term_width() {
    struct winsize w;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
        return std::min(static_cast<std::size_t>(w.ws_col), Config::TERM_WIDTH);
    }
    return Config::TERM_WIDTH;
}

void print_line() {
    std::println("{:-<{}}", "", get_term_width());
    std::cout << std::flush;
}

void print_centered_header(std::string_view text) {
    std::size_t width = get_term_width();
    std::size_t text_len = text.length();

    if (text_len >= width - 2) {
        std::println("{}", text);
        return;
    }

    std::size_t remaining = width - text_len - 2;
    std::size_t left_pad = remaining / 2;
    std::size_t right_pad = remaining - left_pad;

    std::println("{0:-<{1}} {2} {0:-<{3}}", "", left_pad, text, right_pad);
}

std::string to_lower(std::string_view text) {
    std::string out(text);
    std::ranges::transform(out, out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    while (!text.empty()) {
        auto nl = text.find('\n');
        auto line = text.substr(0, nl);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        if (nl == std::string_view::npos) {
            break;
        }
        text.remove_prefix(nl + 1);
    }
    return lines;
}

std::vector<std::string_view> split_ws(std::string_view text) {
    std::vector<std::string_view> tokens;
    std::size_t pos = 0;
    while (pos < text.size()) {
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
        std::size_t start = pos;
        while (pos < text.size() && !std::isspace(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
        if (pos > start) {
            tokens.push_back(text.substr(start, pos - start));
        }
    }
    return tokens;
}

bool is_ip_address(std::string_view text) {
    if (text.empty() || text.size() > 45) {
        return false;
    }
    std::string buf(text);
    unsigned char addr[16];
    return ::inet_pton(AF_INET, buf.c_str(), addr) == 1 ||
           ::inet_pton(AF_INET6, buf.c_str(), addr) == 1;
}

std::string first_line(std::string_view text, std::size_t max_len) {
    auto nl = text.find('\n');
    std::string out(trim_sv(text.substr(0, nl)));
    if (out.size() > max_len) {
        out = out.substr(0, max_len - 3) + "...";
    }
    return out;
}

std::expected<std::int64_t, std::errc> parse_millis(std::string_view sv) {
    sv = trim_sv(sv);
    auto dot = sv.find('.');
    auto whole = sv.substr(0, dot);
    if (whole.empty()) {
        return std::unexpected(std::errc::invalid_argument);
    }
    if (dot != std::string_view::npos) {
        auto frac = sv.substr(dot + 1);
        bool digits = std::ranges::all_of(frac, [](unsigned char c) { return std::isdigit(c); });
        if (!digits) {
            return std::unexpected(std::errc::invalid_argument);
        }
    }
    return parse_number<std::int64_t>(whole);
}

std::int64_t seconds_to_millis(double seconds) noexcept {
    if (!std::isfinite(seconds) || seconds <= 0.0) {
        return 0;
    }
    // 0.29 * 1000 == 289.99999999999994
    return static_cast<std::int64_t>(std::floor(seconds * 1000.0 + 1e-6));
}

std::string utc_timestamp(std::chrono::system_clock::time_point tp) {
    auto secs = std::chrono::floor<std::chrono::seconds>(tp);
    return std::format("{:%Y-%m-%d %H:%M:%S} UTC", secs);
}

std::string compact_timestamp(std::chrono::system_clock::time_point tp) {
    auto ms = std::chrono::floor<std::chrono::milliseconds>(tp);
    auto secs = std::chrono::floor<std::chrono::seconds>(ms);
    auto frac = (ms - secs).count();
    return std::format("{:%Y%m%d_%H%M%S}_{:03}", secs, frac);
}

}  // namespace pathprobe
