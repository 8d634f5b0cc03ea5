/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "pathprobe/options.hpp"

#include <format>

#include "pathprobe/utils.hpp"

namespace pathprobe {

namespace {

constexpr int kMaxHopsLimit = 64;

template <typename T>
std::expected<T, std::string> ranged(std::string_view name, std::string_view raw, T lo, T hi) {
    auto v = parse_number<T>(raw);
    if (!v || *v < lo || *v > hi) {
        return std::unexpected(
            std::format("Invalid value '{}' for {} (expected {}..{})", raw, name, lo, hi));
    }
    return *v;
}

}  // namespace

std::expected<Options, std::string> parse_options(const std::vector<std::string_view>& args) {
    Options opts;

    for (std::size_t i = 0; i < args.size(); ++i) {
        std::string_view arg = args[i];
        std::string_view name = arg;
        std::optional<std::string_view> inline_value;
        if (arg.starts_with("--")) {
            if (auto eq = arg.find('='); eq != std::string_view::npos) {
                name = arg.substr(0, eq);
                inline_value = arg.substr(eq + 1);
            }
        }

        auto value = [&]() -> std::expected<std::string_view, std::string> {
            if (inline_value) return *inline_value;
            if (i + 1 >= args.size()) {
                return std::unexpected(std::format("Option '{}' requires a value", name));
            }
            return args[++i];
        };

        if (name == "-h" || name == "--help") {
            opts.show_help = true;
        } else if (name == "-v" || name == "--version") {
            opts.show_version = true;
        } else if (name == "--json") {
            opts.json = true;
        } else if (name == "--no-color") {
            opts.color = false;
        } else if (name == "--capture") {
            // Only the inline form takes a directory, so a target may follow.
            if (inline_value && inline_value->empty()) {
                return std::unexpected("Option '--capture=' requires a directory");
            }
            opts.capture_root = inline_value ? std::filesystem::path(*inline_value)
                                             : std::filesystem::path(Config::CAPTURE_ROOT);
        } else if (name == "--samples") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            auto n = ranged<int>(name, *v, 1, Config::STABILITY_MAX_SAMPLES);
            if (!n) return std::unexpected(n.error());
            opts.samples = *n;
        } else if (name == "--max-hops") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            auto n = ranged<int>(name, *v, 1, kMaxHopsLimit);
            if (!n) return std::unexpected(n.error());
            opts.max_hops = *n;
        } else if (name == "--bottleneck-delta" || name == "--bottleneck-ceiling") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            auto ms = ranged<std::int64_t>(name, *v, 1, 60'000);
            if (!ms) return std::unexpected(ms.error());
            (name == "--bottleneck-delta" ? opts.bottleneck_delta_ms : opts.bottleneck_ceiling_ms) = *ms;
        } else if (name == "--http-backend") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            if (*v == "curl") {
                opts.http_backend = HttpBackend::CurlBinary;
            } else if (*v == "libcurl") {
                opts.http_backend = HttpBackend::Libcurl;
            } else {
                return std::unexpected(
                    std::format("Invalid value '{}' for --http-backend (expected curl or libcurl)", *v));
            }
        } else if (name == "--log-level") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            auto level = parse_log_level(*v);
            if (!level) return std::unexpected(level.error());
            opts.log_level = *level;
        } else if (arg.starts_with('-') && arg.size() > 1) {
            return std::unexpected(std::format("Unknown option '{}'", arg));
        } else if (opts.target.empty()) {
            opts.target = std::string(arg);
        } else {
            return std::unexpected(std::format("Unexpected argument '{}'", arg));
        }
    }

    if (opts.target.empty() && !opts.show_help && !opts.show_version) {
        return std::unexpected("Missing target (domain or URL)");
    }
    return opts;
}

}  // namespace pathprobe
