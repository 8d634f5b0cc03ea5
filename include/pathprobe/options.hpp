/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pathprobe/config.hpp"
#include "pathprobe/log.hpp"

namespace pathprobe {

enum class HttpBackend { CurlBinary, Libcurl };

struct Options {
    std::string target;
    bool json = false;
    std::optional<std::filesystem::path> capture_root;
    int samples = Config::STABILITY_SAMPLES;
    int max_hops = Config::ROUTE_MAX_HOPS;
    std::int64_t bottleneck_delta_ms = Config::BOTTLENECK_DELTA_MS;
    std::int64_t bottleneck_ceiling_ms = Config::BOTTLENECK_CEILING_MS;
    HttpBackend http_backend = HttpBackend::CurlBinary;
    LogLevel log_level = LogLevel::Warn;
    bool color = true;
    bool show_help = false;
    bool show_version = false;
};

// `args` excludes the program name. Accepts both "--opt value" and "--opt=value".
std::expected<Options, std::string> parse_options(const std::vector<std::string_view>& args);

}  // namespace pathprobe
