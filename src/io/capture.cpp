/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "pathprobe/capture.hpp"

#include <cerrno>
#include <chrono>
#include <format>
#include <fstream>
#include <system_error>

#include <unistd.h>

#include "pathprobe/utils.hpp"

namespace fs = std::filesystem;

namespace pathprobe {

namespace {

std::expected<void, std::string> write_file(const fs::path& path, std::string_view content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(std::format("Cannot save file '{}': {}",
                                           path.string(),
                                           std::system_category().message(errno)));
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!out) {
        return std::unexpected(std::format("Write to '{}' failed", path.string()));
    }
    return {};
}

std::string sanitize_label(std::string_view label) {
    std::string out;
    out.reserve(label.size());
    for (char c : label) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                  c == '_' || c == '-' || c == '.';
        out += ok ? c : '_';
    }
    return out.empty() ? std::string("probe") : out;
}

}  // namespace

std::expected<std::unique_ptr<DirectoryCaptureSink>, std::string> DirectoryCaptureSink::create(
    const fs::path& root) {
    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) {
        return std::unexpected(
            std::format("Cannot create capture root '{}': {}", root.string(), ec.message()));
    }

    std::string stem = std::format(
        "{}-{}", compact_timestamp(std::chrono::system_clock::now()), static_cast<long>(::getpid()));

    for (int attempt = 0; attempt < 100; ++attempt) {
        fs::path candidate = root / (attempt == 0 ? stem : std::format("{}-{}", stem, attempt));
        if (fs::create_directory(candidate, ec)) {
            return std::make_unique<DirectoryCaptureSink>(Token{}, candidate);
        }
        if (ec) {
            return std::unexpected(std::format(
                "Cannot create capture directory '{}': {}", candidate.string(), ec.message()));
        }
    }
    return std::unexpected(std::format("No free capture directory under '{}'", root.string()));
}

std::expected<void, std::string> DirectoryCaptureSink::write(const ProbeCommand& cmd,
                                                             const ProbeInvocation& inv) {
    std::string meta = std::format(
        "command: {}\nexit_code: {}\nelapsed_ms: {}\ntimed_out: {}\ncancelled: {}\ntruncated: {}\n",
        describe(cmd),
        inv.exit_code,
        inv.elapsed_ms,
        inv.timed_out,
        inv.cancelled,
        inv.truncated);
    if (!inv.launch_error.empty()) {
        meta += std::format("launch_error: {}\n", inv.launch_error);
    }
    meta += "--- stderr ---\n";
    meta += inv.stderr_text;

    std::lock_guard lock(mutex_);
    auto stem = std::format("{:02}_{}", ++sequence_, sanitize_label(cmd.label));
    if (auto r = write_file(dir_ / (stem + ".txt"), inv.stdout_text); !r) {
        return r;
    }
    return write_file(dir_ / (stem + ".meta.txt"), meta);
}

std::expected<void, std::string> DirectoryCaptureSink::write_artifact(std::string_view name,
                                                                      std::string_view content) {
    std::lock_guard lock(mutex_);
    return write_file(dir_ / sanitize_label(name), content);
}

}  // namespace pathprobe
