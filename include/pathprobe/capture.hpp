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
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include "pathprobe/probe_capability.hpp"

namespace pathprobe {

class RawCaptureSink {
   public:
    virtual ~RawCaptureSink() = default;

    virtual std::expected<void, std::string> write(const ProbeCommand& cmd,
                                                   const ProbeInvocation& inv) = 0;
    virtual std::expected<void, std::string> write_artifact(std::string_view name,
                                                            std::string_view content) = 0;
};

// One directory per run: <root>/<YYYYmmdd_HHMMSS_mmm>-<pid>[-n]/
// NN_<label>.txt holds stdout as the tool printed it, NN_<label>.meta.txt the
// command, exit status and stderr.
class DirectoryCaptureSink final : public RawCaptureSink {
    std::filesystem::path dir_;
    std::mutex mutex_;
    int sequence_ = 0;

    struct Token {
        explicit Token() = default;
    };

   public:
    // Only create() can produce a Token.
    DirectoryCaptureSink(Token, std::filesystem::path dir) : dir_(std::move(dir)) {}

    static std::expected<std::unique_ptr<DirectoryCaptureSink>, std::string> create(
        const std::filesystem::path& root);

    [[nodiscard]] const std::filesystem::path& dir() const noexcept {
        return dir_;
    }

    std::expected<void, std::string> write(const ProbeCommand& cmd,
                                           const ProbeInvocation& inv) override;
    std::expected<void, std::string> write_artifact(std::string_view name,
                                                    std::string_view content) override;
};

}  // namespace pathprobe
