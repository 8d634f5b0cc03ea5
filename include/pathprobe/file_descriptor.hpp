/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <expected>
#include <string>
#include <utility>

namespace pathprobe {

class FileDescriptor {
    int fd_ = -1;

   public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd);
    ~FileDescriptor() noexcept;

    FileDescriptor(FileDescriptor&& other) noexcept;
    FileDescriptor& operator=(FileDescriptor&& other) noexcept;

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    void reset(int new_fd = -1) noexcept;
    int release() noexcept;
    void swap(FileDescriptor& other) noexcept;

    [[nodiscard]] std::expected<void, std::string> set_nonblocking();

    [[nodiscard]] int get() const;

    explicit operator bool() const noexcept {
        return fd_ >= 0;
    }
};

inline void swap(FileDescriptor& a, FileDescriptor& b) noexcept {
    a.swap(b);
}

struct Pipe {
    FileDescriptor read_end;
    FileDescriptor write_end;
};

// Both ends are close-on-exec.
[[nodiscard]] std::expected<Pipe, std::string> make_pipe();

}  // namespace pathprobe
