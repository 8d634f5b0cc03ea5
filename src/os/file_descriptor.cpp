/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "pathprobe/file_descriptor.hpp"

#include <cerrno>
#include <format>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace pathprobe {

FileDescriptor::FileDescriptor(int fd) : fd_(fd) {
    if (fd_ < -1) [[unlikely]] {
        throw std::invalid_argument(std::format("Invalid file descriptor {}", fd));
    }
}

FileDescriptor::~FileDescriptor() noexcept {
    reset();
}

FileDescriptor::FileDescriptor(FileDescriptor&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)) {}

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
    if (this != &other) {
        reset(std::exchange(other.fd_, -1));
    }
    return *this;
}

void FileDescriptor::reset(int new_fd) noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = new_fd;
}

int FileDescriptor::release() noexcept {
    return std::exchange(fd_, -1);
}

void FileDescriptor::swap(FileDescriptor& other) noexcept {
    std::swap(fd_, other.fd_);
}

std::expected<void, std::string> FileDescriptor::set_nonblocking() {
    if (fd_ < 0) {
        return std::unexpected("Cannot change flags of invalid file descriptor");
    }
    int flags = ::fcntl(fd_, F_GETFL);
    if (flags < 0 || ::fcntl(fd_, F_SETFL, flags | O_NONBLOCK) < 0) {
        return std::unexpected(std::format(
            "fcntl failed: {} (Code: {})", std::system_category().message(errno), errno));
    }
    return {};
}

int FileDescriptor::get() const {
    if (fd_ < 0) [[unlikely]] {
        throw std::logic_error("FATAL: Accessing invalid file descriptor (-1)");
    }
    return fd_;
}

std::expected<Pipe, std::string> make_pipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) == -1) {
        return std::unexpected(std::format(
            "Failed to create pipe: {}", std::system_category().message(errno)));
    }
    return Pipe{FileDescriptor(fds[0]), FileDescriptor(fds[1])};
}

}  // namespace pathprobe
