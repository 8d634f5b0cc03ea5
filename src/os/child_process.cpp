/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "pathprobe/child_process.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include "pathprobe/config.hpp"

namespace pathprobe {

namespace {

int pidfd_open(pid_t pid, unsigned int flags) {
#ifdef __NR_pidfd_open
    return static_cast<int>(syscall(__NR_pidfd_open, pid, flags));
#else
    errno = ENOSYS;
    return -1;
#endif
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// Returns false at EOF (or on a hard read error), true while the pipe is open.
bool drain(FileDescriptor& fd, std::string& sink, std::size_t& total, bool& truncated) {
    std::array<char, 4096> buffer;
    while (true) {
        ssize_t n = ::read(fd.get(), buffer.data(), buffer.size());
        if (n > 0) {
            auto count = static_cast<std::size_t>(n);
            if (total + count > Config::MAX_OUTPUT_BYTES) {
                count = Config::MAX_OUTPUT_BYTES - std::min(total, Config::MAX_OUTPUT_BYTES);
                truncated = true;
            }
            sink.append(buffer.data(), count);
            total += count;
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        return false;
    }
}

}  // namespace

ChildProcess::ChildProcess(const std::vector<std::string>& args) {
    if (args.empty()) {
        throw std::invalid_argument("ChildProcess: Empty argument list");
    }

    std::vector<std::string> args_copy = args;
    std::vector<char*> c_args;
    c_args.reserve(args_copy.size() + 1);
    for (auto& arg : args_copy) {
        c_args.push_back(arg.data());
    }
    c_args.push_back(nullptr);

    auto out = make_pipe();
    auto err = make_pipe();
    auto exec_status = make_pipe();
    if (!out) throw std::runtime_error(out.error());
    if (!err) throw std::runtime_error(err.error());
    if (!exec_status) throw std::runtime_error(exec_status.error());

    pid_t pid = ::fork();
    if (pid == -1) {
        throw std::system_error(errno, std::generic_category(), "Failed to fork process");
    }

    if (pid == 0) {
        ::setpgid(0, 0);

        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        if (::dup2(out->write_end.get(), STDOUT_FILENO) == -1) ::_exit(127);
        if (::dup2(err->write_end.get(), STDERR_FILENO) == -1) ::_exit(127);

        sigset_t empty;
        sigemptyset(&empty);
        ::sigprocmask(SIG_SETMASK, &empty, nullptr);

        ::execvp(c_args[0], c_args.data());

        int code = errno;
        [[maybe_unused]] auto val = ::write(exec_status->write_end.get(), &code, sizeof(code));
        ::_exit(127);
    }

    ::setpgid(pid, pid);
    pid_ = pid;
    started_ = std::chrono::steady_clock::now();

    out->write_end.reset();
    err->write_end.reset();
    exec_status->write_end.reset();

    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_status->read_end.get(), &exec_errno, sizeof(exec_errno));
    } while (n == -1 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        reap_blocking();
        pid_ = -1;
        throw std::system_error(exec_errno, std::generic_category(),
                                std::string("Failed to execute ") + args.front());
    }

    stdout_fd_ = std::move(out->read_end);
    stderr_fd_ = std::move(err->read_end);
    for (auto* fd : {&stdout_fd_, &stderr_fd_}) {
        if (auto res = fd->set_nonblocking(); !res) {
            terminate_group();
            throw std::runtime_error(res.error());
        }
    }
}

ChildProcess::~ChildProcess() {
    if (pid_ == -1) {
        return;
    }

    int status;
    if (::waitpid(pid_, &status, WNOHANG) == pid_) {
        return;
    }
    terminate_group();
}

void ChildProcess::terminate_group() noexcept {
    if (pid_ == -1) {
        return;
    }

    ::kill(-pid_, SIGTERM);

    bool reaped = false;
    int status;
    int pfd = pidfd_open(pid_, 0);

    if (pfd >= 0) {
        struct pollfd pfd_struct;
        pfd_struct.fd = pfd;
        pfd_struct.events = POLLIN;

        int ret = ::poll(&pfd_struct, 1, static_cast<int>(Config::KILL_GRACE.count()));
        ::close(pfd);

        if (ret > 0) {
            ::waitpid(pid_, &status, 0);
            reaped = true;
        }
    } else {
        auto deadline = std::chrono::steady_clock::now() + Config::KILL_GRACE;
        while (std::chrono::steady_clock::now() < deadline) {
            if (::waitpid(pid_, &status, WNOHANG) == pid_) {
                reaped = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    }

    // Grandchildren may still hold the group alive even if the leader exited.
    ::kill(-pid_, SIGKILL);
    if (!reaped) {
        ::waitpid(pid_, nullptr, 0);
    }
    pid_ = -1;
}

int ChildProcess::reap_blocking() noexcept {
    int status = 0;
    while (::waitpid(pid_, &status, 0) == -1) {
        if (errno != EINTR) return -1;
    }
    return decode_status(status);
}

ProcessResult ChildProcess::wait(std::chrono::milliseconds timeout, std::stop_token stop) {
    using clock = std::chrono::steady_clock;

    ProcessResult result;
    if (pid_ == -1) {
        throw std::logic_error("ChildProcess::wait called on a finished process");
    }

    const auto deadline = started_ + timeout;
    bool out_open = true;
    bool err_open = true;
    std::size_t total = 0;

    while (out_open || err_open) {
        if (stop.stop_requested()) {
            result.cancelled = true;
            break;
        }
        auto now = clock::now();
        if (now >= deadline) {
            result.timed_out = true;
            break;
        }

        auto slice = std::min<clock::duration>(deadline - now, Config::POLL_SLICE);
        int wait_ms = static_cast<int>(
            std::chrono::ceil<std::chrono::milliseconds>(slice).count());

        std::array<struct pollfd, 2> fds{};
        nfds_t count = 0;
        if (out_open) fds[count++] = {stdout_fd_.get(), POLLIN, 0};
        if (err_open) fds[count++] = {stderr_fd_.get(), POLLIN, 0};

        int ret = ::poll(fds.data(), count, wait_ms);
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "Failed to poll child pipes");
        }
        if (ret == 0) continue;

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) continue;
            bool is_out = out_open && fds[i].fd == stdout_fd_.get();
            auto& fd = is_out ? stdout_fd_ : stderr_fd_;
            auto& sink = is_out ? result.stdout_text : result.stderr_text;
            bool open = drain(fd, sink, total, result.truncated);
            if (is_out) {
                out_open = open;
            } else {
                err_open = open;
            }
        }
    }

    if (result.timed_out || result.cancelled) {
        terminate_group();
        result.exit_code = -1;
    } else {
        // Both pipes closed; the child is exiting. Bound the reap by the same deadline.
        int status = 0;
        while (true) {
            pid_t r = ::waitpid(pid_, &status, WNOHANG);
            if (r == pid_) {
                result.exit_code = decode_status(status);
                pid_ = -1;
                break;
            }
            if (r == -1 && errno != EINTR) {
                result.exit_code = -1;
                pid_ = -1;
                break;
            }
            if (stop.stop_requested() || clock::now() >= deadline) {
                result.timed_out = !stop.stop_requested();
                result.cancelled = stop.stop_requested();
                terminate_group();
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    result.elapsed_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - started_).count();
    return result;
}

}  // namespace pathprobe
