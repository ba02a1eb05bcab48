// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 assembler-0
// Licensed under GPL-3.0-or-later

#pragma once
#ifndef SPAWNCX_DESCRIPTOR_HPP
#define SPAWNCX_DESCRIPTOR_HPP

#include <array>
#include <cerrno>
#include <string>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

#include "Result.hpp"
#include "Stdio.hpp"

namespace SpawnCX {

/**
 * @brief Owning wrapper around a POSIX file descriptor
 * @details Closes on destruction. Close() reports the error instead, for paths
 *          that must surface it (Process::Destroy).
 */
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(const int fd) noexcept : Fd(fd) {}

    ~FileDescriptor() {
        if (Fd >= 0) ::close(Fd);
    }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : Fd(std::exchange(other.Fd, -1)) {}

    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            if (Fd >= 0) ::close(Fd);
            Fd = std::exchange(other.Fd, -1);
        }
        return *this;
    }

    [[nodiscard]] int Get() const noexcept { return Fd; }
    [[nodiscard]] bool IsValid() const noexcept { return Fd >= 0; }

    Result<void> Close() noexcept {
        const int fd = std::exchange(Fd, -1);
        if (fd < 0) return {};
        // The descriptor is released even when close(2) fails; retrying is unsafe
        if (::close(fd) == -1 && errno != EINTR) {
            return Error(ErrorCode::IOError, "close(" + std::to_string(fd) + ") failed", errno);
        }
        return {};
    }

private:
    int Fd = -1;
};

struct PipePair {
    FileDescriptor Read;
    FileDescriptor Write;

    // Both ends are close-on-exec; the child receives its end through dup2
    [[nodiscard]] static Result<PipePair> Create() {
        std::array<int, 2> fds{-1, -1};
#ifdef __linux__
        if (pipe2(fds.data(), O_CLOEXEC) == -1) {
            return Error(ErrorCode::IOError, "pipe2() failed", errno);
        }
#else
        if (pipe(fds.data()) == -1) {
            return Error(ErrorCode::IOError, "pipe() failed", errno);
        }
        for (const int fd : fds) {
            if (fcntl(fd, F_SETFD, FD_CLOEXEC) == -1) {
                const int err = errno;
                ::close(fds[0]);
                ::close(fds[1]);
                return Error(ErrorCode::IOError, "fcntl(FD_CLOEXEC) failed", err);
            }
        }
#endif
        return PipePair{FileDescriptor(fds[0]), FileDescriptor(fds[1])};
    }
};

/**
 * @brief The descriptors backing a Stdio::Config for one spawn
 * @details Child ends are what the child dup2()s onto 0/1/2 (-1 means inherit).
 *          Parent ends are the pipe ends this process keeps. If opening any stream
 *          fails, everything opened so far is closed before the error is returned.
 */
class StdioHandle {
public:
    enum Stream : int {
        STDIN = 0,
        STDOUT = 1,
        STDERR = 2,
    };

    [[nodiscard]] static Result<StdioHandle> Open(const Stdio::Config& config);

    [[nodiscard]] const Stdio::Config& GetConfig() const noexcept { return Config; }

    [[nodiscard]] int ChildFd(const Stream stream) const noexcept {
        if (stream == STDERR && StderrSharesStdout) return ChildEnds[STDOUT].Get();
        return ChildEnds[stream].Get();
    }

    // Called by the parent once the child exists; its copies are no longer needed
    void CloseChildSide() noexcept {
        for (auto& fd : ChildEnds) static_cast<void>(fd.Close());
    }

    [[nodiscard]] FileDescriptor TakeParentEnd(const Stream stream) noexcept {
        return std::move(ParentEnds[stream]);
    }

private:
    explicit StdioHandle(Stdio::Config config) : Config(std::move(config)) {}

    static Result<FileDescriptor> OpenFile(const Stdio& stdio, const bool is_stdin) {
        int flags = O_CLOEXEC;
        if (is_stdin) {
            flags |= O_RDONLY;
        } else {
            flags |= O_WRONLY | O_CREAT | (stdio.IsAppend() ? O_APPEND : O_TRUNC);
        }
        const int fd = ::open(stdio.GetPath().c_str(), flags, 0666);
        if (fd == -1) {
            const int err = errno;
            return Error::FromErrno(ErrorCode::IOError,
                                    std::string(is_stdin ? "stdin" : "stdout/stderr") + ": failed to open " + stdio.ToString(),
                                    err);
        }
        return FileDescriptor(fd);
    }

    Stdio::Config Config;
    std::array<FileDescriptor, 3> ChildEnds;
    std::array<FileDescriptor, 3> ParentEnds;
    bool StderrSharesStdout = false;
};

inline Result<StdioHandle> StdioHandle::Open(const Stdio::Config& config) {
    StdioHandle handle(config);
    handle.StderrSharesStdout = config.IsStderrSameFileAsStdout();

    const std::array<const Stdio*, 3> streams{&config.GetStdin(), &config.GetStdout(), &config.GetStderr()};

    for (int i = STDIN; i <= STDERR; ++i) {
        const Stdio& stdio = *streams[i];
        if (i == STDERR && handle.StderrSharesStdout) continue;

        switch (stdio.GetKind()) {
            case Stdio::Kind::Inherit:
                break;
            case Stdio::Kind::File: {
                auto fd = OpenFile(stdio, i == STDIN);
                if (fd.IsError()) return std::move(fd).Error();
                handle.ChildEnds[i] = std::move(fd).Value();
                break;
            }
            case Stdio::Kind::Pipe: {
                auto pipe_pair = PipePair::Create();
                if (pipe_pair.IsError()) return std::move(pipe_pair).Error();
                auto& [read_end, write_end] = pipe_pair.Value();
                if (i == STDIN) {
                    handle.ChildEnds[i] = std::move(read_end);
                    handle.ParentEnds[i] = std::move(write_end);
                } else {
                    handle.ChildEnds[i] = std::move(write_end);
                    handle.ParentEnds[i] = std::move(read_end);
                }
                break;
            }
        }
    }

    return handle;
}

} // namespace SpawnCX

#endif
