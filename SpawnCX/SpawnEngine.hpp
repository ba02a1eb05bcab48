// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 assembler-0
// Licensed under GPL-3.0-or-later

#pragma once
#ifndef SPAWNCX_SPAWN_ENGINE_HPP
#define SPAWNCX_SPAWN_ENGINE_HPP

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <map>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <vector>

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __linux__
#include <sys/syscall.h>
#endif
#ifdef __APPLE__
extern char **environ;
#endif

#include "Constants.hpp"
#include "Descriptor.hpp"
#include "Result.hpp"

// posix_spawn can only be used when the child's working directory can be set
// and no descriptor of ours can leak into it
#if defined(__APPLE__)
#define SPAWNCX_SPAWN_ADDCHDIR 1
#define SPAWNCX_SPAWN_CLOEXEC_DEFAULT 1
#elif defined(__GLIBC__) && defined(__GLIBC_PREREQ)
#if __GLIBC_PREREQ(2, 34)
#define SPAWNCX_SPAWN_ADDCHDIR 1
#define SPAWNCX_SPAWN_ADDCLOSEFROM 1
#endif
#endif

namespace SpawnCX {

class ExecutionValidator {
public:
    template<Concepts::StringLike T>
    [[nodiscard]] static bool IsFileExecutable(T&& path) {
        const std::string_view path_view(path);
        return access(std::string(path_view).c_str(), X_OK) == 0;
    }

    /**
     * @brief Every location PATH would try for a bare command name, in order
     * @details Empty PATH entries are skipped. Falls back to "/usr/bin:/bin" if PATH is unset.
     */
    [[nodiscard]] static std::vector<std::string> SearchPath(const std::string_view command) {
        const char* path_env = getenv("PATH");
        const std::string_view path_str(path_env ? path_env : "/usr/bin:/bin");

        std::vector<std::string> candidates;
        for (const auto dir_range : std::views::split(path_str, ':')) {
            const std::string_view dir{dir_range.begin(), dir_range.end()};
            if (dir.empty()) continue;
            candidates.push_back((std::filesystem::path(dir) / command).string());
        }
        return candidates;
    }
};

/**
 * @brief Everything a SpawnEngine needs; prepared entirely before any fork
 */
struct SpawnRequest {
    std::string Program;
    std::vector<std::string> Args;
    std::optional<std::filesystem::path> WorkDir;
    std::map<std::string, std::string> Env;
    const StdioHandle* Stdio = nullptr;
};

class SpawnEngine {
public:
    virtual ~SpawnEngine() = default;

    [[nodiscard]] virtual const char* Name() const noexcept = 0;
    [[nodiscard]] virtual bool IsSupported(const SpawnRequest& request) const = 0;
    [[nodiscard]] virtual Result<pid_t> Spawn(const SpawnRequest& request) const = 0;
};

namespace Detail {
    // Owns the strings, exposes the NULL-terminated char* array exec wants
    class CStringArray {
    public:
        explicit CStringArray(std::vector<std::string> strings) : Storage(std::move(strings)) {
            Pointers.reserve(Storage.size() + 1);
            for (auto& s : Storage) Pointers.push_back(s.data());
            Pointers.push_back(nullptr);
        }

        CStringArray(const CStringArray&) = delete;
        CStringArray& operator=(const CStringArray&) = delete;

        [[nodiscard]] char* const* Data() const noexcept { return Pointers.data(); }

    private:
        std::vector<std::string> Storage;
        std::vector<char*> Pointers;
    };

    [[nodiscard]] inline CStringArray BuildArgv(const SpawnRequest& request) {
        std::vector<std::string> argv;
        argv.reserve(request.Args.size() + 1);
        argv.push_back(request.Program);
        argv.insert(argv.end(), request.Args.begin(), request.Args.end());
        return CStringArray(std::move(argv));
    }

    [[nodiscard]] inline CStringArray BuildEnvp(const SpawnRequest& request) {
        std::vector<std::string> envp;
        envp.reserve(request.Env.size());
        for (const auto& [key, value] : request.Env) envp.push_back(key + "=" + value);
        return CStringArray(std::move(envp));
    }

    /**
     * @brief Builds the most specific error it can from the inputs of a failed spawn
     * @param step What failed ("posix_spawn", "fork", "dup2", "chdir", ...)
     * @param err errno, or 0 when the child exited 127 without telling us why
     */
    [[nodiscard]] inline Error MakeSpawnError(const SpawnRequest& request, const std::string_view step, const int err) {
        std::string msg(step);
        if (err != 0) {
            msg += " failed to spawn the process >> ";
            msg += strerror(err);
            msg += '.';
        } else {
            msg += " failed in its pre-exec/exec steps and exited the child process with code[" +
                   std::to_string(Constants::EXIT_FAIL_EC) + "].";
        }

        ErrorCode code = ErrorCode::SpawnFailure;
        if (err == ENOENT) code = ErrorCode::FileNotFound;
        else if (err == EACCES || err == EPERM) code = ErrorCode::PermissionDenied;

        std::error_code ec;
        const auto& dir = request.WorkDir;
        if (dir && dir->is_absolute() && !std::filesystem::exists(*dir, ec)) {
            msg += " Directory specified for WorkingDirectory does not seem to exist.";
            code = ErrorCode::FileNotFound;
        }

        const std::filesystem::path program(request.Program);
        if (program.is_absolute() || (!dir && request.Program.find('/') != std::string::npos)) {
            if (!std::filesystem::exists(program, ec)) {
                msg += " Command[" + request.Program + "] does not seem to exist.";
                code = ErrorCode::FileNotFound;
            } else if (!ExecutionValidator::IsFileExecutable(request.Program)) {
                msg += " Command[" + request.Program + "] does not seem to have executable permissions.";
            }
        } else {
            msg += " Bad arguments for '" + request.Program + "'?";
        }

        return {code, std::move(msg), err};
    }
}

/**
 * @brief posix_spawn(3) based engine
 * @details Bare command names go through posix_spawnp, which searches the PATH of
 *          this process. Only supported where the working directory can be changed
 *          and inherited descriptors >= 3 are closed by the spawn itself.
 */
class PosixSpawnEngine final : public SpawnEngine {
public:
    [[nodiscard]] const char* Name() const noexcept override { return "posix_spawn"; }

    [[nodiscard]] bool IsSupported(const SpawnRequest&) const override {
#if defined(SPAWNCX_SPAWN_ADDCHDIR) && (defined(SPAWNCX_SPAWN_ADDCLOSEFROM) || defined(SPAWNCX_SPAWN_CLOEXEC_DEFAULT))
        return true;
#else
        return false;
#endif
    }

    [[nodiscard]] Result<pid_t> Spawn(const SpawnRequest& request) const override;
};

/**
 * @brief fork(2) + execve(2) based engine
 * @details The child reports any failure before exec as {errno, step} over a
 *          close-on-exec status pipe, then exits 127. A successful exec closes the
 *          pipe, which the parent sees as EOF.
 */
class ForkExecEngine final : public SpawnEngine {
public:
    [[nodiscard]] const char* Name() const noexcept override { return "fork+exec"; }
    [[nodiscard]] bool IsSupported(const SpawnRequest&) const override { return true; }
    [[nodiscard]] Result<pid_t> Spawn(const SpawnRequest& request) const override;

private:
    enum Step : std::uint8_t {
        STEP_DUP2 = 1,
        STEP_CLOEXEC = 2,
        STEP_CHDIR = 3,
        STEP_SIGNALS = 4,
        STEP_EXEC = 5,
    };

    static const char* StepName(const std::uint8_t step) noexcept {
        switch (step) {
            case STEP_DUP2: return "dup2";
            case STEP_CLOEXEC: return "cloexec";
            case STEP_CHDIR: return "chdir";
            case STEP_SIGNALS: return "sigprocmask";
            case STEP_EXEC: return "execve";
            default: return "fork";
        }
    }

    [[noreturn]] static void ChildFail(int status_fd, int err, std::uint8_t step) noexcept;
    static int MarkInheritedCloseOnExec(long max_fd) noexcept;
};

inline Result<pid_t> PosixSpawnEngine::Spawn(const SpawnRequest& request) const {
    const bool search_path = request.Program.find('/') == std::string::npos;
    const char* step = search_path ? "posix_spawnp" : "posix_spawn";

    posix_spawn_file_actions_t file_actions;
    posix_spawnattr_t attr;

    if (const int ret = posix_spawn_file_actions_init(&file_actions); ret != 0) {
        return Detail::MakeSpawnError(request, "posix_spawn_file_actions_init", ret);
    }
    if (const int ret = posix_spawnattr_init(&attr); ret != 0) {
        posix_spawn_file_actions_destroy(&file_actions);
        return Detail::MakeSpawnError(request, "posix_spawnattr_init", ret);
    }

    struct Cleanup {
        posix_spawn_file_actions_t* Actions;
        posix_spawnattr_t* Attr;
        ~Cleanup() {
            posix_spawn_file_actions_destroy(Actions);
            posix_spawnattr_destroy(Attr);
        }
    } cleanup{&file_actions, &attr};

    int ret = 0;
    for (const auto stream : {StdioHandle::STDIN, StdioHandle::STDOUT, StdioHandle::STDERR}) {
        const int fd = request.Stdio->ChildFd(stream);
        if (fd < 0) continue;
        if ((ret = posix_spawn_file_actions_adddup2(&file_actions, fd, stream)) != 0) {
            return Detail::MakeSpawnError(request, "posix_spawn_file_actions_adddup2", ret);
        }
    }

#ifdef SPAWNCX_SPAWN_ADDCHDIR
    if (request.WorkDir) {
        if ((ret = posix_spawn_file_actions_addchdir_np(&file_actions, request.WorkDir->c_str())) != 0) {
            return Detail::MakeSpawnError(request, "posix_spawn_file_actions_addchdir_np", ret);
        }
    }
#else
    if (request.WorkDir) {
        return Error(ErrorCode::Unsupported, "posix_spawn cannot change the working directory on this platform");
    }
#endif

#ifdef SPAWNCX_SPAWN_ADDCLOSEFROM
    if ((ret = posix_spawn_file_actions_addclosefrom_np(&file_actions, 3)) != 0) {
        return Detail::MakeSpawnError(request, "posix_spawn_file_actions_addclosefrom_np", ret);
    }
#endif

    sigset_t empty_mask;
    sigset_t default_signals;
    sigemptyset(&empty_mask);
    sigemptyset(&default_signals);
    sigaddset(&default_signals, SIGPIPE);

    short flags = POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF;
#ifdef SPAWNCX_SPAWN_CLOEXEC_DEFAULT
    flags |= POSIX_SPAWN_CLOEXEC_DEFAULT;
#endif

    if ((ret = posix_spawnattr_setsigmask(&attr, &empty_mask)) != 0 ||
        (ret = posix_spawnattr_setsigdefault(&attr, &default_signals)) != 0 ||
        (ret = posix_spawnattr_setflags(&attr, flags)) != 0) {
        return Detail::MakeSpawnError(request, "posix_spawnattr", ret);
    }

    const auto argv = Detail::BuildArgv(request);
    const auto envp = Detail::BuildEnvp(request);

    pid_t pid = -1;
    if (search_path) {
        ret = posix_spawnp(&pid, request.Program.c_str(), &file_actions, &attr, argv.Data(), envp.Data());
    } else {
        ret = posix_spawn(&pid, request.Program.c_str(), &file_actions, &attr, argv.Data(), envp.Data());
    }

    if (ret != 0) return Detail::MakeSpawnError(request, step, ret);

    if (pid <= 0) return Detail::MakeSpawnError(request, step, 0);

    return pid;
}

inline void ForkExecEngine::ChildFail(const int status_fd, const int err, const std::uint8_t step) noexcept {
    std::array<std::uint8_t, sizeof(int) + 1> report{};
    std::memcpy(report.data(), &err, sizeof(int));
    report[sizeof(int)] = step;
    while (write(status_fd, report.data(), report.size()) == -1 && errno == EINTR) {}
    _exit(Constants::EXIT_FAIL_EC);
}

// Async-signal-safe; runs in the forked child
inline int ForkExecEngine::MarkInheritedCloseOnExec(const long max_fd) noexcept {
#if defined(__linux__) && defined(SYS_close_range) && defined(CLOSE_RANGE_CLOEXEC)
    if (syscall(SYS_close_range, 3U, ~0U, CLOSE_RANGE_CLOEXEC) == 0) return 0;
#endif
    for (int fd = 3; fd < max_fd; ++fd) {
        const int fd_flags = fcntl(fd, F_GETFD);
        if (fd_flags == -1) continue;
        if (!(fd_flags & FD_CLOEXEC) && fcntl(fd, F_SETFD, fd_flags | FD_CLOEXEC) == -1) return errno;
    }
    return 0;
}

inline Result<pid_t> ForkExecEngine::Spawn(const SpawnRequest& request) const {
    // Nothing below fork() may allocate, so everything is built up front
    const auto argv = Detail::BuildArgv(request);
    const auto envp = Detail::BuildEnvp(request);

    std::vector<std::string> candidates;
    if (request.Program.find('/') != std::string::npos) {
        candidates.push_back(request.Program);
    } else {
        candidates = ExecutionValidator::SearchPath(request.Program);
    }
    const std::string work_dir = request.WorkDir ? request.WorkDir->string() : std::string();
    long max_fd = sysconf(_SC_OPEN_MAX);
    if (max_fd < 0) max_fd = 1024;

    auto status_pipe = PipePair::Create();
    if (status_pipe.IsError()) return std::move(status_pipe).Error();
    auto& [status_read, status_write] = status_pipe.Value();

    const std::array<int, 3> child_fds{
        request.Stdio->ChildFd(StdioHandle::STDIN),
        request.Stdio->ChildFd(StdioHandle::STDOUT),
        request.Stdio->ChildFd(StdioHandle::STDERR),
    };

    const pid_t pid = fork();
    if (pid == -1) return Detail::MakeSpawnError(request, "fork", errno);

    if (pid == 0) {
        const int status_fd = status_write.Get();
        ::close(status_read.Get());

        for (int target = 0; target < 3; ++target) {
            const int fd = child_fds[target];
            if (fd < 0) continue;
            if (fd == target) {
                // Already in place, only the close-on-exec bit needs clearing
                if (fcntl(fd, F_SETFD, 0) == -1) ChildFail(status_fd, errno, STEP_DUP2);
            } else if (dup2(fd, target) == -1) {
                ChildFail(status_fd, errno, STEP_DUP2);
            }
        }

        if (const int err = MarkInheritedCloseOnExec(max_fd); err != 0) ChildFail(status_fd, err, STEP_CLOEXEC);

        if (!work_dir.empty() && chdir(work_dir.c_str()) == -1) ChildFail(status_fd, errno, STEP_CHDIR);

        sigset_t empty_mask;
        sigemptyset(&empty_mask);
        struct sigaction default_action{};
        default_action.sa_handler = SIG_DFL;
        sigemptyset(&default_action.sa_mask);
        if (sigprocmask(SIG_SETMASK, &empty_mask, nullptr) == -1 ||
            sigaction(SIGPIPE, &default_action, nullptr) == -1) {
            ChildFail(status_fd, errno, STEP_SIGNALS);
        }

        // Same rules as execvp: keep going on ENOENT, remember the first EACCES
        int exec_err = ENOENT;
        bool saw_eacces = false;
        for (const auto& candidate : candidates) {
            execve(candidate.c_str(), argv.Data(), envp.Data());
            int err = errno;
            if (err == ETXTBSY) {
                timespec pause{0, 10'000'000};
                nanosleep(&pause, nullptr);
                execve(candidate.c_str(), argv.Data(), envp.Data());
                err = errno;
            }
            if (err == EACCES) {
                saw_eacces = true;
            } else if (err != ENOENT && err != ENOTDIR) {
                exec_err = err;
                break;
            }
        }
        if (saw_eacces && exec_err == ENOENT) exec_err = EACCES;
        ChildFail(status_fd, exec_err, STEP_EXEC);
    }

    static_cast<void>(status_write.Close());

    std::array<std::uint8_t, sizeof(int) + 1> report{};
    ssize_t received = 0;
    while (received < static_cast<ssize_t>(report.size())) {
        const ssize_t n = read(status_read.Get(), report.data() + received, report.size() - static_cast<size_t>(received));
        if (n == -1 && errno == EINTR) continue;
        if (n <= 0) break;
        received += n;
    }

    if (received == 0) return pid;

    // The child is exiting, reap it before reporting
    int status = 0;
    while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {}

    if (received != static_cast<ssize_t>(report.size())) {
        return Detail::MakeSpawnError(request, "fork (status pipe)", 0);
    }

    int err = 0;
    std::memcpy(&err, report.data(), sizeof(int));
    return Detail::MakeSpawnError(request, StepName(report[sizeof(int)]), err);
}

namespace SpawnEngines {
    [[nodiscard]] inline const SpawnEngine& PosixSpawn() {
        static const PosixSpawnEngine engine;
        return engine;
    }

    [[nodiscard]] inline const SpawnEngine& ForkExec() {
        static const ForkExecEngine engine;
        return engine;
    }

    [[nodiscard]] inline const SpawnEngine& Select(const SpawnRequest& request, const bool prefer_posix_spawn) {
        if (prefer_posix_spawn && PosixSpawn().IsSupported(request)) return PosixSpawn();
        return ForkExec();
    }
}

} // namespace SpawnCX

#endif
