// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 assembler-0
// Licensed under GPL-3.0-or-later

#pragma once
#ifndef SPAWNCX_PROCESS_HPP
#define SPAWNCX_PROCESS_HPP

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <concepts>
#include <condition_variable>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <exception>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "Constants.hpp"
#include "Descriptor.hpp"
#include "LineScanner.hpp"
#include "OutputFeed.hpp"
#include "Result.hpp"
#include "Signal.hpp"
#include "Stdio.hpp"
#include "Wait.hpp"

namespace SpawnCX {

class Command;

enum class ReaderMode {
    // One reader thread per piped output stream
    Threads,
    // No threads; the owner drives output through Process::PumpOutput()
    Cooperative,
};

namespace Detail {
    // A write to a pipe whose reader exited must fail with EPIPE, not kill us
    inline void IgnoreSigpipeOnce() {
        static std::once_flag once;
        std::call_once(once, [] {
            struct sigaction current{};
            if (sigaction(SIGPIPE, nullptr, &current) == 0 && current.sa_handler == SIG_DFL) {
                signal(SIGPIPE, SIG_IGN);
                spdlog::debug("SpawnCX: SIGPIPE handling configured (ignored globally)");
            }
        });
    }
}

/**
 * @brief Write end of a child's stdin pipe
 * @details Writes block until the child has read enough. Close() is idempotent and
 *          is also performed by Process::Destroy().
 */
class StdinStream {
public:
    explicit StdinStream(FileDescriptor fd) : Fd(std::move(fd)) {
        Detail::IgnoreSigpipeOnce();
    }

    StdinStream(const StdinStream&) = delete;
    StdinStream& operator=(const StdinStream&) = delete;

    Result<void> Write(const void* data, size_t length);

    Result<void> Write(const std::string_view text) {
        return Write(text.data(), text.size());
    }

    Result<void> Close() {
        std::lock_guard lock(Mutex);
        return Fd.Close();
    }

    [[nodiscard]] bool IsClosed() const {
        std::lock_guard lock(Mutex);
        return !Fd.IsValid();
    }

private:
    mutable std::mutex Mutex;
    FileDescriptor Fd;
};

inline Result<void> StdinStream::Write(const void* data, size_t length) {
    std::lock_guard lock(Mutex);
    if (!Fd.IsValid()) return Error(ErrorCode::IOError, "StdinStream is closed");

    const auto* bytes = static_cast<const char*>(data);
    while (length > 0) {
        const ssize_t written = ::write(Fd.Get(), bytes, length);
        if (written == -1) {
            if (errno == EINTR) continue;
            const int err = errno;
            if (err == EPIPE) return Error(ErrorCode::IOError, "stdin closed by the child process", err);
            return Error(ErrorCode::IOError, "write to stdin failed", err);
        }
        bytes += written;
        length -= static_cast<size_t>(written);
    }
    return {};
}

namespace Detail {

/**
 * @brief Reads one piped output stream and dispatches its lines
 * @details Borrows the descriptor; ProcessCore owns and closes it once the
 *          reader has stopped. In Threads mode the worker polls the pipe together
 *          with the process wake pipe, so teardown never depends on the child (or a
 *          grandchild holding the write end) closing the pipe.
 */
class StreamReader {
public:
    using Reporter = std::function<void(ProcessError)>;

    StreamReader(const int fd, const std::string_view context, Reporter report, std::function<void()> on_ended)
        : Fd(fd), Context(context), Report(std::move(report)), OnEnded(std::move(on_ended)),
          Scanner([this](const std::optional<std::string_view> line) { Dispatch(line); }) {}

    ~StreamReader() { Stop(); }

    StreamReader(const StreamReader&) = delete;
    StreamReader& operator=(const StreamReader&) = delete;

    size_t Register(const std::vector<std::shared_ptr<OutputFeed>>& feeds, const ReaderMode mode, const int wake_fd) {
        std::lock_guard lock(LifecycleMutex);
        if (Stopped || Finishing) return 0;

        const size_t added = Feeds.Add(feeds);
        if (added > 0 && !Started) {
            Started = true;
            if (mode == ReaderMode::Threads) {
                Worker = std::thread(&StreamReader::Run, this, wake_fd);
                WorkerId = Worker.get_id();
            }
            spdlog::debug("SpawnCX: {} reader started (fd {})", Context, Fd);
        }
        return added;
    }

    // Threads mode: joins the worker. The wake pipe must already be signalled
    void Stop() {
        std::thread worker;
        {
            std::lock_guard lock(LifecycleMutex);
            Stopped = true;
            worker = std::move(Worker);
        }
        if (worker.joinable()) worker.join();
    }

    [[nodiscard]] int GetFd() const noexcept { return Fd; }
    [[nodiscard]] bool HasStarted() const noexcept { return Started; }
    [[nodiscard]] bool HasEnded() const noexcept { return Ended; }

    // Not started counts as stopped: nothing is listening
    [[nodiscard]] bool IsStopped() const noexcept { return !Started || Ended; }
    [[nodiscard]] bool IsActive() const noexcept { return Started && !Finishing; }

    // True while lines are being handed to feeds; the scanner must not be re-entered
    [[nodiscard]] bool IsDispatching() const noexcept { return Dispatching; }

    [[nodiscard]] bool IsWorkerThread() const {
        std::lock_guard lock(LifecycleMutex);
        return WorkerId == std::this_thread::get_id();
    }

    // Cooperative mode: one read, the descriptor is known to be ready
    void ReadAvailable() {
        if (!ReadOnce()) Finish();
    }

    // Reads whatever is already buffered in the pipe, bounded so a writer that
    // never stops cannot hold teardown hostage
    void Drain() {
        for (int i = 0; i < 16 && !Finishing; ++i) {
            pollfd pfd{Fd, POLLIN, 0};
            if (poll(&pfd, 1, 0) <= 0) break;
            if (!ReadOnce()) break;
        }
    }

    void Finish() {
        if (Finishing.exchange(true)) return;
        Dispatching = true;
        try {
            Scanner.Close();
        } catch (const std::exception& e) {
            Report(ProcessError{std::string(Context), e.what(), std::current_exception()});
        }
        Dispatching = false;
        Ended = true;
        spdlog::debug("SpawnCX: {} reader stopped (fd {})", Context, Fd);
        OnEnded();
    }

private:
    void Run(const int wake_fd) {
        while (true) {
            std::array<pollfd, 2> fds{{
                {Fd, POLLIN, 0},
                {wake_fd, POLLIN, 0},
            }};

            if (poll(fds.data(), fds.size(), -1) == -1) {
                if (errno == EINTR) continue;
                spdlog::warn("SpawnCX: {} reader poll() failed: {}", Context, strerror(errno));
                break;
            }

            if (fds[1].revents != 0) {
                Drain();
                break;
            }

            if (fds[0].revents != 0 && !ReadOnce()) break;
        }
        Finish();
    }

    // false on end-of-stream or an unrecoverable read error
    bool ReadOnce() {
        const ssize_t n = ::read(Fd, Buffer.data(), Buffer.size());
        if (n > 0) {
            Dispatching = true;
            try {
                Scanner.OnData(Buffer.data(), static_cast<size_t>(n));
            } catch (const std::exception& e) {
                Dispatching = false;
                Report(ProcessError{std::string(Context), e.what(), std::current_exception()});
                return false;
            }
            Dispatching = false;
            return true;
        }
        if (n == 0) return false;
        if (errno == EINTR || errno == EAGAIN) return true;
        spdlog::debug("SpawnCX: {} read(fd {}) failed: {}", Context, Fd, strerror(errno));
        return false;
    }

    void Dispatch(const std::optional<std::string_view> line) {
        if (!line) {
            Cached.clear();
            for (const auto& feed : Feeds.Close()) Deliver(*feed, std::nullopt);
            return;
        }
        Feeds.Refresh(Cached, CachedVersion);
        for (const auto& feed : Cached) Deliver(*feed, line);
    }

    void Deliver(OutputFeed& feed, const std::optional<std::string_view> line) {
        try {
            feed.OnOutput(line);
        } catch (const std::exception& e) {
            Report(ProcessError{std::string(Context), e.what(), std::current_exception()});
        } catch (...) {
            Report(ProcessError{std::string(Context), "OutputFeed threw a non-standard exception", std::current_exception()});
        }
    }

    const int Fd;
    const std::string_view Context;
    Reporter Report;
    std::function<void()> OnEnded;

    FeedRegistry Feeds;
    std::vector<std::shared_ptr<OutputFeed>> Cached;
    uint64_t CachedVersion = 0;
    LineScanner Scanner;
    std::array<char, Constants::PIPE_BUFFER_SIZE> Buffer{};

    mutable std::mutex LifecycleMutex;
    std::thread Worker;
    std::thread::id WorkerId;
    bool Stopped = false;
    std::atomic<bool> Started{false};
    std::atomic<bool> Finishing{false};
    std::atomic<bool> Ended{false};
    std::atomic<bool> Dispatching{false};
};

struct ProcessAttributes {
    std::string CommandName;
    std::vector<std::string> Args;
    std::optional<std::filesystem::path> Cwd;
    std::map<std::string, std::string> Env;
    Signal DestroySignal = Signal::Term;
    ReaderMode Mode = ReaderMode::Threads;
    ProcessError::Handler Handler;
};

inline void AppendProcessInfo(std::ostringstream& out, const std::string_view title, const pid_t pid,
                              const std::string& exit_code, const ProcessAttributes& attributes,
                              const Stdio::Config& stdio) {
    out << title << ": [\n";
    out << "    pid: " << pid << '\n';
    out << "    exitCode: " << exit_code << '\n';
    out << "    command: " << attributes.CommandName << '\n';
    out << "    args: [";
    if (attributes.Args.empty()) {
        out << "]\n";
    } else {
        for (const auto& arg : attributes.Args) out << "\n        " << arg;
        out << "\n    ]\n";
    }
    out << "    cwd: " << (attributes.Cwd ? attributes.Cwd->string() : std::string()) << '\n';
    out << "    stdio: [\n";

    // Re-indent the nested config, dropping its header line
    std::istringstream lines(stdio.ToString());
    std::string line;
    std::getline(lines, line);
    while (std::getline(lines, line)) out << "    " << line << '\n';

    out << "    destroySignal: " << attributes.DestroySignal << '\n';
    out << ']';
}

/**
 * @brief Shared state behind a Process handle
 * @details Lock order: StateMutex is never held while calling out (handler, feeds,
 *          joins). Only this class closes the stdout/stderr descriptors, and only
 *          after their readers have stopped.
 */
class ProcessCore {
public:
    ProcessCore(const pid_t pid, ProcessAttributes attributes, StdioHandle& stdio, PipePair wake)
        : Pid(pid), Attributes(std::move(attributes)), StdioConfig(stdio.GetConfig()), Wake(std::move(wake)) {
        if (auto fd = stdio.TakeParentEnd(StdioHandle::STDIN); fd.IsValid()) {
            Stdin = std::make_unique<StdinStream>(std::move(fd));
        }
        StdoutFd = stdio.TakeParentEnd(StdioHandle::STDOUT);
        StderrFd = stdio.TakeParentEnd(StdioHandle::STDERR);

        auto report = [this](ProcessError error) { ReportError(std::move(error)); };
        auto on_ended = [this] {
            std::lock_guard lock(StopMutex);
            StopCv.notify_all();
        };
        if (StdoutFd.IsValid()) {
            StdoutReader = std::make_unique<StreamReader>(StdoutFd.Get(), ProcessError::CONTEXT_STDOUT, report, on_ended);
        }
        if (StderrFd.IsValid()) {
            StderrReader = std::make_unique<StreamReader>(StderrFd.Get(), ProcessError::CONTEXT_STDERR, report, on_ended);
        }
    }

    ~ProcessCore() { Shutdown(); }

    ProcessCore(const ProcessCore&) = delete;
    ProcessCore& operator=(const ProcessCore&) = delete;

    [[nodiscard]] std::optional<int> ExitCodeOrNull() {
        std::lock_guard lock(StateMutex);
        return PollLocked();
    }

    [[nodiscard]] bool IsDestroyed() const {
        std::lock_guard lock(StateMutex);
        return Destroyed;
    }

    // Not exited, and not already sent the destroy signal
    [[nodiscard]] bool IsAlive() {
        std::lock_guard lock(StateMutex);
        return !PollLocked() && !KnownDead;
    }

    void Destroy(bool immediate);

    size_t RegisterFeeds(StreamReader* reader, const std::vector<std::shared_ptr<OutputFeed>>& feeds) {
        if (!reader || IsDestroyed()) return 0;
        return reader->Register(feeds, Attributes.Mode, Wake.Read.Get());
    }

    [[nodiscard]] bool AwaitStop(std::optional<std::chrono::milliseconds> timeout);
    [[nodiscard]] Result<bool> PumpOutput(std::chrono::milliseconds timeout);

    [[nodiscard]] std::string ToString();

    const pid_t Pid;
    const ProcessAttributes Attributes;
    const Stdio::Config StdioConfig;
    std::unique_ptr<StdinStream> Stdin;
    std::unique_ptr<StreamReader> StdoutReader;
    std::unique_ptr<StreamReader> StderrReader;

private:
    std::optional<int> PollLocked();
    void ReportError(ProcessError error);
    void ScheduleTeardown(bool immediate);
    void TeardownLoop();
    void RunTeardown();
    void RunTeardownIfDue();
    [[nodiscard]] bool IsStopped() const;
    [[nodiscard]] bool OnReaderThread() const;
    [[nodiscard]] bool OnTeardownThread();
    [[nodiscard]] bool DispatchInProgress() const;
    void Shutdown();

    FileDescriptor StdoutFd;
    FileDescriptor StderrFd;
    PipePair Wake;

    mutable std::mutex StateMutex;
    std::optional<int> CachedExitCode;
    bool Destroyed = false;
    bool KnownDead = false;

    std::mutex TeardownMutex;
    std::condition_variable TeardownCv;
    std::optional<std::chrono::steady_clock::time_point> TeardownDeadline;
    std::thread TeardownWorker;
    std::atomic<bool> TeardownScheduled{false};
    bool TearingDown = false;
    std::atomic<bool> TeardownDone{false};

    std::mutex StopMutex;
    std::condition_variable StopCv;
};

inline std::optional<int> ProcessCore::PollLocked() {
    if (CachedExitCode) return CachedExitCode;

    int status = 0;
    pid_t result;
    do {
        result = waitpid(Pid, &status, WNOHANG);
    } while (result == -1 && errno == EINTR);

    if (result == 0) return std::nullopt;

    if (result == -1) {
        spdlog::warn("SpawnCX: waitpid({}) failed: {}", Pid, strerror(errno));
        CachedExitCode = Constants::EXIT_FAIL_EC;
        return CachedExitCode;
    }

    if (WIFEXITED(status)) {
        CachedExitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        // Same convention as the shell; a child killed by our destroy signal
        // therefore reports SignalCode(DestroySignal)
        CachedExitCode = 128 + WTERMSIG(status);
    } else {
        return std::nullopt;
    }

    spdlog::debug("SpawnCX: pid {} exited with code {}", Pid, *CachedExitCode);
    return CachedExitCode;
}

inline void ProcessCore::ReportError(ProcessError error) {
    if (!Attributes.Handler) return;
    try {
        Attributes.Handler(error);
    } catch (const std::exception& e) {
        spdlog::error("SpawnCX: ProcessError handler threw for pid {} [{}]: {}", Pid, error.Context, e.what());
        Destroy(false);
    } catch (...) {
        spdlog::error("SpawnCX: ProcessError handler threw for pid {} [{}]", Pid, error.Context);
        Destroy(false);
    }
}

inline void ProcessCore::Destroy(const bool immediate) {
    int kill_error = 0;
    {
        std::lock_guard lock(StateMutex);
        if (Destroyed) {
            if (!immediate) return;
        } else {
            Destroyed = true;
            // Signalled under the lock: the pid cannot be reaped (and reused) in between
            if (!PollLocked()) {
                if (kill(Pid, SignalNumber(Attributes.DestroySignal)) == -1 && errno != ESRCH) {
                    kill_error = errno;
                } else {
                    KnownDead = true;
                    spdlog::debug("SpawnCX: sent {} to pid {}",
                                  SignalInfo::GetSignalName(Attributes.DestroySignal), Pid);
                }
            }
        }
    }

    if (kill_error != 0) {
        ReportError(ProcessError{std::string(ProcessError::CONTEXT_DESTROY),
                                 std::string("kill() failed: ") + strerror(kill_error), nullptr});
    }

    if (Stdin) {
        if (auto closed = Stdin->Close(); closed.IsError()) {
            ReportError(ProcessError{std::string(ProcessError::CONTEXT_DESTROY), closed.Error().FullMessage(), nullptr});
        }
    }

    ScheduleTeardown(immediate);
}

inline bool ProcessCore::OnReaderThread() const {
    return (StdoutReader && StdoutReader->IsWorkerThread()) || (StderrReader && StderrReader->IsWorkerThread());
}

inline bool ProcessCore::OnTeardownThread() {
    std::lock_guard lock(TeardownMutex);
    return TeardownWorker.get_id() == std::this_thread::get_id();
}

inline bool ProcessCore::DispatchInProgress() const {
    return (StdoutReader && StdoutReader->IsDispatching()) || (StderrReader && StderrReader->IsDispatching());
}

inline void ProcessCore::ScheduleTeardown(const bool immediate) {
    const auto due = std::chrono::steady_clock::now() + (immediate ? std::chrono::milliseconds(0) : Constants::DESTROY_GRACE_PERIOD);

    {
        std::lock_guard lock(TeardownMutex);
        if (!TeardownDeadline || due < *TeardownDeadline) TeardownDeadline = due;
        TeardownScheduled = true;
        if (Attributes.Mode == ReaderMode::Threads && !TeardownWorker.joinable()) {
            TeardownWorker = std::thread(&ProcessCore::TeardownLoop, this);
        }
    }
    TeardownCv.notify_all();

    if (!immediate) return;

    // Called from a feed while the scanner is mid-chunk: the next PumpOutput() tears down
    if (Attributes.Mode == ReaderMode::Cooperative) {
        if (!DispatchInProgress()) RunTeardown();
        return;
    }

    // A feed or error handler must not wait on the thread it is running on
    if (OnReaderThread() || OnTeardownThread()) return;

    std::unique_lock lock(StopMutex);
    StopCv.wait(lock, [this] { return TeardownDone.load(); });
}

inline void ProcessCore::TeardownLoop() {
    {
        std::unique_lock lock(TeardownMutex);
        while (std::chrono::steady_clock::now() < *TeardownDeadline) {
            TeardownCv.wait_until(lock, *TeardownDeadline);
        }
    }
    RunTeardown();
}

inline void ProcessCore::RunTeardown() {
    if (Attributes.Mode == ReaderMode::Cooperative && DispatchInProgress()) return;
    {
        std::lock_guard lock(TeardownMutex);
        if (TeardownDone || TearingDown) return;
        TearingDown = true;
    }

    spdlog::debug("SpawnCX: tearing down readers for pid {}", Pid);

    if (Attributes.Mode == ReaderMode::Threads) {
        constexpr char wake = 'w';
        ssize_t written;
        do {
            written = ::write(Wake.Write.Get(), &wake, 1);
        } while (written == -1 && errno == EINTR);
        if (written == -1) spdlog::warn("SpawnCX: wake pipe write failed for pid {}: {}", Pid, strerror(errno));

        if (StdoutReader) StdoutReader->Stop();
        if (StderrReader) StderrReader->Stop();
    } else {
        for (auto* reader : {StdoutReader.get(), StderrReader.get()}) {
            if (!reader) continue;
            reader->Stop();
            if (reader->HasStarted()) {
                reader->Drain();
                reader->Finish();
            }
        }
    }

    for (auto* fd : {&StdoutFd, &StderrFd}) {
        if (auto closed = fd->Close(); closed.IsError()) {
            ReportError(ProcessError{std::string(ProcessError::CONTEXT_DESTROY), closed.Error().FullMessage(), nullptr});
        }
    }

    {
        std::lock_guard lock(TeardownMutex);
        TeardownDone = true;
    }
    {
        std::lock_guard lock(StopMutex);
        StopCv.notify_all();
    }
}

inline void ProcessCore::RunTeardownIfDue() {
    {
        std::lock_guard lock(TeardownMutex);
        if (TeardownDone || !TeardownDeadline) return;
        if (std::chrono::steady_clock::now() < *TeardownDeadline) return;
    }
    RunTeardown();
}

inline bool ProcessCore::IsStopped() const {
    const bool readers_stopped = (!StdoutReader || StdoutReader->IsStopped()) &&
                                 (!StderrReader || StderrReader->IsStopped());
    return readers_stopped && (!TeardownScheduled || TeardownDone);
}

inline bool ProcessCore::AwaitStop(const std::optional<std::chrono::milliseconds> timeout) {
    if (Attributes.Mode == ReaderMode::Cooperative) {
        if (DispatchInProgress()) return IsStopped();
        const auto deadline = timeout ? std::chrono::steady_clock::now() + *timeout
                                      : std::chrono::steady_clock::time_point::max();
        while (!IsStopped()) {
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline) return false;
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            static_cast<void>(PumpOutput(std::min(remaining, Constants::MAX_POLL_INTERVAL)));
        }
        return true;
    }

    std::unique_lock lock(StopMutex);
    if (!timeout) {
        StopCv.wait(lock, [this] { return IsStopped(); });
        return true;
    }
    return StopCv.wait_for(lock, *timeout, [this] { return IsStopped(); });
}

inline Result<bool> ProcessCore::PumpOutput(const std::chrono::milliseconds timeout) {
    if (Attributes.Mode != ReaderMode::Cooperative) {
        return Error(ErrorCode::Unsupported, "PumpOutput() requires ReaderMode::Cooperative");
    }
    if (DispatchInProgress()) {
        return Error(ErrorCode::Unsupported, "PumpOutput() cannot be called from inside an OutputFeed");
    }

    RunTeardownIfDue();

    std::vector<pollfd> fds;
    std::vector<StreamReader*> readers;
    for (auto* reader : {StdoutReader.get(), StderrReader.get()}) {
        if (!reader || !reader->IsActive()) continue;
        fds.push_back({reader->GetFd(), POLLIN, 0});
        readers.push_back(reader);
    }

    if (fds.empty()) return false;

    auto wait = timeout;
    {
        std::lock_guard lock(TeardownMutex);
        if (TeardownDeadline) {
            const auto until = std::chrono::duration_cast<std::chrono::milliseconds>(
                *TeardownDeadline - std::chrono::steady_clock::now());
            wait = std::clamp(until, std::chrono::milliseconds(0), wait);
        }
    }

    const int ready = poll(fds.data(), fds.size(), static_cast<int>(wait.count()));
    if (ready == -1 && errno != EINTR) {
        return Error(ErrorCode::IOError, "poll() on process output failed", errno);
    }

    for (size_t i = 0; ready > 0 && i < fds.size(); ++i) {
        if (fds[i].revents != 0) readers[i]->ReadAvailable();
    }

    RunTeardownIfDue();

    return std::ranges::any_of(readers, [](const StreamReader* reader) { return reader->IsActive(); });
}

inline std::string ProcessCore::ToString() {
    const auto code = ExitCodeOrNull();
    std::ostringstream out;
    AppendProcessInfo(out, "Process", Pid, code ? std::to_string(*code) : std::string("not exited"), Attributes, StdioConfig);
    return out.str();
}

inline void ProcessCore::Shutdown() {
    Destroy(true);

    auto code = Wait::ForCondition(Constants::REAP_TIMEOUT, Wait::ThreadSleep, [this] { return ExitCodeOrNull(); });
    if (!code.Value) {
        std::lock_guard lock(StateMutex);
        if (!PollLocked()) {
            spdlog::warn("SpawnCX: pid {} still running {}ms after {}, sending SIGKILL", Pid,
                         Constants::REAP_TIMEOUT.count(), SignalInfo::GetSignalName(Attributes.DestroySignal));
            kill(Pid, SIGKILL);
            int status = 0;
            while (waitpid(Pid, &status, 0) == -1 && errno == EINTR) {}
            CachedExitCode = SignalCode(Signal::Kill);
        }
    }

    std::thread worker;
    {
        std::lock_guard lock(TeardownMutex);
        worker = std::move(TeardownWorker);
    }
    if (worker.joinable()) worker.join();
}

} // namespace Detail

/**
 * @brief Handle to a running (or finished) child process
 * @details Move-only. Destroying the handle destroys the process: the destroy signal
 *          is sent if it is still alive, SIGKILL follows after Constants::REAP_TIMEOUT,
 *          and the child is reaped. Do not destroy the last handle from inside an
 *          OutputFeed of the same process.
 */
class Process {
public:
    Process(Process&&) noexcept = default;
    Process& operator=(Process&&) noexcept = default;
    ~Process() = default;

    [[nodiscard]] pid_t Pid() const noexcept { return Core->Pid; }
    [[nodiscard]] const std::string& Command() const noexcept { return Core->Attributes.CommandName; }
    [[nodiscard]] const std::vector<std::string>& Args() const noexcept { return Core->Attributes.Args; }
    [[nodiscard]] const std::optional<fs::path>& Cwd() const noexcept { return Core->Attributes.Cwd; }
    [[nodiscard]] const std::map<std::string, std::string>& Environment() const noexcept { return Core->Attributes.Env; }
    [[nodiscard]] const Stdio::Config& StdioConfig() const noexcept { return Core->StdioConfig; }
    [[nodiscard]] Signal DestroySignal() const noexcept { return Core->Attributes.DestroySignal; }
    [[nodiscard]] ReaderMode Mode() const noexcept { return Core->Attributes.Mode; }

    // nullptr unless stdin is Stdio::Pipe()
    [[nodiscard]] StdinStream* Stdin() const noexcept { return Core->Stdin.get(); }

    [[nodiscard]] bool IsDestroyed() const { return Core->IsDestroyed(); }

    // The exit code, or std::nullopt while the process is running
    [[nodiscard]] std::optional<int> ExitCodeOrNull() const { return Core->ExitCodeOrNull(); }

    [[nodiscard]] Result<int> ExitCode() const {
        if (auto code = Core->ExitCodeOrNull()) return *code;
        return Error(ErrorCode::NotExited, "Process[pid=" + std::to_string(Core->Pid) + "] has not exited");
    }

    [[nodiscard]] bool IsAlive() const { return Core->IsAlive(); }

    /**
     * @brief Terminates the process with its destroy signal
     * @details Idempotent. Closes stdin and schedules reader teardown after
     *          Constants::DESTROY_GRACE_PERIOD, or right away when immediate is set
     *          (in which case this blocks until the readers have stopped).
     */
    Process& Destroy(const bool immediate = false) {
        Core->Destroy(immediate);
        return *this;
    }

    // Returns how many of the given feeds were newly registered
    size_t StdoutFeed(const std::vector<std::shared_ptr<OutputFeed>>& feeds) {
        return Core->RegisterFeeds(Core->StdoutReader.get(), feeds);
    }

    size_t StderrFeed(const std::vector<std::shared_ptr<OutputFeed>>& feeds) {
        return Core->RegisterFeeds(Core->StderrReader.get(), feeds);
    }

    template<typename... Feeds>
    requires (sizeof...(Feeds) > 0 && (std::convertible_to<Feeds, std::shared_ptr<OutputFeed>> && ...))
    size_t StdoutFeed(Feeds&&... feeds) {
        return StdoutFeed(std::vector<std::shared_ptr<OutputFeed>>{std::forward<Feeds>(feeds)...});
    }

    template<typename... Feeds>
    requires (sizeof...(Feeds) > 0 && (std::convertible_to<Feeds, std::shared_ptr<OutputFeed>> && ...))
    size_t StderrFeed(Feeds&&... feeds) {
        return StderrFeed(std::vector<std::shared_ptr<OutputFeed>>{std::forward<Feeds>(feeds)...});
    }

    /**
     * @brief Waits until both output readers have delivered end-of-stream
     * @return false if the timeout elapsed first
     */
    bool AwaitStop(const std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
        return Core->AwaitStop(timeout);
    }

    /**
     * @brief Cooperative mode only: reads and dispatches whatever output is ready
     * @return true while at least one reader has not reached end-of-stream
     */
    Result<bool> PumpOutput(const std::chrono::milliseconds timeout = std::chrono::milliseconds(0)) {
        return Core->PumpOutput(timeout);
    }

    // Blocks until the process exits
    [[nodiscard]] Result<int> WaitFor() {
        auto code = WaitFor(Wait::FOREVER);
        if (code.IsError()) return std::move(code).Error();
        return *code.Value();
    }

    /**
     * @brief Blocks for at most the given duration
     * @return The exit code, or std::nullopt if the process is still running
     */
    template<Concepts::DurationLike D>
    [[nodiscard]] Result<std::optional<int>> WaitFor(D&& duration) {
        if (Core->Attributes.Mode == ReaderMode::Cooperative) {
            return Error(ErrorCode::Unsupported, "Blocking WaitFor() is not available in ReaderMode::Cooperative");
        }
        const auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(std::forward<D>(duration));
        return Wait::ForCondition(timeout, Wait::ThreadSleep, [this] { return Core->ExitCodeOrNull(); }).Value;
    }

    /**
     * @brief Waits using the caller's own suspension primitive
     * @param sleep Suspends for the given interval; returning false aborts the wait
     * @param stop A stop request ends the wait with ErrorCode::Cancelled, the process is untouched
     */
    template<Concepts::DurationLike D, typename Sleep>
    requires std::is_invocable_r_v<bool, Sleep&, std::chrono::milliseconds>
    [[nodiscard]] Result<std::optional<int>> WaitForAsync(D&& duration, Sleep&& sleep, const std::stop_token& stop = {}) {
        const auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(std::forward<D>(duration));
        auto outcome = Wait::ForCondition(
            timeout,
            [&](const std::chrono::milliseconds interval) {
                if (stop.stop_requested()) return false;
                return static_cast<bool>(sleep(interval)) && !stop.stop_requested();
            },
            [this] { return Core->ExitCodeOrNull(); });

        if (outcome.Aborted) return Error(ErrorCode::Cancelled, "WaitForAsync() was cancelled");
        return outcome.Value;
    }

    [[nodiscard]] std::string ToString() const { return Core->ToString(); }

private:
    friend class Command;

    explicit Process(std::unique_ptr<Detail::ProcessCore> core) : Core(std::move(core)) {}

    std::unique_ptr<Detail::ProcessCore> Core;
};

} // namespace SpawnCX

#endif
