// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 assembler-0
// Licensed under GPL-3.0-or-later
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <vector>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include "SpawnCX.hpp"

using namespace SpawnCX;
using namespace std::chrono_literals;

class TestRunner {
    int passed = 0;
    int failed = 0;

public:
    void Assert(const bool condition, const std::string& test_name) {
        if (condition) {
            std::cout << "[PASS] " << test_name << std::endl;
            passed++;
        } else {
            std::cout << "[FAIL] " << test_name << std::endl;
            failed++;
        }
    }

    void PrintSummary() const {
        std::cout << "\n=== Test Summary ===" << std::endl;
        std::cout << "Passed: " << passed << std::endl;
        std::cout << "Failed: " << failed << std::endl;
        std::cout << "Total: " << (passed + failed) << std::endl;
    }

    [[nodiscard]] int GetFailedCount() const { return failed; }
};

// Records every line and end-of-stream marker it receives
class LineCollector final : public OutputFeed {
public:
    void OnOutput(const std::optional<std::string_view> line) override {
        std::lock_guard lock(Mutex);
        if (line) {
            Lines.emplace_back(*line);
        } else {
            ++EndMarkers;
        }
    }

    [[nodiscard]] std::vector<std::string> GetLines() const {
        std::lock_guard lock(Mutex);
        return Lines;
    }

    [[nodiscard]] int GetEndMarkers() const {
        std::lock_guard lock(Mutex);
        return EndMarkers;
    }

private:
    mutable std::mutex Mutex;
    std::vector<std::string> Lines;
    int EndMarkers = 0;
};

static std::string MakeTempDir() {
    std::string tmpl = "/tmp/spawncxXXXXXX";
    std::vector buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    char* p = mkdtemp(buf.data());
    if (!p) return {};
    return {p};
}

static bool WriteTextFile(const std::string& path, const std::string& content) {
    std::ofstream ofs(path, std::ios::out | std::ios::trunc);
    if (!ofs) return false;
    ofs << content;
    return ofs.good();
}

static std::string ReadTextFile(const std::string& path) {
    std::ifstream ifs(path);
    std::ostringstream content;
    content << ifs.rdbuf();
    return content.str();
}

static void CleanupTemp(const std::string& dir) {
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

template<typename Predicate>
static bool WaitUntil(Predicate&& predicate, const std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return predicate();
}

static std::vector<std::string> ScanChunks(const std::string& data, const std::vector<size_t>& cuts, int& end_markers) {
    std::vector<std::string> lines;
    end_markers = 0;
    LineScanner scanner([&](const std::optional<std::string_view> line) {
        if (line) {
            lines.emplace_back(*line);
        } else {
            ++end_markers;
        }
    });

    size_t offset = 0;
    for (const size_t cut : cuts) {
        scanner.OnData(data.data() + offset, cut - offset);
        offset = cut;
    }
    scanner.OnData(data.data() + offset, data.size() - offset);
    scanner.Close();
    return lines;
}

void TestLineScanner(TestRunner& runner) {
    std::cout << "\n=== Line Scanner Tests ===" << std::endl;

    const std::string data = "one\ntwo\r\nthree\rfour\r\n\r\nfive";
    const std::vector<std::string> expected = {"one", "two", "three", "four", "", "five"};

    int end_markers = 0;
    const auto whole = ScanChunks(data, {}, end_markers);
    runner.Assert(whole == expected, "Single chunk splits on LF, CR and CRLF");
    runner.Assert(end_markers == 1, "End marker dispatched exactly once");

    bool all_splits_match = true;
    for (size_t cut = 0; cut <= data.size(); ++cut) {
        int markers = 0;
        if (ScanChunks(data, {cut}, markers) != expected || markers != 1) all_splits_match = false;
    }
    runner.Assert(all_splits_match, "Every two-chunk split yields the same lines");

    std::vector<size_t> every_byte;
    for (size_t cut = 1; cut < data.size(); ++cut) every_byte.push_back(cut);
    runner.Assert(ScanChunks(data, every_byte, end_markers) == expected, "Byte-by-byte delivery yields the same lines");

    runner.Assert(ScanChunks("a\r", {1}, end_markers) == std::vector<std::string>{"a"},
                  "CR at the end of a chunk is a terminator");
    runner.Assert(ScanChunks("a\r\nb", {2}, end_markers) == std::vector<std::string>{"a", "b"},
                  "CRLF split across chunks counts once");
    runner.Assert(ScanChunks("\r\r\n", {}, end_markers) == std::vector<std::string>{"", ""},
                  "CR followed by CRLF is two empty lines");
    runner.Assert(ScanChunks("last\n", {}, end_markers) == std::vector<std::string>{"last"},
                  "Terminated stream has no extra trailing line");
    runner.Assert(ScanChunks("", {}, end_markers).empty() && end_markers == 1, "Empty stream only ends");

    std::vector<std::string> lines;
    int closes = 0;
    LineScanner scanner([&](const std::optional<std::string_view> line) {
        if (line) lines.emplace_back(*line); else ++closes;
    });
    scanner.OnData("partial", 7);
    scanner.Close();
    scanner.Close();
    scanner.OnData("ignored\n", 8);
    runner.Assert(lines == std::vector<std::string>{"partial"}, "Unterminated segment flushed on close");
    runner.Assert(closes == 1 && scanner.IsClosed(), "Close is idempotent and data after close is ignored");

    bool rethrown = false;
    LineScanner throwing([](const std::optional<std::string_view> line) {
        if (line) throw std::runtime_error("dispatch failure");
    });
    try {
        throwing.OnData("x\n", 2);
    } catch (const std::runtime_error&) {
        rethrown = true;
    }
    runner.Assert(rethrown && throwing.IsClosed(), "Throwing dispatch closes the scanner and propagates");
}

void TestResultAndSignals(TestRunner& runner) {
    std::cout << "\n=== Result and Signal Tests ===" << std::endl;

    runner.Assert(Error::FromErrno(ErrorCode::IOError, "x", ENOENT).GetCode() == ErrorCode::FileNotFound, "ENOENT maps to FileNotFound");
    runner.Assert(Error::FromErrno(ErrorCode::IOError, "x", EACCES).GetCode() == ErrorCode::PermissionDenied, "EACCES maps to PermissionDenied");
    runner.Assert(Error::FromErrno(ErrorCode::IOError, "x", EIO).GetCode() == ErrorCode::IOError, "Other errno keeps the fallback");

    const Error error(ErrorCode::SpawnFailure, "boom", ENOENT);
    runner.Assert(error.FullMessage().find("[SpawnFailure] boom") == 0, "FullMessage carries the code name");
    runner.Assert(error.FullMessage().find("errno 2") != std::string::npos, "FullMessage carries errno");

    Result<int> ok(7);
    Result<int> failed(Error(ErrorCode::NotExited, "running"));
    runner.Assert(ok.IsOk() && ok.Value() == 7, "Result holds a value");
    runner.Assert(failed.IsError() && failed.Error().GetCode() == ErrorCode::NotExited, "Result holds an error");

    runner.Assert(SignalCode(Signal::Term) == 143, "SIGTERM code is 143");
    runner.Assert(SignalCode(Signal::Kill) == 137, "SIGKILL code is 137");
    runner.Assert(std::string(SignalInfo::GetSignalName(SIGTERM)) == "SIGTERM", "Signal name lookup");
    runner.Assert(std::string(SignalInfo::GetSignalName(Signal::Kill)) == "SIGKILL", "SIGKILL name");
}

void TestWaitProtocol(TestRunner& runner) {
    std::cout << "\n=== Wait Protocol Tests ===" << std::endl;

    int checks = 0;
    auto once = Wait::ForCondition(0ms, Wait::ThreadSleep, [&]() -> std::optional<int> {
        ++checks;
        return std::nullopt;
    });
    runner.Assert(!once.Value && !once.Aborted && checks == 1, "Zero timeout checks the condition once");

    std::vector<std::chrono::milliseconds> intervals;
    int calls = 0;
    auto found = Wait::ForCondition(
        5s,
        [&](const std::chrono::milliseconds interval) {
            intervals.push_back(interval);
            return true;
        },
        [&]() -> std::optional<int> {
            if (++calls == 4) return 42;
            return std::nullopt;
        });
    runner.Assert(found.Value == 42, "Condition value ends the wait");
    runner.Assert(intervals.size() == 3, "Sleeps between checks only");
    runner.Assert(std::ranges::all_of(intervals, [](const auto i) { return i == Constants::MAX_POLL_INTERVAL; }),
                  "Poll interval capped at 100ms");

    std::vector<std::chrono::milliseconds> short_intervals;
    static_cast<void>(Wait::ForCondition(
        30ms,
        [&](const std::chrono::milliseconds interval) {
            short_intervals.push_back(interval);
            std::this_thread::sleep_for(interval);
            return true;
        },
        []() -> std::optional<int> { return std::nullopt; }));
    runner.Assert(!short_intervals.empty() && short_intervals.front() <= 31ms, "Interval is remaining + 1ms near the deadline");

    auto aborted = Wait::ForCondition(
        5s, [](std::chrono::milliseconds) { return false; }, []() -> std::optional<int> { return std::nullopt; });
    runner.Assert(aborted.Aborted && !aborted.Value, "Sleep returning false aborts");
}

void TestStdioConfig(TestRunner& runner) {
    std::cout << "\n=== Stdio Config Tests ===" << std::endl;

    const std::string dir = MakeTempDir();
    if (dir.empty()) {
        std::cout << "[SKIP] Unable to create temp dir" << std::endl;
        return;
    }

    runner.Assert(Stdio::File("/dev/null").IsNull(), "Null device collapses to Stdio::Null()");
    runner.Assert(Stdio::File(dir + "/./a/../b.txt").GetPath() == std::filesystem::path(dir + "/b.txt"), "File paths are normalized");
    runner.Assert(Stdio::Pipe().ToString() == "Stdio.Pipe", "Pipe ToString");
    runner.Assert(Stdio::File("/tmp/x", true).ToString() == "Stdio.File[file=/tmp/x, append=true]", "File ToString");

    Stdio::Config::Builder defaults;
    auto config = defaults.Build();
    runner.Assert(config.IsOk() && config.Value().GetStdin().IsPipe() && config.Value().GetStdout().IsPipe(),
                  "Defaults are all Pipe");

    const OutputOptions no_input = OutputOptions::Builder().Build();
    config = defaults.Build(&no_input);
    runner.Assert(config.IsOk() && config.Value().GetStdin().IsNull(), "Output mode without input nulls stdin");

    const OutputOptions with_input = OutputOptions::Builder().InputUtf8([] { return std::string("x"); }).Build();
    Stdio::Config::Builder inherit_stdout;
    inherit_stdout.Stdin = Stdio::Inherit();
    inherit_stdout.Stdout = Stdio::Inherit();
    config = inherit_stdout.Build(&with_input);
    runner.Assert(config.IsOk() && config.Value().GetStdin().IsPipe() && config.Value().GetStdout().IsPipe(),
                  "Output mode pipes stdin for input and forces stdout to Pipe");

    const std::string input_path = dir + "/input.txt";
    WriteTextFile(input_path, "from file\n");

    Stdio::Config::Builder append_stdin;
    append_stdin.Stdin = Stdio::File(input_path, true);
    config = append_stdin.Build();
    runner.Assert(config.IsOk() && !config.Value().GetStdin().IsAppend(), "Append on stdin is dropped");

    Stdio::Config::Builder missing_stdin;
    missing_stdin.Stdin = Stdio::File(dir + "/missing.txt");
    config = missing_stdin.Build();
    runner.Assert(config.IsError() && config.Error().GetCode() == ErrorCode::FileNotFound, "Missing stdin file rejected");

    Stdio::Config::Builder same_file;
    same_file.Stdin = Stdio::File(input_path);
    same_file.Stdout = Stdio::File(input_path);
    config = same_file.Build();
    runner.Assert(config.IsError() && config.Error().GetCode() == ErrorCode::InvalidArgument, "stdout same as stdin rejected");

    Stdio::Config::Builder nested;
    nested.Stdout = Stdio::File(dir + "/logs/nested/out.txt");
    nested.Stderr = Stdio::File(dir + "/logs/nested/../nested/out.txt");
    config = nested.Build();
    runner.Assert(config.IsOk() && std::filesystem::is_directory(dir + "/logs/nested"), "Parent directories created");
    runner.Assert(config.IsOk() && config.Value().IsStderrSameFileAsStdout(), "stderr sharing stdout file detected");

    CleanupTemp(dir);
}

void TestOutputOptions(TestRunner& runner) {
    std::cout << "\n=== Output Options Tests ===" << std::endl;

    const auto clamped = OutputOptions::Builder().MaxBuffer(1).TimeoutMillis(1).Build();
    runner.Assert(clamped.GetMaxBuffer() == Constants::OUTPUT_MIN_MAX_BUFFER, "MaxBuffer clamped to minimum");
    runner.Assert(clamped.GetTimeout() == 250ms, "Timeout clamped to minimum");

    const auto defaults = OutputOptions::Builder().Build();
    runner.Assert(defaults.GetMaxBuffer() == Constants::OUTPUT_DEFAULT_MAX_BUFFER, "Default MaxBuffer");
    runner.Assert(!defaults.HasInput(), "No input by default");

    int invocations = 0;
    auto options = OutputOptions::Builder().Input([&] {
        ++invocations;
        return std::vector<std::uint8_t>{'h', 'i'};
    }).Build();
    auto first = options.ConsumeInput();
    auto second = options.ConsumeInput();
    runner.Assert(first.IsOk() && first.Value() == std::optional<std::string>("hi"), "Input bytes produced");
    runner.Assert(second.IsOk() && !second.Value() && invocations == 1, "Input producer invoked at most once");

    auto throwing = OutputOptions::Builder().InputUtf8([]() -> std::string { throw std::runtime_error("no input"); }).Build();
    auto consumed = throwing.ConsumeInput();
    runner.Assert(consumed.IsError() && consumed.Error().GetCode() == ErrorCode::IOError, "Throwing producer wraps as IOError");
}

void TestOutputBuffer(TestRunner& runner) {
    std::cout << "\n=== Output Buffer Tests ===" << std::endl;

    OutputBuffer buffer(16);
    buffer.OnOutput("0123456789");
    buffer.OnOutput("abcdefghij");
    buffer.OnOutput("dropped");
    buffer.OnOutput(std::nullopt);
    runner.Assert(buffer.IsMaxSizeExceeded(), "Exceeded flag set at the cap");
    runner.Assert(buffer.HasEnded(), "End marker recorded");
    runner.Assert(buffer.Take() == "0123456789\nabcde", "Lines joined with newline and truncated exactly");

    FeedRegistry registry;
    auto feed = std::make_shared<LineCollector>();
    runner.Assert(registry.Add({feed, feed, nullptr}) == 1, "Registry deduplicates by identity");
    runner.Assert(registry.Add({feed}) == 0, "Re-registering adds nothing");

    std::vector<std::shared_ptr<OutputFeed>> cached;
    uint64_t seen = 0;
    registry.Refresh(cached, seen);
    runner.Assert(cached.size() == 1, "Refresh copies the registered feeds");
    cached.clear();
    registry.Refresh(cached, seen);
    runner.Assert(cached.empty(), "Refresh skips the copy when nothing changed");
    registry.Add({std::make_shared<LineCollector>()});
    registry.Refresh(cached, seen);
    runner.Assert(cached.size() == 2, "Refresh picks up newly added feeds");

    runner.Assert(registry.Close().size() == 2 && registry.Add({std::make_shared<LineCollector>()}) == 0,
                  "Closed registry rejects new feeds");
}

void TestBasicExecution(TestRunner& runner) {
    std::cout << "\n=== Basic Execution Tests ===" << std::endl;

    for (const bool posix_spawn : {true, false}) {
        const std::string engine = posix_spawn ? " (posix_spawn)" : " (fork+exec)";

        auto output = Command("sh").Args(Utils::Expand({"-c", "echo hi; exit 7"})).UsePosixSpawn(posix_spawn).Timeout(5s).Output();
        runner.Assert(output.IsOk(), "Shell round trip executed" + engine);

        if (output.IsOk()) {
            const auto& result = output.Value();
            runner.Assert(result.GetProcessInfo().ExitCode() == 7, "Exit code preserved" + engine);
            runner.Assert(result.GetStdout() == "hi", "Captured stdout trimmed" + engine);
            runner.Assert(!result.GetProcessError(), "No process error" + engine);
        }
    }

    auto output = Command("echo").Args(Utils::Expand({"hello", "world"})).Timeout(5s).Output();
    runner.Assert(output.IsOk() && output.Value().GetStdout() == "hello world", "Multiple args output");

    output = Command("sh").Args(Utils::Expand({"-c", "echo stdout; echo stderr >&2"})).Timeout(5s).Output();
    if (output.IsOk()) {
        runner.Assert(output.Value().GetStdout() == "stdout", "Stdout captured");
        runner.Assert(output.Value().GetStderr() == "stderr", "Stderr captured");
    }

    output = Command("seq").Args(Utils::Expand({"1", "100000"})).Output(OutputOptions::Builder().TimeoutMillis(10000).Build());
    if (output.IsOk()) {
        const auto& stdout_text = output.Value().GetStdout();
        runner.Assert(stdout_text.size() > 500000 && stdout_text.ends_with("\n100000"), "Large output captured without deadlock");
    }

    output = Command("cat").Output(OutputOptions::Builder().InputUtf8([] { return std::string("line one\nline two\n"); }).Build());
    runner.Assert(output.IsOk() && output.Value().GetStdout() == "line one\nline two", "Input written to stdin");
}

void TestCaptureLimits(TestRunner& runner) {
    std::cout << "\n=== Capture Limit Tests ===" << std::endl;

    const auto start = std::chrono::steady_clock::now();
    auto output = Command("sh").Args(Utils::Expand({"-c", "sleep 1; exit 42"}))
                      .Output(OutputOptions::Builder().TimeoutMillis(250).Build());
    const auto duration = std::chrono::steady_clock::now() - start;

    runner.Assert(output.IsOk(), "Timed out capture still returns output");
    if (output.IsOk()) {
        const auto& result = output.Value();
        runner.Assert(result.GetProcessError() == std::optional<std::string>("waitFor timed out"), "Timeout reported");
        runner.Assert(result.GetProcessInfo().ExitCode() == SignalCode(Signal::Term), "Exit code reflects the destroy signal");
        runner.Assert(duration < 1s, "Timeout enforced quickly");
    }

    output = Command("yes").Output(OutputOptions::Builder().MaxBuffer(16384).TimeoutMillis(10000).Build());
    runner.Assert(output.IsOk(), "Overflowing capture returns output");
    if (output.IsOk()) {
        const auto& result = output.Value();
        runner.Assert(result.GetStdout().size() == 16384, "Captured text capped exactly at maxBuffer");
        runner.Assert(result.GetProcessError() == std::optional<std::string>("maxBuffer[16384] exceeded"), "Buffer overflow reported");
    }

    // The background sleep keeps the pipe open long after sh exits
    const auto grandchild_start = std::chrono::steady_clock::now();
    output = Command("sh").Args(Utils::Expand({"-c", "sleep 5 & echo started"}))
                 .Output(OutputOptions::Builder().TimeoutMillis(10000).Build());
    runner.Assert(output.IsOk() && output.Value().GetStdout() == "started", "Output read while a grandchild holds the pipe");
    runner.Assert(std::chrono::steady_clock::now() - grandchild_start < 3s, "Readers stop without waiting for the grandchild");
}

void TestProcessLifecycle(TestRunner& runner) {
    std::cout << "\n=== Process Lifecycle Tests ===" << std::endl;

    auto spawned = Command("sleep").Arg("10").Spawn();
    runner.Assert(spawned.IsOk(), "Sleep spawn success");
    if (spawned.IsOk()) {
        auto& process = spawned.Value();
        runner.Assert(process.Pid() > 0, "Valid PID returned");
        runner.Assert(process.IsAlive(), "Process alive after spawn");
        runner.Assert(process.ExitCode().IsError() && process.ExitCode().Error().GetCode() == ErrorCode::NotExited,
                      "ExitCode fails while running");
        runner.Assert(process.Stdin() != nullptr, "Piped stdin available");
        runner.Assert(process.ToString().find("command: sleep") != std::string::npos, "ToString describes the process");

        std::vector<std::thread> destroyers;
        for (int i = 0; i < 8; ++i) destroyers.emplace_back([&process] { process.Destroy(); });
        for (auto& t : destroyers) t.join();
        runner.Assert(!process.IsAlive(), "Not alive as soon as destroy returns");

        const auto code = process.WaitFor(2s);
        runner.Assert(process.IsDestroyed(), "Destroyed flag set");
        runner.Assert(code.IsOk() && code.Value() == SignalCode(Signal::Term), "Destroyed process reports 143");
        runner.Assert(!process.IsAlive(), "Not alive after destroy");
        runner.Assert(process.Stdin()->IsClosed(), "Destroy closes stdin");

        bool monotonic = true;
        for (int i = 0; i < 100; ++i) {
            if (process.ExitCodeOrNull() != code.Value()) monotonic = false;
        }
        runner.Assert(monotonic, "Exit code stable once known");
    }

    int alive_after_destroy = 0;
    for (int i = 0; i < 10; ++i) {
        auto sleeper = Command("sleep").Arg("10").Spawn();
        if (sleeper.IsError()) continue;
        sleeper.Value().Destroy();
        if (sleeper.Value().IsAlive()) ++alive_after_destroy;
    }
    runner.Assert(alive_after_destroy == 0, "Destroy of a running process is never reported alive");

    spawned = Command("sleep").Arg("10").DestroySignal(Signal::Kill).Spawn();
    if (spawned.IsOk()) {
        auto& process = spawned.Value();
        process.Destroy(true);
        const auto code = process.WaitFor(2s);
        runner.Assert(code.IsOk() && code.Value() == SignalCode(Signal::Kill), "Kill destroy signal reports 137");
    }

    spawned = Command("sh").Args(Utils::Expand({"-c", "exit 3"})).Spawn();
    if (spawned.IsOk()) {
        auto& process = spawned.Value();
        const auto code = process.WaitFor();
        process.Destroy();
        runner.Assert(code.IsOk() && code.Value() == 3 && process.ExitCodeOrNull() == 3, "Natural exit never rewritten");
    }

    // Signal delivery counted by the child itself
    auto term_lines = std::make_shared<LineCollector>();
    spawned = Command("sh").Args(Utils::Expand({"-c", "trap 'echo term' TERM; echo ready; while :; do :; done"})).Spawn();
    if (spawned.IsOk()) {
        auto& process = spawned.Value();
        process.StdoutFeed(term_lines);
        WaitUntil([&] { return !term_lines->GetLines().empty(); }, 2s);

        std::vector<std::thread> destroyers;
        for (int i = 0; i < 8; ++i) destroyers.emplace_back([&process] { process.Destroy(); });
        for (auto& t : destroyers) t.join();

        process.AwaitStop(2s);
        const auto lines = term_lines->GetLines();
        runner.Assert(std::ranges::count(lines, std::string("term")) == 1, "Concurrent destroys deliver exactly one signal");
        runner.Assert(term_lines->GetEndMarkers() == 1, "End-of-stream delivered once after teardown");
    }
}

void TestOutputFeeds(TestRunner& runner) {
    std::cout << "\n=== Output Feed Tests ===" << std::endl;

    auto collector = std::make_shared<LineCollector>();
    auto spawned = Command("sh").Args(Utils::Expand({"-c", "printf 'a\\nb\\r\\nc'"})).Spawn();
    if (spawned.IsOk()) {
        auto& process = spawned.Value();
        runner.Assert(process.StdoutFeed(collector, collector) == 1, "Duplicate feed registered once");
        runner.Assert(process.StdoutFeed(collector) == 0, "Re-registration is a no-op");
        static_cast<void>(process.WaitFor());
        process.AwaitStop(2s);
        runner.Assert(collector->GetLines() == std::vector<std::string>{"a", "b", "c"}, "One dispatch per line");
        runner.Assert(collector->GetEndMarkers() == 1, "End-of-stream delivered once");
        process.Destroy();
        runner.Assert(process.StderrFeed(std::make_shared<LineCollector>()) == 0, "Registration after destroy returns 0");
    }

    auto unused = std::make_shared<LineCollector>();
    spawned = Command("echo").Arg("hidden").Stdout(Stdio::Null()).Spawn();
    if (spawned.IsOk()) {
        auto& process = spawned.Value();
        runner.Assert(process.StdoutFeed(unused) == 0, "Non-piped stdout accepts no feeds");
        static_cast<void>(process.WaitFor());
        runner.Assert(unused->GetLines().empty(), "Non-piped stdout dispatches nothing");
    }

    // A failing consumer is reported, a failing handler destroys the process
    std::mutex error_mutex;
    std::string error_context;
    std::atomic<int> errors{0};
    spawned = Command("sh").Args(Utils::Expand({"-c", "echo boom; sleep 5"}))
                  .OnError([&](const ProcessError& error) {
                      {
                          std::lock_guard lock(error_mutex);
                          error_context = error.Context;
                      }
                      ++errors;
                      throw std::runtime_error("handler failure");
                  })
                  .Spawn();
    if (spawned.IsOk()) {
        auto& process = spawned.Value();
        process.StdoutFeed(OutputFeed::Of([](const std::optional<std::string_view> line) {
            if (line) throw std::runtime_error("consumer failure");
        }));
        runner.Assert(WaitUntil([&] { return errors > 0; }, 2s), "Consumer exception routed to handler");
        {
            std::lock_guard lock(error_mutex);
            runner.Assert(error_context == "feed.stdout", "Error context names the stream");
        }
        runner.Assert(WaitUntil([&] { return process.IsDestroyed(); }, 2s), "Throwing handler destroys the process");
        const auto code = process.WaitFor(2s);
        runner.Assert(code.IsOk() && code.Value() == SignalCode(Signal::Term), "Handler-destroyed process terminated");
    }

    // Destroying from inside a feed must not deadlock on the reader
    spawned = Command("sh").Args(Utils::Expand({"-c", "echo ready; sleep 5"})).Spawn();
    if (spawned.IsOk()) {
        auto& process = spawned.Value();
        Process* self = &process;
        process.StdoutFeed(OutputFeed::Of([self](const std::optional<std::string_view> line) {
            if (line == "ready") self->Destroy(true);
        }));
        const auto code = process.WaitFor(3s);
        runner.Assert(code.IsOk() && code.Value() == SignalCode(Signal::Term), "Destroy from a feed completes");
    }
}

void TestStdinAndRedirection(TestRunner& runner) {
    std::cout << "\n=== Stdin and Redirection Tests ===" << std::endl;

    auto collector = std::make_shared<LineCollector>();
    auto spawned = Command("cat").Spawn();
    if (spawned.IsOk()) {
        auto& process = spawned.Value();
        process.StdoutFeed(collector);
        runner.Assert(process.Stdin()->Write("hello\nworld\n").IsOk(), "Write to stdin");
        runner.Assert(process.Stdin()->Close().IsOk(), "Close stdin");
        const auto code = process.WaitFor(2s);
        process.AwaitStop(2s);
        runner.Assert(code.IsOk() && code.Value() == 0, "cat exits after stdin closes");
        runner.Assert(collector->GetLines() == std::vector<std::string>{"hello", "world"}, "stdin piped through cat");
        runner.Assert(process.Stdin()->Write("late").IsError(), "Write after close fails");
    }

    const std::string dir = MakeTempDir();
    if (dir.empty()) {
        std::cout << "[SKIP] Unable to create temp dir" << std::endl;
        return;
    }

    const std::string log_path = dir + "/logs/out.log";
    spawned = Command("sh").Args(Utils::Expand({"-c", "echo out; echo err >&2"}))
                  .Stdout(Stdio::File(log_path))
                  .Stderr(Stdio::File(log_path))
                  .Spawn();
    if (spawned.IsOk()) {
        auto& process = spawned.Value();
        runner.Assert(process.Stdin() != nullptr && process.StdoutFeed(std::make_shared<LineCollector>()) == 0,
                      "File stdout is not readable through feeds");
        static_cast<void>(process.WaitFor());
        runner.Assert(ReadTextFile(log_path) == "out\nerr\n", "stdout and stderr share one file");
    }

    spawned = Command("sh").Args(Utils::Expand({"-c", "echo more"})).Stdout(Stdio::File(log_path, true)).Spawn();
    if (spawned.IsOk()) {
        static_cast<void>(spawned.Value().WaitFor());
        runner.Assert(ReadTextFile(log_path) == "out\nerr\nmore\n", "Append mode keeps existing content");
    }

    const std::string input_path = dir + "/input.txt";
    WriteTextFile(input_path, "from file\n");
    auto output = Command("cat").Stdin(Stdio::File(input_path)).Timeout(5s).Output();
    runner.Assert(output.IsOk() && output.Value().GetStdout() == "from file", "stdin read from file");

    CleanupTemp(dir);
}

void TestEnvironmentVariables(TestRunner& runner) {
    std::cout << "\n=== Environment Variable Tests ===" << std::endl;

    auto output = Command("sh").Args(Utils::Expand({"-c", "printf '%s' \"$NEW_VAR\""}))
                      .Environment("NEW_VAR", "new_value").Timeout(5s).Output();
    runner.Assert(output.IsOk() && output.Value().GetStdout() == "new_value", "New env var value visible");

    setenv("SPAWNCX_REMOVE_ME", "present", 1);
    output = Command("sh").Args(Utils::Expand({"-c", "printf '%s' \"${SPAWNCX_REMOVE_ME-unset}\""}))
                 .RemoveEnvironment("SPAWNCX_REMOVE_ME").Timeout(5s).Output();
    runner.Assert(output.IsOk() && output.Value().GetStdout() == "unset", "Removed env var absent");

    output = Command("sh").Args(Utils::Expand({"-c", "printf '%s' \"$SPAWNCX_REMOVE_ME\""})).Timeout(5s).Output();
    runner.Assert(output.IsOk() && output.Value().GetStdout() == "present", "Parent environment inherited");
    unsetenv("SPAWNCX_REMOVE_ME");

    output = Command("sh").Args(Utils::Expand({"-c", "printf '%s' \"$HOME\""}))
                 .WithEnvironment([](std::map<std::string, std::string>& env) { env["HOME"] = "/nonexistent-home"; })
                 .Timeout(5s).Output();
    runner.Assert(output.IsOk() && output.Value().GetStdout() == "/nonexistent-home", "WithEnvironment edits apply");
    runner.Assert(output.IsOk() && output.Value().GetProcessInfo().Environment().at("HOME") == "/nonexistent-home",
                  "Environment snapshot recorded");

    const char* parent_home = std::getenv("HOME");
    runner.Assert(!parent_home || std::string(parent_home) != "/nonexistent-home", "Override did not leak to parent");
}

void TestWorkingDirectory(TestRunner& runner) {
    std::cout << "\n=== Working Directory Tests ===" << std::endl;

    for (const bool posix_spawn : {true, false}) {
        const std::string engine = posix_spawn ? " (posix_spawn)" : " (fork+exec)";
        auto output = Command("pwd").WorkingDirectory("/tmp").UsePosixSpawn(posix_spawn).Timeout(5s).Output();
        runner.Assert(output.IsOk() && output.Value().GetStdout().find("tmp") != std::string::npos,
                      "Working directory set correctly" + engine);
    }

    // A relative program path resolves against our directory, not the child's
    std::error_code ec;
    const auto original = std::filesystem::current_path(ec);
    std::filesystem::current_path("/", ec);
    for (const bool posix_spawn : {true, false}) {
        const std::string engine = posix_spawn ? " (posix_spawn)" : " (fork+exec)";
        auto output = Command("./bin/sh").Args(Utils::Expand({"-c", "pwd"}))
                          .WorkingDirectory("/tmp")
                          .UsePosixSpawn(posix_spawn)
                          .Timeout(5s).Output();
        runner.Assert(output.IsOk() && output.Value().GetProcessInfo().ExitCode() == 0,
                      "Relative program path survives the directory change" + engine);
    }
    std::filesystem::current_path(original, ec);
}

void TestErrorHandling(TestRunner& runner) {
    std::cout << "\n=== Error Handling Tests ===" << std::endl;

    for (const bool posix_spawn : {true, false}) {
        const std::string engine = posix_spawn ? " (posix_spawn)" : " (fork+exec)";
        auto spawned = Command("nonexistentcommand12345").UsePosixSpawn(posix_spawn).Spawn();
        runner.Assert(spawned.IsError(), "Non-existent command fails to spawn" + engine);
        if (spawned.IsError()) {
            std::cout << "Expected error: " << spawned.Error().FullMessage() << std::endl;
            runner.Assert(spawned.Error().GetCode() == ErrorCode::FileNotFound, "Missing command is FileNotFound" + engine);
        }
    }

    auto spawned = Command("/nonexistent/bin/tool").Spawn();
    runner.Assert(spawned.IsError() && spawned.Error().GetCode() == ErrorCode::FileNotFound, "Missing absolute command rejected");

    spawned = Command("   ").Spawn();
    runner.Assert(spawned.IsError() && spawned.Error().GetCode() == ErrorCode::InvalidArgument, "Blank command rejected");

    spawned = Command("pwd").WorkingDirectory("/nonexistent/dir/12345").Spawn();
    runner.Assert(spawned.IsError() && spawned.Error().GetCode() == ErrorCode::FileNotFound, "Missing working directory rejected");

    const std::string dir = MakeTempDir();
    if (!dir.empty()) {
        const std::string script = dir + "/noexec.sh";
        WriteTextFile(script, "#!/bin/sh\necho ok\n");
        chmod(script.c_str(), 0644);
        for (const bool posix_spawn : {true, false}) {
            const std::string engine = posix_spawn ? " (posix_spawn)" : " (fork+exec)";
            spawned = Command(script).UsePosixSpawn(posix_spawn).Spawn();
            runner.Assert(spawned.IsError() && spawned.Error().GetCode() == ErrorCode::PermissionDenied,
                          "Non-executable file rejected" + engine);
        }
        runner.Assert(!ExecutionValidator::IsFileExecutable(script), "Validator sees missing exec bit");
        chmod(script.c_str(), 0755);
        runner.Assert(ExecutionValidator::IsFileExecutable(script), "Executable bit recognized");
        CleanupTemp(dir);
    }

    const auto candidates = ExecutionValidator::SearchPath("sh");
    runner.Assert(std::ranges::any_of(candidates, [](const std::string& c) { return ExecutionValidator::IsFileExecutable(c); }),
                  "sh found on PATH");
    runner.Assert(std::ranges::none_of(ExecutionValidator::SearchPath("nonexistentcmd123"),
                                       [](const std::string& c) { return ExecutionValidator::IsFileExecutable(c); }),
                  "Non-existent not executable");
}

void TestReaderModes(TestRunner& runner) {
    std::cout << "\n=== Reader Mode Tests ===" << std::endl;

    auto collector = std::make_shared<LineCollector>();
    auto spawned = Command("sh").Args(Utils::Expand({"-c", "echo one; echo two"})).Readers(ReaderMode::Cooperative).Spawn();
    if (spawned.IsOk()) {
        auto& process = spawned.Value();
        process.StdoutFeed(collector);

        const auto blocking = process.WaitFor(100ms);
        runner.Assert(blocking.IsError() && blocking.Error().GetCode() == ErrorCode::Unsupported,
                      "Blocking wait rejected in cooperative mode");

        const auto code = process.WaitForAsync(5s, [&](const std::chrono::milliseconds interval) {
            static_cast<void>(process.PumpOutput(interval));
            return true;
        });
        runner.Assert(code.IsOk() && code.Value() == 0, "Async wait with a pumping sleep");
        runner.Assert(process.AwaitStop(2s), "Pumping reaches end-of-stream");
        runner.Assert(collector->GetLines() == std::vector<std::string>{"one", "two"}, "Cooperative reader dispatches lines");
        runner.Assert(collector->GetEndMarkers() == 1, "Cooperative end-of-stream delivered once");
    }

    // A feed destroying the process mid-chunk: dispatch stays in order and ends once
    std::vector<std::string> events;
    spawned = Command("sh").Args(Utils::Expand({"-c", "i=0; while [ $i -lt 2000 ]; do echo line-$i; i=$((i+1)); done"}))
                  .Readers(ReaderMode::Cooperative)
                  .Spawn();
    if (spawned.IsOk()) {
        auto& process = spawned.Value();
        Process* self = &process;
        process.StdoutFeed(
            OutputFeed::Of([self](const std::optional<std::string_view> line) {
                if (line == "line-5") self->Destroy(true);
            }),
            OutputFeed::Of([&events](const std::optional<std::string_view> line) {
                events.emplace_back(line ? std::string(*line) : std::string("<end>"));
            }));

        runner.Assert(process.AwaitStop(5s), "Cooperative teardown after destroy from a feed");
        runner.Assert(process.IsDestroyed(), "Feed destroyed the cooperative process");
        runner.Assert(!events.empty() && events.back() == "<end>" && std::ranges::count(events, std::string("<end>")) == 1,
                      "End-of-stream delivered once and last");

        bool in_order = events.size() > 6;
        for (size_t i = 0; in_order && i + 1 < events.size(); ++i) {
            if (events[i] != "line-" + std::to_string(i)) in_order = false;
        }
        runner.Assert(in_order, "Lines after the destroying line keep their order");
    }

    auto threaded = Command("true").Spawn();
    if (threaded.IsOk()) {
        auto pumped = threaded.Value().PumpOutput();
        runner.Assert(pumped.IsError() && pumped.Error().GetCode() == ErrorCode::Unsupported, "PumpOutput rejected in thread mode");
    }

    spawned = Command("sleep").Arg("10").Spawn();
    if (spawned.IsOk()) {
        auto& process = spawned.Value();
        std::stop_source stop;
        stop.request_stop();
        const auto cancelled = process.WaitForAsync(5s, Wait::ThreadSleep, stop.get_token());
        runner.Assert(cancelled.IsError() && cancelled.Error().GetCode() == ErrorCode::Cancelled, "Cancelled async wait");
        runner.Assert(process.IsAlive() && !process.IsDestroyed(), "Cancellation leaves the process running");

        std::stop_source later;
        std::jthread canceller([&later] {
            std::this_thread::sleep_for(150ms);
            later.request_stop();
        });
        const auto start = std::chrono::steady_clock::now();
        const auto interrupted = process.WaitForAsync(5s, Wait::ThreadSleep, later.get_token());
        runner.Assert(interrupted.IsError() && std::chrono::steady_clock::now() - start < 1s, "Stop request ends a running wait");
        process.Destroy();
    }
}

#ifdef __linux__
// Closes our end of the pipe wired to the child's descriptor, without telling the library
static bool ClosePipeUnderneath(const pid_t pid, const int child_fd) {
    std::error_code ec;
    const auto target = std::filesystem::read_symlink("/proc/" + std::to_string(pid) + "/fd/" + std::to_string(child_fd), ec);
    if (ec) return false;

    int found = -1;
    for (const auto& entry : std::filesystem::directory_iterator("/proc/self/fd", ec)) {
        std::error_code link_ec;
        if (std::filesystem::read_symlink(entry.path(), link_ec) == target && !link_ec) {
            found = std::stoi(entry.path().filename().string());
            break;
        }
    }
    return found >= 0 && close(found) == 0;
}

void TestDestroyFailures(TestRunner& runner) {
    std::cout << "\n=== Destroy Failure Tests ===" << std::endl;

    std::mutex error_mutex;
    std::vector<ProcessError> errors;
    const auto record = [&](const ProcessError& error) {
        std::lock_guard lock(error_mutex);
        errors.push_back(error);
    };

    auto spawned = Command("sleep").Arg("10").OnError(record).Spawn();
    if (spawned.IsOk()) {
        auto& process = spawned.Value();
        runner.Assert(ClosePipeUnderneath(process.Pid(), STDIN_FILENO), "Located the stdin pipe");
        process.Destroy();
        {
            std::lock_guard lock(error_mutex);
            runner.Assert(errors.size() == 1 && errors.front().Context == ProcessError::CONTEXT_DESTROY,
                          "Failed stdin close reported with destroy context");
        }
        const auto code = process.WaitFor(2s);
        runner.Assert(code.IsOk() && code.Value() == SignalCode(Signal::Term), "Process still terminated");
    }

    // The handler runs on the teardown worker and destroys again, immediately
    std::atomic<int> teardown_errors{0};
    Process* current = nullptr;
    spawned = Command("sleep").Arg("10")
                  .OnError([&](const ProcessError& error) {
                      if (error.Context != ProcessError::CONTEXT_DESTROY) return;
                      ++teardown_errors;
                      current->Destroy(true);
                  })
                  .Spawn();
    if (spawned.IsOk()) {
        auto& process = spawned.Value();
        current = &process;
        runner.Assert(ClosePipeUnderneath(process.Pid(), STDOUT_FILENO), "Located the stdout pipe");
        process.Destroy();
        runner.Assert(process.AwaitStop(3s), "Teardown completes when the handler destroys immediately");
        runner.Assert(teardown_errors == 1, "Failed stdout close reported from teardown");
    }
}

void TestDescriptorIsolation(TestRunner& runner) {
    std::cout << "\n=== Descriptor Isolation Tests ===" << std::endl;

    // Inheritable on purpose: only the spawn engine can keep it out of the child
    const int devnull = open("/dev/null", O_RDONLY);
    const int leaked = devnull >= 0 ? dup2(devnull, 42) : -1;
    if (leaked != 42) {
        std::cout << "[SKIP] Unable to open an inheritable descriptor" << std::endl;
        if (devnull >= 0) close(devnull);
        return;
    }

    for (const bool posix_spawn : {true, false}) {
        const std::string engine = posix_spawn ? " (posix_spawn)" : " (fork+exec)";
        auto output = Command("sh").Args(Utils::Expand({"-c", "if [ -e /proc/$$/fd/42 ]; then echo leaked; else echo clean; fi; ls /proc/$$/fd"}))
                          .UsePosixSpawn(posix_spawn)
                          .Timeout(5s).Output();
        runner.Assert(output.IsOk() && output.Value().GetStdout().starts_with("clean"), "Parent descriptors not inherited" + engine);
    }

    close(leaked);
    close(devnull);
}
#endif

int main() {
    TestRunner runner;

    std::cout << "SpawnCX Test Suite" << std::endl;
    std::cout << "==================" << std::endl;

    TestLineScanner(runner);
    TestResultAndSignals(runner);
    TestWaitProtocol(runner);
    TestStdioConfig(runner);
    TestOutputOptions(runner);
    TestOutputBuffer(runner);
    TestBasicExecution(runner);
    TestCaptureLimits(runner);
    TestProcessLifecycle(runner);
    TestOutputFeeds(runner);
    TestStdinAndRedirection(runner);
    TestEnvironmentVariables(runner);
    TestWorkingDirectory(runner);
    TestErrorHandling(runner);
    TestReaderModes(runner);
#ifdef __linux__
    TestDestroyFailures(runner);
    TestDescriptorIsolation(runner);
#endif

    runner.PrintSummary();

    return runner.GetFailedCount();
}
