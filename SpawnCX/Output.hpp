// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 assembler-0
// Licensed under GPL-3.0-or-later

#pragma once
#ifndef SPAWNCX_OUTPUT_HPP
#define SPAWNCX_OUTPUT_HPP

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "Constants.hpp"
#include "OutputFeed.hpp"
#include "OutputOptions.hpp"
#include "Process.hpp"
#include "Result.hpp"
#include "Signal.hpp"
#include "Stdio.hpp"
#include "Wait.hpp"

namespace SpawnCX {

// Snapshot of a finished process, as captured by Command::Output()
class ProcessInfo {
public:
    ProcessInfo(const pid_t pid, const int exit_code, Detail::ProcessAttributes attributes, Stdio::Config stdio)
        : ProcessId(pid), Code(exit_code), Attributes(std::move(attributes)), Streams(std::move(stdio)) {
        Attributes.Handler = nullptr;
    }

    [[nodiscard]] pid_t Pid() const noexcept { return ProcessId; }
    [[nodiscard]] int ExitCode() const noexcept { return Code; }
    [[nodiscard]] const std::string& Command() const noexcept { return Attributes.CommandName; }
    [[nodiscard]] const std::vector<std::string>& Args() const noexcept { return Attributes.Args; }
    [[nodiscard]] const std::optional<fs::path>& Cwd() const noexcept { return Attributes.Cwd; }
    [[nodiscard]] const std::map<std::string, std::string>& Environment() const noexcept { return Attributes.Env; }
    [[nodiscard]] const Stdio::Config& StdioConfig() const noexcept { return Streams; }
    [[nodiscard]] Signal DestroySignal() const noexcept { return Attributes.DestroySignal; }

    [[nodiscard]] std::string ToString() const {
        std::ostringstream out;
        Detail::AppendProcessInfo(out, "Output.ProcessInfo", ProcessId, std::to_string(Code), Attributes, Streams);
        return out.str();
    }

private:
    pid_t ProcessId;
    int Code;
    Detail::ProcessAttributes Attributes;
    Stdio::Config Streams;
};

class Output {
public:
    Output(std::string stdout_, std::string stderr_, std::optional<std::string> process_error, ProcessInfo info)
        : Stdout(std::move(stdout_)), Stderr(std::move(stderr_)), ErrorMessage(std::move(process_error)), Info(std::move(info)) {}

    [[nodiscard]] const std::string& GetStdout() const noexcept { return Stdout; }
    [[nodiscard]] const std::string& GetStderr() const noexcept { return Stderr; }

    // Why the capture is incomplete (buffer overflow, timeout, stdin failure), if it is
    [[nodiscard]] const std::optional<std::string>& GetProcessError() const noexcept { return ErrorMessage; }
    [[nodiscard]] const ProcessInfo& GetProcessInfo() const noexcept { return Info; }

    [[nodiscard]] bool IsSuccessful() const noexcept {
        return Info.ExitCode() == 0 && !ErrorMessage.has_value();
    }

    [[nodiscard]] bool HasOutput() const noexcept {
        return !Stdout.empty() || !Stderr.empty();
    }

    [[nodiscard]] std::string ToString() const {
        std::ostringstream out;
        out << "Output: [\n";
        out << "    stdout: " << Stdout << '\n';
        out << "    stderr: " << Stderr << '\n';
        out << "    processError: " << (ErrorMessage ? *ErrorMessage : std::string("null")) << '\n';
        out << "    processInfo: [\n";
        std::istringstream lines(Info.ToString());
        std::string line;
        std::getline(lines, line);
        while (std::getline(lines, line)) out << "    " << line << '\n';
        out << ']';
        return out.str();
    }

private:
    std::string Stdout;
    std::string Stderr;
    std::optional<std::string> ErrorMessage;
    ProcessInfo Info;
};

/**
 * @brief OutputFeed that accumulates lines up to a byte cap
 * @details Lines are joined with '\n'; separators count against the cap. The line
 *          that crosses the cap is truncated to fit and everything after is dropped.
 */
class OutputBuffer final : public OutputFeed {
public:
    explicit OutputBuffer(const size_t max_size) : MaxSize(max_size) {}

    void OnOutput(const std::optional<std::string_view> line) override {
        std::lock_guard lock(Mutex);
        if (!line) {
            Ended = true;
            return;
        }
        if (Exceeded) return;

        const size_t remaining = MaxSize - Data.size();
        const bool first = !HasLine;
        HasLine = true;

        if (!first) {
            if (remaining == 0) {
                Exceeded = true;
                return;
            }
            Data.push_back('\n');
        }

        const size_t room = MaxSize - Data.size();
        Data.append(line->data(), std::min(room, line->size()));
        if (Data.size() >= MaxSize) Exceeded = true;
    }

    [[nodiscard]] bool HasEnded() const noexcept { return Ended; }
    [[nodiscard]] bool IsMaxSizeExceeded() const noexcept { return Exceeded; }

    // Takes the accumulated text; the buffer is empty afterwards
    [[nodiscard]] std::string Take() {
        std::lock_guard lock(Mutex);
        return std::exchange(Data, {});
    }

private:
    const size_t MaxSize;
    std::mutex Mutex;
    std::string Data;
    bool HasLine = false;
    std::atomic<bool> Ended{false};
    std::atomic<bool> Exceeded{false};
};

namespace Detail {

    // Upper bound on the final wait for both readers to stop once destroyed
    inline constexpr auto OUTPUT_AWAIT_STOP = Constants::DESTROY_GRACE_PERIOD + std::chrono::seconds(3);

    /**
     * @brief Drives a spawned process to completion and collects its output
     * @details stdin input is written and closed first. The wait ends when both
     *          streams reach end-of-stream, a few poll ticks after the exit code is
     *          known, on timeout, or as soon as either buffer overflows. The process
     *          is always destroyed before returning.
     */
    [[nodiscard]] inline Result<SpawnCX::Output> Capture(Process process, OutputOptions options) {
        const auto start = std::chrono::steady_clock::now();
        const size_t max_buffer = options.GetMaxBuffer();

        auto stdout_buffer = std::make_shared<OutputBuffer>(max_buffer);
        auto stderr_buffer = std::make_shared<OutputBuffer>(max_buffer);
        static_cast<void>(process.StdoutFeed(stdout_buffer));
        static_cast<void>(process.StderrFeed(stderr_buffer));

        std::optional<std::string> stdin_error;
        if (auto* stdin_stream = process.Stdin()) {
            auto input = options.ConsumeInput();
            if (input.IsError()) {
                stdin_error = input.Error().GetMessage();
            } else if (const auto& text = input.Value()) {
                if (auto written = stdin_stream->Write(*text); written.IsError()) {
                    stdin_error = "stdin write failed: " + written.Error().FullMessage();
                }
            }
            if (auto closed = stdin_stream->Close(); closed.IsError() && !stdin_error) {
                stdin_error = "stdin write failed: " + closed.Error().FullMessage();
            }
        }
        options.DropAllInput();

        auto remaining = options.GetTimeout() -
                         std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        remaining = std::max(remaining, std::chrono::milliseconds(1));

        int post_exit_ticks = 0;
        const auto overflowed = [&] {
            return stdout_buffer->IsMaxSizeExceeded() || stderr_buffer->IsMaxSizeExceeded();
        };

        auto outcome = Wait::ForCondition(
            remaining,
            [&](const std::chrono::milliseconds interval) {
                if (overflowed()) return false;
                std::this_thread::sleep_for(interval);
                return !overflowed();
            },
            [&]() -> std::optional<int> {
                auto code = process.ExitCodeOrNull();
                if (!code) return std::nullopt;
                if (stdout_buffer->HasEnded() && stderr_buffer->HasEnded()) return code;
                if (++post_exit_ticks >= Constants::OUTPUT_POST_EXIT_TICKS) return code;
                return std::nullopt;
            });

        process.Destroy();
        if (!process.AwaitStop(OUTPUT_AWAIT_STOP)) {
            spdlog::warn("SpawnCX: output readers for pid {} did not stop in time", process.Pid());
        }

        auto exit_code = process.WaitFor();
        const int code = exit_code.IsOk() ? exit_code.Value() : Constants::EXIT_FAIL_EC;

        std::optional<std::string> process_error;
        if (overflowed()) {
            process_error = "maxBuffer[" + std::to_string(max_buffer) + "] exceeded";
        } else if (!outcome.Value) {
            process_error = "waitFor timed out";
        } else if (stdin_error) {
            process_error = std::move(stdin_error);
        }

        ProcessInfo info(process.Pid(), code,
                         ProcessAttributes{process.Command(), process.Args(), process.Cwd(), process.Environment(),
                                           process.DestroySignal(), process.Mode(), nullptr},
                         process.StdioConfig());

        return SpawnCX::Output(stdout_buffer->Take(), stderr_buffer->Take(), std::move(process_error), std::move(info));
    }
}

} // namespace SpawnCX

#endif
