// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 assembler-0
// Licensed under GPL-3.0-or-later

#pragma once
#ifndef SPAWNCX_COMMAND_HPP
#define SPAWNCX_COMMAND_HPP

#include <algorithm>
#include <cctype>
#include <chrono>
#include <exception>
#include <filesystem>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <unistd.h>

#include <spdlog/spdlog.h>

#include "Constants.hpp"
#include "Descriptor.hpp"
#include "Output.hpp"
#include "OutputFeed.hpp"
#include "OutputOptions.hpp"
#include "Process.hpp"
#include "Result.hpp"
#include "Signal.hpp"
#include "SpawnEngine.hpp"
#include "Stdio.hpp"

namespace SpawnCX {

namespace Utils {
    template<Concepts::StringLike T>
    [[nodiscard]] bool IsBlank(const T& str) noexcept {
        const std::string_view view(str);
        return std::ranges::all_of(view, [](const unsigned char c) { return std::isspace(c) != 0; });
    }

    /**
     * @brief Expand initializer list or any range-like container into a std::vector
     * @details This helper allows passing braced-init-lists to Command::Args()
     * @example Command("sh").Args(Utils::Expand({"-c", "echo hello"}))
     */
    template<Concepts::StringLike T>
    [[nodiscard]] constexpr std::vector<std::string> Expand(std::initializer_list<T> args) {
        std::vector<std::string> result;
        result.reserve(args.size());
        for (const auto& arg : args) result.emplace_back(arg);
        return result;
    }

    template<std::ranges::range R>
    requires Concepts::StringLike<std::ranges::range_value_t<R>>
    [[nodiscard]] constexpr std::vector<std::string> Expand(R&& range) {
        std::vector<std::string> result;
        if constexpr (std::ranges::sized_range<R>) result.reserve(std::ranges::size(range));
        for (const auto& item : range) result.emplace_back(item);
        return result;
    }
}

/**
 * @brief Describes a process to spawn
 * @details Nothing touches the system until Spawn() or Output(). The environment is
 *          read from this process when spawning, then the Environment(),
 *          RemoveEnvironment() and WithEnvironment() edits are applied in call order.
 */
class Command {
public:
    using EnvironmentBlock = std::function<void(std::map<std::string, std::string>&)>;

    template<Concepts::StringLike T>
    explicit Command(T&& executable) : Executable(std::forward<T>(executable)) {
        Arguments.reserve(8); // Reserve space for typical argument count
    }

    template<Concepts::StringLike T>
    Command& Arg(T&& argument) {
        Arguments.emplace_back(std::forward<T>(argument));
        return *this;
    }

    template<std::ranges::range R>
    requires Concepts::StringLike<std::ranges::range_value_t<R>>
    Command& Args(R&& arguments) {
        if constexpr (std::ranges::sized_range<R>) {
            Arguments.reserve(Arguments.size() + std::ranges::size(arguments));
        }
        for (const auto& argument : arguments) Arguments.emplace_back(argument);
        return *this;
    }

    Command& WorkingDirectory(fs::path path) {
        WorkDir = std::move(path);
        return *this;
    }

    template<Concepts::StringLike K, Concepts::StringLike V>
    Command& Environment(K&& key, V&& value) {
        EnvEdits.emplace_back([key = std::string(std::forward<K>(key)), value = std::string(std::forward<V>(value))](
                                  std::map<std::string, std::string>& env) { env[key] = value; });
        return *this;
    }

    template<Concepts::StringLike K>
    Command& RemoveEnvironment(K&& key) {
        EnvEdits.emplace_back([key = std::string(std::forward<K>(key))](std::map<std::string, std::string>& env) {
            env.erase(key);
        });
        return *this;
    }

    Command& WithEnvironment(EnvironmentBlock block) {
        if (block) EnvEdits.push_back(std::move(block));
        return *this;
    }

    Command& Stdin(Stdio source) {
        StdioBuilder.Stdin = std::move(source);
        return *this;
    }

    Command& Stdout(Stdio destination) {
        StdioBuilder.Stdout = std::move(destination);
        return *this;
    }

    Command& Stderr(Stdio destination) {
        StdioBuilder.Stderr = std::move(destination);
        return *this;
    }

    Command& DestroySignal(const Signal signal) {
        DestroyWith = signal;
        return *this;
    }

    Command& OnError(ProcessError::Handler handler) {
        Handler = std::move(handler);
        return *this;
    }

    // fork+exec is used when false, or when posix_spawn cannot honour the request
    Command& UsePosixSpawn(const bool enabled) {
        PreferPosixSpawn = enabled;
        return *this;
    }

    Command& Readers(const ReaderMode mode) {
        Mode = mode;
        return *this;
    }

    // Default timeout for Output() when called without options
    template<Concepts::DurationLike D>
    Command& Timeout(D&& duration) {
        TimeoutDuration = std::chrono::duration_cast<std::chrono::milliseconds>(std::forward<D>(duration));
        return *this;
    }

    [[nodiscard]] Result<Process> Spawn() const;

    /**
     * @brief Spawns, feeds input, waits and collects stdout/stderr
     * @details stdout and stderr are always piped; stdin is piped only when the
     *          options carry input. The process is destroyed before this returns.
     */
    [[nodiscard]] Result<SpawnCX::Output> Output(OutputOptions options) const;

    [[nodiscard]] Result<SpawnCX::Output> Output() const {
        OutputOptions::Builder builder;
        if (TimeoutDuration) builder.TimeoutAfter(*TimeoutDuration);
        return Output(builder.Build());
    }

private:
    [[nodiscard]] std::optional<Error> Validate() const;
    [[nodiscard]] std::string ResolveProgram() const;
    [[nodiscard]] Result<std::map<std::string, std::string>> SnapshotEnvironment() const;
    [[nodiscard]] Result<Process> SpawnWith(const Stdio::Config& config, ReaderMode mode) const;

    std::string Executable;
    std::vector<std::string> Arguments;
    std::optional<fs::path> WorkDir;
    std::vector<EnvironmentBlock> EnvEdits;
    Stdio::Config::Builder StdioBuilder;
    Signal DestroyWith = Signal::Term;
    ProcessError::Handler Handler = ProcessError::Ignore();
    bool PreferPosixSpawn = true;
    ReaderMode Mode = ReaderMode::Threads;
    std::optional<std::chrono::milliseconds> TimeoutDuration;
};

inline std::optional<Error> Command::Validate() const {
    if (Utils::IsBlank(Executable)) {
        return Error(ErrorCode::InvalidArgument, "command cannot be blank");
    }

    std::error_code ec;
    if (const fs::path program(Executable); program.is_absolute() && !fs::exists(program, ec)) {
        return Error(ErrorCode::FileNotFound, "Command[" + Executable + "] does not exist", ENOENT);
    }

    if (WorkDir && !fs::is_directory(*WorkDir, ec)) {
        return Error(ErrorCode::FileNotFound, "WorkingDirectory[" + WorkDir->string() + "] does not exist", ENOENT);
    }

    return std::nullopt;
}

// A relative path with a separator must resolve against our working directory,
// not the child's once it has changed directory
inline std::string Command::ResolveProgram() const {
    const fs::path program(Executable);
    if (!WorkDir || program.is_absolute() || Executable.find('/') == std::string::npos) return Executable;

    std::error_code ec;
    const fs::path absolute = fs::absolute(program, ec);
    if (ec) return Executable;
    return absolute.lexically_normal().string();
}

inline Result<std::map<std::string, std::string>> Command::SnapshotEnvironment() const {
    std::map<std::string, std::string> env;
    for (char** entry = environ; entry && *entry; ++entry) {
        const std::string_view variable(*entry);
        const size_t separator = variable.find('=');
        if (separator == std::string_view::npos || separator == 0) continue;
        env.emplace(variable.substr(0, separator), variable.substr(separator + 1));
    }

    for (const auto& edit : EnvEdits) {
        try {
            edit(env);
        } catch (const std::exception& e) {
            return Error(ErrorCode::InvalidArgument, std::string("WithEnvironment block threw: ") + e.what());
        }
    }
    return env;
}

inline Result<Process> Command::SpawnWith(const Stdio::Config& config, const ReaderMode mode) const {
    if (auto invalid = Validate()) return std::move(*invalid);

    auto env = SnapshotEnvironment();
    if (env.IsError()) return std::move(env).Error();

    SpawnRequest request;
    request.Program = ResolveProgram();
    request.Args = Arguments;
    request.WorkDir = WorkDir;
    request.Env = std::move(env).Value();

    auto handle = StdioHandle::Open(config);
    if (handle.IsError()) return std::move(handle).Error();

    auto wake = PipePair::Create();
    if (wake.IsError()) return std::move(wake).Error();

    request.Stdio = &handle.Value();
    const SpawnEngine& engine = SpawnEngines::Select(request, PreferPosixSpawn);

    auto pid = engine.Spawn(request);
    if (pid.IsError()) {
        spdlog::debug("SpawnCX: {} failed for {}: {}", engine.Name(), Executable, pid.Error().FullMessage());
        return std::move(pid).Error();
    }

    handle.Value().CloseChildSide();
    spdlog::debug("SpawnCX: spawned {} (pid {}) via {}", Executable, pid.Value(), engine.Name());

    Detail::ProcessAttributes attributes{
        Executable,
        Arguments,
        WorkDir,
        std::move(request.Env),
        DestroyWith,
        mode,
        Handler ? Handler : ProcessError::Ignore(),
    };

    return Process(std::make_unique<Detail::ProcessCore>(pid.Value(), std::move(attributes), handle.Value(),
                                                         std::move(wake).Value()));
}

inline Result<Process> Command::Spawn() const {
    auto config = StdioBuilder.Build();
    if (config.IsError()) return std::move(config).Error();
    return SpawnWith(config.Value(), Mode);
}

inline Result<SpawnCX::Output> Command::Output(OutputOptions options) const {
    auto config = StdioBuilder.Build(&options);
    if (config.IsError()) {
        options.DropAllInput();
        return std::move(config).Error();
    }

    // Capture waits with blocking sleeps, so it always runs its own reader threads
    auto process = SpawnWith(config.Value(), ReaderMode::Threads);
    if (process.IsError()) {
        options.DropAllInput();
        return std::move(process).Error();
    }

    return Detail::Capture(std::move(process).Value(), std::move(options));
}

} // namespace SpawnCX

#endif
