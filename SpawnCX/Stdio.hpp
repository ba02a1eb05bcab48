// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 assembler-0
// Licensed under GPL-3.0-or-later

#pragma once
#ifndef SPAWNCX_STDIO_HPP
#define SPAWNCX_STDIO_HPP

#include <filesystem>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>

#include "Constants.hpp"
#include "OutputOptions.hpp"
#include "Result.hpp"

namespace SpawnCX {

namespace fs = std::filesystem;

/**
 * @brief How one standard stream of a child process is connected
 * @details Inherit shares the parent's stream, Pipe connects it to this process,
 *          File redirects it. Null is the File sentinel for the null device.
 */
class Stdio {
public:
    enum class Kind {
        Inherit,
        Pipe,
        File,
    };

    [[nodiscard]] static Stdio Inherit() { return Stdio(Kind::Inherit, {}, false); }
    [[nodiscard]] static Stdio Pipe() { return Stdio(Kind::Pipe, {}, false); }
    [[nodiscard]] static Stdio Null() { return Stdio(Kind::File, fs::path(Constants::NULL_DEVICE), false); }

    [[nodiscard]] static Stdio File(const fs::path& path, const bool append = false) {
        fs::path normalized = path.lexically_normal();
        if (normalized == fs::path(Constants::NULL_DEVICE)) return Null();
        return Stdio(Kind::File, std::move(normalized), append);
    }

    [[nodiscard]] Kind GetKind() const noexcept { return Type; }
    [[nodiscard]] bool IsInherit() const noexcept { return Type == Kind::Inherit; }
    [[nodiscard]] bool IsPipe() const noexcept { return Type == Kind::Pipe; }
    [[nodiscard]] bool IsFile() const noexcept { return Type == Kind::File; }
    [[nodiscard]] bool IsNull() const { return IsFile() && Path == fs::path(Constants::NULL_DEVICE); }
    [[nodiscard]] const fs::path& GetPath() const noexcept { return Path; }
    [[nodiscard]] bool IsAppend() const noexcept { return Append; }

    bool operator==(const Stdio& other) const {
        return Type == other.Type && Path == other.Path && Append == other.Append;
    }

    [[nodiscard]] std::string ToString() const {
        switch (Type) {
            case Kind::Inherit: return "Stdio.Inherit";
            case Kind::Pipe: return "Stdio.Pipe";
            case Kind::File: break;
        }
        std::ostringstream out;
        out << "Stdio.File[file=" << Path.string() << ", append=" << (Append ? "true" : "false") << ']';
        return out.str();
    }

    class Config;

private:
    Stdio(const Kind type, fs::path path, const bool append)
        : Type(type), Path(std::move(path)), Append(append) {}

    Kind Type;
    fs::path Path;
    bool Append;
};

namespace Utils {
    [[nodiscard]] inline bool IsCanonicallyEqual(const fs::path& a, const fs::path& b) {
        if (a == b) return true;
        std::error_code ec_a, ec_b;
        const auto canonical_a = fs::weakly_canonical(a, ec_a);
        const auto canonical_b = fs::weakly_canonical(b, ec_b);
        if (!ec_a && !ec_b) return canonical_a == canonical_b;
        return fs::absolute(a, ec_a).lexically_normal() == fs::absolute(b, ec_b).lexically_normal();
    }
}

class Stdio::Config {
public:
    class Builder {
    public:
        Stdio Stdin = Stdio::Pipe();
        Stdio Stdout = Stdio::Pipe();
        Stdio Stderr = Stdio::Pipe();

        /**
         * @brief Validates and normalizes the requested streams
         * @param options Non-null when building for Command::Output(), which forces
         *        stdout/stderr to Pipe and only pipes stdin if there is input to write.
         */
        [[nodiscard]] Result<Config> Build(const OutputOptions* options = nullptr) const;
    };

    [[nodiscard]] const Stdio& GetStdin() const noexcept { return Stdin; }
    [[nodiscard]] const Stdio& GetStdout() const noexcept { return Stdout; }
    [[nodiscard]] const Stdio& GetStderr() const noexcept { return Stderr; }

    // stderr redirected to the same file as stdout reuses stdout's descriptor
    [[nodiscard]] bool IsStderrSameFileAsStdout() const {
        if (!Stdout.IsFile() || !Stderr.IsFile()) return false;
        return Utils::IsCanonicallyEqual(Stdout.GetPath(), Stderr.GetPath());
    }

    bool operator==(const Config& other) const {
        return Stdin == other.Stdin && Stdout == other.Stdout && Stderr == other.Stderr;
    }

    [[nodiscard]] std::string ToString() const {
        std::ostringstream out;
        out << "Stdio.Config: [\n"
            << "    stdin: " << Stdin.ToString() << '\n'
            << "    stdout: " << Stdout.ToString() << '\n'
            << "    stderr: " << Stderr.ToString() << '\n'
            << ']';
        return out.str();
    }

private:
    Config(Stdio stdin_, Stdio stdout_, Stdio stderr_)
        : Stdin(std::move(stdin_)), Stdout(std::move(stdout_)), Stderr(std::move(stderr_)) {}

    Stdio Stdin;
    Stdio Stdout;
    Stdio Stderr;
};

inline Result<Stdio::Config> Stdio::Config::Builder::Build(const OutputOptions* options) const {
    const bool is_output = options != nullptr;

    Stdio stdin_ = Stdin;
    if (is_output && options->HasInput()) {
        stdin_ = Stdio::Pipe();
    } else if (is_output && stdin_.IsPipe()) {
        stdin_ = Stdio::Null();
    } else if (stdin_.IsFile() && stdin_.IsAppend()) {
        stdin_ = Stdio::File(stdin_.GetPath(), false);
    }

    if (stdin_.IsFile() && !stdin_.IsNull()) {
        std::error_code ec;
        if (!fs::exists(stdin_.GetPath(), ec)) {
            return Error(ErrorCode::FileNotFound, "stdin: " + stdin_.ToString() + " does not exist");
        }
    }

    Stdio stdout_ = is_output ? Stdio::Pipe() : Stdout;
    Stdio stderr_ = is_output ? Stdio::Pipe() : Stderr;

    for (const auto& [name, stdio] : {std::pair<const char*, const Stdio*>{"stdout", &stdout_},
                                      std::pair<const char*, const Stdio*>{"stderr", &stderr_}}) {
        if (!stdio->IsFile() || stdio->IsNull()) continue;

        if (stdin_.IsFile() && Utils::IsCanonicallyEqual(stdin_.GetPath(), stdio->GetPath())) {
            return Error(ErrorCode::InvalidArgument, std::string(name) + " cannot be the same file as stdin");
        }

        const fs::path parent = stdio->GetPath().parent_path();
        if (parent.empty()) continue;

        std::error_code ec;
        if (!fs::exists(parent, ec) && !fs::create_directories(parent, ec)) {
            return Error(ErrorCode::IOError,
                         "Failed to create parent directory for " + std::string(name) + "[" + stdio->GetPath().string() + "]",
                         ec.value());
        }
    }

    return Config(std::move(stdin_), std::move(stdout_), std::move(stderr_));
}

} // namespace SpawnCX

#endif
