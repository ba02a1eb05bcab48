// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 assembler-0
// Licensed under GPL-3.0-or-later

#pragma once
#ifndef SPAWNCX_RESULT_HPP
#define SPAWNCX_RESULT_HPP

#include <cerrno>
#include <cstring>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <variant>

namespace SpawnCX {

enum class ErrorCode {
    SpawnFailure,
    FileNotFound,
    PermissionDenied,
    InvalidArgument,
    IOError,
    NotExited,
    Unsupported,
    Cancelled,
};

[[nodiscard]] constexpr const char* ErrorCodeName(const ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::SpawnFailure: return "SpawnFailure";
        case ErrorCode::FileNotFound: return "FileNotFound";
        case ErrorCode::PermissionDenied: return "PermissionDenied";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::NotExited: return "NotExited";
        case ErrorCode::Unsupported: return "Unsupported";
        case ErrorCode::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

class Error {
public:
    Error(const ErrorCode code, std::string message, const int native_error = 0)
        : Code(code), Message(std::move(message)), NativeError(native_error) {}

    /**
     * @brief Maps an errno value onto the closest ErrorCode
     * @details ENOENT becomes FileNotFound, EACCES/EPERM become PermissionDenied,
     *          anything else takes the supplied fallback.
     */
    [[nodiscard]] static Error FromErrno(const ErrorCode fallback, std::string message, const int err) {
        ErrorCode code = fallback;
        if (err == ENOENT) code = ErrorCode::FileNotFound;
        else if (err == EACCES || err == EPERM) code = ErrorCode::PermissionDenied;
        return {code, std::move(message), err};
    }

    [[nodiscard]] ErrorCode GetCode() const noexcept { return Code; }
    [[nodiscard]] const std::string& GetMessage() const noexcept { return Message; }
    [[nodiscard]] int GetNativeError() const noexcept { return NativeError; }

    [[nodiscard]] std::string FullMessage() const {
        std::ostringstream out;
        out << '[' << ErrorCodeName(Code) << "] " << Message;
        if (NativeError != 0) {
            out << " (errno " << NativeError << ": " << std::strerror(NativeError) << ')';
        }
        return out.str();
    }

private:
    ErrorCode Code;
    std::string Message;
    int NativeError;
};

template<typename T>
class Result {
public:
    Result(T value) : Storage(std::in_place_index<0>, std::move(value)) {}
    Result(SpawnCX::Error error) : Storage(std::in_place_index<1>, std::move(error)) {}

    [[nodiscard]] bool IsOk() const noexcept { return Storage.index() == 0; }
    [[nodiscard]] bool IsError() const noexcept { return Storage.index() == 1; }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] T& Value() & { return std::get<0>(Storage); }
    [[nodiscard]] const T& Value() const & { return std::get<0>(Storage); }
    [[nodiscard]] T&& Value() && { return std::get<0>(std::move(Storage)); }

    [[nodiscard]] const SpawnCX::Error& Error() const & { return std::get<1>(Storage); }
    [[nodiscard]] SpawnCX::Error&& Error() && { return std::get<1>(std::move(Storage)); }

private:
    std::variant<T, SpawnCX::Error> Storage;
};

template<>
class Result<void> {
public:
    Result() = default;
    Result(SpawnCX::Error error) : Failure(std::move(error)) {}

    [[nodiscard]] bool IsOk() const noexcept { return !Failure.has_value(); }
    [[nodiscard]] bool IsError() const noexcept { return Failure.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const SpawnCX::Error& Error() const & { return *Failure; }
    [[nodiscard]] SpawnCX::Error&& Error() && { return std::move(*Failure); }

private:
    std::optional<SpawnCX::Error> Failure;
};

} // namespace SpawnCX

#endif
