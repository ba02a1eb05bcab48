// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 assembler-0
// Licensed under GPL-3.0-or-later

#pragma once
#ifndef SPAWNCX_OUTPUT_OPTIONS_HPP
#define SPAWNCX_OUTPUT_OPTIONS_HPP

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "Constants.hpp"
#include "Result.hpp"

namespace SpawnCX {

/**
 * @brief Options for a one-shot Command::Output() call
 * @details Input producers are invoked lazily, at most once, after the process
 *          has spawned. Bytes and text are mutually exclusive; the last one set wins.
 */
class OutputOptions {
public:
    using BytesProducer = std::function<std::vector<std::uint8_t>()>;
    using TextProducer = std::function<std::string()>;

    class Builder {
    public:
        Builder& Input(BytesProducer producer) {
            InputBytes = std::move(producer);
            InputText = nullptr;
            return *this;
        }

        Builder& InputUtf8(TextProducer producer) {
            InputText = std::move(producer);
            InputBytes = nullptr;
            return *this;
        }

        Builder& MaxBuffer(const size_t bytes) {
            MaxBufferBytes = bytes;
            return *this;
        }

        Builder& TimeoutMillis(const int millis) {
            Timeout = std::chrono::milliseconds(millis);
            return *this;
        }

        template<Concepts::DurationLike D>
        Builder& TimeoutAfter(D&& duration) {
            Timeout = std::chrono::duration_cast<std::chrono::milliseconds>(std::forward<D>(duration));
            return *this;
        }

        [[nodiscard]] OutputOptions Build() const {
            OutputOptions options;
            options.InputBytes = InputBytes;
            options.InputText = InputText;
            options.MaxBufferBytes = std::max(MaxBufferBytes, Constants::OUTPUT_MIN_MAX_BUFFER);
            options.Timeout = std::max(Timeout, std::chrono::milliseconds(Constants::OUTPUT_MIN_TIMEOUT_MS));
            return options;
        }

    private:
        BytesProducer InputBytes;
        TextProducer InputText;
        size_t MaxBufferBytes = Constants::OUTPUT_DEFAULT_MAX_BUFFER;
        std::chrono::milliseconds Timeout{Constants::OUTPUT_MIN_TIMEOUT_MS};
    };

    OutputOptions() = default;

    [[nodiscard]] bool HasInput() const noexcept {
        return static_cast<bool>(InputBytes) || static_cast<bool>(InputText);
    }

    [[nodiscard]] size_t GetMaxBuffer() const noexcept { return MaxBufferBytes; }
    [[nodiscard]] std::chrono::milliseconds GetTimeout() const noexcept { return Timeout; }

    /**
     * @brief Invokes whichever input producer is set and clears it
     * @return The input, std::nullopt if there was none, or IOError if the producer threw
     */
    [[nodiscard]] Result<std::optional<std::string>> ConsumeInput() {
        auto bytes = std::exchange(InputBytes, nullptr);
        auto text = std::exchange(InputText, nullptr);
        try {
            if (bytes) {
                auto data = bytes();
                return std::optional<std::string>(std::in_place, data.begin(), data.end());
            }
            if (text) return std::optional<std::string>(text());
        } catch (const std::exception& e) {
            return Error(ErrorCode::IOError, std::string("Output input producer threw: ") + e.what());
        }
        return std::optional<std::string>();
    }

    void DropAllInput() noexcept {
        InputBytes = nullptr;
        InputText = nullptr;
    }

private:
    BytesProducer InputBytes;
    TextProducer InputText;
    size_t MaxBufferBytes = Constants::OUTPUT_DEFAULT_MAX_BUFFER;
    std::chrono::milliseconds Timeout{Constants::OUTPUT_MIN_TIMEOUT_MS};
};

} // namespace SpawnCX

#endif
