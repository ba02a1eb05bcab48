// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 assembler-0
// Licensed under GPL-3.0-or-later

#pragma once
#ifndef SPAWNCX_LINE_SCANNER_HPP
#define SPAWNCX_LINE_SCANNER_HPP

#include <algorithm>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "Constants.hpp"

namespace SpawnCX {

/**
 * @brief Reassembles a byte stream into lines
 * @details Accepts "\n", "\r" and "\r\n" as terminators (a "\r\n" split across two
 *          OnData() calls still counts once). Terminators are never part of a line.
 *          Close() flushes an unterminated trailing segment, then dispatches
 *          std::nullopt exactly once.
 */
class LineScanner {
public:
    using Dispatch = std::function<void(std::optional<std::string_view>)>;

    explicit LineScanner(Dispatch dispatch) : Sink(std::move(dispatch)) {
        Line.reserve(Constants::LINE_BUFFER_SIZE);
    }

    ~LineScanner() { Wipe(); }

    LineScanner(const LineScanner&) = delete;
    LineScanner& operator=(const LineScanner&) = delete;

    void OnData(const char* data, size_t length);
    void Close();

    [[nodiscard]] bool IsClosed() const noexcept { return Closed; }

private:
    void Emit();
    void Wipe() noexcept;

    Dispatch Sink;
    std::string Line;
    size_t MaxLineLength = 0;
    bool HasPartial = false;
    bool SkipLF = false;
    bool Closed = false;
};

inline void LineScanner::OnData(const char* data, const size_t length) {
    if (Closed || length == 0) return;

    size_t i = 0;
    while (i < length) {
        if (SkipLF) {
            SkipLF = false;
            if (data[i] == '\n') {
                ++i;
                continue;
            }
        }

        // Copy the run of non-terminator bytes in one go
        const char* begin = data + i;
        const char* end = data + length;
        const char* terminator = std::find_if(begin, end, [](const char c) { return c == '\n' || c == '\r'; });
        if (terminator != begin) {
            Line.append(begin, terminator);
            HasPartial = true;
        }
        i = static_cast<size_t>(terminator - data);
        if (i == length) break;

        SkipLF = data[i] == '\r';
        ++i;
        Emit();
    }
}

inline void LineScanner::Close() {
    if (Closed) return;
    Closed = true;
    SkipLF = false;

    try {
        if (HasPartial) Emit();
    } catch (...) {
        Wipe();
        Sink(std::nullopt);
        throw;
    }

    Wipe();
    Sink(std::nullopt);
}

inline void LineScanner::Emit() {
    MaxLineLength = std::max(MaxLineLength, Line.size());
    HasPartial = false;
    try {
        Sink(std::string_view(Line));
    } catch (...) {
        Closed = true;
        Wipe();
        throw;
    }
    Line.clear();
}

inline void LineScanner::Wipe() noexcept {
    MaxLineLength = std::max(MaxLineLength, Line.size());
    Line.resize(MaxLineLength);
    std::fill(Line.begin(), Line.end(), '\0');
    Line.clear();
    MaxLineLength = 0;
    HasPartial = false;
}

} // namespace SpawnCX

#endif
