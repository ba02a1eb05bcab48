// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 assembler-0
// Licensed under GPL-3.0-or-later

#pragma once
#ifndef SPAWNCX_CONSTANTS_HPP
#define SPAWNCX_CONSTANTS_HPP

#include <chrono>
#include <climits>
#include <concepts>
#include <cstddef>
#include <string_view>

namespace SpawnCX {

// Constants
namespace Constants {
    constexpr int EXIT_FAIL_EC = 127;
    constexpr size_t PIPE_BUFFER_SIZE = 8192;
    constexpr size_t LINE_BUFFER_SIZE = 2048;
    constexpr auto MAX_POLL_INTERVAL = std::chrono::milliseconds(100);

    // Reader teardown delay after Destroy(), lets the last buffered lines flush
    constexpr auto DESTROY_GRACE_PERIOD = std::chrono::milliseconds(100);
    // Destructor escalates to SIGKILL if the destroy signal did not reap in time
    constexpr auto REAP_TIMEOUT = std::chrono::milliseconds(250);

    constexpr int OUTPUT_MIN_TIMEOUT_MS = 250;
    constexpr size_t OUTPUT_MIN_MAX_BUFFER = PIPE_BUFFER_SIZE * 2;
    constexpr size_t OUTPUT_DEFAULT_MAX_BUFFER = INT_MAX / 2;
    // Ticks of MAX_POLL_INTERVAL allowed after exit for the readers to reach EOF
    constexpr int OUTPUT_POST_EXIT_TICKS = 5;

    constexpr std::string_view NULL_DEVICE = "/dev/null";
}

// Concepts
namespace Concepts {
    template<typename T>
    concept StringLike = std::convertible_to<T, std::string_view>;

    template<typename T>
    concept DurationLike = requires(T t) {
        std::chrono::duration_cast<std::chrono::milliseconds>(t);
    };
}

} // namespace SpawnCX

#endif
