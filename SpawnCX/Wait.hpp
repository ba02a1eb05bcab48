// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 assembler-0
// Licensed under GPL-3.0-or-later

#pragma once
#ifndef SPAWNCX_WAIT_HPP
#define SPAWNCX_WAIT_HPP

#include <algorithm>
#include <chrono>
#include <optional>
#include <thread>
#include <type_traits>
#include <utility>

#include "Constants.hpp"

namespace SpawnCX::Wait {

// Timeout value meaning "no deadline"
inline constexpr auto FOREVER = std::chrono::milliseconds::max();

template<typename T>
struct Outcome {
    std::optional<T> Value;
    bool Aborted = false;
};

/**
 * @brief Polls a condition until it yields a value or the timeout elapses
 * @param timeout Total budget; zero checks the condition exactly once
 * @param sleep Called with the interval to suspend for, min(remaining + 1ms, 100ms).
 *        Returning false aborts the wait (Outcome::Aborted)
 * @param condition Returns std::optional<T>; a value ends the wait
 */
template<typename Sleep, typename Condition>
requires std::is_invocable_r_v<bool, Sleep&, std::chrono::milliseconds>
[[nodiscard]] auto ForCondition(const std::chrono::milliseconds timeout, Sleep&& sleep, Condition&& condition)
    -> Outcome<typename std::invoke_result_t<Condition&>::value_type> {
    using namespace std::chrono_literals;

    const auto start = std::chrono::steady_clock::now();
    const bool forever = timeout >= FOREVER;

    while (true) {
        if (auto value = condition()) return {std::move(value), false};

        std::chrono::milliseconds remaining = Constants::MAX_POLL_INTERVAL;
        if (!forever) {
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            remaining = timeout - elapsed;
        }
        if (remaining <= 0ms) return {};

        if (!sleep(std::min(remaining + 1ms, Constants::MAX_POLL_INTERVAL))) {
            return {std::nullopt, true};
        }
    }
}

[[nodiscard]] inline bool ThreadSleep(const std::chrono::milliseconds interval) {
    std::this_thread::sleep_for(interval);
    return true;
}

} // namespace SpawnCX::Wait

#endif
