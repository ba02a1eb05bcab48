// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 assembler-0
// Licensed under GPL-3.0-or-later

#pragma once
#ifndef SPAWNCX_OUTPUT_FEED_HPP
#define SPAWNCX_OUTPUT_FEED_HPP

#include <algorithm>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace SpawnCX {

/**
 * @brief A failure that happened after spawn, away from the caller's stack
 * @details Context is one of CONTEXT_DESTROY, CONTEXT_STDOUT or CONTEXT_STDERR.
 *          Cause holds the original exception when there was one.
 */
struct ProcessError {
    static constexpr std::string_view CONTEXT_DESTROY = "destroy";
    static constexpr std::string_view CONTEXT_STDOUT = "feed.stdout";
    static constexpr std::string_view CONTEXT_STDERR = "feed.stderr";

    std::string Context;
    std::string Message;
    std::exception_ptr Cause;

    // If a handler throws, the process it was reporting for is destroyed
    using Handler = std::function<void(const ProcessError&)>;

    [[nodiscard]] static Handler Ignore() {
        return [](const ProcessError&) {};
    }
};

/**
 * @brief Consumer of one output stream, one line at a time
 * @details The line does not include its terminator and is only valid for the
 *          duration of the call. std::nullopt marks end-of-stream and is delivered
 *          once per registration.
 */
class OutputFeed {
public:
    virtual ~OutputFeed() = default;

    virtual void OnOutput(std::optional<std::string_view> line) = 0;

    template<typename F>
    requires std::is_invocable_v<F&, std::optional<std::string_view>>
    [[nodiscard]] static std::shared_ptr<OutputFeed> Of(F&& fn);
};

namespace Detail {
    template<typename F>
    class CallableFeed final : public OutputFeed {
    public:
        explicit CallableFeed(F fn) : Fn(std::move(fn)) {}

        void OnOutput(std::optional<std::string_view> line) override { Fn(line); }

    private:
        F Fn;
    };
}

template<typename F>
requires std::is_invocable_v<F&, std::optional<std::string_view>>
std::shared_ptr<OutputFeed> OutputFeed::Of(F&& fn) {
    return std::make_shared<Detail::CallableFeed<std::decay_t<F>>>(std::forward<F>(fn));
}

/**
 * @brief Ordered, identity-deduplicated set of feeds for one stream
 * @details The dispatching side keeps its own copy and refreshes it only when the
 *          set changed, so feeds may register more feeds (or destroy the process)
 *          from inside OnOutput(). Once closed, the set is emptied and rejects
 *          further registrations.
 */
class FeedRegistry {
public:
    // Returns how many of the feeds were newly added
    size_t Add(const std::vector<std::shared_ptr<OutputFeed>>& feeds) {
        std::lock_guard lock(Mutex);
        if (IsClosed) return 0;
        size_t added = 0;
        for (const auto& feed : feeds) {
            if (!feed) continue;
            if (std::ranges::find(Feeds, feed) != Feeds.end()) continue;
            Feeds.push_back(feed);
            ++added;
        }
        if (added > 0) ++Version;
        return added;
    }

    // Copies the current set into cached if it changed since seen_version
    void Refresh(std::vector<std::shared_ptr<OutputFeed>>& cached, uint64_t& seen_version) const {
        std::lock_guard lock(Mutex);
        if (seen_version == Version) return;
        cached = Feeds;
        seen_version = Version;
    }

    // Returns the feeds that were registered at the time of closing
    std::vector<std::shared_ptr<OutputFeed>> Close() {
        std::lock_guard lock(Mutex);
        IsClosed = true;
        ++Version;
        return std::exchange(Feeds, {});
    }

private:
    mutable std::mutex Mutex;
    std::vector<std::shared_ptr<OutputFeed>> Feeds;
    uint64_t Version = 0;
    bool IsClosed = false;
};

} // namespace SpawnCX

#endif
