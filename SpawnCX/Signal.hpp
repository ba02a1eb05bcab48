// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 assembler-0
// Licensed under GPL-3.0-or-later

#pragma once
#ifndef SPAWNCX_SIGNAL_HPP
#define SPAWNCX_SIGNAL_HPP

#include <csignal>
#include <ostream>

namespace SpawnCX {

/**
 * @brief Signals a Process may be destroyed with
 * @details Term is the default. A platform without signal delivery would map
 *          Term onto its graceful termination primitive and Kill onto forced
 *          termination; on POSIX both are delivered with kill(2).
 */
enum class Signal {
    Term,
    Kill,
};

[[nodiscard]] constexpr int SignalNumber(const Signal signal) noexcept {
    return signal == Signal::Kill ? SIGKILL : SIGTERM;
}

// Exit code reported for a process terminated by the signal (shell convention)
[[nodiscard]] constexpr int SignalCode(const Signal signal) noexcept {
    return 128 + SignalNumber(signal);
}

class SignalInfo {
public:
    static const char* GetSignalName(const int signal) {
        switch (signal) {
            case SIGTERM: return "SIGTERM";
            case SIGKILL: return "SIGKILL";
            default: return "UNKNOWN";
        }
    }

    static const char* GetSignalName(const Signal signal) {
        return GetSignalName(SignalNumber(signal));
    }
};

inline std::ostream& operator<<(std::ostream& out, const Signal signal) {
    return out << SignalInfo::GetSignalName(signal);
}

} // namespace SpawnCX

#endif
