// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 assembler-0
// Licensed under GPL-3.0-or-later
#include "SpawnCX.hpp"
#include <cstdlib>
#include <iostream>

using namespace SpawnCX;

void PrintOutput(const Output& output) {
    const auto& info = output.GetProcessInfo();
    std::cout << "PID: " << info.Pid() << std::endl;
    std::cout << "Exit Code: " << info.ExitCode() << std::endl;
    std::cout << "Process Error: " << output.GetProcessError().value_or("none") << std::endl;

    std::cout << "\nStdout:\n" << output.GetStdout() << std::endl;
    std::cout << "\nStderr:\n" << output.GetStderr() << std::endl;
}

int main() {
    if (const char* level = std::getenv("SPAWNCX_LOG_LEVEL")) {
        spdlog::set_level(spdlog::level::from_str(level));
    }

    std::cout << "--- Running ls -l ---" << std::endl;
    if (auto result = Command("ls").Arg("-l").Output(); result.IsOk()) {
        PrintOutput(result.Value());
    } else {
        std::cerr << result.Error().FullMessage() << std::endl;
    }

    std::cout << "\n--- Running ping with a 2-second timeout ---" << std::endl;
    if (auto result = Command("ping").Arg("8.8.8.8").Timeout(std::chrono::seconds(2)).Output(); result.IsOk()) {
        PrintOutput(result.Value());
    } else {
        std::cerr << result.Error().FullMessage() << std::endl;
    }

    std::cout << "\n--- Streaming a long-running process line by line ---" << std::endl;
    if (auto spawned = Command("sh").Args(Utils::Expand({"-c", "for i in 1 2 3; do echo tick $i; sleep 1; done"})).Spawn();
        spawned.IsOk()) {
        auto& process = spawned.Value();
        std::cout << "Process spawned with PID: " << process.Pid() << std::endl;

        process.StdoutFeed(OutputFeed::Of([](const std::optional<std::string_view> line) {
            if (line) std::cout << "[stdout] " << *line << std::endl;
        }));

        if (auto code = process.WaitFor(std::chrono::seconds(5)); code.IsOk() && code.Value()) {
            std::cout << "Exited with code " << *code.Value() << std::endl;
        }
        process.Destroy();
        process.AwaitStop();
    } else {
        std::cerr << "Failed to spawn sh: " << spawned.Error().FullMessage() << std::endl;
    }

    std::cout << "\n--- Attempting to spawn a non-existent command ---" << std::endl;
    if (auto spawned = Command("nonexistentcommand").Spawn(); spawned.IsError()) {
        std::cerr << "Failed to spawn non-existent command, as expected: " << spawned.Error().FullMessage() << std::endl;
    }

    return 0;
}
