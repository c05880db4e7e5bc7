/*
 * elapsed - Command runtime overlay
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include <sys/types.h>
#include <unistd.h>

#include "elapsed/child.hpp"
#include "elapsed/format.hpp"
#include "elapsed/types.hpp"

namespace elapsed {

// Whether the status line is drawn at all.
enum class OverlayPolicy : uint8_t {
    Auto,    // only when the terminal fd is a tty
    Always,
    Never
};

struct SupervisorConfig {
    CommandSpec command;
    ExecutionMode mode = ExecutionMode::Inherit;
    std::chrono::milliseconds refresh{1000};
    bool leaveTotal = false;
    DurationFormat format;
    OverlayPolicy overlay = OverlayPolicy::Auto;
    int terminalFd = STDERR_FILENO;   // status line and messages
    int outputFd = STDOUT_FILENO;     // PTY relay destination
    std::function<void(pid_t)> onSpawn;
};

enum class RunError : uint8_t {
    None = 0,
    Config,
    Spawn,
    Pty
};

struct RunResult {
    bool ok = false;
    int exitCode = 1;
    TerminationOutcome outcome;
    RunError error = RunError::None;
    SpawnError spawnError = SpawnError::None;
    std::string message;
    std::chrono::nanoseconds elapsed{0};
    explicit operator bool() const noexcept { return ok; }
};

class Supervisor final {
public:
    explicit Supervisor(SupervisorConfig config);

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;
    Supervisor(Supervisor&&) = delete;
    Supervisor& operator=(Supervisor&&) = delete;

    // Runs the command to completion. `exitCode` is what the program
    // should exit with; on spawn failure `ok` is false and nothing runs.
    [[nodiscard]] RunResult run() noexcept;

    [[nodiscard]] static int exitCodeFor(const TerminationOutcome& outcome) noexcept;
    [[nodiscard]] static std::string signalMessage(int sig);

private:
    [[nodiscard]] bool overlayEnabled() const noexcept;
    [[nodiscard]] RunResult fail(RunError error, const std::string& message) const;

    SupervisorConfig config_;
};

}
