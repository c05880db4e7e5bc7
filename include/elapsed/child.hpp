/*
 * elapsed - Command runtime overlay
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>

#include <sys/types.h>

#include "elapsed/pty.hpp"
#include "elapsed/types.hpp"

namespace elapsed {

// Receives every chunk the relay reads from the PTY master.
// Returns false when the destination can no longer be written.
using RelaySink = std::function<bool(const char* data, std::size_t len)>;

enum class SpawnError : uint8_t {
    None = 0,
    NotFound,
    PermissionDenied,
    ExecFailed,
    ForkFailed,
    PtyFailed,
    AlreadyStarted
};

struct SpawnResult {
    bool ok = false;
    pid_t pid = -1;
    SpawnError error = SpawnError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

class ChildProcess final {
public:
    ChildProcess() noexcept = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&&) = delete;
    ChildProcess& operator=(ChildProcess&&) = delete;

    // In PTY modes `sink` receives the relayed output; when empty it is
    // written straight to stdout.
    [[nodiscard]] SpawnResult spawn(const CommandSpec& command, ExecutionMode mode,
                                    RelaySink sink = nullptr) noexcept;

    // Blocks until the child terminates and the relay has drained.
    [[nodiscard]] TerminationOutcome wait() noexcept;

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }
    [[nodiscard]] bool isRunning() const noexcept { return pid_ > 0 && !reaped_.load(); }
    [[nodiscard]] bool relayFailed() const noexcept { return relayFailed_.load(); }
    [[nodiscard]] std::size_t relayedBytes() const noexcept { return relayedBytes_.load(); }

private:
    void relayLoop();
    void joinRelay() noexcept;

    pid_t pid_ = -1;
    std::atomic<bool> reaped_{false};
    TerminationOutcome outcome_;

    FileDescriptor master_;
    RelaySink sink_;
    std::thread relayThread_;
    std::atomic<bool> relayFailed_{false};
    std::atomic<std::size_t> relayedBytes_{0};
};

[[nodiscard]] const char* toString(SpawnError error) noexcept;

}
