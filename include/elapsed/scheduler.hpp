/*
 * elapsed - Command runtime overlay
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <thread>

#include "elapsed/format.hpp"

namespace elapsed {

class TerminalWriter;

using Clock = std::chrono::steady_clock;

// Longest accepted refresh interval; longer values are clamped to it.
constexpr std::chrono::milliseconds kMaxRefreshInterval{24LL * 60 * 60 * 1000};

class StatusLineScheduler final {
public:
    enum class State : uint8_t { Idle, Running, Stopped };

    StatusLineScheduler(TerminalWriter& writer, DurationFormat format,
                        std::chrono::milliseconds interval, Clock::time_point start) noexcept;
    ~StatusLineScheduler();

    StatusLineScheduler(const StatusLineScheduler&) = delete;
    StatusLineScheduler& operator=(const StatusLineScheduler&) = delete;
    StatusLineScheduler(StatusLineScheduler&&) = delete;
    StatusLineScheduler& operator=(StatusLineScheduler&&) = delete;

    [[nodiscard]] bool start();

    // Returns once the tick thread has exited; no redraw happens afterwards.
    void stop() noexcept;

    [[nodiscard]] State state() const noexcept;
    [[nodiscard]] std::size_t ticks() const noexcept { return ticks_.load(); }

private:
    void tickLoop();
    void tick();
    [[nodiscard]] bool nextDeadline(Clock::time_point& next) const noexcept;

    TerminalWriter& writer_;
    DurationFormat format_;
    std::chrono::milliseconds interval_;
    Clock::time_point start_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    State state_ = State::Idle;
    bool stopRequested_ = false;
    std::atomic<std::size_t> ticks_{0};

    std::thread thread_;
};

}
