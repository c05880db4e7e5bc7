/*
 * elapsed - Command runtime overlay
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "elapsed/scheduler.hpp"
#include "elapsed/logger.hpp"
#include "elapsed/terminal.hpp"

namespace elapsed {

StatusLineScheduler::StatusLineScheduler(TerminalWriter& writer, DurationFormat format,
                                         std::chrono::milliseconds interval,
                                         Clock::time_point start) noexcept
    : writer_(writer), format_(std::move(format)), interval_(interval), start_(start) {
    if (interval_.count() <= 0) {
        LOG_WARN("Non-positive refresh interval, using 1000ms");
        interval_ = std::chrono::milliseconds(1000);
    } else if (interval_ > kMaxRefreshInterval) {
        LOG_WARN("Refresh interval too large, using " + std::to_string(kMaxRefreshInterval.count()) + "ms");
        interval_ = kMaxRefreshInterval;
    }
}

StatusLineScheduler::~StatusLineScheduler() {
    stop();
}

bool StatusLineScheduler::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != State::Idle) {
            LOG_WARN("Status line scheduler already started");
            return false;
        }
        state_ = State::Running;
        stopRequested_ = false;
    }

    try {
        thread_ = std::thread(&StatusLineScheduler::tickLoop, this);
        LOG_DEBUG("Status line scheduler started, interval " + std::to_string(interval_.count()) + "ms");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start status line scheduler: " + std::string(e.what()));
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = State::Stopped;
        return false;
    }
}

void StatusLineScheduler::stop() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::Idle) {
            state_ = State::Stopped;
            return;
        }
        stopRequested_ = true;
    }
    wake_.notify_all();

    // An in-flight tick finishes before join() returns
    if (thread_.joinable()) {
        thread_.join();
        LOG_DEBUG("Status line scheduler stopped after " + std::to_string(ticks_.load()) + " ticks");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    state_ = State::Stopped;
}

StatusLineScheduler::State StatusLineScheduler::state() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void StatusLineScheduler::tickLoop() {
    setThreadName("Scheduler");

    try {
        while (true) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (stopRequested_) {
                    break;
                }
            }

            tick();

            Clock::time_point next;
            const bool hasDeadline = nextDeadline(next);

            std::unique_lock<std::mutex> lock(mutex_);
            if (!hasDeadline) {
                // No representable next tick: sleep until stop()
                wake_.wait(lock, [this] { return stopRequested_; });
                break;
            }
            if (wake_.wait_until(lock, next, [this] { return stopRequested_; })) {
                break;
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Status line scheduler error: " + std::string(e.what()));
    } catch (...) {
        LOG_ERROR("Unknown status line scheduler error");
    }
}

// Next multiple of the interval after start_, skipping any we overran.
// False when that point does not fit in the clock's range.
bool StatusLineScheduler::nextDeadline(Clock::time_point& next) const noexcept {
    const auto step = std::chrono::duration_cast<Clock::duration>(interval_);
    const auto sinceStart = Clock::now() - start_;
    if (step.count() <= 0) {
        return false;
    }
    const Clock::rep periods = sinceStart.count() < 0 ? Clock::rep{0} : sinceStart / step + 1;
    const auto headroom = Clock::time_point::max() - start_;
    if (periods > headroom / step) {
        return false;
    }
    next = start_ + step * periods;
    return true;
}

void StatusLineScheduler::tick() {
    const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start_);
    if (!writer_.redraw(format_.render(elapsed))) {
        LOG_DEBUG("Status line redraw failed");
    }
    ticks_.fetch_add(1);
    LOG_TRACE("Tick " + std::to_string(ticks_.load()));
}

}
