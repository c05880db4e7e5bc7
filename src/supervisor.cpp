/*
 * elapsed - Command runtime overlay
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "elapsed/supervisor.hpp"
#include "elapsed/child.hpp"
#include "elapsed/logger.hpp"
#include "elapsed/pty.hpp"
#include "elapsed/scheduler.hpp"
#include "elapsed/terminal.hpp"
#include <cstring>
#include <memory>

namespace elapsed {

namespace {

// Sends log lines through the writer while the status line is on screen,
// so they land on rows of their own.
class LogRoute {
public:
    explicit LogRoute(TerminalWriter* writer) : active_(writer != nullptr) {
        if (active_) {
            Logger::setSink([writer](const std::string& line) { return writer->message(line); });
        }
    }
    ~LogRoute() {
        if (active_) {
            Logger::setSink(nullptr);
        }
    }
    LogRoute(const LogRoute&) = delete;
    LogRoute& operator=(const LogRoute&) = delete;

private:
    bool active_;
};

}

Supervisor::Supervisor(SupervisorConfig config) : config_(std::move(config)) {
    LOG_DEBUG("Supervisor created - command: " + describe(config_.command) +
              ", mode: " + toString(config_.mode) +
              ", refresh: " + std::to_string(config_.refresh.count()) + "ms" +
              ", total: " + (config_.leaveTotal ? "yes" : "no"));
}

RunResult Supervisor::run() noexcept {
    try {
        if (config_.refresh.count() <= 0) {
            return fail(RunError::Config, "refresh interval must be a positive number of milliseconds");
        }
        if (config_.refresh > kMaxRefreshInterval) {
            return fail(RunError::Config, "refresh interval must be at most " +
                                              std::to_string(kMaxRefreshInterval.count()) + "ms");
        }
        if (config_.mode != ExecutionMode::Inherit && !ptySupported()) {
            return fail(RunError::Config, "pseudo-terminals are not supported on this system");
        }

        const bool overlay = overlayEnabled();
        TerminalWriter writer(config_.terminalFd);
        const LogRoute logRoute(overlay ? &writer : nullptr);

        RelaySink sink;
        if (config_.mode != ExecutionMode::Inherit) {
            const int outFd = config_.outputFd;
            if (overlay) {
                sink = [&writer, outFd](const char* data, std::size_t len) {
                    return writer.passthrough(outFd, data, len);
                };
            } else {
                sink = [outFd](const char* data, std::size_t len) {
                    return TerminalWriter::writeAll(outFd, data, len);
                };
            }
        }

        ChildProcess child;
        const auto start = Clock::now();
        auto spawned = child.spawn(config_.command, config_.mode, std::move(sink));
        if (!spawned) {
            RunResult result = fail(spawned.error == SpawnError::PtyFailed ? RunError::Pty : RunError::Spawn,
                                    spawned.message);
            result.spawnError = spawned.error;
            return result;
        }

        if (config_.onSpawn) {
            config_.onSpawn(spawned.pid);
        }

        std::unique_ptr<StatusLineScheduler> scheduler;
        if (overlay) {
            scheduler = std::make_unique<StatusLineScheduler>(writer, config_.format, config_.refresh, start);
            if (!scheduler->start()) {
                // The overlay is a convenience; keep supervising without it
                LOG_WARN("Running without status line");
                scheduler.reset();
            }
        } else {
            LOG_DEBUG("Status line disabled, terminal fd is not a tty");
        }

        RunResult result;
        result.outcome = child.wait();
        const auto end = Clock::now();
        result.elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start);

        if (scheduler) {
            scheduler->stop();
        }

        if (overlay) {
            if (config_.leaveTotal) {
                const std::string text = config_.format.render(result.elapsed);
                if (!writer.finish(text)) {
                    LOG_WARN("Could not write final status line");
                }
            } else if (!writer.erase()) {
                LOG_WARN("Could not erase status line");
            }
        }

        if (child.relayFailed()) {
            LOG_WARN("Some command output could not be relayed");
        }

        if (result.outcome.killedBySignal()) {
            // Starts its own row even when the output stopped mid-line
            if (!writer.message(signalMessage(result.outcome.code))) {
                LOG_ERROR(signalMessage(result.outcome.code));
            }
        }

        result.ok = true;
        result.exitCode = exitCodeFor(result.outcome);
        LOG_INFO(describe(config_.command) + " finished in " +
                 std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(result.elapsed).count()) +
                 "ms, exit code " + std::to_string(result.exitCode));
        return result;

    } catch (const std::exception& e) {
        LOG_ERROR("Supervisor error: " + std::string(e.what()));
        RunResult result;
        result.error = RunError::Spawn;
        result.message = e.what();
        return result;
    }
}

int Supervisor::exitCodeFor(const TerminationOutcome& outcome) noexcept {
    if (outcome.killedBySignal()) {
        return 1;
    }
    return outcome.code;
}

std::string Supervisor::signalMessage(int sig) {
    std::string message = "elapsed: command killed by signal " + std::to_string(sig);
    const char* name = ::strsignal(sig);
    if (name != nullptr) {
        message += " (" + std::string(name) + ")";
    }
    return message;
}

bool Supervisor::overlayEnabled() const noexcept {
    switch (config_.overlay) {
        case OverlayPolicy::Always: return true;
        case OverlayPolicy::Never: return false;
        case OverlayPolicy::Auto:
        default:
            return ::isatty(config_.terminalFd) == 1;
    }
}

RunResult Supervisor::fail(RunError error, const std::string& message) const {
    RunResult result;
    result.error = error;
    result.message = message;
    result.exitCode = 1;
    LOG_DEBUG("Run failed before start: " + message);
    return result;
}

}
