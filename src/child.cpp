/*
 * elapsed - Command runtime overlay
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "elapsed/child.hpp"
#include "elapsed/logger.hpp"
#include "elapsed/terminal.hpp"
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace elapsed {

namespace {

// How long the relay waits for more output once the child is reaped.
// Covers descendants that keep the slave open after the child exits.
constexpr int kDrainPollMs = 100;

SpawnResult spawnFailure(SpawnError error, const std::string& message) {
    SpawnResult result;
    result.error = error;
    result.message = message;
    return result;
}

SpawnError classifyExecErrno(int err) noexcept {
    switch (err) {
        case ENOENT:
        case ENOTDIR:
            return SpawnError::NotFound;
        case EACCES:
        case EPERM:
            return SpawnError::PermissionDenied;
        default:
            return SpawnError::ExecFailed;
    }
}

pid_t waitForPid(pid_t pid, int& status) noexcept {
    while (true) {
        const pid_t r = ::waitpid(pid, &status, 0);
        if (r < 0 && errno == EINTR) {
            continue;
        }
        return r;
    }
}

}

ChildProcess::~ChildProcess() {
    if (isRunning()) {
        LOG_WARN("Child " + std::to_string(pid_) + " still running at teardown, killing it");
        ::kill(pid_, SIGKILL);
        int status = 0;
        (void)waitForPid(pid_, status);
        reaped_.store(true);
    }
    joinRelay();
}

SpawnResult ChildProcess::spawn(const CommandSpec& command, ExecutionMode mode, RelaySink sink) noexcept {
    if (pid_ > 0) {
        return spawnFailure(SpawnError::AlreadyStarted, "child already started");
    }
    if (command.program.empty()) {
        return spawnFailure(SpawnError::NotFound, "empty command");
    }

    try {
        // Everything the child touches is prepared before fork()
        std::vector<std::string> argvStorage;
        argvStorage.reserve(command.args.size() + 1);
        argvStorage.push_back(command.program);
        argvStorage.insert(argvStorage.end(), command.args.begin(), command.args.end());

        std::vector<char*> argv;
        argv.reserve(argvStorage.size() + 1);
        for (auto& arg : argvStorage) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        const bool usePty = mode != ExecutionMode::Inherit;
        PtyPair pty;
        if (usePty) {
            auto opened = openPty(::isatty(STDOUT_FILENO) ? STDOUT_FILENO : STDERR_FILENO);
            if (!opened) {
                return spawnFailure(SpawnError::PtyFailed, opened.message);
            }
            pty = std::move(opened.pty);
        }
        const bool mergeStderr = mode == ExecutionMode::PtyMerged;

        std::array<int, 2> statusPipe{};
        if (::pipe2(statusPipe.data(), O_CLOEXEC) != 0) {
            return spawnFailure(SpawnError::ForkFailed, std::string("pipe2 failed: ") + std::strerror(errno));
        }
        FileDescriptor statusRead(statusPipe[0]);
        FileDescriptor statusWrite(statusPipe[1]);

        const pid_t pid = ::fork();
        if (pid < 0) {
            return spawnFailure(SpawnError::ForkFailed, std::string("fork failed: ") + std::strerror(errno));
        }

        if (pid == 0) {
            // Child: async-signal-safe calls only from here on
            if (usePty) {
                if (::dup2(pty.slave.get(), STDOUT_FILENO) < 0 ||
                    (mergeStderr && ::dup2(pty.slave.get(), STDERR_FILENO) < 0)) {
                    const int err = errno;
                    (void)!::write(statusWrite.get(), &err, sizeof(err));
                    ::_exit(127);
                }
            }
            ::execvp(argv[0], argv.data());
            const int err = errno;
            (void)!::write(statusWrite.get(), &err, sizeof(err));
            ::_exit(127);
        }

        statusWrite.reset();
        pty.slave.reset();

        int execErrno = 0;
        ssize_t got = 0;
        do {
            got = ::read(statusRead.get(), &execErrno, sizeof(execErrno));
        } while (got < 0 && errno == EINTR);

        if (got > 0) {
            int status = 0;
            (void)waitForPid(pid, status);
            const std::string message = command.program + ": " + std::strerror(execErrno);
            LOG_DEBUG("exec failed: " + message);
            return spawnFailure(classifyExecErrno(execErrno), message);
        }

        pid_ = pid;
        reaped_.store(false);
        LOG_DEBUG("Spawned " + describe(command) + " as pid " + std::to_string(pid) +
                  " (" + toString(mode) + ")");

        if (usePty) {
            master_ = std::move(pty.master);
            sink_ = std::move(sink);
            try {
                relayThread_ = std::thread(&ChildProcess::relayLoop, this);
            } catch (const std::exception& e) {
                LOG_ERROR("Failed to start PTY relay: " + std::string(e.what()));
                ::kill(pid_, SIGKILL);
                int status = 0;
                (void)waitForPid(pid_, status);
                reaped_.store(true);
                master_.reset();
                return spawnFailure(SpawnError::PtyFailed, "could not start PTY relay");
            }
        }

        SpawnResult result;
        result.ok = true;
        result.pid = pid;
        return result;

    } catch (const std::exception& e) {
        return spawnFailure(SpawnError::ExecFailed, std::string("spawn failed: ") + e.what());
    }
}

TerminationOutcome ChildProcess::wait() noexcept {
    if (pid_ <= 0) {
        LOG_ERROR("wait() called without a spawned child");
        return TerminationOutcome::exited(1);
    }
    if (reaped_.load()) {
        return outcome_;
    }

    int status = 0;
    if (waitForPid(pid_, status) < 0) {
        LOG_ERROR("waitpid failed: " + std::string(std::strerror(errno)));
        outcome_ = TerminationOutcome::exited(1);
    } else if (WIFEXITED(status)) {
        outcome_ = TerminationOutcome::exited(WEXITSTATUS(status));
    } else if (WIFSIGNALED(status)) {
        outcome_ = TerminationOutcome::signaled(WTERMSIG(status));
    } else {
        outcome_ = TerminationOutcome::exited(1);
    }
    reaped_.store(true);

    LOG_DEBUG("Child " + std::to_string(pid_) +
              (outcome_.killedBySignal() ? " killed by signal " : " exited with ") +
              std::to_string(outcome_.code));

    joinRelay();
    return outcome_;
}

void ChildProcess::relayLoop() {
    setThreadName("Relay");
    LOG_DEBUG("PTY relay started");

    std::array<char, 4096> buf{};
    bool sinkOpen = true;
    std::size_t total = 0;

    try {
        while (true) {
            pollfd pfd{master_.get(), POLLIN, 0};
            const int ready = ::poll(&pfd, 1, kDrainPollMs);
            if (ready < 0) {
                if (errno == EINTR) {
                    continue;
                }
                LOG_ERROR("PTY relay poll failed: " + std::string(std::strerror(errno)));
                relayFailed_.store(true);
                break;
            }
            if (ready == 0) {
                // Quiet master after the child is gone: nothing left to copy
                if (reaped_.load()) {
                    break;
                }
                continue;
            }

            const ssize_t n = ::read(master_.get(), buf.data(), buf.size());
            if (n == 0) {
                break;
            }
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) {
                    continue;
                }
                if (errno == EIO) {
                    // Linux: every slave descriptor has been closed
                    break;
                }
                LOG_ERROR("PTY relay read failed: " + std::string(std::strerror(errno)));
                relayFailed_.store(true);
                break;
            }

            total += static_cast<std::size_t>(n);
            relayedBytes_.store(total);
            if (!sinkOpen) {
                continue;
            }
            const bool written = sink_ ? sink_(buf.data(), static_cast<std::size_t>(n))
                                       : TerminalWriter::writeAll(STDOUT_FILENO, buf.data(),
                                                                  static_cast<std::size_t>(n));
            if (!written) {
                // Keep draining so the child never blocks on a full PTY
                LOG_ERROR("PTY relay could not write output, discarding the rest");
                relayFailed_.store(true);
                sinkOpen = false;
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("PTY relay error: " + std::string(e.what()));
        relayFailed_.store(true);
    }

    LOG_DEBUG("PTY relay finished after " + std::to_string(total) + " bytes");
}

void ChildProcess::joinRelay() noexcept {
    if (relayThread_.joinable()) {
        relayThread_.join();
    }
    master_.reset();
}

const char* toString(SpawnError error) noexcept {
    switch (error) {
        case SpawnError::None: return "none";
        case SpawnError::NotFound: return "not found";
        case SpawnError::PermissionDenied: return "permission denied";
        case SpawnError::ExecFailed: return "exec failed";
        case SpawnError::ForkFailed: return "fork failed";
        case SpawnError::PtyFailed: return "pty failed";
        case SpawnError::AlreadyStarted: return "already started";
        default: return "unknown";
    }
}

}
