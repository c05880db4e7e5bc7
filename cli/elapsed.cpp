/*
 * elapsed - Command runtime overlay (elapsed)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "elapsed/logger.hpp"
#include "elapsed/options.hpp"
#include "elapsed/pty.hpp"
#include "elapsed/supervisor.hpp"
#include "elapsed/version.hpp"
#include <csignal>
#include <cstdlib>
#include <initializer_list>
#include <iostream>
#include <string>
#include <vector>
#include <unistd.h>

using namespace elapsed;

namespace {

constexpr int kUsageExit = 2;
constexpr int kNotExecutableExit = 126;
constexpr int kNotFoundExit = 127;

// Async-signal-safe: only read the pid and forward
volatile sig_atomic_t g_child_pid = 0;

void forwardSignal(int sig, siginfo_t* info, void*) {
    // Terminal-generated signals already reach the child through the
    // process group; only pass on the ones sent to us directly.
    if (info != nullptr && info->si_code > 0) {
        return;
    }
    const pid_t pid = static_cast<pid_t>(g_child_pid);
    if (pid > 0) {
        ::kill(pid, sig);
    }
}

// A handler rather than SIG_IGN, so the child still starts with the default
void ignorePipe(int) {}

void installSignalHandlers() {
    struct sigaction sa {};
    sa.sa_sigaction = forwardSignal;
    sa.sa_flags = SA_SIGINFO | SA_RESTART;
    sigemptyset(&sa.sa_mask);
    for (int sig : {SIGINT, SIGTERM, SIGHUP, SIGQUIT}) {
        if (::sigaction(sig, &sa, nullptr) != 0) {
            LOG_WARN("Could not install handler for signal " + std::to_string(sig));
        }
    }

    struct sigaction pipeAction {};
    pipeAction.sa_handler = ignorePipe;
    sigemptyset(&pipeAction.sa_mask);
    if (::sigaction(SIGPIPE, &pipeAction, nullptr) != 0) {
        LOG_WARN("Could not install SIGPIPE handler");
    }
}

int spawnExitCode(SpawnError error) {
    switch (error) {
        case SpawnError::NotFound: return kNotFoundExit;
        case SpawnError::PermissionDenied: return kNotExecutableExit;
        default: return 1;
    }
}

}

int main(int argc, char* argv[]) {
    Logger::initFromEnv();

    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);
    auto parsed = parseOptions(args, ptySupported());
    if (!parsed) {
        std::cerr << "elapsed: " << parsed.message << "\n";
        std::cerr << "Try '" << argv[0] << " --help' for more information.\n";
        return kUsageExit;
    }

    Options& opts = parsed.options;
    if (opts.action == OptionsAction::Help) {
        printUsage(argv[0]);
        return 0;
    }
    if (opts.action == OptionsAction::Version) {
        std::cout << "elapsed " << kVersion << "\n";
        return 0;
    }
    for (const auto& warning : opts.warnings) {
        std::cerr << "elapsed: warning: " << warning << "\n";
    }

    installSignalHandlers();

    SupervisorConfig config;
    config.command = opts.command;
    config.mode = opts.mode();
    config.refresh = opts.refresh;
    config.leaveTotal = opts.total;
    config.format = opts.format;
    config.onSpawn = [](pid_t pid) { g_child_pid = static_cast<sig_atomic_t>(pid); };

    try {
        Supervisor supervisor(std::move(config));
        auto result = supervisor.run();
        g_child_pid = 0;

        if (!result) {
            std::cerr << "elapsed: " << result.message << "\n";
            switch (result.error) {
                case RunError::Config: return kUsageExit;
                case RunError::Spawn: return spawnExitCode(result.spawnError);
                default: return 1;
            }
        }
        return result.exitCode;

    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: " + std::string(e.what()));
        return 1;
    }
}
