/*
 * elapsed - Command runtime overlay
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "elapsed/format.hpp"
#include "elapsed/types.hpp"

namespace elapsed {

enum class OptionsAction : uint8_t { Run, Help, Version };

struct Options {
    OptionsAction action = OptionsAction::Run;
    CommandSpec command;
    std::string formatSpec = DurationFormat::kDefaultTemplate;
    DurationFormat format;
    std::chrono::milliseconds refresh{1000};
    bool total = false;
    bool tty = false;
    bool splitStderr = false;
    std::vector<std::string> warnings;

    [[nodiscard]] ExecutionMode mode() const noexcept;
};

struct OptionsResult {
    bool ok = false;
    Options options;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// `args` holds argv[1..]. `ptyAvailable` gates --tty.
[[nodiscard]] OptionsResult parseOptions(const std::vector<std::string>& args, bool ptyAvailable);

void printUsage(const char* progName);

}
