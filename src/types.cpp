/*
 * elapsed - Command runtime overlay
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "elapsed/types.hpp"

namespace elapsed {

const char* toString(ExecutionMode mode) noexcept {
    switch (mode) {
        case ExecutionMode::Inherit:   return "inherit";
        case ExecutionMode::PtyMerged: return "pty";
        case ExecutionMode::PtySplit:  return "pty-split";
        default: return "unknown";
    }
}

std::string describe(const CommandSpec& command) {
    std::string out = command.program;
    for (const auto& arg : command.args) {
        out += ' ';
        if (arg.empty() || arg.find_first_of(" \t\"'") != std::string::npos) {
            out += '"' + arg + '"';
        } else {
            out += arg;
        }
    }
    return out;
}

}
