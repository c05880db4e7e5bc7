/*
 * elapsed - Command runtime overlay
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "elapsed/options.hpp"
#include "elapsed/logger.hpp"
#include "elapsed/scheduler.hpp"
#include "elapsed/version.hpp"
#include <cctype>
#include <cstddef>
#include <iostream>
#include <stdexcept>

namespace elapsed {

namespace {

OptionsResult usageError(const std::string& message) {
    OptionsResult result;
    result.message = message;
    return result;
}

bool isNumber(const std::string& value) {
    if (value.empty()) return false;
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

// Splits "--name=value"; returns false for anything else.
bool splitInline(const std::string& arg, std::string& name, std::string& value) {
    if (arg.rfind("--", 0) != 0) return false;
    const auto eq = arg.find('=');
    if (eq == std::string::npos) return false;
    name = arg.substr(0, eq);
    value = arg.substr(eq + 1);
    return true;
}

}

ExecutionMode Options::mode() const noexcept {
    if (!tty) {
        return ExecutionMode::Inherit;
    }
    return splitStderr ? ExecutionMode::PtySplit : ExecutionMode::PtyMerged;
}

OptionsResult parseOptions(const std::vector<std::string>& args, bool ptyAvailable) {
    Options opts;
    std::string refreshSpec;
    bool haveRefresh = false;

    std::size_t i = 0;
    for (; i < args.size(); ++i) {
        std::string arg = args[i];
        std::string inlineValue;
        bool hasInline = false;
        {
            std::string name;
            if (splitInline(arg, name, inlineValue)) {
                arg = name;
                hasInline = true;
            }
        }

        auto takeValue = [&](std::string& out) -> bool {
            if (hasInline) {
                out = inlineValue;
                return true;
            }
            if (i + 1 >= args.size()) {
                return false;
            }
            out = args[++i];
            return true;
        };

        if (arg == "--") {
            ++i;
            break;
        }
        if (arg == "-h" || arg == "--help") {
            opts.action = OptionsAction::Help;
            OptionsResult result;
            result.ok = true;
            result.options = std::move(opts);
            return result;
        }
        if (arg == "-V" || arg == "--version") {
            opts.action = OptionsAction::Version;
            OptionsResult result;
            result.ok = true;
            result.options = std::move(opts);
            return result;
        }
        if (arg == "-f" || arg == "--format") {
            if (!takeValue(opts.formatSpec)) {
                return usageError(arg + " requires a template");
            }
        } else if (arg == "-r" || arg == "--refresh") {
            if (!takeValue(refreshSpec)) {
                return usageError(arg + " requires a number of milliseconds");
            }
            haveRefresh = true;
        } else if (hasInline) {
            return usageError("option " + arg + " does not take a value");
        } else if (arg == "-t" || arg == "--total") {
            opts.total = true;
        } else if (arg == "--tty") {
            opts.tty = true;
        } else if (arg == "--split-stderr") {
            opts.splitStderr = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            return usageError("unknown option " + arg);
        } else {
            break;
        }
    }

    if (i >= args.size()) {
        return usageError("no command given");
    }
    opts.command.program = args[i];
    opts.command.args.assign(args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());

    if (haveRefresh) {
        if (!isNumber(refreshSpec)) {
            return usageError("invalid refresh interval '" + refreshSpec + "'");
        }
        try {
            const long long ms = std::stoll(refreshSpec);
            if (ms <= 0) {
                return usageError("refresh interval must be positive");
            }
            if (ms > kMaxRefreshInterval.count()) {
                return usageError("refresh interval must be at most " +
                                  std::to_string(kMaxRefreshInterval.count()) + "ms");
            }
            opts.refresh = std::chrono::milliseconds(ms);
        } catch (const std::exception&) {
            return usageError("invalid refresh interval '" + refreshSpec + "'");
        }
    }

    auto parsed = DurationFormat::parse(opts.formatSpec);
    if (!parsed) {
        return usageError("invalid --format: " + parsed.message);
    }
    opts.format = std::move(parsed.format);

    if (opts.tty && !ptyAvailable) {
        return usageError("--tty is not supported on this system");
    }
    if (opts.splitStderr && !opts.tty) {
        opts.warnings.push_back("--split-stderr has no effect without --tty");
    }

    LOG_DEBUG("Options: format \"" + opts.formatSpec + "\", refresh " +
              std::to_string(opts.refresh.count()) + "ms, mode " + toString(opts.mode()));

    OptionsResult result;
    result.ok = true;
    result.options = std::move(opts);
    return result;
}

void printUsage(const char* progName) {
    std::cout << "elapsed " << kVersion << " - show a running timer below a command's output\n\n";
    std::cout << "Usage: " << progName << " [options] [--] <command> [args...]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Options:\n";
    std::cout << "  -f, --format <TEMPLATE>  Status line template [default: Elapsed: %H:%M:%S]\n";
    std::cout << "  -r, --refresh <MS>       Milliseconds between updates, at most 86400000 [default: 1000]\n";
    std::cout << "  -t, --total              Leave the final elapsed time on screen\n";
    std::cout << "      --tty                Run the command on a pseudo-terminal\n";
    std::cout << "      --split-stderr       With --tty, keep stderr off the pseudo-terminal\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "  -V, --version            Show version\n\n";
    std::cout << "Template:\n";
    std::cout << "  %H %M %S   hours, minutes, seconds (zero-padded)\n";
    std::cout << "  %s         total seconds\n";
    std::cout << "  %f %<N>f   fractional seconds (6 or N digits)\n";
    std::cout << "  %n %t %e   newline, tab, escape (also \\n \\t \\e)\n";
    std::cout << "  %% \\\\      literal % and \\\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  ELAPSED_LOG_LEVEL  Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " make -j8\n";
    std::cout << "  " << progName << " --total --format '%s.%2fs' ./build.sh\n";
    std::cout << "  " << progName << " --tty --split-stderr cargo test 2>errors.log\n";
}

}
