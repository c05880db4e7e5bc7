/*
 * elapsed - Command runtime overlay
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace elapsed {

enum class LogLevel : uint8_t { 
    ERROR = 0, 
    WARN = 1, 
    INFO = 2, 
    DEBUG = 3, 
    TRACE = 4 
};

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    static void initFromEnv() noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    
    static void log(LogLevel level, const std::string& message) noexcept;

    // Receives each formatted line instead of stderr while installed. A
    // sink returning false sends that line to stderr after all.
    using Sink = std::function<bool(const std::string& line)>;
    static void setSink(Sink sink);
    
    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

    // Accepts error/warn/warning/info/debug/trace, case-insensitive
    [[nodiscard]] static std::optional<LogLevel> parseLevel(const std::string& name);

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Thread naming for better logging context
void setThreadName(const std::string& name);

}

// Convenience macros for common usage
#define LOG_ERROR(msg) ::elapsed::Logger::error(msg)
#define LOG_WARN(msg)  ::elapsed::Logger::warn(msg)  
#define LOG_INFO(msg)  ::elapsed::Logger::info(msg)
#define LOG_DEBUG(msg) ::elapsed::Logger::debug(msg)
#define LOG_TRACE(msg) ::elapsed::Logger::trace(msg)
