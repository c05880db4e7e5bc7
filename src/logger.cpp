/*
 * elapsed - Command runtime overlay
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "elapsed/logger.hpp"
#include <iostream>
#include <cctype>
#include <cstdlib>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace elapsed {

static LogLevel g_level = LogLevel::WARN;
static std::mutex g_log_mutex;
static bool g_level_initialized = false;
static std::unordered_map<std::thread::id, std::string> g_thread_names;
static Logger::Sink g_sink;

void Logger::setLevel(LogLevel level) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = level;
    g_level_initialized = true;
}

void Logger::initFromEnv() noexcept {
    setLevel(parseEnvLevel());
}

void Logger::setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_sink = std::move(sink);
}

LogLevel Logger::level() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (!g_level_initialized) {
        g_level = parseEnvLevel();
        g_level_initialized = true;
    }
    return g_level;
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    try {
        if (static_cast<uint8_t>(level) > static_cast<uint8_t>(Logger::level())) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::string thread_info;
        Sink sink;
        {
            std::lock_guard<std::mutex> lock(g_log_mutex);
            auto it = g_thread_names.find(std::this_thread::get_id());
            thread_info = it != g_thread_names.end() ? it->second : "Main";
            sink = g_sink;
        }

        std::stringstream ss;
        ss << "[" << std::put_time(std::localtime(&time_t), "%H:%M:%S");
        ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
        ss << " elapsed [" << levelToString(level) << "]";
        ss << " [" << thread_info << "]";
        ss << " " << message << "\n";

        // Called unlocked; the sink takes its own locks
        if (sink && sink(ss.str())) {
            return;
        }

        {
            // stdout belongs to the child command
            std::lock_guard<std::mutex> lock(g_log_mutex);
            std::cerr << ss.str() << std::flush;
        }
    } catch (...) {
        // Logging must never take the supervisor down
    }
}

std::optional<LogLevel> Logger::parseLevel(const std::string& name) {
    std::string level_str;
    level_str.reserve(name.size());
    for (char c : name) {
        level_str.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (level_str == "error") return LogLevel::ERROR;
    if (level_str == "warn" || level_str == "warning") return LogLevel::WARN;
    if (level_str == "info") return LogLevel::INFO;
    if (level_str == "debug") return LogLevel::DEBUG;
    if (level_str == "trace") return LogLevel::TRACE;
    return std::nullopt;
}

LogLevel Logger::parseEnvLevel() noexcept {
    const char* env_val = std::getenv("ELAPSED_LOG_LEVEL");
    if (!env_val) return LogLevel::WARN;

    try {
        return parseLevel(env_val).value_or(LogLevel::WARN);
    } catch (...) {
        return LogLevel::WARN;
    }
}

const char* Logger::levelToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default: return "UNKN ";
    }
}

void setThreadName(const std::string& name) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_thread_names[std::this_thread::get_id()] = name;
}

}
