/*
 * elapsed - Command runtime overlay
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "elapsed/terminal.hpp"
#include "elapsed/logger.hpp"
#include <cerrno>

#include <sys/ioctl.h>

namespace elapsed {

TerminalWriter::TerminalWriter(int fd) noexcept : fd_(fd) {
}

// Nothing in here may log while mutex_ is held: log lines can be routed
// back through message().

bool TerminalWriter::redraw(const std::string& text, bool force) noexcept {
    bool ok = false;
    try {
        std::lock_guard<std::mutex> lock(mutex_);

        std::string out;
        if (midLine_) {
            if (!force) {
                // Remember it for when the partial line is finished
                remember(text);
                return true;
            }
            out.push_back('\n');
            midLine_ = false;
        } else {
            out = clearSequence();
        }
        out += text;

        remember(text);
        displayed_ = true;
        ok = writeAll(fd_, out.data(), out.size());
    } catch (const std::exception& e) {
        LOG_ERROR("Status line redraw failed: " + std::string(e.what()));
        return false;
    }
    return ok;
}

bool TerminalWriter::erase() noexcept {
    bool ok = true;
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        const std::string out = clearSequence();
        displayed_ = false;
        text_.clear();
        rowsAbove_ = 0;
        if (!out.empty()) {
            ok = writeAll(fd_, out.data(), out.size());
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Status line erase failed: " + std::string(e.what()));
        return false;
    }
    return ok;
}

bool TerminalWriter::passthrough(int fd, const char* data, std::size_t len) noexcept {
    if (len == 0) {
        return true;
    }

    bool ok = false;
    try {
        std::lock_guard<std::mutex> lock(mutex_);

        const std::string clear = clearSequence();
        displayed_ = false;
        if (!clear.empty() && !writeAll(fd_, clear.data(), clear.size())) {
            return false;
        }
        if (!writeAll(fd, data, len)) {
            return false;
        }

        midLine_ = data[len - 1] != '\n';
        ok = restore();
    } catch (const std::exception& e) {
        LOG_ERROR("Relayed write failed: " + std::string(e.what()));
        return false;
    }
    return ok;
}

bool TerminalWriter::message(const std::string& line) noexcept {
    bool ok = false;
    try {
        std::lock_guard<std::mutex> lock(mutex_);

        std::string out = clearSequence();
        displayed_ = false;
        if (midLine_) {
            out.push_back('\n');
            midLine_ = false;
        }
        out += line;
        if (line.empty() || line.back() != '\n') {
            out.push_back('\n');
        }
        ok = writeAll(fd_, out.data(), out.size()) && restore();
    } catch (const std::exception&) {
        // Logging from here could recurse into message()
        return false;
    }
    return ok;
}

bool TerminalWriter::finish(const std::string& text) noexcept {
    bool ok = false;
    try {
        std::lock_guard<std::mutex> lock(mutex_);

        std::string out = midLine_ ? std::string("\n") : clearSequence();
        out += text;
        out.push_back('\n');

        midLine_ = false;
        displayed_ = false;
        text_.clear();
        rowsAbove_ = 0;
        ok = writeAll(fd_, out.data(), out.size());
    } catch (const std::exception& e) {
        LOG_ERROR("Final status line failed: " + std::string(e.what()));
        return false;
    }
    return ok;
}

void TerminalWriter::setColumns(std::size_t columns) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    columns_ = columns;
}

bool TerminalWriter::isDisplayed() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return displayed_;
}

std::string TerminalWriter::displayed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return displayed_ ? text_ : std::string();
}

bool TerminalWriter::writeAll(int fd, const char* data, std::size_t len) noexcept {
    while (len > 0) {
        const ssize_t n = ::write(fd, data, len);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        data += n;
        len -= static_cast<std::size_t>(n);
    }
    return true;
}

// Back to column 0 of the first status row, then clear what follows.
std::string TerminalWriter::clearSequence() const {
    if (!displayed_) {
        return std::string();
    }
    std::string seq = "\r";
    if (rowsAbove_ > 0) {
        seq += "\x1B[" + std::to_string(rowsAbove_) + "A";
        seq += "\x1B[J";
    } else {
        seq += "\x1B[K";
    }
    return seq;
}

std::size_t TerminalWriter::columns() const noexcept {
    if (columns_ > 0) {
        return columns_;
    }
    struct winsize ws {};
    if (::ioctl(fd_, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) {
        return ws.ws_col;
    }
    return 0;
}

void TerminalWriter::remember(const std::string& text) {
    text_ = text;
    const std::size_t rows = rowsSpanned(text, columns());
    rowsAbove_ = rows > 0 ? rows - 1 : 0;
}

// Puts the remembered status line back once output sits at a line start
bool TerminalWriter::restore() noexcept {
    if (midLine_ || text_.empty()) {
        return true;
    }
    displayed_ = true;
    return writeAll(fd_, text_.data(), text_.size());
}

std::size_t TerminalWriter::rowsSpanned(const std::string& text, std::size_t columns) noexcept {
    std::size_t rows = 0;
    std::size_t width = 0;

    auto closeRow = [&]() {
        if (columns == 0 || width == 0) {
            rows += 1;
        } else {
            rows += (width + columns - 1) / columns;
        }
        width = 0;
    };

    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (c == '\n') {
            closeRow();
        } else if (c == 0x1B) {
            // CSI runs to its final byte; other escapes take one more byte
            if (i + 1 < text.size() && text[i + 1] == '[') {
                i += 2;
                while (i < text.size() && (static_cast<unsigned char>(text[i]) < 0x40 ||
                                           static_cast<unsigned char>(text[i]) > 0x7E)) {
                    ++i;
                }
            } else {
                ++i;
            }
        } else if (c == '\t') {
            width = (width / 8 + 1) * 8;
        } else if (c == '\r') {
            width = 0;
        } else if (c >= 0x20 && c != 0x7F && (c & 0xC0) != 0x80) {
            // Counts code points, not UTF-8 continuation bytes
            ++width;
        }
    }
    closeRow();
    return rows;
}

}
