/*
 * elapsed - Command runtime overlay
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <mutex>
#include <string>

#include <unistd.h>

namespace elapsed {

/*
 * Owns the status line on a terminal descriptor (stderr unless told
 * otherwise). At most one status block is on screen; every operation
 * first moves back to its start and clears it.
 */
class TerminalWriter final {
public:
    explicit TerminalWriter(int fd = STDERR_FILENO) noexcept;

    TerminalWriter(const TerminalWriter&) = delete;
    TerminalWriter& operator=(const TerminalWriter&) = delete;
    TerminalWriter(TerminalWriter&&) = delete;
    TerminalWriter& operator=(TerminalWriter&&) = delete;

    // While relayed output has left the cursor mid-line the redraw is
    // deferred, unless `force` is set, which starts a fresh line first.
    bool redraw(const std::string& text, bool force = false) noexcept;
    bool erase() noexcept;

    // Writes relayed child output to `fd` with the status line lifted out
    // of the way. The line comes back only if `data` ends with '\n'.
    bool passthrough(int fd, const char* data, std::size_t len) noexcept;

    // Prints a line of our own (diagnostics, the final signal notice) on a
    // fresh row above the status line.
    bool message(const std::string& line) noexcept;

    // Draws `text` one last time and leaves it behind, ending the row.
    bool finish(const std::string& text) noexcept;

    // Width used to count wrapped rows; 0 asks the terminal each time.
    void setColumns(std::size_t columns) noexcept;

    [[nodiscard]] bool isDisplayed() const noexcept;
    [[nodiscard]] std::string displayed() const;
    [[nodiscard]] int fd() const noexcept { return fd_; }

    [[nodiscard]] static bool writeAll(int fd, const char* data, std::size_t len) noexcept;

private:
    [[nodiscard]] std::string clearSequence() const;
    [[nodiscard]] std::size_t columns() const noexcept;
    void remember(const std::string& text);
    bool restore() noexcept;

    // Rows the text occupies once wrapped at `columns` (0 = no wrapping)
    static std::size_t rowsSpanned(const std::string& text, std::size_t columns) noexcept;

    int fd_;
    mutable std::mutex mutex_;
    bool displayed_ = false;
    std::string text_;
    std::size_t rowsAbove_ = 0;  // rows of text_ above the cursor row
    bool midLine_ = false;
    std::size_t columns_ = 0;
};

}
