/*
 * elapsed - Command runtime overlay
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>

namespace elapsed {

// Owning wrapper around a raw descriptor; closes on destruction.
class FileDescriptor final {
public:
    FileDescriptor() noexcept = default;
    explicit FileDescriptor(int fd) noexcept : fd_(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.release()) {}
    FileDescriptor& operator=(FileDescriptor&& other) noexcept;

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }
    explicit operator bool() const noexcept { return valid(); }

    int release() noexcept;
    void reset(int fd = -1) noexcept;

private:
    int fd_ = -1;
};

struct PtyPair {
    FileDescriptor master;
    FileDescriptor slave;
};

struct PtyResult {
    bool ok = false;
    PtyPair pty;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Runtime capability check; false when the platform cannot hand out PTYs.
[[nodiscard]] bool ptySupported() noexcept;

// Opens a master/slave pair. Both ends are close-on-exec; the slave is
// sized like the terminal on `sizeFromFd` when that is a terminal.
[[nodiscard]] PtyResult openPty(int sizeFromFd = -1) noexcept;

}
