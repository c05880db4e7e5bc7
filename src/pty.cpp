/*
 * elapsed - Command runtime overlay
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "elapsed/pty.hpp"
#include "elapsed/logger.hpp"
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

namespace elapsed {

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
    if (this != &other) {
        reset(other.release());
    }
    return *this;
}

int FileDescriptor::release() noexcept {
    const int fd = fd_;
    fd_ = -1;
    return fd;
}

void FileDescriptor::reset(int fd) noexcept {
    if (fd_ >= 0 && fd_ != fd) {
        ::close(fd_);
    }
    fd_ = fd;
}

bool ptySupported() noexcept {
    FileDescriptor probe(::posix_openpt(O_RDWR | O_NOCTTY | O_CLOEXEC));
    if (!probe) {
        LOG_DEBUG("posix_openpt unavailable: " + std::string(std::strerror(errno)));
        return false;
    }
    return true;
}

PtyResult openPty(int sizeFromFd) noexcept {
    PtyResult result;

    try {
        FileDescriptor master(::posix_openpt(O_RDWR | O_NOCTTY | O_CLOEXEC));
        if (!master) {
            result.message = std::string("posix_openpt failed: ") + std::strerror(errno);
            return result;
        }
        if (::grantpt(master.get()) != 0) {
            result.message = std::string("grantpt failed: ") + std::strerror(errno);
            return result;
        }
        if (::unlockpt(master.get()) != 0) {
            result.message = std::string("unlockpt failed: ") + std::strerror(errno);
            return result;
        }

        char name[PATH_MAX];
        if (::ptsname_r(master.get(), name, sizeof(name)) != 0) {
            result.message = std::string("ptsname failed: ") + std::strerror(errno);
            return result;
        }

        FileDescriptor slave(::open(name, O_RDWR | O_NOCTTY | O_CLOEXEC));
        if (!slave) {
            result.message = std::string("open ") + name + " failed: " + std::strerror(errno);
            return result;
        }

        if (sizeFromFd >= 0 && ::isatty(sizeFromFd)) {
            struct winsize ws {};
            if (::ioctl(sizeFromFd, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) {
                if (::ioctl(slave.get(), TIOCSWINSZ, &ws) != 0) {
                    LOG_WARN("Could not size PTY: " + std::string(std::strerror(errno)));
                }
            }
        }

        LOG_DEBUG("Opened PTY " + std::string(name));
        result.pty.master = std::move(master);
        result.pty.slave = std::move(slave);
        result.ok = true;
    } catch (const std::exception& e) {
        result.message = std::string("PTY setup failed: ") + e.what();
    }
    return result;
}

}
