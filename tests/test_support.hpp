#pragma once

// Test support helpers.
//
// Tests are plain executables that return non-zero on failure. assert() is
// replaced with an always-on version so Release builds (NDEBUG) still check.

#include <cassert>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

namespace elapsed_test {

inline void fail(const char* expr, const char* file, int line) {
  std::cerr << "Test assertion failed: " << expr << " (" << file << ":" << line << ")\n";
  std::exit(1);
}

inline std::size_t countOf(const std::string& haystack, const std::string& needle) {
  if (needle.empty()) return 0;
  std::size_t n = 0;
  for (auto pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + needle.size())) {
    ++n;
  }
  return n;
}

// A pipe standing in for a terminal. Output stays small enough to fit in
// the kernel buffer, so drain() after the fact sees everything.
class CapturePipe {
public:
  CapturePipe() {
    int fds[2];
    if (::pipe(fds) != 0) {
      std::cerr << "pipe() failed\n";
      std::exit(1);
    }
    read_ = fds[0];
    write_ = fds[1];
    ::fcntl(read_, F_SETFL, ::fcntl(read_, F_GETFL) | O_NONBLOCK);
  }
  ~CapturePipe() {
    ::close(read_);
    ::close(write_);
  }
  CapturePipe(const CapturePipe&) = delete;
  CapturePipe& operator=(const CapturePipe&) = delete;

  int writeFd() const { return write_; }

  std::string drain() {
    std::string out;
    char buf[4096];
    while (true) {
      const ssize_t n = ::read(read_, buf, sizeof(buf));
      if (n > 0) {
        out.append(buf, static_cast<std::size_t>(n));
        continue;
      }
      if (n < 0 && errno == EINTR) continue;
      break;
    }
    return out;
  }

private:
  int read_ = -1;
  int write_ = -1;
};

// Minimal terminal model: printable text, \r, \n (as CR+LF), and the
// CSI sequences the status line uses (A, K, J). Other CSI sequences are
// consumed without effect. With a width, text wraps like an xterm: the
// cursor stays on the last column until the next printable character.
class Screen {
public:
  explicit Screen(std::size_t width = 0) : width_(width) {}

  void feed(const std::string& bytes) {
    for (std::size_t i = 0; i < bytes.size(); ++i) {
      const char c = bytes[i];
      if (c == '\r') {
        col_ = 0;
      } else if (c == '\n') {
        ++row_;
        col_ = 0;
        ensureRow();
      } else if (c == '\x1B' && i + 1 < bytes.size() && bytes[i + 1] == '[') {
        i += 2;
        int param = 0;
        bool haveParam = false;
        while (i < bytes.size() && (std::isdigit(static_cast<unsigned char>(bytes[i])) || bytes[i] == ';')) {
          if (bytes[i] != ';') {
            param = param * 10 + (bytes[i] - '0');
            haveParam = true;
          }
          ++i;
        }
        if (i >= bytes.size()) break;
        csi(bytes[i], haveParam ? param : 1);
      } else {
        if (width_ > 0 && col_ >= width_) {
          ++row_;
          col_ = 0;
        }
        ensureRow();
        std::string& line = rows_[row_];
        if (line.size() < col_) line.resize(col_, ' ');
        if (col_ < line.size()) {
          line[col_] = c;
        } else {
          line.push_back(c);
        }
        ++col_;
      }
    }
  }

  // Rows joined with '\n', trailing blanks and empty rows dropped.
  std::string contents() const {
    std::vector<std::string> rows = rows_;
    for (auto& r : rows) {
      while (!r.empty() && r.back() == ' ') r.pop_back();
    }
    while (!rows.empty() && rows.back().empty()) rows.pop_back();
    std::string out;
    for (std::size_t i = 0; i < rows.size(); ++i) {
      if (i > 0) out += '\n';
      out += rows[i];
    }
    return out;
  }

  std::size_t row() const { return row_; }
  std::size_t col() const { return col_; }

private:
  void ensureRow() {
    if (rows_.size() <= row_) rows_.resize(row_ + 1);
  }

  void csi(char final, int param) {
    ensureRow();
    switch (final) {
      case 'A':
        row_ = row_ >= static_cast<std::size_t>(param) ? row_ - static_cast<std::size_t>(param) : 0;
        break;
      case 'K':
        if (rows_[row_].size() > col_) rows_[row_].resize(col_);
        break;
      case 'J':
        if (rows_[row_].size() > col_) rows_[row_].resize(col_);
        rows_.resize(row_ + 1);
        break;
      default:
        break;
    }
  }

  std::size_t width_;
  std::vector<std::string> rows_;
  std::size_t row_ = 0;
  std::size_t col_ = 0;
};

} // namespace elapsed_test

#ifndef ELAPSED_TEST_ASSERT
#define ELAPSED_TEST_ASSERT(expr) \
  (static_cast<bool>(expr) ? (void)0 : ::elapsed_test::fail(#expr, __FILE__, __LINE__))
#endif

#ifdef assert
#undef assert
#endif
#define assert(expr) ELAPSED_TEST_ASSERT(expr)

#ifndef TEST_CHECK
#define TEST_CHECK(expr) ELAPSED_TEST_ASSERT(expr)
#endif
