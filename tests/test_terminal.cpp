#include "elapsed/logger.hpp"
#include "elapsed/terminal.hpp"

#include "test_support.hpp"

#include <iostream>
#include <string>

using elapsed::TerminalWriter;
using elapsed_test::CapturePipe;
using elapsed_test::Screen;

static void writeRaw(int fd, const std::string& s) {
  assert(TerminalWriter::writeAll(fd, s.data(), s.size()));
}

int main() {
  // redraw then erase leaves the screen as it was
  {
    CapturePipe pipe;
    Screen screen;
    writeRaw(pipe.writeFd(), "hello\n");
    screen.feed(pipe.drain());
    const std::string before = screen.contents();
    const std::size_t col = screen.col();

    TerminalWriter writer(pipe.writeFd());
    assert(!writer.isDisplayed());
    assert(writer.redraw("Elapsed: 00:00:01"));
    assert(writer.isDisplayed());
    assert(writer.displayed() == "Elapsed: 00:00:01");
    screen.feed(pipe.drain());
    assert(screen.contents() == "hello\nElapsed: 00:00:01");

    assert(writer.erase());
    assert(!writer.isDisplayed());
    screen.feed(pipe.drain());
    assert(screen.contents() == before);
    assert(screen.col() == col);
  }

  // Erasing with nothing displayed writes nothing
  {
    CapturePipe pipe;
    TerminalWriter writer(pipe.writeFd());
    assert(writer.erase());
    assert(pipe.drain().empty());
  }

  // Repeated redraws overwrite in place
  {
    CapturePipe pipe;
    Screen screen;
    TerminalWriter writer(pipe.writeFd());
    for (int i = 0; i < 20; ++i) {
      assert(writer.redraw("tick " + std::to_string(i)));
    }
    assert(writer.redraw("x"));
    const std::string bytes = pipe.drain();
    screen.feed(bytes);
    assert(screen.contents() == "x");
    assert(elapsed_test::countOf(bytes, "\r\x1B[K") == 20);
  }

  // Multi-line status blocks are lifted as a whole
  {
    CapturePipe pipe;
    Screen screen;
    TerminalWriter writer(pipe.writeFd());
    writeRaw(pipe.writeFd(), "out\n");
    assert(writer.redraw("H: 00\nM: 00\nS: 01"));
    assert(writer.redraw("H: 00\nM: 00\nS: 02"));
    const std::string bytes = pipe.drain();
    assert(bytes.find("\r\x1B[2A\x1B[J") != std::string::npos);
    screen.feed(bytes);
    assert(screen.contents() == "out\nH: 00\nM: 00\nS: 02");

    assert(writer.erase());
    screen.feed(pipe.drain());
    assert(screen.contents() == "out");
  }

  // Relayed lines go above the status line
  {
    CapturePipe pipe;
    Screen screen;
    TerminalWriter writer(pipe.writeFd());
    assert(writer.redraw("Elapsed: 00:00:00"));
    const std::string line = "Starting...\n";
    assert(writer.passthrough(pipe.writeFd(), line.data(), line.size()));
    assert(writer.isDisplayed());
    assert(writer.redraw("Elapsed: 00:00:01"));
    screen.feed(pipe.drain());
    assert(screen.contents() == "Starting...\nElapsed: 00:00:01");
  }

  // A partial line defers the status line until the line is finished
  {
    CapturePipe pipe;
    Screen screen;
    TerminalWriter writer(pipe.writeFd());
    assert(writer.redraw("S0"));
    const std::string partial = "Continue? ";
    assert(writer.passthrough(pipe.writeFd(), partial.data(), partial.size()));
    assert(!writer.isDisplayed());
    assert(writer.redraw("S1"));
    assert(!writer.isDisplayed());
    screen.feed(pipe.drain());
    assert(screen.contents() == "Continue?");

    const std::string rest = "yes\n";
    assert(writer.passthrough(pipe.writeFd(), rest.data(), rest.size()));
    assert(writer.isDisplayed());
    screen.feed(pipe.drain());
    assert(screen.contents() == "Continue? yes\nS1");
  }

  // force starts a fresh line when output stopped mid-line
  {
    CapturePipe pipe;
    Screen screen;
    TerminalWriter writer(pipe.writeFd());
    const std::string partial = "no newline";
    assert(writer.passthrough(pipe.writeFd(), partial.data(), partial.size()));
    assert(writer.redraw("Total", true));
    screen.feed(pipe.drain());
    assert(screen.contents() == "no newline\nTotal");
  }

  // Our own messages start a fresh row after a partial line
  {
    CapturePipe pipe;
    Screen screen;
    TerminalWriter writer(pipe.writeFd());
    assert(writer.redraw("S0"));
    const std::string partial = "partial";
    assert(writer.passthrough(pipe.writeFd(), partial.data(), partial.size()));
    assert(writer.message("notice"));
    assert(writer.isDisplayed());
    screen.feed(pipe.drain());
    assert(screen.contents() == "partial\nnotice\nS0");

    // and the status line stays below them
    assert(writer.message("second\n"));
    screen.feed(pipe.drain());
    assert(screen.contents() == "partial\nnotice\nsecond\nS0");
  }

  // finish leaves the last text behind and forgets it
  {
    CapturePipe pipe;
    Screen screen;
    TerminalWriter writer(pipe.writeFd());
    assert(writer.redraw("Elapsed: 00:00:01"));
    assert(writer.finish("Elapsed: 00:00:02"));
    assert(!writer.isDisplayed());
    assert(writer.message("after"));
    assert(writer.erase());
    screen.feed(pipe.drain());
    assert(screen.contents() == "Elapsed: 00:00:02\nafter");
  }

  // A status line wider than the terminal is lifted as all its rows
  {
    CapturePipe pipe;
    Screen screen(10);
    TerminalWriter writer(pipe.writeFd());
    writer.setColumns(10);
    writeRaw(pipe.writeFd(), "out\n");
    for (int i = 0; i < 5; ++i) {
      assert(writer.redraw("Elapsed: 00:00:0" + std::to_string(i) + " long tail"));
    }
    const std::string bytes = pipe.drain();
    assert(elapsed_test::countOf(bytes, "\r\x1B[2A\x1B[J") == 4);
    screen.feed(bytes);
    assert(screen.contents() == "out\nElapsed: 0\n0:00:04 lo\nng tail");

    const std::string line = "relayed\n";
    assert(writer.passthrough(pipe.writeFd(), line.data(), line.size()));
    screen.feed(pipe.drain());
    assert(screen.contents() == "out\nrelayed\nElapsed: 0\n0:00:04 lo\nng tail");

    assert(writer.erase());
    screen.feed(pipe.drain());
    assert(screen.contents() == "out\nrelayed");
  }

  // Escape sequences and UTF-8 continuation bytes take no columns
  {
    CapturePipe pipe;
    TerminalWriter writer(pipe.writeFd());
    writer.setColumns(10);
    assert(writer.redraw("\x1B[1m\xC3\xA9t\xC3\xA9 12345\x1B[0m"));
    assert(writer.redraw("x"));
    const std::string bytes = pipe.drain();
    assert(bytes.find("\x1B[J") == std::string::npos);
    assert(elapsed_test::countOf(bytes, "\r\x1B[K") == 1);
  }

  // Log lines routed through the writer keep off the status row
  {
    using elapsed::Logger;
    using elapsed::LogLevel;
    CapturePipe pipe;
    Screen screen;
    TerminalWriter writer(pipe.writeFd());
    Logger::setLevel(LogLevel::WARN);
    Logger::setSink([&writer](const std::string& line) { return writer.message(line); });
    assert(writer.redraw("Elapsed: 00:00:03"));
    LOG_WARN("disk almost full");
    Logger::setSink(nullptr);

    screen.feed(pipe.drain());
    const std::string shown = screen.contents();
    const auto warn = shown.find("disk almost full");
    assert(warn != std::string::npos);
    assert(shown.find('\n') > warn);
    assert(shown.substr(shown.find('\n') + 1) == "Elapsed: 00:00:03");
  }

  // Closed descriptor reports failure instead of throwing
  {
    int fds[2];
    assert(::pipe(fds) == 0);
    ::close(fds[0]);
    ::close(fds[1]);
    TerminalWriter writer(fds[1]);
    assert(!writer.redraw("x"));
  }

  std::cerr << "test_terminal OK\n";
  return 0;
}
