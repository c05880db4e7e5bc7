#include "elapsed/child.hpp"
#include "elapsed/pty.hpp"

#include "test_support.hpp"

#include <csignal>
#include <cstdio>
#include <iostream>
#include <mutex>
#include <string>

#include <sys/stat.h>

using elapsed::ChildProcess;
using elapsed::CommandSpec;
using elapsed::ExecutionMode;
using elapsed::SpawnError;

static CommandSpec shell(const std::string& script) {
  return CommandSpec{"/bin/sh", {"-c", script}};
}

int main() {
  // Normal exit code
  {
    ChildProcess child;
    auto spawned = child.spawn(shell("exit 7"), ExecutionMode::Inherit);
    assert(spawned.ok);
    assert(spawned.pid > 0);
    assert(child.isRunning());
    auto outcome = child.wait();
    assert(!outcome.killedBySignal());
    assert(outcome.code == 7);
    assert(!child.isRunning());

    // A second wait returns the same outcome
    auto again = child.wait();
    assert(again.kind == outcome.kind && again.code == 7);
  }

  // PATH lookup
  {
    ChildProcess child;
    assert(child.spawn(CommandSpec{"true", {}}, ExecutionMode::Inherit).ok);
    auto outcome = child.wait();
    assert(!outcome.killedBySignal() && outcome.code == 0);
  }

  // Death by signal
  {
    ChildProcess child;
    assert(child.spawn(shell("kill -9 $$"), ExecutionMode::Inherit).ok);
    auto outcome = child.wait();
    assert(outcome.killedBySignal());
    assert(outcome.code == SIGKILL);
  }

  // Missing program fails at spawn time
  {
    ChildProcess child;
    auto spawned = child.spawn(CommandSpec{"/nonexistent/elapsed-test-binary", {}}, ExecutionMode::Inherit);
    assert(!spawned.ok);
    assert(spawned.error == SpawnError::NotFound);
    assert(spawned.message.find("/nonexistent/elapsed-test-binary") != std::string::npos);
    assert(!child.isRunning());

    ChildProcess viaPath;
    auto byName = viaPath.spawn(CommandSpec{"elapsed-test-no-such-command", {}}, ExecutionMode::Inherit);
    assert(!byName.ok);
    assert(byName.error == SpawnError::NotFound);
  }

  // Present but not executable
  {
    char path[] = "/tmp/elapsed-test-XXXXXX";
    const int fd = ::mkstemp(path);
    assert(fd >= 0);
    ::close(fd);
    assert(::chmod(path, 0644) == 0);

    ChildProcess child;
    auto spawned = child.spawn(CommandSpec{path, {}}, ExecutionMode::Inherit);
    ::unlink(path);
    assert(!spawned.ok);
    assert(spawned.error == SpawnError::PermissionDenied);
  }

  // Double spawn is refused
  {
    ChildProcess child;
    assert(child.spawn(shell("exit 0"), ExecutionMode::Inherit).ok);
    auto second = child.spawn(shell("exit 0"), ExecutionMode::Inherit);
    assert(!second.ok);
    assert(second.error == SpawnError::AlreadyStarted);
    (void)child.wait();
  }

  if (!elapsed::ptySupported()) {
    std::cerr << "test_child: no PTY support, skipping PTY cases\n";
    std::cerr << "test_child OK\n";
    return 0;
  }

  // Merged PTY: stdout is a terminal and stderr shares it
  {
    std::mutex mutex;
    std::string relayed;
    ChildProcess child;
    auto spawned = child.spawn(
        shell("if [ -t 1 ]; then echo is-a-tty; else echo not-a-tty; fi; echo on-stderr >&2; exit 3"),
        ExecutionMode::PtyMerged,
        [&](const char* data, std::size_t len) {
          std::lock_guard<std::mutex> lock(mutex);
          relayed.append(data, len);
          return true;
        });
    assert(spawned.ok);
    auto outcome = child.wait();
    assert(outcome.code == 3);
    std::lock_guard<std::mutex> lock(mutex);
    assert(relayed.find("is-a-tty") != std::string::npos);
    assert(relayed.find("on-stderr") != std::string::npos);
    assert(relayed.find("\r\n") != std::string::npos);
    assert(child.relayedBytes() == relayed.size());
    assert(!child.relayFailed());
  }

  // Split PTY: stderr bypasses the relay
  {
    std::string relayed;
    ChildProcess child;
    auto spawned = child.spawn(
        shell("echo relayed-line; echo 'test_child: split stderr line (expected)' >&2"),
        ExecutionMode::PtySplit,
        [&](const char* data, std::size_t len) {
          relayed.append(data, len);
          return true;
        });
    assert(spawned.ok);
    auto outcome = child.wait();
    assert(outcome.code == 0);
    assert(relayed.find("relayed-line") != std::string::npos);
    assert(relayed.find("split stderr line") == std::string::npos);
  }

  // Lots of output arrives complete before wait() returns
  {
    std::string relayed;
    ChildProcess child;
    auto spawned = child.spawn(shell("i=0; while [ $i -lt 2000 ]; do echo line-$i; i=$((i+1)); done"),
                               ExecutionMode::PtyMerged,
                               [&](const char* data, std::size_t len) {
                                 relayed.append(data, len);
                                 return true;
                               });
    assert(spawned.ok);
    assert(child.wait().code == 0);
    assert(relayed.find("line-0\r\n") != std::string::npos);
    assert(relayed.find("line-1999\r\n") != std::string::npos);
  }

  // A failing sink does not hide the child's result
  {
    ChildProcess child;
    auto spawned = child.spawn(shell("echo a; echo b; exit 5"), ExecutionMode::PtyMerged,
                               [](const char*, std::size_t) { return false; });
    assert(spawned.ok);
    auto outcome = child.wait();
    assert(outcome.code == 5);
    assert(child.relayFailed());
  }

  // Spawn failure in PTY mode leaves nothing behind
  {
    ChildProcess child;
    auto spawned = child.spawn(CommandSpec{"/nonexistent/elapsed-test-binary", {}}, ExecutionMode::PtyMerged);
    assert(!spawned.ok);
    assert(spawned.error == SpawnError::NotFound);
    assert(!child.isRunning());
  }

  std::cerr << "test_child OK\n";
  return 0;
}
