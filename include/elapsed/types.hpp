#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace elapsed {

// How the child's stdout/stderr reach the real terminal.
enum class ExecutionMode : std::uint8_t { Inherit, PtyMerged, PtySplit };

struct CommandSpec {
    std::string program;
    std::vector<std::string> args;
};

// Produced once, when the OS reports that the child is gone.
struct TerminationOutcome {
    enum class Kind : std::uint8_t { Exited, Signaled };

    Kind kind = Kind::Exited;
    int code = 0;   // exit code or signal number

    [[nodiscard]] static TerminationOutcome exited(int code) noexcept { return {Kind::Exited, code}; }
    [[nodiscard]] static TerminationOutcome signaled(int sig) noexcept { return {Kind::Signaled, sig}; }
    [[nodiscard]] bool killedBySignal() const noexcept { return kind == Kind::Signaled; }
};

[[nodiscard]] const char* toString(ExecutionMode mode) noexcept;
[[nodiscard]] std::string describe(const CommandSpec& command);

} // namespace elapsed
