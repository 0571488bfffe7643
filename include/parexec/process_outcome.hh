#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace parexec {

enum class TerminationReason {
    COMPLETED, // the process exited (or was killed by a signal) on its own
    TIMED_OUT, // killed after the deadline of its token passed
    KILLED, // killed after its token was cancelled
};

constexpr std::string_view to_string(TerminationReason tr) noexcept {
    switch (tr) {
    case TerminationReason::COMPLETED: return "completed";
    case TerminationReason::TIMED_OUT: return "timed-out";
    case TerminationReason::KILLED: return "killed";
    }
    return "unknown";
}

// Result of one child process run, produced separately by the compilation and
// the execution step
struct ProcessOutcome {
    int exit_code = 0; // 128 + signal number if the process was killed by a signal
    std::optional<int> signal;
    std::string stdout_text;
    std::string stderr_text;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    std::chrono::nanoseconds elapsed{0};
    TerminationReason termination = TerminationReason::COMPLETED;

    [[nodiscard]] bool exited_normally() const noexcept {
        return termination == TerminationReason::COMPLETED and not signal.has_value();
    }
};

} // namespace parexec
