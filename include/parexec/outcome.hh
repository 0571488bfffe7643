#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace parexec {

enum class Phase { COMPILE, EXECUTE };

enum class RejectReason {
    EMPTY_SOURCE,
    SOURCE_TOO_LARGE,
    INVALID_WORKER_COUNT,
    LANGUAGE_MISMATCH,
    MATCHED_PATTERN,
};

constexpr std::string_view to_string(Phase phase) noexcept {
    switch (phase) {
    case Phase::COMPILE: return "compile";
    case Phase::EXECUTE: return "execute";
    }
    return "unknown";
}

constexpr std::string_view to_string(RejectReason reason) noexcept {
    switch (reason) {
    case RejectReason::EMPTY_SOURCE: return "empty-source";
    case RejectReason::SOURCE_TOO_LARGE: return "source-too-large";
    case RejectReason::INVALID_WORKER_COUNT: return "invalid-worker-count";
    case RejectReason::LANGUAGE_MISMATCH: return "language-mismatch";
    case RejectReason::MATCHED_PATTERN: return "matched-pattern";
    }
    return "unknown";
}

namespace outcome {

struct Success {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
};

struct CompileError {
    std::string diagnostics; // compiler's stderr, verbatim
    std::string stdout_text;
    int exit_code = 0;
    bool cancelled = false;
    std::string detail; // e.g. "compiler produced no executable", may be empty
};

struct RuntimeError {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
    std::optional<int> signal;
    bool cancelled = false;
};

struct Timeout {
    Phase phase = Phase::EXECUTE;
    std::string stdout_text;
    std::string stderr_text;
    std::chrono::milliseconds limit{0};
};

struct Rejected {
    RejectReason reason = RejectReason::EMPTY_SOURCE;
    std::string detail;
    std::optional<std::string> matched_pattern; // set iff reason == MATCHED_PATTERN
};

// The workspace could not be created
struct ResourceExhausted {
    std::string description;
};

// A compiler or the launcher could not be spawned at all
struct ToolchainError {
    std::string description;
};

} // namespace outcome

using CompileOutcome = std::variant<
    outcome::Success,
    outcome::CompileError,
    outcome::RuntimeError,
    outcome::Timeout,
    outcome::Rejected,
    outcome::ResourceExhausted,
    outcome::ToolchainError>;

// Human-readable classification, e.g. "Compilation Error"
std::string_view classification(const CompileOutcome& outcome) noexcept;

[[nodiscard]] inline bool is_success(const CompileOutcome& outcome) noexcept {
    return std::holds_alternative<outcome::Success>(outcome);
}

} // namespace parexec
