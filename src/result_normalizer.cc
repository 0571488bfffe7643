#include <parexec/concat_tostr.hh>
#include <parexec/result_normalizer.hh>
#include <stdexcept>

namespace parexec {

namespace {

bool failed(const ProcessOutcome& po) noexcept {
    return po.exit_code != 0 or po.signal.has_value();
}

} // namespace

CompileOutcome normalize(
    const ScreenResult& screen,
    const std::optional<CompilationResult>& compilation,
    const std::optional<ProcessOutcome>& execution,
    TimeLimits limits
) {
    if (not screen.allowed) {
        if (compilation or execution) {
            throw std::logic_error("normalize(): rejected source cannot have been compiled");
        }
        if (not screen.matched_pattern) {
            throw std::logic_error("normalize(): rejection without a matched pattern");
        }
        return outcome::Rejected{
            .reason = RejectReason::MATCHED_PATTERN,
            .detail = concat_tostr(
                "source contains forbidden pattern `",
                *screen.matched_pattern,
                "` at line ",
                screen.line
            ),
            .matched_pattern = screen.matched_pattern,
        };
    }

    if (not compilation) {
        throw std::logic_error("normalize(): allowed source has to be compiled");
    }

    const auto& cp = compilation->process;
    bool compiled = cp.termination == TerminationReason::COMPLETED and not failed(cp) and
        compilation->executable_produced;
    if (not compiled and execution) {
        throw std::logic_error("normalize(): execution after a failed compilation");
    }

    switch (cp.termination) {
    case TerminationReason::TIMED_OUT:
        return outcome::Timeout{
            .phase = Phase::COMPILE,
            .stdout_text = cp.stdout_text,
            .stderr_text = cp.stderr_text,
            .limit = limits.compile,
        };
    case TerminationReason::KILLED:
        return outcome::CompileError{
            .diagnostics = cp.stderr_text,
            .stdout_text = cp.stdout_text,
            .exit_code = cp.exit_code,
            .cancelled = true,
            .detail = "compilation was cancelled",
        };
    case TerminationReason::COMPLETED: break;
    }

    if (failed(cp)) {
        return outcome::CompileError{
            .diagnostics = cp.stderr_text,
            .stdout_text = cp.stdout_text,
            .exit_code = cp.exit_code,
            .cancelled = false,
            .detail = {},
        };
    }
    if (not compilation->executable_produced) {
        return outcome::CompileError{
            .diagnostics = cp.stderr_text,
            .stdout_text = cp.stdout_text,
            .exit_code = cp.exit_code,
            .cancelled = false,
            .detail = "compiler produced no executable",
        };
    }

    if (not execution) {
        throw std::logic_error("normalize(): compiled program has to be executed");
    }

    const auto& ep = *execution;
    switch (ep.termination) {
    case TerminationReason::TIMED_OUT:
        return outcome::Timeout{
            .phase = Phase::EXECUTE,
            .stdout_text = ep.stdout_text,
            .stderr_text = ep.stderr_text,
            .limit = limits.execute,
        };
    case TerminationReason::KILLED:
        return outcome::RuntimeError{
            .stdout_text = ep.stdout_text,
            .stderr_text = ep.stderr_text,
            .exit_code = ep.exit_code,
            .signal = ep.signal,
            .cancelled = true,
        };
    case TerminationReason::COMPLETED: break;
    }

    if (failed(ep)) {
        return outcome::RuntimeError{
            .stdout_text = ep.stdout_text,
            .stderr_text = ep.stderr_text,
            .exit_code = ep.exit_code,
            .signal = ep.signal,
            .cancelled = false,
        };
    }

    return outcome::Success{
        .stdout_text = ep.stdout_text,
        .stderr_text = ep.stderr_text,
        .exit_code = 0,
    };
}

} // namespace parexec
