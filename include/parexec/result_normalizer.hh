#pragma once

#include <chrono>
#include <optional>
#include <parexec/outcome.hh>
#include <parexec/pattern_screener.hh>
#include <parexec/process_outcome.hh>

namespace parexec {

struct CompilationResult {
    ProcessOutcome process;
    bool executable_produced = false; // the artifact existed after the compiler exited
};

struct TimeLimits {
    std::chrono::milliseconds compile{0};
    std::chrono::milliseconds execute{0};
};

/**
 * @brief Maps what the request went through into its final outcome
 * @details Precedence: the screener's rejection, then the compilation
 *   (timeout, failure or missing executable), then the execution (timeout,
 *   failure), then success. A cancelled step yields CompileError or
 *   RuntimeError with the cancelled flag set. Pure: performs no I/O.
 *
 * @param screen verdict of the screener
 * @param compilation present iff the screener allowed the source
 * @param execution present iff the compilation succeeded
 * @param limits reported in Timeout outcomes
 *
 * @errors Throws std::logic_error if the inputs are inconsistent (e.g. an
 *   execution after a failed compilation)
 */
CompileOutcome normalize(
    const ScreenResult& screen,
    const std::optional<CompilationResult>& compilation,
    const std::optional<ProcessOutcome>& execution,
    TimeLimits limits
);

} // namespace parexec
