#pragma once

#include <parexec/cancellation_token.hh>
#include <parexec/compiler.hh>
#include <parexec/config.hh>
#include <parexec/outcome.hh>
#include <parexec/pattern_screener.hh>
#include <parexec/request.hh>
#include <parexec/runner.hh>
#include <parexec/workspace.hh>

namespace parexec {

/**
 * The compile-and-run pipeline of a single request:
 *   validate -> screen -> acquire workspace -> compile -> run -> normalize
 * The workspace is released exactly once whichever way the request ends.
 *
 * Holds no per-request state, so compile_and_run() may be called
 * concurrently, provided that the collaborators are thread-safe.
 */
class Pipeline {
    const Config& config_;
    const PatternScreener& screener_;
    WorkspaceManager& workspaces_;
    const Compiler& compiler_;
    const Runner& runner_;

public:
    Pipeline(
        const Config& config,
        const PatternScreener& screener,
        WorkspaceManager& workspaces,
        const Compiler& compiler,
        const Runner& runner
    )
    : config_(config)
    , screener_(screener)
    , workspaces_(workspaces)
    , compiler_(compiler)
    , runner_(runner) {}

    /**
     * @brief Compiles and runs @p req
     * @details Expected per-request failures (rejection, compilation error,
     *   timeouts, crashes, workspace creation failure, compiler that cannot
     *   be spawned) are returned as outcomes, never thrown.
     *
     * @param req the request
     * @param cancellation if not nullptr, cancelling it kills the running
     *   step and ends the request as cancelled
     */
    CompileOutcome compile_and_run(
        const CompileRequest& req, const CancellationToken* cancellation = nullptr
    ) const;
};

} // namespace parexec
