#include <chrono>
#include <parexec/logger.hh>
#include <parexec/pipeline.hh>
#include <parexec/result_normalizer.hh>

using std::chrono::duration_cast;
using std::chrono::milliseconds;

namespace parexec {

namespace {

std::string elapsed_ms(const ProcessOutcome& po) {
    return concat_tostr(duration_cast<milliseconds>(po.elapsed).count(), " ms");
}

} // namespace

CompileOutcome Pipeline::compile_and_run(
    const CompileRequest& req, const CancellationToken* cancellation
) const {
    if (auto rejection = validate(req, config_); rejection) {
        stdlog("request rejected (", to_string(rejection->reason), "): ", rejection->detail);
        return std::move(*rejection);
    }

    auto screen = screener_.screen(req.source);
    if (not screen.allowed) {
        stdlog(
            "request rejected (",
            to_string(RejectReason::MATCHED_PATTERN),
            "): pattern `",
            *screen.matched_pattern,
            "` at line ",
            screen.line
        );
        return normalize(screen, std::nullopt, std::nullopt, {});
    }

    TimeLimits limits = {
        .compile = config_.compile_timeout,
        .execute = config_.execute_timeout(req.mode),
    };

    // Nothing is spawned for a request cancelled while waiting
    if (cancellation != nullptr and cancellation->cancelled()) {
        stdlog("request cancelled before compilation");
        return outcome::CompileError{.cancelled = true, .detail = "compilation was cancelled"};
    }

    std::optional<WorkspaceGuard> guard;
    try {
        guard.emplace(workspaces_, workspaces_.acquire());
    } catch (const ResourceExhausted& e) {
        errlog("workspace acquisition failed: ", e.what());
        return outcome::ResourceExhausted{.description = e.what()};
    }

    const Workspace& ws = guard->workspace();
    const auto& wsname = ws.name();
    stdlog(
        wsname,
        ": screened, compiling (",
        to_string(req.mode),
        ", ",
        to_string(req.language),
        ", ",
        req.worker_count,
        " workers)"
    );

    std::optional<CompilationResult> compilation;
    std::optional<ProcessOutcome> execution;
    try {
        {
            CancellationToken token{limits.compile, cancellation};
            compilation = compiler_.compile(ws, req.source, req.mode, req.language, token);
        }
        const auto& cp = compilation->process;
        stdlog(
            wsname,
            ": compiled in ",
            elapsed_ms(cp),
            ", exit code ",
            cp.exit_code,
            ", ",
            to_string(cp.termination),
            (compilation->executable_produced ? "" : ", no executable")
        );

        if (cp.exited_normally() and cp.exit_code == 0 and compilation->executable_produced) {
            CancellationToken token{limits.execute, cancellation};
            execution = runner_.run(
                ws, req.mode, static_cast<uint32_t>(req.worker_count), req.stdin_text, token
            );
            stdlog(
                wsname,
                ": executed in ",
                elapsed_ms(*execution),
                ", exit code ",
                execution->exit_code,
                ", ",
                to_string(execution->termination)
            );
        }
    } catch (const std::exception& e) {
        errlog(wsname, ": toolchain failure: ", e.what());
        return outcome::ToolchainError{.description = e.what()};
    }

    auto res = normalize(screen, compilation, execution, limits);
    stdlog(wsname, ": finished: ", classification(res));
    return res;
}

} // namespace parexec
