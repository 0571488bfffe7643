#pragma once

#include <cstdint>
#include <optional>
#include <parexec/cancellation_token.hh>
#include <parexec/config.hh>
#include <parexec/mode.hh>
#include <parexec/process_outcome.hh>
#include <parexec/workspace.hh>
#include <string>
#include <unistd.h>

namespace parexec {

class Runner {
public:
    Runner() = default;
    Runner(const Runner&) = delete;
    Runner(Runner&&) = delete;
    Runner& operator=(const Runner&) = delete;
    Runner& operator=(Runner&&) = delete;

    virtual ~Runner() = default;

    /**
     * @brief Runs the artifact compiled in @p ws with @p worker_count workers
     * @details @p worker_count has to be already validated against the
     *   configured ceiling. On cancellation or expiry of @p token the whole
     *   process tree is killed. Must be thread-safe.
     *
     * @errors Throws std::runtime_error on host-level failures (e.g. the
     *   launcher cannot be executed)
     */
    virtual ProcessOutcome run(
        const Workspace& ws,
        Mode mode,
        uint32_t worker_count,
        const std::optional<std::string>& stdin_text,
        const CancellationToken& token
    ) const = 0;
};

// Runs the artifact directly (thread-parallel) or through the configured MPI
// launcher (process-parallel)
class ToolchainRunner : public Runner {
    const Config& config_;
    bool running_as_root_;

public:
    explicit ToolchainRunner(const Config& config, bool running_as_root = (geteuid() == 0))
    : config_(config)
    , running_as_root_(running_as_root) {}

    ProcessOutcome run(
        const Workspace& ws,
        Mode mode,
        uint32_t worker_count,
        const std::optional<std::string>& stdin_text,
        const CancellationToken& token
    ) const override;
};

} // namespace parexec
