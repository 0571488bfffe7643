#include <parexec/file_manip.hh>
#include <parexec/runner.hh>
#include <parexec/spawner.hh>
#include <parexec/toolchain.hh>

namespace parexec {

ProcessOutcome ToolchainRunner::run(
    const Workspace& ws,
    Mode mode,
    uint32_t worker_count,
    const std::optional<std::string>& stdin_text,
    const CancellationToken& token
) const {
    std::optional<std::string> stdin_file;
    if (stdin_text) {
        stdin_file = ws.file(STDIN_FILE_NAME);
        put_file_contents(*stdin_file, *stdin_text, 0600);
    }

    std::optional<std::chrono::nanoseconds> cpu_time_limit;
    if (auto remaining = token.remaining(); remaining) {
        // Every worker may keep a whole CPU busy
        cpu_time_limit = *remaining * worker_count;
    }

    return Spawner::run(
        run_command(config_, mode, worker_count, running_as_root_),
        {
            .working_dir = ws.path(),
            .stdin_file = std::move(stdin_file),
            .env = run_environment(config_, ws, mode, worker_count, running_as_root_),
            .max_output_bytes = config_.max_output_bytes,
            .file_size_limit = config_.max_executable_file_size_bytes,
            .cpu_time_limit = cpu_time_limit,
        },
        token
    );
}

} // namespace parexec
