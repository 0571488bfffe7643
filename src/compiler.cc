#include <parexec/compiler.hh>
#include <parexec/file_manip.hh>
#include <parexec/spawner.hh>
#include <parexec/toolchain.hh>
#include <sys/stat.h>

namespace parexec {

CompilationResult ToolchainCompiler::compile(
    const Workspace& ws,
    std::string_view source,
    Mode mode,
    Language lang,
    const CancellationToken& token
) const {
    put_file_contents(ws.file(source_file_name(lang)), source, 0600);

    auto process = Spawner::run(
        compile_command(config_, mode, lang),
        {
            .working_dir = ws.path(),
            .stdin_file = std::nullopt,
            .env = compile_environment(config_, ws),
            .max_output_bytes = config_.max_output_bytes,
            .file_size_limit = config_.max_executable_file_size_bytes,
            .cpu_time_limit = std::nullopt,
        },
        token
    );

    struct stat st = {};
    bool executable_produced =
        stat(ws.file(ARTIFACT_NAME).c_str(), &st) == 0 and S_ISREG(st.st_mode);
    return {.process = std::move(process), .executable_produced = executable_produced};
}

} // namespace parexec
