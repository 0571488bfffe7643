#include <parexec/concat_tostr.hh>
#include <parexec/toolchain.hh>

using std::string;
using std::vector;

namespace parexec {

const string& compiler_executable(const Config& config, Mode mode, Language lang) noexcept {
    switch (mode) {
    case Mode::THREAD_PARALLEL:
        return lang == Language::CPP ? config.cpp_compiler : config.c_compiler;
    case Mode::PROCESS_PARALLEL:
        return lang == Language::CPP ? config.mpi_cpp_compiler : config.mpi_c_compiler;
    }
    return config.c_compiler;
}

vector<string> compile_command(const Config& config, Mode mode, Language lang) {
    vector<string> cmd = {compiler_executable(config, mode, lang)};
    if (mode == Mode::THREAD_PARALLEL) {
        cmd.emplace_back("-fopenmp");
    }
    cmd.emplace_back(source_file_name(lang));
    cmd.emplace_back("-o");
    cmd.emplace_back(ARTIFACT_NAME);
    cmd.emplace_back("-lm");
    if (lang == Language::CPP) {
        cmd.emplace_back("-std=c++17");
        cmd.emplace_back("-pedantic");
    }
    return cmd;
}

vector<string>
run_command(const Config& config, Mode mode, uint32_t worker_count, bool running_as_root) {
    string artifact = concat_tostr("./", ARTIFACT_NAME);
    switch (mode) {
    case Mode::THREAD_PARALLEL: return {std::move(artifact)};
    case Mode::PROCESS_PARALLEL: {
        vector<string> cmd = {config.mpi_launcher};
        if (running_as_root) {
            cmd.emplace_back("--allow-run-as-root");
        }
        cmd.emplace_back("--oversubscribe");
        cmd.emplace_back("-np");
        cmd.emplace_back(std::to_string(worker_count));
        cmd.emplace_back(std::move(artifact));
        return cmd;
    }
    }
    return {std::move(artifact)};
}

vector<string> compile_environment(const Config& config, const Workspace& ws) {
    // Workspace path has a trailing slash, the variables are nicer without it
    string dir = ws.path().substr(0, ws.path().size() - 1);
    return {
        concat_tostr("PATH=", config.child_path),
        concat_tostr("HOME=", dir),
        concat_tostr("TMPDIR=", dir),
    };
}

vector<string> run_environment(
    const Config& config,
    const Workspace& ws,
    Mode mode,
    uint32_t worker_count,
    bool running_as_root
) {
    auto env = compile_environment(config, ws);
    switch (mode) {
    case Mode::THREAD_PARALLEL:
        // The thread limit caps the runtime even if the source requests more
        // threads itself (e.g. num_threads(64))
        env.emplace_back(concat_tostr("OMP_NUM_THREADS=", worker_count));
        env.emplace_back(concat_tostr("OMP_THREAD_LIMIT=", worker_count));
        break;
    case Mode::PROCESS_PARALLEL:
        if (running_as_root) {
            env.emplace_back("OMPI_ALLOW_RUN_AS_ROOT=1");
            env.emplace_back("OMPI_ALLOW_RUN_AS_ROOT_CONFIRM=1");
        }
        break;
    }
    return env;
}

} // namespace parexec
