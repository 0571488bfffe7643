#include <parexec/health.hh>
#include <parexec/logger.hh>
#include <parexec/spawner.hh>

namespace parexec {

namespace {

std::string first_line(const std::string& str) { return str.substr(0, str.find('\n')); }

} // namespace

ToolStatus
probe_tool(const Config& config, const std::string& executable, std::chrono::milliseconds timeout) {
    ToolStatus res{
        .executable = executable,
        .available = false,
        .version = std::nullopt,
        .error = std::nullopt,
    };
    try {
        CancellationToken token{timeout};
        auto po = Spawner::run(
            {executable, "--version"},
            {
                .working_dir = ".",
                .stdin_file = std::nullopt,
                .env = {concat_tostr("PATH=", config.child_path)},
                .max_output_bytes = 4096,
                .file_size_limit = std::nullopt,
                .cpu_time_limit = std::nullopt,
            },
            token
        );
        res.available = po.exited_normally() and po.exit_code == 0;
        if (res.available) {
            // mpirun prints its version to stderr in some implementations
            res.version = first_line(po.stdout_text.empty() ? po.stderr_text : po.stdout_text);
        } else if (po.termination == TerminationReason::TIMED_OUT) {
            res.error = "timed out";
        } else {
            res.error = concat_tostr("exited with code ", po.exit_code);
        }
    } catch (const std::exception& e) {
        res.error = e.what();
    }

    if (not res.available) {
        errlog("health check: ", executable, " is not available: ", res.error.value_or("unknown"));
    }
    return res;
}

HealthReport health_check(const Config& config, std::chrono::milliseconds timeout) {
    HealthReport rep{
        .c_compiler = probe_tool(config, config.c_compiler, timeout),
        .cpp_compiler = probe_tool(config, config.cpp_compiler, timeout),
        .mpi_c_compiler = probe_tool(config, config.mpi_c_compiler, timeout),
        .mpi_cpp_compiler = probe_tool(config, config.mpi_cpp_compiler, timeout),
        .mpi_launcher = probe_tool(config, config.mpi_launcher, timeout),
    };

    for (const ToolStatus* compiler :
         {&rep.c_compiler, &rep.cpp_compiler, &rep.mpi_c_compiler, &rep.mpi_cpp_compiler})
    {
        if (compiler->available) {
            rep.toolchain_available = true;
            rep.toolchain_version = compiler->version.value_or("");
            break;
        }
    }

    rep.thread_parallel_available = rep.c_compiler.available or rep.cpp_compiler.available;
    rep.process_parallel_available =
        (rep.mpi_c_compiler.available or rep.mpi_cpp_compiler.available) and
        rep.mpi_launcher.available;
    return rep;
}

} // namespace parexec
