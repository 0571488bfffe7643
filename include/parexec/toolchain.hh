#pragma once

#include <cstdint>
#include <parexec/config.hh>
#include <parexec/mode.hh>
#include <parexec/workspace.hh>
#include <string>
#include <string_view>
#include <vector>

namespace parexec {

// Names of the files inside a workspace
constexpr std::string_view ARTIFACT_NAME = "program";
constexpr std::string_view STDIN_FILE_NAME = "stdin.txt";

constexpr std::string_view source_file_name(Language lang) noexcept {
    switch (lang) {
    case Language::C: return "source.c";
    case Language::CPP: return "source.cpp";
    }
    return "source";
}

const std::string& compiler_executable(const Config& config, Mode mode, Language lang) noexcept;

// Command compiling the source file to ARTIFACT_NAME, both given relative to
// the workspace, so that the diagnostics refer to "source.c:LINE:COL"
std::vector<std::string> compile_command(const Config& config, Mode mode, Language lang);

// Command running the artifact from inside the workspace with @p worker_count
// workers
std::vector<std::string> run_command(
    const Config& config, Mode mode, uint32_t worker_count, bool running_as_root
);

// The whole environment of the compiler: PATH from config, HOME and TMPDIR
// inside the workspace
std::vector<std::string> compile_environment(const Config& config, const Workspace& ws);

// compile_environment() plus the variables passing the worker count
// (thread-parallel) or allowing the launcher to run as root
// (process-parallel)
std::vector<std::string> run_environment(
    const Config& config,
    const Workspace& ws,
    Mode mode,
    uint32_t worker_count,
    bool running_as_root
);

} // namespace parexec
