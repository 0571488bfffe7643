#pragma once

#include <chrono>
#include <optional>
#include <parexec/config.hh>
#include <string>
#include <vector>

namespace parexec {

struct ToolStatus {
    std::string executable;
    bool available = false; // `executable --version` exited with 0
    std::optional<std::string> version; // first line of the version output
    std::optional<std::string> error; // why the tool could not be run at all
};

struct HealthReport {
    ToolStatus c_compiler;
    ToolStatus cpp_compiler;
    ToolStatus mpi_c_compiler;
    ToolStatus mpi_cpp_compiler;
    ToolStatus mpi_launcher;
    bool toolchain_available = false; // at least one compiler is invokable
    std::string toolchain_version; // empty if !toolchain_available
    bool thread_parallel_available = false;
    bool process_parallel_available = false;
};

// Runs `tool --version` with @p timeout
ToolStatus probe_tool(const Config& config, const std::string& executable, std::chrono::milliseconds timeout);

// Probes every configured compiler and the launcher. An absent toolchain is
// reported, never retried
HealthReport health_check(const Config& config, std::chrono::milliseconds timeout = std::chrono::seconds{5});

} // namespace parexec
