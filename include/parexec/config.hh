#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <parexec/config_file.hh>
#include <parexec/mode.hh>
#include <string>
#include <vector>

namespace parexec {

// Loaded once at start, never modified afterwards, so it may be read by any
// number of concurrent requests
struct Config {
    std::string scratch_root = "/tmp/parexec";
    std::chrono::milliseconds compile_timeout{10'000};
    std::chrono::milliseconds thread_parallel_execute_timeout{10'000};
    std::chrono::milliseconds process_parallel_execute_timeout{30'000};
    uint32_t thread_parallel_max_workers = 16;
    uint32_t process_parallel_max_workers = 8;
    size_t max_output_bytes = 64 << 10;
    size_t max_source_bytes = 64 << 10;
    uint64_t max_executable_file_size_bytes = 64 << 20;
    std::chrono::seconds stale_workspace_max_age{3600};
    std::optional<std::vector<std::string>> deny_patterns; // unset = built-in list

    std::string c_compiler = "gcc";
    std::string cpp_compiler = "g++";
    std::string mpi_c_compiler = "mpicc";
    std::string mpi_cpp_compiler = "mpicxx";
    std::string mpi_launcher = "mpirun";
    std::string child_path = "/usr/local/bin:/usr/bin:/bin";

    std::optional<std::string> stdlog_file; // unset = stderr
    std::optional<std::string> errlog_file; // unset = stderr

    [[nodiscard]] uint32_t max_workers(Mode mode) const noexcept {
        return mode == Mode::THREAD_PARALLEL ? thread_parallel_max_workers
                                             : process_parallel_max_workers;
    }

    [[nodiscard]] std::chrono::milliseconds execute_timeout(Mode mode) const noexcept {
        return mode == Mode::THREAD_PARALLEL ? thread_parallel_execute_timeout
                                             : process_parallel_execute_timeout;
    }

    /**
     * @brief Builds config from already parsed @p cf, unset variables keep
     *   their default values
     *
     * @errors Throws std::runtime_error if a value is malformed or out of
     *   range
     */
    static Config from_config_file(const ConfigFile& cf);

    // Throws std::runtime_error on I/O error, ConfigFile::ParseError on syntax
    // error and everything that from_config_file() throws
    static Config load_from_file(const std::string& path);

    static Config load_from_string(std::string config);
};

} // namespace parexec
