#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <parexec/cancellation_token.hh>
#include <parexec/errmsg.hh>
#include <parexec/process_outcome.hh>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <unistd.h>
#include <vector>

namespace parexec {

class Spawner {
protected:
    Spawner() = default;

public:
    // Appended to a captured stream that exceeded Options::max_output_bytes
    static constexpr std::string_view TRUNCATION_MARKER = "\n[output truncated]\n";

    struct Options {
        std::string working_dir = "."; // directory at which program will be run
        std::optional<std::string> stdin_file; // if unset, stdin is /dev/null
        std::vector<std::string> env; // the whole environment ("NAME=value")
        size_t max_output_bytes = 64 << 10; // per stream
        std::optional<uint64_t> file_size_limit; // RLIMIT_FSIZE [bytes]
        // If not set and the token has a deadline, then CPU time limit will
        // be set to the remaining time rounded up to seconds + 1 second
        std::optional<std::chrono::nanoseconds> cpu_time_limit;
        // How long to wait for the rest of the output after the process
        // group got killed
        std::chrono::milliseconds drain_grace_period{200};
    };

    /**
     * @brief Runs @p argv[0] with arguments @p argv in a new process group
     *   and captures its standard output and standard error
     * @details argv[0] is searched for in PATH of @p opts.env (execvp(3)).
     *   While the process runs @p token is polled, once it is cancelled or
     *   its deadline passes the whole process tree is killed. After the
     *   process exits, the rest of its process group is killed too, so no
     *   worker outlives it. This function is thread-safe.
     *
     * @param argv program and its arguments, has to be non-empty
     * @param opts options, see Options
     * @param token decides when the process has to be killed
     * @param do_in_parent_after_fork function taking child's pid as an
     *   argument that will be called in the parent process just after fork()
     *
     * @return ProcessOutcome with captured (and possibly truncated) streams
     *
     * @errors Throws an exception std::runtime_error with appropriate
     *   information if any syscall fails or the program cannot be executed
     *   (e.g. it does not exist)
     */
    static ProcessOutcome run(
        const std::vector<std::string>& argv,
        const Options& opts,
        const CancellationToken& token,
        const std::function<void(pid_t)>& do_in_parent_after_fork = [](pid_t /*unused*/) {}
    );

protected:
    // Sends @p str followed by error message of @p errnum through @p fd and
    // _exits with -1
    [[noreturn]] static void
    send_error_message_and_exit(int fd, int errnum, std::string_view str) noexcept {
        write_all(fd, str);
        write_all(fd, errmsg(errnum));
        _exit(-1);
    }

    /**
     * @brief Initializes child process which will execute @p argv[0], this
     *   function does not return (it kills the process instead)!
     * @details Only async-signal-safe functions are used here, everything
     *   that needs allocation is prepared by the parent.
     *
     * @param argv nullptr-terminated arguments
     * @param envp nullptr-terminated environment
     * @param working_dir directory to change to
     * @param stdin_fd, stdout_fd, stderr_fd descriptors that become standard
     *   streams
     * @param cpu_limit_s RLIMIT_CPU to set [s] or 0 for none
     * @param fsize_limit RLIMIT_FSIZE to set, if set
     * @param fd file descriptor to which errors will be written
     */
    [[noreturn]] static void run_child(
        char* const* argv,
        char* const* envp,
        const char* working_dir,
        int stdin_fd,
        int stdout_fd,
        int stderr_fd,
        uint64_t cpu_limit_s,
        std::optional<uint64_t> fsize_limit,
        int fd
    ) noexcept;

private:
    static void write_all(int fd, std::string_view str) noexcept {
        while (!str.empty()) {
            ssize_t rc = ::write(fd, str.data(), str.size());
            if (rc <= 0) {
                if (rc == -1 and errno == EINTR) {
                    continue;
                }
                return;
            }
            str.remove_prefix(static_cast<size_t>(rc));
        }
    }
};

} // namespace parexec
