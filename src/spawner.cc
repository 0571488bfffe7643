#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <climits>
#include <csignal>
#include <fcntl.h>
#include <parexec/call_in_destructor.hh>
#include <parexec/concat_tostr.hh>
#include <parexec/file_descriptor.hh>
#include <parexec/macros/throw.hh>
#include <parexec/pipe.hh>
#include <parexec/process.hh>
#include <parexec/spawner.hh>
#include <parexec/syscalls.hh>
#include <poll.h>
#include <sys/resource.h>
#include <sys/wait.h>

using std::array;
using std::string;
using std::vector;
using std::chrono::duration_cast;
using std::chrono::milliseconds;
using std::chrono::nanoseconds;

namespace {

constexpr milliseconds MAX_POLL_SLICE{50};

// Accumulates one captured stream, keeping at most max_size bytes
class OutputCollector {
    FileDescriptor fd_;
    string text_;
    size_t max_size_;
    bool truncated_ = false;

public:
    OutputCollector(FileDescriptor fd, size_t max_size) : fd_(std::move(fd)), max_size_(max_size) {}

    [[nodiscard]] bool is_open() const noexcept { return fd_.is_open(); }

    [[nodiscard]] int fd() const noexcept { return fd_; }

    // Reads once from the pipe, the part exceeding the limit is discarded
    void read_some() {
        array<char, 1 << 16> buff; // NOLINT(cppcoreguidelines-pro-type-member-init)
        ssize_t rc = read(fd_, buff.data(), buff.size());
        if (rc == -1) {
            if (errno == EINTR or errno == EAGAIN) {
                return;
            }
            THROW("read()", errmsg());
        }
        if (rc == 0) {
            fd_.reset(); // EOF
            return;
        }

        auto len = static_cast<size_t>(rc);
        if (text_.size() < max_size_) {
            auto n = std::min(len, max_size_ - text_.size());
            text_.append(buff.data(), n);
            len -= n;
        }
        if (len > 0) {
            truncated_ = true;
        }
    }

    [[nodiscard]] bool truncated() const noexcept { return truncated_; }

    string release_text() {
        if (truncated_) {
            text_ += parexec::Spawner::TRUNCATION_MARKER;
        }
        return std::move(text_);
    }
};

// Polls the open collectors (and @p pidfd if non-negative) for at most
// @p timeout. Returns true if @p pidfd became readable (the process exited).
bool poll_and_collect(
    OutputCollector& out, OutputCollector& err, int pidfd, milliseconds timeout
) {
    array<pollfd, 3> pfds{};
    nfds_t nfds = 0;
    auto add = [&](int fd) {
        pfds[nfds++] = pollfd{.fd = fd, .events = POLLIN, .revents = 0};
    };
    if (out.is_open()) {
        add(out.fd());
    }
    if (err.is_open()) {
        add(err.fd());
    }
    if (pidfd >= 0) {
        add(pidfd);
    }

    int rc = poll(pfds.data(), nfds, static_cast<int>(timeout.count()));
    if (rc == -1) {
        if (errno == EINTR) {
            return false;
        }
        THROW("poll()", errmsg());
    }

    bool exited = false;
    for (nfds_t i = 0; i < nfds; ++i) {
        if (pfds[i].revents == 0) {
            continue;
        }
        if (pfds[i].fd == pidfd) {
            exited = true;
        } else if (pfds[i].fd == out.fd()) {
            out.read_some();
        } else {
            err.read_some();
        }
    }
    return exited;
}

milliseconds poll_slice(const parexec::CancellationToken& token) {
    auto remaining = token.remaining();
    if (not remaining) {
        return MAX_POLL_SLICE;
    }
    // Round up, so that the deadline is not spun on with zero timeouts
    auto slice = duration_cast<milliseconds>(*remaining + milliseconds{1} - nanoseconds{1});
    return std::clamp(slice, milliseconds{0}, MAX_POLL_SLICE);
}

// Returns nullptr-terminated array of pointers to @p strs
vector<char*> to_c_array(const vector<string>& strs) {
    vector<char*> res;
    res.reserve(strs.size() + 1);
    for (auto& str : strs) {
        res.emplace_back(const_cast<char*>(str.c_str())); // NOLINT
    }
    res.emplace_back(nullptr);
    return res;
}

} // namespace

namespace parexec {

ProcessOutcome Spawner::run(
    const vector<string>& argv,
    const Options& opts,
    const CancellationToken& token,
    const std::function<void(pid_t)>& do_in_parent_after_fork
) {
    if (argv.empty()) {
        THROW("argv has to contain at least the program name");
    }

    auto start_time = CancellationToken::Clock::now();

    FileDescriptor stdin_fd{
        opts.stdin_file.value_or("/dev/null").c_str(), O_RDONLY | O_CLOEXEC};
    if (!stdin_fd.is_open()) {
        THROW("open('", opts.stdin_file.value_or("/dev/null"), "')", errmsg());
    }

    auto stdout_pipe = pipe2(O_CLOEXEC);
    if (not stdout_pipe) {
        THROW("pipe2()", errmsg());
    }
    auto stderr_pipe = pipe2(O_CLOEXEC);
    if (not stderr_pipe) {
        THROW("pipe2()", errmsg());
    }
    // Error stream from child
    auto error_pipe = pipe2(O_CLOEXEC);
    if (not error_pipe) {
        THROW("pipe2()", errmsg());
    }

    auto c_argv = to_c_array(argv);
    auto c_envp = to_c_array(opts.env);

    uint64_t cpu_limit_s = 0;
    if (auto cpu_tl = (opts.cpu_time_limit ? opts.cpu_time_limit : token.remaining()); cpu_tl) {
        // + 1 to avoid premature death, the limit is useful when the process
        // group escapes being killed
        cpu_limit_s = static_cast<uint64_t>(
            std::chrono::ceil<std::chrono::seconds>(*cpu_tl).count() + 1
        );
    }

    pid_t cpid = fork();
    if (cpid == -1) {
        THROW("fork()", errmsg());
    }
    if (cpid == 0) {
        run_child(
            c_argv.data(),
            c_envp.data(),
            opts.working_dir.c_str(),
            stdin_fd,
            stdout_pipe->writable,
            stderr_pipe->writable,
            cpu_limit_s,
            opts.file_size_limit,
            error_pipe->writable
        );
    }

    // Both the parent and the child set the process group to avoid a race
    // with killing the group before the child calls setpgid()
    (void)setpgid(cpid, cpid);

    stdin_fd.reset();
    stdout_pipe->writable.reset();
    stderr_pipe->writable.reset();
    error_pipe->writable.reset();

    siginfo_t si{};
    // Useful when exception is thrown
    CallInDtor kill_and_wait_child_guard([&] {
        (void)kill(-cpid, SIGKILL);
        (void)kill(cpid, SIGKILL);
        while (syscalls::waitid(P_PID, cpid, &si, WEXITED, nullptr) == -1 and errno == EINTR) {
        }
    });

    do_in_parent_after_fork(cpid);

    FileDescriptor pidfd{syscalls::pidfd_open(cpid, 0)};
    if (!pidfd.is_open()) {
        THROW("pidfd_open()", errmsg());
    }

    OutputCollector out(std::move(stdout_pipe->readable), opts.max_output_bytes);
    OutputCollector err(std::move(stderr_pipe->readable), opts.max_output_bytes);

    ProcessOutcome res;
    bool exited = false;
    while (not exited) {
        if (token.cancelled()) {
            res.termination = TerminationReason::KILLED;
            break;
        }
        if (token.expired()) {
            res.termination = TerminationReason::TIMED_OUT;
            break;
        }
        exited = poll_and_collect(out, err, pidfd, poll_slice(token));
    }
    res.elapsed = duration_cast<nanoseconds>(CancellationToken::Clock::now() - start_time);

    if (not exited) {
        kill_process_tree(cpid, cpid);
    }
    // The leader is not reaped yet, so the process group still exists
    (void)kill(-cpid, SIGKILL);

    // Drain the rest of the output
    auto drain_deadline = CancellationToken::Clock::now() + opts.drain_grace_period;
    while (out.is_open() or err.is_open()) {
        auto now = CancellationToken::Clock::now();
        if (now >= drain_deadline) {
            break;
        }
        auto left = std::chrono::ceil<milliseconds>(drain_deadline - now);
        (void)poll_and_collect(out, err, -1, std::min(left, MAX_POLL_SLICE));
    }

    kill_and_wait_child_guard.cancel();
    while (syscalls::waitid(P_PID, cpid, &si, WEXITED, nullptr) == -1) {
        if (errno != EINTR) {
            THROW("waitid()", errmsg());
        }
    }

    // Read errors from the child
    string message;
    array<char, 4096> buff{};
    ssize_t rc = 0;
    while ((rc = read(error_pipe->readable, buff.data(), buff.size())) != 0) {
        if (rc == -1) {
            if (errno == EINTR) {
                continue;
            }
            THROW("read()", errmsg());
        }
        message.append(buff.data(), static_cast<size_t>(rc));
    }
    if (!message.empty()) {
        THROW(message);
    }

    switch (si.si_code) {
    case CLD_EXITED: res.exit_code = si.si_status; break;
    case CLD_KILLED:
    case CLD_DUMPED:
        res.signal = si.si_status;
        res.exit_code = 128 + si.si_status;
        break;
    default: THROW("Invalid siginfo_t.si_code: ", si.si_code);
    }

    res.stdout_truncated = out.truncated();
    res.stderr_truncated = err.truncated();
    res.stdout_text = out.release_text();
    res.stderr_text = err.release_text();
    return res;
}

void Spawner::run_child(
    char* const* argv,
    char* const* envp,
    const char* working_dir,
    int stdin_fd,
    int stdout_fd,
    int stderr_fd,
    uint64_t cpu_limit_s,
    std::optional<uint64_t> fsize_limit,
    int fd
) noexcept {
    // Create new process group (useful for killing the whole process group)
    if (setpgid(0, 0)) {
        send_error_message_and_exit(fd, errno, "setpgid()");
    }

    // The parent may block signals (e.g. in a signal handling thread)
    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    if (sigprocmask(SIG_SETMASK, &empty_mask, nullptr)) {
        send_error_message_and_exit(fd, errno, "sigprocmask()");
    }
    struct sigaction sa = {};
    sa.sa_handler = SIG_DFL; // NOLINT(cppcoreguidelines-pro-type-union-access)
    sigemptyset(&sa.sa_mask);
    for (int sig : {SIGPIPE, SIGINT, SIGTERM, SIGQUIT}) {
        if (sigaction(sig, &sa, nullptr)) {
            send_error_message_and_exit(fd, errno, "sigaction()");
        }
    }

    if (chdir(working_dir) == -1) {
        send_error_message_and_exit(fd, errno, "chdir()");
    }

    rlimit limit{};
    // No core dumps
    limit.rlim_cur = limit.rlim_max = 0;
    if (setrlimit(RLIMIT_CORE, &limit)) {
        send_error_message_and_exit(fd, errno, "setrlimit(RLIMIT_CORE)");
    }

    if (fsize_limit.has_value()) {
        limit.rlim_cur = limit.rlim_max = *fsize_limit;
        if (setrlimit(RLIMIT_FSIZE, &limit)) {
            send_error_message_and_exit(fd, errno, "setrlimit(RLIMIT_FSIZE)");
        }
    }

    // Limit below is useful when spawned process becomes orphaned
    if (cpu_limit_s > 0) {
        // Soft limit delivers SIGXCPU, the hard limit one second later SIGKILL
        limit.rlim_cur = cpu_limit_s;
        limit.rlim_max = cpu_limit_s + 1;
        if (setrlimit(RLIMIT_CPU, &limit)) {
            send_error_message_and_exit(fd, errno, "setrlimit(RLIMIT_CPU)");
        }
    }

    // Change standard streams
    for (auto [from, to] : {
             std::pair{stdin_fd, STDIN_FILENO},
             std::pair{stdout_fd, STDOUT_FILENO},
             std::pair{stderr_fd, STDERR_FILENO},
         })
    {
        while (dup2(from, to) == -1) {
            if (errno != EINTR) {
                send_error_message_and_exit(fd, errno, "dup2()");
            }
        }
    }

    // Close file descriptors that are not needed to be open (for security
    // reasons), fd has FD_CLOEXEC flag set so it is closed on successful exec
    constexpr unsigned FIRST_FD = STDERR_FILENO + 1;
    auto close_fds = [&](unsigned first, unsigned last) {
        if (first > last) {
            return;
        }
        if (syscalls::close_range(first, last, 0) == 0) {
            return;
        }
        // Fallback for old kernels
        auto max_fd = sysconf(_SC_OPEN_MAX);
        if (max_fd < 0) {
            max_fd = 1 << 16;
        }
        for (auto i = static_cast<long>(first);
             i <= std::min(static_cast<long>(last), max_fd);
             ++i)
        {
            (void)close(static_cast<int>(i));
        }
    };
    close_fds(FIRST_FD, static_cast<unsigned>(fd) - 1);
    close_fds(static_cast<unsigned>(fd) + 1, UINT_MAX);

    environ = const_cast<char**>(envp); // NOLINT(cppcoreguidelines-pro-type-const-cast)
    execvp(argv[0], argv);
    int errnum = errno;

    // execvp() failed
    ErrMsg msg;
    msg.append("execvp('");
    msg.append(argv[0]);
    msg.append("')");
    send_error_message_and_exit(fd, errnum, msg);
}

} // namespace parexec
