#include <array>
#include <cerrno>
#include <charconv>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <exception>
#include <iostream>
#include <optional>
#include <parexec/cancellation_token.hh>
#include <parexec/compiler.hh>
#include <parexec/config.hh>
#include <parexec/errmsg.hh>
#include <parexec/examples.hh>
#include <parexec/file_descriptor.hh>
#include <parexec/file_manip.hh>
#include <parexec/health.hh>
#include <parexec/logger.hh>
#include <parexec/macros/throw.hh>
#include <parexec/overloaded.hh>
#include <parexec/pattern_screener.hh>
#include <parexec/pipeline.hh>
#include <parexec/runner.hh>
#include <parexec/workspace.hh>
#include <poll.h>
#include <string>
#include <string_view>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace parexec; // NOLINT(google-build-using-namespace)

using std::string;
using std::string_view;
using std::vector;

namespace {

constexpr const char* DEFAULT_CONFIG_FILE = "parexec.conf";

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [-c CONFIG] <command>\n"
              << "Commands:\n"
              << "  run MODE WORKERS SOURCE_FILE [c|cpp] [STDIN_FILE]\n"
              << "      MODE: thread-parallel (openmp) or process-parallel (mpi)\n"
              << "  examples [NAME]\n"
              << "  health\n"
              << "Configuration is read from " << DEFAULT_CONFIG_FILE
              << " if it exists and -c is not given.\n";
}

void print_stream(string_view name, const string& text) {
    if (text.empty()) {
        return;
    }
    std::cout << "--- " << name << " ---\n" << text;
    if (text.back() != '\n') {
        std::cout << '\n';
    }
}

void print_outcome(const CompileOutcome& res) {
    std::cout << "Classification: " << classification(res) << '\n';
    std::visit(
        overloaded{
            [](const outcome::Success& s) {
                std::cout << "Exit code: " << s.exit_code << '\n';
                print_stream("stdout", s.stdout_text);
                print_stream("stderr", s.stderr_text);
            },
            [](const outcome::CompileError& ce) {
                std::cout << "Exit code: " << ce.exit_code << '\n';
                if (!ce.detail.empty()) {
                    std::cout << "Detail: " << ce.detail << '\n';
                }
                print_stream("stdout", ce.stdout_text);
                print_stream("diagnostics", ce.diagnostics);
            },
            [](const outcome::RuntimeError& re) {
                std::cout << "Exit code: " << re.exit_code << '\n';
                if (re.signal) {
                    std::cout << "Signal: " << *re.signal << " (" << strsignal(*re.signal)
                              << ")\n";
                }
                print_stream("stdout", re.stdout_text);
                print_stream("stderr", re.stderr_text);
            },
            [](const outcome::Timeout& t) {
                std::cout << "Phase: " << to_string(t.phase) << '\n'
                          << "Limit: " << t.limit.count() << " ms\n";
                print_stream("stdout", t.stdout_text);
                print_stream("stderr", t.stderr_text);
            },
            [](const outcome::Rejected& r) {
                std::cout << "Reason: " << to_string(r.reason) << '\n'
                          << "Detail: " << r.detail << '\n';
            },
            [](const outcome::ResourceExhausted& re) {
                std::cout << "Detail: " << re.description << '\n';
            },
            [](const outcome::ToolchainError& te) {
                std::cout << "Detail: " << te.description << '\n';
            },
        },
        res
    );
}

void print_tool(string_view label, const ToolStatus& ts) {
    std::cout << label << ": " << ts.executable << " - "
              << (ts.available ? "available" : "unavailable");
    if (ts.version) {
        std::cout << " (" << *ts.version << ')';
    } else if (ts.error) {
        std::cout << " (" << *ts.error << ')';
    }
    std::cout << '\n';
}

int run_health(const Config& config) {
    auto rep = health_check(config);
    print_tool("C compiler", rep.c_compiler);
    print_tool("C++ compiler", rep.cpp_compiler);
    print_tool("MPI C compiler", rep.mpi_c_compiler);
    print_tool("MPI C++ compiler", rep.mpi_cpp_compiler);
    print_tool("MPI launcher", rep.mpi_launcher);
    std::cout << "thread-parallel: " << (rep.thread_parallel_available ? "yes" : "no") << '\n'
              << "process-parallel: " << (rep.process_parallel_available ? "yes" : "no") << '\n'
              << "toolchain available: " << (rep.toolchain_available ? "yes" : "no") << '\n';
    if (rep.toolchain_available) {
        std::cout << "toolchain version: " << rep.toolchain_version << '\n';
    }
    return rep.toolchain_available ? 0 : 1;
}

int run_examples(const vector<string_view>& args) {
    if (args.empty()) {
        for (const auto& example : list_example_programs()) {
            std::cout << example.name << " (" << to_string(example.mode) << ", "
                      << to_string(example.language) << ")\n";
        }
        return 0;
    }
    if (args.size() > 1) {
        std::cerr << "examples: too many arguments\n";
        return 2;
    }

    const auto* example = find_example_program(args[0]);
    if (example == nullptr) {
        std::cerr << "examples: no example named `" << args[0] << "`\n";
        return 2;
    }
    std::cout << example->source;
    return 0;
}

// Runs the pipeline in a separate thread, so that the signals may be awaited
// in this one. The signals have to be already blocked.
CompileOutcome run_cancellable(const Pipeline& pipeline, const CompileRequest& req, sigset_t sigset) {
    CancellationToken cancellation;
    auto done_fd = FileDescriptor{eventfd(0, EFD_CLOEXEC)};
    if (!done_fd.is_open()) {
        THROW("eventfd()", errmsg());
    }
    auto sigfd = FileDescriptor{signalfd(-1, &sigset, SFD_CLOEXEC)};
    if (!sigfd.is_open()) {
        THROW("signalfd()", errmsg());
    }

    std::optional<CompileOutcome> res;
    std::exception_ptr error;
    std::thread worker{[&] {
        try {
            res = pipeline.compile_and_run(req, &cancellation);
        } catch (...) {
            error = std::current_exception();
        }
        uint64_t val = 1;
        if (write(done_fd, &val, sizeof(val)) != sizeof(val)) {
            errlog("write()", errmsg());
        }
    }};

    enum {
        DONE = 0,
        SIGNAL = 1,
    };
    std::array<pollfd, 2> pfds{};
    pfds[DONE] = {.fd = done_fd, .events = POLLIN, .revents = 0};
    pfds[SIGNAL] = {.fd = sigfd, .events = POLLIN, .revents = 0};
    for (;;) {
        int rc = poll(pfds.data(), pfds.size(), -1);
        if (rc == -1) {
            if (errno == EINTR) {
                continue;
            }
            errlog("poll()", errmsg());
            cancellation.cancel();
            break;
        }
        if (pfds[DONE].revents & POLLIN) {
            break;
        }
        if (pfds[SIGNAL].revents & POLLIN) {
            signalfd_siginfo ssi{};
            if (read(sigfd, &ssi, sizeof(ssi)) == sizeof(ssi)) {
                stdlog("received signal ", ssi.ssi_signo, " - cancelling the request");
            }
            cancellation.cancel();
            pfds[SIGNAL].fd = -1; // The request finishes on its own now
        }
    }

    worker.join();
    if (error) {
        std::rethrow_exception(error);
    }
    return std::move(*res);
}

int run_request(const Config& config, const vector<string_view>& args, sigset_t sigset) {
    if (args.size() < 3 or args.size() > 5) {
        std::cerr << "run: expected MODE WORKERS SOURCE_FILE [c|cpp] [STDIN_FILE]\n";
        return 2;
    }

    CompileRequest req;
    auto mode = mode_from_string(args[0]);
    if (not mode) {
        std::cerr << "run: invalid mode `" << args[0] << "`\n";
        return 2;
    }
    req.mode = *mode;

    auto [ptr, ec] =
        std::from_chars(args[1].data(), args[1].data() + args[1].size(), req.worker_count);
    if (ec != std::errc{} or ptr != args[1].data() + args[1].size()) {
        std::cerr << "run: invalid worker count `" << args[1] << "`\n";
        return 2;
    }

    req.source = get_file_contents(string{args[2]});
    if (args.size() > 3) {
        auto lang = language_from_string(args[3]);
        if (not lang) {
            std::cerr << "run: invalid language `" << args[3] << "`\n";
            return 2;
        }
        req.language = *lang;
    }
    if (args.size() > 4) {
        req.stdin_text = get_file_contents(string{args[4]});
    }

    DiskWorkspaceManager workspaces{config.scratch_root};
    // Recover workspaces left behind by a crashed process
    try {
        (void)workspaces.sweep_stale(config.stale_workspace_max_age);
    } catch (const std::exception& e) {
        errlog("stale workspace sweep failed: ", e.what());
    }

    PatternScreener screener{config.deny_patterns.value_or(PatternScreener::default_deny_patterns())};
    ToolchainCompiler compiler{config};
    ToolchainRunner runner{config};
    Pipeline pipeline{config, screener, workspaces, compiler, runner};

    auto res = run_cancellable(pipeline, req, sigset);
    print_outcome(res);
    return is_success(res) ? 0 : 1;
}

Config load_config(const std::optional<string>& config_file) {
    if (config_file) {
        return Config::load_from_file(*config_file);
    }
    if (access(DEFAULT_CONFIG_FILE, F_OK) == 0) {
        return Config::load_from_file(DEFAULT_CONFIG_FILE);
    }
    return Config{};
}

} // namespace

int main(int argc, char** argv) {
    vector<string_view> args(argv + 1, argv + argc);
    std::optional<string> config_file;
    if (args.size() >= 2 and args[0] == "-c") {
        config_file = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }
    if (args.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    // Block signals so that the worker thread inherits the blocked signal mask
    // and they are received only through the signalfd
    sigset_t sigset;
    if (sigemptyset(&sigset) || sigaddset(&sigset, SIGINT) || sigaddset(&sigset, SIGTERM) ||
        sigaddset(&sigset, SIGQUIT))
    {
        errlog("sigaddset()", errmsg());
        return 1;
    }
    if (int rc = pthread_sigmask(SIG_BLOCK, &sigset, nullptr); rc != 0) {
        errlog("pthread_sigmask()", errmsg(rc));
        return 1;
    }

    try {
        Config config = load_config(config_file);
        if (config.stdlog_file) {
            stdlog.open(*config.stdlog_file);
        }
        if (config.errlog_file) {
            errlog.open(*config.errlog_file);
        }

        auto command = args[0];
        args.erase(args.begin());
        if (command == "run") {
            return run_request(config, args, sigset);
        }
        if (command == "examples") {
            return run_examples(args);
        }
        if (command == "health") {
            if (!args.empty()) {
                std::cerr << "health: too many arguments\n";
                return 2;
            }
            return run_health(config);
        }
        print_usage(argv[0]);
        return 2;
    } catch (const ConfigFile::ParseError& e) {
        errlog("Failed to load the config: ", e.what(), '\n', e.diagnostics());
        return 1;
    } catch (const std::exception& e) {
        errlog("Error: ", e.what());
        return 1;
    }
}
