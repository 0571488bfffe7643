#include "intercept_logger.hh"
#include "living_processes.hh"
#include "temporary_directory.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <parexec/compiler.hh>
#include <parexec/examples.hh>
#include <parexec/health.hh>
#include <parexec/pipeline.hh>
#include <parexec/runner.hh>
#include <parexec/spawner.hh>
#include <parexec/toolchain.hh>
#include <functional>
#include <string_view>
#include <thread>
#include <vector>

using namespace parexec; // NOLINT(google-build-using-namespace)
using std::string;
using std::chrono::milliseconds;
using std::chrono::seconds;
using testing::HasSubstr;

namespace {

// Real compilers and a scratch root inside a temporary directory
class ToolchainIntegration : public testing::Test {
protected:
    TemporaryDirectory tmp_dir{"/tmp/parexec-test.XXXXXX"};
    Config config;
    PatternScreener screener;
    DiskWorkspaceManager workspaces{tmp_dir.path() + "scratch"};
    ToolchainCompiler compiler{config};
    ToolchainRunner runner{config};
    Pipeline pipeline{config, screener, workspaces, compiler, runner};
    Mode mode = Mode::THREAD_PARALLEL;

    void SetUp() override {
        ToolStatus gcc;
        (void)intercept_logger(errlog, [&] { gcc = probe_tool(config, config.c_compiler, seconds{5}); });
        if (not gcc.available) {
            GTEST_SKIP() << config.c_compiler << " is not available";
        }
    }

    CompileOutcome run(string source, int64_t workers, std::optional<string> stdin_text = std::nullopt) {
        CompileRequest req = {
            .source = std::move(source),
            .mode = mode,
            .worker_count = workers,
            .language = Language::C,
            .stdin_text = std::move(stdin_text),
        };
        CompileOutcome res;
        (void)intercept_logger(stdlog, [&] { res = pipeline.compile_and_run(req); });
        return res;
    }

    // True if no workspace is left in the scratch root
    bool scratch_root_is_empty() {
        Directory dir{workspaces.scratch_root().c_str()};
        throw_assert(dir.is_open());
        bool empty = true;
        for_each_dir_component(
            dir, [&](dirent* /*unused*/) { empty = false; }, [] { throw_assert(false); }
        );
        return empty;
    }
};

constexpr const char SUM_SOURCE[] = R"(#include <stdio.h>
#include <omp.h>

int main() {
    int sum = 0;
    #pragma omp parallel for reduction(+:sum)
    for (int i = 1; i <= 10; ++i) {
        sum += i;
    }
    printf("sum = %d\n", sum);
    printf("threads = %d\n", omp_get_max_threads());
    return 0;
}
)";

// Adds the MPI compiler wrapper and launcher to the real toolchain
class MpiIntegration : public ToolchainIntegration {
protected:
    void SetUp() override {
        ToolchainIntegration::SetUp();
        if (IsSkipped()) {
            return;
        }
        for (const string* tool : {&config.mpi_c_compiler, &config.mpi_launcher}) {
            ToolStatus status;
            (void)intercept_logger(errlog, [&] { status = probe_tool(config, *tool, seconds{10}); });
            if (not status.available) {
                GTEST_SKIP() << *tool << " is not available";
            }
        }
        mode = Mode::PROCESS_PARALLEL;
    }
};

std::vector<string> lines_of(std::string_view text) {
    std::vector<string> res;
    while (not text.empty()) {
        auto pos = text.find('\n');
        res.emplace_back(text.substr(0, pos));
        if (pos == std::string_view::npos) {
            break;
        }
        text.remove_prefix(pos + 1);
    }
    return res;
}

constexpr const char MPI_HELLO_SOURCE[] = R"(#include <mpi.h>
#include <stdio.h>

int main(int argc, char** argv) {
    MPI_Init(&argc, &argv);
    int rank = 0;
    int size = 0;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);
    printf("rank %d of %d\n", rank, size);
    MPI_Finalize();
    return 0;
}
)";

} // namespace

// NOLINTNEXTLINE
TEST_F(ToolchainIntegration, thread_parallel_sum) {
    auto res = run(SUM_SOURCE, 4);
    ASSERT_TRUE(std::holds_alternative<outcome::Success>(res)) << classification(res);
    EXPECT_EQ(std::get<outcome::Success>(res).stdout_text, "sum = 55\nthreads = 4\n");
    EXPECT_TRUE(scratch_root_is_empty());
}

// NOLINTNEXTLINE
TEST_F(ToolchainIntegration, example_program) {
    const auto* example = find_example_program("array_sum");
    ASSERT_NE(example, nullptr);
    auto res = run(string{example->source}, 2);
    ASSERT_TRUE(std::holds_alternative<outcome::Success>(res)) << classification(res);
    EXPECT_EQ(
        std::get<outcome::Success>(res).stdout_text,
        "Sum of 1 to 1000 = 500500\nExpected: 500500\n"
    );
}

// NOLINTNEXTLINE
TEST_F(ToolchainIntegration, compilation_diagnostics_are_verbatim) {
    constexpr const char source[] = "#include <stdio.h>\nint main() {\n    printf(\"x\")\n}\n";
    auto res = run(source, 1);
    ASSERT_TRUE(std::holds_alternative<outcome::CompileError>(res)) << classification(res);
    const auto& ce = std::get<outcome::CompileError>(res);
    EXPECT_NE(ce.exit_code, 0);
    EXPECT_THAT(ce.diagnostics, HasSubstr("source.c:3:"));

    // The same compilation run by hand
    TemporaryDirectory manual_dir("/tmp/parexec-test.XXXXXX");
    put_file_contents(manual_dir.path() + "source.c", source);
    Workspace manual_ws{manual_dir.path(), "manual"};
    CancellationToken token{seconds{30}};
    auto manual = Spawner::run(
        compile_command(config, Mode::THREAD_PARALLEL, Language::C),
        {
            .working_dir = manual_dir.path(),
            .stdin_file = std::nullopt,
            .env = compile_environment(config, manual_ws),
            .max_output_bytes = config.max_output_bytes,
            .file_size_limit = std::nullopt,
            .cpu_time_limit = std::nullopt,
        },
        token
    );
    EXPECT_EQ(ce.diagnostics, manual.stderr_text);
    EXPECT_EQ(ce.exit_code, manual.exit_code);
    EXPECT_TRUE(scratch_root_is_empty());
}

// NOLINTNEXTLINE
TEST_F(ToolchainIntegration, stdin_and_runtime_error) {
    auto res = run(
        "#include <stdio.h>\nint main() { int x = 0; scanf(\"%d\", &x); printf(\"%d\\n\", 2 * x); "
        "return 3; }\n",
        1,
        "21\n"
    );
    ASSERT_TRUE(std::holds_alternative<outcome::RuntimeError>(res)) << classification(res);
    const auto& re = std::get<outcome::RuntimeError>(res);
    EXPECT_EQ(re.exit_code, 3);
    EXPECT_EQ(re.signal, std::nullopt);
    EXPECT_EQ(re.stdout_text, "42\n");
}

// NOLINTNEXTLINE
TEST_F(ToolchainIntegration, infinite_loop_times_out) {
    config.thread_parallel_execute_timeout = milliseconds{2000};
    auto start = std::chrono::steady_clock::now();
    auto res = run(
        R"(#include <stdio.h>
#include <unistd.h>

int main() {
    printf("%d\n", (int)getpid());
    fflush(stdout);
    #pragma omp parallel
    {
        volatile unsigned long long x = 0;
        for (;;) {
            ++x;
        }
    }
    return 0;
}
)",
        4
    );
    auto elapsed = std::chrono::steady_clock::now() - start;
    ASSERT_TRUE(std::holds_alternative<outcome::Timeout>(res)) << classification(res);
    const auto& timeout = std::get<outcome::Timeout>(res);
    EXPECT_EQ(timeout.phase, Phase::EXECUTE);
    EXPECT_EQ(timeout.limit, milliseconds{2000});
    // Compilation time is included
    EXPECT_GE(elapsed, milliseconds{2000});
    EXPECT_LT(elapsed, seconds{2 + 10});

    // The program was the leader of its process group
    pid_t pid = std::stoi(timeout.stdout_text);
    EXPECT_TRUE(group_dies_soon(pid));
    EXPECT_TRUE(scratch_root_is_empty());
}

// NOLINTNEXTLINE
TEST_F(ToolchainIntegration, concurrent_requests) {
    CompileOutcome first;
    CompileOutcome second;
    auto request = [&](CompileOutcome& res, int64_t workers) {
        CompileRequest req = {
            .source = SUM_SOURCE,
            .mode = Mode::THREAD_PARALLEL,
            .worker_count = workers,
            .language = Language::C,
            .stdin_text = std::nullopt,
        };
        res = pipeline.compile_and_run(req);
    };
    (void)intercept_logger(stdlog, [&] {
        std::thread t1(request, std::ref(first), 2);
        std::thread t2(request, std::ref(second), 3);
        t1.join();
        t2.join();
    });
    ASSERT_TRUE(std::holds_alternative<outcome::Success>(first)) << classification(first);
    ASSERT_TRUE(std::holds_alternative<outcome::Success>(second)) << classification(second);
    EXPECT_EQ(std::get<outcome::Success>(first).stdout_text, "sum = 55\nthreads = 2\n");
    EXPECT_EQ(std::get<outcome::Success>(second).stdout_text, "sum = 55\nthreads = 3\n");
    EXPECT_TRUE(scratch_root_is_empty());
}

// NOLINTNEXTLINE
TEST_F(MpiIntegration, every_rank_reports) {
    auto res = run(MPI_HELLO_SOURCE, 3);
    ASSERT_TRUE(std::holds_alternative<outcome::Success>(res)) << classification(res);
    EXPECT_THAT(
        lines_of(std::get<outcome::Success>(res).stdout_text),
        testing::UnorderedElementsAre("rank 0 of 3", "rank 1 of 3", "rank 2 of 3")
    );
    EXPECT_TRUE(scratch_root_is_empty());
}

// NOLINTNEXTLINE
TEST_F(MpiIntegration, infinite_loop_times_out_and_no_rank_survives) {
    config.process_parallel_execute_timeout = milliseconds{5000};
    auto res = run(
        R"(#include <mpi.h>
#include <stdio.h>
#include <unistd.h>

int main(int argc, char** argv) {
    MPI_Init(&argc, &argv);
    printf("%d\n", (int)getpid());
    fflush(stdout);
    volatile unsigned long long x = 0;
    for (;;) {
        ++x;
    }
    MPI_Finalize();
    return 0;
}
)",
        2
    );
    ASSERT_TRUE(std::holds_alternative<outcome::Timeout>(res)) << classification(res);
    const auto& timeout = std::get<outcome::Timeout>(res);
    EXPECT_EQ(timeout.phase, Phase::EXECUTE);
    EXPECT_EQ(timeout.limit, milliseconds{5000});

    auto pids = lines_of(timeout.stdout_text);
    EXPECT_EQ(pids.size(), 2U) << timeout.stdout_text;
    for (const auto& pid : pids) {
        EXPECT_TRUE(process_dies_soon(std::stoi(pid))) << "rank " << pid << " survived";
    }
    EXPECT_TRUE(scratch_root_is_empty());
}
