#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <parexec/toolchain.hh>

using namespace parexec; // NOLINT(google-build-using-namespace)
using testing::ElementsAre;

// NOLINTNEXTLINE
TEST(toolchain, compile_command) {
    Config config;
    EXPECT_THAT(
        compile_command(config, Mode::THREAD_PARALLEL, Language::C),
        ElementsAre("gcc", "-fopenmp", "source.c", "-o", "program", "-lm")
    );
    EXPECT_THAT(
        compile_command(config, Mode::THREAD_PARALLEL, Language::CPP),
        ElementsAre("g++", "-fopenmp", "source.cpp", "-o", "program", "-lm", "-std=c++17", "-pedantic")
    );
    EXPECT_THAT(
        compile_command(config, Mode::PROCESS_PARALLEL, Language::C),
        ElementsAre("mpicc", "source.c", "-o", "program", "-lm")
    );

    config.mpi_cpp_compiler = "/opt/mpi/bin/mpic++";
    EXPECT_THAT(
        compile_command(config, Mode::PROCESS_PARALLEL, Language::CPP),
        ElementsAre("/opt/mpi/bin/mpic++", "source.cpp", "-o", "program", "-lm", "-std=c++17", "-pedantic")
    );
}

// NOLINTNEXTLINE
TEST(toolchain, run_command) {
    Config config;
    EXPECT_THAT(run_command(config, Mode::THREAD_PARALLEL, 4, false), ElementsAre("./program"));
    EXPECT_THAT(run_command(config, Mode::THREAD_PARALLEL, 4, true), ElementsAre("./program"));
    EXPECT_THAT(
        run_command(config, Mode::PROCESS_PARALLEL, 3, false),
        ElementsAre("mpirun", "--oversubscribe", "-np", "3", "./program")
    );
    EXPECT_THAT(
        run_command(config, Mode::PROCESS_PARALLEL, 8, true),
        ElementsAre("mpirun", "--allow-run-as-root", "--oversubscribe", "-np", "8", "./program")
    );
}

// NOLINTNEXTLINE
TEST(toolchain, environment) {
    Config config;
    config.child_path = "/usr/bin:/bin";
    Workspace ws{"/tmp/parexec/parexec.abc123", "parexec.abc123"};

    EXPECT_THAT(
        compile_environment(config, ws),
        ElementsAre(
            "PATH=/usr/bin:/bin", "HOME=/tmp/parexec/parexec.abc123", "TMPDIR=/tmp/parexec/parexec.abc123"
        )
    );
    EXPECT_THAT(
        run_environment(config, ws, Mode::THREAD_PARALLEL, 6, true),
        ElementsAre(
            "PATH=/usr/bin:/bin",
            "HOME=/tmp/parexec/parexec.abc123",
            "TMPDIR=/tmp/parexec/parexec.abc123",
            "OMP_NUM_THREADS=6",
            "OMP_THREAD_LIMIT=6"
        )
    );
    EXPECT_EQ(run_environment(config, ws, Mode::PROCESS_PARALLEL, 2, false).size(), 3);
    EXPECT_THAT(
        run_environment(config, ws, Mode::PROCESS_PARALLEL, 2, true),
        testing::IsSupersetOf({"OMPI_ALLOW_RUN_AS_ROOT=1", "OMPI_ALLOW_RUN_AS_ROOT_CONFIRM=1"})
    );
}

// NOLINTNEXTLINE
TEST(toolchain, file_names) {
    EXPECT_EQ(source_file_name(Language::C), "source.c");
    EXPECT_EQ(source_file_name(Language::CPP), "source.cpp");
    Workspace ws{"/tmp/x/", "x"};
    EXPECT_EQ(ws.file(ARTIFACT_NAME), "/tmp/x/program");
    EXPECT_EQ(ws.file(STDIN_FILE_NAME), "/tmp/x/stdin.txt");
}
