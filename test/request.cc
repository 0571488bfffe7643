#include <gtest/gtest.h>
#include <initializer_list>
#include <parexec/request.hh>

using parexec::CompileRequest;
using parexec::Config;
using parexec::Language;
using parexec::looks_like_plain_c;
using parexec::Mode;
using parexec::RejectReason;
using parexec::validate;

namespace {

CompileRequest request(std::string source, Mode mode, int64_t workers, Language lang) {
    return {
        .source = std::move(source),
        .mode = mode,
        .worker_count = workers,
        .language = lang,
        .stdin_text = std::nullopt,
    };
}

constexpr const char C_SOURCE[] = "#include <stdio.h>\nint main() { printf(\"hi\\n\"); }\n";
constexpr const char CPP_SOURCE[] =
    "#include <iostream>\nint main() { std::cout << \"hi\\n\"; }\n";

} // namespace

// NOLINTNEXTLINE
TEST(request, looks_like_plain_c) {
    EXPECT_TRUE(looks_like_plain_c(C_SOURCE));
    EXPECT_FALSE(looks_like_plain_c(CPP_SOURCE));
    // C++ using printf is still C++
    EXPECT_FALSE(looks_like_plain_c("#include <cstdio>\n#include <vector>\nint main() { "
                                    "std::vector<int> v; printf(\"%zu\", v.size()); }"));
    // Nothing to tell
    EXPECT_FALSE(looks_like_plain_c("int main() { return 0; }"));
}

// NOLINTNEXTLINE
TEST(request, valid) {
    Config config;
    EXPECT_EQ(validate(request(C_SOURCE, Mode::THREAD_PARALLEL, 1, Language::C), config), std::nullopt);
    EXPECT_EQ(
        validate(request(CPP_SOURCE, Mode::PROCESS_PARALLEL, 8, Language::CPP), config), std::nullopt
    );
    EXPECT_EQ(
        validate(request(C_SOURCE, Mode::THREAD_PARALLEL, 16, Language::C), config), std::nullopt
    );
}

// NOLINTNEXTLINE
TEST(request, worker_count) {
    Config config;
    for (int64_t workers : std::initializer_list<int64_t>{0, -1, 17, 1'000'000'000'000}) {
        auto rej = validate(request(C_SOURCE, Mode::THREAD_PARALLEL, workers, Language::C), config);
        ASSERT_TRUE(rej.has_value()) << workers;
        EXPECT_EQ(rej->reason, RejectReason::INVALID_WORKER_COUNT) << workers;
    }

    auto rej = validate(request(C_SOURCE, Mode::PROCESS_PARALLEL, 9, Language::C), config);
    ASSERT_TRUE(rej.has_value());
    EXPECT_EQ(rej->reason, RejectReason::INVALID_WORKER_COUNT);
    EXPECT_EQ(rej->detail, "worker count has to be between 1 and 8 in process-parallel mode, got 9");
}

// NOLINTNEXTLINE
TEST(request, language_mismatch) {
    Config config;
    auto rej = validate(request(C_SOURCE, Mode::THREAD_PARALLEL, 4, Language::CPP), config);
    ASSERT_TRUE(rej.has_value());
    EXPECT_EQ(rej->reason, RejectReason::LANGUAGE_MISMATCH);
    EXPECT_EQ(rej->matched_pattern, std::nullopt);
    // Selecting C for C++ code is left to the compiler
    EXPECT_EQ(validate(request(CPP_SOURCE, Mode::THREAD_PARALLEL, 4, Language::C), config), std::nullopt);
}

// NOLINTNEXTLINE
TEST(request, validation_order) {
    Config config;
    config.max_source_bytes = 10;

    auto rej = validate(request("", Mode::THREAD_PARALLEL, 0, Language::CPP), config);
    ASSERT_TRUE(rej.has_value());
    EXPECT_EQ(rej->reason, RejectReason::EMPTY_SOURCE);

    rej = validate(request(C_SOURCE, Mode::THREAD_PARALLEL, 0, Language::CPP), config);
    ASSERT_TRUE(rej.has_value());
    EXPECT_EQ(rej->reason, RejectReason::SOURCE_TOO_LARGE);

    config.max_source_bytes = 1 << 10;
    rej = validate(request(C_SOURCE, Mode::THREAD_PARALLEL, 0, Language::CPP), config);
    ASSERT_TRUE(rej.has_value());
    EXPECT_EQ(rej->reason, RejectReason::INVALID_WORKER_COUNT);
}

// NOLINTNEXTLINE
TEST(request, source_size_limit_is_inclusive) {
    Config config;
    config.max_source_bytes = 4;
    EXPECT_EQ(validate(request("main", Mode::THREAD_PARALLEL, 1, Language::C), config), std::nullopt);
    auto rej = validate(request("main ", Mode::THREAD_PARALLEL, 1, Language::C), config);
    ASSERT_TRUE(rej.has_value());
    EXPECT_EQ(rej->reason, RejectReason::SOURCE_TOO_LARGE);
    EXPECT_EQ(rej->detail, "source has 5 bytes, the limit is 4 bytes");
}
