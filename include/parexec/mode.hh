#pragma once

#include <optional>
#include <string_view>

namespace parexec {

enum class Mode {
    THREAD_PARALLEL, // shared-memory threads (OpenMP), worker = thread
    PROCESS_PARALLEL, // message passing (MPI) on a single node, worker = process
};

enum class Language { C, CPP };

constexpr std::string_view to_string(Mode mode) noexcept {
    switch (mode) {
    case Mode::THREAD_PARALLEL: return "thread-parallel";
    case Mode::PROCESS_PARALLEL: return "process-parallel";
    }
    return "unknown";
}

constexpr std::string_view to_string(Language lang) noexcept {
    switch (lang) {
    case Language::C: return "c";
    case Language::CPP: return "cpp";
    }
    return "unknown";
}

// Accepts also the names of the underlying runtimes: "openmp" and "mpi"
constexpr std::optional<Mode> mode_from_string(std::string_view str) noexcept {
    if (str == "thread-parallel" or str == "openmp") {
        return Mode::THREAD_PARALLEL;
    }
    if (str == "process-parallel" or str == "mpi") {
        return Mode::PROCESS_PARALLEL;
    }
    return std::nullopt;
}

constexpr std::optional<Language> language_from_string(std::string_view str) noexcept {
    if (str == "c") {
        return Language::C;
    }
    if (str == "cpp" or str == "c++") {
        return Language::CPP;
    }
    return std::nullopt;
}

} // namespace parexec
