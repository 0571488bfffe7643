#pragma once

#include <cstdint>
#include <optional>
#include <parexec/config.hh>
#include <parexec/mode.hh>
#include <parexec/outcome.hh>
#include <string>
#include <string_view>

namespace parexec {

struct CompileRequest {
    std::string source;
    Mode mode = Mode::THREAD_PARALLEL;
    int64_t worker_count = 4; // signed, so that invalid input stays representable
    Language language = Language::C;
    std::optional<std::string> stdin_text; // if unset, the program reads /dev/null
};

// Returns true if @p source looks like plain C (printf, malloc, ...) and
// shows none of the C++ idioms (iostream, std::, classes, ...)
bool looks_like_plain_c(std::string_view source) noexcept;

/**
 * @brief Validates @p req against @p config, in order: empty source, source
 *   size, worker count in [1, max_workers(mode)], language mismatch
 * @details Does no filesystem or process work.
 *
 * @return std::nullopt if the request is valid, the rejection otherwise
 */
std::optional<outcome::Rejected> validate(const CompileRequest& req, const Config& config);

} // namespace parexec
