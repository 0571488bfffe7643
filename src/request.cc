#include <parexec/concat_tostr.hh>
#include <parexec/request.hh>

using std::string_view;

namespace {

constexpr string_view CPP_INDICATORS[] = {
    "iostream",
    "fstream",
    "sstream",
    "cout",
    "cin",
    "endl",
    "std::",
    "using namespace",
    "class ",
    "public:",
    "private:",
    "protected:",
    "template<",
    "nullptr",
    "<vector>",
    "<string>",
    "<map>",
    "<set>",
    "<algorithm>",
    "new ",
    "delete ",
};

constexpr string_view C_ONLY_INDICATORS[] = {
    "printf", "scanf", "stdio.h", "stdlib.h", "malloc", "free(",
};

template <size_t N>
bool contains_any(string_view source, const string_view (&needles)[N]) noexcept {
    for (auto needle : needles) {
        if (source.find(needle) != string_view::npos) {
            return true;
        }
    }
    return false;
}

} // namespace

namespace parexec {

bool looks_like_plain_c(string_view source) noexcept {
    return contains_any(source, C_ONLY_INDICATORS) and not contains_any(source, CPP_INDICATORS);
}

std::optional<outcome::Rejected> validate(const CompileRequest& req, const Config& config) {
    if (req.source.empty()) {
        return outcome::Rejected{
            .reason = RejectReason::EMPTY_SOURCE,
            .detail = "no source code provided",
            .matched_pattern = std::nullopt,
        };
    }

    if (req.source.size() > config.max_source_bytes) {
        return outcome::Rejected{
            .reason = RejectReason::SOURCE_TOO_LARGE,
            .detail = concat_tostr(
                "source has ",
                req.source.size(),
                " bytes, the limit is ",
                config.max_source_bytes,
                " bytes"
            ),
            .matched_pattern = std::nullopt,
        };
    }

    auto max_workers = config.max_workers(req.mode);
    if (req.worker_count < 1 or req.worker_count > static_cast<int64_t>(max_workers)) {
        return outcome::Rejected{
            .reason = RejectReason::INVALID_WORKER_COUNT,
            .detail = concat_tostr(
                "worker count has to be between 1 and ",
                max_workers,
                " in ",
                to_string(req.mode),
                " mode, got ",
                req.worker_count
            ),
            .matched_pattern = std::nullopt,
        };
    }

    if (req.language == Language::CPP and looks_like_plain_c(req.source)) {
        return outcome::Rejected{
            .reason = RejectReason::LANGUAGE_MISMATCH,
            .detail = "C++ was selected but the code appears to be C (using "
                      "printf/scanf/stdio.h). Either switch to C or use C++ features "
                      "(iostream, cout, cin, etc.)",
            .matched_pattern = std::nullopt,
        };
    }

    return std::nullopt;
}

} // namespace parexec
