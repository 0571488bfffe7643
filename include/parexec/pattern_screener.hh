#pragma once

#include <cstddef>
#include <optional>
#include <parexec/aho_corasick.hh>
#include <string>
#include <string_view>
#include <vector>

namespace parexec {

struct ScreenResult {
    bool allowed = true;
    std::optional<std::string> matched_pattern; // set iff not allowed
    size_t line = 0; // line (counted from 1) of the match, 0 if allowed
};

/**
 * Static scan of submitted source text against a deny-list of constructs
 * (process spawning, raw syscalls, inline assembly, filesystem opens,
 * sockets, ...).
 *
 * This is a shallow, fail-closed heuristic and NOT a sound analysis: code
 * that builds a forbidden call indirectly (macros concatenating tokens,
 * function pointers obtained at runtime, a space before the parenthesis,
 * trigraphs, ...) passes the screener. It is only a cheap pre-filter that
 * rejects obviously hostile input before any process is spawned. Real
 * deployments have to add process-level isolation (containers, seccomp)
 * around the whole service.
 *
 * Patterns are matched as plain substrings, except that a pattern beginning
 * (ending) with an identifier character does not match inside a longer
 * identifier, e.g. "open(" does not match "fopen(" and "asm" does not match
 * "plasma".
 *
 * The automaton is built once and is immutable afterwards, so screen() may be
 * called concurrently.
 */
class PatternScreener {
    std::vector<std::string> patterns_; // pattern id i + 1 => patterns_[i]
    AhoCorasick automaton_;

public:
    // Throws std::invalid_argument if a pattern is empty
    explicit PatternScreener(std::vector<std::string> deny_patterns);

    // Uses default_deny_patterns()
    PatternScreener() : PatternScreener(default_deny_patterns()) {}

    static const std::vector<std::string>& default_deny_patterns();

    [[nodiscard]] const std::vector<std::string>& patterns() const noexcept { return patterns_; }

    // Reports the match that ends first in @p source (the longest one if more
    // patterns end at the same position)
    [[nodiscard]] ScreenResult screen(std::string_view source) const;
};

} // namespace parexec
