#include <algorithm>
#include <cstddef>
#include <parexec/pattern_screener.hh>
#include <stdexcept>

using std::string;
using std::string_view;
using std::vector;

namespace {

constexpr bool is_identifier_char(char c) noexcept {
    return (c >= 'a' and c <= 'z') or (c >= 'A' and c <= 'Z') or (c >= '0' and c <= '9') or
        c == '_';
}

} // namespace

namespace parexec {

const vector<string>& PatternScreener::default_deny_patterns() {
    static const vector<string> patterns = {
        // Process spawning
        "system(",
        "fork(",
        "vfork(",
        "clone(",
        "execl(",
        "execlp(",
        "execle(",
        "execv(",
        "execvp(",
        "execve(",
        "execvpe(",
        "fexecve(",
        "popen(",
        "posix_spawn",
        "posix_spawnp",
        "daemon(",
        // Arbitrary syscalls and process manipulation
        "syscall(",
        "ptrace",
        "dlopen",
        "setuid(",
        "setgid(",
        "chroot(",
        "kill(",
        "prctl(",
        // Raw assembly
        "asm",
        "__asm",
        "__asm__",
        // Filesystem
        "fopen(",
        "freopen(",
        "open(",
        "openat(",
        "creat(",
        "ofstream",
        "ifstream",
        "fstream",
        "<filesystem>",
        "remove(",
        "unlink(",
        "unlinkat(",
        "rename(",
        "rmdir(",
        "mkdir(",
        "chmod(",
        "chown(",
        "truncate(",
        "symlink(",
        // Network
        "socket(",
        "connect(",
        "bind(",
        "listen(",
        "accept(",
        "sys/socket.h",
        "netinet/",
        "arpa/inet.h",
    };
    return patterns;
}

PatternScreener::PatternScreener(vector<string> deny_patterns)
: patterns_(std::move(deny_patterns)) {
    for (size_t i = 0; i < patterns_.size(); ++i) {
        if (patterns_[i].empty()) {
            throw std::invalid_argument("deny pattern cannot be empty");
        }
        automaton_.add_pattern(patterns_[i], static_cast<AhoCorasick::uint>(i + 1));
    }
    automaton_.build_fail_edges();
}

ScreenResult PatternScreener::screen(string_view source) const {
    auto matches = automaton_.search_in(source);
    for (size_t end = 0; end < matches.size(); ++end) {
        // Patterns ending here are visited from the longest one
        for (auto node = matches[end]; node != 0; node = automaton_.next_pattern(node)) {
            const string& patt = patterns_[automaton_.pattern_id(node) - 1];
            size_t beg = end + 1 - patt.size();
            if (is_identifier_char(patt.front()) and beg > 0 and
                is_identifier_char(source[beg - 1]))
            {
                continue;
            }
            if (is_identifier_char(patt.back()) and end + 1 < source.size() and
                is_identifier_char(source[end + 1]))
            {
                continue;
            }

            return {
                .allowed = false,
                .matched_pattern = patt,
                .line = static_cast<size_t>(
                    1 + std::count(source.begin(), source.begin() + static_cast<ptrdiff_t>(beg), '\n')
                ),
            };
        }
    }

    return {.allowed = true, .matched_pattern = std::nullopt, .line = 0};
}

} // namespace parexec
