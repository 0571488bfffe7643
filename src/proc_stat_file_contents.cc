#include <parexec/concat_tostr.hh>
#include <parexec/file_manip.hh>
#include <parexec/macros/throw.hh>
#include <parexec/proc_stat_file_contents.hh>

using std::string;
using std::string_view;

namespace {

constexpr bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

void remove_leading_spaces(string_view& str) noexcept {
    while (!str.empty() && is_space(str.front())) {
        str.remove_prefix(1);
    }
}

string_view extract_leading_non_spaces(string_view& str) noexcept {
    size_t len = 0;
    while (len < str.size() && !is_space(str[len])) {
        ++len;
    }
    auto res = str.substr(0, len);
    str.remove_prefix(len);
    return res;
}

} // namespace

ProcStatFileContents::ProcStatFileContents(string stat_file_contents)
: contents_(std::move(stat_file_contents)) {
    string_view str(contents_);
    auto add_field = [&](string_view val) {
        fields_.emplace_back(static_cast<size_t>(val.data() - contents_.data()), val.size());
    };

    // [0] - Process pid
    remove_leading_spaces(str);
    add_field(extract_leading_non_spaces(str));
    // [1] - Executable filename, it may contain spaces and parentheses
    auto open_paren = str.find('(');
    auto close_paren = str.rfind(')');
    if (open_paren == string_view::npos or close_paren == string_view::npos or
        close_paren < open_paren)
    {
        THROW("Malformed /proc/[pid]/stat contents: ", contents_);
    }
    add_field(str.substr(open_paren + 1, close_paren - open_paren - 1));
    str.remove_prefix(close_paren + 1);
    // [>1]
    for (;;) {
        remove_leading_spaces(str);
        auto val = extract_leading_non_spaces(str);
        if (val.empty()) {
            break;
        }

        add_field(val);
    }
}

ProcStatFileContents ProcStatFileContents::get(pid_t pid) {
    return ProcStatFileContents{get_file_contents(concat_tostr("/proc/", pid, "/stat"))};
}
