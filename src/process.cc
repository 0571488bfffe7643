#include <algorithm>
#include <charconv>
#include <map>
#include <optional>
#include <parexec/call_in_destructor.hh>
#include <parexec/concat_tostr.hh>
#include <parexec/directory.hh>
#include <parexec/errmsg.hh>
#include <parexec/file_descriptor.hh>
#include <parexec/macros/throw.hh>
#include <parexec/proc_stat_file_contents.hh>
#include <parexec/process.hh>

using std::string;
using std::vector;

namespace {

template <class T>
std::optional<T> str2num(std::string_view str) noexcept {
    T res{};
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), res);
    if (ec != std::errc{} or ptr != str.data() + str.size()) {
        return std::nullopt;
    }
    return res;
}

// Returns std::nullopt if the process does not exist anymore
std::optional<string> read_proc_stat(const char* pid_str) {
    FileDescriptor fd{concat_tostr("/proc/", pid_str, "/stat").c_str(), O_RDONLY | O_CLOEXEC};
    if (!fd.is_open()) {
        return std::nullopt;
    }

    string res;
    char buff[1024];
    for (;;) {
        ssize_t rc = read(fd, buff, sizeof(buff));
        if (rc == 0) {
            return res;
        }
        if (rc == -1) {
            if (errno == EINTR) {
                continue;
            }
            return std::nullopt; // ESRCH - the process has just died
        }
        res.append(buff, static_cast<size_t>(rc));
    }
}

} // namespace

vector<pid_t> descendant_processes(pid_t pid) {
    Directory dir("/proc");
    if (!dir.is_open()) {
        THROW("opendir('/proc')", errmsg());
    }

    std::multimap<pid_t, pid_t> children; // ppid => pid
    for_each_dir_component(
        dir,
        [&](dirent* file) {
            auto child_pid = str2num<pid_t>(file->d_name);
            if (!child_pid) {
                return; // Not a process
            }

            auto contents = read_proc_stat(file->d_name);
            if (!contents) {
                return;
            }

            auto stat = ProcStatFileContents::from_proc_stat_contents(std::move(*contents));
            auto ppid = str2num<pid_t>(stat.field(ProcStatFileContents::PPID_FID));
            if (ppid) {
                children.emplace(*ppid, *child_pid);
            }
        },
        [] { THROW("readdir('/proc')", errmsg()); }
    );

    vector<pid_t> res;
    vector<pid_t> queue = {pid};
    while (!queue.empty()) {
        pid_t parent = queue.back();
        queue.pop_back();
        auto [beg, end] = children.equal_range(parent);
        for (auto it = beg; it != end; ++it) {
            res.emplace_back(it->second);
            queue.emplace_back(it->second);
        }
    }

    return res;
}

void kill_process_tree(pid_t root_pid, pid_t pgid) {
    // Stopped processes cannot fork and stay parents of their children, so
    // nobody is reparented while the tree is being collected
    constexpr int MAX_FREEZE_ROUNDS = 8;
    (void)kill(-pgid, SIGSTOP);
    (void)kill(root_pid, SIGSTOP);
    CallInDtor group_killer([&] { (void)kill(-pgid, SIGKILL); });
    vector<pid_t> victims;
    for (int round = 0; round < MAX_FREEZE_ROUNDS; ++round) {
        auto descendants = descendant_processes(root_pid);
        std::sort(descendants.begin(), descendants.end());
        if (descendants == victims) {
            break; // The tree is frozen
        }

        for (pid_t pid : descendants) {
            (void)kill(pid, SIGSTOP);
        }
        victims = std::move(descendants);
    }

    for (pid_t pid : victims) {
        (void)kill(pid, SIGKILL);
    }
    (void)kill(root_pid, SIGKILL);
}
