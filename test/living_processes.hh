#pragma once

#include <charconv>
#include <chrono>
#include <parexec/concat_tostr.hh>
#include <parexec/directory.hh>
#include <parexec/file_manip.hh>
#include <parexec/proc_stat_file_contents.hh>
#include <parexec/throw_assert.hh>
#include <stdexcept>
#include <string>
#include <sys/types.h>
#include <thread>
#include <vector>

// Returns pids of the processes in the process group @p pgid that are not
// zombies (zombies may wait some time for their reaper)
inline std::vector<pid_t> living_group_members(pid_t pgid) {
    Directory dir("/proc");
    throw_assert(dir.is_open());

    std::vector<pid_t> res;
    for_each_dir_component(
        dir,
        [&](dirent* file) {
            std::string_view name = file->d_name;
            pid_t pid = 0;
            auto [ptr, ec] = std::from_chars(name.data(), name.data() + name.size(), pid);
            if (ec != std::errc{} or ptr != name.data() + name.size()) {
                return;
            }

            std::string contents;
            try {
                contents = get_file_contents("/proc/" + std::string{name} + "/stat");
            } catch (const std::runtime_error&) {
                return; // The process has just died
            }
            auto stat = ProcStatFileContents::from_proc_stat_contents(std::move(contents));
            if (stat.field(ProcStatFileContents::PGRP_FID) == std::to_string(pgid) and
                stat.field(ProcStatFileContents::STATE_FID) != "Z")
            {
                res.emplace_back(pid);
            }
        },
        [] { throw std::runtime_error("readdir('/proc') failed"); }
    );
    return res;
}

// Killed processes need a moment to become zombies
inline bool group_dies_soon(pid_t pgid) {
    for (int i = 0; i < 100; ++i) {
        if (living_group_members(pgid).empty()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
    return false;
}

// True once the process @p pid is gone or is a zombie
inline bool process_dies_soon(pid_t pid) {
    for (int i = 0; i < 100; ++i) {
        std::string contents;
        try {
            contents = get_file_contents(concat_tostr("/proc/", pid, "/stat"));
        } catch (const std::runtime_error&) {
            return true;
        }
        auto stat = ProcStatFileContents::from_proc_stat_contents(std::move(contents));
        if (stat.field(ProcStatFileContents::STATE_FID) == "Z") {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
    return false;
}
