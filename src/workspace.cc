#include <cerrno>
#include <cstdlib>
#include <ctime>
#include <parexec/directory.hh>
#include <parexec/errmsg.hh>
#include <parexec/file_descriptor.hh>
#include <parexec/file_manip.hh>
#include <parexec/logger.hh>
#include <parexec/macros/throw.hh>
#include <parexec/workspace.hh>
#include <sys/stat.h>

using std::string;

namespace parexec {

DiskWorkspaceManager::DiskWorkspaceManager(string scratch_root)
: scratch_root_(std::move(scratch_root)) {
    if (scratch_root_.empty()) {
        THROW("scratch root cannot be empty");
    }
    if (scratch_root_.back() != '/') {
        scratch_root_ += '/';
    }
    if (mkdir_r(scratch_root_, 0700)) {
        THROW("mkdir_r('", scratch_root_, "')", errmsg());
    }
}

Workspace DiskWorkspaceManager::acquire() {
    auto make_template = [&] { return concat_tostr(scratch_root_, NAME_PREFIX, "XXXXXX"); };
    string templ = make_template();
    // Create directory with permissions (mode: 0700/rwx------)
    if (mkdtemp(templ.data()) == nullptr) {
        int errnum = errno;
        // Someone may have removed the scratch root. mkdtemp() overwrites the
        // XXXXXX suffix even on failure, so the template has to be rebuilt.
        if (errnum == ENOENT) {
            if (mkdir_r(scratch_root_, 0700)) {
                errnum = errno;
            } else {
                templ = make_template();
                errnum = (mkdtemp(templ.data()) == nullptr ? errno : 0);
            }
        }
        if (errnum != 0) {
            throw ResourceExhausted(
                concat_tostr("cannot create workspace in ", scratch_root_, errmsg(errnum))
            );
        }
    }

    string name = templ.substr(scratch_root_.size());
    return Workspace{std::move(templ), std::move(name)};
}

void DiskWorkspaceManager::release(Workspace& ws) noexcept {
    if (ws.released()) {
        return;
    }
    mark_released(ws);

    if (remove_r(ws.path()) and errno != ENOENT) {
        errlog("workspace ", ws.name(), ": failed to remove ", ws.path(), errmsg());
    }
}

size_t DiskWorkspaceManager::sweep_stale(std::chrono::seconds max_age) const {
    FileDescriptor dirfd{scratch_root_.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC};
    if (!dirfd.is_open()) {
        THROW("open('", scratch_root_, "')", errmsg());
    }
    // Directory takes ownership of the duplicate, dirfd is still needed
    Directory dir{fdopendir(fcntl(dirfd, F_DUPFD_CLOEXEC, 0))};
    if (!dir.is_open()) {
        THROW("fdopendir('", scratch_root_, "')", errmsg());
    }

    auto threshold = time(nullptr) - max_age.count();
    size_t removed = 0;
    for_each_dir_component(
        dir,
        [&](dirent* file) {
            std::string_view name = file->d_name;
            if (name.substr(0, NAME_PREFIX.size()) != NAME_PREFIX) {
                return;
            }

            struct stat st = {};
            if (fstatat(dirfd, file->d_name, &st, AT_SYMLINK_NOFOLLOW)) {
                if (errno != ENOENT) {
                    errlog("stale workspace sweep: fstatat('", name, "')", errmsg());
                }
                return;
            }
            if (st.st_mtime >= threshold) {
                return; // May still be in use
            }

            if (remove_rat(dirfd, file->d_name) and errno != ENOENT) {
                errlog("stale workspace sweep: failed to remove ", scratch_root_, name, errmsg());
                return;
            }
            ++removed;
        },
        [&] { THROW("readdir('", scratch_root_, "')", errmsg()); }
    );

    if (removed > 0) {
        stdlog("stale workspace sweep: removed ", removed, " workspace(s) from ", scratch_root_);
    }
    return removed;
}

} // namespace parexec
