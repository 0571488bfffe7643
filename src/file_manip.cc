#include <cerrno>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <linux/limits.h>
#include <parexec/errmsg.hh>
#include <parexec/file_descriptor.hh>
#include <parexec/file_manip.hh>
#include <parexec/macros/throw.hh>
#include <sys/stat.h>
#include <unistd.h>

using std::string;

int mkdir_r(string path, mode_t mode) noexcept {
    if (path.size() >= PATH_MAX) {
        errno = ENAMETOOLONG;
        return -1;
    }

    // Add ending slash (if not exists)
    if (path.empty() || path.back() != '/') {
        path += '/';
    }

    size_t end = 1; // If there is a leading slash, it will be omitted
    while (end < path.size()) {
        while (path[end] != '/') {
            ++end;
        }

        path[end] = '\0'; // Separate subpath
        if (mkdir(path.data(), mode) == -1 && errno != EEXIST) {
            return -1;
        }

        path[end++] = '/';
    }

    return 0;
}

static int remove_rat_impl(int dirfd, const char* path) noexcept {
    int fd = openat(dirfd, path, O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC);
    if (fd == -1) {
        return unlinkat(dirfd, path, 0);
    }

    DIR* dir = fdopendir(fd);
    if (dir == nullptr) {
        int ec = errno;
        (void)close(fd);
        errno = ec;
        return -1;
    }

    int ec = 0;
    errno = 0;
    dirent* file = nullptr;
    while ((file = readdir(dir)) != nullptr) {
        if (strcmp(file->d_name, ".") == 0 || strcmp(file->d_name, "..") == 0) {
            continue;
        }
#ifdef _DIRENT_HAVE_D_TYPE
        if (file->d_type == DT_DIR || file->d_type == DT_UNKNOWN) {
#endif
            if (remove_rat_impl(fd, file->d_name)) {
                ec = errno;
                break;
            }
#ifdef _DIRENT_HAVE_D_TYPE
        } else if (unlinkat(fd, file->d_name, 0)) {
            ec = errno;
            break;
        }
#endif
        errno = 0;
    }
    if (ec == 0 && errno != 0) { // readdir() failed
        ec = errno;
    }

    (void)closedir(dir);

    if (ec) {
        errno = ec;
        return -1;
    }

    return unlinkat(dirfd, path, AT_REMOVEDIR);
}

int remove_rat(int dirfd, const char* pathname) noexcept {
    return remove_rat_impl(dirfd, pathname);
}

int remove_r(const char* pathname) noexcept { return remove_rat(AT_FDCWD, pathname); }

void put_file_contents(const string& pathname, std::string_view contents, mode_t mode) {
    FileDescriptor fd{pathname.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode};
    if (!fd.is_open()) {
        THROW("open('", pathname, "')", errmsg());
    }

    while (!contents.empty()) {
        ssize_t rc = write(fd, contents.data(), contents.size());
        if (rc == -1) {
            if (errno == EINTR) {
                continue;
            }
            THROW("write('", pathname, "')", errmsg());
        }
        contents.remove_prefix(static_cast<size_t>(rc));
    }

    if (fd.close()) {
        THROW("close('", pathname, "')", errmsg());
    }
}

string get_file_contents(const string& pathname) {
    FileDescriptor fd{pathname.c_str(), O_RDONLY | O_CLOEXEC};
    if (!fd.is_open()) {
        THROW("open('", pathname, "')", errmsg());
    }

    string res;
    char buff[1 << 16];
    for (;;) {
        ssize_t rc = read(fd, buff, sizeof(buff));
        if (rc == 0) {
            return res;
        }
        if (rc == -1) {
            if (errno == EINTR) {
                continue;
            }
            THROW("read('", pathname, "')", errmsg());
        }
        res.append(buff, static_cast<size_t>(rc));
    }
}
