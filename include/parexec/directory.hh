#pragma once

#include <cerrno>
#include <cstring>
#include <dirent.h>

// Encapsulates directory object DIR
class Directory {
    DIR* dir_;

public:
    explicit Directory(DIR* dir = nullptr) noexcept : dir_(dir) {}

    explicit Directory(const char* pathname) noexcept : dir_(opendir(pathname)) {}

    Directory(const Directory&) = delete;

    Directory(Directory&& d) noexcept : dir_(d.release()) {}

    Directory& operator=(const Directory&) = delete;

    Directory& operator=(Directory&& d) noexcept {
        reset(d.release());
        return *this;
    }

    [[nodiscard]] bool is_open() const noexcept { return (dir_ != nullptr); }

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator DIR*() const noexcept { return dir_; }

    [[nodiscard]] DIR* release() noexcept {
        DIR* d = dir_;
        dir_ = nullptr;
        return d;
    }

    void reset(DIR* d) noexcept {
        if (dir_) {
            (void)closedir(dir_);
        }
        dir_ = d;
    }

    ~Directory() {
        if (dir_) {
            (void)closedir(dir_);
        }
    }
};

/**
 * @brief Calls @p func on every component of the @p dir other than "." and
 *   ".."
 *
 * @param dir opened directory, readdir(3) is used on it
 * @param func function to call on every component, it should take one
 *   argument - dirent*
 * @param readdir_failed function called (instead of throwing) when readdir(3)
 *   fails, errno is set appropriately
 */
template <class Func, class ErrFunc>
void for_each_dir_component(DIR* dir, Func&& func, ErrFunc&& readdir_failed) {
    for (;;) {
        errno = 0;
        dirent* file = readdir(dir);
        if (file == nullptr) {
            if (errno == 0) {
                return; // No more entries
            }

            readdir_failed();
            return;
        }

        if (strcmp(file->d_name, ".") != 0 and strcmp(file->d_name, "..") != 0) {
            func(file);
        }
    }
}
