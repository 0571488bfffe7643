#pragma once

#include <string>
#include <string_view>
#include <sys/types.h>

/**
 * @brief Creates directory @p path with all missing parent directories
 *
 * @return 0 on success, -1 on error (errno is set appropriately); an already
 *   existing directory is not an error
 */
[[nodiscard]] int mkdir_r(std::string path, mode_t mode = 0755) noexcept;

/**
 * @brief Removes recursively file or directory @p pathname relative to a
 *   directory file descriptor @p dirfd
 * @details Symbolic links are removed, never followed
 *
 * @return 0 on success, -1 on error (errno is set appropriately)
 */
[[nodiscard]] int remove_rat(int dirfd, const char* pathname) noexcept;

[[nodiscard]] int remove_r(const char* pathname) noexcept;

[[nodiscard]] inline int remove_r(const std::string& pathname) noexcept {
    return remove_r(pathname.c_str());
}

// Writes @p contents to the file @p pathname, truncating it or creating it with
// @p mode. Throws std::runtime_error on error
void put_file_contents(const std::string& pathname, std::string_view contents, mode_t mode = 0644);

// Throws std::runtime_error on error
std::string get_file_contents(const std::string& pathname);
