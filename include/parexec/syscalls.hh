#pragma once

#include <cerrno>
#include <csignal>
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>

extern "C" struct rusage;

namespace syscalls {

#ifdef SYS_waitid
inline int
waitid(int id_type, pid_t id, siginfo_t* info, int options, struct rusage* usage) noexcept {
    return static_cast<int>(syscall(SYS_waitid, id_type, id, info, options, usage));
}
#endif

#ifdef SYS_pidfd_open
inline int pidfd_open(pid_t pid, unsigned int flags) noexcept {
    return static_cast<int>(syscall(SYS_pidfd_open, pid, flags));
}
#endif

// Returns -1 and sets errno to ENOSYS if the kernel is too old
inline int close_range(unsigned int first, unsigned int last, unsigned int flags) noexcept {
#ifdef SYS_close_range
    return static_cast<int>(syscall(SYS_close_range, first, last, flags));
#else
    (void)first;
    (void)last;
    (void)flags;
    errno = ENOSYS;
    return -1;
#endif
}

} // namespace syscalls
