#pragma once

#include <csignal>
#include <sys/types.h>
#include <vector>

/**
 * @brief Returns pids of all living descendants of the process @p pid
 * @details Parent links are taken from /proc/[pid]/stat of every accessible
 *   process. Processes that vanish during the scan are skipped.
 *
 * @errors Throws std::runtime_error if /proc cannot be read
 */
std::vector<pid_t> descendant_processes(pid_t pid);

/**
 * @brief Kills the process @p root_pid, all its descendants and the whole
 *   process group @p pgid with SIGKILL
 * @details The tree is frozen with SIGSTOP first (repeatedly, until no new
 *   descendant appears), so that no process escapes by forking or by being
 *   reparented after its parent dies. Descendants that moved to another
 *   process group or session are killed too.
 *
 * @errors Throws std::runtime_error if /proc cannot be read, the process
 *   group is killed anyway
 */
void kill_process_tree(pid_t root_pid, pid_t pgid);
