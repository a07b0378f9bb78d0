#pragma once

#include <cstddef>
#include <vector>

#include <sys/types.h>

namespace vizrun::sandbox {

struct ProcessInfo {
    pid_t pid = -1;
    pid_t ppid = -1;
    char state = '?';
    std::size_t resident_bytes = 0;
};

// Snapshot of every process visible in /proc.
std::vector<ProcessInfo> ListProcesses();

// The process rooted at `root` and all of its descendants, root first.
// Empty when root is not in the snapshot.
std::vector<ProcessInfo> ProcessTree(pid_t root, const std::vector<ProcessInfo>& snapshot);
std::vector<ProcessInfo> ProcessTree(pid_t root);

// Sum of resident memory over the tree; shared pages count once per process.
std::size_t TreeResidentBytes(const std::vector<ProcessInfo>& tree);

// False for pids that are gone or only left as zombies.
bool IsProcessAlive(pid_t pid);

}  // namespace vizrun::sandbox
