#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <sys/resource.h>

namespace vizrun::sandbox {

// Exit status and stderr prefix of a worker that could not enter the sandbox.
constexpr int kSetupFailureExit = 121;
constexpr const char* kSetupFailureMarker = "vizrun-sandbox: ";

// Where the scratch directory appears inside an isolated worker.
constexpr const char* kSandboxMount = "/sandbox";

// Identity of the worker inside its user namespace. Not root, so the
// capabilities held while the namespaces are built are dropped at exec.
constexpr unsigned kSandboxId = 1000;

enum class MountKind {
    kDirectory,
    kSymlink,
    kReadOnlyBind,
    kReadOnlyFileBind,
    kDeviceBind,
    kWritableBind,
    kTmpfs,
    kProc
};

struct MountStep {
    MountKind kind = MountKind::kDirectory;
    // Host path, symlink text or tmpfs options, depending on kind.
    std::string source;
    // Absolute path below the new root, before the root is switched.
    std::string target;
    // Flags the host mount carries. A remount inside a user namespace must
    // keep them.
    unsigned long flags = 0;
};

// Everything the child needs after fork, computed in the parent so the child
// only makes async-signal-safe calls.
struct ChildSetup {
    rlim_t address_space = RLIM_INFINITY;
    rlim_t cpu_soft = RLIM_INFINITY;
    rlim_t cpu_hard = RLIM_INFINITY;
    rlim_t file_size = RLIM_INFINITY;
    rlim_t open_files = 256;
    rlim_t processes = RLIM_INFINITY;
    bool isolate = true;
    std::string uid_map;
    std::string gid_map;
    // Empty directory that becomes "/" of an isolated worker.
    std::string new_root;
    std::vector<MountStep> mounts;
    // Working directory as the worker sees it.
    std::string work_dir;
};

// Root filesystem of an isolated worker: the read-only host trees, a few
// device nodes, /proc, a private /tmp of tmp_bytes, and the scratch directory
// as the only writable host path, at kSandboxMount.
std::vector<MountStep> PlanRootFilesystem(const std::string& new_root,
                                          const std::string& scratch_dir,
                                          std::vector<std::string> read_only_paths,
                                          std::size_t tmp_bytes);

// Runs in the forked child once its standard streams are redirected. The
// child becomes a subreaper and forks the worker, optionally inside fresh
// user, pid, network, ipc and mount namespaces. In the worker this returns
// and the caller execs. The supervising process never returns: it waits for
// the worker, kills and reaps everything the worker left behind, then exits
// with the worker's status.
void EnterSandbox(const ChildSetup& setup);

}  // namespace vizrun::sandbox
