#include "sandbox/isolation.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <initializer_list>
#include <set>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sched.h>
#include <signal.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace vizrun::sandbox {
namespace {

// Pid of the worker, for the supervisor's signal handler.
volatile pid_t g_worker_pid = -1;

void WriteStderr(const char* text) {
    std::size_t remaining = std::strlen(text);
    while (remaining > 0) {
        const auto written = ::write(STDERR_FILENO, text, remaining);
        if (written <= 0) {
            return;
        }
        text += written;
        remaining -= static_cast<std::size_t>(written);
    }
}

[[noreturn]] void FailSetup(const char* what, const char* detail = nullptr) {
    WriteStderr(kSetupFailureMarker);
    WriteStderr(what);
    if (detail != nullptr) {
        WriteStderr(": ");
        WriteStderr(detail);
    }
    WriteStderr("\n");
    ::_exit(kSetupFailureExit);
}

// Decimal text of value into out, which must hold 21 bytes.
char* FormatUnsigned(unsigned long value, char* out) {
    char digits[21];
    int count = 0;
    do {
        digits[count++] = static_cast<char>('0' + value % 10);
        value /= 10;
    } while (value != 0);
    while (count > 0) {
        *out++ = digits[--count];
    }
    *out = '\0';
    return out;
}

bool ParsePid(const char* text, pid_t& pid) {
    if (*text == '\0') {
        return false;
    }
    long value = 0;
    for (; *text != '\0'; ++text) {
        if (*text < '0' || *text > '9') {
            return false;
        }
        value = value * 10 + (*text - '0');
    }
    pid = static_cast<pid_t>(value);
    return true;
}

bool WriteProcFile(const char* path, const char* data, std::size_t length) {
    const int fd = ::open(path, O_WRONLY | O_CLOEXEC);
    if (fd < 0) {
        return false;
    }
    const auto written = ::write(fd, data, length);
    ::close(fd);
    return written == static_cast<ssize_t>(length);
}

// Never asks for more than the inherited hard limit, which only a privileged
// process could raise.
bool SetLimit(int resource, rlim_t soft, rlim_t hard) {
    rlimit current{};
    if (::getrlimit(resource, &current) == 0) {
        hard = std::min(hard, current.rlim_max);
        soft = std::min(soft, hard);
    }
    rlimit limit{soft, hard};
    return ::setrlimit(resource, &limit) == 0;
}

int MaxDescriptor() {
    rlimit limit{};
    if (::getrlimit(RLIMIT_NOFILE, &limit) == 0 && limit.rlim_cur != RLIM_INFINITY) {
        return static_cast<int>(std::min<rlim_t>(limit.rlim_cur, 65536));
    }
    return 1024;
}

void MarkInheritedDescriptorsCloseOnExec() {
    const int max_fd = MaxDescriptor();
    for (int fd = STDERR_FILENO + 1; fd < max_fd; ++fd) {
        const int flags = ::fcntl(fd, F_GETFD);
        if (flags >= 0 && (flags & FD_CLOEXEC) == 0) {
            ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
        }
    }
}

// The supervisor never execs, so close-on-exec does not apply to it; this
// includes the pipe the spawner reads exec errors from.
void CloseInheritedDescriptors() {
    const int max_fd = MaxDescriptor();
    for (int fd = STDERR_FILENO + 1; fd < max_fd; ++fd) {
        ::close(fd);
    }
}

// Parent pid from /proc/<pid>/stat, or -1.
pid_t ParentOf(pid_t pid) {
    char path[48] = "/proc/";
    char* end = FormatUnsigned(static_cast<unsigned long>(pid), path + 6);
    std::memcpy(end, "/stat", 6);
    const int fd = ::open(path, O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return -1;
    }
    char buffer[512];
    const auto length = ::read(fd, buffer, sizeof(buffer) - 1);
    ::close(fd);
    if (length <= 0) {
        return -1;
    }
    buffer[length] = '\0';
    const char* cursor = nullptr;
    for (ssize_t i = length - 1; i >= 0; --i) {
        if (buffer[i] == ')') {
            cursor = buffer + i + 1;
            break;
        }
    }
    // ") S 1234 ..."
    if (cursor == nullptr || cursor[0] != ' ' || cursor[1] == '\0' || cursor[2] != ' ') {
        return -1;
    }
    cursor += 3;
    long value = 0;
    bool any = false;
    for (; *cursor >= '0' && *cursor <= '9'; ++cursor) {
        value = value * 10 + (*cursor - '0');
        any = true;
    }
    return any ? static_cast<pid_t>(value) : -1;
}

// Sends signal to every direct child. Orphans of a subreaper are its direct
// children, so repeated rounds reach the whole tree.
void SignalChildren(int signal) {
    const pid_t self = ::getpid();
    const int dir = ::open("/proc", O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dir < 0) {
        return;
    }
    // linux_dirent64: u64 ino, s64 off, u16 reclen, u8 type, char name[].
    constexpr std::size_t kReclenOffset = 16;
    constexpr std::size_t kNameOffset = 19;
    alignas(8) char buffer[4096];
    while (true) {
        const long count = ::syscall(SYS_getdents64, dir, buffer, sizeof(buffer));
        if (count <= 0) {
            break;
        }
        long offset = 0;
        while (offset < count) {
            unsigned short record_length = 0;
            std::memcpy(&record_length, buffer + offset + kReclenOffset, sizeof(record_length));
            if (record_length == 0) {
                break;
            }
            pid_t pid = 0;
            if (ParsePid(buffer + offset + kNameOffset, pid) && pid != self && ParentOf(pid) == self) {
                ::kill(pid, signal);
            }
            offset += record_length;
        }
    }
    ::close(dir);
}

void KillRemainingChildren() {
    while (true) {
        SignalChildren(SIGKILL);
        const pid_t reaped = ::waitpid(-1, nullptr, 0);
        if (reaped < 0 && errno != EINTR) {
            return;
        }
    }
}

[[noreturn]] void ExitLike(int status) {
    if (WIFSIGNALED(status)) {
        const int signal = WTERMSIG(status);
        struct sigaction action {};
        action.sa_handler = SIG_DFL;
        sigemptyset(&action.sa_mask);
        ::sigaction(signal, &action, nullptr);
        sigset_t unblock;
        sigemptyset(&unblock);
        sigaddset(&unblock, signal);
        ::sigprocmask(SIG_UNBLOCK, &unblock, nullptr);
        ::kill(::getpid(), signal);
        ::_exit(128 + signal);
    }
    ::_exit(WIFEXITED(status) ? WEXITSTATUS(status) : 1);
}

void ForwardSignal(int signal) {
    const pid_t worker = g_worker_pid;
    if (worker > 0) {
        ::kill(worker, signal);
    }
}

[[noreturn]] void SuperviseWorker(pid_t worker) {
    g_worker_pid = worker;
    CloseInheritedDescriptors();
    struct sigaction action {};
    action.sa_handler = ForwardSignal;
    sigemptyset(&action.sa_mask);
    for (const int signal : {SIGTERM, SIGINT, SIGHUP}) {
        ::sigaction(signal, &action, nullptr);
    }

    int status = 0;
    while (true) {
        int child_status = 0;
        const pid_t reaped = ::waitpid(-1, &child_status, 0);
        if (reaped == worker) {
            status = child_status;
            break;
        }
        if (reaped < 0 && errno != EINTR) {
            FailSetup("lost the worker process");
        }
    }
    g_worker_pid = -1;
    KillRemainingChildren();
    ExitLike(status);
}

void MakeDirectory(const MountStep& step) {
    if (::mkdir(step.target.c_str(), 0755) != 0 && errno != EEXIST) {
        FailSetup("cannot create mount point", step.target.c_str());
    }
}

void MakeFile(const MountStep& step) {
    const int fd = ::open(step.target.c_str(), O_RDONLY | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        FailSetup("cannot create mount point", step.target.c_str());
    }
    ::close(fd);
}

void Bind(const MountStep& step, unsigned long remount_flags) {
    if (::mount(step.source.c_str(), step.target.c_str(), nullptr, MS_BIND | MS_REC, nullptr) != 0) {
        FailSetup("cannot bind", step.source.c_str());
    }
    if (remount_flags != 0
        && ::mount(nullptr, step.target.c_str(), nullptr,
                   MS_REMOUNT | MS_BIND | MS_NOSUID | MS_NODEV | step.flags | remount_flags,
                   nullptr) != 0) {
        FailSetup("cannot restrict", step.target.c_str());
    }
}

void ApplyMountStep(const MountStep& step) {
    switch (step.kind) {
        case MountKind::kDirectory:
            MakeDirectory(step);
            return;
        case MountKind::kSymlink:
            if (::symlink(step.source.c_str(), step.target.c_str()) != 0 && errno != EEXIST) {
                FailSetup("cannot create symlink", step.target.c_str());
            }
            return;
        case MountKind::kReadOnlyBind:
            MakeDirectory(step);
            Bind(step, MS_RDONLY);
            return;
        case MountKind::kReadOnlyFileBind:
            MakeFile(step);
            Bind(step, MS_RDONLY);
            return;
        case MountKind::kDeviceBind:
            MakeFile(step);
            Bind(step, 0);
            return;
        case MountKind::kWritableBind:
            MakeDirectory(step);
            if (::mount(step.source.c_str(), step.target.c_str(), nullptr, MS_BIND, nullptr) != 0
                || ::mount(nullptr, step.target.c_str(), nullptr,
                           MS_REMOUNT | MS_BIND | MS_NOSUID | MS_NODEV | step.flags, nullptr) != 0) {
                FailSetup("cannot bind", step.source.c_str());
            }
            return;
        case MountKind::kTmpfs:
            MakeDirectory(step);
            if (::mount("tmpfs", step.target.c_str(), "tmpfs", MS_NOSUID | MS_NODEV, step.source.c_str()) != 0) {
                FailSetup("cannot mount tmpfs", step.target.c_str());
            }
            return;
        case MountKind::kProc:
            MakeDirectory(step);
            // Refused under a /proc with masked paths; nothing depends on it.
            ::mount("proc", step.target.c_str(), "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC, nullptr);
            return;
    }
}

void EnterRootFilesystem(const ChildSetup& setup) {
    if (::unshare(CLONE_NEWNS) != 0) {
        FailSetup("mount namespace unavailable");
    }
    if (::mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0) {
        FailSetup("cannot make mounts private");
    }
    if (::mount("tmpfs", setup.new_root.c_str(), "tmpfs", MS_NOSUID | MS_NODEV, "mode=0755,size=1m") != 0) {
        FailSetup("cannot mount the worker root");
    }
    for (const auto& step : setup.mounts) {
        ApplyMountStep(step);
    }
    if (::chdir(setup.new_root.c_str()) != 0
        || ::syscall(SYS_pivot_root, ".", ".") != 0
        || ::umount2(".", MNT_DETACH) != 0
        || ::chdir("/") != 0) {
        FailSetup("cannot switch to the worker root");
    }
    if (::mount(nullptr, "/", nullptr, MS_REMOUNT | MS_BIND | MS_RDONLY | MS_NOSUID | MS_NODEV, nullptr) != 0) {
        FailSetup("cannot seal the worker root");
    }
}

unsigned long HostMountFlags(const std::string& path) {
    struct statvfs info {};
    if (::statvfs(path.c_str(), &info) != 0) {
        return 0;
    }
    unsigned long flags = 0;
    if (info.f_flag & ST_NOSUID) {
        flags |= MS_NOSUID;
    }
    if (info.f_flag & ST_NODEV) {
        flags |= MS_NODEV;
    }
    if (info.f_flag & ST_NOEXEC) {
        flags |= MS_NOEXEC;
    }
    if (info.f_flag & ST_NODIRATIME) {
        flags |= MS_NODIRATIME;
    }
    if (info.f_flag & ST_NOATIME) {
        flags |= MS_NOATIME;
    } else if (info.f_flag & ST_RELATIME) {
        flags |= MS_RELATIME;
    } else {
        flags |= MS_STRICTATIME;
    }
    return flags;
}

}  // namespace

std::vector<MountStep> PlanRootFilesystem(const std::string& new_root,
                                          const std::string& scratch_dir,
                                          std::vector<std::string> read_only_paths,
                                          std::size_t tmp_bytes) {
    namespace fs = std::filesystem;
    std::vector<MountStep> steps;
    std::set<std::string> planned;
    const auto add = [&](MountKind kind, std::string source, const std::string& inner,
                         unsigned long flags) {
        if (!planned.insert(inner).second) {
            return;
        }
        MountStep step;
        step.kind = kind;
        step.source = std::move(source);
        step.target = new_root + inner;
        step.flags = flags;
        steps.push_back(std::move(step));
    };

    for (auto& path : read_only_paths) {
        path = fs::path(path).lexically_normal().string();
        while (path.size() > 1 && path.back() == '/') {
            path.pop_back();
        }
    }
    // Parents mount before children, or a later bind would hide the child.
    std::sort(read_only_paths.begin(), read_only_paths.end());

    for (const auto& path : read_only_paths) {
        if (path.size() < 2 || path.front() != '/') {
            continue;
        }
        std::error_code ec;
        const auto status = fs::symlink_status(path, ec);
        if (ec || !fs::exists(status)) {
            continue;
        }
        fs::path ancestor;
        for (const auto& part : fs::path(path).parent_path()) {
            ancestor /= part;
            if (ancestor.string() != "/") {
                add(MountKind::kDirectory, {}, ancestor.string(), 0);
            }
        }
        if (fs::is_symlink(status)) {
            const auto link = fs::read_symlink(path, ec);
            if (!ec) {
                add(MountKind::kSymlink, link.string(), path, 0);
            }
        } else if (fs::is_directory(status)) {
            add(MountKind::kReadOnlyBind, path, path, HostMountFlags(path));
        } else if (fs::is_regular_file(status)) {
            add(MountKind::kReadOnlyFileBind, path, path, HostMountFlags(path));
        }
    }

    add(MountKind::kDirectory, {}, "/dev", 0);
    for (const char* device : {"/dev/null", "/dev/zero", "/dev/random", "/dev/urandom"}) {
        std::error_code ec;
        if (fs::exists(device, ec)) {
            add(MountKind::kDeviceBind, device, device, 0);
        }
    }
    add(MountKind::kSymlink, "/proc/self/fd", "/dev/fd", 0);
    add(MountKind::kSymlink, "/proc/self/fd/0", "/dev/stdin", 0);
    add(MountKind::kSymlink, "/proc/self/fd/1", "/dev/stdout", 0);
    add(MountKind::kSymlink, "/proc/self/fd/2", "/dev/stderr", 0);
    add(MountKind::kProc, {}, "/proc", 0);
    add(MountKind::kTmpfs, "mode=1777,size=" + std::to_string(tmp_bytes), "/tmp", 0);
    add(MountKind::kWritableBind, scratch_dir, kSandboxMount, HostMountFlags(scratch_dir));
    return steps;
}

void EnterSandbox(const ChildSetup& setup) {
    if (::setsid() < 0) {
        FailSetup("setsid failed");
    }
    MarkInheritedDescriptorsCloseOnExec();
    if (!SetLimit(RLIMIT_CORE, 0, 0)) {
        FailSetup("resource limits could not be applied");
    }
    if (::prctl(PR_SET_CHILD_SUBREAPER, 1, 0, 0, 0) != 0) {
        FailSetup("cannot become a subreaper");
    }
    if (setup.isolate) {
        if (::unshare(CLONE_NEWUSER | CLONE_NEWPID | CLONE_NEWNET | CLONE_NEWIPC) != 0) {
            FailSetup("namespaces unavailable");
        }
        // Missing on kernels older than 3.19, where the gid map needs no deny.
        WriteProcFile("/proc/self/setgroups", "deny", 4);
        if (!WriteProcFile("/proc/self/uid_map", setup.uid_map.data(), setup.uid_map.size())
            || !WriteProcFile("/proc/self/gid_map", setup.gid_map.data(), setup.gid_map.size())) {
            FailSetup("user namespace id mapping failed");
        }
    }

    const pid_t worker = ::fork();
    if (worker < 0) {
        FailSetup("fork failed");
    }
    if (worker > 0) {
        SuperviseWorker(worker);
    }

    // Worker; pid 1 of its own namespace when isolated.
    ::prctl(PR_SET_PDEATHSIG, SIGKILL, 0, 0, 0);
    if (setup.isolate) {
        EnterRootFilesystem(setup);
    }
    if (::chdir(setup.work_dir.c_str()) != 0) {
        FailSetup("cannot enter the work directory");
    }
    if (::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
        FailSetup("cannot set no_new_privs");
    }
    if (!SetLimit(RLIMIT_AS, setup.address_space, setup.address_space)
        || !SetLimit(RLIMIT_CPU, setup.cpu_soft, setup.cpu_hard)
        || !SetLimit(RLIMIT_FSIZE, setup.file_size, setup.file_size)
        || !SetLimit(RLIMIT_NOFILE, setup.open_files, setup.open_files)
        || !SetLimit(RLIMIT_NPROC, setup.processes, setup.processes)) {
        FailSetup("resource limits could not be applied");
    }
}

}  // namespace vizrun::sandbox
