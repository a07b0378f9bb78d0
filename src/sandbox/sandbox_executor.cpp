#include "sandbox/sandbox_executor.hpp"

#include <boost/version.hpp>
#if BOOST_VERSION >= 108600
#include <boost/process/v1.hpp>
#include <boost/process/v1/extend.hpp>
#else
#include <boost/process.hpp>
#include <boost/process/extend.hpp>
#endif
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <memory>
#include <sstream>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#include "sandbox/isolation.hpp"
#include "sandbox/process_tree.hpp"
#include "sandbox/scratch_directory.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace vizrun::sandbox {
#if BOOST_VERSION >= 108600
namespace bp = boost::process::v1;
#else
namespace bp = boost::process;
#endif

namespace {

std::optional<std::filesystem::path> ResolveProgram(const std::string& name,
                                                    const std::string& search_path) {
    if (name.empty()) {
        return std::nullopt;
    }
    if (name.find('/') != std::string::npos) {
        if (::access(name.c_str(), X_OK) == 0) {
            return std::filesystem::path(name);
        }
        return std::nullopt;
    }
    std::stringstream stream(search_path);
    std::string dir;
    while (std::getline(stream, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        const auto candidate = std::filesystem::path(dir) / name;
        std::error_code ec;
        if (::access(candidate.c_str(), X_OK) == 0 && !std::filesystem::is_directory(candidate, ec)) {
            return candidate;
        }
    }
    return std::nullopt;
}

// Only regular files are read back; the worker could have swapped any of its
// output paths for a symlink.
bool IsPlainFile(const std::filesystem::path& path) {
    std::error_code ec;
    const auto status = std::filesystem::symlink_status(path, ec);
    return !ec && std::filesystem::is_regular_file(status);
}

std::string ReadTail(const std::filesystem::path& path, std::size_t max_bytes, bool& truncated) {
    truncated = false;
    if (!IsPlainFile(path)) {
        return {};
    }
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return {};
    }
    input.seekg(0, std::ios::end);
    const auto size = static_cast<std::size_t>(std::max<std::streamoff>(input.tellg(), 0));
    const auto offset = size > max_bytes ? size - max_bytes : 0;
    input.seekg(static_cast<std::streamoff>(offset));
    std::string text(size - offset, '\0');
    input.read(&text[0], static_cast<std::streamsize>(text.size()));
    text.resize(static_cast<std::size_t>(input.gcount()));
    truncated = offset > 0;
    return text;
}

std::optional<std::string> ReadAll(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return std::nullopt;
    }
    std::ostringstream content;
    content << input.rdbuf();
    return content.str();
}

void SignalTree(const std::vector<ProcessInfo>& tree, int signal, pid_t except = -1) {
    for (const auto& process : tree) {
        if (process.pid != except) {
            ::kill(process.pid, signal);
        }
    }
}

// Reaps pid if it has exited. Returns false once the pid can no longer be
// waited for.
bool TryReap(pid_t pid, int& status, rusage& usage, bool& reaped) {
    while (true) {
        const auto waited = ::wait4(pid, &status, WNOHANG, &usage);
        if (waited == pid) {
            reaped = true;
            return true;
        }
        if (waited == 0) {
            return true;
        }
        if (errno != EINTR) {
            return false;
        }
    }
}

// SIGTERM to every process of the worker, then SIGKILL to everything below
// the supervisor once the grace period runs out, so the supervisor still
// reaps and reports the worker. A supervisor that does not follow within
// another grace period is killed as well. Returns false only when the pid can
// no longer be waited for.
bool TerminateWorker(pid_t pid, std::chrono::milliseconds grace, int& status, rusage& usage) {
    bool reaped = false;
    SignalTree(ProcessTree(pid), SIGTERM);
    ::kill(-pid, SIGTERM);
    const auto grace_deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < grace_deadline) {
        if (!TryReap(pid, status, usage, reaped)) {
            return false;
        }
        if (reaped) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    const auto kill_deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < kill_deadline) {
        if (!TryReap(pid, status, usage, reaped)) {
            return false;
        }
        if (reaped) {
            return true;
        }
        SignalTree(ProcessTree(pid), SIGKILL, pid);
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    SignalTree(ProcessTree(pid), SIGKILL);
    ::kill(-pid, SIGKILL);
    while (true) {
        const auto waited = ::wait4(pid, &status, 0, &usage);
        if (waited == pid) {
            return true;
        }
        if (waited < 0 && errno != EINTR) {
            return false;
        }
    }
}

std::chrono::milliseconds CpuTime(const rusage& usage) {
    const auto micros = (static_cast<long long>(usage.ru_utime.tv_sec) + usage.ru_stime.tv_sec) * 1000000
        + usage.ru_utime.tv_usec + usage.ru_stime.tv_usec;
    return std::chrono::milliseconds(micros / 1000);
}

bool IsUnder(const std::filesystem::path& path, const std::string& root) {
    const auto normal_root = std::filesystem::path(root).lexically_normal();
    const auto relative = path.lexically_normal().lexically_relative(normal_root);
    return !relative.empty() && *relative.begin() != "..";
}

bool IsVisibleInSandbox(const std::filesystem::path& program,
                        const std::vector<std::string>& read_only_paths) {
    return std::any_of(read_only_paths.begin(), read_only_paths.end(),
                       [&program](const std::string& root) { return IsUnder(program, root); });
}

const char* ArtifactFileName(execution::ArtifactKind kind) {
    return kind == execution::ArtifactKind::kImage ? "artifact.png" : "artifact.html";
}

governor::WorkerState TerminalState(WorkerOutcome outcome) {
    switch (outcome) {
        case WorkerOutcome::kCompleted:
            return governor::WorkerState::kCompleted;
        case WorkerOutcome::kTimedOut:
            return governor::WorkerState::kTimedOut;
        case WorkerOutcome::kKilled:
            return governor::WorkerState::kKilled;
        case WorkerOutcome::kCrashed:
        case WorkerOutcome::kSandboxError:
            return governor::WorkerState::kCrashed;
    }
    return governor::WorkerState::kCrashed;
}

}  // namespace

const char* ToString(WorkerOutcome outcome) {
    switch (outcome) {
        case WorkerOutcome::kCompleted:
            return "completed";
        case WorkerOutcome::kTimedOut:
            return "timed_out";
        case WorkerOutcome::kCrashed:
            return "crashed";
        case WorkerOutcome::kKilled:
            return "killed";
        case WorkerOutcome::kSandboxError:
            return "sandbox_error";
    }
    return "sandbox_error";
}

const char* ToString(KillReason reason) {
    switch (reason) {
        case KillReason::kNone:
            return "none";
        case KillReason::kTimeout:
            return "timeout";
        case KillReason::kDeadline:
            return "deadline";
        case KillReason::kMemory:
            return "memory";
        case KillReason::kCancelled:
            return "cancelled";
    }
    return "none";
}

SandboxLimits MakeSandboxLimits(const config::Config& config) {
    SandboxLimits limits;
    limits.scratch_root = config.sandbox.scratch_root;
    limits.isolate = config.sandbox.isolate;
    limits.search_path = config.sandbox.search_path;
    limits.pass_env = config.sandbox.pass_env;
    limits.read_only_paths = config.sandbox.read_only_paths;
    limits.max_file_bytes = static_cast<std::size_t>(config.sandbox.max_file_mb) * 1024 * 1024;
    limits.max_open_files = config.sandbox.max_open_files;
    limits.max_processes = config.sandbox.max_processes;
    limits.max_artifact_bytes = config.limits.max_artifact_bytes;
    limits.max_capture_bytes = config.limits.max_diagnostic_bytes;
    limits.poll_interval = std::chrono::milliseconds(config.sandbox.poll_interval_ms);
    limits.kill_grace = std::chrono::milliseconds(config.sandbox.kill_grace_ms);
    return limits;
}

SandboxExecutor::SandboxExecutor(SandboxLimits limits)
    : limits_(std::move(limits)) {}

WorkerReport SandboxExecutor::Run(const adapters::AdaptedUnit& unit,
                                  governor::WorkerHandle& handle,
                                  std::chrono::steady_clock::time_point deadline) const {
    const auto started = std::chrono::steady_clock::now();
    WorkerReport report;
    try {
        report = Execute(unit, handle, deadline);
    } catch (const std::exception& ex) {
        report = WorkerReport{};
        report.internal_error = ex.what();
    }
    report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    handle.Finish(TerminalState(report.outcome));

    if (report.outcome == WorkerOutcome::kSandboxError) {
        utils::LogError("sandbox", "worker failed",
                        {{"worker", std::to_string(handle.Id())},
                         {"error", report.internal_error}});
    } else {
        utils::LogDebug("sandbox", "worker finished",
                        {{"worker", std::to_string(handle.Id())},
                         {"pid", std::to_string(report.pid)},
                         {"outcome", ToString(report.outcome)},
                         {"exit_code", std::to_string(report.exit_code)},
                         {"elapsed_ms", std::to_string(report.elapsed.count())},
                         {"peak_rss", std::to_string(report.peak_rss_bytes)}});
    }
    return report;
}

WorkerReport SandboxExecutor::Execute(const adapters::AdaptedUnit& unit,
                                      governor::WorkerHandle& handle,
                                      std::chrono::steady_clock::time_point deadline) const {
    WorkerReport report{};
    if (unit.command.empty()) {
        report.internal_error = "adapted unit has no command";
        return report;
    }
    const auto program = ResolveProgram(unit.command.front(), limits_.search_path);
    if (!program) {
        report.internal_error = "interpreter not found: " + unit.command.front();
        return report;
    }
    if (limits_.isolate && !IsVisibleInSandbox(*program, limits_.read_only_paths)) {
        report.internal_error = "interpreter outside the read-only paths: " + program->string();
        return report;
    }

    std::unique_ptr<ScratchDirectory> scratch;
    try {
        scratch = std::make_unique<ScratchDirectory>(limits_.scratch_root);
    } catch (const std::system_error& ex) {
        report.internal_error = std::string("scratch directory: ") + ex.what();
        return report;
    }
    const auto work_dir = scratch->WorkDir();
    const auto script_path = work_dir / unit.script_name;
    const auto artifact_path = scratch->Path() / ArtifactFileName(unit.artifact_kind);
    const auto stdout_path = scratch->Path() / "stdout.log";
    const auto stderr_path = scratch->Path() / "stderr.log";
    {
        std::ofstream script(script_path, std::ios::binary | std::ios::trunc);
        script << unit.source;
        if (!script) {
            report.internal_error = "cannot write " + script_path.string();
            return report;
        }
    }

    // Paths as the worker sees them. An isolated worker finds the scratch
    // directory at kSandboxMount.
    std::filesystem::path inner_scratch = scratch->Path();
    if (limits_.isolate) {
        inner_scratch = kSandboxMount;
    }
    const auto inner_work_dir = inner_scratch / "work";

    // Fresh environment: nothing from the server process leaks in unless listed.
    bp::environment env;
    env["PATH"] = limits_.search_path;
    env["HOME"] = inner_work_dir.string();
    env["TMPDIR"] = inner_work_dir.string();
    env["LANG"] = "C.UTF-8";
    env["LC_ALL"] = "C.UTF-8";
    env["OMP_NUM_THREADS"] = "1";
    env["OPENBLAS_NUM_THREADS"] = "1";
    env["MKL_NUM_THREADS"] = "1";
    env["MPLCONFIGDIR"] = (inner_work_dir / ".matplotlib").string();
    env[adapters::kArtifactPathEnv] = (inner_scratch / ArtifactFileName(unit.artifact_kind)).string();
    for (const auto& key : limits_.pass_env) {
        if (const char* value = std::getenv(key.c_str())) {
            env[key] = value;
        }
    }
    for (const auto& entry : unit.environment) {
        env[entry.first] = entry.second;
    }

    std::vector<std::string> args(unit.command.begin() + 1, unit.command.end());
    args.push_back((inner_work_dir / unit.script_name).string());

    const auto& ceilings = handle.Ceilings();
    const auto timeout_s = std::chrono::duration_cast<std::chrono::seconds>(ceilings.timeout).count();
    ChildSetup setup;
    setup.address_space = static_cast<rlim_t>(ceilings.memory_bytes);
    // SIGXCPU at the soft limit, SIGKILL one second later.
    setup.cpu_soft = static_cast<rlim_t>(timeout_s + 1);
    setup.cpu_hard = static_cast<rlim_t>(timeout_s + 2);
    setup.file_size = static_cast<rlim_t>(limits_.max_file_bytes);
    setup.open_files = static_cast<rlim_t>(limits_.max_open_files);
    setup.processes = static_cast<rlim_t>(limits_.max_processes);
    setup.isolate = limits_.isolate;
    setup.work_dir = inner_work_dir.string();
    if (limits_.isolate) {
        setup.uid_map = std::to_string(kSandboxId) + " " + std::to_string(::geteuid()) + " 1\n";
        setup.gid_map = std::to_string(kSandboxId) + " " + std::to_string(::getegid()) + " 1\n";
        const auto new_root = scratch->Path() / "root";
        std::error_code ec;
        std::filesystem::create_directory(new_root, ec);
        if (ec) {
            report.internal_error = "cannot create " + new_root.string() + ": " + ec.message();
            return report;
        }
        setup.new_root = new_root.string();
        setup.mounts = PlanRootFilesystem(setup.new_root, scratch->Path().string(),
                                          limits_.read_only_paths, limits_.max_file_bytes);
    }

    const auto started = std::chrono::steady_clock::now();
    std::error_code spawn_error;
    pid_t pid = -1;
    try {
        // The spawned process supervises the worker and exits with its status;
        // EnterSandbox also changes into the work directory.
        bp::child child_process(
            bp::exe = program->string(),
            bp::args = args,
            env,
            bp::std_in < bp::null,
            bp::std_out > stdout_path.string(),
            bp::std_err > stderr_path.string(),
            spawn_error,
            bp::extend::on_error = [](auto& exec, const std::error_code&) {
                // A child whose exec failed has already exited; boost never reaps it.
                if (exec.pid > 0) {
                    int status = 0;
                    ::waitpid(exec.pid, &status, 0);
                }
            },
            bp::extend::on_exec_setup = [&setup](auto&) { EnterSandbox(setup); });
        if (!spawn_error) {
            pid = child_process.id();
            child_process.detach();
        }
    } catch (const bp::process_error& ex) {
        report.internal_error = std::string("exec failed: ") + ex.what();
        return report;
    }
    if (spawn_error || pid <= 0) {
        report.internal_error = "spawn failed: " + spawn_error.message();
        return report;
    }

    handle.MarkRunning(pid);
    report.pid = pid;
    utils::LogDebug("sandbox", "worker spawned",
                    {{"worker", std::to_string(handle.Id())},
                     {"pid", std::to_string(pid)},
                     {"isolated", limits_.isolate ? "true" : "false"},
                     {"language", execution::ToString(unit.language)},
                     {"viz_type", execution::ToString(unit.viz_type)}});

    const auto worker_deadline = started + ceilings.timeout;
    const auto effective_deadline = std::min(worker_deadline, deadline);
    int status = 0;
    rusage usage{};
    bool reaped = false;
    int wait_errno = 0;
    std::size_t peak_sampled = 0;
    KillReason reason = KillReason::kNone;
    while (true) {
        const auto waited = ::wait4(pid, &status, WNOHANG, &usage);
        if (waited == pid) {
            reaped = true;
            break;
        }
        if (waited < 0 && errno != EINTR) {
            wait_errno = errno;
            break;
        }
        // The ceiling holds for the worker and everything it forked together.
        const auto resident = TreeResidentBytes(ProcessTree(pid));
        peak_sampled = std::max(peak_sampled, resident);
        const auto now = std::chrono::steady_clock::now();
        if (handle.Token().IsCancelled()) {
            reason = KillReason::kCancelled;
        } else if (now >= effective_deadline) {
            reason = deadline < worker_deadline ? KillReason::kDeadline : KillReason::kTimeout;
        } else if (resident > ceilings.memory_bytes) {
            reason = KillReason::kMemory;
        }
        if (reason != KillReason::kNone) {
            break;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            effective_deadline - now) + std::chrono::milliseconds(1);
        std::this_thread::sleep_for(std::min(limits_.poll_interval, remaining));
    }

    if (reason != KillReason::kNone) {
        utils::LogInfo("sandbox", "terminating worker",
                       {{"worker", std::to_string(handle.Id())},
                        {"pid", std::to_string(pid)},
                        {"reason", ToString(reason)},
                        {"tree_rss", std::to_string(peak_sampled)}});
        reaped = TerminateWorker(pid, limits_.kill_grace, status, usage);
        if (!reaped) {
            wait_errno = errno;
        }
    }
    // Left only if the supervisor itself was killed.
    ::kill(-pid, SIGKILL);

    report.kill_reason = reason;
    report.peak_rss_bytes = std::max(peak_sampled, static_cast<std::size_t>(usage.ru_maxrss) * 1024);
    report.cpu_time = CpuTime(usage);
    report.stdout_text = ReadTail(stdout_path, limits_.max_capture_bytes, report.stdout_truncated);
    report.stderr_text = ReadTail(stderr_path, limits_.max_capture_bytes, report.stderr_truncated);

    if (!reaped) {
        report.internal_error = "lost track of worker pid " + std::to_string(pid) + ": "
            + std::strerror(wait_errno);
        return report;
    }
    if (WIFEXITED(status)) {
        report.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        report.term_signal = WTERMSIG(status);
        report.exit_code = 128 + report.term_signal;
    }

    switch (reason) {
        case KillReason::kTimeout:
        case KillReason::kDeadline:
            report.outcome = WorkerOutcome::kTimedOut;
            return report;
        case KillReason::kMemory:
        case KillReason::kCancelled:
            report.outcome = WorkerOutcome::kKilled;
            return report;
        case KillReason::kNone:
            break;
    }

    if (WIFSIGNALED(status)) {
        // The kernel sends SIGKILL at the hard CPU limit; pid 1 of a namespace
        // never sees the SIGXCPU before it.
        const auto cpu_hard = std::chrono::seconds(static_cast<long long>(setup.cpu_hard));
        report.cpu_limit_reached = report.term_signal == SIGXCPU
            || (report.term_signal == SIGKILL && report.cpu_time + std::chrono::milliseconds(100) >= cpu_hard);
        report.outcome = WorkerOutcome::kCrashed;
        return report;
    }
    if (report.exit_code == kSetupFailureExit
        && report.stderr_text.rfind(kSetupFailureMarker, 0) == 0) {
        report.outcome = WorkerOutcome::kSandboxError;
        report.internal_error = utils::Trim(report.stderr_text);
        return report;
    }

    report.outcome = WorkerOutcome::kCompleted;
    if (IsPlainFile(artifact_path)) {
        std::error_code ec;
        const auto size = std::filesystem::file_size(artifact_path, ec);
        if (!ec) {
            report.artifact_size = static_cast<std::size_t>(size);
            if (report.artifact_size > limits_.max_artifact_bytes) {
                report.artifact_oversized = true;
            } else {
                report.artifact = ReadAll(artifact_path);
            }
        }
    }
    return report;
}

}  // namespace vizrun::sandbox
